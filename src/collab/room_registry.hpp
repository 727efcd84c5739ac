#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace codebox::executor {
class ExecutionService;
}

namespace codebox::collab {

struct Participant {
    std::string connection_id;
    std::string username;
    std::string room;
};

struct ChatMessage {
    std::string user;
    std::string text;
    std::int64_t timestamp_ms = 0;
};

struct CodeChange {
    std::string user;
    nlohmann::json change;
    std::int64_t timestamp_ms = 0;
};

// An event for the transport layer to deliver to each listed connection.
struct OutgoingEvent {
    std::vector<std::string> recipients;
    std::string name;
    nlohmann::json payload;
};

// Room membership, code change history and chat history for shared editing.
// All state is owned by the instance and guarded by one mutex.
class RoomRegistry {
public:
    explicit RoomRegistry(std::chrono::milliseconds unjoined_room_ttl = std::chrono::minutes(10));

    // Rooms nobody joined within the TTL are dropped by later CreateRoom calls.
    std::string CreateRoom();

    // A connection already in a room leaves it first.
    std::vector<OutgoingEvent> Join(const std::string& connection_id,
                                    const std::string& username,
                                    const std::string& room);
    std::vector<OutgoingEvent> Leave(const std::string& connection_id);

    std::vector<OutgoingEvent> RecordCodeChange(const std::string& connection_id,
                                                nlohmann::json change);
    std::vector<OutgoingEvent> RecordMessage(const std::string& connection_id,
                                             const std::string& text);
    std::vector<OutgoingEvent> UpdateCursor(const std::string& connection_id,
                                            nlohmann::json position);

    // Runs `code` for the participant and addresses the result to them alone.
    // The registry lock is not held while the program runs.
    std::optional<OutgoingEvent> RunCode(const std::string& connection_id,
                                         const std::string& code,
                                         const std::string& language,
                                         executor::ExecutionService& service);

    std::optional<Participant> FindParticipant(const std::string& connection_id) const;
    std::vector<ChatMessage> Messages(const std::string& room) const;
    std::vector<CodeChange> History(const std::string& room) const;
    std::size_t ActiveRoomCount() const;
    std::size_t ActiveUserCount() const;

private:
    struct RoomState {
        std::set<std::string> members;
        std::vector<CodeChange> history;
        std::vector<ChatMessage> messages;
        std::chrono::steady_clock::time_point created_at{};
    };

    std::vector<OutgoingEvent> LeaveLocked(const std::string& connection_id);
    nlohmann::json RoomDataLocked(const std::string& room) const;
    std::vector<std::string> MembersLocked(const std::string& room,
                                           const std::string& except = {}) const;

    void PruneUnjoinedLocked(std::chrono::steady_clock::time_point now);

    const std::chrono::milliseconds unjoined_room_ttl_;
    std::unordered_map<std::string, Participant> participants_;
    std::unordered_map<std::string, RoomState> rooms_;
    mutable std::mutex mutex_;
};

}  // namespace codebox::collab
