#include "collab/room_registry.hpp"

#include <chrono>
#include <utility>

#include "executor/execution_service.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/workspace.hpp"
#include "utils/logging.hpp"

namespace codebox::collab {
namespace {

constexpr const char* kSystemUser = "system";

std::int64_t NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

nlohmann::json MessageJson(const ChatMessage& message) {
    return {
        {"user", message.user},
        {"text", message.text},
        {"timestamp", message.timestamp_ms}
    };
}

nlohmann::json ChangeJson(const CodeChange& change) {
    return {
        {"user", change.user},
        {"change", change.change},
        {"timestamp", change.timestamp_ms}
    };
}

OutgoingEvent SystemMessage(std::vector<std::string> recipients, const std::string& text) {
    return OutgoingEvent{std::move(recipients), "message",
                         MessageJson(ChatMessage{kSystemUser, text, NowMs()})};
}

}  // namespace

RoomRegistry::RoomRegistry(std::chrono::milliseconds unjoined_room_ttl)
    : unjoined_room_ttl_(unjoined_room_ttl) {}

std::string RoomRegistry::CreateRoom() {
    // Session ids are random UUIDs, which also make good room ids.
    auto room = sandbox::GenerateSessionId();
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    PruneUnjoinedLocked(now);
    RoomState state{};
    state.created_at = now;
    rooms_.emplace(room, std::move(state));
    return room;
}

void RoomRegistry::PruneUnjoinedLocked(std::chrono::steady_clock::time_point now) {
    for (auto it = rooms_.begin(); it != rooms_.end();) {
        if (it->second.members.empty() && now - it->second.created_at >= unjoined_room_ttl_) {
            utils::Log(utils::LogLevel::kDebug, "collab", "evicted unjoined room",
                       {{"room", it->first}});
            it = rooms_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<OutgoingEvent> RoomRegistry::Join(const std::string& connection_id,
                                              const std::string& username,
                                              const std::string& room) {
    if (connection_id.empty() || room.empty()) {
        utils::Log(utils::LogLevel::kWarn, "collab", "join rejected",
                   {{"connection", connection_id}, {"room", room}});
        return {};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutgoingEvent> events;

    auto existing = participants_.find(connection_id);
    if (existing != participants_.end() && existing->second.room != room) {
        events = LeaveLocked(connection_id);
    }
    participants_[connection_id] = Participant{connection_id, username, room};
    auto& state = rooms_[room];
    state.members.insert(connection_id);

    events.push_back(SystemMessage({connection_id}, "Welcome to the collaboration room " + room + "!"));
    auto others = MembersLocked(room, connection_id);
    if (!others.empty()) {
        events.push_back(SystemMessage(std::move(others), username + " has joined the room"));
    }
    events.push_back(OutgoingEvent{MembersLocked(room), "roomData", RoomDataLocked(room)});

    nlohmann::json history = nlohmann::json::array();
    for (const auto& change : state.history) {
        history.push_back(ChangeJson(change));
    }
    events.push_back(OutgoingEvent{{connection_id}, "codeHistory", std::move(history)});

    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : state.messages) {
        messages.push_back(MessageJson(message));
    }
    events.push_back(OutgoingEvent{{connection_id}, "messageHistory", std::move(messages)});

    utils::Log(utils::LogLevel::kInfo, "collab", "joined",
               {{"connection", connection_id}, {"room", room}});
    return events;
}

std::vector<OutgoingEvent> RoomRegistry::Leave(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return LeaveLocked(connection_id);
}

std::vector<OutgoingEvent> RoomRegistry::LeaveLocked(const std::string& connection_id) {
    auto it = participants_.find(connection_id);
    if (it == participants_.end()) {
        return {};
    }
    const auto participant = it->second;
    participants_.erase(it);

    std::vector<OutgoingEvent> events;
    auto room_it = rooms_.find(participant.room);
    if (room_it != rooms_.end()) {
        room_it->second.members.erase(connection_id);
        if (room_it->second.members.empty()) {
            rooms_.erase(room_it);
        } else {
            events.push_back(SystemMessage(MembersLocked(participant.room),
                                           participant.username + " has left the room"));
            events.push_back(OutgoingEvent{MembersLocked(participant.room), "roomData",
                                           RoomDataLocked(participant.room)});
        }
    }
    utils::Log(utils::LogLevel::kInfo, "collab", "left",
               {{"connection", connection_id}, {"room", participant.room}});
    return events;
}

std::vector<OutgoingEvent> RoomRegistry::RecordCodeChange(const std::string& connection_id,
                                                          nlohmann::json change) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = participants_.find(connection_id);
    if (it == participants_.end()) {
        return {};
    }
    const auto& participant = it->second;
    CodeChange entry{participant.username, std::move(change), NowMs()};
    auto payload = ChangeJson(entry);
    rooms_[participant.room].history.push_back(std::move(entry));

    auto others = MembersLocked(participant.room, connection_id);
    if (others.empty()) {
        return {};
    }
    return {OutgoingEvent{std::move(others), "codeChange", std::move(payload)}};
}

std::vector<OutgoingEvent> RoomRegistry::RecordMessage(const std::string& connection_id,
                                                       const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = participants_.find(connection_id);
    if (it == participants_.end()) {
        return {};
    }
    const auto& participant = it->second;
    ChatMessage message{participant.username, text, NowMs()};
    auto payload = MessageJson(message);
    rooms_[participant.room].messages.push_back(std::move(message));
    return {OutgoingEvent{MembersLocked(participant.room), "message", std::move(payload)}};
}

std::vector<OutgoingEvent> RoomRegistry::UpdateCursor(const std::string& connection_id,
                                                      nlohmann::json position) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = participants_.find(connection_id);
    if (it == participants_.end()) {
        return {};
    }
    const auto& participant = it->second;
    auto others = MembersLocked(participant.room, connection_id);
    if (others.empty()) {
        return {};
    }
    nlohmann::json payload = {
        {"user", participant.username},
        {"userId", connection_id},
        {"position", std::move(position)},
        {"timestamp", NowMs()}
    };
    return {OutgoingEvent{std::move(others), "cursorUpdate", std::move(payload)}};
}

std::optional<OutgoingEvent> RoomRegistry::RunCode(const std::string& connection_id,
                                                   const std::string& code,
                                                   const std::string& language,
                                                   executor::ExecutionService& service) {
    const auto participant = FindParticipant(connection_id);
    if (!participant) {
        return std::nullopt;
    }
    executor::ExecutionOptions options{};
    options.language = language;
    try {
        auto payload = executor::ToJson(service.Execute(code, options));
        payload["user"] = participant->username;
        return OutgoingEvent{{connection_id}, "executionResult", std::move(payload)};
    } catch (const sandbox::FilesystemError& ex) {
        utils::Log(utils::LogLevel::kError, "collab", "execution could not start",
                   {{"connection", connection_id}, {"error", ex.what()}});
        return OutgoingEvent{{connection_id}, "executionError", {{"message", ex.what()}}};
    }
}

std::optional<Participant> RoomRegistry::FindParticipant(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = participants_.find(connection_id);
    if (it == participants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ChatMessage> RoomRegistry::Messages(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return {};
    }
    return it->second.messages;
}

std::vector<CodeChange> RoomRegistry::History(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return {};
    }
    return it->second.history;
}

std::size_t RoomRegistry::ActiveRoomCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

std::size_t RoomRegistry::ActiveUserCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return participants_.size();
}

nlohmann::json RoomRegistry::RoomDataLocked(const std::string& room) const {
    nlohmann::json users = nlohmann::json::array();
    auto it = rooms_.find(room);
    if (it != rooms_.end()) {
        for (const auto& member : it->second.members) {
            auto participant = participants_.find(member);
            if (participant != participants_.end()) {
                users.push_back({{"id", member}, {"username", participant->second.username}});
            }
        }
    }
    return {{"room", room}, {"users", std::move(users)}};
}

std::vector<std::string> RoomRegistry::MembersLocked(const std::string& room,
                                                     const std::string& except) const {
    std::vector<std::string> members;
    auto it = rooms_.find(room);
    if (it == rooms_.end()) {
        return members;
    }
    for (const auto& member : it->second.members) {
        if (member != except) {
            members.push_back(member);
        }
    }
    return members;
}

}  // namespace codebox::collab
