#include "parley/protocol.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace parley {

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

json to_json(const ChatMessage& m) {
    return json{{"username", m.username}, {"text", m.text}};
}

ChatMessage message_from(const json& j) {
    if (!j.is_object()) return {};
    return ChatMessage{string_field(j, "username"), string_field(j, "text")};
}

// Client-supplied text is not guaranteed to be valid UTF-8 once it has been
// stored; never let dump() throw on it.
std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

Event Event::init(std::string room,
                  std::vector<std::string> rooms,
                  std::vector<std::string> users,
                  std::vector<ChatMessage> messages) {
    Event ev;
    ev.type     = EventType::Init;
    ev.room     = std::move(room);
    ev.rooms    = std::move(rooms);
    ev.users    = std::move(users);
    ev.messages = std::move(messages);
    return ev;
}

Event Event::rooms_list(std::vector<std::string> rooms) {
    Event ev;
    ev.type  = EventType::Rooms;
    ev.rooms = std::move(rooms);
    return ev;
}

Event Event::users_list(std::vector<std::string> users) {
    Event ev;
    ev.type  = EventType::Users;
    ev.users = std::move(users);
    return ev;
}

Event Event::chat(ChatMessage message) {
    Event ev;
    ev.type    = EventType::Message;
    ev.message = std::move(message);
    return ev;
}

Event Event::system(std::string notice) {
    Event ev;
    ev.type   = EventType::System;
    ev.notice = std::move(notice);
    return ev;
}

const char* to_string(EventType type) noexcept {
    switch (type) {
        case EventType::Init:    return "init";
        case EventType::Rooms:   return "rooms";
        case EventType::Users:   return "users";
        case EventType::Message: return "message";
        case EventType::System:  return "system";
    }
    return "unknown";
}

bool decode_command(std::string_view text, Command& out) {
    const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return false;

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) return false;

    out = Command{};
    out.raw_type = type_it->get<std::string>();
    out.username = string_field(j, "username");
    out.room     = string_field(j, "room");
    out.text     = string_field(j, "text");

    if (out.raw_type == "join" || out.raw_type == "switch_room") {
        out.type = CommandType::Join;
    } else if (out.raw_type == "message") {
        out.type = CommandType::Message;
    } else {
        out.type = CommandType::Unknown;
    }
    return true;
}

std::string encode_event(const Event& ev) {
    json j;
    j["type"] = to_string(ev.type);

    switch (ev.type) {
        case EventType::Init: {
            json msgs = json::array();
            for (const auto& m : ev.messages) msgs.push_back(to_json(m));
            j["room"]     = ev.room;
            j["rooms"]    = ev.rooms;
            j["users"]    = ev.users;
            j["messages"] = std::move(msgs);
            break;
        }
        case EventType::Rooms:
            j["rooms"] = ev.rooms;
            break;
        case EventType::Users:
            j["users"] = ev.users;
            break;
        case EventType::Message:
            j["message"] = to_json(ev.message);
            break;
        case EventType::System:
            j["message"] = ev.notice;
            break;
    }
    return dump(j);
}

std::string encode_command(const Command& cmd) {
    json j;
    switch (cmd.type) {
        case CommandType::Join:
            j["type"]     = cmd.raw_type.empty() ? "join" : cmd.raw_type;
            j["username"] = cmd.username;
            j["room"]     = cmd.room;
            break;
        case CommandType::Message:
            j["type"]     = "message";
            j["room"]     = cmd.room;
            j["username"] = cmd.username;
            j["text"]     = cmd.text;
            break;
        case CommandType::Unknown:
            j["type"] = cmd.raw_type;
            break;
    }
    return dump(j);
}

bool decode_event(std::string_view text, Event& out) {
    const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return false;

    const std::string type = string_field(j, "type");
    out = Event{};

    if (type == "init") {
        out.type  = EventType::Init;
        out.room  = string_field(j, "room");
        out.rooms = string_list(j, "rooms");
        out.users = string_list(j, "users");
        auto it = j.find("messages");
        if (it != j.end() && it->is_array()) {
            for (const auto& m : *it) out.messages.push_back(message_from(m));
        }
    } else if (type == "rooms") {
        out.type  = EventType::Rooms;
        out.rooms = string_list(j, "rooms");
    } else if (type == "users") {
        out.type  = EventType::Users;
        out.users = string_list(j, "users");
    } else if (type == "message") {
        out.type = EventType::Message;
        auto it = j.find("message");
        if (it == j.end()) return false;
        out.message = message_from(*it);
    } else if (type == "system") {
        out.type   = EventType::System;
        out.notice = string_field(j, "message");
    } else {
        return false;
    }
    return true;
}

} // namespace parley
