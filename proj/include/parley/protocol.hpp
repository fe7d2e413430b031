#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace parley {

// One history entry / chat line.
struct ChatMessage {
    std::string username;
    std::string text;

    bool operator==(const ChatMessage& o) const {
        return username == o.username && text == o.text;
    }
    bool operator!=(const ChatMessage& o) const { return !(*this == o); }
};

// Client -> server
enum class CommandType : std::uint8_t {
    Join    = 0,   // "join" and "switch_room"
    Message = 1,
    Unknown = 2
};

struct Command {
    CommandType type{CommandType::Unknown};
    std::string raw_type;   // value of "type" as received
    std::string username;
    std::string room;
    std::string text;
};

// Server -> client
enum class EventType : std::uint8_t {
    Init    = 0,
    Rooms   = 1,
    Users   = 2,
    Message = 3,
    System  = 4
};

struct Event {
    EventType type{EventType::System};

    std::string              room;      // Init
    std::vector<std::string> rooms;     // Init, Rooms
    std::vector<std::string> users;     // Init, Users
    std::vector<ChatMessage> messages;  // Init
    ChatMessage              message;   // Message
    std::string              notice;    // System

    static Event init(std::string room,
                      std::vector<std::string> rooms,
                      std::vector<std::string> users,
                      std::vector<ChatMessage> messages);
    static Event rooms_list(std::vector<std::string> rooms);
    static Event users_list(std::vector<std::string> users);
    static Event chat(ChatMessage message);
    static Event system(std::string notice);
};

const char* to_string(EventType type) noexcept;

/// Parse one inbound text frame.
/// Returns false for non-JSON, non-object or missing/non-string "type".
/// Unrecognized types decode successfully as CommandType::Unknown.
bool decode_command(std::string_view text, Command& out);

/// Serialize an outbound event to its JSON text.
std::string encode_event(const Event& ev);

// Client side of the wire.
std::string encode_command(const Command& cmd);
bool decode_event(std::string_view text, Event& out);

} // namespace parley
