#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "parley/protocol.hpp"
#include "parley_server/room_manager.hpp"

namespace parley_server {

// ChatHub is the wire adapter in front of the RoomManager: it decodes
// inbound JSON text into manager calls, and encodes manager events into
// JSON text for the transport. It does NOT touch epoll directly; the SendFn
// queues the text on the destination's socket and returns false if it could
// not (closed, overflowed).
class ChatHub {
public:
    using SendFn = std::function<bool(int /*dst_fd*/, const std::string& /*json*/)>;

    struct Options {
        std::size_t history_limit   = DEFAULT_HISTORY_LIMIT;
        std::string default_room    = DEFAULT_ROOM;
        std::size_t max_name_length = 64;
    };

    ChatHub(SendFn send_fn, Options opts);

    // Lifecycle
    void add_connection(int fd);
    void remove_connection(int fd);

    // One complete inbound text message from `fd`.
    void on_text(int fd, std::string_view text);

    RoomManager& rooms() noexcept { return rooms_; }
    const RoomManager& rooms() const noexcept { return rooms_; }

private:
    SendFn      send_fn_;
    Options     opts_;
    RoomManager rooms_;

    void handle_join(int fd, const parley::Command& cmd);
    void handle_message(int fd, const parley::Command& cmd);

    static std::string trim(const std::string& s);
    static std::string preview(std::string_view text);
};

} // namespace parley_server
