#include "parley_server/chat_hub.hpp"
#include "parley_server/log.hpp"

#include <cctype>
#include <utility>

namespace parley_server {

ChatHub::ChatHub(SendFn send_fn, Options opts)
    : send_fn_(std::move(send_fn)),
      opts_(std::move(opts)),
      rooms_([this](ConnectionId dst, const parley::Event& ev) {
                 return send_fn_ && send_fn_(dst, parley::encode_event(ev));
             },
             opts_.history_limit, opts_.default_room)
{}

void ChatHub::add_connection(int fd) {
    rooms_.connect(fd);
}

void ChatHub::remove_connection(int fd) {
    rooms_.disconnect(fd);
}

void ChatHub::on_text(int fd, std::string_view text) {
    parley::Command cmd;
    if (!parley::decode_command(text, cmd)) {
        log_warn("fd=", fd, " malformed frame ignored: ", preview(text));
        return;
    }

    switch (cmd.type) {
        case parley::CommandType::Join:
            handle_join(fd, cmd);
            return;
        case parley::CommandType::Message:
            handle_message(fd, cmd);
            return;
        case parley::CommandType::Unknown:
        default:
            log_warn("fd=", fd, " unknown message type '", preview(cmd.raw_type), "' ignored");
            return;
    }
}

void ChatHub::handle_join(int fd, const parley::Command& cmd) {
    const std::string username = trim(cmd.username);
    const std::string room     = trim(cmd.room);

    if (username.empty()) {
        log_warn("fd=", fd, " join without username ignored");
        return;
    }
    if (username.size() > opts_.max_name_length || room.size() > opts_.max_name_length) {
        log_warn("fd=", fd, " join with over-long name ignored (limit ", opts_.max_name_length, ")");
        return;
    }

    rooms_.join(fd, username, room);
}

void ChatHub::handle_message(int fd, const parley::Command& cmd) {
    // room/username in the frame are ignored; the manager uses tracked state.
    const std::string text = trim(cmd.text);
    if (text.empty()) return;

    rooms_.send(fd, text);
}

std::string ChatHub::trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string ChatHub::preview(std::string_view text) {
    constexpr std::size_t MAX_PREVIEW = 64;
    if (text.size() <= MAX_PREVIEW) return std::string(text);
    return std::string(text.substr(0, MAX_PREVIEW)) + "...";
}

} // namespace parley_server
