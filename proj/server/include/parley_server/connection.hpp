#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "parley/websocket.hpp"

namespace parley_server {

// One accepted socket: HTTP upgrade, then RFC 6455 frames.
class Connection {
public:
    struct Limits {
        std::size_t max_message_bytes = 64 * 1024;
        std::size_t max_outbuf_bytes  = 1024 * 1024;
    };

    using OnOpen = std::function<void(Connection&)>;
    using OnText = std::function<void(Connection&, const std::string& /*text*/)>;

    Connection(int fd, std::string peer, Limits limits);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;

    int fd() const noexcept { return fd_; }
    const std::string& peer() const noexcept { return peer_; }

    bool is_closed() const noexcept { return closed_; }
    bool is_open() const noexcept { return state_ == State::Open && !closed_; }
    bool wants_write() const noexcept { return wants_write_; }
    bool overflowed() const noexcept { return overflowed_; }

    // A Close or error response has been queued and fully written.
    bool should_close() const noexcept;

    // Returns false when the connection must be dropped now. Frames that
    // arrive together with the peer's FIN are still delivered first.
    bool on_readable(const OnOpen& on_open, const OnText& on_text);
    bool on_writable();

    // Queue one text frame. Never blocks. Fails when the connection is not
    // open or the pending output would exceed max_outbuf_bytes; the latter
    // also marks the connection overflowed.
    bool queue_text(std::string_view text);

    // Queue a Close frame and stop accepting input.
    void begin_close(std::uint16_t code);

    void close_now() noexcept;

private:
    enum class State {
        Handshake,
        Open,
        Closing
    };

    int fd_{-1};
    std::string peer_;
    bool closed_{false};
    Limits limits_;
    State state_{State::Handshake};

    // Input buffering for stream reassembly
    std::vector<std::uint8_t> inbuf_;

    // Output buffering (single contiguous buffer + offset)
    std::vector<std::uint8_t> outbuf_;
    std::size_t out_off_{0};
    bool wants_write_{false};
    bool overflowed_{false};
    bool peer_eof_{false};   // recv() returned 0

    // Fragmented message being reassembled
    std::string msg_;
    parley::ws::OpCode msg_opcode_{parley::ws::OpCode::Text};
    bool in_message_{false};

    bool read_into_buffer();
    bool process_handshake(const OnOpen& on_open);
    bool process_frames(const OnText& on_text);
    void handle_frame(const parley::ws::FrameHeader& hdr, const std::uint8_t* payload,
                      const OnText& on_text);
    void finish_message(const OnText& on_text);
    bool flush_out_buffer();

    void queue_raw(std::string_view bytes);
    void queue_frame(parley::ws::OpCode opcode, std::string_view payload);
    void protocol_error(std::uint16_t code, const char* why);

    std::size_t pending_out() const noexcept { return outbuf_.size() - out_off_; }

    static constexpr std::size_t READ_CHUNK = 4096;
};

} // namespace parley_server
