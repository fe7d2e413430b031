#include "parley_server/connection.hpp"
#include "parley_server/log.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <sys/socket.h>
#include <unistd.h>

namespace parley_server {

namespace ws = parley::ws;

static void safe_close_fd(int& fd) noexcept {
    if (fd >= 0) { ::close(fd); fd = -1; }
}

Connection::Connection(int fd, std::string peer, Limits limits)
    : fd_(fd), peer_(std::move(peer)), limits_(limits)
{
    inbuf_.reserve(16 * 1024);
    outbuf_.reserve(16 * 1024);
}

Connection::~Connection() { close_now(); }

Connection::Connection(Connection&& o) noexcept
    : fd_(o.fd_), peer_(std::move(o.peer_)), closed_(o.closed_), limits_(o.limits_),
      state_(o.state_), inbuf_(std::move(o.inbuf_)), outbuf_(std::move(o.outbuf_)),
      out_off_(o.out_off_), wants_write_(o.wants_write_), overflowed_(o.overflowed_),
      peer_eof_(o.peer_eof_),
      msg_(std::move(o.msg_)), msg_opcode_(o.msg_opcode_), in_message_(o.in_message_)
{
    o.fd_ = -1; o.closed_ = true; o.out_off_ = 0; o.wants_write_ = false;
}

Connection& Connection::operator=(Connection&& o) noexcept {
    if (this == &o) return *this;
    close_now();
    fd_ = o.fd_; peer_ = std::move(o.peer_); closed_ = o.closed_; limits_ = o.limits_;
    state_ = o.state_; inbuf_ = std::move(o.inbuf_); outbuf_ = std::move(o.outbuf_);
    out_off_ = o.out_off_; wants_write_ = o.wants_write_; overflowed_ = o.overflowed_;
    peer_eof_ = o.peer_eof_;
    msg_ = std::move(o.msg_); msg_opcode_ = o.msg_opcode_; in_message_ = o.in_message_;
    o.fd_ = -1; o.closed_ = true; o.out_off_ = 0; o.wants_write_ = false;
    return *this;
}

void Connection::close_now() noexcept {
    if (closed_) return;
    closed_ = true;
    safe_close_fd(fd_);
    inbuf_.clear(); outbuf_.clear(); msg_.clear();
    out_off_ = 0; wants_write_ = false;
}

bool Connection::should_close() const noexcept {
    return closed_ || (state_ == State::Closing && pending_out() == 0);
}

bool Connection::on_readable(const OnOpen& on_open, const OnText& on_text) {
    if (closed_ || !read_into_buffer()) {
        close_now();
        return false;
    }

    if (state_ == State::Handshake && !process_handshake(on_open)) {
        close_now();
        return false;
    }
    if (state_ == State::Open && !process_frames(on_text)) {
        close_now();
        return false;
    }
    if (state_ == State::Closing) {
        // Nothing more is read once a Close or error response is queued.
        inbuf_.clear();
    }
    if (peer_eof_) {
        // Frames that arrived ahead of the FIN have been handled above.
        close_now();
        return false;
    }
    return !overflowed_;
}

bool Connection::on_writable() {
    if (closed_) return false;
    if (!flush_out_buffer()) { close_now(); return false; }
    return true;
}

bool Connection::queue_text(std::string_view text) {
    if (closed_ || state_ != State::Open || overflowed_) return false;

    if (pending_out() + text.size() + ws::MAX_FRAME_HEADER_SIZE > limits_.max_outbuf_bytes) {
        overflowed_ = true;
        return false;
    }

    queue_frame(ws::OpCode::Text, text);
    return true;
}

void Connection::begin_close(std::uint16_t code) {
    if (closed_ || state_ == State::Closing) return;
    if (state_ == State::Open) {
        std::vector<std::uint8_t> frame;
        ws::encode_close(code, frame);
        queue_raw(std::string_view(reinterpret_cast<const char*>(frame.data()), frame.size()));
    }
    state_ = State::Closing;
}

// -------- internal helpers --------

bool Connection::read_into_buffer() {
    // Level-triggered: whatever is left past the cap is read on the next wakeup.
    const std::size_t cap = limits_.max_message_bytes + ws::MAX_FRAME_HEADER_SIZE + ws::MAX_HANDSHAKE_SIZE;
    std::uint8_t tmp[READ_CHUNK];
    while (inbuf_.size() < cap) {
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n > 0) {
            if (state_ == State::Closing) continue;   // drain and drop
            std::size_t old = inbuf_.size();
            inbuf_.resize(old + static_cast<std::size_t>(n));
            std::memcpy(inbuf_.data() + old, tmp, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            peer_eof_ = true;
            return true;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        if (errno == EINTR) continue;
        return false;
    }
    return true;
}

bool Connection::process_handshake(const OnOpen& on_open) {
    std::string_view data(reinterpret_cast<const char*>(inbuf_.data()), inbuf_.size());
    ws::HandshakeRequest req;
    std::size_t consumed = 0;

    switch (ws::parse_handshake(data, req, consumed)) {
        case ws::HandshakeStatus::Incomplete:
            return true;

        case ws::HandshakeStatus::Bad:
            log_warn("Handshake rejected from ", peer_);
            queue_raw(ws::bad_request_response());
            state_ = State::Closing;
            inbuf_.clear();
            return true;

        case ws::HandshakeStatus::Ok:
            break;
    }

    try {
        queue_raw(ws::handshake_response(req));
    } catch (const std::exception& e) {
        log_error("Handshake failed for ", peer_, ": ", e.what());
        return false;
    }

    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + static_cast<std::ptrdiff_t>(consumed));
    state_ = State::Open;
    log_debug("WebSocket open: ", peer_, " target=", req.target);

    if (on_open) on_open(*this);
    return true;
}

bool Connection::process_frames(const OnText& on_text) {
    std::size_t cursor = 0;

    while (state_ == State::Open && !overflowed_) {
        const std::size_t avail = inbuf_.size() - cursor;

        ws::FrameHeader hdr{};
        if (!ws::read_header(inbuf_.data() + cursor, avail, hdr)) break;

        if (hdr.rsv != 0) { protocol_error(ws::close_code::PROTOCOL_ERROR, "reserved bits set"); break; }
        if (!hdr.masked)  { protocol_error(ws::close_code::PROTOCOL_ERROR, "unmasked client frame"); break; }

        if (ws::is_control(hdr.opcode)) {
            if (!hdr.fin || hdr.length > ws::MAX_CONTROL_PAYLOAD) {
                protocol_error(ws::close_code::PROTOCOL_ERROR, "invalid control frame");
                break;
            }
        } else if (hdr.length > limits_.max_message_bytes ||
                   msg_.size() + hdr.length > limits_.max_message_bytes) {
            protocol_error(ws::close_code::TOO_BIG, "message too big");
            break;
        }

        const std::size_t frame_total = hdr.header_size + static_cast<std::size_t>(hdr.length);
        if (avail < frame_total) break;

        std::uint8_t* payload = inbuf_.data() + cursor + hdr.header_size;
        ws::apply_mask(payload, static_cast<std::size_t>(hdr.length), hdr.mask);

        handle_frame(hdr, payload, on_text);
        cursor += frame_total;
    }

    if (state_ == State::Closing) {
        inbuf_.clear();
    } else if (cursor > 0) {
        std::size_t rem = inbuf_.size() - cursor;
        if (rem) std::memmove(inbuf_.data(), inbuf_.data() + cursor, rem);
        inbuf_.resize(rem);
    }
    return !overflowed_;
}

void Connection::handle_frame(const ws::FrameHeader& hdr, const std::uint8_t* payload,
                              const OnText& on_text) {
    const std::string_view body(reinterpret_cast<const char*>(payload),
                                static_cast<std::size_t>(hdr.length));

    switch (hdr.opcode) {
        case ws::OpCode::Text:
        case ws::OpCode::Binary:
            if (in_message_) {
                protocol_error(ws::close_code::PROTOCOL_ERROR, "new message inside fragmented message");
                return;
            }
            msg_opcode_ = hdr.opcode;
            msg_.assign(body.data(), body.size());
            in_message_ = true;
            if (hdr.fin) finish_message(on_text);
            return;

        case ws::OpCode::Continuation:
            if (!in_message_) {
                protocol_error(ws::close_code::PROTOCOL_ERROR, "unexpected continuation frame");
                return;
            }
            msg_.append(body.data(), body.size());
            if (hdr.fin) finish_message(on_text);
            return;

        case ws::OpCode::Ping:
            queue_frame(ws::OpCode::Pong, body);
            return;

        case ws::OpCode::Pong:
            return;

        case ws::OpCode::Close: {
            // Body is empty, or a 2-byte code plus an optional reason.
            if (body.size() == 1) {
                protocol_error(ws::close_code::PROTOCOL_ERROR, "truncated close code");
                return;
            }
            if (body.size() >= 2) {
                const auto code = static_cast<std::uint16_t>((static_cast<std::uint8_t>(body[0]) << 8) |
                                                             static_cast<std::uint8_t>(body[1]));
                if (!ws::is_valid_close_code(code)) {
                    protocol_error(ws::close_code::PROTOCOL_ERROR, "invalid close code");
                    return;
                }
                log_debug("Close frame from ", peer_, " code=", code);
            }
            begin_close(ws::close_code::NORMAL);
            return;
        }

        default:
            protocol_error(ws::close_code::PROTOCOL_ERROR, "unknown opcode");
            return;
    }
}

void Connection::finish_message(const OnText& on_text) {
    in_message_ = false;
    std::string text;
    text.swap(msg_);

    if (msg_opcode_ != ws::OpCode::Text) {
        log_warn("Binary message from ", peer_, " ignored (", text.size(), " bytes)");
        return;
    }
    if (on_text) on_text(*this, text);
}

bool Connection::flush_out_buffer() {
    while (out_off_ < outbuf_.size()) {
        std::size_t rem = outbuf_.size() - out_off_;
        ssize_t n = ::send(fd_, outbuf_.data() + out_off_, rem, MSG_NOSIGNAL);

        if (n > 0) { out_off_ += static_cast<std::size_t>(n); continue; }
        if (n == 0) return false;

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            wants_write_ = true;
            if (out_off_ > 64 * 1024) {
                outbuf_.erase(outbuf_.begin(), outbuf_.begin() + static_cast<std::ptrdiff_t>(out_off_));
                out_off_ = 0;
            }
            return true;
        }
        if (errno == EINTR) continue;
        return false;
    }

    outbuf_.clear();
    out_off_ = 0;
    wants_write_ = false;
    return true;
}

void Connection::queue_raw(std::string_view bytes) {
    if (closed_) return;
    outbuf_.insert(outbuf_.end(), bytes.begin(), bytes.end());
    wants_write_ = true;
}

void Connection::queue_frame(ws::OpCode opcode, std::string_view payload) {
    if (closed_) return;
    ws::encode_frame(opcode, payload, outbuf_);
    wants_write_ = true;
}

void Connection::protocol_error(std::uint16_t code, const char* why) {
    log_warn("Protocol error from ", peer_, ": ", why);
    in_message_ = false;
    msg_.clear();
    begin_close(code);
}

} // namespace parley_server
