#include "client.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>

namespace parley_client {

namespace ws = parley::ws;

Client::Client() = default;

Client::~Client() {
    stop();
}

bool Client::connect_to(const std::string& host, int port, const std::string& target) {
    if (fd_ >= 0) close_now();

    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close_now();
        return false;
    }

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close_now();
        return false;
    }

    if (!handshake(host + ":" + std::to_string(port), target)) {
        close_now();
        return false;
    }
    return true;
}

bool Client::handshake(const std::string& host, const std::string& target) {
    std::string key;
    try {
        key = ws::generate_client_key();
    } catch (const std::exception&) {
        return false;
    }

    const std::string req = ws::client_handshake(host, target, key);
    if (!send_all(fd_, reinterpret_cast<const std::uint8_t*>(req.data()), req.size()))
        return false;

    inbuf_.clear();
    for (;;) {
        std::size_t consumed = 0;
        std::string_view data(reinterpret_cast<const char*>(inbuf_.data()), inbuf_.size());
        switch (ws::parse_handshake_response(data, key, consumed)) {
            case ws::HandshakeStatus::Ok:
                inbuf_.erase(inbuf_.begin(), inbuf_.begin() + static_cast<std::ptrdiff_t>(consumed));
                return true;
            case ws::HandshakeStatus::Bad:
                return false;
            case ws::HandshakeStatus::Incomplete:
                if (!fill(5000)) return false;
                break;
        }
    }
}

bool Client::send_command(const parley::Command& cmd) {
    return send_text(parley::encode_command(cmd));
}

bool Client::join(const std::string& username, const std::string& room) {
    parley::Command cmd;
    cmd.type = parley::CommandType::Join;
    cmd.username = username;
    cmd.room = room;
    if (!send_command(cmd)) return false;

    username_ = username;
    room_ = room;
    return true;
}

bool Client::say(const std::string& text) {
    parley::Command cmd;
    cmd.type = parley::CommandType::Message;
    cmd.username = username_;
    cmd.room = room_;
    cmd.text = text;
    return send_command(cmd);
}

bool Client::send_text(std::string_view text) {
    return send_frame(ws::OpCode::Text, text);
}

bool Client::recv_event(parley::Event& out, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);

    for (;;) {
        if (peer_closed_.load(std::memory_order_acquire)) return false;

        ws::FrameHeader hdr{};
        const bool have_header = ws::read_header(inbuf_.data(), inbuf_.size(), hdr);

        // Checked before header_size + length is formed, so a 64-bit length
        // cannot wrap the sum.
        const std::size_t pending = hdr.opcode == ws::OpCode::Continuation ? msg_.size() : 0;
        if (have_header && (hdr.length > MAX_MESSAGE_BYTES ||
                            pending + hdr.length > MAX_MESSAGE_BYTES)) {
            send_close(ws::close_code::TOO_BIG);
            peer_closed_.store(true, std::memory_order_release);
            return false;
        }
        if (have_header && ws::is_control(hdr.opcode) &&
            (!hdr.fin || hdr.length > ws::MAX_CONTROL_PAYLOAD)) {
            send_close(ws::close_code::PROTOCOL_ERROR);
            peer_closed_.store(true, std::memory_order_release);
            return false;
        }

        if (have_header && inbuf_.size() >= hdr.header_size + hdr.length) {
            const std::size_t total = hdr.header_size + static_cast<std::size_t>(hdr.length);
            std::uint8_t* payload = inbuf_.data() + hdr.header_size;
            if (hdr.masked) ws::apply_mask(payload, static_cast<std::size_t>(hdr.length), hdr.mask);
            std::string body(reinterpret_cast<const char*>(payload), static_cast<std::size_t>(hdr.length));
            inbuf_.erase(inbuf_.begin(), inbuf_.begin() + static_cast<std::ptrdiff_t>(total));

            switch (hdr.opcode) {
                case ws::OpCode::Text:
                case ws::OpCode::Binary:
                    msg_ = std::move(body);
                    in_message_ = !hdr.fin;
                    break;
                case ws::OpCode::Continuation:
                    msg_ += body;
                    in_message_ = !hdr.fin;
                    break;
                case ws::OpCode::Ping:
                    send_frame(ws::OpCode::Pong, body);
                    continue;
                case ws::OpCode::Pong:
                    continue;
                case ws::OpCode::Close:
                    send_close(ws::close_code::NORMAL);
                    peer_closed_.store(true, std::memory_order_release);
                    return false;
                default:
                    continue;
            }

            if (in_message_) continue;
            if (parley::decode_event(msg_, out)) return true;
            continue;   // not an event we understand
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() <= 0) return false;
            wait_ms = static_cast<int>(left.count());
        }
        if (!fill(wait_ms)) return false;
    }
}

int Client::run(const std::string& username, const std::string& room) {
    if (fd_ < 0) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::cerr << "Client not connected.\n";
        return 1;
    }

    if (!join(username, room)) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::cerr << "Join failed.\n";
        return 1;
    }

    running_.store(true, std::memory_order_release);

    // Receiver thread: prints incoming events while you type.
    rx_thread_ = std::thread([this]{ rx_loop(); });

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::cout << "Commands: /join <room> | /quit\n";
    }

    while (running_.load(std::memory_order_acquire)) {
        std::string line;
        if (!std::getline(std::cin, line)) break;
        trim_cr(line);
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;

        bool ok = false;
        if (starts_with(line, "/join ")) {
            ok = join(username_, line.substr(6));
        } else {
            ok = say(line);
        }

        if (!ok) {
            std::lock_guard<std::mutex> lock(io_mutex_);
            std::cerr << "Send failed.\n";
            break;
        }
    }

    stop();
    return 0;
}

void Client::stop() {
    running_.store(false, std::memory_order_release);

    if (fd_ >= 0) {
        if (!peer_closed_.load(std::memory_order_acquire))
            send_close(ws::close_code::GOING_AWAY);
        ::shutdown(fd_, SHUT_RDWR);
    }

    if (rx_thread_.joinable()) rx_thread_.join();
    close_now();
}

// -------- internal helpers --------

bool Client::send_frame(ws::OpCode opcode, std::string_view payload) {
    if (fd_ < 0) return false;

    std::vector<std::uint8_t> frame;
    try {
        const ws::MaskKey mask = ws::random_mask();
        ws::encode_frame(opcode, payload, frame, &mask);
    } catch (const std::exception&) {
        return false;
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    return send_all(fd_, frame.data(), frame.size());
}

void Client::send_close(std::uint16_t code) {
    if (fd_ < 0) return;

    std::vector<std::uint8_t> frame;
    try {
        const ws::MaskKey mask = ws::random_mask();
        ws::encode_close(code, frame, &mask);
    } catch (const std::exception&) {
        return;   // no mask, no Close; the socket is dropped anyway
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    send_all(fd_, frame.data(), frame.size());
}

bool Client::send_all(int fd, const std::uint8_t* data, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
        if (n > 0) { off += static_cast<std::size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
    return true;
}

bool Client::fill(int timeout_ms) {
    if (fd_ < 0) return false;

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int r;
    do {
        r = ::poll(&pfd, 1, timeout_ms);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return false;   // timeout
    if (r < 0) {
        peer_closed_.store(true, std::memory_order_release);
        return false;
    }

    std::uint8_t tmp[4096];
    ssize_t n;
    do {
        n = ::recv(fd_, tmp, sizeof(tmp), 0);
    } while (n < 0 && errno == EINTR);
    if (n <= 0) {
        peer_closed_.store(true, std::memory_order_release);
        return false;
    }

    inbuf_.insert(inbuf_.end(), tmp, tmp + n);
    return true;
}

void Client::rx_loop() {
    while (running_.load(std::memory_order_acquire)) {
        parley::Event ev;
        if (recv_event(ev, 200)) {
            print_event(ev);
            continue;
        }
        if (peer_closed_.load(std::memory_order_acquire)) break;
    }

    if (running_.exchange(false)) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::cout << "\n[disconnected] press Enter to exit\n";
    }
}

void Client::print_event(const parley::Event& ev) {
    auto join_list = [](const std::vector<std::string>& v) {
        std::string s;
        for (const auto& item : v) {
            if (!s.empty()) s += ", ";
            s += item;
        }
        return s;
    };

    std::lock_guard<std::mutex> lock(io_mutex_);
    switch (ev.type) {
        case parley::EventType::Init:
            std::cout << "== #" << ev.room << " == users: " << join_list(ev.users)
                      << " | rooms: " << join_list(ev.rooms) << "\n";
            for (const auto& m : ev.messages)
                std::cout << m.username << ": " << m.text << "\n";
            break;
        case parley::EventType::Rooms:
            std::cout << "[rooms] " << join_list(ev.rooms) << "\n";
            break;
        case parley::EventType::Users:
            std::cout << "[users] " << join_list(ev.users) << "\n";
            break;
        case parley::EventType::Message:
            std::cout << ev.message.username << ": " << ev.message.text << "\n";
            break;
        case parley::EventType::System:
            std::cout << "* " << ev.notice << "\n";
            break;
    }
    std::cout << std::flush;
}

void Client::trim_cr(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
}

bool Client::starts_with(std::string_view s, std::string_view pfx) {
    return s.size() >= pfx.size() && s.substr(0, pfx.size()) == pfx;
}

void Client::close_now() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    peer_closed_.store(false, std::memory_order_release);
    inbuf_.clear();
    msg_.clear();
    in_message_ = false;
}

} // namespace parley_client
