#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "parley/protocol.hpp"
#include "parley/websocket.hpp"

namespace parley_client {

class Client {
public:
    // Largest frame or reassembled message accepted from the server.
    static constexpr std::size_t MAX_MESSAGE_BYTES = 16 * 1024 * 1024;

    Client();
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // TCP connect + WebSocket upgrade.
    bool connect_to(const std::string& host, int port, const std::string& target = "/");
    bool is_connected() const noexcept { return fd_ >= 0 && !peer_closed_; }

    bool send_command(const parley::Command& cmd);
    bool join(const std::string& username, const std::string& room);
    bool say(const std::string& text);

    // Raw text frame, no JSON encoding.
    bool send_text(std::string_view text);

    // Next decoded event. Answers pings on the way. Returns false on
    // timeout (timeout_ms >= 0), Close, socket error or an oversized or
    // malformed frame; the last three leave the client disconnected.
    bool recv_event(parley::Event& out, int timeout_ms = -1);

    // Receiver thread + interactive prompt loop.
    // Returns when user quits or server closes.
    int run(const std::string& username, const std::string& room);

    // Send Close, stop threads and close socket.
    void stop();

private:
    int fd_{-1};
    std::atomic<bool> running_{false};
    std::atomic<bool> peer_closed_{false};   // Close received, EOF or socket error

    std::string username_;
    std::string room_;

    std::vector<std::uint8_t> inbuf_;
    std::string msg_;
    bool in_message_{false};

    std::thread rx_thread_;
    std::mutex io_mutex_;    // stdout
    std::mutex send_mutex_;  // socket writes (prompt thread + pongs from rx thread)

    bool handshake(const std::string& host, const std::string& target);
    bool send_frame(parley::ws::OpCode opcode, std::string_view payload);
    void send_close(std::uint16_t code);
    static bool send_all(int fd, const std::uint8_t* data, std::size_t len);
    bool fill(int timeout_ms);

    // Receiver thread
    void rx_loop();
    void print_event(const parley::Event& ev);

    // Utils
    static void trim_cr(std::string& s);
    static bool starts_with(std::string_view s, std::string_view pfx);
    void close_now();
};

} // namespace parley_client
