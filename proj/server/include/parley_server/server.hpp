#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "parley_server/chat_hub.hpp"
#include "parley_server/connection.hpp"
#include "parley_server/server_config.hpp"

struct sockaddr_in;

namespace parley_server {

class EpollServer {
public:
    explicit EpollServer(ServerConfig cfg);
    ~EpollServer();

    EpollServer(const EpollServer&) = delete;
    EpollServer& operator=(const EpollServer&) = delete;

    void open();  // bind + listen + epoll; called by run() if needed
    void run();   // blocking event loop
    void stop() noexcept;  // request shutdown; safe from any thread or a signal handler

    // Bound port, valid after open(). Differs from cfg.port when it was 0.
    int port() const noexcept { return bound_port_.load(); }

    const ChatHub& hub() const noexcept { return hub_; }

private:
    ServerConfig cfg_;

    int listen_fd_{-1};
    int epoll_fd_{-1};
    int wake_fd_{-1};
    std::atomic<int> bound_port_{0};
    std::atomic<bool> running_{false};

    // key: client fd
    std::unordered_map<int, Connection> conns_;

    // fds that failed a delivery or an epoll update mid-callback
    std::vector<int> doomed_;

    ChatHub hub_;

    void setup_listen_socket();
    void setup_epoll();
    void loop();

    void accept_new_connections();
    void handle_event(int fd, std::uint32_t events);

    void close_connection(int fd);
    void reap_doomed();

    void update_interest(int fd);
    void ensure_writable(int fd);

    bool send_text(int fd, const std::string& text);

    static std::string format_peer(const sockaddr_in& addr);
};

} // namespace parley_server
