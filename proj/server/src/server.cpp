#include "parley_server/server.hpp"
#include "parley_server/log.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace parley_server {

static void safe_close(int& fd) noexcept { if (fd >= 0) ::close(fd), fd = -1; }
static bool set_nonblocking(int fd) {
    int f = ::fcntl(fd, F_GETFL, 0);
    return (f >= 0 && ::fcntl(fd, F_SETFL, f | O_NONBLOCK) == 0);
}

static ChatHub::Options hub_options(const ServerConfig& c) {
    ChatHub::Options o;
    o.history_limit   = c.history_limit;
    o.default_room    = c.default_room;
    o.max_name_length = c.max_name_length;
    return o;
}

EpollServer::EpollServer(ServerConfig c)
    : cfg_(std::move(c)),
      hub_([this](int fd, const std::string& text) { return send_text(fd, text); },
           hub_options(cfg_))
{}

EpollServer::~EpollServer() {
    stop();
    for (auto& kv : conns_) kv.second.close_now();
    conns_.clear();
    safe_close(wake_fd_);
    safe_close(epoll_fd_);
    safe_close(listen_fd_);
}

void EpollServer::open() {
    if (listen_fd_ >= 0) return;
    setup_listen_socket();
    setup_epoll();
    running_ = true;
}

// A stop() issued after open() but before run() makes run() return at once.
void EpollServer::run() {
    open();
    loop();
}

// Called from signal handlers: only an atomic store and write(2) here.
void EpollServer::stop() noexcept {
    running_.store(false);
    if (wake_fd_ >= 0) {
        const int saved_errno = errno;
        const std::uint64_t one = 1;
        // A full eventfd counter already guarantees a wakeup.
        const ssize_t rc = ::write(wake_fd_, &one, sizeof(one));
        (void)rc;
        errno = saved_errno;
    }
}

void EpollServer::setup_listen_socket() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) throw std::runtime_error("socket() failed");

    int opt = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        throw std::runtime_error("setsockopt(SO_REUSEADDR) failed");
    if (!set_nonblocking(listen_fd_)) throw std::runtime_error("fcntl failed");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(static_cast<std::uint16_t>(cfg_.port));
    if (::inet_pton(AF_INET, cfg_.bind_address.c_str(), &addr.sin_addr) != 1)
        throw std::runtime_error("inet_pton failed for " + cfg_.bind_address);

    if (::bind(listen_fd_, (sockaddr*)&addr, sizeof(addr)) < 0 ||
        ::listen(listen_fd_, 1024) < 0)
        throw std::runtime_error(std::string("bind/listen failed: ") + std::strerror(errno));

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, (sockaddr*)&bound, &len) < 0)
        throw std::runtime_error("getsockname failed");
    bound_port_ = ntohs(bound.sin_port);
}

void EpollServer::setup_epoll() {
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) throw std::runtime_error("epoll_create1 failed");

    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) throw std::runtime_error("eventfd failed");

    epoll_event ev{};
    ev.data.fd = listen_fd_;
    ev.events  = EPOLLIN;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listen_fd_, &ev) < 0)
        throw std::runtime_error("epoll_ctl ADD failed");

    ev.data.fd = wake_fd_;
    ev.events  = EPOLLIN;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0)
        throw std::runtime_error("epoll_ctl ADD (eventfd) failed");
}

void EpollServer::loop() {
    constexpr int MAX_EVENTS = 256;
    std::vector<epoll_event> events(MAX_EVENTS);

    log_info("Listening on ", cfg_.bind_address, ":", bound_port_.load());

    while (running_) {
        int n = ::epoll_wait(epoll_fd_, events.data(), MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("epoll_wait failed");
        }

        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) {
                std::uint64_t drained = 0;
                while (::read(wake_fd_, &drained, sizeof(drained)) > 0) {}
            } else if (fd == listen_fd_) {
                accept_new_connections();
            } else {
                handle_event(fd, events[i].events);
            }
        }
    }

    log_info("Event loop stopped");
}

void EpollServer::accept_new_connections() {
    for (;;) {
        sockaddr_in ca{};
        socklen_t cl = sizeof(ca);

        int cfd = ::accept4(listen_fd_, (sockaddr*)&ca, &cl,
                            SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EINTR) continue;
            log_error("accept4: ", std::strerror(errno));
            return;
        }

        if (cfg_.max_connections > 0 && (int)conns_.size() >= cfg_.max_connections) {
            log_warn("Connection limit reached (", cfg_.max_connections, "), refusing ", format_peer(ca));
            ::close(cfd);
            continue;
        }

        Connection::Limits limits;
        limits.max_message_bytes = cfg_.max_message_bytes;
        limits.max_outbuf_bytes  = cfg_.max_outbuf_bytes;
        Connection conn(cfd, format_peer(ca), limits);

        epoll_event ev{};
        ev.data.fd = cfd;
        ev.events  = EPOLLIN | EPOLLRDHUP;

        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, cfd, &ev) < 0) {
            conn.close_now();
            continue;
        }

        log_info("New connection fd=", cfd, " from ", conn.peer());
        conns_.emplace(cfd, std::move(conn));
    }
}

void EpollServer::handle_event(int fd, std::uint32_t events) {
    auto it = conns_.find(fd);
    if (it == conns_.end()) return;
    Connection& c = it->second;

    if (events & EPOLLERR) {
        close_connection(fd);
        return reap_doomed();
    }

    // On a hang-up the socket is still read once; on_readable() handles
    // any buffered frames before reporting the end of stream.
    if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP)) {
        const bool ok = c.on_readable(
            [this](Connection& cc) { hub_.add_connection(cc.fd()); },
            [this](Connection& cc, const std::string& text) { hub_.on_text(cc.fd(), text); });
        if (!ok) {
            close_connection(fd);
            return reap_doomed();
        }
    }

    if ((events & EPOLLOUT) && !c.on_writable()) {
        close_connection(fd);
        return reap_doomed();
    }

    if (c.should_close()) {
        close_connection(fd);
        return reap_doomed();
    }

    update_interest(fd);
    reap_doomed();
}

void EpollServer::close_connection(int fd) {
    auto it = conns_.find(fd);
    if (it == conns_.end()) return;

    const RoomManager& rooms = hub_.rooms();
    log_info("Closed: ", it->second.peer(), " user=", rooms.username_of(fd),
             " room=", rooms.room_of(fd));

    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    // Leave the room before the fd number can be reused by accept().
    hub_.remove_connection(fd);
    it->second.close_now();
    conns_.erase(it);
}

void EpollServer::reap_doomed() {
    while (!doomed_.empty()) {
        const int fd = doomed_.back();
        doomed_.pop_back();
        close_connection(fd);
    }
}

void EpollServer::update_interest(int fd) {
    auto it = conns_.find(fd);
    if (it == conns_.end()) return;

    epoll_event ev{};
    ev.data.fd = fd;
    ev.events  = EPOLLIN | EPOLLRDHUP;
    if (it->second.wants_write())
        ev.events |= EPOLLOUT;

    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0)
        doomed_.push_back(fd);
}

void EpollServer::ensure_writable(int fd) {
    auto it = conns_.find(fd);
    if (it != conns_.end() && it->second.wants_write())
        update_interest(fd);
}

bool EpollServer::send_text(int fd, const std::string& text) {
    auto it = conns_.find(fd);
    if (it == conns_.end()) return false;

    if (!it->second.queue_text(text)) {
        if (it->second.overflowed())
            log_warn("Slow consumer fd=", fd, " (", it->second.peer(), ") exceeded output limit");
        doomed_.push_back(fd);
        return false;
    }
    ensure_writable(fd);
    return true;
}

std::string EpollServer::format_peer(const sockaddr_in& a) {
    char ip[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &a.sin_addr, ip, sizeof(ip));
    std::ostringstream o;
    o << ip << ":" << ntohs(a.sin_port);
    return o.str();
}

} // namespace parley_server
