#include "client.hpp"
#include "parley/protocol.hpp"
#include "parley/websocket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace parley_client {

namespace ws = parley::ws;

using Bytes = std::vector<std::uint8_t>;

// Scripted server side: one accepted socket, upgraded by hand.
struct ScriptedServer {
    int listen_fd{-1};
    int port{0};

    ScriptedServer() {
        listen_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        assert(listen_fd >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        int rc = ::bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = ::listen(listen_fd, 4);
        assert(rc == 0);
        (void)rc;

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
    }
    ~ScriptedServer() {
        if (listen_fd >= 0) ::close(listen_fd);
    }

    // Accepts one client and answers its upgrade. Returns the socket.
    int accept_upgraded() const {
        const int fd = ::accept(listen_fd, nullptr, nullptr);
        assert(fd >= 0);

        std::string head;
        char tmp[1024];
        ws::HandshakeRequest req;
        std::size_t consumed = 0;
        while (ws::parse_handshake(head, req, consumed) == ws::HandshakeStatus::Incomplete) {
            const ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            assert(n > 0);
            head.append(tmp, static_cast<std::size_t>(n));
        }
        assert(ws::parse_handshake(head, req, consumed) == ws::HandshakeStatus::Ok);
        send_bytes(fd, ws::handshake_response(req));
        return fd;
    }

    static void send_bytes(int fd, const std::string& s) {
        const ssize_t n = ::send(fd, s.data(), s.size(), MSG_NOSIGNAL);
        assert(n == static_cast<ssize_t>(s.size()));
        (void)n;
    }
    static void send_bytes(int fd, const Bytes& b) {
        send_bytes(fd, std::string(b.begin(), b.end()));
    }

    // Reads one masked client frame; returns false on timeout or EOF.
    static bool read_frame(int fd, ws::FrameHeader& hdr, std::string& payload) {
        Bytes buf;
        std::uint8_t tmp[1024];
        for (;;) {
            if (ws::read_header(buf.data(), buf.size(), hdr) &&
                buf.size() >= hdr.header_size + hdr.length) {
                std::uint8_t* p = buf.data() + hdr.header_size;
                ws::apply_mask(p, static_cast<std::size_t>(hdr.length), hdr.mask);
                payload.assign(reinterpret_cast<const char*>(p), static_cast<std::size_t>(hdr.length));
                return true;
            }
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, 3000) <= 0) return false;
            const ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n <= 0) return false;
            buf.insert(buf.end(), tmp, tmp + n);
        }
    }
};

static std::uint16_t close_code_of(const std::string& payload) {
    if (payload.size() < 2) return 0;
    return static_cast<std::uint16_t>((static_cast<std::uint8_t>(payload[0]) << 8) |
                                      static_cast<std::uint8_t>(payload[1]));
}

// Test 1: events, fragments and pings from a well-behaved server
void test_normal_traffic() {
    std::cout << "\n=== Test 1: Normal Traffic ===" << std::endl;

    ScriptedServer srv;
    std::string pong;
    bool got_pong = false;

    std::thread peer([&srv, &pong, &got_pong] {
        const int fd = srv.accept_upgraded();

        Bytes out;
        ws::encode_frame(ws::OpCode::Ping, "hb", out);
        const std::string text = parley::encode_event(parley::Event::system("hello there"));
        Bytes first;
        ws::encode_frame(ws::OpCode::Text, text.substr(0, 5), first);
        first[0] &= 0x7F;   // not final
        out.insert(out.end(), first.begin(), first.end());
        ws::encode_frame(ws::OpCode::Continuation, text.substr(5), out);
        ScriptedServer::send_bytes(fd, out);

        ws::FrameHeader hdr{};
        got_pong = ScriptedServer::read_frame(fd, hdr, pong) && hdr.opcode == ws::OpCode::Pong &&
                   hdr.masked;
        ::close(fd);
    });

    Client client;
    assert(client.connect_to("127.0.0.1", srv.port));

    parley::Event ev;
    assert(client.recv_event(ev, 3000));
    assert(ev.type == parley::EventType::System);
    assert(ev.notice == "hello there");

    peer.join();
    assert(got_pong);
    assert(pong == "hb");

    client.stop();
    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: a 64-bit length near 2^64 is refused without touching the payload
void test_huge_length_rejected() {
    std::cout << "\n=== Test 2: Oversized Frame Length ===" << std::endl;

    ScriptedServer srv;
    std::string reply;
    bool got_close = false;

    std::thread peer([&srv, &reply, &got_close] {
        const int fd = srv.accept_upgraded();

        const Bytes frame = {0x81, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xF0,
                             'a', 'b', 'c'};
        ScriptedServer::send_bytes(fd, frame);

        ws::FrameHeader hdr{};
        got_close = ScriptedServer::read_frame(fd, hdr, reply) && hdr.opcode == ws::OpCode::Close;
        ::close(fd);
    });

    Client client;
    assert(client.connect_to("127.0.0.1", srv.port));

    parley::Event ev;
    assert(!client.recv_event(ev, 3000));
    assert(!client.is_connected());
    assert(!client.recv_event(ev, 0));

    peer.join();
    assert(got_close);
    assert(close_code_of(reply) == ws::close_code::TOO_BIG);

    client.stop();
    std::cout << "✓ Test 2 PASSED" << std::endl;
}

// Test 3: limit is exact, and control frames are held to 125 bytes
void test_frame_limits() {
    std::cout << "\n=== Test 3: Frame Limits ===" << std::endl;

    {
        ScriptedServer srv;
        std::string reply;
        bool got_close = false;

        std::thread peer([&srv, &reply, &got_close] {
            const int fd = srv.accept_upgraded();

            // Header only: MAX_MESSAGE_BYTES + 1 in the 64-bit form
            const std::uint64_t len = Client::MAX_MESSAGE_BYTES + 1;
            Bytes frame = {0x81, 0x7F};
            for (int i = 7; i >= 0; --i) frame.push_back(static_cast<std::uint8_t>((len >> (i * 8)) & 0xFF));
            ScriptedServer::send_bytes(fd, frame);

            ws::FrameHeader hdr{};
            got_close = ScriptedServer::read_frame(fd, hdr, reply);
            ::close(fd);
        });

        Client client;
        assert(client.connect_to("127.0.0.1", srv.port));
        parley::Event ev;
        assert(!client.recv_event(ev, 3000));
        assert(!client.is_connected());

        peer.join();
        assert(got_close);
        assert(close_code_of(reply) == ws::close_code::TOO_BIG);
        client.stop();
    }
    {
        ScriptedServer srv;
        std::string reply;
        bool got_close = false;

        std::thread peer([&srv, &reply, &got_close] {
            const int fd = srv.accept_upgraded();

            Bytes frame;
            ws::encode_frame(ws::OpCode::Ping, std::string(126, 'p'), frame);
            ScriptedServer::send_bytes(fd, frame);

            ws::FrameHeader hdr{};
            got_close = ScriptedServer::read_frame(fd, hdr, reply);
            ::close(fd);
        });

        Client client;
        assert(client.connect_to("127.0.0.1", srv.port));
        parley::Event ev;
        assert(!client.recv_event(ev, 3000));
        assert(!client.is_connected());

        peer.join();
        assert(got_close);
        assert(close_code_of(reply) == ws::close_code::PROTOCOL_ERROR);
        client.stop();
    }

    std::cout << "✓ Test 3 PASSED" << std::endl;
}

}  // namespace parley_client

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n"
              << "║        Client Test Suite                                   ║\n"
              << "╚════════════════════════════════════════════════════════════╝" << std::endl;

    try {
        parley_client::test_normal_traffic();
        parley_client::test_huge_length_rejected();
        parley_client::test_frame_limits();

        std::cout << "\n╔════════════════════════════════════════════════════════════╗\n"
                  << "║          ✓ All Tests PASSED!                               ║\n"
                  << "╚════════════════════════════════════════════════════════════╝" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
