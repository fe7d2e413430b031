#include "client.hpp"
#include "parley_server/log.hpp"
#include "parley_server/server.hpp"

#include <cassert>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using parley::Event;
using parley::EventType;
using parley_client::Client;

constexpr int BOTS         = 6;
constexpr int PER_BOT      = 20;
constexpr int RECV_TIMEOUT = 5000;

Event next_event(Client& c) {
    Event ev;
    const bool ok = c.recv_event(ev, RECV_TIMEOUT);
    assert(ok && "timed out waiting for an event");
    (void)ok;
    return ev;
}

void drain(Client& c) {
    Event ev;
    while (c.recv_event(ev, 300)) {}
}

parley_server::EpollServer* g_server = nullptr;

extern "C" void on_signal(int) {
    if (g_server) g_server->stop();
}

std::unique_ptr<Client> connect_bot(int port) {
    auto c = std::make_unique<Client>();
    const bool ok = c->connect_to("127.0.0.1", port);
    assert(ok);
    (void)ok;
    return c;
}

}  // namespace

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n"
              << "║        Parley Load Test                                    ║\n"
              << "╚════════════════════════════════════════════════════════════╝" << std::endl;

    parley_server::set_log_level(parley_server::LogLevel::Warn);

    try {
        parley_server::ServerConfig cfg;
        cfg.bind_address = "127.0.0.1";
        cfg.port = 0;

        parley_server::EpollServer server(cfg);
        server.open();
        const int port = server.port();
        assert(port > 0);

        std::thread loop([&server] {
            try {
                server.run();
            } catch (const std::exception& e) {
                std::cerr << "server loop failed: " << e.what() << std::endl;
            }
        });

        // ---- Everyone joins "general" ----
        std::cout << "\n=== Test 1: Bots Join ===" << std::endl;
        std::vector<std::unique_ptr<Client>> bots;
        for (int i = 0; i < BOTS; ++i) {
            bots.push_back(connect_bot(port));
            const std::string name = "bot" + std::to_string(i);
            assert(bots.back()->join(name, "general"));

            Event init = next_event(*bots.back());
            assert(init.type == EventType::Init);
            assert(init.room == "general");
            assert(static_cast<int>(init.users.size()) == i + 1);
            assert(init.users.back() == name);
        }
        for (auto& b : bots) drain(*b);
        std::cout << "✓ Test 1 PASSED" << std::endl;

        // ---- Concurrent chatter, one order for all ----
        std::cout << "\n=== Test 2: Concurrent Messages ===" << std::endl;
        std::vector<std::vector<std::string>> seen(BOTS);
        std::vector<std::thread> workers;
        for (int i = 0; i < BOTS; ++i) {
            workers.emplace_back([&bots, &seen, i] {
                Client& c = *bots[i];
                for (int k = 0; k < PER_BOT; ++k) {
                    const bool sent = c.say("m" + std::to_string(i) + "-" + std::to_string(k));
                    assert(sent);
                    (void)sent;
                }
                while (static_cast<int>(seen[i].size()) < BOTS * PER_BOT) {
                    Event ev;
                    if (!c.recv_event(ev, RECV_TIMEOUT)) break;
                    if (ev.type == EventType::Message)
                        seen[i].push_back(ev.message.username + "|" + ev.message.text);
                }
            });
        }
        for (auto& t : workers) t.join();

        for (int i = 0; i < BOTS; ++i) {
            assert(static_cast<int>(seen[i].size()) == BOTS * PER_BOT);
            assert(seen[i] == seen[0]);
        }
        std::cout << "✓ Test 2 PASSED (" << seen[0].size() << " messages, identical order)" << std::endl;

        // ---- Late joiner gets capped history ----
        std::cout << "\n=== Test 3: Late Joiner History ===" << std::endl;
        auto late = connect_bot(port);
        assert(late->join("late", "general"));
        Event init = next_event(*late);
        assert(init.type == EventType::Init);
        assert(init.messages.size() == 100);
        const auto& last = init.messages.back();
        assert(last.username + "|" + last.text == seen[0].back());
        const auto& first = init.messages.front();
        assert(first.username + "|" + first.text == seen[0][seen[0].size() - 100]);

        Event ev = next_event(*bots[0]);
        assert(ev.type == EventType::Users && ev.users.size() == BOTS + 1);
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::System && ev.notice == "late joined the room");
        for (int i = 1; i < BOTS; ++i) drain(*bots[i]);
        std::cout << "✓ Test 3 PASSED" << std::endl;

        // ---- Disconnect notifies the room ----
        std::cout << "\n=== Test 4: Disconnect ===" << std::endl;
        bots[BOTS - 1]->stop();
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::Users);
        assert(ev.users.size() == BOTS);
        for (const auto& u : ev.users) assert(u != "bot" + std::to_string(BOTS - 1));
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::System);
        assert(ev.notice == "bot" + std::to_string(BOTS - 1) + " left the room");
        std::cout << "✓ Test 4 PASSED" << std::endl;

        // ---- Garbage does not cost the connection ----
        std::cout << "\n=== Test 5: Malformed Frame ===" << std::endl;
        assert(bots[1]->send_text("not json at all"));
        assert(bots[1]->say("still here"));
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::Message);
        assert(ev.message.username == "bot1" && ev.message.text == "still here");
        std::cout << "✓ Test 5 PASSED" << std::endl;

        // ---- New room shows up for everyone ----
        std::cout << "\n=== Test 6: Room Creation ===" << std::endl;
        drain(*late);
        assert(late->join("late", "team"));
        ev = next_event(*late);
        assert(ev.type == EventType::Init && ev.room == "team");
        assert(ev.messages.empty());

        ev = next_event(*bots[0]);
        assert(ev.type == EventType::Users);
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::System && ev.notice == "late left the room");
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::Rooms);
        assert(ev.rooms == (std::vector<std::string>{"general", "team"}));
        std::cout << "✓ Test 6 PASSED" << std::endl;

        // ---- A message sent right before hanging up still goes out ----
        std::cout << "\n=== Test 7: Message Then Disconnect ===" << std::endl;
        assert(bots[2]->say("last words"));
        bots[2]->stop();
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::Message);
        assert(ev.message.username == "bot2" && ev.message.text == "last words");
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::Users);
        ev = next_event(*bots[0]);
        assert(ev.type == EventType::System && ev.notice == "bot2 left the room");
        std::cout << "✓ Test 7 PASSED" << std::endl;

        late->stop();
        for (auto& b : bots) b->stop();

        // ---- Shutdown through a signal handler, as main() does ----
        std::cout << "\n=== Test 8: Stop From Signal Handler ===" << std::endl;
        g_server = &server;
        std::signal(SIGUSR1, on_signal);
        std::raise(SIGUSR1);
        loop.join();
        std::signal(SIGUSR1, SIG_DFL);
        g_server = nullptr;
        std::cout << "✓ Test 8 PASSED" << std::endl;

        std::cout << "\n╔════════════════════════════════════════════════════════════╗\n"
                  << "║          ✓ All Tests PASSED!                               ║\n"
                  << "╚════════════════════════════════════════════════════════════╝" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
