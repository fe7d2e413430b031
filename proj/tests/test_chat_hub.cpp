#include "parley_server/chat_hub.hpp"
#include "parley_server/log.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace parley_server {

using json = nlohmann::json;

struct Outbox {
    std::map<int, std::vector<json>> sent;

    ChatHub::SendFn fn() {
        return [this](int fd, const std::string& text) {
            sent[fd].push_back(json::parse(text));
            return true;
        };
    }

    std::vector<json> take(int fd) {
        std::vector<json> out;
        out.swap(sent[fd]);
        return out;
    }
};

// Test 1: JSON in, JSON out
void test_join_and_message() {
    std::cout << "\n=== Test 1: Join And Message ===" << std::endl;

    Outbox box;
    ChatHub hub(box.fn(), ChatHub::Options{});

    hub.add_connection(5);
    hub.on_text(5, R"({"type":"join","username":"  alice ","room":" general "})");

    auto out = box.take(5);
    assert(out.size() == 1);
    assert(out[0]["type"] == "init");
    assert(out[0]["room"] == "general");
    assert(out[0]["users"] == json::array({"alice"}));

    // Frame username/room are ignored for messages
    hub.on_text(5, R"({"type":"message","room":"elsewhere","username":"mallory","text":"  hi  "})");
    out = box.take(5);
    assert(out.size() == 1);
    assert(out[0]["type"] == "message");
    assert(out[0]["message"]["username"] == "alice");
    assert(out[0]["message"]["text"] == "hi");

    // Whitespace-only text is dropped
    hub.on_text(5, R"({"type":"message","text":"   "})");
    assert(box.take(5).empty());
    assert(hub.rooms().history("general").size() == 1);

    // switch_room moves the connection
    hub.on_text(5, R"({"type":"switch_room","username":"alice","room":"team"})");
    out = box.take(5);
    assert(out.size() == 1 && out[0]["type"] == "init" && out[0]["room"] == "team");
    assert(hub.rooms().room_of(5) == "team");

    hub.remove_connection(5);
    assert(!hub.rooms().is_connected(5));

    std::cout << "✓ Test 1 PASSED" << std::endl;
}

// Test 2: bad input changes nothing
void test_ignored_input() {
    std::cout << "\n=== Test 2: Ignored Input ===" << std::endl;

    Outbox box;
    ChatHub::Options opts;
    opts.max_name_length = 8;
    opts.default_room = "lobby";
    ChatHub hub(box.fn(), opts);

    hub.add_connection(1);
    hub.on_text(1, "not json");
    hub.on_text(1, "[1,2]");
    hub.on_text(1, R"({"type":"dance"})");
    hub.on_text(1, R"({"type":"join","username":"   "})");
    hub.on_text(1, R"({"type":"join","username":"much_too_long_name"})");
    hub.on_text(1, R"({"type":"join","username":"bob","room":"a_very_long_room"})");
    hub.on_text(1, R"({"type":"message","text":"nobody hears this"})");

    assert(box.take(1).empty());
    assert(hub.rooms().room_names().empty());
    assert(hub.rooms().is_connected(1));

    // Still usable afterwards; empty room means the configured default
    hub.on_text(1, R"({"type":"join","username":"bob"})");
    auto out = box.take(1);
    assert(out.size() == 1 && out[0]["room"] == "lobby");

    std::cout << "✓ Test 2 PASSED" << std::endl;
}

}  // namespace parley_server

int main() {
    std::cout << "╔════════════════════════════════════════════════════════════╗\n"
              << "║        ChatHub Test Suite                                  ║\n"
              << "╚════════════════════════════════════════════════════════════╝" << std::endl;

    parley_server::set_log_level(parley_server::LogLevel::Error);

    try {
        parley_server::test_join_and_message();
        parley_server::test_ignored_input();

        std::cout << "\n╔════════════════════════════════════════════════════════════╗\n"
                  << "║          ✓ All Tests PASSED!                               ║\n"
                  << "╚════════════════════════════════════════════════════════════╝" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
