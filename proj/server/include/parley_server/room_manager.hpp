#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "parley/protocol.hpp"

namespace parley_server {

using ConnectionId = int;

constexpr std::size_t DEFAULT_HISTORY_LIMIT = 100;
constexpr const char* DEFAULT_ROOM          = "general";

// RoomManager is the single owner of the room/connection graph.
//
// Every public operation runs under one mutex, including the calls to the
// SendFn, so events for a room reach every member in the order the
// operations were applied. The SendFn must therefore only queue bytes; it
// must not block and must not call back into the manager. Returning false
// from it marks that destination as dead: it receives nothing further and is
// disconnected before the current operation returns.
class RoomManager {
public:
    using SendFn = std::function<bool(ConnectionId /*dst*/, const parley::Event&)>;

    explicit RoomManager(SendFn send_fn,
                         std::size_t history_limit = DEFAULT_HISTORY_LIMIT,
                         std::string default_room = DEFAULT_ROOM);

    RoomManager(const RoomManager&) = delete;
    RoomManager& operator=(const RoomManager&) = delete;

    // Register a live connection (it starts receiving room-list refreshes).
    void connect(ConnectionId id);

    // Leave the current room (if different), enter `room` (created lazily,
    // empty => default room). Returns false without any effect when
    // `username` is empty.
    bool join(ConnectionId id, const std::string& username, const std::string& room);

    // Leave current room (if any).
    void leave(ConnectionId id);

    // Append to the current room's history and broadcast. No-op when unjoined.
    void send(ConnectionId id, const std::string& text);

    // Leave + forget the connection. Idempotent.
    void disconnect(ConnectionId id);

    // Snapshots
    bool is_connected(ConnectionId id) const;
    std::string room_of(ConnectionId id) const;
    std::string username_of(ConnectionId id) const;
    std::vector<std::string> room_names() const;
    std::vector<std::string> users(const std::string& room) const;
    std::vector<parley::ChatMessage> history(const std::string& room) const;
    std::size_t room_size(const std::string& room) const;
    std::size_t connection_count() const;

    std::size_t history_limit() const noexcept { return history_limit_; }
    const std::string& default_room() const noexcept { return default_room_; }

private:
    struct Member {
        std::string username;
        std::string room;     // empty => not in a room
    };

    struct Room {
        std::vector<ConnectionId>       members;   // join order
        std::deque<parley::ChatMessage> history;   // oldest first
    };

    mutable std::mutex mutex_;

    SendFn      send_fn_;
    std::size_t history_limit_;
    std::string default_room_;

    std::unordered_map<std::string, Room> rooms_;
    std::vector<std::string>              room_order_;  // creation order
    std::map<ConnectionId, Member>        members_;

    // Destinations whose delivery failed during the current operation.
    std::unordered_set<ConnectionId> dead_;
    std::vector<ConnectionId>        dead_queue_;

    void leave_locked(ConnectionId id, Member& m);
    void disconnect_locked(ConnectionId id);
    void reap_dead_locked();

    void deliver(ConnectionId dst, const parley::Event& ev);
    void broadcast_room(const Room& room, const parley::Event& ev, ConnectionId except);
    void broadcast_all(const parley::Event& ev, ConnectionId except);

    std::vector<std::string> usernames_locked(const Room& room) const;
    parley::Event init_event_locked(const std::string& name, const Room& room) const;
};

} // namespace parley_server
