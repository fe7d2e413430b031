#include "parley_server/room_manager.hpp"
#include "parley_server/log.hpp"

#include <algorithm>
#include <utility>

namespace parley_server {

namespace {
constexpr ConnectionId NO_CONNECTION = -1;
}

RoomManager::RoomManager(SendFn send_fn, std::size_t history_limit, std::string default_room)
    : send_fn_(std::move(send_fn)),
      history_limit_(history_limit == 0 ? 1 : history_limit),
      default_room_(default_room.empty() ? std::string(DEFAULT_ROOM) : std::move(default_room))
{}

void RoomManager::connect(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_.emplace(id, Member{});
}

bool RoomManager::join(ConnectionId id, const std::string& username, const std::string& room) {
    if (username.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string target = room.empty() ? default_room_ : room;
    Member& m = members_[id];

    if (m.room == target) {
        // Re-join of the current room: refresh identity and snapshot only.
        Room& r = rooms_.at(target);
        const bool renamed = m.username != username;
        m.username = username;
        if (renamed) broadcast_room(r, parley::Event::users_list(usernames_locked(r)), id);
        deliver(id, init_event_locked(target, r));
        reap_dead_locked();
        return true;
    }

    if (!m.room.empty()) leave_locked(id, m);

    auto it = rooms_.find(target);
    const bool created = it == rooms_.end();
    if (created) {
        it = rooms_.emplace(target, Room{}).first;
        room_order_.push_back(target);
        log_info("Room created: ", target);
    }

    Room& r = it->second;
    r.members.push_back(id);
    m.username = username;
    m.room = target;
    log_debug("fd=", id, " user=", username, " joined room=", target);

    if (created) broadcast_all(parley::Event::rooms_list(room_order_), id);

    deliver(id, init_event_locked(target, r));
    broadcast_room(r, parley::Event::users_list(usernames_locked(r)), id);
    broadcast_room(r, parley::Event::system(username + " joined the room"), id);

    reap_dead_locked();
    return true;
}

void RoomManager::leave(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(id);
    if (it == members_.end() || it->second.room.empty()) return;

    leave_locked(id, it->second);
    reap_dead_locked();
}

void RoomManager::send(ConnectionId id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(id);
    if (it == members_.end() || it->second.room.empty()) return;

    Room& r = rooms_.at(it->second.room);
    parley::ChatMessage msg{it->second.username, text};

    r.history.push_back(msg);
    while (r.history.size() > history_limit_) r.history.pop_front();

    broadcast_room(r, parley::Event::chat(std::move(msg)), NO_CONNECTION);
    reap_dead_locked();
}

void RoomManager::disconnect(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked(id);
    reap_dead_locked();
}

bool RoomManager::is_connected(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.count(id) != 0;
}

std::string RoomManager::room_of(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(id);
    if (it == members_.end()) return {};
    return it->second.room;
}

std::string RoomManager::username_of(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(id);
    if (it == members_.end()) return {};
    return it->second.username;
}

std::vector<std::string> RoomManager::room_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return room_order_;
}

std::vector<std::string> RoomManager::users(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return {};
    return usernames_locked(it->second);
}

std::vector<parley::ChatMessage> RoomManager::history(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return {};
    return {it->second.history.begin(), it->second.history.end()};
}

std::size_t RoomManager::room_size(const std::string& room) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return 0;
    return it->second.members.size();
}

std::size_t RoomManager::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

// -------- internal helpers (mutex_ held) --------

void RoomManager::leave_locked(ConnectionId id, Member& m) {
    auto rit = rooms_.find(m.room);
    const std::string room = std::move(m.room);
    m.room.clear();
    if (rit == rooms_.end()) return;

    // Rooms are kept when they empty out; history stays for later joiners.
    Room& r = rit->second;
    r.members.erase(std::remove(r.members.begin(), r.members.end(), id), r.members.end());
    log_debug("fd=", id, " user=", m.username, " left room=", room);

    broadcast_room(r, parley::Event::users_list(usernames_locked(r)), NO_CONNECTION);
    broadcast_room(r, parley::Event::system(m.username + " left the room"), NO_CONNECTION);
}

void RoomManager::disconnect_locked(ConnectionId id) {
    auto it = members_.find(id);
    if (it == members_.end()) return;
    if (!it->second.room.empty()) leave_locked(id, it->second);
    members_.erase(id);
}

void RoomManager::reap_dead_locked() {
    // Disconnecting a dead member notifies its room, which can uncover more
    // dead members; keep going until the queue is drained.
    for (std::size_t i = 0; i < dead_queue_.size(); ++i) {
        const ConnectionId id = dead_queue_[i];
        log_warn("Delivery to fd=", id, " failed, dropping it");
        disconnect_locked(id);
    }
    dead_queue_.clear();
    dead_.clear();
}

void RoomManager::deliver(ConnectionId dst, const parley::Event& ev) {
    if (dead_.count(dst)) return;
    if (send_fn_ && send_fn_(dst, ev)) return;

    dead_.insert(dst);
    dead_queue_.push_back(dst);
}

void RoomManager::broadcast_room(const Room& room, const parley::Event& ev, ConnectionId except) {
    for (ConnectionId dst : room.members) {
        if (dst != except) deliver(dst, ev);
    }
}

void RoomManager::broadcast_all(const parley::Event& ev, ConnectionId except) {
    for (const auto& kv : members_) {
        if (kv.first != except) deliver(kv.first, ev);
    }
}

std::vector<std::string> RoomManager::usernames_locked(const Room& room) const {
    std::vector<std::string> out;
    out.reserve(room.members.size());
    for (ConnectionId id : room.members) {
        auto it = members_.find(id);
        if (it != members_.end()) out.push_back(it->second.username);
    }
    return out;
}

parley::Event RoomManager::init_event_locked(const std::string& name, const Room& room) const {
    return parley::Event::init(name,
                               room_order_,
                               usernames_locked(room),
                               {room.history.begin(), room.history.end()});
}

} // namespace parley_server
