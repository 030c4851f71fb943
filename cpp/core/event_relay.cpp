#include "event_relay.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace sidecar {

EventRelay::ListenerId EventRelay::subscribe(NotificationListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool EventRelay::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

size_t EventRelay::emit(const NotificationEvent& event) {
    // 复制一份快照，回调在锁外执行（回调里可以 subscribe / unsubscribe）
    std::vector<std::pair<ListenerId, NotificationListener>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = listeners_;
    }

    if (snapshot.empty()) {
        std::cout << "[EventRelay] No listener connected, dropped " << event.name() << std::endl;
        return 0;
    }

    size_t delivered = 0;
    for (const auto& [id, listener] : snapshot) {
        try {
            listener(event);
            delivered++;
        } catch (const std::exception& e) {
            std::cerr << "[EventRelay] Listener " << id << " failed on "
                      << event.name() << ": " << e.what() << std::endl;
        }
    }
    return delivered;
}

size_t EventRelay::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

} // namespace sidecar
