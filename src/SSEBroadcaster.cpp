#include "SSEBroadcaster.hpp"
#include <utility>

size_t SSEBroadcaster::subscribe(Sender sendEvent) {
    std::lock_guard lock(mtx);
    size_t id = nextId++;
    clients.emplace(id, std::move(sendEvent));
    return id;
}

void SSEBroadcaster::unsubscribe(size_t subscription) {
    std::lock_guard lock(mtx);
    clients.erase(subscription);
}

void SSEBroadcaster::broadcast(const std::string& type, const std::string& data) {
    std::lock_guard lock(mtx);
    std::string event = "event: " + type + "\ndata: " + data + "\n\n";
    for (auto it = clients.begin(); it != clients.end();) {
        if (it->second(event)) {
            ++it;
        } else {
            it = clients.erase(it);
        }
    }
}

size_t SSEBroadcaster::subscriberCount() const {
    std::lock_guard lock(mtx);
    return clients.size();
}
