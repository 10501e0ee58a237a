#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// Fans server-sent events out to subscribed clients. A sender returns false
// once its client is gone and is then dropped.
class SSEBroadcaster {
public:
    using Sender = std::function<bool(const std::string&)>;

    size_t subscribe(Sender sendEvent);
    void unsubscribe(size_t subscription);
    void broadcast(const std::string& type, const std::string& data);
    size_t subscriberCount() const;

private:
    std::map<size_t, Sender> clients;
    size_t nextId = 1;
    mutable std::mutex mtx;
};
