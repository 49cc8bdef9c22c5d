#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

// Observer registration with symmetric subscribe/unsubscribe. Handlers run
// outside the lock on a snapshot, so a handler may unsubscribe itself.
template <typename Event>
class EventBroadcaster {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard lock(mtx);
        SubscriptionId id = nextId++;
        clients.emplace(id, std::move(handler));
        return id;
    }

    // Returns false when 'id' was not (or no longer) subscribed.
    bool unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mtx);
        return clients.erase(id) > 0;
    }

    void broadcast(const Event& event) {
        std::vector<Handler> snapshot;
        {
            std::lock_guard lock(mtx);
            snapshot.reserve(clients.size());
            for (const auto& [id, handler] : clients) {
                snapshot.push_back(handler);
            }
        }
        for (auto& handler : snapshot) {
            handler(event);
        }
    }

    size_t subscriberCount() const {
        std::lock_guard lock(mtx);
        return clients.size();
    }

private:
    std::map<SubscriptionId, Handler> clients;
    SubscriptionId nextId = 1;
    mutable std::mutex mtx;
};
