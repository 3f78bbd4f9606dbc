// =============================================================================
// HostLink - Observable<T>
// =============================================================================
// Latest-value stream. A subscriber receives the current value immediately and
// then every update. Updates are delivered on the setter's thread, in order,
// outside the value lock.
//   auto sub = csm.state().subscribe([](const ConnectionState& s) { ... });
// =============================================================================
#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include "event_bus.hpp"

namespace hostlink {

template<typename T>
class Observable {
public:
    using Listener = std::function<void(const T&)>;

    explicit Observable(T initial = T{}) : value_(std::move(initial)) {}
    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    T get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    // Replaces the value and notifies all listeners. Concurrent setters are
    // serialized so listeners observe updates in the order values were set.
    void set(T v) {
        std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
        std::vector<Entry> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_ = v;
            listeners = listeners_;
        }
        for (auto& e : listeners) e.fn(v);
    }

    SubscriptionHandle subscribe(Listener fn) {
        std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
        T current;
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            listeners_.push_back({id, fn});
            current = value_;
        }
        fn(current);
        // Unsubscribe waits for an in-flight notification on another thread
        return SubscriptionHandle([this, id]() {
            std::lock_guard<std::recursive_mutex> notify_lock(notify_mutex_);
            std::lock_guard<std::mutex> lock(mutex_);
            listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                [id](const Entry& e) { return e.id == id; }), listeners_.end());
        });
    }

private:
    struct Entry {
        uint64_t id;
        Listener fn;
    };

    mutable std::mutex mutex_;
    std::recursive_mutex notify_mutex_;
    T value_;
    std::vector<Entry> listeners_;
    uint64_t next_id_ = 1;
};

} // namespace hostlink
