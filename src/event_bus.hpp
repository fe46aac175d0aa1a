// =============================================================================
// Retina - Event Bus
// =============================================================================
// Typed publish/subscribe between the match loop, the device session worker
// and observers (CLI, tests). One bus per Controller.
//
//   auto sub = bus.subscribe<MatchEvent>([](const MatchEvent& e) { ... });
//   bus.publish(MatchEvent{...});
//
// Handlers run on the publishing thread, outside the bus lock, so a handler
// may publish or subscribe itself.
// =============================================================================
#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>
#include "result.hpp"
#include "retina_log.hpp"

namespace retina {

// Controller -> observers, once per processed frame
struct MatchEvent {
    uint64_t tick = 0;
    bool matched = false;
    bool from_cache = false;
    std::string template_id;     // empty when !matched
    float confidence = 0.0f;
    std::string source;          // "exact" / "structural" / "none"
    std::string fingerprint;     // hex
    double process_time_ms = 0.0;
};

// DeviceSession -> observers, once per command reaching a terminal state
struct DispatchEvent {
    std::string label;
    bool success = false;
    int attempts = 0;            // writes performed
    std::string error;           // empty on success
    ErrorKind error_kind = ErrorKind::Generic;
};

// DeviceSession state transition. States are device::SessionState values.
struct SessionStateEvent {
    int old_state = 0;
    int new_state = 0;
    std::string label;           // command in flight, may be empty
    int retries = 0;
    int64_t timestamp = 0;       // steady_clock ms
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: lives as long as the bus

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================
// A SubscriptionHandle must not outlive the bus it came from.

class EventBus {
public:
    template<typename T>
    using Handler = std::function<void(const T&)>;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(Handler<T> handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t id = next_id_++;
        channel<T>().handlers.emplace_back(
            id, std::make_shared<const Handler<T>>(std::move(handler)));
        RLOG_DEBUG("eventbus", "handler %llu subscribed to %s",
                   (unsigned long long)id, typeid(T).name());
        return SubscriptionHandle([this, id]() { unsubscribe<T>(id); });
    }

    template<typename T>
    void publish(const T& event) {
        std::vector<std::shared_ptr<const Handler<T>>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const Channel<T>* ch = find<T>();
            if (!ch) return;
            snapshot.reserve(ch->handlers.size());
            for (const auto& h : ch->handlers) snapshot.push_back(h.second);
        }
        for (const auto& fn : snapshot) {
            try {
                (*fn)(event);
            } catch (const std::exception& e) {
                RLOG_ERROR("eventbus", "%s handler threw: %s", typeid(T).name(), e.what());
            }
        }
    }

    template<typename T>
    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Channel<T>* ch = find<T>();
        return ch ? ch->handlers.size() : 0;
    }

    template<typename T>
    bool has_subscribers() const { return subscriber_count<T>() > 0; }

private:
    struct ChannelBase {
        virtual ~ChannelBase() = default;
    };

    template<typename T>
    struct Channel : ChannelBase {
        std::vector<std::pair<uint64_t, std::shared_ptr<const Handler<T>>>> handlers;
    };

    // Callers hold mutex_.
    template<typename T>
    Channel<T>& channel() {
        auto& slot = channels_[std::type_index(typeid(T))];
        if (!slot) slot = std::make_unique<Channel<T>>();
        return static_cast<Channel<T>&>(*slot);
    }

    template<typename T>
    const Channel<T>* find() const {
        auto it = channels_.find(std::type_index(typeid(T)));
        return it == channels_.end() ? nullptr : static_cast<const Channel<T>*>(it->second.get());
    }

    template<typename T>
    void unsubscribe(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& hs = channel<T>().handlers;
        hs.erase(std::remove_if(hs.begin(), hs.end(),
                                [id](const auto& h) { return h.first == id; }),
                 hs.end());
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<ChannelBase>> channels_;
    uint64_t next_id_ = 1;
};

} // namespace retina
