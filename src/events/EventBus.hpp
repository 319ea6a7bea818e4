#pragma once

#include "Event.hpp"
#include <algorithm>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Deepvale {

using EventCallback = std::function<void(Event&)>;

// Handle returned by subscribe, used to unsubscribe
using ListenerHandle = size_t;

// Synchronous event bus decoupling the world from whoever observes it
class EventBus {
public:
    template<typename T>
    static ListenerHandle subscribe(const std::function<void(T&)>& callback) {
        ListenerHandle handle = s_nextHandle++;
        s_listeners[T::getStaticType()].push_back({handle, [callback](Event& e) {
            callback(static_cast<T&>(e));
        }});
        return handle;
    }

    // Receives every event regardless of type
    static ListenerHandle subscribeAll(const EventCallback& callback) {
        ListenerHandle handle = s_nextHandle++;
        s_globalListeners.push_back({handle, callback});
        return handle;
    }

    static void unsubscribe(ListenerHandle handle) {
        auto matches = [handle](const Listener& listener) { return listener.handle == handle; };

        for (auto& [type, listeners] : s_listeners) {
            std::erase_if(listeners, matches);
        }
        std::erase_if(s_globalListeners, matches);
    }

    // Delivers to global listeners first, then typed ones; stops once handled
    // Listeners may (un)subscribe from inside a callback; those changes take
    // effect from the next post
    static void post(Event& event) {
        const auto globals = s_globalListeners;
        for (const auto& listener : globals) {
            listener.callback(event);
            if (event.handled) return;
        }

        auto it = s_listeners.find(event.getEventType());
        if (it == s_listeners.end()) {
            return;
        }
        const auto listeners = it->second;
        for (const auto& listener : listeners) {
            listener.callback(event);
            if (event.handled) break;
        }
    }

    // True when posting an event of this type would reach at least one listener
    static bool hasListeners(EventType type) {
        if (!s_globalListeners.empty()) {
            return true;
        }
        auto it = s_listeners.find(type);
        return it != s_listeners.end() && !it->second.empty();
    }

    static void clear() {
        s_listeners.clear();
        s_globalListeners.clear();
    }

private:
    struct Listener {
        ListenerHandle handle;
        EventCallback callback;
    };

    static inline ListenerHandle s_nextHandle = 0;
    static inline std::unordered_map<EventType, std::vector<Listener>> s_listeners;
    static inline std::vector<Listener> s_globalListeners;
};

// Unsubscribes on destruction
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    explicit ScopedSubscription(ListenerHandle handle) : m_handle(handle), m_active(true) {}

    ~ScopedSubscription() { reset(); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : m_handle(other.m_handle), m_active(std::exchange(other.m_active, false)) {}

    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = other.m_handle;
            m_active = std::exchange(other.m_active, false);
        }
        return *this;
    }

    void reset() {
        if (m_active) {
            EventBus::unsubscribe(m_handle);
            m_active = false;
        }
    }

private:
    ListenerHandle m_handle = 0;
    bool m_active = false;
};

} // namespace Deepvale
