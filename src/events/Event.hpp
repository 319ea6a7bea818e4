#pragma once

#include <string>

namespace Deepvale {

enum class EventType {
    None = 0,
    // Block events
    BlockChanged,
    // Chunk lifecycle events
    ChunkLoaded, ChunkUnloaded, ChunkMeshRebuilt
};

// Event categories for filtering
enum EventCategory {
    None = 0,
    EventCategoryWorld = 1 << 0,
    EventCategoryBlock = 1 << 1,
    EventCategoryChunk = 1 << 2
};

#define EVENT_CLASS_TYPE(type) \
    static EventType getStaticType() { return EventType::type; } \
    virtual EventType getEventType() const override { return getStaticType(); } \
    virtual const char* getName() const override { return #type; }

#define EVENT_CLASS_CATEGORY(category) \
    virtual int getCategoryFlags() const override { return category; }

class Event {
public:
    virtual ~Event() = default;

    bool handled = false;

    virtual EventType getEventType() const = 0;
    virtual const char* getName() const = 0;
    virtual int getCategoryFlags() const = 0;
    virtual std::string toString() const { return getName(); }

    bool isInCategory(EventCategory category) const {
        return getCategoryFlags() & category;
    }
};

// Routes an event to a typed handler when the runtime type matches
class EventDispatcher {
public:
    explicit EventDispatcher(Event& event) : m_event(event) {}

    template<typename T, typename F>
    bool dispatch(const F& func) {
        if (m_event.getEventType() == T::getStaticType()) {
            m_event.handled |= func(static_cast<T&>(m_event));
            return true;
        }
        return false;
    }

private:
    Event& m_event;
};

} // namespace Deepvale
