#pragma once

#include "window_event.hpp"

#include <array>
#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

namespace lwgpu
{
// A dispatch table of window event handlers, keyed by event kind.
//
// Events are queued with `post` and delivered by `dispatchPending` in the order they were
// posted. Events posted by a handler are appended to the queue and delivered after the
// handler returns; handlers are never invoked re-entrantly.
class EventDispatcher
{
public:
    using Handler = std::function<void(const WindowEvent&)>;

    EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Throws std::logic_error if called from within a handler.
    void subscribe(WindowEventKind kind, Handler handler);
    void post(const WindowEvent& event);

    // Returns the number of events delivered. Calling this from within a handler delivers
    // nothing and returns zero.
    std::size_t dispatchPending();

    inline bool        dispatching() const noexcept { return mDispatching; }
    inline std::size_t pendingCount() const noexcept { return mQueue.size(); }
    std::size_t        handlerCount(WindowEventKind kind) const noexcept;

private:
    std::array<std::vector<Handler>, WINDOW_EVENT_KIND_COUNT> mHandlers;
    std::deque<WindowEvent>                                   mQueue;
    bool                                                      mDispatching = false;
};
} // namespace lwgpu
