#include "event_dispatcher.hpp"

#include <common/assert.hpp>

#include <stdexcept>
#include <utility>

namespace lwgpu
{
namespace
{
std::size_t kindIndex(const WindowEventKind kind) noexcept
{
    const auto idx = static_cast<std::size_t>(kind);
    LWGPU_ASSERT(idx < WINDOW_EVENT_KIND_COUNT);
    return idx;
}

class DispatchGuard
{
public:
    explicit DispatchGuard(bool& flag) noexcept
        : mFlag(flag)
    {
        mFlag = true;
    }
    ~DispatchGuard() { mFlag = false; }

    DispatchGuard(const DispatchGuard&) = delete;
    DispatchGuard& operator=(const DispatchGuard&) = delete;

private:
    bool& mFlag;
};
} // namespace

const char* windowEventKindToStr(const WindowEventKind kind) noexcept
{
    switch (kind)
    {
    case WindowEventKind::Resized:
        return "Resized";
    case WindowEventKind::RedrawRequested:
        return "RedrawRequested";
    case WindowEventKind::CloseRequested:
        return "CloseRequested";
    }
    LWGPU_ASSERT(!"Unknown WindowEventKind");
    return "Unknown";
}

void EventDispatcher::subscribe(const WindowEventKind kind, Handler handler)
{
    LWGPU_ASSERT(handler != nullptr);
    if (mDispatching)
    {
        throw std::logic_error("Handlers cannot be subscribed while events are dispatched.");
    }
    mHandlers[kindIndex(kind)].push_back(std::move(handler));
}

void EventDispatcher::post(const WindowEvent& event) { mQueue.push_back(event); }

std::size_t EventDispatcher::dispatchPending()
{
    if (mDispatching)
    {
        return 0;
    }

    DispatchGuard guard(mDispatching);
    std::size_t   numDispatched = 0;

    while (!mQueue.empty())
    {
        const WindowEvent event = mQueue.front();
        mQueue.pop_front();

        for (const Handler& handler : mHandlers[kindIndex(event.kind)])
        {
            handler(event);
        }
        ++numDispatched;
    }

    return numDispatched;
}

std::size_t EventDispatcher::handlerCount(const WindowEventKind kind) const noexcept
{
    return mHandlers[kindIndex(kind)].size();
}
} // namespace lwgpu
