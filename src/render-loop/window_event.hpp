#pragma once

#include <common/extent.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lwgpu
{
enum class WindowEventKind : std::uint32_t
{
    Resized = 0,
    RedrawRequested,
    CloseRequested,
};

inline constexpr std::size_t WINDOW_EVENT_KIND_COUNT = 3;

const char* windowEventKindToStr(WindowEventKind kind) noexcept;

struct WindowEvent
{
    WindowEventKind kind = WindowEventKind::RedrawRequested;
    // The new framebuffer size in pixels for Resized events, otherwise zero.
    FramebufferSize size;

    static constexpr WindowEvent resized(const FramebufferSize newSize) noexcept
    {
        return WindowEvent{WindowEventKind::Resized, newSize};
    }
    static constexpr WindowEvent redrawRequested() noexcept
    {
        return WindowEvent{WindowEventKind::RedrawRequested, {}};
    }
    static constexpr WindowEvent closeRequested() noexcept
    {
        return WindowEvent{WindowEventKind::CloseRequested, {}};
    }

    bool operator==(const WindowEvent&) const noexcept = default;
};

// Something which produces window events, e.g. a desktop window.
class EventSource
{
public:
    virtual ~EventSource() = default;

    // Appends all events which have occurred since the last call.
    virtual void pollEvents(std::vector<WindowEvent>& events) = 0;
    // Returns the current drawable size in pixels.
    virtual FramebufferSize framebufferSize() const = 0;
};
} // namespace lwgpu
