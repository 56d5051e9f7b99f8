#pragma once

#include <render-loop/window_event.hpp>

#include <common/extent.hpp>

#include <string_view>
#include <vector>

struct GLFWwindow;

namespace lwgpu
{
struct WindowDescriptor
{
    Extent2i         windowSize;
    std::string_view title;
};

// A resizable GLFW window without a client API, drawn to through a WebGPU surface.
class Window final : public EventSource
{
public:
    explicit Window(const WindowDescriptor&);
    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // GLFW holds a pointer to the window object.
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    // Polls GLFW and appends the queued events followed by a redraw request.
    void            pollEvents(std::vector<WindowEvent>& events) override;
    FramebufferSize framebufferSize() const override;

    GLFWwindow* ptr() const { return mWindow; }

private:
    static void onFramebufferSize(GLFWwindow*, int width, int height);
    static void onContentScale(GLFWwindow*, float xscale, float yscale);
    static void onClose(GLFWwindow*);
    static void onKey(GLFWwindow*, int key, int scancode, int action, int mods);

    GLFWwindow*              mWindow;
    std::vector<WindowEvent> mPendingEvents;

    static int glfwRefCount;
};
} // namespace lwgpu
