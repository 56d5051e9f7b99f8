#include "window.hpp"

#include <render-loop/errors.hpp>

#include <common/assert.hpp>
#include <common/logging.hpp>

#include <GLFW/glfw3.h>

#include <iterator>
#include <string>

namespace lwgpu
{
namespace
{
Window& windowFromUserPointer(GLFWwindow* const window)
{
    void* const userPtr = glfwGetWindowUserPointer(window);
    LWGPU_ASSERT(userPtr != nullptr);
    return *static_cast<Window*>(userPtr);
}
} // namespace

int Window::glfwRefCount = 0;

Window::Window(const WindowDescriptor& windowDesc)
    : mWindow(nullptr),
      mPendingEvents()
{
    if (glfwRefCount++ == 0)
    {
        if (!glfwInit())
        {
            --glfwRefCount;
            throw InitializationError("Failed to initialize GLFW.");
        }
        // NOTE: with this hint in place, GLFW assumes that we will manage the API and we can skip
        // calling glfwSwapBuffers.
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    }

    // The title must be null-terminated for GLFW.
    const std::string title(windowDesc.title);
    mWindow = glfwCreateWindow(
        windowDesc.windowSize.x, windowDesc.windowSize.y, title.c_str(), nullptr, nullptr);

    if (!mWindow)
    {
        if (--glfwRefCount == 0)
        {
            glfwTerminate();
        }
        throw InitializationError("Failed to create GLFW window.");
    }

    glfwSetWindowUserPointer(mWindow, this);
    glfwSetFramebufferSizeCallback(mWindow, onFramebufferSize);
    glfwSetWindowContentScaleCallback(mWindow, onContentScale);
    glfwSetWindowCloseCallback(mWindow, onClose);
    glfwSetKeyCallback(mWindow, onKey);

    const FramebufferSize size = framebufferSize();
    logDebug("Created window \"{}\" with framebuffer {}x{}.", title, size.x, size.y);
}

Window::~Window()
{
    if (mWindow)
    {
        glfwDestroyWindow(mWindow);
        mWindow = nullptr;
    }

    if (--glfwRefCount == 0)
    {
        glfwTerminate();
    }
}

void Window::pollEvents(std::vector<WindowEvent>& events)
{
    glfwPollEvents();

    events.insert(
        events.end(),
        std::make_move_iterator(mPendingEvents.begin()),
        std::make_move_iterator(mPendingEvents.end()));
    mPendingEvents.clear();

    // Redraw continuously, once every time the event queue has been drained.
    events.push_back(WindowEvent::redrawRequested());
}

FramebufferSize Window::framebufferSize() const
{
    FramebufferSize result;
    glfwGetFramebufferSize(mWindow, &result.x, &result.y);
    return result;
}

void Window::onFramebufferSize(GLFWwindow* const window, const int width, const int height)
{
    windowFromUserPointer(window).mPendingEvents.push_back(
        WindowEvent::resized(FramebufferSize{width, height}));
}

void Window::onContentScale(GLFWwindow* const window, const float xscale, const float yscale)
{
    // A scale factor change moves the window between monitors and changes the drawable size.
    Window& self = windowFromUserPointer(window);
    logDebug("Window content scale changed to {}x{}.", xscale, yscale);
    self.mPendingEvents.push_back(WindowEvent::resized(self.framebufferSize()));
}

void Window::onClose(GLFWwindow* const window)
{
    windowFromUserPointer(window).mPendingEvents.push_back(WindowEvent::closeRequested());
}

void Window::onKey(
    GLFWwindow* const window,
    const int         key,
    const int /*scancode*/,
    const int action,
    const int /*mods*/)
{
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
    {
        windowFromUserPointer(window).mPendingEvents.push_back(WindowEvent::closeRequested());
    }
}
} // namespace lwgpu
