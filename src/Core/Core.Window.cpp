module;
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <string>

module Core:Window.Impl;
import :Logging;
import :Window;

namespace Core::Windowing
{
    namespace
    {
        int s_LiveWindows = 0;

        void OnGlfwError(int error, const char* description)
        {
            Log::Error("GLFW error {}: {}", error, description);
        }

        bool AcquireGlfw()
        {
            if (s_LiveWindows == 0)
            {
                glfwSetErrorCallback(OnGlfwError);
                if (glfwInit() != GLFW_TRUE)
                    return false;
            }
            ++s_LiveWindows;
            return true;
        }

        void ReleaseGlfw()
        {
            if (--s_LiveWindows == 0)
                glfwTerminate();
        }

        GLFWwindow* Native(void* handle) { return static_cast<GLFWwindow*>(handle); }

        bool QueryVisible(GLFWwindow* window) { return glfwGetWindowAttrib(window, GLFW_VISIBLE) == GLFW_TRUE; }
    }

    Window::Window(const WindowProps& props)
        : m_Title(props.Title)
    {
        if (!AcquireGlfw())
        {
            Log::Error("Window '{}': GLFW initialization failed", m_Title);
            return;
        }

        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_RESIZABLE, props.Resizable ? GLFW_TRUE : GLFW_FALSE);

        GLFWwindow* window = glfwCreateWindow(props.Width, props.Height, m_Title.c_str(), nullptr, nullptr);
        if (!window)
        {
            Log::Error("Window '{}': glfwCreateWindow failed", m_Title);
            ReleaseGlfw();
            return;
        }

        m_Handle = window;
        glfwGetFramebufferSize(window, &m_State.FramebufferWidth, &m_State.FramebufferHeight);
        m_State.Visible = QueryVisible(window);
        glfwSetWindowUserPointer(window, &m_State);

        glfwSetFramebufferSizeCallback(window, [](GLFWwindow* w, int width, int height)
        {
            auto& state = *static_cast<CallbackState*>(glfwGetWindowUserPointer(w));
            state.FramebufferWidth = width;
            state.FramebufferHeight = height;
            state.Pending.FramebufferResized = true;
        });

        glfwSetWindowCloseCallback(window, [](GLFWwindow* w)
        {
            static_cast<CallbackState*>(glfwGetWindowUserPointer(w))->Pending.CloseRequested = true;
        });

        glfwSetWindowIconifyCallback(window, [](GLFWwindow* w, int iconified)
        {
            auto& state = *static_cast<CallbackState*>(glfwGetWindowUserPointer(w));
            state.Minimized = iconified == GLFW_TRUE;
            state.Visible = QueryVisible(w);
            state.Pending.MinimizeChanged = true;
        });

        glfwSetWindowRefreshCallback(window, [](GLFWwindow* w)
        {
            static_cast<CallbackState*>(glfwGetWindowUserPointer(w))->Visible = QueryVisible(w);
        });

        Log::Info("Window '{}' opened ({}x{}, framebuffer {}x{})", m_Title, props.Width, props.Height,
                  m_State.FramebufferWidth, m_State.FramebufferHeight);
    }

    Window::~Window()
    {
        if (!m_Handle)
            return;

        glfwDestroyWindow(Native(m_Handle));
        m_Handle = nullptr;
        ReleaseGlfw();
    }

    FrameEvents Window::PollEvents()
    {
        if (!m_Handle)
            return FrameEvents{.CloseRequested = true};

        glfwPollEvents();
        return TakePending();
    }

    FrameEvents Window::WaitEvents()
    {
        if (!m_Handle)
            return FrameEvents{.CloseRequested = true};

        glfwWaitEvents();
        return TakePending();
    }

    FrameEvents Window::TakePending()
    {
        // Show/hide has no GLFW callback of its own.
        m_State.Visible = QueryVisible(Native(m_Handle));

        FrameEvents events = m_State.Pending;
        m_State.Pending = {};
        return events;
    }

    bool Window::ShouldClose() const
    {
        return !m_Handle || glfwWindowShouldClose(Native(m_Handle)) == GLFW_TRUE;
    }

    void Window::SetTitle(const std::string& title)
    {
        m_Title = title;
        if (m_Handle)
            glfwSetWindowTitle(Native(m_Handle), m_Title.c_str());
    }
}
