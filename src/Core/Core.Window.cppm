module;
#include <string>

export module Core:Window;

export namespace Core::Windowing
{
    // The surface a backend renderer presents into. Backends only read the
    // framebuffer size and the native handle; nothing here talks to the
    // windowing system.
    class IWindowProvider
    {
    public:
        virtual ~IWindowProvider() = default;

        [[nodiscard]] virtual int GetFramebufferWidth() const = 0;
        [[nodiscard]] virtual int GetFramebufferHeight() const = 0;
        [[nodiscard]] virtual bool IsVisible() const = 0;
        [[nodiscard]] virtual bool IsMinimized() const = 0;
        [[nodiscard]] virtual void* GetNativeHandle() const = 0;

        // False while hidden, minimized, or while either framebuffer side is zero.
        [[nodiscard]] bool HasDrawableArea() const
        {
            return IsVisible() && !IsMinimized() && GetFramebufferWidth() > 0 && GetFramebufferHeight() > 0;
        }
    };

    // Fixed-size surface with no OS window behind it. Used for headless runs
    // and as the stand-in surface in tests.
    class HeadlessWindow final : public IWindowProvider
    {
    public:
        explicit HeadlessWindow(int width = 800, int height = 600) : m_Width(width), m_Height(height) {}

        [[nodiscard]] int GetFramebufferWidth() const override { return m_Width; }
        [[nodiscard]] int GetFramebufferHeight() const override { return m_Height; }
        [[nodiscard]] bool IsVisible() const override { return m_Visible; }
        [[nodiscard]] bool IsMinimized() const override { return false; }
        [[nodiscard]] void* GetNativeHandle() const override { return nullptr; }

        void Resize(int width, int height)
        {
            m_Width = width;
            m_Height = height;
        }

        void SetVisible(bool visible) { m_Visible = visible; }

    private:
        int m_Width;
        int m_Height;
        bool m_Visible = true;
    };

    struct WindowProps
    {
        std::string Title = "Umbra";
        int Width = 1280;
        int Height = 720;
        bool Resizable = true;
    };

    // What happened since the previous PollEvents() call.
    struct FrameEvents
    {
        bool CloseRequested = false;
        bool FramebufferResized = false;
        bool MinimizeChanged = false;
    };

    // GLFW-backed window without a client API context. GLFW is initialized
    // with the first live Window and terminated with the last one.
    class Window final : public IWindowProvider
    {
    public:
        explicit Window(const WindowProps& props);
        ~Window() override;

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        // Pumps the OS queue and returns what changed. Call once per frame.
        FrameEvents PollEvents();
        // Same as PollEvents, but sleeps until at least one event arrives.
        // For hosts idling while there is nothing to draw.
        FrameEvents WaitEvents();

        [[nodiscard]] bool IsValid() const { return m_Handle != nullptr; }
        [[nodiscard]] bool ShouldClose() const;

        [[nodiscard]] int GetFramebufferWidth() const override { return m_State.FramebufferWidth; }
        [[nodiscard]] int GetFramebufferHeight() const override { return m_State.FramebufferHeight; }
        [[nodiscard]] bool IsVisible() const override { return m_State.Visible; }
        [[nodiscard]] bool IsMinimized() const override { return m_State.Minimized; }
        [[nodiscard]] void* GetNativeHandle() const override { return m_Handle; } // GLFWwindow*

        void SetTitle(const std::string& title);
        [[nodiscard]] const std::string& GetTitle() const { return m_Title; }

    private:
        // Written by the GLFW callbacks through the window user pointer.
        struct CallbackState
        {
            int FramebufferWidth = 0;
            int FramebufferHeight = 0;
            bool Minimized = false;
            bool Visible = false;
            FrameEvents Pending{};
        };

        FrameEvents TakePending();

        void* m_Handle = nullptr;
        std::string m_Title;
        CallbackState m_State;
    };
}
