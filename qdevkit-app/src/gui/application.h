// application.h - GUI application main loop
#pragma once

#include <memory>
#include <string>

struct GLFWwindow;
struct ImFont;

namespace spdlog::sinks {
    class sink;
}

namespace qdevkit::app::core {
    class ConfigManager;
}

namespace qdevkit::app::gui {

class MainWindow;

class Application {
public:
    Application(core::ConfigManager* config_manager, const std::string& initial_tool = "");
    ~Application();

    // Run the application (blocking)
    int Run();

    // Access window
    GLFWwindow* GetWindow() const { return window_; }

    // Access fonts
    ImFont* GetRegularFont() const { return font_regular_; }
    ImFont* GetMonoFont() const { return font_mono_; }
    ImFont* GetLargeFont() const { return font_large_; }

private:
    bool Initialize();
    void Shutdown();
    void MainLoop();
    void Render();

    // Setup helpers
    bool InitializeGLFW();
    bool InitializeImGui();
    void LoadFonts();
    void ApplyTheme();
    void AttachConsoleSink();
    void DetachConsoleSink();

    // Window
    GLFWwindow* window_ = nullptr;
    int window_width_ = 1000;
    int window_height_ = 700;
    std::string window_title_ = "QDevKit - Developer Utilities";

    // Main window
    std::unique_ptr<MainWindow> main_window_;
    std::shared_ptr<spdlog::sinks::sink> console_sink_;

    // Fonts
    ImFont* font_regular_ = nullptr;
    ImFont* font_mono_ = nullptr;
    ImFont* font_large_ = nullptr;

    // State
    bool running_ = false;
    bool is_idle_ = false;
    bool glfw_initialized_ = false;
    bool imgui_initialized_ = false;

    core::ConfigManager* config_manager_;
    std::string initial_tool_;
};

} // namespace qdevkit::app::gui
