// application.cpp - GUI application implementation
#include "gui/application.h"
#include "gui/main_window.h"
#include "gui/console_sink.h"
#include "gui/theme.h"
#include "gui/icons.h"
#include "core/config_manager.h"
#include <qdevkit/qdevkit.h>

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <vector>

namespace qdevkit::app::gui {

// Error callback for GLFW
static void glfw_error_callback(int error, const char* description) {
    spdlog::error("GLFW Error {}: {}", error, description);
}

Application::Application(core::ConfigManager* config_manager, const std::string& initial_tool)
    : config_manager_(config_manager), initial_tool_(initial_tool) {
    if (config_manager_) {
        window_width_ = config_manager_->GetConfig().window_width;
        window_height_ = config_manager_->GetConfig().window_height;
    }
}

Application::~Application() {
    Shutdown();
}

int Application::Run() {
    if (!Initialize()) {
        spdlog::error("Failed to initialize Application");
        return 1;
    }

    running_ = true;
    MainLoop();

    return 0;
}

bool Application::Initialize() {
    spdlog::info("Initializing QDevKit GUI...");

    if (!qdevkit::Initialize()) {
        return false;
    }

    if (!InitializeGLFW()) {
        return false;
    }

    if (!InitializeImGui()) {
        return false;
    }

    LoadFonts();
    ApplyTheme();

    main_window_ = std::make_unique<MainWindow>(config_manager_);
    AttachConsoleSink();

    if (!initial_tool_.empty() && !main_window_->SelectTool(initial_tool_)) {
        spdlog::warn("Unknown tool '{}', showing the JSON formatter", initial_tool_);
    }

    spdlog::info("Application initialized successfully");
    return true;
}

bool Application::InitializeGLFW() {
    glfwSetErrorCallback(glfw_error_callback);

    if (!glfwInit()) {
        spdlog::error("Failed to initialize GLFW");
        return false;
    }
    glfw_initialized_ = true;

    // OpenGL 3.3 Core Profile
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    window_ = glfwCreateWindow(window_width_, window_height_, window_title_.c_str(), nullptr, nullptr);
    if (!window_) {
        spdlog::error("Failed to create GLFW window");
        return false;
    }
    glfwSetWindowSizeLimits(window_, 400, 300, GLFW_DONT_CARE, GLFW_DONT_CARE);

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);  // VSync

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        spdlog::error("Failed to initialize GLAD");
        return false;
    }

    spdlog::info("GLFW initialized with OpenGL {}", (const char*)glGetString(GL_VERSION));
    return true;
}

bool Application::InitializeImGui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_initialized_ = true;

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;  // Layout is fixed; settings live in qdevkit.yaml

    if (!ImGui_ImplGlfw_InitForOpenGL(window_, true)) {
        spdlog::error("Failed to initialize ImGui GLFW backend");
        return false;
    }

    if (!ImGui_ImplOpenGL3_Init("#version 330 core")) {
        spdlog::error("Failed to initialize ImGui OpenGL3 backend");
        return false;
    }

    spdlog::info("ImGui initialized");
    return true;
}

void Application::LoadFonts() {
    ImGuiIO& io = ImGui::GetIO();

    // Find fonts directory - from the build tree, the install prefix or the project root
    std::vector<std::string> font_paths = {
        "./resources/fonts/",
        "./qdevkit-app/resources/fonts/",
        "../resources/fonts/",
        "../share/qdevkit/fonts/",
        "../../qdevkit-app/resources/fonts/",
        "/usr/share/qdevkit/fonts/"
    };

    std::string font_dir;
    for (const auto& path : font_paths) {
        if (std::filesystem::exists(path + "Inter-Regular.ttf")) {
            font_dir = path;
            break;
        }
    }

    if (font_dir.empty()) {
        spdlog::warn("Font directory not found, using default fonts");
        font_regular_ = io.Fonts->AddFontDefault();
        font_mono_ = io.Fonts->AddFontDefault();
        font_large_ = io.Fonts->AddFontDefault();
        return;
    }

    ImFontConfig font_config;
    font_config.OversampleH = 2;
    font_config.OversampleV = 2;
    font_config.PixelSnapH = true;

    std::string inter_path = font_dir + "Inter-Regular.ttf";
    font_regular_ = io.Fonts->AddFontFromFileTTF(inter_path.c_str(), 15.0f, &font_config);

    // Merge FontAwesome icons
    ImFontConfig icon_config;
    icon_config.MergeMode = true;
    icon_config.PixelSnapH = true;
    icon_config.GlyphMinAdvanceX = 14.0f;
    static const ImWchar icon_ranges[] = { ICON_MIN_FA, ICON_MAX_FA, 0 };

    std::string fa_path = font_dir + "fa-solid-900.ttf";
    bool has_icons = std::filesystem::exists(fa_path);
    if (has_icons) {
        io.Fonts->AddFontFromFileTTF(fa_path.c_str(), 14.0f, &icon_config, icon_ranges);
    }

    std::string mono_path = font_dir + "JetBrainsMono-Regular.ttf";
    if (std::filesystem::exists(mono_path)) {
        font_mono_ = io.Fonts->AddFontFromFileTTF(mono_path.c_str(), 14.0f, &font_config);
        if (has_icons) {
            io.Fonts->AddFontFromFileTTF(fa_path.c_str(), 14.0f, &icon_config, icon_ranges);
        }
    } else {
        // Keeps FONT_MONO pointing at a real atlas entry
        font_mono_ = io.Fonts->AddFontFromFileTTF(inter_path.c_str(), 15.0f, &font_config);
    }

    font_large_ = io.Fonts->AddFontFromFileTTF(inter_path.c_str(), 24.0f, &font_config);
    if (has_icons) {
        io.Fonts->AddFontFromFileTTF(fa_path.c_str(), 22.0f, &icon_config, icon_ranges);
    }

    io.Fonts->Build();
    spdlog::info("Fonts loaded from: {}", font_dir);
}

void Application::ApplyTheme() {
    ThemePreset preset = ThemePreset::QDevKitDark;
    if (config_manager_) {
        if (auto parsed = Theme::ParsePresetKey(config_manager_->GetConfig().theme)) {
            preset = *parsed;
        }
    }
    GetTheme().ApplyPreset(preset);
    spdlog::info("Theme applied: {}", Theme::GetPresetName(preset));
}

void Application::AttachConsoleSink() {
    auto sink = std::make_shared<ConsoleSinkMt>(&main_window_->GetConsole());
    sink->set_level(spdlog::level::trace);
    spdlog::default_logger()->sinks().push_back(sink);
    console_sink_ = sink;
}

void Application::DetachConsoleSink() {
    if (!console_sink_) {
        return;
    }

    std::static_pointer_cast<ConsoleSinkMt>(console_sink_)->Detach();
    auto& sinks = spdlog::default_logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), console_sink_), sinks.end());
    console_sink_.reset();
}

void Application::MainLoop() {
    int last_width = 0, last_height = 0;
    glfwGetWindowSize(window_, &last_width, &last_height);

    while (!glfwWindowShouldClose(window_) && running_) {
        int current_width, current_height;
        glfwGetWindowSize(window_, &current_width, &current_height);
        bool is_resizing = (current_width != last_width || current_height != last_height);
        last_width = current_width;
        last_height = current_height;

        // Sleep on events while nothing is happening
        if (is_idle_ && !is_resizing) {
            glfwWaitEventsTimeout(0.05);
        } else {
            glfwPollEvents();
        }

        ImGuiIO& io = ImGui::GetIO();
        is_idle_ = !is_resizing &&
                   !io.WantCaptureMouse && !io.WantCaptureKeyboard &&
                   io.MouseDelta.x == 0 && io.MouseDelta.y == 0;

        Render();
    }
}

void Application::Render() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    if (main_window_) {
        main_window_->Render();
    }

    ImGui::Render();

    int display_w, display_h;
    glfwGetFramebufferSize(window_, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);

    ImVec4 clear_color = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
    glClearColor(clear_color.x, clear_color.y, clear_color.z, clear_color.w);
    glClear(GL_COLOR_BUFFER_BIT);

    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    glfwSwapBuffers(window_);
}

void Application::Shutdown() {
    if (!glfw_initialized_) {
        qdevkit::Shutdown();
        return;
    }
    spdlog::info("Shutting down Application...");

    // The console is owned by the main window; stop logging into it first
    DetachConsoleSink();
    main_window_.reset();

    if (imgui_initialized_) {
        if (ImGui::GetIO().BackendRendererUserData) {
            ImGui_ImplOpenGL3_Shutdown();
        }
        if (ImGui::GetIO().BackendPlatformUserData) {
            ImGui_ImplGlfw_Shutdown();
        }
        ImGui::DestroyContext();
        imgui_initialized_ = false;
    }

    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    glfwTerminate();
    glfw_initialized_ = false;

    qdevkit::Shutdown();
    spdlog::info("Application shutdown complete");
}

} // namespace qdevkit::app::gui
