#include "context.hpp"
#include "GLFW/glfw3.h"
#include "brk/gl.hpp"
#include "glm/vec4.hpp"
#include <cstdio>
#include <signal.h>

#include "imgui/imgui.h"
#include "imgui/imgui_impl_glfw.h"
#include "imgui/imgui_impl_opengl3.h"

static Context s_context;
static volatile sig_atomic_t s_close_requested = 0;

static void sig_handler(int signo) {
    if (signo == SIGTERM)
        s_close_requested = 1;
}

static void install_signal_handlers() {
    struct sigaction act {};
    act.sa_handler = sig_handler;
    sigfillset(&act.sa_mask);
    act.sa_flags = SA_RESTART;

    if (sigaction(SIGTERM, &act, nullptr) == -1)
        fprintf(stderr,
                "Could not install handler for SIGTERM, the session log "
                "might not be stored on shutdown.\n");
}

static void apply_imgui_styles() {
    ImGuiStyle &style = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.FrameBorderSize = 0.0f;
    style.FrameRounding = 4.0f;
    style.ItemSpacing = ImVec2(10.0f, 4.0f);
    style.Colors[ImGuiCol_Text] = ImVec4(1.00f, 1.00f, 1.00f, 1.00f);
    style.Colors[ImGuiCol_TextDisabled] = ImVec4(0.50f, 0.50f, 0.50f, 1.00f);
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.08f, 0.08f, 0.08f, 0.00f);
    style.Colors[ImGuiCol_Border] = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);

    // Timer button blends into the background
    style.Colors[ImGuiCol_Button] = ImVec4(0.00f, 0.00f, 0.00f, 0.00f);
    style.Colors[ImGuiCol_ButtonHovered] = ImVec4(1.00f, 1.00f, 1.00f, 0.08f);
    style.Colors[ImGuiCol_ButtonActive] = ImVec4(1.00f, 1.00f, 1.00f, 0.16f);
}

brk::Result<Context *, ContextError>
Context::create(const brk::Config &config,
                std::optional<std::filesystem::path> log_path) {
    if (!brk::Window::init())
        return {.error = ContextError::GLFW_FAIL};

    brk::WindowSpec spec;
    spec.width = (int32_t)config.window_size.x;
    spec.height = (int32_t)config.window_size.y;
    spec.pos_x = (int32_t)config.window_position.x;
    spec.pos_y = (int32_t)config.window_position.y;
    spec.always_on_top = config.always_on_top;

    std::optional<brk::Window> window_opt = brk::Window::create(spec);
    if (!window_opt.has_value()) {
        brk::Window::terminate();
        return {.error = ContextError::WINDOW_FAIL};
    }

    s_context.main_window = std::move(window_opt.value());
    s_context.main_window.update_user_pointer();

    if (!brk::gl::init()) {
        brk::Window::terminate();
        return {.error = ContextError::GL_FAIL};
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr;

    ImGui_ImplGlfw_InitForOpenGL(s_context.main_window.handle, true);
    ImGui_ImplOpenGL3_Init("#version 330");
    apply_imgui_styles();

    s_context.view = CounterView::create(config, std::move(log_path));
    s_context.view.on_attach();
    install_signal_handlers();

    return {.value = &s_context};
}

void Context::close_app() { main_window.close(); }

void Context::cleanup() {
    view.on_detach();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    brk::Window::terminate();
}

void Context::run_loop() {
    double prev_time = glfwGetTime();
    double curr_time = 0.0;
    int32_t fb_width = 0;
    int32_t fb_height = 0;

    while (main_window.is_open()) {
        if (s_close_requested) {
            close_app();
            break;
        }

        /* Not clamped - a stalled frame has to be counted in full. */
        curr_time = (float)glfwGetTime();
        timestep = (float)(curr_time - prev_time);
        prev_time = curr_time;

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        while (!main_window.pending_events.empty()) {
            brk::Event event = main_window.pending_events.front();
            main_window.pending_events.pop();

            view.on_event(event);
        }

        view.on_update(timestep);
        view.on_render();

        ImGui::Render();
        glfwGetFramebufferSize(main_window.handle, &fb_width, &fb_height);
        brk::gl::clear(glm::vec4(0.08f, 0.08f, 0.08f, 0.85f), fb_width,
                       fb_height);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        main_window.update();
    }
}

Context *context() { return &s_context; }
