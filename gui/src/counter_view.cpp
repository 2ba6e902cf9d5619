#include "counter_view.hpp"
#include "brk/format.hpp"
#include "brk/palette.hpp"
#include "context.hpp"
#include "imgui/imgui.h"
#include <cstdio>
#include <string>

static constexpr float TIMER_FONT_SCALE = 2.0f;
static constexpr float BREAKS_FONT_SCALE = 1.25f;

static ImVec4 to_imvec(const glm::vec4 &color) {
    return ImVec4(color.r, color.g, color.b, color.a);
}

CounterView CounterView::create(const brk::Config &config,
                                std::optional<std::filesystem::path> log_path) {
    CounterView view;
    view.tracker = brk::Tracker::create(config, std::move(log_path));
    view.last_state = view.tracker.state();

    return view;
}

void CounterView::on_attach() {
    refresh_title();
}

void CounterView::on_detach() {
    tracker.store_log(true);
}

void CounterView::on_event(brk::Event &event) {
    if (event.type != brk::EventType::KeyPressed)
        return;

    switch (event.key.key) {
    case brk::Key::Space:
        tracker.toggle_run();
        refresh_title();
        break;
    case brk::Key::R:
        tracker.reset();
        refresh_title();
        break;
    case brk::Key::Escape:
        context()->close_app();
        break;
    default:
        break;
    }
}

void CounterView::on_update(float ts) {
    if (!tracker.update(ts * 1000.0f))
        return;

    refresh_title();

    brk::BreakState state = tracker.state();
    if (state == last_state)
        return;

    last_state = state;
    if (state != brk::BreakState::Normal) {
        fprintf(stderr, "%s after %s\n", brk::state_name(state),
                brk::format_elapsed(tracker.timer.elapsed_seconds).c_str());
        context()->main_window.request_attention();
    }
}

void CounterView::refresh_title() {
    std::string title = "breakwatch";
    if (tracker.running())
        title += " " + brk::format_elapsed(tracker.timer.elapsed_seconds);
    else
        title += " (paused)";

    context()->main_window.set_title(title);
}

static void centered_cursor_x(float item_width) {
    float offset = (ImGui::GetContentRegionAvail().x - item_width) * 0.5f;
    if (offset > 0.0f)
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + offset);
}

void CounterView::on_render() {
    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBackground |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("##counter", nullptr, flags);

    const ImGuiStyle &style = ImGui::GetStyle();
    bool running = tracker.running();
    std::string label =
        running ? brk::format_elapsed(tracker.timer.elapsed_seconds)
                : std::string("PAUSED");
    glm::vec4 color =
        running ? brk::state_color(tracker.state()) : brk::DEFAULT_COLOR;

    ImGui::SetWindowFontScale(TIMER_FONT_SCALE);
    ImVec2 text_size = ImGui::CalcTextSize(label.c_str());
    ImVec2 button_size(text_size.x + style.FramePadding.x * 2.0f,
                       text_size.y + style.FramePadding.y * 2.0f);

    float content_height = button_size.y;
    std::string breaks;
    if (!running) {
        breaks = "breaks: " + std::to_string(tracker.log.break_count());
        content_height += style.ItemSpacing.y +
                          ImGui::GetTextLineHeight() / TIMER_FONT_SCALE *
                              BREAKS_FONT_SCALE;
    }

    float offset_y =
        (ImGui::GetContentRegionAvail().y - content_height) * 0.5f;
    if (offset_y > 0.0f)
        ImGui::SetCursorPosY(ImGui::GetCursorPosY() + offset_y);

    centered_cursor_x(button_size.x);
    ImGui::PushStyleColor(ImGuiCol_Text, to_imvec(color));
    // Fixed ID, the label changes every second
    if (ImGui::Button((label + "###timer").c_str(), button_size)) {
        tracker.toggle_run();
        refresh_title();
    }
    ImGui::PopStyleColor();

    if (ImGui::IsItemClicked(ImGuiMouseButton_Right)) {
        tracker.reset();
        refresh_title();
    }

    if (!breaks.empty()) {
        ImGui::SetWindowFontScale(BREAKS_FONT_SCALE);
        centered_cursor_x(ImGui::CalcTextSize(breaks.c_str()).x);
        ImGui::TextUnformatted(breaks.c_str());
    }

    ImGui::SetWindowFontScale(1.0f);
    ImGui::End();
}
