#ifndef COUNTER_VIEW_HPP
#define COUNTER_VIEW_HPP

#include "brk/config.hpp"
#include "brk/event.hpp"
#include "brk/tracker.hpp"
#include <filesystem>
#include <optional>

/* The whole GUI: elapsed time as a button that toggles the timer, break
   count underneath while paused. */
struct CounterView {
    [[nodiscard]] static CounterView
    create(const brk::Config &config,
           std::optional<std::filesystem::path> log_path);

    void on_attach();
    void on_detach();

    void on_event(brk::Event &event);
    void on_update(float ts);
    void on_render();

    void refresh_title();

    brk::Tracker tracker;
    brk::BreakState last_state = brk::BreakState::Normal;
};

#endif // COUNTER_VIEW_HPP
