#include "brk/config.hpp"
#include "brk/format.hpp"
#include "brk/palette.hpp"
#include "brk/stopwatch.hpp"
#include "brk/tracker.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;

static constexpr auto POLL_INTERVAL = 250ms;

static volatile sig_atomic_t s_quit = 0;
static volatile sig_atomic_t s_toggle_requests = 0;
static volatile sig_atomic_t s_reset_requests = 0;

static void sig_handler(int signo) {
    switch (signo) {
    case SIGINT:
    case SIGTERM:
        s_quit = 1;
        break;
    case SIGUSR1:
        s_toggle_requests = s_toggle_requests + 1;
        break;
    case SIGUSR2:
        s_reset_requests = s_reset_requests + 1;
        break;
    }
}

static void install_signal_handlers() {
    struct sigaction act {};
    act.sa_handler = sig_handler;
    sigfillset(&act.sa_mask);
    act.sa_flags = SA_RESTART;

    for (int signo : {SIGINT, SIGTERM, SIGUSR1, SIGUSR2}) {
        if (sigaction(signo, &act, nullptr) == -1)
            fprintf(stderr, "Could not install handler for signal %d\n",
                    signo);
    }
}

static void draw_status(const brk::Tracker &tracker, bool colored) {
    std::string elapsed = brk::format_elapsed(tracker.timer.elapsed_seconds);
    const char *status =
        tracker.running() ? brk::state_name(tracker.state()) : "paused";

    if (colored) {
        printf("\r\x1b[2K%s%s  %s\x1b[0m",
               brk::state_ansi_color(tracker.state()), elapsed.c_str(),
               status);
    } else {
        printf("\r%s  %-13s", elapsed.c_str(), status);
    }

    fflush(stdout);
}

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    brk::Config config = brk::load_config_env();

    std::optional<std::filesystem::path> log_path;
    std::optional<std::filesystem::path> dir = brk::config_dir();
    if (dir.has_value())
        log_path = dir.value() / brk::SESSION_LOG_FILE_NAME;

    brk::Tracker tracker = brk::Tracker::create(config, std::move(log_path));
    install_signal_handlers();

    bool colored = isatty(STDOUT_FILENO) == 1;
    brk::BreakState last_state = tracker.state();
    draw_status(tracker, colored);

    brk::Stopwatch frame_clock;
    frame_clock.start();
    while (!s_quit) {
        std::this_thread::sleep_for(POLL_INTERVAL);

        bool redraw = tracker.update(frame_clock.lap_ms());

        while (s_toggle_requests > 0) {
            s_toggle_requests = s_toggle_requests - 1;
            tracker.toggle_run();
            redraw = true;
        }

        while (s_reset_requests > 0) {
            s_reset_requests = s_reset_requests - 1;
            tracker.reset();
            redraw = true;
        }

        brk::BreakState state = tracker.state();
        if (state != last_state) {
            last_state = state;
            if (state != brk::BreakState::Normal)
                fprintf(stderr, "\n\a%s after %s\n", brk::state_name(state),
                        brk::format_elapsed(tracker.timer.elapsed_seconds)
                            .c_str());
            redraw = true;
        }

        if (redraw)
            draw_status(tracker, colored);
    }

    printf("\n");
    tracker.store_log(true);

    return 0;
}
