#ifndef BRK_SESSION_LOG_HPP
#define BRK_SESSION_LOG_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace brk {

enum class SegmentKind {
    Active,
    Pause
};

struct Segment {
    SegmentKind kind = SegmentKind::Active;
    uint64_t seconds = 0;
};

/* Alternating stretches of running and paused time. The current segment is
   open until the next close_segment(). */
struct SessionLog {
    [[nodiscard]] static SessionLog create(SegmentKind first);

    void advance(uint64_t seconds = 1);
    void close_segment();

    /* Pause segments, the ongoing one included, except a leading pause. */
    [[nodiscard]] uint32_t break_count() const;
    [[nodiscard]] std::string to_text(bool include_current) const;

    std::vector<Segment> segments;
    Segment current{};
};

/* Overwrites PATH with the text form of LOG. */
[[nodiscard]] bool store_session_log(const SessionLog &log,
                                     const std::filesystem::path &path,
                                     bool include_current = false);

} // namespace brk

#endif
