#include "brk/session_log.hpp"
#include "brk/file_utils.hpp"
#include "brk/format.hpp"
#include <algorithm>
#include <sstream>

namespace brk {

SessionLog SessionLog::create(SegmentKind first) {
    SessionLog log;
    log.current.kind = first;

    return log;
}

void SessionLog::advance(uint64_t seconds) {
    current.seconds += seconds;
}

void SessionLog::close_segment() {
    segments.push_back(current);

    current.kind = current.kind == SegmentKind::Active ? SegmentKind::Pause
                                                       : SegmentKind::Active;
    current.seconds = 0;
}

uint32_t SessionLog::break_count() const {
    uint32_t count = (uint32_t)std::count_if(
        segments.begin(), segments.end(),
        [](const Segment &seg) { return seg.kind == SegmentKind::Pause; });

    if (current.kind == SegmentKind::Pause)
        count++;

    // Pause the process started in is not a break
    const Segment &first = segments.empty() ? current : segments.front();
    if (first.kind == SegmentKind::Pause)
        count--;

    return count;
}

static void write_segment(std::stringstream &ss, const Segment &seg) {
    ss << format_elapsed(seg.seconds, true) << ' '
       << (seg.kind == SegmentKind::Pause ? "pause" : "active");
}

std::string SessionLog::to_text(bool include_current) const {
    std::stringstream ss;
    for (size_t i = 0; i < segments.size(); i++) {
        if (i != 0)
            ss << '\n';

        write_segment(ss, segments[i]);
    }

    if (include_current) {
        if (!segments.empty())
            ss << '\n';

        write_segment(ss, current);
    }

    return ss.str();
}

bool store_session_log(const SessionLog &log,
                       const std::filesystem::path &path,
                       bool include_current) {
    return write_file_content(path, log.to_text(include_current));
}

} // namespace brk
