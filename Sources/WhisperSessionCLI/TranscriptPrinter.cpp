#include "TranscriptPrinter.hpp"

#include <cstdio>

namespace ws::cli {

std::string format_timestamp(int64_t ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%03lld",
                  static_cast<long long>(ms / 60000),
                  static_cast<long long>((ms / 1000) % 60),
                  static_cast<long long>(ms % 1000));
    return buf;
}

std::string format_segment(const Segment& segment) {
    return "[" + format_timestamp(segment.start_time) + " --> "
           + format_timestamp(segment.end_time) + "] " + segment.text;
}

std::string format_stop_summary(std::size_t segment_count) {
    return "[stopped after " + std::to_string(segment_count)
           + (segment_count == 1 ? " segment]" : " segments]");
}

} // namespace ws::cli
