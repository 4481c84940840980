#pragma once

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ws::cli {

/// "mm:ss.mmm"
std::string format_timestamp(int64_t ms);

/// "[mm:ss.mmm --> mm:ss.mmm] text"
std::string format_segment(const Segment& segment);

/// Trailer printed after a run that was interrupted.
std::string format_stop_summary(std::size_t segment_count);

} // namespace ws::cli
