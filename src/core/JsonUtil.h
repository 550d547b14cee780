#pragma once
#include <chrono>
#include <string>

namespace hulud_scan {
namespace jsonutil {

// JSON string escaping (no surrounding quotes); bytes >= 0x20 pass through unchanged.
std::string escape(const std::string& s);
// UTC ISO-8601 with 'Z' suffix; empty for a zero time point.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

} // namespace jsonutil
} // namespace hulud_scan
