#pragma once
#include <optional>
#include <string>

namespace podium {

// "MM:SS,mmm" (league display format). Returns "--" for negative or non-finite.
std::string format_lap_time(double seconds);

// Accepts "MM:SS,mmm", "MM:SS.mmm" or a plain decimal number of seconds.
std::optional<double> parse_lap_time(const std::string& text);

} // namespace podium
