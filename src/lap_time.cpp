#include <podium/lap_time.hpp>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <podium/csv.hpp>

namespace podium {

static std::optional<long> to_long_strict(const std::string& s) {
  if (s.empty()) return std::nullopt;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  try {
    return std::stol(s);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::string format_lap_time(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) return "--";
  long long total_ms = std::llround(seconds * 1000.0);
  const long long minutes = total_ms / 60000;
  total_ms -= minutes * 60000;
  const long long secs = total_ms / 1000;
  const long long ms = total_ms - secs * 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld,%03lld", minutes, secs, ms);
  return std::string(buf);
}

std::optional<double> parse_lap_time(const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos) {
    auto v = csv::to_double(text);
    if (!v || !std::isfinite(*v)) return std::nullopt;
    return v;
  }

  const auto minutes = to_long_strict(text.substr(0, colon));
  const std::string rest = text.substr(colon + 1);
  const auto sep = rest.find_first_of(",.");
  const auto secs = to_long_strict(rest.substr(0, sep));
  if (!minutes || !secs || *secs >= 60) return std::nullopt;

  double frac = 0.0;
  if (sep != std::string::npos) {
    const std::string digits = rest.substr(sep + 1);
    const auto ms = to_long_strict(digits);
    if (!ms) return std::nullopt;
    frac = static_cast<double>(*ms) / std::pow(10.0, static_cast<double>(digits.size()));
  }
  return static_cast<double>(*minutes) * 60.0 + static_cast<double>(*secs) + frac;
}

} // namespace podium
