#include <podium/config.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <raylib.h>
#include <podium/csv.hpp>

namespace podium {

static std::optional<bool> to_bool(const std::string& s) {
  const std::string l = csv::lower(s);
  if (l == "true" || l == "1" || l == "yes") return true;
  if (l == "false" || l == "0" || l == "no") return false;
  return std::nullopt;
}

static std::optional<int> to_log_level(const std::string& s) {
  const std::string l = csv::lower(s);
  if (l == "debug")   return LOG_DEBUG;
  if (l == "info")    return LOG_INFO;
  if (l == "warning") return LOG_WARNING;
  if (l == "error")   return LOG_ERROR;
  if (l == "none")    return LOG_NONE;
  return std::nullopt;
}

static bool positive(const std::optional<double>& v) {
  return v && std::isfinite(*v) && *v > 0.0;
}

static bool apply_entry(ReplayConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "race_duration_ms" || key == "points_duration_ms") {
    const auto v = csv::to_double(value);
    if (!positive(v)) return false;
    (key == "race_duration_ms" ? cfg.race_duration_ms : cfg.points_duration_ms) = *v;
    return true;
  }
  if (key == "visibility_threshold") {
    const auto v = csv::to_double(value);
    if (!v || !std::isfinite(*v)) return false;
    cfg.visibility_threshold = std::clamp(*v, 0.0, 1.0);
    return true;
  }
  if (key == "lane_step") {
    const auto v = csv::to_double(value);
    if (!positive(v)) return false;
    cfg.lane_step = *v;
    return true;
  }
  if (key == "show_photos") {
    const auto v = to_bool(value);
    if (!v) return false;
    cfg.show_photos = *v;
    return true;
  }
  if (key == "points_scale") {
    const std::string l = csv::lower(value);
    if (l == "linear") cfg.points_scale = ScaleKind::Linear;
    else if (l == "sqrt") cfg.points_scale = ScaleKind::Sqrt;
    else return false;
    return true;
  }
  if (key == "window_width" || key == "window_height" || key == "target_fps") {
    const auto v = csv::to_int(value);
    if (!v || *v <= 0) return false;
    if (key == "window_width") cfg.window_width = *v;
    else if (key == "window_height") cfg.window_height = *v;
    else cfg.target_fps = *v;
    return true;
  }
  if (key == "log_level") {
    const auto v = to_log_level(value);
    if (!v) return false;
    cfg.log_level = *v;
    return true;
  }
  return false;
}

ReplayConfig config_from_csv_stream(std::istream& in) {
  ReplayConfig cfg{};
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = csv::split_line(raw);
    if (!header_consumed && cols.size() >= 2 && cols[0] == "key" && cols[1] == "value") {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || !apply_entry(cfg, csv::lower(cols[0]), cols[1])) {
      TraceLog(LOG_WARNING, "PODIUM: config entry ignored: '%s'", raw.c_str());
    }
  }
  return cfg;
}

std::optional<ReplayConfig> load_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_csv_stream(f);
}

} // namespace podium
