#pragma once
#include <istream>
#include <optional>
#include <string>
#include <raylib.h>
#include <podium/points_progression.hpp>

namespace podium {

struct ReplayConfig {
  double race_duration_ms = 6000.0;
  double points_duration_ms = 4000.0;
  double visibility_threshold = 0.3; // [0, 1]
  double lane_step = 0.08;           // lane units per frame
  bool show_photos = false;
  ScaleKind points_scale = ScaleKind::Linear;
  int window_width = 1024;
  int window_height = 768;
  int target_fps = 60;
  int log_level = LOG_INFO; // raylib TraceLogLevel
};

// key,value rows; optional "key,value" header, '#' comments and blank lines
// ignored. Unknown keys and invalid values are skipped (logged) and keep the
// default.
ReplayConfig config_from_csv_stream(std::istream& in);

// nullopt if the file cannot be opened.
std::optional<ReplayConfig> load_config_csv(const std::string& path);

} // namespace podium
