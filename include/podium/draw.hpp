#pragma once
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include <raylib.h>

namespace podium {

// Photo reference plus the number shown when no photo can be drawn.
struct Avatar {
  std::string image_ref; // file path; empty = no photo
  int number = 0;
};

// All coordinates are surface-local pixels (origin = container top-left).

struct TrackCmd {
  Rectangle bounds{};
  float start_x = 0.0f;
  float finish_x = 0.0f;
  std::vector<float> sector_x; // sector boundary markers between start and finish
  float lane_top = 0.0f;
  float lane_height = 0.0f;
  int lanes = 0;
};

struct CarCmd {
  Vector2 pos{};
  Color color{};
  std::string label;
  int purple_sectors = 0;
};

struct CarpetCmd {
  Vector2 pos{};
  int ordinal = 1; // 1 = gold, 2 = silver, 3 = bronze
  Color color{};   // entrant color, used for the edge stripe
  std::string caption;
};

struct GlowLaneCmd {
  float x0 = 0.0f;
  float x1 = 0.0f;
  float y = 0.0f;      // lane center
  float height = 0.0f;
  Color color{};
};

struct AvatarCmd {
  Vector2 center{};
  float radius = 0.0f;
  Avatar avatar;
  Color color{};
  bool allow_photo = false;
};

struct LineCmd {
  Vector2 a{};
  Vector2 b{};
  float thickness = 1.0f;
  Color color{};
};

struct LabelCmd {
  Vector2 pos{};
  std::string text;
  int size = 12;
  Color color{};
};

using DrawCommand = std::variant<TrackCmd, CarCmd, CarpetCmd, GlowLaneCmd,
                                 AvatarCmd, LineCmd, LabelCmd>;
using DrawList = std::vector<DrawCommand>;

// High-contrast palette; entrants take colors round-robin by index.
Color palette_color(std::size_t index);
std::size_t palette_size();

inline Color with_alpha(Color c, unsigned char a) { c.a = a; return c; }

inline bool same_color(Color a, Color b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

} // namespace podium
