#include <podium/surface.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace podium {

namespace {

static const Color kPalette[] = {
  {231, 76, 60, 255},   // red
  {52, 152, 219, 255},  // blue
  {46, 204, 113, 255},  // green
  {241, 196, 15, 255},  // yellow
  {155, 89, 182, 255},  // purple
  {26, 188, 156, 255},  // teal
  {230, 126, 34, 255},  // orange
  {236, 112, 99, 255},  // salmon
};

static constexpr Color kAsphalt   {40, 40, 46, 255};
static constexpr Color kEdge      {30, 30, 34, 255};
static constexpr Color kLaneLine  {70, 70, 80, 255};
static constexpr Color kSector    {200, 200, 210, 160};
static constexpr Color kLabel     {220, 220, 230, 255};
static constexpr Color kPurplePip {180, 90, 255, 255};
static constexpr Color kCheckerW  {240, 240, 240, 255};
static constexpr Color kCheckerB  {20, 20, 22, 255};

static Color carpetColor(int ordinal) {
  switch (ordinal) {
    case 1:  return Color{255, 215, 0, 255};   // gold
    case 2:  return Color{192, 192, 192, 255}; // silver
    case 3:  return Color{205, 127, 50, 255};  // bronze
    default: return Color{120, 120, 130, 255};
  }
}

static const char* ordinalSuffix(int n) {
  const int mod100 = n % 100;
  if (mod100 >= 11 && mod100 <= 13) return "th";
  switch (n % 10) {
    case 1:  return "st";
    case 2:  return "nd";
    case 3:  return "rd";
    default: return "th";
  }
}

} // namespace

Color palette_color(std::size_t index) {
  return kPalette[index % palette_size()];
}

std::size_t palette_size() {
  return sizeof(kPalette) / sizeof(kPalette[0]);
}

void SurfaceRenderer::draw(const DrawList& list) {
  for (const auto& cmd : list) {
    std::visit([this](const auto& c) {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, TrackCmd>) {
        draw_track(c);
      } else if constexpr (std::is_same_v<T, CarCmd>) {
        draw_car(c.pos, c.color, c.label, c.purple_sectors);
      } else if constexpr (std::is_same_v<T, CarpetCmd>) {
        draw_carpet(c.pos, c.ordinal, c.color, c.caption);
      } else if constexpr (std::is_same_v<T, GlowLaneCmd>) {
        draw_glow_lane(c.x0, c.x1, c.y, c.height, c.color);
      } else if constexpr (std::is_same_v<T, AvatarCmd>) {
        draw_avatar_or_badge(c.center, c.radius, c.avatar, c.color, c.allow_photo);
      } else if constexpr (std::is_same_v<T, LineCmd>) {
        draw_line_segment(c.a, c.b, c.thickness, c.color);
      } else {
        draw_label(c.pos, c.text, c.size, c.color);
      }
    }, cmd);
  }
}

void SurfaceRenderer::draw_track(const TrackCmd& t) {
  const Rectangle asphalt{ t.start_x - 12.0f, t.lane_top,
                           (t.finish_x - t.start_x) + 24.0f,
                           t.lane_height * static_cast<float>(std::max(t.lanes, 1)) };
  surface_.fill_rect(asphalt, kAsphalt);
  surface_.line({asphalt.x, asphalt.y}, {asphalt.x + asphalt.width, asphalt.y}, 2.0f, kEdge);
  surface_.line({asphalt.x, asphalt.y + asphalt.height},
                {asphalt.x + asphalt.width, asphalt.y + asphalt.height}, 2.0f, kEdge);

  // Lane separators
  for (int i = 1; i < t.lanes; ++i) {
    const float y = t.lane_top + t.lane_height * static_cast<float>(i);
    surface_.line({t.start_x, y}, {t.finish_x, y}, 1.0f, kLaneLine);
  }

  // Sector guides with S1/S2/S3 captions centered in each segment
  float prev = t.start_x;
  int sector = 1;
  for (float sx : t.sector_x) {
    surface_.line({sx, asphalt.y}, {sx, asphalt.y + asphalt.height}, 2.0f, kSector);
    const std::string cap = "S" + std::to_string(sector++);
    surface_.text(cap, {0.5f * (prev + sx) - 8.0f, asphalt.y - 16.0f}, 12, kLabel);
    prev = sx;
  }
  const std::string last = "S" + std::to_string(sector);
  surface_.text(last, {0.5f * (prev + t.finish_x) - 8.0f, asphalt.y - 16.0f}, 12, kLabel);

  // Start line
  surface_.line({t.start_x, asphalt.y}, {t.start_x, asphalt.y + asphalt.height}, 3.0f, kCheckerW);

  // Finish checker
  const int squares = std::max(4, static_cast<int>(asphalt.height / 8.0f));
  const float sq = asphalt.height / static_cast<float>(squares);
  for (int i = 0; i < squares; ++i) {
    const float y = asphalt.y + sq * static_cast<float>(i);
    surface_.fill_rect({t.finish_x - sq, y, sq, sq}, (i % 2 == 0) ? kCheckerW : kCheckerB);
    surface_.fill_rect({t.finish_x, y, sq, sq}, (i % 2 == 0) ? kCheckerB : kCheckerW);
  }
}

void SurfaceRenderer::draw_car(Vector2 pos, Color color, const std::string& label, int purple_sectors) {
  const float len = 14.0f, wid = 7.0f;
  const Vector2 nose  = { pos.x + len, pos.y };
  const Vector2 tailL = { pos.x - len, pos.y + wid };
  const Vector2 tailR = { pos.x - len, pos.y - wid };
  surface_.fill_triangle(nose, tailL, tailR, color);
  surface_.fill_circle(pos, 3.0f, Color{250, 250, 250, 255});

  const int size = 14;
  const float lx = pos.x - len - 6.0f - static_cast<float>(surface_.measure_text(label, size));
  surface_.text(label, {lx, pos.y - size * 0.5f}, size, kLabel);

  for (int i = 0; i < purple_sectors; ++i) {
    surface_.fill_circle({pos.x - len + 4.0f + 6.0f * static_cast<float>(i), pos.y + wid + 5.0f},
                         2.5f, kPurplePip);
  }
}

void SurfaceRenderer::draw_carpet(Vector2 pos, int ordinal, Color color, const std::string& caption) {
  const Color base = carpetColor(ordinal);
  const Rectangle r{ pos.x, pos.y, 120.0f, 22.0f };
  surface_.fill_rect(r, base);
  surface_.fill_rect({r.x, r.y, 5.0f, r.height}, color);

  const std::string ord = std::to_string(ordinal) + ordinalSuffix(ordinal);
  surface_.text(ord, {r.x + 10.0f, r.y + 4.0f}, 14, kCheckerB);
  if (!caption.empty()) {
    surface_.text(caption, {r.x + 44.0f, r.y + 5.0f}, 12, kCheckerB);
  }
}

void SurfaceRenderer::draw_glow_lane(float x0, float x1, float y, float height, Color color) {
  if (x1 < x0) std::swap(x0, x1);
  // Two passes: wide faint halo, then a tighter core
  surface_.fill_rect({x0, y - height * 0.5f, x1 - x0, height}, with_alpha(color, 40));
  surface_.fill_rect({x0, y - height * 0.25f, x1 - x0, height * 0.5f}, with_alpha(color, 70));
}

void SurfaceRenderer::draw_avatar_or_badge(Vector2 center, float radius, const Avatar& avatar,
                                           Color color, bool allow_photo) {
  const bool photo = allow_photo && images_ != nullptr && !avatar.image_ref.empty()
                     && images_->status(avatar.image_ref) == ImageStatus::Ready;
  if (photo) {
    surface_.image_circle(avatar.image_ref, center, radius);
    surface_.ring(center, radius, 2.0f, color);
    return;
  }

  surface_.fill_circle(center, radius, color);
  surface_.ring(center, radius, 1.5f, Color{250, 250, 250, 200});
  const std::string num = std::to_string(avatar.number);
  const int size = std::max(10, static_cast<int>(radius));
  const float w = static_cast<float>(surface_.measure_text(num, size));
  surface_.text(num, {center.x - w * 0.5f, center.y - size * 0.5f}, size, Color{255, 255, 255, 255});
}

void SurfaceRenderer::draw_line_segment(Vector2 a, Vector2 b, float thickness, Color color) {
  surface_.line(a, b, thickness, color);
}

void SurfaceRenderer::draw_label(Vector2 pos, const std::string& text, int size, Color color) {
  surface_.text(text, pos, size, color);
}

} // namespace podium
