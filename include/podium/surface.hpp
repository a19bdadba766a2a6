#pragma once
#include <string>
#include <raylib.h>
#include <podium/draw.hpp>

namespace podium {

enum class ImageStatus { None, Pending, Ready, Failed };

// Non-blocking view of avatar loading. Pending is re-checked every frame;
// Failed is permanent.
class ImageSource {
public:
  virtual ~ImageSource() = default;
  virtual ImageStatus status(const std::string& ref) = 0;
};

// Drawing backend. One instance per rendering surface.
class Surface {
public:
  virtual ~Surface() = default;

  virtual float width() const = 0;
  virtual float height() const = 0;

  virtual void fill_rect(Rectangle r, Color c) = 0;
  virtual void line(Vector2 a, Vector2 b, float thickness, Color c) = 0;
  virtual void fill_circle(Vector2 center, float radius, Color c) = 0;
  virtual void ring(Vector2 center, float radius, float thickness, Color c) = 0;
  virtual void fill_triangle(Vector2 a, Vector2 b, Vector2 c, Color col) = 0;
  virtual void text(const std::string& s, Vector2 pos, int size, Color c) = 0;
  virtual int measure_text(const std::string& s, int size) const = 0;
  // Only called for images the ImageSource reported Ready.
  virtual void image_circle(const std::string& ref, Vector2 center, float radius) = 0;
};

// Stateless drawing operations shared by both replay scenes.
class SurfaceRenderer {
public:
  SurfaceRenderer(Surface& surface, ImageSource* images)
    : surface_(surface), images_(images) {}

  void draw(const DrawList& list);

  void draw_track(const TrackCmd& t);
  void draw_car(Vector2 pos, Color color, const std::string& label, int purple_sectors = 0);
  void draw_carpet(Vector2 pos, int ordinal, Color color, const std::string& caption);
  void draw_glow_lane(float x0, float x1, float y, float height, Color color);
  void draw_avatar_or_badge(Vector2 center, float radius, const Avatar& avatar,
                            Color color, bool allow_photo);
  void draw_line_segment(Vector2 a, Vector2 b, float thickness, Color color);
  void draw_label(Vector2 pos, const std::string& text, int size, Color color);

private:
  Surface& surface_;
  ImageSource* images_; // may be null: badges only
};

} // namespace podium
