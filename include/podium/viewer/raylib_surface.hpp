#pragma once
#include <string>
#include <raylib.h>
#include <podium/surface.hpp>

namespace podium {

class TextureCache;

// Surface backed by raylib immediate-mode drawing. Local coordinates are
// offset by `origin` (screen position of the container's top-left).
class RaylibSurface : public Surface {
public:
  RaylibSurface(Vector2 origin, float width, float height, const TextureCache& textures)
    : origin_(origin), width_(width), height_(height), textures_(textures) {}

  float width() const override { return width_; }
  float height() const override { return height_; }

  void fill_rect(Rectangle r, Color c) override;
  void line(Vector2 a, Vector2 b, float thickness, Color c) override;
  void fill_circle(Vector2 center, float radius, Color c) override;
  void ring(Vector2 center, float radius, float thickness, Color c) override;
  void fill_triangle(Vector2 a, Vector2 b, Vector2 c, Color col) override;
  void text(const std::string& s, Vector2 pos, int size, Color c) override;
  int measure_text(const std::string& s, int size) const override;
  void image_circle(const std::string& ref, Vector2 center, float radius) override;

private:
  Vector2 to_screen_(Vector2 p) const { return { origin_.x + p.x, origin_.y + p.y }; }

  Vector2 origin_;
  float width_;
  float height_;
  const TextureCache& textures_;
};

} // namespace podium
