#include <podium/viewer/raylib_surface.hpp>
#include <algorithm>
#include <cmath>
#include <podium/viewer/texture_cache.hpp>

namespace podium {

void RaylibSurface::fill_rect(Rectangle r, Color c) {
  const Vector2 p = to_screen_({r.x, r.y});
  DrawRectangleRec(Rectangle{p.x, p.y, r.width, r.height}, c);
}

void RaylibSurface::line(Vector2 a, Vector2 b, float thickness, Color c) {
  DrawLineEx(to_screen_(a), to_screen_(b), thickness, c);
}

void RaylibSurface::fill_circle(Vector2 center, float radius, Color c) {
  DrawCircleV(to_screen_(center), radius, c);
}

void RaylibSurface::ring(Vector2 center, float radius, float thickness, Color c) {
  DrawRing(to_screen_(center), std::max(0.0f, radius - thickness), radius, 0.0f, 360.0f, 36, c);
}

void RaylibSurface::fill_triangle(Vector2 a, Vector2 b, Vector2 c, Color col) {
  DrawTriangle(to_screen_(a), to_screen_(b), to_screen_(c), col);
}

void RaylibSurface::text(const std::string& s, Vector2 pos, int size, Color c) {
  const Vector2 p = to_screen_(pos);
  DrawText(s.c_str(), static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)), size, c);
}

int RaylibSurface::measure_text(const std::string& s, int size) const {
  return MeasureText(s.c_str(), size);
}

void RaylibSurface::image_circle(const std::string& ref, Vector2 center, float radius) {
  const Texture2D* tex = textures_.texture(ref);
  if (tex == nullptr) return;
  const Vector2 c = to_screen_(center);
  const Rectangle src{ 0.0f, 0.0f, static_cast<float>(tex->width), static_cast<float>(tex->height) };
  const Rectangle dst{ c.x - radius, c.y - radius, radius * 2.0f, radius * 2.0f };
  DrawTexturePro(*tex, src, dst, Vector2{0.0f, 0.0f}, 0.0f, WHITE);
}

} // namespace podium
