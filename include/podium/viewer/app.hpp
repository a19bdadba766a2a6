#pragma once
#include <optional>
#include <utility>
#include <vector>
#include <podium/config.hpp>
#include <podium/replay_surface.hpp>
#include <podium/results.hpp>
#include <podium/visibility.hpp>
#include <podium/viewer/texture_cache.hpp>

namespace podium {

// Scrolling results page hosting the race replay and points progression
// surfaces. Owns the window for the duration of run().
class ViewerApp {
public:
  ViewerApp(ReplayConfig cfg, std::vector<RoundResult> results, AvatarLookup avatars);
  int run(); // returns 0 on normal exit

private:
  // Page & data flow
  void layout_();
  void mount_race_();
  void mount_points_();
  void process_input_();
  void pump_playback_();
  // Rendering
  void render_frame_();
  void draw_surface_(ReplaySurface& surface, const char* title, const char* subtitle);
  void draw_hud_();

  std::optional<int> season_() const;

  ReplayConfig cfg_;
  std::vector<RoundResult> results_;
  AvatarLookup avatars_;

  TextureCache textures_;
  ViewportMonitor monitor_;
  SurfaceContainer race_box_{};
  SurfaceContainer points_box_{};
  ReplaySurface race_;
  ReplaySurface points_;

  // Filters: season_idx_ = -1 means all seasons
  std::vector<int> seasons_;
  int season_idx_{-1};
  std::vector<std::pair<int, int>> rounds_;
  std::size_t round_idx_{0};

  // Page scroll (pixels)
  float scroll_y_{0.0f};
  float page_height_{0.0f};
};

} // namespace podium
