#include <raylib.h>
#include <algorithm>
#include <cstdio>
#include <string>

#include <podium/viewer/app.hpp>
#include <podium/viewer/raylib_surface.hpp>
#include <podium/points_progression.hpp>
#include <podium/surface.hpp>

namespace podium {

namespace {

// --- Page layout (keep in sync with layout_) ---
static constexpr float kPageMargin   = 20.0f;
static constexpr float kHeaderHeight = 70.0f;
static constexpr float kTitleHeight  = 28.0f;
static constexpr float kRaceHeight   = 300.0f;
static constexpr float kPointsHeight = 420.0f;
static constexpr float kScrollStep   = 48.0f;

static constexpr Color kPageBg   {18, 18, 22, 255};
static constexpr Color kPanelBg  {24, 24, 28, 235};
static constexpr Color kPanelRim {60, 60, 70, 255};
static constexpr Color kTitle    {220, 220, 230, 255};
static constexpr Color kSubtitle {160, 160, 175, 255};

static Rectangle screen_rect(const SurfaceContainer& box, float scroll_y) {
  return { box.bounds.x, box.bounds.y - scroll_y, box.bounds.width, box.bounds.height };
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(ReplayConfig cfg, std::vector<RoundResult> results, AvatarLookup avatars)
  : cfg_(cfg),
    results_(std::move(results)),
    avatars_(std::move(avatars)),
    race_(monitor_, race_box_, "race replay"),
    points_(monitor_, points_box_, "points progression"),
    seasons_(seasons_in(results_)) {}

void ViewerApp::layout_() {
  const float w = static_cast<float>(cfg_.window_width) - 2.0f * kPageMargin;
  const float h = static_cast<float>(cfg_.window_height);
  race_box_.bounds = { kPageMargin, kHeaderHeight + kTitleHeight, w, kRaceHeight };
  // Leave most of a screen between the two so the chart starts below the fold
  const float gap = std::max(h * 0.75f, 240.0f);
  points_box_.bounds = { kPageMargin, race_box_.bounds.y + kRaceHeight + gap, w, kPointsHeight };
  page_height_ = points_box_.bounds.y + kPointsHeight + kPageMargin * 2.0f;
}

std::optional<int> ViewerApp::season_() const {
  if (season_idx_ < 0 || season_idx_ >= static_cast<int>(seasons_.size())) return std::nullopt;
  return seasons_[static_cast<std::size_t>(season_idx_)];
}

void ViewerApp::mount_race_() {
  rounds_ = rounds_in(results_, season_());
  if (round_idx_ >= rounds_.size()) round_idx_ = rounds_.empty() ? 0 : rounds_.size() - 1;

  std::vector<FinisherRecord> podium;
  if (!rounds_.empty()) {
    const auto [season, round] = rounds_[round_idx_];
    podium = podium_for_round(results_, season, round, avatars_);
  }
  RaceReplayOptions opts{};
  opts.duration_ms = cfg_.race_duration_ms;
  opts.visibility_threshold = cfg_.visibility_threshold;
  opts.lane_step = cfg_.lane_step;
  mount_race_replay(race_, podium, opts);
}

void ViewerApp::mount_points_() {
  PointsProgressionOptions opts{};
  opts.duration_ms = cfg_.points_duration_ms;
  opts.visibility_threshold = cfg_.visibility_threshold;
  opts.scale = cfg_.points_scale;
  opts.show_photos = cfg_.show_photos;
  opts.avatars = avatars_;
  if (cfg_.show_photos) {
    for (const auto& [driver, avatar] : avatars_) textures_.request(avatar.image_ref);
  }
  mount_points_progression(points_, points_records(results_, season_()), opts);
}

int ViewerApp::run() {
  InitWindow(cfg_.window_width, cfg_.window_height, "Podium - League Replays");
  SetTargetFPS(cfg_.target_fps);

  layout_();
  round_idx_ = static_cast<std::size_t>(-1); // latest round
  mount_race_();
  mount_points_();

  while (!WindowShouldClose()) {
    process_input_();
    pump_playback_();
    render_frame_();
  }

  race_.dispose();
  points_.dispose();
  textures_.clear();
  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Page scroll
  const float max_scroll = std::max(0.0f, page_height_ - static_cast<float>(GetScreenHeight()));
  scroll_y_ -= GetMouseWheelMove() * kScrollStep;
  if (IsKeyDown(KEY_DOWN)) scroll_y_ += 8.0f;
  if (IsKeyDown(KEY_UP))   scroll_y_ -= 8.0f;
  if (IsKeyPressed(KEY_HOME)) scroll_y_ = 0.0f;
  if (IsKeyPressed(KEY_END))  scroll_y_ = max_scroll;
  scroll_y_ = std::clamp(scroll_y_, 0.0f, max_scroll);

  // Manual replays
  if (IsKeyPressed(KEY_R)) race_.replay();
  if (IsKeyPressed(KEY_P)) points_.replay();

  // Round selection (race replay only)
  if (IsKeyPressed(KEY_LEFT_BRACKET) && round_idx_ > 0) {
    --round_idx_;
    mount_race_();
  }
  if (IsKeyPressed(KEY_RIGHT_BRACKET) && round_idx_ + 1 < rounds_.size()) {
    ++round_idx_;
    mount_race_();
  }

  // Season filter: all -> each season -> all; both surfaces remount
  if (IsKeyPressed(KEY_S)) {
    season_idx_ = (season_idx_ + 1 < static_cast<int>(seasons_.size())) ? season_idx_ + 1 : -1;
    round_idx_ = static_cast<std::size_t>(-1);
    mount_race_();
    mount_points_();
  }
}

void ViewerApp::pump_playback_() {
  const Rectangle viewport{ 0.0f, scroll_y_, static_cast<float>(GetScreenWidth()),
                            static_cast<float>(GetScreenHeight()) };
  monitor_.update(viewport);

  const double now_ms = GetTime() * 1000.0;
  race_.on_refresh(now_ms);
  points_.on_refresh(now_ms);

  // Tooltip hover in chart-local coordinates
  if (auto* chart = dynamic_cast<PointsProgressionSimulator*>(points_.scene())) {
    const Rectangle r = screen_rect(points_box_, scroll_y_);
    const Vector2 m = GetMousePosition();
    if (CheckCollisionPointRec(m, r)) chart->set_hover(Vector2{ m.x - r.x, m.y - r.y });
    else                              chart->set_hover(std::nullopt);
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(kPageBg);

  char race_sub[96] = "no results";
  if (!rounds_.empty() && round_idx_ < rounds_.size()) {
    std::snprintf(race_sub, sizeof(race_sub), "Season %d - Round %d  ([ ] round, R replay)",
                  rounds_[round_idx_].first, rounds_[round_idx_].second);
  }
  char points_sub[96];
  if (const auto s = season_()) std::snprintf(points_sub, sizeof(points_sub), "Season %d  (S season, P replay)", *s);
  else std::snprintf(points_sub, sizeof(points_sub), "All seasons  (S season, P replay)");

  draw_surface_(race_, "Podium Replay", race_sub);
  draw_surface_(points_, "Championship Progression", points_sub);
  draw_hud_();
  EndDrawing();
}

void ViewerApp::draw_surface_(ReplaySurface& surface, const char* title, const char* subtitle) {
  const SurfaceContainer& box = surface.container();
  const Rectangle r = screen_rect(box, scroll_y_);
  if (r.y + r.height < 0.0f || r.y - kTitleHeight > static_cast<float>(GetScreenHeight())) return;

  DrawText(title, static_cast<int>(r.x), static_cast<int>(r.y - kTitleHeight), 20, kTitle);
  if (box.hidden) {
    DrawText("No data for this selection", static_cast<int>(r.x), static_cast<int>(r.y + 6.0f), 16, kSubtitle);
    return;
  }
  DrawText(subtitle, static_cast<int>(r.x + 340.0f), static_cast<int>(r.y - kTitleHeight + 4.0f), 14, kSubtitle);

  DrawRectangleRec(r, kPanelBg);
  DrawRectangleLinesEx(r, 1.0f, kPanelRim);

  BeginScissorMode(static_cast<int>(r.x), static_cast<int>(r.y),
                   static_cast<int>(r.width), static_cast<int>(r.height));
  RaylibSurface target({r.x, r.y}, r.width, r.height, textures_);
  SurfaceRenderer renderer(target, &textures_);
  renderer.draw(surface.frame());
  EndScissorMode();
}

void ViewerApp::draw_hud_() {
  DrawRectangle(0, 0, GetScreenWidth(), static_cast<int>(kHeaderHeight) - 20, Color{0, 0, 0, 160});
  DrawText(TextFormat("race=%s  points=%s  photos=%s  scroll=%.0f/%.0f",
                      trigger_state_name(race_.state()),
                      trigger_state_name(points_.state()),
                      cfg_.show_photos ? "on" : "off",
                      scroll_y_, page_height_),
           20, 12, 18, Color{220, 235, 220, 255});
  DrawText("Wheel/Up/Down: Scroll | Home/End | R: Replay race | P: Replay points | [ ]: Round | S: Season",
           20, 34, 14, Color{190, 205, 190, 255});
}

} // namespace podium
