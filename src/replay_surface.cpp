#include <podium/replay_surface.hpp>
#include <utility>
#include <raylib.h>

namespace podium {

ReplaySurface::ReplaySurface(ViewportMonitor& monitor, SurfaceContainer& container, std::string name)
  : container_(container),
    name_(std::move(name)),
    trigger_(monitor, [this]() { start_playback_(); }) {}

ReplaySurface::~ReplaySurface() {
  scheduler_.cancel();
  trigger_.dispose();
}

Disposer ReplaySurface::mount(std::unique_ptr<ReplayScene> scene, PlaybackOptions options) {
  dispose();
  const std::uint64_t gen = ++*mount_gen_;
  options_ = std::move(options);
  scene_ = std::move(scene);

  if (!scene_ || scene_->empty()) {
    TraceLog(LOG_INFO, "PODIUM: %s has nothing to replay, hiding surface", name_.c_str());
    container_.hidden = true;
    scene_.reset();
  } else {
    container_.hidden = false;
    scene_->reset();
    frame_ = scene_->compute_frame();
    trigger_.arm(container_, options_.visibility_threshold);
    TraceLog(LOG_INFO, "PODIUM: %s mounted, waiting for visibility", name_.c_str());
  }

  std::weak_ptr<std::uint64_t> weak_gen = mount_gen_;
  return [this, weak_gen, gen]() {
    auto g = weak_gen.lock();
    if (g && *g == gen) dispose();
  };
}

void ReplaySurface::replay() {
  if (!scene_) return;
  trigger_.replay();
}

void ReplaySurface::dispose() {
  scheduler_.cancel();
  settling_ = false;
  trigger_.dispose();
  if (scene_) {
    scene_->reset();
    scene_.reset();
    TraceLog(LOG_INFO, "PODIUM: %s disposed", name_.c_str());
  }
  frame_.clear();
  ++*mount_gen_;
}

void ReplaySurface::on_refresh(double now_ms) {
  if (settling_) {
    deliver_final_(1.0);
    return;
  }
  scheduler_.on_refresh(now_ms);
}

// Frame at progress 1: Done only once the scene has come to rest.
void ReplaySurface::deliver_final_(double progress) {
  ++frames_;
  scene_->advance(progress);
  frame_ = scene_->compute_frame();
  settling_ = !scene_->settled();
  if (!settling_) {
    trigger_.mark_done();
    TraceLog(LOG_INFO, "PODIUM: %s playback complete", name_.c_str());
  }
}

void ReplaySurface::start_playback_() {
  if (!scene_) return;
  scene_->reset();
  settling_ = false;
  TraceLog(LOG_INFO, "PODIUM: %s playback started (%.0f ms)", name_.c_str(), options_.duration_ms);
  scheduler_.start(options_.duration_ms, [this](double progress) {
    if (progress >= 1.0) {
      deliver_final_(progress);
      return;
    }
    ++frames_;
    scene_->advance(progress);
    frame_ = scene_->compute_frame();
  }, options_.easing);
}

Disposer mount_race_replay(ReplaySurface& surface, const std::vector<FinisherRecord>& finishers,
                           const RaceReplayOptions& options) {
  auto set = build_finishers(finishers);
  const auto& b = surface.container().bounds;
  const RaceLayout layout = RaceLayout::for_surface(b.width, b.height, set.size());
  auto scene = std::make_unique<RaceReplaySimulator>(std::move(set), layout, options.lane_step);

  PlaybackOptions po{};
  po.duration_ms = options.duration_ms;
  po.visibility_threshold = options.visibility_threshold;
  po.easing = race_adjusted_progress;
  return surface.mount(std::move(scene), std::move(po));
}

Disposer mount_points_progression(ReplaySurface& surface, const std::vector<PointsRecord>& records,
                                  const PointsProgressionOptions& options) {
  const std::size_t rounds = round_count_of(records);
  auto series = build_series(records, rounds, options.avatars);
  const auto& b = surface.container().bounds;
  const Rectangle local{ 0.0f, 0.0f, b.width, b.height };
  auto scene = std::make_unique<PointsProgressionSimulator>(std::move(series), rounds, local,
                                                            options.scale, options.show_photos);

  PlaybackOptions po{};
  po.duration_ms = options.duration_ms;
  po.visibility_threshold = options.visibility_threshold;
  return surface.mount(std::move(scene), std::move(po));
}

} // namespace podium
