#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <podium/draw.hpp>
#include <podium/playback.hpp>
#include <podium/points_progression.hpp>
#include <podium/race_replay.hpp>
#include <podium/scene.hpp>
#include <podium/visibility.hpp>

namespace podium {

struct PlaybackOptions {
  double duration_ms = 4000.0;
  double visibility_threshold = 0.3;
  Easing easing; // empty = linear
};

// Handle for one rendering surface. Owns its scene, scheduler and trigger;
// nothing is shared between surfaces.
class ReplaySurface {
public:
  ReplaySurface(ViewportMonitor& monitor, SurfaceContainer& container, std::string name);
  ~ReplaySurface();
  ReplaySurface(const ReplaySurface&) = delete;
  ReplaySurface& operator=(const ReplaySurface&) = delete;

  // Disposes any previous mount first. An empty scene hides the container
  // and never plays. The disposer is idempotent and only tears down this mount.
  Disposer mount(std::unique_ptr<ReplayScene> scene, PlaybackOptions options);

  // (Re)starts playback immediately; scroll re-entry will not start it again.
  void replay();

  void dispose();

  // Host refresh: advances playback by at most one frame. Once progress has
  // reached 1 the scene keeps getting frames at 1 until it is settled.
  void on_refresh(double now_ms);

  const DrawList& frame() const { return frame_; }
  ReplayScene* scene() { return scene_.get(); }
  const ReplayScene* scene() const { return scene_.get(); }
  TriggerState state() const { return trigger_.state(); }
  bool playing() const { return scheduler_.running() || settling_; }
  const PlaybackState& playback() const { return scheduler_.state(); }
  const SurfaceContainer& container() const { return container_; }
  const std::string& name() const { return name_; }
  std::uint64_t frames_delivered() const { return frames_; }

private:
  void start_playback_();
  void deliver_final_(double progress);

  SurfaceContainer& container_;
  std::string name_;
  PlaybackScheduler scheduler_;
  VisibilityTrigger trigger_;
  std::unique_ptr<ReplayScene> scene_;
  PlaybackOptions options_{};
  DrawList frame_;
  std::shared_ptr<std::uint64_t> mount_gen_ = std::make_shared<std::uint64_t>(0);
  std::uint64_t frames_{0};
  bool settling_{false};
};

struct RaceReplayOptions {
  double duration_ms = 6000.0;
  double visibility_threshold = 0.3;
  double lane_step = 0.08;
};

// Race replay of the top finishers of one round; eased with race_adjusted_progress.
Disposer mount_race_replay(ReplaySurface& surface, const std::vector<FinisherRecord>& finishers,
                           const RaceReplayOptions& options = {});

struct PointsProgressionOptions {
  double duration_ms = 4000.0;
  double visibility_threshold = 0.3;
  ScaleKind scale = ScaleKind::Linear;
  bool show_photos = false; // caller-owned photo permission
  std::unordered_map<std::string, Avatar> avatars;
};

Disposer mount_points_progression(ReplaySurface& surface, const std::vector<PointsRecord>& records,
                                  const PointsProgressionOptions& options = {});

} // namespace podium
