#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include <raylib.h>

namespace podium {

using Disposer = std::function<void()>;

// Page-space placement of one rendering surface.
struct SurfaceContainer {
  Rectangle bounds{};
  bool hidden = false;
};

// Fraction of `bounds` inside `viewport` (0 when either is degenerate).
double visible_ratio(const Rectangle& bounds, const Rectangle& viewport);

// Host-side watcher of surface visibility. A watch reports each transition
// from below its threshold to at/above it.
class ViewportMonitor {
public:
  using WatchId = std::uint64_t;
  using Callback = std::function<void()>;

  WatchId watch(const SurfaceContainer& container, double ratio_threshold, Callback on_enter);
  void unwatch(WatchId id);

  // Recompute ratios; called by the host once per refresh. A fresh watch
  // starts outside, so a surface already in view fires on the next update.
  void update(const Rectangle& viewport);

  std::size_t active_watches() const;

private:
  struct Watch {
    WatchId id;
    const SurfaceContainer* container;
    double threshold;
    Callback on_enter;
    bool inside = false;
    bool active = true;
  };

  std::vector<std::shared_ptr<Watch>> watches_;
  WatchId next_id_{1};
};

enum class TriggerState { Idle, Armed, Playing, Done };

const char* trigger_state_name(TriggerState s);

// One-shot gate: fires at most once per arm(), disarming its own watch.
class VisibilityTrigger {
public:
  VisibilityTrigger(ViewportMonitor& monitor, std::function<void()> on_fire);
  ~VisibilityTrigger();
  VisibilityTrigger(const VisibilityTrigger&) = delete;
  VisibilityTrigger& operator=(const VisibilityTrigger&) = delete;

  // Disposes any previous watch first. The disposer is idempotent.
  Disposer arm(const SurfaceContainer& container, double ratio_threshold = 0.3);

  // Bypasses arming: drops the watch, marks fired and starts playback.
  void replay();

  // Playback reached progress 1.
  void mark_done();

  // Drops the watch and returns to Idle.
  void dispose();

  TriggerState state() const { return state_; }
  bool has_fired() const { return state_ == TriggerState::Playing || state_ == TriggerState::Done; }
  bool watching() const { return watch_ != 0; }

private:
  void drop_watch_();
  void fire_();

  ViewportMonitor& monitor_;
  std::function<void()> on_fire_;
  TriggerState state_{TriggerState::Idle};
  ViewportMonitor::WatchId watch_{0};
  std::shared_ptr<std::uint64_t> generation_ = std::make_shared<std::uint64_t>(0);
};

} // namespace podium
