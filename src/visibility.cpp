#include <podium/visibility.hpp>
#include <algorithm>
#include <utility>

namespace podium {

double visible_ratio(const Rectangle& bounds, const Rectangle& viewport) {
  const double area = static_cast<double>(bounds.width) * static_cast<double>(bounds.height);
  if (area <= 0.0 || viewport.width <= 0.0f || viewport.height <= 0.0f) return 0.0;
  const float x0 = std::max(bounds.x, viewport.x);
  const float y0 = std::max(bounds.y, viewport.y);
  const float x1 = std::min(bounds.x + bounds.width, viewport.x + viewport.width);
  const float y1 = std::min(bounds.y + bounds.height, viewport.y + viewport.height);
  if (x1 <= x0 || y1 <= y0) return 0.0;
  return (static_cast<double>(x1 - x0) * static_cast<double>(y1 - y0)) / area;
}

ViewportMonitor::WatchId ViewportMonitor::watch(const SurfaceContainer& container,
                                                double ratio_threshold, Callback on_enter) {
  auto w = std::make_shared<Watch>();
  w->id = next_id_++;
  w->container = &container;
  w->threshold = std::clamp(ratio_threshold, 0.0, 1.0);
  w->on_enter = std::move(on_enter);
  watches_.push_back(w);
  return w->id;
}

void ViewportMonitor::unwatch(WatchId id) {
  for (auto& w : watches_) {
    if (w->id == id) w->active = false;
  }
}

void ViewportMonitor::update(const Rectangle& viewport) {
  // Callbacks may watch/unwatch; iterate a snapshot.
  const auto snapshot = watches_;
  for (const auto& w : snapshot) {
    if (!w->active) continue;
    const double ratio = w->container->hidden ? 0.0 : visible_ratio(w->container->bounds, viewport);
    const bool inside = ratio > 0.0 && ratio >= w->threshold;
    const bool entered = inside && !w->inside;
    w->inside = inside;
    if (entered && w->on_enter) w->on_enter();
  }
  watches_.erase(std::remove_if(watches_.begin(), watches_.end(),
                                [](const std::shared_ptr<Watch>& w) { return !w->active; }),
                 watches_.end());
}

std::size_t ViewportMonitor::active_watches() const {
  return static_cast<std::size_t>(std::count_if(watches_.begin(), watches_.end(),
                                                [](const std::shared_ptr<Watch>& w) { return w->active; }));
}

const char* trigger_state_name(TriggerState s) {
  switch (s) {
    case TriggerState::Idle:    return "Idle";
    case TriggerState::Armed:   return "Armed";
    case TriggerState::Playing: return "Playing";
    case TriggerState::Done:    return "Done";
  }
  return "Unknown";
}

VisibilityTrigger::VisibilityTrigger(ViewportMonitor& monitor, std::function<void()> on_fire)
  : monitor_(monitor), on_fire_(std::move(on_fire)) {}

VisibilityTrigger::~VisibilityTrigger() {
  drop_watch_();
}

Disposer VisibilityTrigger::arm(const SurfaceContainer& container, double ratio_threshold) {
  drop_watch_();
  const std::uint64_t gen = ++*generation_;
  state_ = TriggerState::Armed;

  std::weak_ptr<std::uint64_t> weak_gen = generation_;
  watch_ = monitor_.watch(container, ratio_threshold, [this, weak_gen, gen]() {
    auto g = weak_gen.lock();
    if (!g || *g != gen || state_ != TriggerState::Armed) return;
    drop_watch_();
    fire_();
  });

  return [this, weak_gen, gen]() {
    auto g = weak_gen.lock();
    if (!g || *g != gen) return;
    dispose();
  };
}

void VisibilityTrigger::replay() {
  drop_watch_();
  ++*generation_;
  fire_();
}

void VisibilityTrigger::mark_done() {
  if (state_ == TriggerState::Playing) state_ = TriggerState::Done;
}

void VisibilityTrigger::dispose() {
  drop_watch_();
  ++*generation_;
  state_ = TriggerState::Idle;
}

void VisibilityTrigger::drop_watch_() {
  if (watch_ != 0) {
    monitor_.unwatch(watch_);
    watch_ = 0;
  }
}

void VisibilityTrigger::fire_() {
  state_ = TriggerState::Playing;
  if (on_fire_) on_fire_();
}

} // namespace podium
