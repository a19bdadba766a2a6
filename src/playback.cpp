#include <podium/playback.hpp>
#include <algorithm>
#include <utility>
#include <raylib.h>

namespace podium {

Canceller PlaybackScheduler::start(double duration_ms, FrameFn on_frame, Easing easing) {
  cancel();

  auto run = std::make_shared<Run>();
  run->state.duration_ms = duration_ms > 0.0 ? duration_ms : 0.0;
  run->on_frame = std::move(on_frame);
  run->easing = std::move(easing);
  run_ = run;
  last_ = run->state;

  std::weak_ptr<Run> weak = run;
  return [weak]() {
    if (auto r = weak.lock()) r->state.cancelled = true;
  };
}

void PlaybackScheduler::cancel() {
  if (!run_) return;
  if (!run_->state.cancelled && run_->state.raw_progress < 1.0) {
    TraceLog(LOG_DEBUG, "PODIUM: playback cancelled at %.3f", run_->state.raw_progress);
  }
  run_->state.cancelled = true;
  last_ = run_->state;
  run_.reset();
}

void PlaybackScheduler::on_refresh(double now_ms) {
  if (!run_) return;
  // Keep the run alive even if on_frame restarts or cancels this scheduler
  const std::shared_ptr<Run> run = run_;
  if (run->state.cancelled) {
    last_ = run->state;
    run_.reset();
    return;
  }

  auto& st = run->state;
  if (!run->started) {
    run->started = true;
    st.start_time = now_ms;
  }

  const double elapsed = std::max(0.0, now_ms - st.start_time);
  st.raw_progress = st.duration_ms > 0.0 ? std::min(elapsed / st.duration_ms, 1.0) : 1.0;
  st.adjusted_progress = run->easing ? std::clamp(run->easing(st.raw_progress), 0.0, 1.0)
                                     : st.raw_progress;
  st.has_fired = true;

  if (run->on_frame) run->on_frame(st.adjusted_progress);

  if (run_ == run) {
    last_ = st;
    if (st.raw_progress >= 1.0 || st.cancelled) run_.reset();
  }
}

} // namespace podium
