#pragma once
#include <functional>
#include <memory>

namespace podium {

// Race-only finish-line slow motion: identity through 80% of wall-clock time,
// then the final 20% of time covers the last 10% of the race.
inline double race_adjusted_progress(double r) {
  if (r <= 0.0) return 0.0;
  if (r >= 1.0) return 1.0;
  return r < 0.8 ? (r / 0.8) * 0.8 : 0.8 + ((r - 0.8) / 0.2) * 0.5 * 0.2;
}

using Easing = std::function<double(double)>;
using Canceller = std::function<void()>;

struct PlaybackState {
  double start_time = 0.0;        // ms, host clock; set on the first refresh
  double duration_ms = 0.0;
  double raw_progress = 0.0;      // [0, 1]
  double adjusted_progress = 0.0; // [0, 1], equals raw without easing
  bool cancelled = false;
  bool has_fired = false;         // at least one frame delivered
};

// Fixed-duration frame loop driven by the host's display refresh.
// Single-threaded: on_refresh() runs inside the host frame callback.
class PlaybackScheduler {
public:
  using FrameFn = std::function<void(double progress)>;

  PlaybackScheduler() = default;
  PlaybackScheduler(const PlaybackScheduler&) = delete;
  PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;
  ~PlaybackScheduler() { cancel(); }

  // Cancels any run in progress first. The returned canceller is idempotent
  // and only affects the run it was issued for.
  Canceller start(double duration_ms, FrameFn on_frame, Easing easing = {});

  // Idempotent; safe before start.
  void cancel();

  // Delivers at most one frame for the active run.
  void on_refresh(double now_ms);

  bool running() const { return run_ != nullptr && !run_->state.cancelled; }
  // Last run's state (also after completion or cancellation).
  const PlaybackState& state() const { return last_; }

private:
  struct Run {
    PlaybackState state;
    FrameFn on_frame;
    Easing easing;
    bool started = false;
  };

  std::shared_ptr<Run> run_;
  PlaybackState last_{};
};

} // namespace podium
