#pragma once
#include <podium/draw.hpp>

namespace podium {

// Per-surface animated content driven by a PlaybackScheduler.
// advance() mutates per-frame state; compute_frame() is a pure read of it.
class ReplayScene {
public:
  virtual ~ReplayScene() = default;

  virtual bool empty() const = 0;
  // Clears every transient per-entity field (start of playback or disposal).
  virtual void reset() = 0;
  virtual void advance(double progress) = 0;
  virtual DrawList compute_frame() const = 0;
  // False while the scene still needs frames at progress 1 to come to rest.
  virtual bool settled() const { return true; }
};

} // namespace podium
