#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <raylib.h>
#include <podium/draw.hpp>
#include <podium/scene.hpp>

namespace podium {

// Already-fetched classification row for one round.
struct FinisherRecord {
  std::string driver;
  double sector1 = 0.0;
  double sector2 = 0.0;
  double sector3 = 0.0;
  int position = 0;
  Avatar avatar;
};

struct Finisher {
  std::string name;
  double sector1 = 0.0;
  double sector2 = 0.0;
  double sector3 = 0.0;
  double total_time = 0.0; // exact sum of the sectors
  int position = 0;
  std::size_t input_index = 0;
  Color color{};
  Avatar avatar;
  int purple_sectors = 0;
};

// Drops records with a non-finite or negative sector. Colors are assigned
// round-robin from the palette by input index; purple sectors are marked
// against the surviving set.
std::vector<Finisher> build_finishers(const std::vector<FinisherRecord>& records);

// Shared scales over entrants with a finite, positive total.
struct RaceReductions {
  bool valid = false;
  double slowest = 0.0;      // max(total)
  double fastest = 0.0;      // min(total)
  double fastest_s1 = 0.0;   // min(sector1)
  double fastest_s1s2 = 0.0; // min(sector1 + sector2)
};

RaceReductions reduce_race(const std::vector<Finisher>& finishers);

// Fraction of the track covered at adjusted progress p, in [0, 1].
double display_progress(const Finisher& f, const RaceReductions& r, double p);

// Phase-dependent ranking score (lower = ahead).
double ranking_score(const Finisher& f, const RaceReductions& r, double p);

// Lane per finisher (index-aligned with the input). 0 = top lane.
std::vector<int> target_lanes(const std::vector<Finisher>& finishers, double p);

struct RaceLayout {
  float width = 0.0f;
  float height = 0.0f;
  float track_start_x = 0.0f;
  float track_end_x = 0.0f;
  float lane_top = 0.0f;
  float lane_height = 0.0f;

  float lane_center_y(double lane_position) const {
    return lane_top + lane_height * (static_cast<float>(lane_position) + 0.5f);
  }

  static RaceLayout for_surface(float width, float height, std::size_t lanes);
};

class RaceReplaySimulator : public ReplayScene {
public:
  struct EntrantState {
    double display_progress = 0.0;
    double lane_position = 0.0;
    int target_lane = 0;
    bool finished = false;
    int finish_seq = -1;          // 0-based finish order, -1 while running
    double finish_progress = 0.0; // playback progress at the finish event
  };

  RaceReplaySimulator(std::vector<Finisher> finishers, RaceLayout layout, double lane_step);

  bool empty() const override { return finishers_.empty(); }
  void reset() override;
  void advance(double adjusted_progress) override;
  DrawList compute_frame() const override;
  // Every lane_position has reached its target lane.
  bool settled() const override;

  const std::vector<Finisher>& finishers() const { return finishers_; }
  const std::vector<EntrantState>& entrants() const { return state_; }
  const RaceReductions& reductions() const { return reductions_; }
  double progress() const { return progress_; }

  // Input indices in the order the finish events were recorded.
  std::vector<std::size_t> finish_order() const;

  // Lane all entrants start from on mount/replay.
  double neutral_lane() const;

private:
  float x_for_(const EntrantState& e) const;

  std::vector<Finisher> finishers_;
  RaceLayout layout_;
  double lane_step_;
  RaceReductions reductions_;
  std::vector<EntrantState> state_;
  double progress_{0.0};
  int next_finish_seq_{0};
};

} // namespace podium
