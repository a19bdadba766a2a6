#include <podium/race_replay.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <podium/lap_time.hpp>

namespace podium {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static inline bool valid_sector(double s) {
  return std::isfinite(s) && s >= 0.0;
}

std::vector<Finisher> build_finishers(const std::vector<FinisherRecord>& records) {
  std::vector<Finisher> out;
  out.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& r = records[i];
    if (!valid_sector(r.sector1) || !valid_sector(r.sector2) || !valid_sector(r.sector3)) {
      TraceLog(LOG_WARNING, "PODIUM: replay excludes '%s' (invalid sector time)", r.driver.c_str());
      continue;
    }
    Finisher f{};
    f.name = r.driver;
    f.sector1 = r.sector1;
    f.sector2 = r.sector2;
    f.sector3 = r.sector3;
    f.total_time = r.sector1 + r.sector2 + r.sector3;
    f.position = r.position;
    f.input_index = out.size();
    f.color = palette_color(out.size());
    f.avatar = r.avatar;
    out.push_back(std::move(f));
  }

  // Purple sector = fastest time for that sector within this set
  double best[3] = { std::numeric_limits<double>::infinity(),
                     std::numeric_limits<double>::infinity(),
                     std::numeric_limits<double>::infinity() };
  for (const auto& f : out) {
    best[0] = std::min(best[0], f.sector1);
    best[1] = std::min(best[1], f.sector2);
    best[2] = std::min(best[2], f.sector3);
  }
  for (auto& f : out) {
    f.purple_sectors = (f.sector1 == best[0]) + (f.sector2 == best[1]) + (f.sector3 == best[2]);
  }
  return out;
}

RaceReductions reduce_race(const std::vector<Finisher>& finishers) {
  RaceReductions r{};
  for (const auto& f : finishers) {
    if (!std::isfinite(f.total_time) || f.total_time <= 0.0) continue;
    const double s1s2 = f.sector1 + f.sector2;
    if (!r.valid) {
      r.valid = true;
      r.slowest = r.fastest = f.total_time;
      r.fastest_s1 = f.sector1;
      r.fastest_s1s2 = s1s2;
      continue;
    }
    r.slowest = std::max(r.slowest, f.total_time);
    r.fastest = std::min(r.fastest, f.total_time);
    r.fastest_s1 = std::min(r.fastest_s1, f.sector1);
    r.fastest_s1s2 = std::min(r.fastest_s1s2, s1s2);
  }
  return r;
}

double display_progress(const Finisher& f, const RaceReductions& r, double p) {
  p = clamp01(p);
  if (!r.valid || !std::isfinite(f.total_time) || f.total_time <= 0.0) {
    return p > 0.0 ? 1.0 : 0.0;
  }
  // The slowest entrant has share 1.0 and reaches the line exactly at p = 1.
  const double share = f.total_time / r.slowest;
  return std::min(p / share, 1.0);
}

double ranking_score(const Finisher& f, const RaceReductions& r, double p) {
  if (!r.valid) return f.total_time;
  const double elapsed = clamp01(p) * r.fastest;
  if (elapsed < r.fastest_s1)   return f.sector1;
  if (elapsed < r.fastest_s1s2) return f.sector1 + f.sector2;
  return f.total_time;
}

std::vector<int> target_lanes(const std::vector<Finisher>& finishers, double p) {
  const RaceReductions r = reduce_race(finishers);
  std::vector<double> score(finishers.size());
  for (std::size_t i = 0; i < finishers.size(); ++i) {
    score[i] = ranking_score(finishers[i], r, p);
  }
  std::vector<std::size_t> order(finishers.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return score[a] < score[b];
  });

  std::vector<int> lanes(finishers.size(), 0);
  for (std::size_t rank = 0; rank < order.size(); ++rank) {
    lanes[order[rank]] = static_cast<int>(rank);
  }
  return lanes;
}

RaceLayout RaceLayout::for_surface(float width, float height, std::size_t lanes) {
  RaceLayout l{};
  l.width = width;
  l.height = height;
  l.track_start_x = 120.0f;
  l.track_end_x = std::max(l.track_start_x + 40.0f, width - 170.0f);
  l.lane_top = 40.0f;
  const float n = static_cast<float>(std::max<std::size_t>(lanes, 1));
  l.lane_height = std::clamp((height - 60.0f) / n, 20.0f, 64.0f);
  return l;
}

RaceReplaySimulator::RaceReplaySimulator(std::vector<Finisher> finishers, RaceLayout layout,
                                         double lane_step)
  : finishers_(std::move(finishers)),
    layout_(layout),
    lane_step_(lane_step > 0.0 ? lane_step : 0.08),
    reductions_(reduce_race(finishers_)) {
  reset();
}

double RaceReplaySimulator::neutral_lane() const {
  if (finishers_.empty()) return 0.0;
  return 0.5 * static_cast<double>(finishers_.size() - 1);
}

void RaceReplaySimulator::reset() {
  state_.assign(finishers_.size(), EntrantState{});
  const double mid = neutral_lane();
  for (auto& e : state_) {
    e.lane_position = mid;
  }
  progress_ = 0.0;
  next_finish_seq_ = 0;
}

void RaceReplaySimulator::advance(double adjusted_progress) {
  progress_ = clamp01(adjusted_progress);
  const auto lanes = target_lanes(finishers_, progress_);

  std::vector<std::size_t> arrived;
  for (std::size_t i = 0; i < finishers_.size(); ++i) {
    auto& e = state_[i];
    e.display_progress = display_progress(finishers_[i], reductions_, progress_);
    e.target_lane = lanes[i];

    const double d = static_cast<double>(e.target_lane) - e.lane_position;
    if (std::fabs(d) <= lane_step_) e.lane_position = static_cast<double>(e.target_lane);
    else                            e.lane_position += (d > 0.0 ? lane_step_ : -lane_step_);

    if (!e.finished && e.display_progress >= 1.0) arrived.push_back(i);
  }

  // Several arrivals in one frame: record faster totals first, then input order.
  std::stable_sort(arrived.begin(), arrived.end(), [&](std::size_t a, std::size_t b) {
    return finishers_[a].total_time < finishers_[b].total_time;
  });
  for (std::size_t i : arrived) {
    auto& e = state_[i];
    e.finished = true;
    e.finish_seq = next_finish_seq_++;
    e.finish_progress = progress_;
  }
}

bool RaceReplaySimulator::settled() const {
  return std::all_of(state_.begin(), state_.end(), [](const EntrantState& e) {
    return e.lane_position == static_cast<double>(e.target_lane);
  });
}

std::vector<std::size_t> RaceReplaySimulator::finish_order() const {
  std::vector<std::size_t> order;
  for (std::size_t i = 0; i < state_.size(); ++i) {
    if (state_[i].finished) order.push_back(i);
  }
  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return state_[a].finish_seq < state_[b].finish_seq;
  });
  return order;
}

float RaceReplaySimulator::x_for_(const EntrantState& e) const {
  const float len = layout_.track_end_x - layout_.track_start_x;
  return layout_.track_start_x + len * static_cast<float>(clamp01(e.display_progress));
}

DrawList RaceReplaySimulator::compute_frame() const {
  DrawList out;
  if (finishers_.empty()) return out;

  // Sector guides follow the fastest entrant's splits
  TrackCmd track{};
  track.bounds = { 0.0f, 0.0f, layout_.width, layout_.height };
  track.start_x = layout_.track_start_x;
  track.finish_x = layout_.track_end_x;
  track.lane_top = layout_.lane_top;
  track.lane_height = layout_.lane_height;
  track.lanes = static_cast<int>(finishers_.size());
  const float len = layout_.track_end_x - layout_.track_start_x;
  double f1 = 1.0 / 3.0, f2 = 2.0 / 3.0;
  for (const auto& f : finishers_) {
    if (reductions_.valid && f.total_time == reductions_.fastest) {
      f1 = f.sector1 / f.total_time;
      f2 = (f.sector1 + f.sector2) / f.total_time;
      break;
    }
  }
  track.sector_x = { layout_.track_start_x + len * static_cast<float>(f1),
                     layout_.track_start_x + len * static_cast<float>(f2) };
  out.emplace_back(std::move(track));

  for (std::size_t i = 0; i < finishers_.size(); ++i) {
    const auto& e = state_[i];
    if (!e.finished) continue;
    out.emplace_back(GlowLaneCmd{ layout_.track_start_x, layout_.track_end_x,
                                  layout_.lane_center_y(e.lane_position),
                                  layout_.lane_height * 0.8f, finishers_[i].color });
  }

  for (std::size_t i = 0; i < finishers_.size(); ++i) {
    const auto& f = finishers_[i];
    const auto& e = state_[i];
    out.emplace_back(CarCmd{ { x_for_(e), layout_.lane_center_y(e.lane_position) },
                             f.color, f.name, f.purple_sectors });
  }

  for (std::size_t i : finish_order()) {
    const auto& f = finishers_[i];
    const int ordinal = state_[i].finish_seq + 1;
    const float y = layout_.lane_top + layout_.lane_height * static_cast<float>(ordinal - 1)
                    + 0.5f * layout_.lane_height - 11.0f;
    out.emplace_back(CarpetCmd{ { layout_.track_end_x + 30.0f, y }, ordinal, f.color,
                                format_lap_time(f.total_time) });
  }
  return out;
}

} // namespace podium
