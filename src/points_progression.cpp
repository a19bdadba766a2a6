#include <podium/points_progression.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace podium {

static constexpr Color kGrid      {60, 60, 70, 255};
static constexpr Color kAxisLabel {190, 190, 200, 255};
static constexpr Color kHoverLine {235, 235, 235, 160};

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static inline Vector2 lerp2(Vector2 a, Vector2 b, float t) {
  return { a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t };
}

static std::string format_points(double v) {
  char buf[32];
  if (std::fabs(v - std::round(v)) < 1e-9) std::snprintf(buf, sizeof(buf), "%.0f", v);
  else                                     std::snprintf(buf, sizeof(buf), "%.1f", v);
  return std::string(buf);
}

std::size_t round_count_of(const std::vector<PointsRecord>& records) {
  int max_round = 0;
  for (const auto& r : records) max_round = std::max(max_round, r.round);
  return static_cast<std::size_t>(max_round);
}

std::vector<DriverSeries> build_series(const std::vector<PointsRecord>& records,
                                       std::size_t round_count,
                                       const std::unordered_map<std::string, Avatar>& avatars) {
  std::vector<DriverSeries> series;
  std::unordered_map<std::string, std::size_t> index;
  std::vector<std::vector<double>> per_round;

  for (const auto& r : records) {
    if (!std::isfinite(r.points)) {
      TraceLog(LOG_WARNING, "PODIUM: dropping non-finite points for '%s' round %d",
               r.driver.c_str(), r.round);
      continue;
    }
    if (r.round < 1 || static_cast<std::size_t>(r.round) > round_count) continue;

    auto it = index.find(r.driver);
    if (it == index.end()) {
      DriverSeries s{};
      s.name = r.driver;
      s.color = palette_color(series.size());
      if (auto a = avatars.find(r.driver); a != avatars.end()) {
        s.avatar = a->second;
      } else {
        s.avatar.number = static_cast<int>(series.size()) + 1;
      }
      it = index.emplace(r.driver, series.size()).first;
      series.push_back(std::move(s));
      per_round.emplace_back(round_count + 1, 0.0);
    }
    per_round[it->second][static_cast<std::size_t>(r.round)] += r.points;
  }

  // Running totals; index 0 stays anchored at zero.
  for (std::size_t i = 0; i < series.size(); ++i) {
    auto& cum = series[i].cumulative_points;
    cum.assign(round_count + 1, 0.0);
    for (std::size_t k = 1; k <= round_count; ++k) {
      cum[k] = cum[k - 1] + per_round[i][k];
    }
  }
  return series;
}

double nice_axis_max(const std::vector<DriverSeries>& series, double* step_out) {
  double m = 0.0;
  for (const auto& s : series) {
    if (s.cumulative_points.empty()) continue;
    const double last = s.cumulative_points.back();
    if (std::isfinite(last)) m = std::max(m, last);
  }
  if (m <= 0.0) m = 1.0;

  // Tick step from {1, 2, 5} x 10^k giving at most five intervals
  const double magnitude = std::pow(10.0, std::floor(std::log10(m / 5.0)));
  double step = magnitude;
  for (double mult : {1.0, 2.0, 5.0, 10.0}) {
    step = mult * magnitude;
    if (m / step <= 5.0) break;
  }
  if (step_out) *step_out = step;
  return std::ceil(m / step) * step;
}

ChartScale::ChartScale(Rectangle plot, std::size_t round_count, double max_value,
                       double tick_step, ScaleKind kind)
  : plot_(plot),
    rounds_(round_count),
    max_(max_value > 0.0 && std::isfinite(max_value) ? max_value : 1.0),
    step_(tick_step > 0.0 && std::isfinite(tick_step) ? tick_step : max_),
    kind_(kind) {}

float ChartScale::x(double round) const {
  if (rounds_ == 0) return plot_.x;
  return plot_.x + plot_.width * static_cast<float>(round / static_cast<double>(rounds_));
}

float ChartScale::y(double value) const {
  double v = std::isfinite(value) ? std::clamp(value, 0.0, max_) : 0.0;
  double t = v / max_;
  if (kind_ == ScaleKind::Sqrt) t = std::sqrt(t);
  return plot_.y + plot_.height * static_cast<float>(1.0 - t);
}

static Rectangle plot_area(Rectangle bounds) {
  return { bounds.x + 56.0f, bounds.y + 24.0f,
           std::max(10.0f, bounds.width - 56.0f - 40.0f),
           std::max(10.0f, bounds.height - 24.0f - 36.0f) };
}

static ChartScale make_scale(const std::vector<DriverSeries>& series, std::size_t rounds,
                             Rectangle bounds, ScaleKind kind) {
  double step = 1.0;
  const double max = nice_axis_max(series, &step);
  return ChartScale(plot_area(bounds), rounds, max, step, kind);
}

PointsProgressionSimulator::PointsProgressionSimulator(std::vector<DriverSeries> series,
                                                       std::size_t round_count,
                                                       Rectangle bounds, ScaleKind kind,
                                                       bool show_photos)
  : series_(std::move(series)),
    rounds_(round_count),
    scale_(make_scale(series_, rounds_, bounds, kind)),
    show_photos_(show_photos) {
  pixels_.reserve(series_.size());
  for (const auto& s : series_) {
    std::vector<Vector2> px;
    px.reserve(s.cumulative_points.size());
    for (std::size_t k = 0; k < s.cumulative_points.size(); ++k) {
      px.push_back(scale_.at(k, s.cumulative_points[k]));
    }
    pixels_.push_back(std::move(px));
  }
  reset();
}

void PointsProgressionSimulator::reset() {
  progress_ = 0.0;
  // Tooltips off and thinner lines while markers move
  interaction_ = ChartInteraction{ false, kPlaybackLineWidth };
}

void PointsProgressionSimulator::advance(double progress) {
  progress_ = clamp01(progress);
  if (progress_ >= 1.0) {
    interaction_ = ChartInteraction{ true, kNormalLineWidth };
  }
}

Vector2 PointsProgressionSimulator::tip(std::size_t series_index) const {
  const auto& px = pixels_.at(series_index);
  if (px.empty()) return { scale_.plot().x, scale_.plot().y + scale_.plot().height };
  const double pos = progress_ * static_cast<double>(rounds_);
  std::size_t ri = static_cast<std::size_t>(std::floor(pos));
  if (ri >= rounds_ || ri + 1 >= px.size()) return px[std::min(rounds_, px.size() - 1)];
  const double frac = pos - static_cast<double>(ri);
  return lerp2(px[ri], px[ri + 1], static_cast<float>(frac));
}

void PointsProgressionSimulator::draw_guides_(DrawList& out) const {
  const Rectangle& p = scale_.plot();
  const double step = scale_.tick_step();
  for (double v = 0.0; v <= scale_.max_value() + 1e-9; v += step) {
    const float y = scale_.y(v);
    out.emplace_back(LineCmd{ {p.x, y}, {p.x + p.width, y}, 1.0f, kGrid });
    out.emplace_back(LabelCmd{ {p.x - 44.0f, y - 6.0f}, format_points(v), 12, kAxisLabel });
  }
  for (std::size_t k = 0; k <= rounds_; ++k) {
    const float x = scale_.x(static_cast<double>(k));
    out.emplace_back(LineCmd{ {x, p.y}, {x, p.y + p.height}, 1.0f, kGrid });
    const std::string cap = (k == 0) ? "0" : "R" + std::to_string(k);
    out.emplace_back(LabelCmd{ {x - 8.0f, p.y + p.height + 8.0f}, cap, 12, kAxisLabel });
  }
}

void PointsProgressionSimulator::draw_tooltip_(DrawList& out) const {
  if (!interaction_.tooltips_enabled || !hover_ || rounds_ == 0) return;
  const Rectangle& p = scale_.plot();
  const Vector2 h = *hover_;
  if (h.y < p.y || h.y > p.y + p.height) return;

  const double rel = (h.x - p.x) / p.width * static_cast<double>(rounds_);
  const long nearest = std::lround(rel);
  if (nearest < 0 || nearest > static_cast<long>(rounds_)) return;
  const std::size_t k = static_cast<std::size_t>(nearest);
  const float gx = scale_.x(static_cast<double>(k));
  if (std::fabs(gx - h.x) > 12.0f) return;

  out.emplace_back(LineCmd{ {gx, p.y}, {gx, p.y + p.height}, 1.5f, kHoverLine });
  const float tx = (gx + 170.0f < p.x + p.width) ? gx + 10.0f : gx - 170.0f;
  float ty = p.y + 4.0f;
  const std::string head = (k == 0) ? "Start" : "Round " + std::to_string(k);
  out.emplace_back(LabelCmd{ {tx, ty}, head, 14, kAxisLabel });
  for (const auto& s : series_) {
    ty += 16.0f;
    out.emplace_back(LabelCmd{ {tx, ty}, s.name + ": " + format_points(s.cumulative_points[k]),
                               13, s.color });
  }
}

DrawList PointsProgressionSimulator::compute_frame() const {
  DrawList out;
  if (empty()) return out;
  draw_guides_(out);

  const double pos = progress_ * static_cast<double>(rounds_);
  std::size_t ri = static_cast<std::size_t>(std::floor(pos));
  double frac = pos - static_cast<double>(ri);
  if (ri >= rounds_) { ri = rounds_; frac = 0.0; }

  for (std::size_t i = 0; i < series_.size(); ++i) {
    const auto& px = pixels_[i];
    const Color c = series_[i].color;
    for (std::size_t k = 0; k < ri && k + 1 < px.size(); ++k) {
      out.emplace_back(LineCmd{ px[k], px[k + 1], interaction_.line_width, c });
    }
    if (frac > 0.0 && ri + 1 < px.size()) {
      out.emplace_back(LineCmd{ px[ri], lerp2(px[ri], px[ri + 1], static_cast<float>(frac)),
                                interaction_.line_width, c });
    }
  }

  for (std::size_t i = 0; i < series_.size(); ++i) {
    out.emplace_back(AvatarCmd{ tip(i), kMarkerRadius, series_[i].avatar,
                                series_[i].color, show_photos_ });
  }

  draw_tooltip_(out);
  return out;
}

} // namespace podium
