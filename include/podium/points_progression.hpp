#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <raylib.h>
#include <podium/draw.hpp>
#include <podium/scene.hpp>

namespace podium {

struct PointsRecord {
  std::string driver;
  int round = 0;       // 1-based
  double points = 0.0; // scored in that round
};

struct DriverSeries {
  std::string name;
  std::vector<double> cumulative_points; // size = round_count + 1, [0] == 0
  Color color{};
  Avatar avatar;
};

// Highest round number among the records (0 when empty).
std::size_t round_count_of(const std::vector<PointsRecord>& records);

// One series per driver in first-appearance order. Records with non-finite
// points or a round outside [1, round_count] are dropped. Drivers missing from
// `avatars` get their 1-based series index as badge number.
std::vector<DriverSeries> build_series(const std::vector<PointsRecord>& records,
                                       std::size_t round_count,
                                       const std::unordered_map<std::string, Avatar>& avatars = {});

enum class ScaleKind { Linear, Sqrt };

// Maps (round, cumulative value) to chart pixels. Vertical range is [0, max].
class ChartScale {
public:
  ChartScale(Rectangle plot, std::size_t round_count, double max_value, double tick_step,
             ScaleKind kind);

  float x(double round) const;
  float y(double value) const;
  Vector2 at(std::size_t round, double value) const { return { x(static_cast<double>(round)), y(value) }; }

  const Rectangle& plot() const { return plot_; }
  double max_value() const { return max_; }
  double tick_step() const { return step_; }
  std::size_t round_count() const { return rounds_; }

private:
  Rectangle plot_;
  std::size_t rounds_;
  double max_;
  double step_;
  ScaleKind kind_;
};

// Largest finite final cumulative value, rounded up to a nice tick (>= 1).
double nice_axis_max(const std::vector<DriverSeries>& series, double* step_out = nullptr);

struct ChartInteraction {
  bool tooltips_enabled = true;
  float line_width = 3.0f;
};

class PointsProgressionSimulator : public ReplayScene {
public:
  static constexpr float kNormalLineWidth = 3.0f;
  static constexpr float kPlaybackLineWidth = 2.0f;
  static constexpr float kMarkerRadius = 13.0f;

  PointsProgressionSimulator(std::vector<DriverSeries> series, std::size_t round_count,
                             Rectangle bounds, ScaleKind kind, bool show_photos);

  bool empty() const override { return series_.empty() || rounds_ == 0; }
  void reset() override;
  void advance(double progress) override;
  DrawList compute_frame() const override;

  // Tooltip anchor in surface-local pixels; ignored while playback runs.
  void set_hover(std::optional<Vector2> pos) { hover_ = pos; }

  const std::vector<DriverSeries>& series() const { return series_; }
  const ChartScale& scale() const { return scale_; }
  const ChartInteraction& interaction() const { return interaction_; }
  double progress() const { return progress_; }

  // Interpolated marker position of one series at the current progress.
  Vector2 tip(std::size_t series_index) const;

private:
  void draw_guides_(DrawList& out) const;
  void draw_tooltip_(DrawList& out) const;

  std::vector<DriverSeries> series_;
  std::size_t rounds_;
  ChartScale scale_;
  bool show_photos_;
  std::vector<std::vector<Vector2>> pixels_; // precomputed per series, per round
  ChartInteraction interaction_{};
  std::optional<Vector2> hover_;
  double progress_{1.0};
};

} // namespace podium
