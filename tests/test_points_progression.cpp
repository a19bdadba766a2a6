#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include <podium/points_progression.hpp>

using Catch::Approx;
using namespace podium;

static const Rectangle kBounds{ 0.0f, 0.0f, 640.0f, 360.0f };

static std::vector<PointsRecord> scenario_b() {
  return {
    {"X", 1, 25.0}, {"Y", 1, 10.0},
    {"X", 2, 18.0}, {"Y", 2, 0.0},
  };
}

static bool has_label(const DrawList& frame, const std::string& text) {
  for (const auto& cmd : frame) {
    if (const auto* l = std::get_if<LabelCmd>(&cmd); l && l->text == text) return true;
  }
  return false;
}

static std::vector<const AvatarCmd*> markers(const DrawList& frame) {
  std::vector<const AvatarCmd*> out;
  for (const auto& cmd : frame) {
    if (const auto* a = std::get_if<AvatarCmd>(&cmd)) out.push_back(a);
  }
  return out;
}

TEST_CASE("Cumulative series start at zero and accumulate per round") {
  const auto recs = scenario_b();
  const std::size_t rounds = round_count_of(recs);
  REQUIRE(rounds == 2);

  const auto series = build_series(recs, rounds);
  REQUIRE(series.size() == 2);
  REQUIRE(series[0].name == "X");
  REQUIRE(series[0].cumulative_points == std::vector<double>{0.0, 25.0, 43.0});
  REQUIRE(series[1].name == "Y");
  REQUIRE(series[1].cumulative_points == std::vector<double>{0.0, 10.0, 10.0});
}

TEST_CASE("Series stays flat after a driver's last scored round") {
  const std::vector<PointsRecord> recs{ {"X", 1, 25.0}, {"X", 2, 18.0}, {"Y", 1, 10.0} };
  const std::size_t rounds = round_count_of(recs);
  REQUIRE(rounds == 2);

  const auto series = build_series(recs, rounds);
  REQUIRE(series.size() == 2);
  REQUIRE(series[0].cumulative_points == std::vector<double>{0.0, 25.0, 43.0});
  REQUIRE(series[1].cumulative_points == std::vector<double>{0.0, 10.0, 10.0});

  PointsProgressionSimulator sim(series, rounds, kBounds, ScaleKind::Linear, false);
  sim.advance(1.0);
  REQUIRE(sim.tip(1).y == Approx(sim.scale().y(10.0)));
}

TEST_CASE("Driver who first scores late still starts from zero") {
  const std::vector<PointsRecord> recs{
    {"Early", 1, 25.0}, {"Early", 2, 18.0}, {"Early", 3, 15.0},
    {"Late", 3, 12.0},
  };
  const auto series = build_series(recs, round_count_of(recs));
  REQUIRE(series.size() == 2);
  REQUIRE(series[1].cumulative_points == std::vector<double>{0.0, 0.0, 0.0, 12.0});
}

TEST_CASE("Non-finite points are dropped, out-of-range rounds ignored") {
  const std::vector<PointsRecord> recs{
    {"A", 1, 10.0},
    {"A", 2, std::numeric_limits<double>::quiet_NaN()},
    {"B", 2, std::numeric_limits<double>::infinity()},
    {"A", 3, 5.0},
    {"A", 7, 99.0},
  };
  const auto series = build_series(recs, 3);
  REQUIRE(series.size() == 1);
  REQUIRE(series[0].cumulative_points == std::vector<double>{0.0, 10.0, 10.0, 15.0});
}

TEST_CASE("Avatars come from the lookup, else the series index") {
  std::unordered_map<std::string, Avatar> avatars{ {"Y", Avatar{"img/y.png", 44}} };
  const auto series = build_series(scenario_b(), 2, avatars);
  REQUIRE(series[0].avatar.image_ref.empty());
  REQUIRE(series[0].avatar.number == 1);
  REQUIRE(series[1].avatar.image_ref == "img/y.png");
  REQUIRE(series[1].avatar.number == 44);
}

TEST_CASE("Axis maximum rounds up to a tick step") {
  double step = 0.0;
  REQUIRE(nice_axis_max(build_series(scenario_b(), 2), &step) == Approx(50.0));
  REQUIRE(step == Approx(10.0));

  const std::vector<PointsRecord> big{ {"A", 1, 180.0}, {"A", 2, 203.0} };
  REQUIRE(nice_axis_max(build_series(big, 2), &step) == Approx(400.0));
  REQUIRE(step == Approx(100.0));

  REQUIRE(nice_axis_max({}) >= 1.0);
}

TEST_CASE("Square-root scale keeps zero and max at the plot edges") {
  const Rectangle plot{ 10.0f, 20.0f, 200.0f, 100.0f };
  ChartScale lin(plot, 4, 100.0, 20.0, ScaleKind::Linear);
  ChartScale sq(plot, 4, 100.0, 20.0, ScaleKind::Sqrt);

  REQUIRE(lin.x(0.0) == Approx(10.0f));
  REQUIRE(lin.x(4.0) == Approx(210.0f));
  REQUIRE(lin.y(0.0) == Approx(120.0f));
  REQUIRE(lin.y(100.0) == Approx(20.0f));
  REQUIRE(lin.y(25.0) == Approx(95.0f));
  REQUIRE(sq.y(25.0) == Approx(70.0f));
  REQUIRE(sq.y(0.0) == Approx(120.0f));
  REQUIRE(sq.y(100.0) == Approx(20.0f));
}

TEST_CASE("Markers interpolate in pixel space between rounds") {
  auto series = build_series(scenario_b(), 2);
  PointsProgressionSimulator sim(series, 2, kBounds, ScaleKind::Sqrt, false);

  sim.advance(0.75); // halfway between round 1 and round 2
  const auto& sc = sim.scale();
  const Vector2 a = sc.at(1, 25.0);
  const Vector2 b = sc.at(2, 43.0);
  const Vector2 t = sim.tip(0);
  REQUIRE(t.x == Approx(0.5f * (a.x + b.x)));
  REQUIRE(t.y == Approx(0.5f * (a.y + b.y)));
  // Value-space interpolation would land elsewhere on a non-linear scale
  REQUIRE(t.y != Approx(sc.y(34.0)));

  sim.advance(0.0);
  REQUIRE(sim.tip(1).x == Approx(sc.x(0.0)));
  REQUIRE(sim.tip(1).y == Approx(sc.y(0.0)));

  sim.advance(1.0);
  REQUIRE(sim.tip(0).y == Approx(sc.y(43.0)));
}

TEST_CASE("Partial segment follows completed segments") {
  PointsProgressionSimulator sim(build_series(scenario_b(), 2), 2, kBounds,
                                 ScaleKind::Linear, false);
  auto count_series_lines = [&](const DrawList& frame) {
    std::size_t n = 0;
    for (const auto& cmd : frame) {
      if (const auto* l = std::get_if<LineCmd>(&cmd);
          l && same_color(l->color, sim.series()[0].color)) ++n;
    }
    return n;
  };
  sim.advance(0.0);
  REQUIRE(count_series_lines(sim.compute_frame()) == 0);
  sim.advance(0.25);
  REQUIRE(count_series_lines(sim.compute_frame()) == 1);
  sim.advance(0.75);
  REQUIRE(count_series_lines(sim.compute_frame()) == 2);
  sim.advance(1.0);
  REQUIRE(count_series_lines(sim.compute_frame()) == 2);
}

TEST_CASE("Interaction is suppressed during playback and restored at the end") {
  PointsProgressionSimulator sim(build_series(scenario_b(), 2), 2, kBounds,
                                 ScaleKind::Linear, false);
  sim.reset();
  REQUIRE_FALSE(sim.interaction().tooltips_enabled);
  REQUIRE(sim.interaction().line_width == Approx(PointsProgressionSimulator::kPlaybackLineWidth));

  const float hx = sim.scale().x(1.0);
  const float hy = sim.scale().plot().y + 10.0f;
  sim.set_hover(Vector2{ hx, hy });

  sim.advance(0.6);
  REQUIRE_FALSE(sim.interaction().tooltips_enabled);
  REQUIRE_FALSE(has_label(sim.compute_frame(), "Round 1"));

  sim.advance(1.0);
  REQUIRE(sim.interaction().tooltips_enabled);
  REQUIRE(sim.interaction().line_width == Approx(PointsProgressionSimulator::kNormalLineWidth));
  const DrawList frame = sim.compute_frame();
  REQUIRE(has_label(frame, "Round 1"));
  REQUIRE(has_label(frame, "X: 25"));
  REQUIRE(has_label(frame, "Y: 10"));

  sim.reset();
  REQUIRE_FALSE(sim.interaction().tooltips_enabled);
}

TEST_CASE("Photo permission follows the show_photos flag") {
  std::unordered_map<std::string, Avatar> avatars{ {"X", Avatar{"img/x.png", 1}} };
  PointsProgressionSimulator off(build_series(scenario_b(), 2, avatars), 2, kBounds,
                                 ScaleKind::Linear, false);
  PointsProgressionSimulator on(build_series(scenario_b(), 2, avatars), 2, kBounds,
                                ScaleKind::Linear, true);
  off.advance(1.0);
  on.advance(1.0);

  const DrawList f_off = off.compute_frame();
  const DrawList f_on = on.compute_frame();
  const auto m_off = markers(f_off);
  const auto m_on = markers(f_on);
  REQUIRE(m_off.size() == 2);
  REQUIRE(m_on.size() == 2);
  for (const auto* m : m_off) REQUIRE_FALSE(m->allow_photo);
  for (const auto* m : m_on) REQUIRE(m->allow_photo);
  REQUIRE(m_on[0]->avatar.image_ref == "img/x.png");
  REQUIRE(m_on[0]->radius == Approx(PointsProgressionSimulator::kMarkerRadius));
}

TEST_CASE("Axis guides label every round") {
  PointsProgressionSimulator sim(build_series(scenario_b(), 2), 2, kBounds,
                                 ScaleKind::Linear, false);
  const DrawList frame = sim.compute_frame();
  REQUIRE(has_label(frame, "R1"));
  REQUIRE(has_label(frame, "R2"));
  REQUIRE(has_label(frame, "50"));
}

TEST_CASE("No rounds means nothing to draw") {
  PointsProgressionSimulator sim({}, 0, kBounds, ScaleKind::Linear, false);
  REQUIRE(sim.empty());
  REQUIRE(sim.compute_frame().empty());
}
