#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include <podium/playback.hpp>
#include <podium/race_replay.hpp>

using Catch::Approx;
using namespace podium;

static std::vector<FinisherRecord> records(std::initializer_list<FinisherRecord> rs) {
  return std::vector<FinisherRecord>(rs);
}

static RaceReplaySimulator make_sim(const std::vector<FinisherRecord>& rs, double lane_step = 0.08) {
  auto set = build_finishers(rs);
  const auto layout = RaceLayout::for_surface(900.0f, 300.0f, set.size());
  return RaceReplaySimulator(std::move(set), layout, lane_step);
}

// Plays the replay the way the scheduler would: raw steps through the easing.
static void play(RaceReplaySimulator& sim, int steps) {
  for (int i = 0; i <= steps; ++i) {
    sim.advance(race_adjusted_progress(static_cast<double>(i) / steps));
  }
}

TEST_CASE("build_finishers sums sectors and drops non-finite entrants") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto set = build_finishers(records({
    {"A", 30.1, 31.2, 29.3, 1},
    {"B", nan, 30.0, 30.0, 2},
    {"C", 30.0, 31.0, std::numeric_limits<double>::infinity(), 3},
    {"D", 30.5, 31.0, 29.0, 4},
  }));
  REQUIRE(set.size() == 2);
  REQUIRE(set[0].name == "A");
  REQUIRE(set[0].total_time == set[0].sector1 + set[0].sector2 + set[0].sector3);
  REQUIRE(set[1].name == "D");
  REQUIRE(set[1].input_index == 1);
  REQUIRE(same_color(set[0].color, palette_color(0)));
  REQUIRE(same_color(set[1].color, palette_color(1)));
}

TEST_CASE("build_finishers marks purple sectors against the set") {
  auto set = build_finishers(records({
    {"A", 10.0, 10.0, 10.0, 1},
    {"B",  9.0, 10.0, 11.0, 2},
    {"C", 11.0,  9.0, 10.0, 3},
  }));
  REQUIRE(set[0].purple_sectors == 1); // S3 shared with C
  REQUIRE(set[1].purple_sectors == 1); // S1
  REQUIRE(set[2].purple_sectors == 2); // S2, S3
}

TEST_CASE("Scenario: equal totals finish in input order with carpets 1,2,3") {
  auto sim = make_sim(records({
    {"A", 10.0, 10.0, 10.0, 1},
    {"B",  9.0, 10.0, 11.0, 2},
    {"C", 11.0,  9.0, 10.0, 3},
  }));

  sim.advance(0.5);
  REQUIRE(sim.finish_order().empty());

  sim.advance(1.0);
  REQUIRE(sim.finish_order() == std::vector<std::size_t>{0, 1, 2});

  const DrawList frame = sim.compute_frame();
  std::vector<int> ordinals;
  std::vector<std::string> captions;
  for (const auto& cmd : frame) {
    if (const auto* c = std::get_if<CarpetCmd>(&cmd)) {
      ordinals.push_back(c->ordinal);
      captions.push_back(c->caption);
    }
  }
  REQUIRE(ordinals == std::vector<int>{1, 2, 3});
  REQUIRE(captions[0] == "00:30,000");
}

TEST_CASE("Display finish order follows ascending total time") {
  auto sim = make_sim(records({
    {"A", 10.0, 10.0, 12.0, 1}, // 32
    {"B", 12.0, 12.0,  5.0, 2}, // 29
    {"C",  9.0, 13.0,  9.0, 3}, // 31
  }));
  play(sim, 240);
  REQUIRE(sim.finish_order() == std::vector<std::size_t>{1, 2, 0});
}

TEST_CASE("Single entrant finishes exactly at the end") {
  auto sim = make_sim(records({{"Solo", 20.0, 21.0, 22.0, 1}}));
  sim.advance(0.99);
  REQUIRE(sim.finish_order().empty());
  sim.advance(1.0);
  REQUIRE(sim.finish_order() == std::vector<std::size_t>{0});
}

TEST_CASE("A faster entrant never finishes after a slower one") {
  auto set = build_finishers(records({
    {"Slow", 11.0, 11.0, 11.0, 3}, // 33
    {"Fast", 10.0, 10.0, 10.0, 1}, // 30
  }));
  const auto red = reduce_race(set);
  for (int i = 0; i <= 1000; ++i) {
    const double p = static_cast<double>(i) / 1000.0;
    const double slow = display_progress(set[0], red, p);
    const double fast = display_progress(set[1], red, p);
    REQUIRE(fast >= slow);
    if (slow >= 1.0) REQUIRE(fast >= 1.0);
  }
}

TEST_CASE("Entrants arriving in the same frame are recorded fastest first") {
  auto sim = make_sim(records({
    {"Slow", 11.0, 11.0, 11.0, 2}, // 33
    {"Fast", 10.0, 10.0, 10.0, 1}, // 30
  }));
  sim.advance(0.0);
  sim.advance(1.0); // one jump: both cross in the same frame
  REQUIRE(sim.finish_order() == std::vector<std::size_t>{1, 0});
}

TEST_CASE("Ranking score switches phase with the leader's elapsed time") {
  auto set = build_finishers(records({
    {"A", 10.0, 10.0, 12.0, 1}, // s1 10, s1s2 20, total 32
    {"B", 12.0, 12.0,  5.0, 2}, // s1 12, s1s2 24, total 29
    {"C",  9.0, 13.0,  9.0, 3}, // s1  9, s1s2 22, total 31
  }));
  const auto red = reduce_race(set);
  REQUIRE(red.fastest == Approx(29.0));
  REQUIRE(red.fastest_s1 == Approx(9.0));
  REQUIRE(red.fastest_s1s2 == Approx(20.0));

  // elapsed = p * 29: < 9 ranks on S1, < 20 on S1+S2, then on total
  REQUIRE(ranking_score(set[0], red, 0.1) == Approx(10.0));
  REQUIRE(ranking_score(set[0], red, 0.5) == Approx(20.0));
  REQUIRE(ranking_score(set[0], red, 0.9) == Approx(32.0));

  REQUIRE(target_lanes(set, 0.1) == std::vector<int>{1, 2, 0});
  REQUIRE(target_lanes(set, 0.5) == std::vector<int>{0, 2, 1});
  REQUIRE(target_lanes(set, 1.0) == std::vector<int>{2, 0, 1});
}

TEST_CASE("Final lane order equals classification, ties by input order") {
  auto set = build_finishers(records({
    {"A", 12.0, 9.0, 9.0, 1},  // 30
    {"B", 8.0, 12.0, 10.0, 2}, // 30
    {"C", 9.0, 9.0, 11.0, 3},  // 29
  }));
  REQUIRE(target_lanes(set, 1.0) == std::vector<int>{1, 2, 0});
}

TEST_CASE("Lane position moves by a bounded step and never snaps") {
  const double step = 0.05;
  auto sim = make_sim(records({
    {"A", 10.0, 10.0, 12.0, 1},
    {"B", 12.0, 12.0,  5.0, 2},
    {"C",  9.0, 13.0,  9.0, 3},
  }), step);

  for (const auto& e : sim.entrants()) REQUIRE(e.lane_position == Approx(sim.neutral_lane()));

  std::vector<double> prev;
  for (const auto& e : sim.entrants()) prev.push_back(e.lane_position);
  for (int i = 0; i <= 100; ++i) {
    sim.advance(static_cast<double>(i) / 100.0);
    for (std::size_t k = 0; k < prev.size(); ++k) {
      const double lp = sim.entrants()[k].lane_position;
      REQUIRE(std::fabs(lp - prev[k]) <= step + 1e-12);
      prev[k] = lp;
    }
  }
  // Frames at progress 1 carry the lanes the rest of the way
  int extra = 0;
  while (!sim.settled() && extra < 100) {
    sim.advance(1.0);
    ++extra;
  }
  REQUIRE(sim.settled());
  REQUIRE(extra <= 40); // two lanes at 0.05 per frame
  REQUIRE(sim.entrants()[1].lane_position == Approx(0.0));
  REQUIRE(sim.entrants()[2].lane_position == Approx(1.0));
  REQUIRE(sim.entrants()[0].lane_position == Approx(2.0));
}

TEST_CASE("Reset clears finish state and recentres lanes") {
  auto sim = make_sim(records({
    {"A", 10.0, 10.0, 10.0, 1},
    {"B", 11.0, 11.0, 11.0, 2},
  }));
  play(sim, 60);
  REQUIRE(sim.finish_order().size() == 2);

  sim.reset();
  REQUIRE(sim.finish_order().empty());
  for (const auto& e : sim.entrants()) {
    REQUIRE_FALSE(e.finished);
    REQUIRE(e.finish_seq == -1);
    REQUIRE(e.lane_position == Approx(0.5));
  }
}

TEST_CASE("Car x is clamped at the finish boundary") {
  auto sim = make_sim(records({
    {"Fast", 10.0, 10.0, 10.0, 1},
    {"Slow", 20.0, 20.0, 20.0, 2},
  }));
  sim.advance(0.75);
  const DrawList frame = sim.compute_frame();
  const TrackCmd* track = nullptr;
  std::vector<const CarCmd*> cars;
  for (const auto& cmd : frame) {
    if (const auto* t = std::get_if<TrackCmd>(&cmd)) track = t;
    if (const auto* c = std::get_if<CarCmd>(&cmd)) cars.push_back(c);
  }
  REQUIRE(track != nullptr);
  REQUIRE(cars.size() == 2);
  REQUIRE(cars[0]->pos.x == Approx(track->finish_x));
  REQUIRE(cars[1]->pos.x < track->finish_x);
}

TEST_CASE("Frame draws track, glow lanes, cars, then carpets") {
  auto sim = make_sim(records({
    {"A", 10.0, 10.0, 10.0, 1},
    {"B", 11.0, 11.0, 11.0, 2},
  }));
  sim.advance(0.95); // A finished, B still running
  const DrawList frame = sim.compute_frame();
  REQUIRE(frame.size() == 5);
  REQUIRE(std::holds_alternative<TrackCmd>(frame[0]));
  REQUIRE(std::holds_alternative<GlowLaneCmd>(frame[1]));
  REQUIRE(std::holds_alternative<CarCmd>(frame[2]));
  REQUIRE(std::holds_alternative<CarCmd>(frame[3]));
  REQUIRE(std::holds_alternative<CarpetCmd>(frame[4]));
}

TEST_CASE("Zero-total entrants stay out of the shared scales") {
  auto set = build_finishers(records({
    {"Ghost", 0.0, 0.0, 0.0, 3},
    {"A", 10.0, 10.0, 10.0, 1},
    {"B", 12.0, 12.0, 12.0, 2},
  }));
  REQUIRE(set.size() == 3);
  const auto red = reduce_race(set);
  REQUIRE(red.valid);
  REQUIRE(red.fastest == Approx(30.0));
  REQUIRE(red.slowest == Approx(36.0));
  REQUIRE(red.fastest_s1 == Approx(10.0));
  REQUIRE(display_progress(set[0], red, 0.0) == 0.0);
  REQUIRE(display_progress(set[0], red, 0.1) == 1.0);
}

TEST_CASE("Empty set renders nothing") {
  auto sim = make_sim({});
  REQUIRE(sim.empty());
  sim.advance(0.5);
  REQUIRE(sim.compute_frame().empty());
}

TEST_CASE("A ranking change on the last frame leaves the lanes unsettled") {
  auto sim = make_sim(records({
    {"A", 10.0, 85.0,  5.0, 1}, // 100, slow middle sector
    {"B", 10.0, 80.0, 12.0, 2}, // 102
  }));
  play(sim, 360);
  // Ahead on S1+S2 until the leader's elapsed time passes 90 s
  REQUIRE(sim.entrants()[0].target_lane == 0);
  REQUIRE(sim.entrants()[1].target_lane == 1);
  REQUIRE_FALSE(sim.settled());

  while (!sim.settled()) sim.advance(1.0);
  REQUIRE(sim.entrants()[0].lane_position == 0.0);
  REQUIRE(sim.entrants()[1].lane_position == 1.0);
}
