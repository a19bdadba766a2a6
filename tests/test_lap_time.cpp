#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>

#include <podium/lap_time.hpp>

using Catch::Approx;
using namespace podium;

TEST_CASE("Lap times format as MM:SS,mmm") {
  REQUIRE(format_lap_time(30.0) == "00:30,000");
  REQUIRE(format_lap_time(89.708) == "01:29,708");
  REQUIRE(format_lap_time(59.9996) == "01:00,000");
  REQUIRE(format_lap_time(0.0) == "00:00,000");
}

TEST_CASE("Invalid lap times format as a dash") {
  REQUIRE(format_lap_time(-1.0) == "--");
  REQUIRE(format_lap_time(std::numeric_limits<double>::quiet_NaN()) == "--");
  REQUIRE(format_lap_time(std::numeric_limits<double>::infinity()) == "--");
}

TEST_CASE("Lap times parse from both separators and plain seconds") {
  REQUIRE(*parse_lap_time("01:29,708") == Approx(89.708));
  REQUIRE(*parse_lap_time("01:29.708") == Approx(89.708));
  REQUIRE(*parse_lap_time("00:30") == Approx(30.0));
  REQUIRE(*parse_lap_time("29.5") == Approx(29.5));
  REQUIRE(*parse_lap_time("1:05,5") == Approx(65.5));
}

TEST_CASE("Malformed lap times are rejected") {
  REQUIRE_FALSE(parse_lap_time("").has_value());
  REQUIRE_FALSE(parse_lap_time("abc").has_value());
  REQUIRE_FALSE(parse_lap_time("01:75,000").has_value());
  REQUIRE_FALSE(parse_lap_time("01:-5,000").has_value());
  REQUIRE_FALSE(parse_lap_time("01:29,7x8").has_value());
  REQUIRE_FALSE(parse_lap_time("12.5s").has_value());
  REQUIRE_FALSE(parse_lap_time("inf").has_value());
}
