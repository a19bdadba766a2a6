#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <sstream>

#include <podium/results.hpp>

using Catch::Approx;
using namespace podium;

static std::vector<RoundResult> sample() {
  std::istringstream ss(
    "season,round,driver,sector1,sector2,sector3,position,points\n"
    "# season opener\n"
    "2024,1,NOR,29.3,31.1,29.7,2,18\n"
    "2024,1,VER,29.1,31.0,29.6,1,25\n"
    "2024,1,LEC,29.2,31.3,29.9,3,15\n"
    "2024,1,PIA,29.4,31.4,30.0,4,12\n"
    "\n"
    "2024,2,LEC,00:29.000,00:31.000,00:29.500,1,25\n"
    "2024,2,VER,nan,31.0,29.6,2,\n"
    "2024,2,NOR,29.5,31.2,29.9,3,15\n"
    "2023,5,HAM,30.0,32.0,30.0,1,25\n"
    "2024,3,broken row\n"
    "2024,x,NOR,29.5,31.2,29.9,3,15\n");
  return results_from_csv_stream(ss);
}

TEST_CASE("Results CSV skips headers, comments and malformed rows") {
  const auto rows = sample();
  REQUIRE(rows.size() == 8);
  REQUIRE(rows[0].driver == "NOR");
  REQUIRE(rows[0].sector1 == Approx(29.3));
  REQUIRE(rows[0].points == Approx(18.0));
  REQUIRE(rows[4].sector1 == Approx(29.0)); // MM:SS.mmm
}

TEST_CASE("Unparsable sectors stay non-finite and blank points count as zero") {
  const auto rows = sample();
  const auto& ver = rows[5];
  REQUIRE(ver.driver == "VER");
  REQUIRE(std::isnan(ver.sector1));
  REQUIRE(ver.points == 0.0);
}

TEST_CASE("Seasons and rounds come out in chronological order") {
  const auto rows = sample();
  REQUIRE(seasons_in(rows) == std::vector<int>{2023, 2024});
  const auto all = rounds_in(rows, std::nullopt);
  REQUIRE(all.size() == 3);
  REQUIRE(all.front() == std::make_pair(2023, 5));

  REQUIRE(latest_round(rows, std::nullopt) == std::make_pair(2024, 2));
  REQUIRE(latest_round(rows, 2023) == std::make_pair(2023, 5));
  REQUIRE_FALSE(latest_round(rows, 2019).has_value());
}

TEST_CASE("Podium takes the top three by position") {
  const auto rows = sample();
  AvatarLookup avatars{ {"VER", Avatar{"img/ver.png", 1}} };
  const auto podium = podium_for_round(rows, 2024, 1, avatars);
  REQUIRE(podium.size() == 3);
  REQUIRE(podium[0].driver == "VER");
  REQUIRE(podium[1].driver == "NOR");
  REQUIRE(podium[2].driver == "LEC");
  REQUIRE(podium[0].avatar.image_ref == "img/ver.png");
  REQUIRE(podium[1].avatar.image_ref.empty());
  REQUIRE(podium[1].avatar.number == 2);

  REQUIRE(podium_for_round(rows, 2024, 9, avatars).empty());
}

TEST_CASE("Points records renumber rounds across seasons") {
  const auto rows = sample();

  const auto season = points_records(rows, 2024);
  REQUIRE(season.size() == 7);
  REQUIRE(season[4].round == 2);

  const auto all = points_records(rows, std::nullopt);
  REQUIRE(all.size() == 8);
  REQUIRE(all[0].round == 2);  // 2024 round 1 follows 2023 round 5
  REQUIRE(all[4].round == 3);
  REQUIRE(all[7].driver == "HAM");
  REQUIRE(all[7].round == 1);
}

TEST_CASE("Profiles give avatars with a number fallback") {
  std::istringstream ss(
    "driver,photo,number\n"
    "VER,img/ver.png,1\n"
    "NOR,,4\n"
    "LEC,img/lec.png\n");
  const auto profiles = profiles_from_csv_stream(ss);
  REQUIRE(profiles.size() == 3);
  const auto avatars = avatars_from_profiles(profiles);
  REQUIRE(avatars.at("VER").image_ref == "img/ver.png");
  REQUIRE(avatars.at("NOR").image_ref.empty());
  REQUIRE(avatars.at("NOR").number == 4);
  REQUIRE(avatars.at("LEC").number == 3);
}

TEST_CASE("Missing files are reported as nullopt") {
  REQUIRE_FALSE(load_results_csv("/nonexistent/results.csv").has_value());
  REQUIRE_FALSE(load_profiles_csv("/nonexistent/profiles.csv").has_value());
}
