#pragma once
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <podium/draw.hpp>
#include <podium/points_progression.hpp>
#include <podium/race_replay.hpp>

namespace podium {

// One row of a round's classification as published by the league.
struct RoundResult {
  int season = 0;
  int round = 0;
  std::string driver;
  double sector1 = 0.0;
  double sector2 = 0.0;
  double sector3 = 0.0;
  int position = 0;
  double points = 0.0;
};

struct DriverProfile {
  std::string driver;
  std::string photo; // file path, may be empty
  int number = 0;    // 0 = unset
};

using AvatarLookup = std::unordered_map<std::string, Avatar>;

// CSV: season,round,driver,sector1,sector2,sector3,position,points
// Optional header row; '#' comments and blank lines ignored; invalid rows skipped.
// Sector fields take seconds or MM:SS.mmm. Non-finite sectors are kept so the
// replay can exclude the entrant itself.
std::vector<RoundResult> results_from_csv_stream(std::istream& in);
std::optional<std::vector<RoundResult>> load_results_csv(const std::string& path);

// CSV: driver,photo,number
std::vector<DriverProfile> profiles_from_csv_stream(std::istream& in);
std::optional<std::vector<DriverProfile>> load_profiles_csv(const std::string& path);

// Number fallback = 1-based position in the profile list when unset.
AvatarLookup avatars_from_profiles(const std::vector<DriverProfile>& profiles);

// Sorted distinct seasons.
std::vector<int> seasons_in(const std::vector<RoundResult>& results);

// Last (season, round) in chronological order, optionally within one season.
std::optional<std::pair<int, int>> latest_round(const std::vector<RoundResult>& results,
                                                std::optional<int> season);

// Distinct (season, round) pairs in chronological order.
std::vector<std::pair<int, int>> rounds_in(const std::vector<RoundResult>& results,
                                           std::optional<int> season);

// Top `count` rows of one round ordered by position (stable on input order).
std::vector<FinisherRecord> podium_for_round(const std::vector<RoundResult>& results,
                                             int season, int round,
                                             const AvatarLookup& avatars,
                                             std::size_t count = 3);

// Points tuples. With no season filter, rounds are renumbered 1..K across
// seasons in chronological order.
std::vector<PointsRecord> points_records(const std::vector<RoundResult>& results,
                                         std::optional<int> season);

} // namespace podium
