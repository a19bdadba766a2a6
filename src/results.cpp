#include <podium/results.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <raylib.h>
#include <podium/csv.hpp>
#include <podium/lap_time.hpp>

namespace podium {

static bool is_header_row(const std::vector<std::string>& cols, const char* first) {
  return !cols.empty() && csv::lower(cols[0]) == first;
}

// Sector text: seconds or MM:SS.mmm. "nan"/"inf" stay non-finite so the
// replay can drop the entrant; anything else unparsable rejects the row.
static std::optional<double> parse_sector(const std::string& s) {
  const std::string l = csv::lower(s);
  if (l == "nan" || l == "inf" || l == "-inf" || l.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return parse_lap_time(s);
}

static std::optional<RoundResult> parse_result_row(const std::vector<std::string>& cols) {
  if (cols.size() < 8) return std::nullopt;
  RoundResult r{};
  const auto season = csv::to_int(cols[0]);
  const auto round = csv::to_int(cols[1]);
  const auto s1 = parse_sector(cols[3]);
  const auto s2 = parse_sector(cols[4]);
  const auto s3 = parse_sector(cols[5]);
  const auto pos = csv::to_int(cols[6]);
  const auto pts = csv::to_double(cols[7]);
  if (!season || !round || !s1 || !s2 || !s3 || !pos || cols[2].empty()) return std::nullopt;
  r.season = *season;
  r.round = *round;
  r.driver = cols[2];
  r.sector1 = *s1;
  r.sector2 = *s2;
  r.sector3 = *s3;
  r.position = *pos;
  // Missing or malformed points count as zero, as on the league tables
  r.points = pts.value_or(0.0);
  return r;
}

std::vector<RoundResult> results_from_csv_stream(std::istream& in) {
  std::vector<RoundResult> out;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols, "season")) {
      header_consumed = true;
      continue;
    }
    if (auto row = parse_result_row(cols); row.has_value()) {
      out.push_back(*row);
    } else {
      TraceLog(LOG_WARNING, "PODIUM: results line %d skipped (malformed)", line_no);
    }
  }
  return out;
}

std::optional<std::vector<RoundResult>> load_results_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return results_from_csv_stream(f);
}

std::vector<DriverProfile> profiles_from_csv_stream(std::istream& in) {
  std::vector<DriverProfile> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols, "driver")) {
      header_consumed = true;
      continue;
    }
    if (cols.empty() || cols[0].empty()) continue;
    DriverProfile p{};
    p.driver = cols[0];
    if (cols.size() > 1) p.photo = cols[1];
    if (cols.size() > 2) p.number = csv::to_int(cols[2]).value_or(0);
    out.push_back(std::move(p));
  }
  return out;
}

std::optional<std::vector<DriverProfile>> load_profiles_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return profiles_from_csv_stream(f);
}

AvatarLookup avatars_from_profiles(const std::vector<DriverProfile>& profiles) {
  AvatarLookup out;
  for (std::size_t i = 0; i < profiles.size(); ++i) {
    const auto& p = profiles[i];
    Avatar a{};
    a.image_ref = p.photo;
    a.number = p.number > 0 ? p.number : static_cast<int>(i) + 1;
    out.emplace(p.driver, std::move(a));
  }
  return out;
}

std::vector<int> seasons_in(const std::vector<RoundResult>& results) {
  std::set<int> s;
  for (const auto& r : results) s.insert(r.season);
  return std::vector<int>(s.begin(), s.end());
}

std::vector<std::pair<int, int>> rounds_in(const std::vector<RoundResult>& results,
                                           std::optional<int> season) {
  std::set<std::pair<int, int>> s;
  for (const auto& r : results) {
    if (season && r.season != *season) continue;
    s.emplace(r.season, r.round);
  }
  return std::vector<std::pair<int, int>>(s.begin(), s.end());
}

std::optional<std::pair<int, int>> latest_round(const std::vector<RoundResult>& results,
                                                std::optional<int> season) {
  const auto rounds = rounds_in(results, season);
  if (rounds.empty()) return std::nullopt;
  return rounds.back();
}

std::vector<FinisherRecord> podium_for_round(const std::vector<RoundResult>& results,
                                             int season, int round,
                                             const AvatarLookup& avatars,
                                             std::size_t count) {
  std::vector<const RoundResult*> rows;
  for (const auto& r : results) {
    if (r.season == season && r.round == round) rows.push_back(&r);
  }
  std::stable_sort(rows.begin(), rows.end(), [](const RoundResult* a, const RoundResult* b) {
    return a->position < b->position;
  });
  if (rows.size() > count) rows.resize(count);

  std::vector<FinisherRecord> out;
  out.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& r = *rows[i];
    FinisherRecord f{};
    f.driver = r.driver;
    f.sector1 = r.sector1;
    f.sector2 = r.sector2;
    f.sector3 = r.sector3;
    f.position = r.position;
    if (auto it = avatars.find(r.driver); it != avatars.end()) f.avatar = it->second;
    else f.avatar.number = r.position;
    out.push_back(std::move(f));
  }
  return out;
}

std::vector<PointsRecord> points_records(const std::vector<RoundResult>& results,
                                         std::optional<int> season) {
  // Chronological index of each (season, round); 1-based
  std::map<std::pair<int, int>, int> index;
  int k = 0;
  for (const auto& sr : rounds_in(results, season)) index.emplace(sr, ++k);

  std::vector<PointsRecord> out;
  for (const auto& r : results) {
    if (season && r.season != *season) continue;
    PointsRecord p{};
    p.driver = r.driver;
    p.round = season ? r.round : index.at({r.season, r.round});
    p.points = r.points;
    out.push_back(std::move(p));
  }
  return out;
}

} // namespace podium
