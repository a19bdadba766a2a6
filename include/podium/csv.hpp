#pragma once
#include <optional>
#include <string>
#include <vector>

namespace podium::csv {

// Tiny CSV helpers shared by the loaders: no quoted fields, fields trimmed.
std::string trim(std::string s);
std::vector<std::string> split_line(const std::string& line);
std::optional<double> to_double(const std::string& s);
std::optional<int> to_int(const std::string& s);
std::string lower(std::string s);

} // namespace podium::csv
