#include "rapport/util/strings.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace rapport {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim_copy(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string format_fixed(double v, int precision) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(std::max(0, precision)) << v;
  return ss.str();
}

} // namespace rapport
