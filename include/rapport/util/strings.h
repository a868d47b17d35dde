#pragma once

#include <string>

namespace rapport {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Fixed-precision formatting used by CLI output and debug logging.
std::string format_fixed(double v, int precision = 3);

} // namespace rapport
