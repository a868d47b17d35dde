#include "rapport/core/time.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rapport {
namespace {

// Howard Hinnant's algorithms (public domain):
// https://howardhinnant.github.io/date_algorithms.html
// days_from_civil returns days since 1970-01-01.
constexpr std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

constexpr Civil civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp + (mp < 10 ? 3 : -9);
  return Civil{y + (m <= 2), m, d};
}

constexpr bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

constexpr int days_in_month(int y, int m) {
  constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap_year(y) ? 29 : kDays[m - 1];
}

int parse_field(const std::string& iso, std::size_t pos, std::size_t len) {
  for (std::size_t k = pos; k < pos + len; ++k) {
    if (!std::isdigit(static_cast<unsigned char>(iso[k]))) {
      throw std::runtime_error("Invalid timestamp, expected YYYY-MM-DD[THH:MM:SS]: " + iso);
    }
  }
  return std::stoi(iso.substr(pos, len));
}

} // namespace

Timestamp Timestamp::from_ymd_hms(int year, int month, int day, int hour, int minute, int second) {
  if (month < 1 || month > 12) throw std::runtime_error("month out of range");
  if (day < 1 || day > days_in_month(year, month)) throw std::runtime_error("day out of range");
  if (hour < 0 || hour > 23) throw std::runtime_error("hour out of range");
  if (minute < 0 || minute > 59) throw std::runtime_error("minute out of range");
  if (second < 0 || second > 59) throw std::runtime_error("second out of range");
  const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  return Timestamp(days * Duration::kSecondsPerDay + hour * Duration::kSecondsPerHour +
                   minute * Duration::kSecondsPerMinute + second);
}

Timestamp Timestamp::parse_iso(const std::string& iso) {
  const bool date_only = iso.size() == 10;
  const bool full = iso.size() == 19 && (iso[10] == 'T' || iso[10] == ' ') && iso[13] == ':' && iso[16] == ':';
  if ((!date_only && !full) || iso[4] != '-' || iso[7] != '-') {
    throw std::runtime_error("Invalid timestamp, expected YYYY-MM-DD[THH:MM:SS]: " + iso);
  }
  const int y = parse_field(iso, 0, 4);
  const int mo = parse_field(iso, 5, 2);
  const int d = parse_field(iso, 8, 2);
  if (date_only) return from_ymd_hms(y, mo, d);
  return from_ymd_hms(y, mo, d, parse_field(iso, 11, 2), parse_field(iso, 14, 2), parse_field(iso, 17, 2));
}

std::string Timestamp::to_string() const {
  std::int64_t days = seconds_ / Duration::kSecondsPerDay;
  std::int64_t rem = seconds_ % Duration::kSecondsPerDay;
  if (rem < 0) {
    rem += Duration::kSecondsPerDay;
    --days;
  }
  const Civil c = civil_from_days(days);
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << c.year << '-' << std::setw(2) << c.month << '-' << std::setw(2)
     << c.day << 'T' << std::setw(2) << rem / Duration::kSecondsPerHour << ':' << std::setw(2)
     << (rem % Duration::kSecondsPerHour) / Duration::kSecondsPerMinute << ':' << std::setw(2)
     << rem % Duration::kSecondsPerMinute;
  return ss.str();
}

} // namespace rapport
