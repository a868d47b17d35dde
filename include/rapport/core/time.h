#pragma once

#include <cstdint>
#include <string>

namespace rapport {

// Signed span of simulated time with one-second resolution.
class Duration {
 public:
  static constexpr std::int64_t kSecondsPerMinute = 60;
  static constexpr std::int64_t kSecondsPerHour = 3600;
  static constexpr std::int64_t kSecondsPerDay = 86400;
  static constexpr std::int64_t kSecondsPerWeek = 7 * kSecondsPerDay;
  static constexpr std::int64_t kSecondsPerYear = 365 * kSecondsPerDay;

  constexpr Duration() = default;

  static constexpr Duration zero() { return Duration(0); }
  static constexpr Duration seconds(std::int64_t s) { return Duration(s); }
  static constexpr Duration minutes(std::int64_t m) { return Duration(m * kSecondsPerMinute); }
  static constexpr Duration hours(std::int64_t h) { return Duration(h * kSecondsPerHour); }
  static constexpr Duration days(std::int64_t d) { return Duration(d * kSecondsPerDay); }
  static constexpr Duration weeks(std::int64_t w) { return Duration(w * kSecondsPerWeek); }
  static constexpr Duration years(std::int64_t y) { return Duration(y * kSecondsPerYear); }

  constexpr std::int64_t as_seconds() const { return seconds_; }
  constexpr std::int64_t as_hours() const { return seconds_ / kSecondsPerHour; }
  constexpr std::int64_t as_days() const { return seconds_ / kSecondsPerDay; }
  double as_days_f64() const { return static_cast<double>(seconds_) / static_cast<double>(kSecondsPerDay); }

  constexpr bool is_zero() const { return seconds_ == 0; }
  constexpr bool is_negative() const { return seconds_ < 0; }

  constexpr Duration operator+(Duration o) const { return Duration(seconds_ + o.seconds_); }
  constexpr Duration operator-(Duration o) const { return Duration(seconds_ - o.seconds_); }
  constexpr Duration operator*(std::int64_t k) const { return Duration(seconds_ * k); }

  constexpr bool operator==(Duration o) const { return seconds_ == o.seconds_; }
  constexpr bool operator!=(Duration o) const { return seconds_ != o.seconds_; }
  constexpr bool operator<(Duration o) const { return seconds_ < o.seconds_; }
  constexpr bool operator<=(Duration o) const { return seconds_ <= o.seconds_; }
  constexpr bool operator>(Duration o) const { return seconds_ > o.seconds_; }
  constexpr bool operator>=(Duration o) const { return seconds_ >= o.seconds_; }

 private:
  constexpr explicit Duration(std::int64_t s) : seconds_(s) {}

  std::int64_t seconds_{0};
};

// Seconds since 1970-01-01T00:00:00 in simulated time. No time zones, no leap seconds.
class Timestamp {
 public:
  static Timestamp from_ymd_hms(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

  // Accepts "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS". Throws std::runtime_error on malformed input.
  static Timestamp parse_iso(const std::string& iso);

  constexpr Timestamp() = default;
  constexpr explicit Timestamp(std::int64_t seconds_since_epoch) : seconds_(seconds_since_epoch) {}

  constexpr std::int64_t seconds_since_epoch() const { return seconds_; }

  Timestamp operator+(Duration d) const { return Timestamp(seconds_ + d.as_seconds()); }
  Timestamp operator-(Duration d) const { return Timestamp(seconds_ - d.as_seconds()); }
  Duration operator-(Timestamp o) const { return Duration::seconds(seconds_ - o.seconds_); }

  constexpr bool operator==(Timestamp o) const { return seconds_ == o.seconds_; }
  constexpr bool operator!=(Timestamp o) const { return seconds_ != o.seconds_; }
  constexpr bool operator<(Timestamp o) const { return seconds_ < o.seconds_; }
  constexpr bool operator<=(Timestamp o) const { return seconds_ <= o.seconds_; }
  constexpr bool operator>(Timestamp o) const { return seconds_ > o.seconds_; }
  constexpr bool operator>=(Timestamp o) const { return seconds_ >= o.seconds_; }

  // "YYYY-MM-DDTHH:MM:SS"
  std::string to_string() const;

 private:
  std::int64_t seconds_{0};
};

} // namespace rapport
