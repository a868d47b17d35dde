#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>

#include "rapport/core/time.h"

#define RAPPORT_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_time() {
  using rapport::Duration;
  using rapport::Timestamp;

  const Timestamp epoch = Timestamp::from_ymd_hms(1970, 1, 1);
  RAPPORT_ASSERT(epoch.seconds_since_epoch() == 0);
  RAPPORT_ASSERT(epoch.to_string() == "1970-01-01T00:00:00");

  const Timestamp t = Timestamp::parse_iso("2024-02-29T13:45:10");
  RAPPORT_ASSERT(t.to_string() == "2024-02-29T13:45:10");
  RAPPORT_ASSERT(Timestamp::parse_iso("2024-03-01") - Timestamp::parse_iso("2024-02-28") == Duration::days(2));
  RAPPORT_ASSERT(Timestamp::parse_iso("2024-03-01 06:00:00").to_string() == "2024-03-01T06:00:00");

  RAPPORT_ASSERT((t + Duration::hours(12)).to_string() == "2024-03-01T01:45:10");
  RAPPORT_ASSERT(t - Duration::days(1) < t);

  RAPPORT_ASSERT(Duration::weeks(1) == Duration::days(7));
  RAPPORT_ASSERT(Duration::days(3).as_hours() == 72);
  RAPPORT_ASSERT(Duration::hours(36).as_days() == 1);
  RAPPORT_ASSERT(Duration::hours(36).as_days_f64() == 1.5);
  RAPPORT_ASSERT((Duration::days(1) - Duration::days(2)).is_negative());
  RAPPORT_ASSERT(Duration::zero().is_zero());

  bool threw = false;
  try {
    (void)Timestamp::parse_iso("2024-13-01");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  RAPPORT_ASSERT(threw);

  // Days are checked against the length of their month.
  for (const char* bad : {"2024-02-30", "2024-02-31", "2023-02-29", "2100-02-29", "2024-04-31", "2024-11-31"}) {
    threw = false;
    try {
      (void)Timestamp::parse_iso(bad);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    RAPPORT_ASSERT(threw);
  }
  RAPPORT_ASSERT(Timestamp::parse_iso("2000-02-29").to_string() == "2000-02-29T00:00:00");
  RAPPORT_ASSERT(Timestamp::from_ymd_hms(2023, 12, 31).to_string() == "2023-12-31T00:00:00");

  threw = false;
  try {
    (void)Timestamp::parse_iso("yesterday");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  RAPPORT_ASSERT(threw);

  return 0;
}
