#include "tactical/time/time_utils.hpp"

#include <cstdio>
#include <ctime>

namespace tactical {

namespace {

// Floor division so timestamps before the epoch still map to the right day.
std::tm toUtc(std::int64_t ms) {
  std::int64_t seconds = ms / 1000;
  if (ms < 0 && ms % 1000 != 0) {
    --seconds;
  }
  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm out{};
  gmtime_r(&t, &out);
  return out;
}

}  // namespace

std::string utc_date_string(std::int64_t ms) {
  std::tm tm = toUtc(ms);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

int utc_hour(std::int64_t ms) { return toUtc(ms).tm_hour; }

int utc_weekday(std::int64_t ms) { return toUtc(ms).tm_wday; }

}  // namespace tactical
