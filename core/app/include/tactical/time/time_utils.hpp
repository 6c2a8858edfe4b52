#pragma once

#include <cstdint>
#include <string>

namespace tactical {

// -----------------------------------------------------------------------------
// UTC calendar helpers
// -----------------------------------------------------------------------------
//
// @brief  Free functions that derive calendar facts from epoch milliseconds
//         as reported by ITimeProvider::now_ms().
//
// @details
// The circuit breaker resets on the first evaluation of a new UTC calendar
// day, and the quality gate applies session/weekend penalties. Both must
// follow the injected clock (simulation or live), never the wall clock, so
// these helpers take the timestamp explicitly.
//
// Thread-safety: Stateless, uses gmtime_r. Safe to call from any thread.
// -----------------------------------------------------------------------------

/// "YYYY-MM-DD" for the UTC day containing ms.
std::string utc_date_string(std::int64_t ms);

/// Hour of day 0-23 (UTC).
int utc_hour(std::int64_t ms);

/// Day of week 0-6 with 0 = Sunday (UTC).
int utc_weekday(std::int64_t ms);

}  // namespace tactical
