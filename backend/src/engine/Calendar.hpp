#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace fl::engine
{

// Wall-clock instants are epoch seconds; fractional parts carry sub-second
// tick spacing.
using Timestamp = double;

enum class Period
{
    Hourly = 0,
    Daily,
    Weekly,
    Monthly,
    Yearly,
    Lifetime,
};

inline constexpr std::size_t kPeriodCount = 6;

inline constexpr std::array<Period, kPeriodCount> kAllPeriods = {
    Period::Hourly,  Period::Daily,  Period::Weekly,
    Period::Monthly, Period::Yearly, Period::Lifetime,
};

constexpr std::size_t period_index(Period period) noexcept
{
    return static_cast<std::size_t>(period);
}

char const *period_name(Period period) noexcept;

// Calendar boundary strategy for one period. `crossed` reports whether `now`
// lies in a later local calendar unit than `reset_at`; `next` returns the
// start of the unit following `now`.
struct BoundaryRule
{
    bool (*crossed)(Timestamp reset_at, Timestamp now);
    Timestamp (*next)(Timestamp now);
};

BoundaryRule boundary_rule(Period period) noexcept;

namespace calendar
{

Timestamp now_seconds();

// Local-calendar predicates. Hours compare real instants of the local hour
// start so a repeated hour during a DST fall-back still counts as a new hour.
bool is_new_hour(Timestamp reset_at, Timestamp now);
bool is_new_day(Timestamp reset_at, Timestamp now);
bool is_new_week(Timestamp reset_at, Timestamp now);
bool is_new_month(Timestamp reset_at, Timestamp now);
bool is_new_year(Timestamp reset_at, Timestamp now);

Timestamp start_of_hour(Timestamp ts);
Timestamp start_of_day(Timestamp ts);

Timestamp next_hour(Timestamp now);
Timestamp next_day(Timestamp now);
Timestamp next_week(Timestamp now);
Timestamp next_month(Timestamp now);
Timestamp next_year(Timestamp now);
// Target for accumulators that never reset (9999-12-31T00:00:00Z).
Timestamp lifetime_target(Timestamp now);

// Local time with its UTC offset, e.g. 2024-03-10T03:15:00.250000-07:00.
std::string format_iso8601(Timestamp ts);
// Accepts `YYYY-MM-DD`, `YYYY-MM-DD[T ]HH:MM[:SS[.ffffff]]` and an optional
// `Z` / `+HH:MM` / `+HHMM` suffix. Without a suffix the value is local time.
std::optional<Timestamp> parse_iso8601(std::string_view text);

} // namespace calendar

} // namespace fl::engine
