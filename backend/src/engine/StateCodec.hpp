#pragma once

#include "engine/Calendar.hpp"
#include "engine/SlidingWindowBuffer.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fl::engine
{

// Version 1 is the flat layout (`hourly_volume`, `hourly_reset`, ...);
// version 2 nests each period as {volume, reset_at}.
inline constexpr int kLegacyStateVersion = 1;
inline constexpr int kStateVersion = 2;

struct PersistedPeriod
{
    double volume = 0.0;
    Timestamp reset_at = 0.0;
};

// Everything the engine needs to resume after a restart. Period volumes are
// the full totals at capture time and come back as baselines.
struct PersistedState
{
    std::array<PersistedPeriod, kPeriodCount> periods{};
    double hourly_max_flow = 0.0;
    std::optional<double> hourly_min_flow;
    std::vector<Sample> flow_samples;
    std::vector<Sample> hourly_consumption;
    std::vector<Sample> daily_consumption;
    std::vector<FlowRange> hourly_flow_stats;
    bool water_leak_detected = false;
    // False for documents written before lifetime kept a start instant.
    bool lifetime_reset_known = true;

    PersistedPeriod &period(Period p)
    {
        return periods[period_index(p)];
    }
    PersistedPeriod const &period(Period p) const
    {
        return periods[period_index(p)];
    }

    // Fresh-install state: zero volumes, every window starting at `now`.
    static PersistedState defaults(Timestamp now);
};

std::string encode_state(PersistedState const &state, bool pretty = false);

// Field-by-field decode of either layout. Missing or malformed fields take
// their defaults (timestamps fall back to `now`); only a payload that is not a
// JSON object yields nullopt.
std::optional<PersistedState> decode_state(std::string_view payload,
                                           Timestamp now);

} // namespace fl::engine
