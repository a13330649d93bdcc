#include "engine/StateCodec.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cmath>
#include <format>
#include <string>

namespace fl::engine
{

namespace
{

void add_finite(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
                double value)
{
    yyjson_mut_obj_add_real(doc, obj, key, std::isfinite(value) ? value : 0.0);
}

yyjson_mut_val *make_sample_array(yyjson_mut_doc *doc,
                                  std::vector<Sample> const &samples)
{
    auto *arr = yyjson_mut_arr(doc);
    for (auto const &sample : samples)
    {
        if (!std::isfinite(sample.timestamp) || !std::isfinite(sample.value))
        {
            continue;
        }
        auto *pair = yyjson_mut_arr(doc);
        yyjson_mut_arr_add_real(doc, pair, sample.timestamp);
        yyjson_mut_arr_add_real(doc, pair, sample.value);
        yyjson_mut_arr_add_val(arr, pair);
    }
    return arr;
}

yyjson_mut_val *make_range_array(yyjson_mut_doc *doc,
                                 std::vector<FlowRange> const &ranges)
{
    auto *arr = yyjson_mut_arr(doc);
    for (auto const &range : ranges)
    {
        if (!std::isfinite(range.timestamp) || !std::isfinite(range.max) ||
            !std::isfinite(range.min))
        {
            continue;
        }
        auto *triple = yyjson_mut_arr(doc);
        yyjson_mut_arr_add_real(doc, triple, range.timestamp);
        yyjson_mut_arr_add_real(doc, triple, range.max);
        yyjson_mut_arr_add_real(doc, triple, range.min);
        yyjson_mut_arr_add_val(arr, triple);
    }
    return arr;
}

Timestamp read_timestamp(yyjson_val *obj, char const *key, Timestamp now)
{
    auto text = json::get_string(obj, key);
    if (!text)
    {
        return now;
    }
    if (auto parsed = calendar::parse_iso8601(*text); parsed)
    {
        return *parsed;
    }
    FL_LOG_WARN("state field {} has unparseable timestamp '{}'; using now",
                key, *text);
    return now;
}

double read_volume(yyjson_val *obj, char const *key)
{
    auto value = json::get_number(obj, key);
    if (!value || !std::isfinite(*value) || *value < 0.0)
    {
        return 0.0;
    }
    return *value;
}

// Reads the leading `width` numbers of a JSON array. Returns false for
// anything shorter or non-numeric.
bool read_row(yyjson_val *row, std::size_t width, double *out)
{
    if (row == nullptr || !yyjson_is_arr(row) || yyjson_arr_size(row) < width)
    {
        return false;
    }
    for (std::size_t i = 0; i < width; ++i)
    {
        auto *item = yyjson_arr_get(row, i);
        if (item == nullptr || !yyjson_is_num(item))
        {
            return false;
        }
        out[i] = yyjson_get_num(item);
        if (!std::isfinite(out[i]))
        {
            return false;
        }
    }
    return true;
}

std::vector<Sample> read_samples(yyjson_val *root, char const *key)
{
    std::vector<Sample> samples;
    auto *arr = yyjson_obj_get(root, key);
    if (arr == nullptr || !yyjson_is_arr(arr))
    {
        return samples;
    }
    std::size_t skipped = 0;
    std::size_t idx = 0;
    std::size_t max = 0;
    yyjson_val *row = nullptr;
    samples.reserve(yyjson_arr_size(arr));
    yyjson_arr_foreach(arr, idx, max, row)
    {
        double values[2]{};
        if (!read_row(row, 2, values))
        {
            ++skipped;
            continue;
        }
        samples.push_back(Sample{values[0], values[1]});
    }
    if (skipped > 0)
    {
        FL_LOG_WARN("dropped {} malformed entries from {}", skipped, key);
    }
    return samples;
}

std::vector<FlowRange> read_ranges(yyjson_val *root, char const *key)
{
    std::vector<FlowRange> ranges;
    auto *arr = yyjson_obj_get(root, key);
    if (arr == nullptr || !yyjson_is_arr(arr))
    {
        return ranges;
    }
    std::size_t skipped = 0;
    std::size_t idx = 0;
    std::size_t max = 0;
    yyjson_val *row = nullptr;
    ranges.reserve(yyjson_arr_size(arr));
    yyjson_arr_foreach(arr, idx, max, row)
    {
        double values[3]{};
        if (!read_row(row, 3, values))
        {
            ++skipped;
            continue;
        }
        ranges.push_back(FlowRange{values[0], values[1], values[2]});
    }
    if (skipped > 0)
    {
        FL_LOG_WARN("dropped {} malformed entries from {}", skipped, key);
    }
    return ranges;
}

void decode_periods_v2(yyjson_val *root, PersistedState &state, Timestamp now)
{
    for (auto period : kAllPeriods)
    {
        auto &slot = state.period(period);
        auto *obj = yyjson_obj_get(root, period_name(period));
        if (obj == nullptr || !yyjson_is_obj(obj))
        {
            continue;
        }
        slot.volume = read_volume(obj, "volume");
        slot.reset_at = read_timestamp(obj, "reset_at", now);
        if (period == Period::Lifetime &&
            yyjson_is_null(yyjson_obj_get(obj, "reset_at")))
        {
            state.lifetime_reset_known = false;
        }
    }
}

void decode_periods_v1(yyjson_val *root, PersistedState &state, Timestamp now)
{
    for (auto period : kAllPeriods)
    {
        auto &slot = state.period(period);
        auto name = std::string(period_name(period));
        slot.volume = read_volume(root, (name + "_volume").c_str());
        // Lifetime never had a reset instant in this layout.
        if (period != Period::Lifetime)
        {
            slot.reset_at = read_timestamp(root, (name + "_reset").c_str(), now);
        }
    }
    state.lifetime_reset_known = false;
}

} // namespace

PersistedState PersistedState::defaults(Timestamp now)
{
    PersistedState state;
    for (auto &period : state.periods)
    {
        period.volume = 0.0;
        period.reset_at = now;
    }
    return state;
}

std::string encode_state(PersistedState const &state, bool pretty)
{
    json::MutableDocument document;
    auto *doc = document.doc();
    if (doc == nullptr)
    {
        return "{}";
    }
    auto *root = yyjson_mut_obj(doc);
    document.set_root(root);

    yyjson_mut_obj_add_int(doc, root, "version", kStateVersion);
    for (auto period : kAllPeriods)
    {
        auto const &slot = state.period(period);
        auto *obj = yyjson_mut_obj(doc);
        add_finite(doc, obj, "volume", slot.volume);
        if (period == Period::Lifetime && !state.lifetime_reset_known)
        {
            yyjson_mut_obj_add_null(doc, obj, "reset_at");
        }
        else
        {
            yyjson_mut_obj_add_strcpy(
                doc, obj, "reset_at",
                calendar::format_iso8601(slot.reset_at).c_str());
        }
        yyjson_mut_obj_add_val(doc, root, period_name(period), obj);
    }
    add_finite(doc, root, "hourly_max_flow", state.hourly_max_flow);
    if (state.hourly_min_flow && std::isfinite(*state.hourly_min_flow))
    {
        yyjson_mut_obj_add_real(doc, root, "hourly_min_flow",
                                *state.hourly_min_flow);
    }
    else
    {
        yyjson_mut_obj_add_null(doc, root, "hourly_min_flow");
    }
    yyjson_mut_obj_add_val(doc, root, "flow_samples",
                           make_sample_array(doc, state.flow_samples));
    yyjson_mut_obj_add_val(doc, root, "hourly_consumption",
                           make_sample_array(doc, state.hourly_consumption));
    yyjson_mut_obj_add_val(doc, root, "daily_consumption",
                           make_sample_array(doc, state.daily_consumption));
    yyjson_mut_obj_add_val(doc, root, "hourly_flow_stats",
                           make_range_array(doc, state.hourly_flow_stats));
    yyjson_mut_obj_add_bool(doc, root, "water_leak_detected",
                            state.water_leak_detected);
    return document.write("{}", pretty);
}

std::optional<PersistedState> decode_state(std::string_view payload,
                                           Timestamp now)
{
    auto document = json::Document::parse(payload);
    auto *root = document.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        FL_LOG_WARN("accounting state is not a JSON object; ignoring it");
        return std::nullopt;
    }

    auto state = PersistedState::defaults(now);
    auto version = json::get_int(root, "version");
    bool nested = version ? *version >= kStateVersion
                          : yyjson_is_obj(yyjson_obj_get(root, "hourly"));
    if (version && *version > kStateVersion)
    {
        FL_LOG_WARN("accounting state version {} is newer than {}; reading "
                    "known fields only",
                    *version, kStateVersion);
    }
    if (nested)
    {
        decode_periods_v2(root, state, now);
    }
    else
    {
        decode_periods_v1(root, state, now);
    }

    if (auto max_flow = json::get_number(root, "hourly_max_flow");
        max_flow && std::isfinite(*max_flow))
    {
        state.hourly_max_flow = *max_flow;
    }
    if (auto min_flow = json::get_number(root, "hourly_min_flow");
        min_flow && std::isfinite(*min_flow))
    {
        state.hourly_min_flow = *min_flow;
    }
    state.flow_samples = read_samples(root, "flow_samples");
    state.hourly_consumption = read_samples(root, "hourly_consumption");
    state.daily_consumption = read_samples(root, "daily_consumption");
    state.hourly_flow_stats = read_ranges(root, "hourly_flow_stats");
    state.water_leak_detected =
        json::get_bool(root, "water_leak_detected").value_or(false);
    return state;
}

} // namespace fl::engine
