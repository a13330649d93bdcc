#include "report/Serializer.hpp"

#include "engine/SettingsManager.hpp"
#include "utils/Json.hpp"

#include <cmath>
#include <cstdint>
#include <yyjson.h>

namespace fl::report
{

namespace
{

// Non-finite values have no JSON spelling; report them as null.
void add_real(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
              double value)
{
    if (std::isfinite(value))
    {
        yyjson_mut_obj_add_real(doc, obj, key, value);
    }
    else
    {
        yyjson_mut_obj_add_null(doc, obj, key);
    }
}

void add_timestamp(yyjson_mut_doc *doc, yyjson_mut_val *obj, char const *key,
                   engine::Timestamp ts)
{
    auto text = engine::calendar::format_iso8601(ts);
    yyjson_mut_obj_add_strncpy(doc, obj, key, text.data(), text.size());
}

void add_periods(yyjson_mut_doc *doc, yyjson_mut_val *root,
                 engine::AccountingSnapshot const &snapshot)
{
    auto *periods = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_val(doc, root, "periods", periods);
    for (auto period : engine::kAllPeriods)
    {
        auto const &entry = snapshot.period(period);
        auto *slot = yyjson_mut_obj(doc);
        add_real(doc, slot, "volume", entry.volume);
        add_real(doc, slot, "cost", entry.cost);
        if (!entry.reset_known)
        {
            yyjson_mut_obj_add_null(doc, slot, "reset_at");
        }
        else
        {
            add_timestamp(doc, slot, "reset_at", entry.reset_at);
        }
        yyjson_mut_obj_add_val(doc, periods, engine::period_name(period),
                               slot);
    }
}

void add_statistics(yyjson_mut_doc *doc, yyjson_mut_val *root,
                    engine::FlowStatistics const &stats)
{
    auto *obj = yyjson_mut_obj(doc);
    yyjson_mut_obj_add_val(doc, root, "statistics", obj);
    json::add_optional_number(doc, obj, "avg_flow_1h", stats.avg_flow_1h);
    json::add_optional_number(doc, obj, "peak_flow_24h", stats.peak_flow_24h);
    json::add_optional_number(doc, obj, "peak_flow_7d", stats.peak_flow_7d);
    json::add_optional_number(doc, obj, "min_flow_24h", stats.min_flow_24h);
    json::add_optional_number(doc, obj, "avg_hourly_24h",
                              stats.avg_hourly_24h);
    json::add_optional_number(doc, obj, "peak_hourly_24h",
                              stats.peak_hourly_24h);
    json::add_optional_number(doc, obj, "peak_hourly_7d",
                              stats.peak_hourly_7d);
    json::add_optional_number(doc, obj, "avg_daily_7d", stats.avg_daily_7d);
    json::add_optional_number(doc, obj, "avg_daily_30d", stats.avg_daily_30d);
    json::add_optional_number(doc, obj, "peak_daily_30d",
                              stats.peak_daily_30d);
}

} // namespace

std::string serialize_status(engine::AccountingSnapshot const &snapshot,
                             bool pretty)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);

    add_timestamp(native, root, "taken_at", snapshot.taken_at);
    yyjson_mut_obj_add_bool(native, root, "available", snapshot.available);
    add_real(native, root, "flow_rate", snapshot.flow_rate);
    add_real(native, root, "volume_delta", snapshot.volume_delta);
    add_timestamp(native, root, "volume_last_reset",
                  snapshot.volume_last_reset);

    add_periods(native, root, snapshot);
    add_statistics(native, root, snapshot.statistics);

    add_real(native, root, "hourly_max_flow", snapshot.hourly_max_flow);
    json::add_optional_number(native, root, "hourly_min_flow",
                              snapshot.hourly_min_flow);
    yyjson_mut_obj_add_bool(native, root, "water_leak_detected",
                            snapshot.water_leak_detected);

    auto *counts = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "buffers", counts);
    yyjson_mut_obj_add_uint(
        native, counts, "flow_samples",
        static_cast<std::uint64_t>(snapshot.counts.flow_samples));
    yyjson_mut_obj_add_uint(
        native, counts, "hourly_consumption",
        static_cast<std::uint64_t>(snapshot.counts.hourly_consumption));
    yyjson_mut_obj_add_uint(
        native, counts, "hourly_flow_stats",
        static_cast<std::uint64_t>(snapshot.counts.hourly_flow_stats));
    yyjson_mut_obj_add_uint(
        native, counts, "daily_consumption",
        static_cast<std::uint64_t>(snapshot.counts.daily_consumption));

    auto *settings = yyjson_mut_obj(native);
    yyjson_mut_obj_add_val(native, root, "settings", settings);
    add_real(native, settings, "waterTariff", snapshot.settings.water_tariff);
    add_real(native, settings, "leakThreshold",
             snapshot.settings.leak_threshold);
    yyjson_mut_obj_add_str(
        native, settings, "unitSystem",
        engine::SettingsManager::unit_system_name(
            snapshot.settings.unit_system));

    return doc.write("{}", pretty);
}

std::string serialize_leak_event(engine::LeakEvent const &event,
                                 engine::Timestamp at)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_str(native, root, "event",
                           engine::leak_event_name(event.kind));
    add_real(native, root, "min_flow", event.min_flow);
    add_real(native, root, "threshold", event.threshold);
    add_timestamp(native, root, "at", at);
    return doc.write();
}

} // namespace fl::report
