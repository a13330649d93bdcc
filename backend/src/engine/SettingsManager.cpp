#include "engine/SettingsManager.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace fl::engine
{

bool SettingsManager::valid_water_tariff(double value) noexcept
{
    return std::isfinite(value) && value >= 0.0 && value <= kMaxWaterTariff;
}

bool SettingsManager::valid_leak_threshold(double value) noexcept
{
    return std::isfinite(value) && value >= 0.0 && value <= kMaxLeakThreshold;
}

bool SettingsManager::valid_save_interval(int seconds) noexcept
{
    return seconds >= kMinSaveIntervalSeconds;
}

char const *SettingsManager::unit_system_name(UnitSystem unit) noexcept
{
    switch (unit)
    {
    case UnitSystem::Metric:
        return "metric";
    case UnitSystem::Us:
        return "us";
    }
    return "metric";
}

std::optional<UnitSystem>
SettingsManager::parse_unit_system(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (lowered == "metric")
    {
        return UnitSystem::Metric;
    }
    if (lowered == "us" || lowered == "imperial")
    {
        return UnitSystem::Us;
    }
    return std::nullopt;
}

AccountingSettings SettingsManager::accounting_settings(CoreSettings const &s)
{
    return AccountingSettings{s.water_tariff, s.leak_threshold, s.unit_system};
}

SettingsManager::ApplyResult
SettingsManager::apply_update(CoreSettings settings,
                              SettingsUpdate const &update)
{
    ApplyResult result{};
    auto &s = settings;

    if (update.water_tariff)
    {
        if (!valid_water_tariff(*update.water_tariff))
        {
            FL_LOG_WARN("rejecting water tariff {}; expected 0 to {}",
                        *update.water_tariff, kMaxWaterTariff);
            result.rejected.emplace_back("waterTariff");
        }
        else if (s.water_tariff != *update.water_tariff)
        {
            s.water_tariff = *update.water_tariff;
            result.accounting_changed = true;
            result.persist = true;
        }
    }
    if (update.leak_threshold)
    {
        if (!valid_leak_threshold(*update.leak_threshold))
        {
            FL_LOG_WARN("rejecting leak threshold {} L/min; expected 0 to {}",
                        *update.leak_threshold, kMaxLeakThreshold);
            result.rejected.emplace_back("leakThreshold");
        }
        else if (s.leak_threshold != *update.leak_threshold)
        {
            s.leak_threshold = *update.leak_threshold;
            result.accounting_changed = true;
            result.persist = true;
        }
    }
    if (update.unit_system && s.unit_system != *update.unit_system)
    {
        s.unit_system = *update.unit_system;
        result.accounting_changed = true;
        result.persist = true;
    }
    if (update.save_interval_seconds)
    {
        if (!valid_save_interval(*update.save_interval_seconds))
        {
            FL_LOG_WARN("rejecting save interval {}s; minimum is {}s",
                        *update.save_interval_seconds,
                        kMinSaveIntervalSeconds);
            result.rejected.emplace_back("saveIntervalSeconds");
        }
        else if (s.save_interval_seconds != *update.save_interval_seconds)
        {
            s.save_interval_seconds = *update.save_interval_seconds;
            result.save_interval_changed = true;
            result.persist = true;
        }
    }

    result.settings = std::move(settings);
    return result;
}

} // namespace fl::engine
