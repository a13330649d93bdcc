#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fl::engine
{

class SettingsManager
{
  public:
    struct ApplyResult
    {
        CoreSettings settings;
        bool accounting_changed = false;
        bool save_interval_changed = false;
        bool persist = false;
        // Keys of the values that were out of range and left unchanged.
        std::vector<std::string> rejected;
    };

    static bool valid_water_tariff(double value) noexcept;
    static bool valid_leak_threshold(double value) noexcept;
    static bool valid_save_interval(int seconds) noexcept;

    static char const *unit_system_name(UnitSystem unit) noexcept;
    static std::optional<UnitSystem> parse_unit_system(std::string_view text);

    static AccountingSettings accounting_settings(CoreSettings const &s);

    // Apply an incremental SettingsUpdate, rejecting out-of-range values.
    static ApplyResult apply_update(CoreSettings settings,
                                    SettingsUpdate const &update);
};

} // namespace fl::engine
