#include "engine/PersistenceManager.hpp"
#include "engine/SettingsManager.hpp"

#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <format>
#include <string>
#include <system_error>

namespace fl::engine
{

namespace
{

template <typename T>
std::optional<T> parse_number(std::string const &text)
{
    T value{};
    auto const *begin = text.data();
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

PersistenceManager::PersistenceManager(std::filesystem::path path)
    : database_(std::make_shared<storage::Database>(std::move(path)))
{
}

PersistenceManager::~PersistenceManager() = default;

bool PersistenceManager::is_valid() const noexcept
{
    return database_ != nullptr && database_->is_valid();
}

std::optional<double>
PersistenceManager::read_double_setting(char const *key) const
{
    auto value = database_->get_setting(key);
    if (!value)
    {
        return std::nullopt;
    }
    auto parsed = parse_number<double>(*value);
    if (!parsed)
    {
        FL_LOG_WARN("stored setting {}='{}' is not a number", key, *value);
    }
    return parsed;
}

CoreSettings PersistenceManager::load_settings(CoreSettings defaults) const
{
    if (!is_valid())
    {
        return defaults;
    }
    auto &s = defaults;
    if (auto tariff = read_double_setting("waterTariff"); tariff)
    {
        if (SettingsManager::valid_water_tariff(*tariff))
            s.water_tariff = *tariff;
        else
            FL_LOG_WARN("stored water tariff {} is out of range", *tariff);
    }
    if (auto threshold = read_double_setting("leakThreshold"); threshold)
    {
        if (SettingsManager::valid_leak_threshold(*threshold))
            s.leak_threshold = *threshold;
        else
            FL_LOG_WARN("stored leak threshold {} is out of range", *threshold);
    }
    if (auto unit = database_->get_setting("unitSystem"); unit)
    {
        if (auto parsed = SettingsManager::parse_unit_system(*unit); parsed)
            s.unit_system = *parsed;
        else
            FL_LOG_WARN("stored unit system '{}' is unknown", *unit);
    }
    if (auto interval = database_->get_setting("saveIntervalSeconds"); interval)
    {
        auto parsed = parse_number<int>(*interval);
        if (parsed && SettingsManager::valid_save_interval(*parsed))
            s.save_interval_seconds = *parsed;
        else
            FL_LOG_WARN("stored save interval '{}' is invalid", *interval);
    }
    return defaults;
}

bool PersistenceManager::persist_settings(CoreSettings const &s)
{
    if (!is_valid())
        return false;
    auto db = database_;
    if (!db->begin_transaction())
        return false;

    bool success = true;
    auto set_int = [&](char const *key, int value)
    { success = success && db->set_setting(key, std::to_string(value)); };
    auto set_double = [&](char const *key, double value)
    { success = success && db->set_setting(key, std::format("{}", value)); };
    auto set_string = [&](char const *key, std::string const &value)
    { success = success && db->set_setting(key, value); };

    set_double("waterTariff", s.water_tariff);
    set_double("leakThreshold", s.leak_threshold);
    set_string("unitSystem", SettingsManager::unit_system_name(s.unit_system));
    set_int("saveIntervalSeconds", s.save_interval_seconds);

    if (!success)
    {
        db->rollback_transaction();
        return false;
    }
    return db->commit_transaction();
}

std::optional<PersistedState> PersistenceManager::load_state(Timestamp now) const
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    auto document = database_->load_document();
    if (!document)
    {
        FL_LOG_INFO("no stored accounting state; starting fresh");
        return std::nullopt;
    }
    auto state = decode_state(document->payload, now);
    if (state)
    {
        FL_LOG_INFO("loaded accounting state v{} saved at {}", document->version,
                    calendar::format_iso8601(
                        static_cast<Timestamp>(document->saved_at)));
    }
    return state;
}

bool PersistenceManager::save_state(PersistedState const &state,
                                    Timestamp saved_at)
{
    if (!is_valid())
    {
        return false;
    }
    storage::StoredDocument document;
    document.version = kStateVersion;
    document.payload = encode_state(state);
    document.saved_at = static_cast<std::int64_t>(std::floor(saved_at));
    return database_->store_document(document);
}

} // namespace fl::engine
