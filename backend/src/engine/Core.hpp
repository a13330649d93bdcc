#pragma once

#include "engine/AccountingEngine.hpp"
#include "engine/Calendar.hpp"
#include "telemetry/LocalMeter.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

namespace fl::engine
{

class EventBus;

inline constexpr double kMaxWaterTariff = 100.0;
inline constexpr double kMaxLeakThreshold = 10.0;
inline constexpr int kMinSaveIntervalSeconds = 10;
inline constexpr int kDefaultSaveIntervalSeconds = 300;

struct CoreSettings
{
    std::filesystem::path state_path;
    // Empty reads standard input.
    std::filesystem::path input_path;
    bool read_input = true;
    bool stop_at_end_of_input = true;
    unsigned idle_sleep_ms = 200;
    double water_tariff = 0.0;
    double leak_threshold = 0.0;
    UnitSystem unit_system = UnitSystem::Metric;
    int save_interval_seconds = kDefaultSaveIntervalSeconds;
};

struct SettingsUpdate
{
    std::optional<double> water_tariff;
    std::optional<double> leak_threshold;
    std::optional<UnitSystem> unit_system;
    std::optional<int> save_interval_seconds;

    bool empty() const noexcept
    {
        return !water_tariff && !leak_threshold && !unit_system &&
               !save_interval_seconds;
    }
};

class Core
{
  public:
    // `overrides` are applied on top of the persisted settings and saved.
    explicit Core(CoreSettings settings, SettingsUpdate overrides = {});
    ~Core();
    static std::unique_ptr<Core> create(CoreSettings settings,
                                        SettingsUpdate overrides = {});

    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    // Queues a reading for the engine loop; safe from any thread.
    void ingest(telemetry::Reading reading);
    // Applies queued readings on the calling thread. run() does this too.
    std::size_t process_pending();

    AccountingSnapshot snapshot() const;
    CoreSettings settings() const;
    void update_settings(SettingsUpdate update);
    bool save_now();
    EventBus &events() noexcept;

    // Derived values from the stored state after catch-up, without a meter
    // and without writing anything back.
    static std::optional<AccountingSnapshot>
    offline_snapshot(CoreSettings settings, SettingsUpdate const &overrides,
                     Timestamp now);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fl::engine
