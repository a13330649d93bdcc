#pragma once

#include "engine/Calendar.hpp"
#include "engine/LeakDetector.hpp"
#include "engine/PeriodAccount.hpp"
#include "engine/SlidingWindowBuffer.hpp"
#include "engine/StateCodec.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace fl::telemetry
{
class MeterTransport;
}

namespace fl::engine
{

enum class UnitSystem
{
    Metric = 0,
    Us = 1,
};

inline constexpr double kLitersPerCubicMeter = 1000.0;
inline constexpr double kLitersPerGallon = 3.78541;

struct AccountingSettings
{
    double water_tariff = 0.0;
    double leak_threshold = 0.0;
    UnitSystem unit_system = UnitSystem::Metric;
};

// Tariff is per m³ (metric) or per gallon (US); a zero tariff costs nothing.
double cost_for_volume(double liters, AccountingSettings const &settings);

struct PeriodSnapshot
{
    Period period = Period::Hourly;
    double volume = 0.0;
    double cost = 0.0;
    Timestamp reset_at = 0.0;
    bool reset_known = true;
};

struct FlowStatistics
{
    std::optional<double> avg_flow_1h;
    std::optional<double> peak_flow_24h;
    std::optional<double> peak_flow_7d;
    std::optional<double> min_flow_24h;
    std::optional<double> avg_hourly_24h;
    std::optional<double> peak_hourly_24h;
    std::optional<double> peak_hourly_7d;
    std::optional<double> avg_daily_7d;
    std::optional<double> avg_daily_30d;
    std::optional<double> peak_daily_30d;
};

struct BufferCounts
{
    std::size_t flow_samples = 0;
    std::size_t hourly_consumption = 0;
    std::size_t hourly_flow_stats = 0;
    std::size_t daily_consumption = 0;
};

// Point-in-time copy of every derived value, taken under one read lock.
struct AccountingSnapshot
{
    Timestamp taken_at = 0.0;
    bool available = false;
    double flow_rate = 0.0;
    double volume_delta = 0.0;
    Timestamp volume_last_reset = 0.0;
    std::array<PeriodSnapshot, kPeriodCount> periods{};
    FlowStatistics statistics;
    double hourly_max_flow = 0.0;
    std::optional<double> hourly_min_flow;
    bool water_leak_detected = false;
    BufferCounts counts;
    AccountingSettings settings;

    PeriodSnapshot const &period(Period p) const
    {
        return periods[period_index(p)];
    }
};

// Orchestrates the six period accounts, the four statistics windows and the
// leak detector. on_tick() and handle_stale_boundaries() are the only
// mutators besides restore and the settings setter; all of them hold the
// write lock for their full duration so readers never see a half-finalized
// period.
class AccountingEngine
{
  public:
    AccountingEngine(telemetry::MeterTransport *meter, Timestamp now,
                     AccountingSettings settings = {});

    AccountingEngine(AccountingEngine const &) = delete;
    AccountingEngine &operator=(AccountingEngine const &) = delete;

    // Returns false when the meter reported no data and nothing changed.
    bool on_tick(Timestamp now);

    // Startup catch-up for boundaries crossed while not running. Must run
    // before register_accumulators(). Returns how many periods rolled over.
    std::size_t handle_stale_boundaries(Timestamp now);
    void register_accumulators(Timestamp now);

    void restore(PersistedState const &state);
    PersistedState capture() const;

    AccountingSnapshot snapshot(Timestamp now) const;
    FlowStatistics statistics(Timestamp now) const;

    std::optional<LeakEvent> drain_pending_leak_event();
    bool is_leaking() const;

    AccountingSettings settings() const;
    void apply_settings(AccountingSettings settings);

    std::optional<Timestamp> last_tick_at() const;

    double current_volume(Period period) const;
    Timestamp reset_at(Period period) const;
    BufferCounts counts() const;

    std::vector<Sample> hourly_consumption() const;
    std::vector<Sample> daily_consumption() const;
    std::vector<FlowRange> hourly_flow_stats() const;

  private:
    void check_period_boundaries(Timestamp now);
    void track_flow(double flow_rate);
    void reset_flow_trackers();
    void archive_hour(Timestamp hour_start, double volume);
    void trim_buffers(Timestamp now);
    double accumulated_ml(Period period) const;
    double volume_of(Period period) const;
    FlowStatistics statistics_locked(Timestamp now) const;

    PeriodAccount &account(Period period)
    {
        return accounts_[period_index(period)];
    }
    PeriodAccount const &account(Period period) const
    {
        return accounts_[period_index(period)];
    }

    telemetry::MeterTransport *meter_;
    mutable std::shared_mutex mutex_;

    AccountingSettings settings_;
    std::array<PeriodAccount, kPeriodCount> accounts_;

    SlidingWindowBuffer<Sample> flow_samples_{kHourSeconds};
    SlidingWindowBuffer<Sample> hourly_consumption_{kWeekSeconds};
    SlidingWindowBuffer<FlowRange> hourly_flow_stats_{kWeekSeconds};
    SlidingWindowBuffer<Sample> daily_consumption_{kMonthWindowSeconds};

    LeakDetector leak_detector_;

    bool available_ = false;
    double flow_rate_ = 0.0;
    double volume_delta_ = 0.0;
    Timestamp volume_last_reset_;
    double hourly_max_flow_ = 0.0;
    std::optional<double> hourly_min_flow_;
    std::optional<Timestamp> last_tick_at_;
    bool lifetime_reset_known_ = true;
};

} // namespace fl::engine
