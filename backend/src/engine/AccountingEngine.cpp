#include "engine/AccountingEngine.hpp"

#include "telemetry/MeterTransport.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace fl::engine
{

namespace
{

constexpr std::array<Period, 5> kResettablePeriods = {
    Period::Hourly, Period::Daily, Period::Weekly, Period::Monthly,
    Period::Yearly,
};

} // namespace

double cost_for_volume(double liters, AccountingSettings const &settings)
{
    if (settings.water_tariff == 0.0)
    {
        return 0.0;
    }
    if (settings.unit_system == UnitSystem::Metric)
    {
        return liters / kLitersPerCubicMeter * settings.water_tariff;
    }
    return liters / kLitersPerGallon * settings.water_tariff;
}

AccountingEngine::AccountingEngine(telemetry::MeterTransport *meter,
                                   Timestamp now, AccountingSettings settings)
    : meter_(meter), settings_(settings),
      accounts_{PeriodAccount{Period::Hourly, now},
                PeriodAccount{Period::Daily, now},
                PeriodAccount{Period::Weekly, now},
                PeriodAccount{Period::Monthly, now},
                PeriodAccount{Period::Yearly, now},
                PeriodAccount{Period::Lifetime, now}},
      volume_last_reset_(now)
{
}

bool AccountingEngine::on_tick(Timestamp now)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (meter_ == nullptr)
    {
        return false;
    }
    available_ = meter_->availability();
    if (!available_)
    {
        return false;
    }

    volume_delta_ = meter_->volume_delta();
    flow_rate_ = meter_->flow_rate();
    volume_last_reset_ = now;
    last_tick_at_ = now;

    // The crossing tick's sample still counts toward the closing hour.
    track_flow(flow_rate_);
    check_period_boundaries(now);

    flow_samples_.append(Sample{now, flow_rate_});
    trim_buffers(now);

    leak_detector_.evaluate(
        hourly_flow_stats_.windowed_min(kDaySeconds, now, &FlowRange::min),
        settings_.leak_threshold);
    return true;
}

void AccountingEngine::check_period_boundaries(Timestamp now)
{
    for (auto period : kResettablePeriods)
    {
        auto &acc = account(period);
        if (!acc.crossed(now))
        {
            continue;
        }
        auto started = acc.reset_at();
        auto finalized = acc.finalize_and_reset(now, accumulated_ml(period));
        if (period == Period::Hourly)
        {
            archive_hour(started, finalized);
        }
        else if (period == Period::Daily)
        {
            daily_consumption_.append(Sample{started, finalized});
        }
        if (meter_ != nullptr)
        {
            meter_->reset_accumulator(acc.name(), acc.next_boundary(now));
        }
        FL_LOG_DEBUG("{} period closed at {:.3f} L (began {})", acc.name(),
                     finalized, calendar::format_iso8601(started));
    }
}

void AccountingEngine::archive_hour(Timestamp hour_start, double volume)
{
    hourly_consumption_.append(Sample{hour_start, volume});
    if (hourly_min_flow_)
    {
        hourly_flow_stats_.append(
            FlowRange{hour_start, hourly_max_flow_, *hourly_min_flow_});
    }
    reset_flow_trackers();
}

void AccountingEngine::track_flow(double flow_rate)
{
    hourly_min_flow_ =
        hourly_min_flow_ ? std::min(*hourly_min_flow_, flow_rate) : flow_rate;
    hourly_max_flow_ = std::max(hourly_max_flow_, flow_rate);
}

void AccountingEngine::reset_flow_trackers()
{
    hourly_max_flow_ = 0.0;
    hourly_min_flow_.reset();
}

void AccountingEngine::trim_buffers(Timestamp now)
{
    flow_samples_.trim(now);
    hourly_consumption_.trim(now);
    hourly_flow_stats_.trim(now);
    daily_consumption_.trim(now);
}

std::size_t AccountingEngine::handle_stale_boundaries(Timestamp now)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::size_t rolled = 0;
    for (auto period : kResettablePeriods)
    {
        auto &acc = account(period);
        if (!acc.crossed(now))
        {
            continue;
        }
        auto started = acc.reset_at();
        // No accumulator exists yet, so the baseline is the whole total.
        auto finalized = acc.finalize_and_reset(now, 0.0);
        if (period == Period::Hourly)
        {
            archive_hour(started, finalized);
        }
        else if (period == Period::Daily)
        {
            daily_consumption_.append(Sample{started, finalized});
        }
        ++rolled;
        FL_LOG_INFO("{} period ended while stopped; archived {:.3f} L from {}",
                    acc.name(), finalized, calendar::format_iso8601(started));
    }
    if (rolled > 0)
    {
        trim_buffers(now);
    }
    return rolled;
}

void AccountingEngine::register_accumulators(Timestamp now)
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (meter_ == nullptr)
    {
        return;
    }
    for (auto const &acc : accounts_)
    {
        meter_->add_accumulator(acc.name(), acc.next_boundary(now));
    }
}

void AccountingEngine::restore(PersistedState const &state)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto period : kAllPeriods)
    {
        auto const &slot = state.period(period);
        account(period).restore(slot.volume, slot.reset_at);
    }
    hourly_max_flow_ = state.hourly_max_flow;
    hourly_min_flow_ = state.hourly_min_flow;
    flow_samples_.assign(state.flow_samples);
    hourly_consumption_.assign(state.hourly_consumption);
    daily_consumption_.assign(state.daily_consumption);
    hourly_flow_stats_.assign(state.hourly_flow_stats);
    leak_detector_.restore(state.water_leak_detected);
    lifetime_reset_known_ = state.lifetime_reset_known;
}

PersistedState AccountingEngine::capture() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    PersistedState state;
    for (auto period : kAllPeriods)
    {
        auto &slot = state.period(period);
        slot.volume = volume_of(period);
        slot.reset_at = account(period).reset_at();
    }
    state.hourly_max_flow = hourly_max_flow_;
    state.hourly_min_flow = hourly_min_flow_;
    state.flow_samples = flow_samples_.to_vector();
    state.hourly_consumption = hourly_consumption_.to_vector();
    state.daily_consumption = daily_consumption_.to_vector();
    state.hourly_flow_stats = hourly_flow_stats_.to_vector();
    state.water_leak_detected = leak_detector_.is_leaking();
    state.lifetime_reset_known = lifetime_reset_known_;
    return state;
}

double AccountingEngine::accumulated_ml(Period period) const
{
    if (meter_ == nullptr)
    {
        return 0.0;
    }
    return meter_->accumulated_volume(period_name(period));
}

double AccountingEngine::volume_of(Period period) const
{
    return account(period).current_volume(accumulated_ml(period));
}

FlowStatistics AccountingEngine::statistics_locked(Timestamp now) const
{
    FlowStatistics stats;
    stats.avg_flow_1h = flow_samples_.windowed_average(kHourSeconds, now);
    stats.peak_flow_24h =
        hourly_flow_stats_.windowed_max(kDaySeconds, now, &FlowRange::max);
    stats.peak_flow_7d =
        hourly_flow_stats_.windowed_max(kWeekSeconds, now, &FlowRange::max);
    stats.min_flow_24h =
        hourly_flow_stats_.windowed_min(kDaySeconds, now, &FlowRange::min);
    stats.avg_hourly_24h = hourly_consumption_.windowed_average(kDaySeconds, now);
    stats.peak_hourly_24h = hourly_consumption_.windowed_max(kDaySeconds, now);
    stats.peak_hourly_7d = hourly_consumption_.windowed_max(kWeekSeconds, now);
    stats.avg_daily_7d = daily_consumption_.windowed_average(kWeekSeconds, now);
    stats.avg_daily_30d =
        daily_consumption_.windowed_average(kMonthWindowSeconds, now);
    stats.peak_daily_30d =
        daily_consumption_.windowed_max(kMonthWindowSeconds, now);
    return stats;
}

FlowStatistics AccountingEngine::statistics(Timestamp now) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return statistics_locked(now);
}

AccountingSnapshot AccountingEngine::snapshot(Timestamp now) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    AccountingSnapshot snap;
    snap.taken_at = now;
    snap.available = available_;
    snap.flow_rate = flow_rate_;
    snap.volume_delta = volume_delta_;
    snap.volume_last_reset = volume_last_reset_;
    for (auto period : kAllPeriods)
    {
        auto &entry = snap.periods[period_index(period)];
        entry.period = period;
        entry.volume = volume_of(period);
        entry.cost = cost_for_volume(entry.volume, settings_);
        entry.reset_at = account(period).reset_at();
        entry.reset_known =
            period != Period::Lifetime || lifetime_reset_known_;
    }
    snap.statistics = statistics_locked(now);
    snap.hourly_max_flow = hourly_max_flow_;
    snap.hourly_min_flow = hourly_min_flow_;
    snap.water_leak_detected = leak_detector_.is_leaking();
    snap.counts = BufferCounts{flow_samples_.count(), hourly_consumption_.count(),
                               hourly_flow_stats_.count(),
                               daily_consumption_.count()};
    snap.settings = settings_;
    return snap;
}

std::optional<LeakEvent> AccountingEngine::drain_pending_leak_event()
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return leak_detector_.drain();
}

bool AccountingEngine::is_leaking() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return leak_detector_.is_leaking();
}

AccountingSettings AccountingEngine::settings() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void AccountingEngine::apply_settings(AccountingSettings settings)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    settings_ = settings;
}

std::optional<Timestamp> AccountingEngine::last_tick_at() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_tick_at_;
}

double AccountingEngine::current_volume(Period period) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return volume_of(period);
}

Timestamp AccountingEngine::reset_at(Period period) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return account(period).reset_at();
}

BufferCounts AccountingEngine::counts() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return BufferCounts{flow_samples_.count(), hourly_consumption_.count(),
                        hourly_flow_stats_.count(), daily_consumption_.count()};
}

std::vector<Sample> AccountingEngine::hourly_consumption() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hourly_consumption_.to_vector();
}

std::vector<Sample> AccountingEngine::daily_consumption() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return daily_consumption_.to_vector();
}

std::vector<FlowRange> AccountingEngine::hourly_flow_stats() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hourly_flow_stats_.to_vector();
}

} // namespace fl::engine
