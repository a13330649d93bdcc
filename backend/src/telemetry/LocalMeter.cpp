#include "telemetry/LocalMeter.hpp"

#include "utils/Log.hpp"

#include <cmath>
#include <utility>

namespace fl::telemetry
{

void LocalMeter::apply(Reading const &reading)
{
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = reading.available;
    if (!reading.available)
    {
        return;
    }
    flow_rate_ = std::isfinite(reading.flow_rate) ? reading.flow_rate : 0.0;
    if (!std::isfinite(reading.volume_delta) || reading.volume_delta < 0.0)
    {
        FL_LOG_WARN("ignoring invalid volume delta {}", reading.volume_delta);
        return;
    }
    pending_delta_ += reading.volume_delta;
    for (auto &entry : accumulators_)
    {
        entry.second.milliliters += reading.volume_delta;
    }
}

double LocalMeter::flow_rate() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return flow_rate_;
}

double LocalMeter::volume_delta()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(pending_delta_, 0.0);
}

bool LocalMeter::availability() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

double LocalMeter::accumulated_volume(std::string const &name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accumulators_.find(name);
    return it == accumulators_.end() ? 0.0 : it->second.milliliters;
}

void LocalMeter::add_accumulator(std::string const &name,
                                 engine::Timestamp target_reset_at)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = accumulators_[name];
    entry.milliliters = 0.0;
    entry.target_reset_at = target_reset_at;
}

void LocalMeter::reset_accumulator(std::string const &name,
                                   engine::Timestamp next_target_reset_at)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accumulators_.find(name);
    if (it == accumulators_.end())
    {
        FL_LOG_WARN("reset requested for unknown accumulator {}", name);
        return;
    }
    it->second.milliliters = 0.0;
    it->second.target_reset_at = next_target_reset_at;
}

std::optional<LocalMeter::Accumulator>
LocalMeter::accumulator(std::string const &name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accumulators_.find(name);
    if (it == accumulators_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace fl::telemetry
