#pragma once

#include "engine/Calendar.hpp"

#include <string>

namespace fl::telemetry
{

// The device side of the accounting engine. Implementations own the live
// per-period accumulators; the engine only reads and resets them.
class MeterTransport
{
  public:
    virtual ~MeterTransport() = default;

    // Instantaneous flow in L/min.
    virtual double flow_rate() const = 0;
    // Volume in mL captured since the previous call; reading clears it.
    virtual double volume_delta() = 0;
    virtual bool availability() const = 0;

    // Milliliters counted by `name` since it was added or last reset. Unknown
    // accumulators read as zero.
    virtual double accumulated_volume(std::string const &name) const = 0;
    virtual void add_accumulator(std::string const &name,
                                 engine::Timestamp target_reset_at) = 0;
    virtual void reset_accumulator(std::string const &name,
                                   engine::Timestamp next_target_reset_at) = 0;
};

} // namespace fl::telemetry
