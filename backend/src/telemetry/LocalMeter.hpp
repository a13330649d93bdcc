#pragma once

#include "telemetry/MeterTransport.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace fl::telemetry
{

struct Reading
{
    double flow_rate = 0.0;
    double volume_delta = 0.0;
    bool available = true;
    std::optional<engine::Timestamp> timestamp;
};

// In-process meter fed by Reading values. Each applied delta is added to
// every registered accumulator.
class LocalMeter final : public MeterTransport
{
  public:
    struct Accumulator
    {
        double milliliters = 0.0;
        engine::Timestamp target_reset_at = 0.0;
    };

    void apply(Reading const &reading);

    double flow_rate() const override;
    double volume_delta() override;
    bool availability() const override;

    double accumulated_volume(std::string const &name) const override;
    void add_accumulator(std::string const &name,
                         engine::Timestamp target_reset_at) override;
    void reset_accumulator(std::string const &name,
                           engine::Timestamp next_target_reset_at) override;

    std::optional<Accumulator> accumulator(std::string const &name) const;

  private:
    mutable std::mutex mutex_;
    double flow_rate_ = 0.0;
    double pending_delta_ = 0.0;
    bool available_ = false;
    std::unordered_map<std::string, Accumulator> accumulators_;
};

} // namespace fl::telemetry
