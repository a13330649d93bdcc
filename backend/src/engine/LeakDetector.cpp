#include "engine/LeakDetector.hpp"

#include "utils/Log.hpp"

#include <utility>

namespace fl::engine
{

char const *leak_event_name(LeakEventKind kind) noexcept
{
    switch (kind)
    {
    case LeakEventKind::Detected:
        return "water_leak_detected";
    case LeakEventKind::Cleared:
        return "water_leak_cleared";
    }
    return "unknown";
}

bool LeakDetector::evaluate(std::optional<double> min_flow, double threshold)
{
    if (!min_flow)
    {
        return false;
    }
    if (*min_flow > threshold && !leaking_)
    {
        leaking_ = true;
        pending_ = LeakEvent{LeakEventKind::Detected, *min_flow, threshold};
        FL_LOG_WARN("water leak detected: min flow {:.3f} L/min exceeds "
                    "threshold {:.3f} L/min",
                    *min_flow, threshold);
        return true;
    }
    if (*min_flow <= threshold && leaking_)
    {
        leaking_ = false;
        pending_ = LeakEvent{LeakEventKind::Cleared, *min_flow, threshold};
        FL_LOG_INFO("water leak cleared: min flow {:.3f} L/min", *min_flow);
        return true;
    }
    return false;
}

std::optional<LeakEvent> LeakDetector::drain() noexcept
{
    return std::exchange(pending_, std::nullopt);
}

void LeakDetector::restore(bool leaking) noexcept
{
    leaking_ = leaking;
    pending_.reset();
}

} // namespace fl::engine
