#pragma once

#include <optional>

namespace fl::engine
{

enum class LeakEventKind
{
    Detected,
    Cleared,
};

struct LeakEvent
{
    LeakEventKind kind = LeakEventKind::Detected;
    double min_flow = 0.0;
    double threshold = 0.0;
};

// "water_leak_detected" / "water_leak_cleared".
char const *leak_event_name(LeakEventKind kind) noexcept;

// Two-state hysteresis over the trailing 24h minimum flow. Flow that never
// drops to or below the threshold for a full day is a leak.
class LeakDetector
{
  public:
    // Returns true when the classification changed. An absent statistic
    // leaves both the state and the pending event untouched.
    bool evaluate(std::optional<double> min_flow, double threshold);

    bool is_leaking() const noexcept
    {
        return leaking_;
    }

    std::optional<LeakEvent> const &pending() const noexcept
    {
        return pending_;
    }

    std::optional<LeakEvent> drain() noexcept;

    void restore(bool leaking) noexcept;

  private:
    bool leaking_ = false;
    std::optional<LeakEvent> pending_;
};

} // namespace fl::engine
