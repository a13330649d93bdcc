#pragma once

#include "engine/Calendar.hpp"

namespace fl::engine
{

// Accumulators report milliliters; accounts are kept in liters.
inline constexpr double kMillilitersPerLiter = 1000.0;

// One accounting window (hour, day, week, month, year or lifetime). The
// account holds the finalized baseline and the instant the window began; the
// live part of the total comes from the meter's accumulator of the same name.
class PeriodAccount
{
  public:
    PeriodAccount(Period period, Timestamp reset_at);

    Period period() const noexcept
    {
        return period_;
    }
    char const *name() const noexcept
    {
        return period_name(period_);
    }
    double baseline() const noexcept
    {
        return baseline_;
    }
    Timestamp reset_at() const noexcept
    {
        return reset_at_;
    }

    double current_volume(double accumulated_ml) const noexcept;
    bool crossed(Timestamp now) const;
    Timestamp next_boundary(Timestamp now) const;

    // Returns the closing total of the window and starts a new one at `now`.
    // The caller resets the meter accumulator toward next_boundary(now).
    double finalize_and_reset(Timestamp now, double accumulated_ml);

    void restore(double baseline, Timestamp reset_at);

  private:
    Period period_;
    BoundaryRule rule_;
    double baseline_ = 0.0;
    Timestamp reset_at_;
};

} // namespace fl::engine
