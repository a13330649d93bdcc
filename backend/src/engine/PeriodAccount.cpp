#include "engine/PeriodAccount.hpp"

#include "utils/Log.hpp"

#include <algorithm>
#include <cmath>

namespace fl::engine
{

PeriodAccount::PeriodAccount(Period period, Timestamp reset_at)
    : period_(period), rule_(boundary_rule(period)), reset_at_(reset_at)
{
}

double PeriodAccount::current_volume(double accumulated_ml) const noexcept
{
    return baseline_ + std::max(0.0, accumulated_ml) / kMillilitersPerLiter;
}

bool PeriodAccount::crossed(Timestamp now) const
{
    return rule_.crossed(reset_at_, now);
}

Timestamp PeriodAccount::next_boundary(Timestamp now) const
{
    return rule_.next(now);
}

double PeriodAccount::finalize_and_reset(Timestamp now, double accumulated_ml)
{
    auto finalized = current_volume(accumulated_ml);
    baseline_ = 0.0;
    reset_at_ = now;
    return finalized;
}

void PeriodAccount::restore(double baseline, Timestamp reset_at)
{
    if (!std::isfinite(baseline) || baseline < 0.0)
    {
        FL_LOG_WARN("{} baseline {} is not a valid volume; using 0", name(),
                    baseline);
        baseline = 0.0;
    }
    baseline_ = baseline;
    reset_at_ = reset_at;
}

} // namespace fl::engine
