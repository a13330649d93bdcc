#pragma once

#include "engine/Calendar.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace fl::engine
{

struct Sample
{
    Timestamp timestamp = 0.0;
    double value = 0.0;

    bool operator==(Sample const &) const = default;
};

// Highest and lowest flow rate seen during one finalized hour.
struct FlowRange
{
    Timestamp timestamp = 0.0;
    double max = 0.0;
    double min = 0.0;

    bool operator==(FlowRange const &) const = default;
};

inline constexpr double kHourSeconds = 3600.0;
inline constexpr double kDaySeconds = 86400.0;
inline constexpr double kWeekSeconds = 7 * kDaySeconds;
inline constexpr double kMonthWindowSeconds = 30 * kDaySeconds;

// Time-ordered entries with a fixed retention horizon. Entries are appended
// in non-decreasing timestamp order; trim() drops the expired prefix.
template <typename Entry> class SlidingWindowBuffer
{
  public:
    using Field = double Entry::*;

    explicit SlidingWindowBuffer(double retention_seconds)
        : retention_(retention_seconds)
    {
    }

    void append(Entry entry)
    {
        entries_.push_back(entry);
    }

    void trim(Timestamp now)
    {
        auto cutoff = now - retention_;
        while (!entries_.empty() && entries_.front().timestamp < cutoff)
        {
            entries_.pop_front();
        }
    }

    std::optional<double> windowed_average(double window_seconds, Timestamp now,
                                           Field field = &Entry::value) const
    {
        auto cutoff = now - window_seconds;
        double sum = 0.0;
        std::size_t count = 0;
        for (auto const &entry : entries_)
        {
            if (entry.timestamp >= cutoff)
            {
                sum += entry.*field;
                ++count;
            }
        }
        if (count == 0)
        {
            return std::nullopt;
        }
        return sum / static_cast<double>(count);
    }

    std::optional<double> windowed_max(double window_seconds, Timestamp now,
                                       Field field = &Entry::value) const
    {
        return fold(window_seconds, now, field,
                    [](double a, double b) { return b > a; });
    }

    std::optional<double> windowed_min(double window_seconds, Timestamp now,
                                       Field field = &Entry::value) const
    {
        return fold(window_seconds, now, field,
                    [](double a, double b) { return b < a; });
    }

    std::size_t count() const noexcept
    {
        return entries_.size();
    }

    bool empty() const noexcept
    {
        return entries_.empty();
    }

    std::deque<Entry> const &entries() const noexcept
    {
        return entries_;
    }

    std::vector<Entry> to_vector() const
    {
        return {entries_.begin(), entries_.end()};
    }

    // Replaces the contents verbatim; the next trim() applies the horizon.
    void assign(std::vector<Entry> const &entries)
    {
        entries_.assign(entries.begin(), entries.end());
    }

  private:
    template <typename Better>
    std::optional<double> fold(double window_seconds, Timestamp now,
                               Field field, Better better) const
    {
        auto cutoff = now - window_seconds;
        std::optional<double> result;
        for (auto const &entry : entries_)
        {
            if (entry.timestamp < cutoff)
            {
                continue;
            }
            double value = entry.*field;
            if (!result || better(*result, value))
            {
                result = value;
            }
        }
        return result;
    }

    double retention_;
    std::deque<Entry> entries_;
};

} // namespace fl::engine
