#include "engine/Calendar.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <format>

namespace fl::engine
{

namespace
{

constexpr double kSecondsPerHour = 3600.0;
constexpr double kSecondsPerDay = 86400.0;

std::tm to_local(Timestamp ts)
{
    auto t = static_cast<std::time_t>(std::floor(ts));
    std::tm out{};
    localtime_r(&t, &out);
    return out;
}

long long civil_day(std::tm const &tm)
{
    using namespace std::chrono;
    auto ymd = year{tm.tm_year + 1900} / month{static_cast<unsigned>(tm.tm_mon + 1)} /
               day{static_cast<unsigned>(tm.tm_mday)};
    return sys_days{ymd}.time_since_epoch().count();
}

// Monday-based week.
long long week_start_day(std::tm const &tm)
{
    return civil_day(tm) - ((tm.tm_wday + 6) % 7);
}

// `month` is zero-based and `day` may overflow; mktime normalizes both.
Timestamp local_midnight(int year, int month, int day)
{
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_isdst = -1;
    return static_cast<Timestamp>(std::mktime(&tm));
}

bool never_crossed(Timestamp, Timestamp)
{
    return false;
}

bool consume(std::string_view &text, char expected)
{
    if (text.empty() || text.front() != expected)
    {
        return false;
    }
    text.remove_prefix(1);
    return true;
}

bool read_digits(std::string_view &text, std::size_t count, int &out)
{
    if (text.size() < count)
    {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i)
    {
        char c = text[i];
        if (c < '0' || c > '9')
        {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    text.remove_prefix(count);
    return true;
}

std::string_view trim(std::string_view text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

char const *period_name(Period period) noexcept
{
    switch (period)
    {
    case Period::Hourly:
        return "hourly";
    case Period::Daily:
        return "daily";
    case Period::Weekly:
        return "weekly";
    case Period::Monthly:
        return "monthly";
    case Period::Yearly:
        return "yearly";
    case Period::Lifetime:
        return "lifetime";
    }
    return "unknown";
}

BoundaryRule boundary_rule(Period period) noexcept
{
    switch (period)
    {
    case Period::Hourly:
        return {&calendar::is_new_hour, &calendar::next_hour};
    case Period::Daily:
        return {&calendar::is_new_day, &calendar::next_day};
    case Period::Weekly:
        return {&calendar::is_new_week, &calendar::next_week};
    case Period::Monthly:
        return {&calendar::is_new_month, &calendar::next_month};
    case Period::Yearly:
        return {&calendar::is_new_year, &calendar::next_year};
    case Period::Lifetime:
        break;
    }
    return {&never_crossed, &calendar::lifetime_target};
}

namespace calendar
{

Timestamp now_seconds()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

Timestamp start_of_hour(Timestamp ts)
{
    auto tm = to_local(ts);
    return std::floor(ts) - (tm.tm_min * 60 + tm.tm_sec);
}

Timestamp start_of_day(Timestamp ts)
{
    auto tm = to_local(ts);
    return local_midnight(tm.tm_year + 1900, tm.tm_mon, tm.tm_mday);
}

bool is_new_hour(Timestamp reset_at, Timestamp now)
{
    return start_of_hour(now) > start_of_hour(reset_at);
}

bool is_new_day(Timestamp reset_at, Timestamp now)
{
    return civil_day(to_local(now)) > civil_day(to_local(reset_at));
}

bool is_new_week(Timestamp reset_at, Timestamp now)
{
    return week_start_day(to_local(now)) > week_start_day(to_local(reset_at));
}

bool is_new_month(Timestamp reset_at, Timestamp now)
{
    auto a = to_local(reset_at);
    auto b = to_local(now);
    return b.tm_year * 12 + b.tm_mon > a.tm_year * 12 + a.tm_mon;
}

bool is_new_year(Timestamp reset_at, Timestamp now)
{
    return to_local(now).tm_year > to_local(reset_at).tm_year;
}

Timestamp next_hour(Timestamp now)
{
    return start_of_hour(now) + kSecondsPerHour;
}

Timestamp next_day(Timestamp now)
{
    auto tm = to_local(now);
    return local_midnight(tm.tm_year + 1900, tm.tm_mon, tm.tm_mday + 1);
}

Timestamp next_week(Timestamp now)
{
    auto tm = to_local(now);
    int days_until_monday = 7 - (tm.tm_wday + 6) % 7;
    return local_midnight(tm.tm_year + 1900, tm.tm_mon,
                          tm.tm_mday + days_until_monday);
}

Timestamp next_month(Timestamp now)
{
    auto tm = to_local(now);
    return local_midnight(tm.tm_year + 1900, tm.tm_mon + 1, 1);
}

Timestamp next_year(Timestamp now)
{
    auto tm = to_local(now);
    return local_midnight(tm.tm_year + 1900 + 1, 0, 1);
}

Timestamp lifetime_target(Timestamp)
{
    using namespace std::chrono;
    auto last = sys_days{year{9999} / December / 31};
    return static_cast<Timestamp>(last.time_since_epoch().count()) *
           kSecondsPerDay;
}

std::string format_iso8601(Timestamp ts)
{
    auto whole = std::floor(ts);
    auto micros = std::llround((ts - whole) * 1e6);
    if (micros >= 1000000)
    {
        whole += 1.0;
        micros -= 1000000;
    }
    auto tm = to_local(whole);
    auto offset_minutes = tm.tm_gmtoff / 60;
    char sign = offset_minutes < 0 ? '-' : '+';
    if (offset_minutes < 0)
    {
        offset_minutes = -offset_minutes;
    }
    auto text = std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                            tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (micros != 0)
    {
        text += std::format(".{:06}", micros);
    }
    text += std::format("{}{:02}:{:02}", sign, offset_minutes / 60,
                        offset_minutes % 60);
    return text;
}

std::optional<Timestamp> parse_iso8601(std::string_view text)
{
    auto s = trim(text);
    int y = 0;
    int mo = 0;
    int d = 0;
    if (!read_digits(s, 4, y) || !consume(s, '-') || !read_digits(s, 2, mo) ||
        !consume(s, '-') || !read_digits(s, 2, d))
    {
        return std::nullopt;
    }
    using namespace std::chrono;
    auto ymd = year{y} / month{static_cast<unsigned>(mo)} /
               day{static_cast<unsigned>(d)};
    if (!ymd.ok())
    {
        return std::nullopt;
    }
    if (s.empty())
    {
        auto midnight = local_midnight(y, mo - 1, d);
        if (midnight == -1.0)
        {
            return std::nullopt;
        }
        return midnight;
    }
    if (!consume(s, 'T') && !consume(s, 't') && !consume(s, ' '))
    {
        return std::nullopt;
    }
    int h = 0;
    int mi = 0;
    int sec = 0;
    double fraction = 0.0;
    if (!read_digits(s, 2, h) || !consume(s, ':') || !read_digits(s, 2, mi))
    {
        return std::nullopt;
    }
    if (consume(s, ':'))
    {
        if (!read_digits(s, 2, sec))
        {
            return std::nullopt;
        }
        if (consume(s, '.') || consume(s, ','))
        {
            double scale = 0.1;
            std::size_t digits = 0;
            while (!s.empty() && s.front() >= '0' && s.front() <= '9')
            {
                fraction += (s.front() - '0') * scale;
                scale /= 10.0;
                s.remove_prefix(1);
                ++digits;
            }
            if (digits == 0)
            {
                return std::nullopt;
            }
        }
    }
    if (h > 23 || mi > 59 || sec > 59)
    {
        return std::nullopt;
    }

    std::optional<int> offset_seconds;
    if (consume(s, 'Z') || consume(s, 'z'))
    {
        offset_seconds = 0;
    }
    else if (!s.empty() && (s.front() == '+' || s.front() == '-'))
    {
        int sign = s.front() == '-' ? -1 : 1;
        s.remove_prefix(1);
        int oh = 0;
        int om = 0;
        if (!read_digits(s, 2, oh))
        {
            return std::nullopt;
        }
        if (!s.empty())
        {
            consume(s, ':');
            if (!read_digits(s, 2, om))
            {
                return std::nullopt;
            }
        }
        if (oh > 23 || om > 59)
        {
            return std::nullopt;
        }
        offset_seconds = sign * (oh * 3600 + om * 60);
    }
    if (!s.empty())
    {
        return std::nullopt;
    }

    if (offset_seconds)
    {
        auto days = static_cast<double>(sys_days{ymd}.time_since_epoch().count());
        return days * kSecondsPerDay + h * 3600 + mi * 60 + sec -
               *offset_seconds + fraction;
    }
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    tm.tm_isdst = -1;
    auto local = std::mktime(&tm);
    if (local == static_cast<std::time_t>(-1))
    {
        return std::nullopt;
    }
    return static_cast<Timestamp>(local) + fraction;
}

} // namespace calendar

} // namespace fl::engine
