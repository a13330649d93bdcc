#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace fl::log
{

// Defined in Log.cpp. The file sink is opened lazily on the first line.
bool append_log_line_to_file(std::string const &line);
void set_log_file(std::filesystem::path path);
void set_debug_enabled(bool enabled) noexcept;
bool debug_enabled() noexcept;

// FL_ENABLE_LOGGING=1 overrides FL_BUILD_MINIMAL so Release builds can be
// diagnosed without rebuilding the whole tree in a debug configuration.
#if defined(FL_ENABLE_LOGGING) && (FL_ENABLE_LOGGING)
#define FL_LOGGING_ACTIVE 1
#elif !defined(FL_BUILD_MINIMAL)
#define FL_LOGGING_ACTIVE 1
#else
#define FL_LOGGING_ACTIVE 0
#endif

#if FL_LOGGING_ACTIVE
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    if (level == 'D' && !debug_enabled())
    {
        return;
    }
    auto const now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    append_log_line_to_file(final);
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
}

} // namespace fl::log

#if FL_LOGGING_ACTIVE
#define FL_LOG_INFO(fmt, ...) fl::log::write_line('I', fmt, ##__VA_ARGS__)
#define FL_LOG_DEBUG(fmt, ...) fl::log::write_line('D', fmt, ##__VA_ARGS__)
#define FL_LOG_WARN(fmt, ...) fl::log::write_line('W', fmt, ##__VA_ARGS__)
#define FL_LOG_ERROR(fmt, ...) fl::log::write_line('E', fmt, ##__VA_ARGS__)
#else
#define FL_LOG_INFO(fmt, ...) (void)0
#define FL_LOG_DEBUG(fmt, ...) (void)0
#define FL_LOG_WARN(fmt, ...) (void)0
#define FL_LOG_ERROR(fmt, ...) (void)0
#endif
