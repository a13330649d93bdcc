#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace fl::log
{

namespace
{
std::mutex s_mutex;
std::ofstream s_ofs;
std::optional<std::filesystem::path> s_path;
std::atomic_bool s_debug_enabled{false};
} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_path = std::move(path);
}

bool append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = fl::utils::data_root() / "flowledger.log";
    }
    if (s_path->empty())
    {
        return false;
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (!s_ofs.is_open())
    {
        return false;
    }
    s_ofs << line << '\n';
    s_ofs.flush();
    return static_cast<bool>(s_ofs);
}

void set_debug_enabled(bool enabled) noexcept
{
    s_debug_enabled.store(enabled, std::memory_order_relaxed);
}

bool debug_enabled() noexcept
{
    return s_debug_enabled.load(std::memory_order_relaxed);
}

} // namespace fl::log
