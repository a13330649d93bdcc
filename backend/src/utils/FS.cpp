#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace fl::utils
{

namespace
{
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate, ec))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> env_path(char const *key)
{
    auto const *value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
}

// $XDG_STATE_HOME/flowledger, else ~/.local/state/flowledger.
std::optional<std::filesystem::path> flowledger_state_home()
{
    if (auto xdg = env_path("XDG_STATE_HOME"))
    {
        if (auto ensured = ensure_directory(*xdg / "flowledger"))
        {
            return ensured;
        }
    }
    if (auto home = env_path("HOME"))
    {
        if (auto ensured =
                ensure_directory(*home / ".local" / "state" / "flowledger"))
        {
            return ensured;
        }
    }
    return std::nullopt;
}

std::filesystem::path data_root()
{
    if (auto explicit_root = env_path("FL_DATA_ROOT"))
    {
        if (auto ensured = ensure_directory(*explicit_root))
        {
            return *ensured;
        }
    }
    if (auto state_home = flowledger_state_home())
    {
        return *state_home;
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

} // namespace fl::utils
