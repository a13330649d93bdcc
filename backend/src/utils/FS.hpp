#pragma once

#include <filesystem>
#include <optional>

namespace fl::utils
{

std::filesystem::path data_root();
std::optional<std::filesystem::path> executable_path();
std::optional<std::filesystem::path> flowledger_state_home();

} // namespace fl::utils
