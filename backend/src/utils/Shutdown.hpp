#pragma once

namespace fl::runtime
{

// Installs SIGINT/SIGTERM handlers that raise the shutdown flag.
void install_signal_handlers();
bool should_shutdown() noexcept;

} // namespace fl::runtime
