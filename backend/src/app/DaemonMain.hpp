#pragma once

namespace fl::app
{

// Runs the flowledger daemon: reads telemetry, keeps the accounting state
// and saves it on shutdown. With --status it prints the stored figures and
// exits instead.
int daemon_main(int argc, char *argv[]);

} // namespace fl::app
