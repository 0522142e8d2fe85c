#pragma once

namespace ts::app
{

// Runs the streaming daemon (engine thread + HTTP server) until SIGINT,
// SIGTERM or --run-seconds. Returns the process exit code.
int daemon_main(int argc, char *argv[]);

} // namespace ts::app
