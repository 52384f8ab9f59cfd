#pragma once

namespace logging {

// Install the process-wide spdlog logger on stderr.
// Quiet mode logs errors only; verbose mode logs everything down to debug
// with a compact "[HH:MM:SS] message key=value" line.
void init(bool verbose);

void set_verbose(bool verbose);

}  // namespace logging
