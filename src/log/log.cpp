#include "log.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace logging {

void init(bool verbose) {
    auto sink   = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("drivescan", std::move(sink));
    logger->set_pattern("[%H:%M:%S] %v");
    spdlog::set_default_logger(std::move(logger));
    set_verbose(verbose);
}

void set_verbose(bool verbose) {
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::err);
}

}  // namespace logging
