#pragma once

#include "capydeploy/hub/config.hpp"
#include "capydeploy/hub/logger.hpp"

namespace capydeploy::hub
{

    // Executes one CLI subcommand; returns the process exit code.
    int run_command(const HubConfig &config, Logger &logger);

} // namespace capydeploy::hub
