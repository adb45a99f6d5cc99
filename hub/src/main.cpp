#include <cstdlib>
#include <exception>
#include <iostream>

#include "capydeploy/hub/cli.hpp"
#include "capydeploy/hub/config.hpp"
#include "capydeploy/hub/logger.hpp"
#include "capydeploy/protocol_error.hpp"

int main(int argc, char *argv[])
{
    try
    {
        auto config = capydeploy::hub::parse_arguments(argc, argv);
        capydeploy::hub::Logger logger(config.log_path);
        logger.install_as_default();
        try
        {
            return capydeploy::hub::run_command(config, logger);
        }
        catch (const capydeploy::ProtocolError &error)
        {
            std::cerr << capydeploy::to_string(error.code()) << ": " << error.message() << std::endl;
            logger.log("error", error.what());
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
