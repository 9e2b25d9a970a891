#include <iostream>

#include "sharebox/client/config.hpp"
#include "sharebox/client/logger.hpp"
#include "sharebox/client/session.hpp"

int main(int argc, char *argv[])
{
    try
    {
        const auto config = sharebox::client::parse_arguments(argc, argv);
        sharebox::client::Logger logger(config.log_path);
        sharebox::client::ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
