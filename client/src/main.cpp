#include <exception>
#include <iostream>

#include "chunkvault/client/config.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/uploader.hpp"
#include "chunkvault/version.hpp"

int main(int argc, char *argv[])
{
    chunkvault::client::ClientConfig config;
    try
    {
        config = chunkvault::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    try
    {
        chunkvault::client::Logger logger(config.log_path);
        logger.log("info", "chunkvault_client ", chunkvault::version(), " starting");
        chunkvault::client::Uploader uploader(std::move(config), std::move(logger));
        return uploader.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
