#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "minishare/client/config.hpp"
#include "minishare/client/logger.hpp"
#include "minishare/client/session.hpp"
#include "minishare/client/shell.hpp"
#include "minishare/version.hpp"

int main(int argc, char *argv[])
{
    using namespace minishare::client;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            std::cout << "MiniShare client " << minishare::version() << "\n"
                      << usage(argv[0]) << std::endl;
            return EXIT_SUCCESS;
        }
    }

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << usage(argv[0]) << std::endl;
        return EXIT_FAILURE;
    }

    std::error_code ec;
    if (!std::filesystem::exists(config.downloads_dir, ec))
    {
        if (std::filesystem::create_directories(config.downloads_dir, ec))
        {
            std::cout << "Created download folder: " << config.downloads_dir.string() << std::endl;
        }
        else
        {
            std::cerr << "[warning] cannot create download folder " << config.downloads_dir.string() << ": "
                      << ec.message() << std::endl;
        }
    }

    Logger logger(config.log_path);
    logger.log("info", "MiniShare client ", minishare::version(), " starting");
    ClientSession session(config, logger);

    try
    {
        std::cout << "Connecting to server at " << config.host << ":" << config.port << "..." << std::endl;
        session.connect();
        std::cout << "Successfully connected to server!" << std::endl;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: cannot connect to " << config.host << ":" << config.port << ": " << ex.what()
                  << std::endl;
        logger.log("error", "connect failed: ", ex.what());
        return EXIT_FAILURE;
    }

    try
    {
        Shell shell(session, std::cin, std::cout);
        return shell.run() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        logger.log("error", "fatal: ", ex.what());
        return EXIT_FAILURE;
    }
}
