#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nascore/error_codes.hpp"
#include "nascore/server/config.hpp"
#include "nascore/server/server.hpp"
#include "nascore/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "nascore server " << nascore::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--upload-dir <DIR>] [--chunk-size <BYTES>] [--session-ttl <seconds>]\n"
                     "       [--sweep-interval <seconds>] [--owner-refresh <seconds>] [--config <FILE>]\n"
                     "       [--log <FILE>] [--verbose]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::filesystem::path> find_config_flag(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

    std::shared_ptr<spdlog::logger> make_logger(const nascore::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        return logger;
    }

} // namespace

int main(int argc, char *argv[])
{
    using nascore::server::Server;
    using nascore::server::ServerConfig;

    ServerConfig config;

    try
    {
        if (const auto config_file = find_config_flag(argc, argv))
        {
            nascore::server::load_config_file(*config_file, config);
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
                continue;
            }

            const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" || arg == "--threads" ||
                                     arg == "--upload-dir" || arg == "--chunk-size" || arg == "--session-ttl" ||
                                     arg == "--sweep-interval" || arg == "--owner-refresh" || arg == "--config" ||
                                     arg == "--log";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--upload-dir")
            {
                config.upload_dir = std::filesystem::path(*value);
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = std::stoull(*value);
            }
            else if (arg == "--session-ttl")
            {
                config.session_ttl = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--owner-refresh")
            {
                config.owner_refresh = std::chrono::seconds(std::stoll(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            // --config was applied before the other flags.
        }
    }
    catch (const nascore::OperationError &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::logic_error &ex)
    {
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        spdlog::set_default_logger(make_logger(config));
        spdlog::info("Starting nascore server {} on {}:{}", nascore::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
