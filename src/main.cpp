#include "surge/detail/curl_utils.hpp"
#include "surge/http_downloader.hpp"
#include "surge/interrupt_scope.hpp"
#include "surge/job_config.hpp"
#include "surge/job_controller.hpp"
#include "surge/logger.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

int main(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "surge";

    surge::CommandLine command_line;
    try {
        surge::detail::ensureCurlInitialized();
        command_line = surge::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const surge::ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n" << surge::usage(program);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }

    if (command_line.help_requested) {
        std::cout << surge::usage(program);
        return 0;
    }

    const auto& config = command_line.config;
    try {
        surge::Logger logger(config.verbose ? surge::Logger::Level::debug : surge::Logger::Level::warn,
                             config.log_file);

        std::error_code ec;
        std::filesystem::create_directories(config.directory, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: "
                                     + config.directory.string() + " - " + ec.message());
        }

        surge::DownloadOptions options;
        options.connection_count = config.connection_count;
        options.chunk_size = config.chunk_size;
        options.speed_limit = config.speed_limit;
        surge::HttpDownloader downloader(config.url, config.directory, options);

        surge::JobOptions job_options;
        job_options.progress = config.progress;
        job_options.silence = config.silence;

        surge::InterruptScope interrupt_scope(downloader);
        surge::JobController controller(downloader, job_options, std::cout);
        controller.run();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
