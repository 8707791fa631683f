#include "surge/job_config.hpp"
#include "surge/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/format.h>

namespace surge {

namespace {

std::uint64_t parseNumber(const std::string& option, const std::string& text, std::uint64_t min, std::uint64_t max) {
    const bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digits) {
        throw ConfigError(fmt::format("Invalid value for {}: '{}'", option, text));
    }

    std::uint64_t value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigError(fmt::format("Value for {} is out of range: {}", option, text));
    }
    if (value < min || value > max) {
        throw ConfigError(fmt::format("Value for {} must be between {} and {}", option, min, max));
    }
    return value;
}

bool parseBool(const std::string& option, const std::string& text) {
    if (text == "true" || text == "1" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        return false;
    }
    throw ConfigError(fmt::format("Invalid value for {}: '{}' (expected true or false)", option, text));
}

} // namespace

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    CommandLine result;
    JobConfig& config = result.config;
    bool have_url = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string option = args[i];
        std::optional<std::string> inline_value;
        if (option.rfind("--", 0) == 0) {
            const auto eq = option.find('=');
            if (eq != std::string::npos) {
                inline_value = option.substr(eq + 1);
                option.resize(eq);
            }
        }

        const auto value = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= args.size()) {
                throw ConfigError(fmt::format("Missing value for {}", option));
            }
            return args[++i];
        };
        const auto no_value = [&] {
            if (inline_value) {
                throw ConfigError(fmt::format("Option {} takes no value", option));
            }
        };

        if (option == "-h" || option == "--help") {
            no_value();
            result.help_requested = true;
            return result;
        } else if (option == "-c" || option == "--connection-count") {
            config.connection_count = static_cast<unsigned>(parseNumber(option, value(), 1, 255));
        } else if (option == "--chunk-size") {
            config.chunk_size = static_cast<std::size_t>(
                parseNumber(option, value(), 1, std::numeric_limits<std::size_t>::max()));
        } else if (option == "-s" || option == "--speed-limit") {
            config.speed_limit = parseNumber(option, value(), 1, std::numeric_limits<std::uint64_t>::max());
        } else if (option == "-p" || option == "--progress") {
            config.progress = inline_value ? parseBool(option, *inline_value) : true;
        } else if (option == "--no-progress") {
            no_value();
            config.progress = false;
        } else if (option == "--silence") {
            no_value();
            config.silence = true;
        } else if (option == "-d" || option == "--dir") {
            config.directory = value();
            if (config.directory.empty()) {
                throw ConfigError("Download directory must not be empty");
            }
        } else if (option == "-v" || option == "--verbose") {
            no_value();
            config.verbose = true;
        } else if (option == "--log-file") {
            config.log_file = value();
        } else if (!option.empty() && option[0] == '-') {
            throw ConfigError(fmt::format("Unknown option: {}", option));
        } else {
            if (have_url) {
                throw ConfigError(fmt::format("Unexpected argument: {}", option));
            }
            if (!detail::isWellFormedUrl(option)) {
                throw ConfigError(fmt::format("Invalid URL: {}", option));
            }
            config.url = option;
            have_url = true;
        }
    }

    if (!have_url) {
        throw ConfigError("Missing URL");
    }
    return result;
}

std::string usage(std::string_view program_name) {
    return fmt::format(
        "Usage: {} [options] <url>\n"
        "Options:\n"
        "  -c, --connection-count <n>   Parallel connections, 1-255 (default: 3)\n"
        "      --chunk-size <bytes>     Size of each range request (default: 4194304)\n"
        "  -s, --speed-limit <bytes/s>  Overall download speed ceiling (default: unlimited)\n"
        "  -p, --progress[=true|false]  Show the progress bar (default: true)\n"
        "      --no-progress            Hide the progress bar\n"
        "      --silence                Suppress progress, summary and path output\n"
        "  -d, --dir <directory>        Download directory (default: current directory)\n"
        "  -v, --verbose                Enable debug logging\n"
        "      --log-file <path>        Also write logs to a file\n"
        "  -h, --help                   Show this message\n",
        program_name);
}

} // namespace surge
