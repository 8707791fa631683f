#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace surge {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct JobConfig {
    std::string url;
    unsigned connection_count{3};
    std::size_t chunk_size{4 * 1024 * 1024};
    std::optional<std::uint64_t> speed_limit;
    bool progress{true};
    bool silence{false};
    std::filesystem::path directory{"."};
    bool verbose{false};
    std::string log_file;
};

struct CommandLine {
    bool help_requested{false};
    JobConfig config;
};

// Parses the arguments following the program name. Throws ConfigError.
[[nodiscard]] CommandLine parseCommandLine(const std::vector<std::string>& args);

[[nodiscard]] std::string usage(std::string_view program_name);

} // namespace surge
