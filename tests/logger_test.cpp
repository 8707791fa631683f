#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <spdlog/spdlog.h>

#include "surge/logger.hpp"

using namespace ::testing;
using namespace ::surge;

namespace fs = std::filesystem;

TEST(LoggerTest, WritesToFileAndRestoresDefault)
{
    const auto path     = fs::temp_directory_path() / ("surge_logger_" + std::to_string(::getpid()) + ".log");
    const auto previous = spdlog::default_logger();
    {
        Logger logger {Logger::Level::info, path.string()};
        EXPECT_EQ(spdlog::default_logger(), logger.logger());
        EXPECT_EQ(logger.logLevel(), Logger::Level::info);

        spdlog::info("transfer started");
        spdlog::debug("hidden detail");

        logger.setLogLevel(Logger::Level::debug);
        spdlog::debug("visible detail");
    }
    EXPECT_EQ(spdlog::default_logger(), previous);

    std::ifstream      in {path};
    const std::string  contents {std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {}};
    EXPECT_THAT(contents, HasSubstr("[info] transfer started"));
    EXPECT_THAT(contents, HasSubstr("[debug] visible detail"));
    EXPECT_THAT(contents, Not(HasSubstr("hidden detail")));

    std::error_code ec;
    fs::remove(path, ec);
}
