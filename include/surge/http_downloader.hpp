#pragma once

#include "transfer_source.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace surge {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DownloadOptions {
    unsigned connection_count{3};
    std::size_t chunk_size{4 * 1024 * 1024};
    std::optional<std::uint64_t> speed_limit;
};

class HttpDownloader final : public TransferSource {
public:
    HttpDownloader(std::string url, const std::filesystem::path& directory, DownloadOptions options = {});
    ~HttpDownloader() override;

    [[nodiscard]] std::future<DownloadOutcome> start() override;
    [[nodiscard]] ProgressReceiver subscribe() const override;
    [[nodiscard]] std::optional<std::uint64_t> totalSize() const override;
    [[nodiscard]] std::uint64_t downloadSpeed() const override;
    [[nodiscard]] std::filesystem::path filePath() const override;
    void cancel() noexcept override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace surge
