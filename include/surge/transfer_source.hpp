#pragma once

#include "progress.hpp"
#include "progress_signal.hpp"

#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>

namespace surge {

// What the progress display needs from a download engine.
class TransferSource {
public:
    virtual ~TransferSource() = default;

    // Begins the transfer. The future resolves with the outcome or carries the
    // transfer failure. The progress signal is closed before it resolves.
    [[nodiscard]] virtual std::future<DownloadOutcome> start() = 0;

    [[nodiscard]] virtual ProgressReceiver subscribe() const = 0;
    [[nodiscard]] virtual std::optional<std::uint64_t> totalSize() const = 0;
    [[nodiscard]] virtual std::uint64_t downloadSpeed() const = 0;
    [[nodiscard]] virtual std::filesystem::path filePath() const = 0;

    virtual void cancel() noexcept = 0;
};

} // namespace surge
