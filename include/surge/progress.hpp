#pragma once

#include <cstdint>
#include <optional>

namespace surge {

struct ProgressSample {
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    std::uint64_t throughput_bytes_per_sec{0};
};

enum class DownloadOutcome {
    Finished,
    Cancelled,
};

[[nodiscard]] const char* describe(DownloadOutcome outcome) noexcept;

} // namespace surge
