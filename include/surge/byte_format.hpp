#pragma once

#include <cstdint>
#include <string_view>

namespace surge {

struct ScaledBytes {
    float value{0.0F};
    std::string_view unit{"B"};
};

// Scales by 1024 until the value drops below 1024, saturating at PB.
[[nodiscard]] ScaledBytes scaleBytes(std::uint64_t bytes) noexcept;

} // namespace surge
