#include "surge/byte_format.hpp"

#include <array>
#include <cstddef>

namespace surge {

ScaledBytes scaleBytes(std::uint64_t bytes) noexcept {
    static constexpr std::array<std::string_view, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};

    std::size_t i = 0;
    auto value = static_cast<float>(bytes);
    while (value >= 1024.0F && i < units.size() - 1) {
        ++i;
        value /= 1024.0F;
    }
    return {value, units[i]};
}

} // namespace surge
