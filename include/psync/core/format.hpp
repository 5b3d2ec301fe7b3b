#pragma once

#include <cstdint>
#include <string>

namespace psync {

/**
 * @brief Format a byte count with binary units, e.g. 1536 -> "1.50 KiB"
 */
std::string human_readable_size(double bytes);

inline std::string human_readable_size(std::uint64_t bytes) {
    return human_readable_size(static_cast<double>(bytes));
}

} // namespace psync
