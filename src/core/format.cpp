#include "psync/core/format.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace psync {

std::string human_readable_size(double bytes) {
    static constexpr std::array<const char*, 7> units{"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < units.size()) {
        bytes /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << bytes << ' ' << units[unit];
    return oss.str();
}

} // namespace psync
