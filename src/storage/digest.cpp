#include "psync/storage/digest.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace psync::storage {
namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime  = 0x100000001b3ULL;

std::string to_hex(std::uint64_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

} // namespace

Digest hash_bytes(const std::vector<std::uint8_t>& data) {
    std::uint64_t hash = kFnvOffset;
    for (std::uint8_t byte : data) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= kFnvPrime;
    }
    return to_hex(hash);
}

std::optional<Digest> hash_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    std::uint64_t hash = kFnvOffset;
    char buffer[8192];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        for (std::streamsize i = 0; i < count; ++i) {
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i]));
            hash *= kFnvPrime;
        }
    }
    if (input.bad()) {
        return std::nullopt;
    }
    return to_hex(hash);
}

} // namespace psync::storage
