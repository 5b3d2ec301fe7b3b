#pragma once

#include "psync/storage/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace psync::storage {

/// 64-bit FNV-1a over the bytes, as 16 hex characters
Digest hash_bytes(const std::vector<std::uint8_t>& data);

/// Streams the file through FNV-1a; nullopt when it cannot be opened
std::optional<Digest> hash_file(const std::filesystem::path& path);

} // namespace psync::storage
