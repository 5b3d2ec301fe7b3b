#include "psync/config/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <thread>

namespace psync::config {

using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& document, const char* key, T& target) {
    if (document.contains(key)) {
        target = document.at(key).get<T>();
    }
}

/**
 * @brief Read a count that must be a non-negative integer no greater than `limit`
 *
 * nlohmann converts -1 to a huge unsigned value on get<>(), so the stored
 * number type is checked first.
 */
template<typename T>
Status read_count(const json& document, const char* key, std::uint64_t limit, T& target) {
    if (!document.contains(key)) {
        return Ok<TransferError>();
    }
    const auto& value = document.at(key);
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() > limit) {
        return Err<void>(TransferError::other(std::string("Invalid config: ") + key +
                                              " must be a whole number no greater than " + std::to_string(limit)));
    }
    target = static_cast<T>(value.get<std::uint64_t>());
    return Ok<TransferError>();
}

TransferResult<std::regex> compile_pattern(const std::string& pattern, const char* what) {
    try {
        return Ok<TransferError>(std::regex(pattern));
    } catch (const std::regex_error& e) {
        return Err<std::regex>(TransferError::other(std::string("Invalid ") + what + " pattern '" + pattern + "': " + e.what()));
    }
}

} // namespace

std::size_t default_thread_count() {
    const unsigned int hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : std::min<std::size_t>(hardware, transfer::kMaxWorkers);
}

TransferResult<EngineConfig> parse_config(const std::string& json_text, EngineConfig base) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Err<EngineConfig>(TransferError::other(std::string("Invalid config: ") + e.what()));
    }

    if (!document.is_object()) {
        return Err<EngineConfig>(TransferError::other("Invalid config: top level must be an object"));
    }

    if (auto res = read_count(document, "threads", transfer::kMaxWorkers, base.threads); res.is_error()) {
        return Err<EngineConfig>(res.error());
    }
    if (auto res = read_count(document, "chunk_size", transfer::kMaxChunkSize, base.chunk_size); res.is_error()) {
        return Err<EngineConfig>(res.error());
    }
    if (auto res = read_count(document, "large_file_threshold", std::numeric_limits<std::uint64_t>::max(),
                              base.large_file_threshold);
        res.is_error()) {
        return Err<EngineConfig>(res.error());
    }

    try {
        read_key(document, "include", base.include);
        read_key(document, "exclude", base.exclude);
        read_key(document, "dry_run", base.dry_run);
        read_key(document, "no_progress", base.no_progress);
        read_key(document, "preserve_times", base.preserve_times);
        read_key(document, "verify", base.verify);
    } catch (const json::exception& e) {
        return Err<EngineConfig>(TransferError::other(std::string("Invalid config: ") + e.what()));
    }

    if (base.threads == 0) {
        return Err<EngineConfig>(TransferError::other("Invalid config: threads must be > 0"));
    }
    if (base.chunk_size == 0) {
        return Err<EngineConfig>(TransferError::other("Invalid config: chunk_size must be > 0"));
    }

    return Ok<TransferError>(std::move(base));
}

TransferResult<EngineConfig> load_config(const std::filesystem::path& path, EngineConfig base) {
    std::ifstream input(path);
    if (!input) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Err<EngineConfig>(TransferError::not_found(path.string()));
        }
        return Err<EngineConfig>(TransferError::io("Failed to open config file: " + path.string()));
    }

    std::ostringstream contents;
    contents << input.rdbuf();
    return parse_config(contents.str(), std::move(base));
}

std::string to_json(const EngineConfig& config) {
    json document = {
        {"threads", config.threads},
        {"include", config.include},
        {"exclude", config.exclude},
        {"dry_run", config.dry_run},
        {"no_progress", config.no_progress},
        {"preserve_times", config.preserve_times},
        {"verify", config.verify},
        {"chunk_size", config.chunk_size},
        {"large_file_threshold", config.large_file_threshold}
    };
    return document.dump(2);
}

TransferResult<Filters> compile_filters(const EngineConfig& config) {
    Filters filters;
    if (!config.include.empty()) {
        auto include = compile_pattern(config.include, "include");
        if (include.is_error()) {
            return Err<Filters>(include.error());
        }
        filters.include = std::move(include.value());
    }
    if (!config.exclude.empty()) {
        auto exclude = compile_pattern(config.exclude, "exclude");
        if (exclude.is_error()) {
            return Err<Filters>(exclude.error());
        }
        filters.exclude = std::move(exclude.value());
    }
    return Ok<TransferError>(std::move(filters));
}

transfer::CopyOptions to_copy_options(const EngineConfig& config, const Filters& filters) {
    transfer::CopyOptions options;
    options.threads = config.threads;
    options.include = filters.include_ptr();
    options.exclude = filters.exclude_ptr();
    options.dry_run = config.dry_run;
    options.no_progress = config.no_progress;
    options.preserve_times = config.preserve_times;
    return options;
}

transfer::DeleteOptions to_delete_options(const EngineConfig& config, const Filters& filters) {
    transfer::DeleteOptions options;
    options.threads = config.threads;
    options.dry_run = config.dry_run;
    options.no_progress = config.no_progress;
    options.include = filters.include_ptr();
    options.exclude = filters.exclude_ptr();
    return options;
}

transfer::SyncOptions to_sync_options(const EngineConfig& config) {
    transfer::SyncOptions options;
    options.threads = config.threads;
    options.chunk_size = config.chunk_size;
    options.large_file_threshold = config.large_file_threshold;
    options.no_progress = config.no_progress;
    options.dry_run = config.dry_run;
    options.preserve_times = config.preserve_times;
    return options;
}

transfer::SynchronizerOptions to_synchronizer_options(const EngineConfig& config) {
    transfer::SynchronizerOptions options;
    options.threads = config.threads;
    options.dry_run = config.dry_run;
    options.no_progress = config.no_progress;
    return options;
}

} // namespace psync::config
