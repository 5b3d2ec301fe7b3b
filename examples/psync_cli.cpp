#include "psync/config/config.hpp"
#include "psync/core/format.hpp"
#include "psync/core/platform.hpp"
#include "psync/events/components.hpp"
#include "psync/events/event_bus.hpp"
#include "psync/storage/local_backend.hpp"
#include "psync/storage/resolve.hpp"
#include "psync/transfer/chunk_sync.hpp"
#include "psync/transfer/compare.hpp"
#include "psync/transfer/copy_engine.hpp"
#include "psync/transfer/delete_engine.hpp"
#include "psync/transfer/synchronizer.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using psync::Status;
using psync::config::EngineConfig;

struct CliArgs {
    std::string command;
    std::vector<std::string> paths;
    std::optional<std::string> config_file;
    std::optional<std::size_t> threads;
    std::optional<std::string> include;
    std::optional<std::string> exclude;
    std::optional<std::size_t> chunk_size;
    bool dry_run = false;
    bool no_progress = false;
    bool no_preserve_times = false;
    bool no_verify = false;
    bool verbose = false;
    bool diagnostics = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [OPTIONS] PATH...\n\n";
    std::cout << "Commands:\n";
    std::cout << "  copy SRC DST          Parallel copy of a tree or file\n";
    std::cout << "  delete PATH...        Parallel delete, deepest directories first\n";
    std::cout << "  sync SRC DST          Chunked incremental sync (rewrites changed chunks only)\n";
    std::cout << "  mirror SRC DST        Hash-verified sync incl. symlinks and empty directories\n";
    std::cout << "  diff SRC DST          Report differences between two local trees\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --threads N           Worker threads (default: hardware concurrency)\n";
    std::cout << "  --include RE          Only paths matching RE\n";
    std::cout << "  --exclude RE          Skip paths matching RE\n";
    std::cout << "  --chunk-size BYTES    Sync chunk size (default: 1048576)\n";
    std::cout << "  --dry-run             Report what would happen, change nothing\n";
    std::cout << "  --no-progress         Do not draw a progress bar\n";
    std::cout << "  --no-preserve-times   Do not carry modification times over\n";
    std::cout << "  --no-verify           mirror: do not skip files with matching hashes\n";
    std::cout << "  --config FILE         Load options from a JSON file (flags win)\n";
    std::cout << "  --verbose             Debug logging\n";
    std::cout << "  --diagnostics         Info logging, effective config and statistics\n";
    std::cout << "  --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Locations are local paths or file:// URLs.\n";
}

// Accepts a decimal count in [1, max]; stoull would wrap "-1" to a huge value
bool parse_size(const std::string& flag, const char* text, std::size_t max, std::size_t& out) {
    if (!std::isdigit(static_cast<unsigned char>(text[0]))) {
        spdlog::error("Invalid value for {}: {}", flag, text);
        return false;
    }
    try {
        std::size_t consumed = 0;
        const unsigned long long value = std::stoull(text, &consumed);
        if (consumed != std::string(text).size() || value == 0 || value > max) {
            spdlog::error("Invalid value for {}: {} (expected 1 to {})", flag, text, max);
            return false;
        }
        out = static_cast<std::size_t>(value);
        return true;
    } catch (const std::exception&) {
        spdlog::error("Invalid value for {}: {}", flag, text);
        return false;
    }
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto needs_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--threads") {
            const char* value = needs_value();
            std::size_t threads = 0;
            if (!value || !parse_size(arg, value, psync::transfer::kMaxWorkers, threads)) {
                return std::nullopt;
            }
            args.threads = threads;
        } else if (arg == "--chunk-size") {
            const char* value = needs_value();
            std::size_t chunk_size = 0;
            if (!value || !parse_size(arg, value, psync::transfer::kMaxChunkSize, chunk_size)) {
                return std::nullopt;
            }
            args.chunk_size = chunk_size;
        } else if (arg == "--include") {
            const char* value = needs_value();
            if (!value) {
                return std::nullopt;
            }
            args.include = value;
        } else if (arg == "--exclude") {
            const char* value = needs_value();
            if (!value) {
                return std::nullopt;
            }
            args.exclude = value;
        } else if (arg == "--config") {
            const char* value = needs_value();
            if (!value) {
                return std::nullopt;
            }
            args.config_file = value;
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--no-progress") {
            args.no_progress = true;
        } else if (arg == "--no-preserve-times") {
            args.no_preserve_times = true;
        } else if (arg == "--no-verify") {
            args.no_verify = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--diagnostics") {
            args.diagnostics = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.paths.push_back(arg);
        }
    }
    return args;
}

std::optional<EngineConfig> build_config(const CliArgs& args) {
    EngineConfig config;
    if (args.config_file) {
        auto loaded = psync::config::load_config(*args.config_file);
        if (loaded.is_error()) {
            spdlog::error("Cannot load {}: {}", *args.config_file, loaded.error().to_string());
            return std::nullopt;
        }
        config = loaded.value();
    }

    if (args.threads) config.threads = *args.threads;
    if (args.include) config.include = *args.include;
    if (args.exclude) config.exclude = *args.exclude;
    if (args.chunk_size) config.chunk_size = *args.chunk_size;
    if (args.dry_run) config.dry_run = true;
    if (args.no_progress) config.no_progress = true;
    if (args.no_preserve_times) config.preserve_times = false;
    if (args.no_verify) config.verify = false;
    return config;
}

std::optional<psync::storage::ResolvedLocation> resolve(const std::string& location) {
    auto resolved = psync::storage::resolve_backend(location);
    if (resolved.is_error()) {
        spdlog::error("{}: {}", location, resolved.error().to_string());
        return std::nullopt;
    }
    return resolved.value();
}

bool expect_paths(const CliArgs& args, std::size_t count) {
    if (args.paths.size() != count) {
        spdlog::error("'{}' expects {} path(s), got {}", args.command, count, args.paths.size());
        return false;
    }
    return true;
}

int report(const Status& status, const psync::events::MetricsComponent& metrics, bool diagnostics) {
    const auto& stats = metrics.get_stats();
    if (stats.bytes_copied > 0 || stats.bytes_rewritten > 0) {
        spdlog::info("Transferred {} ({} files), rewrote {} in {} chunks",
                     psync::human_readable_size(stats.bytes_copied.load()), stats.files_copied.load(),
                     psync::human_readable_size(stats.bytes_rewritten.load()), stats.chunks_rewritten.load());
    }
    if (diagnostics) {
        metrics.print_stats();
    }
    if (status.is_error()) {
        spdlog::error("{}", status.error().to_string());
        std::cerr << stats.failures.load() << " item(s) failed\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = parse_args(argc, argv);
    if (!parsed || parsed->command.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    const CliArgs& args = *parsed;

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.diagnostics) {
        spdlog::set_level(spdlog::level::info);
    }

    auto config = build_config(args);
    if (!config) {
        return 1;
    }
    auto filters = psync::config::compile_filters(*config);
    if (filters.is_error()) {
        spdlog::error("{}", filters.error().to_string());
        return 1;
    }

    if (args.diagnostics) {
        spdlog::info("Platform: {} (accelerated copy: {})", psync::platform_name(),
                     psync::has_accelerated_copy() ? "yes" : "no");
        spdlog::info("Effective config:\n{}", psync::config::to_json(*config));
    }

    psync::events::EventBus bus;
    psync::events::LoggerComponent logger(bus);
    psync::events::MetricsComponent metrics(bus);
    const psync::transfer::EngineContext context{nullptr, &bus, nullptr};

    if (args.command == "copy" || args.command == "sync") {
        if (!expect_paths(args, 2)) {
            return 1;
        }
        auto source = resolve(args.paths[0]);
        auto dest = resolve(args.paths[1]);
        if (!source || !dest) {
            return 1;
        }

        Status status = psync::Ok<psync::TransferError>();
        if (args.command == "copy") {
            status = psync::transfer::copy(*source->backend, source->path, *dest->backend, dest->path,
                                           psync::config::to_copy_options(*config, filters.value()), context);
        } else {
            if (!config->include.empty() || !config->exclude.empty()) {
                spdlog::warn("--include/--exclude are ignored by sync");
            }
            status = psync::transfer::sync(*source->backend, source->path, *dest->backend, dest->path,
                                           psync::config::to_sync_options(*config), context);
        }
        return report(status, metrics, args.diagnostics);
    }

    if (args.command == "delete") {
        if (args.paths.empty()) {
            spdlog::error("'delete' expects at least one path");
            return 1;
        }
        std::shared_ptr<psync::storage::StorageBackend> backend;
        std::vector<std::string> roots;
        for (const auto& location : args.paths) {
            auto resolved = resolve(location);
            if (!resolved) {
                return 1;
            }
            backend = resolved->backend;
            roots.push_back(resolved->path);
        }
        const auto status = psync::transfer::remove_tree(*backend, roots,
                                                         psync::config::to_delete_options(*config, filters.value()),
                                                         context);
        return report(status, metrics, args.diagnostics);
    }

    if (args.command == "mirror") {
        if (!expect_paths(args, 2)) {
            return 1;
        }
        psync::storage::LocalSource source;
        psync::storage::LocalSink sink;
        psync::transfer::Synchronizer synchronizer(source, sink);
        const auto items = synchronizer.files_to_sync(args.paths[0], args.paths[1], filters.value().include_ptr(),
                                                      filters.value().exclude_ptr(), config->verify);
        spdlog::info("{} item(s) to transfer", items.size());
        const auto status = synchronizer.sync_files(items, args.paths[0], args.paths[1],
                                                    psync::config::to_synchronizer_options(*config), context);
        return report(status, metrics, args.diagnostics);
    }

    if (args.command == "diff") {
        if (!expect_paths(args, 2)) {
            return 1;
        }
        const auto differences = psync::transfer::compare_dirs(args.paths[0], args.paths[1]);
        if (!differences.passed()) {
            std::cerr << differences.difference_count() << " difference(s)\n";
            return 1;
        }
        std::cout << "No differences\n";
        return 0;
    }

    spdlog::error("Unknown command: {}", args.command);
    print_usage(argv[0]);
    return 1;
}
