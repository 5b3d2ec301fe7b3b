#pragma once

// Plumbing shared by the copy, delete and sync engines

#include "psync/core/error_collector.hpp"
#include "psync/events/event_bus.hpp"
#include "psync/events/events.hpp"
#include "psync/transfer/engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace psync::transfer::detail {

/**
 * @brief Resolves an EngineContext's optional members for one run
 *
 * Owns the fallback progress reporter when the caller did not supply one.
 */
class RunContext {
public:
    RunContext(const EngineContext& context, std::string operation,
               bool no_progress, progress::ProgressUnit unit)
        : operation_(std::move(operation)),
          events_(context.events),
          copier_(context.copier ? context.copier : &FastCopier::shared()),
          started_(std::chrono::steady_clock::now()) {
        if (context.progress) {
            progress_ = context.progress;
        } else {
            owned_progress_ = progress::make_progress(no_progress, unit, operation_);
            progress_ = owned_progress_.get();
        }
    }

    progress::ProgressReporter& progress() { return *progress_; }
    const FastCopier& copier() const { return *copier_; }
    ErrorCollector& errors() { return errors_; }

    template<typename Event>
    void publish(const Event& event) {
        events::publish(events_, event);
    }

    /**
     * @brief Log, record and publish one failed item
     */
    void fail(const std::string& path, TransferError error) {
        spdlog::error("{} failed for {}: {}", operation_, path, error.to_string());
        publish(events::TransferFailedEvent{operation_, path, error});
        errors_.push(std::move(error));
    }

    /**
     * @brief Finish progress, publish the summary and fold the errors
     */
    Status complete(const std::string& finish_message) {
        progress_->finish(finish_message);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_);
        publish(events::OperationCompletedEvent{operation_, errors_.size(), elapsed});
        return errors_.into_status(operation_);
    }

private:
    std::string operation_;
    events::EventBus* events_;
    const FastCopier* copier_;
    std::chrono::steady_clock::time_point started_;
    std::unique_ptr<progress::ProgressReporter> owned_progress_;
    progress::ProgressReporter* progress_ = nullptr;
    ErrorCollector errors_;
};

/// `requested` clamped to [1, kMaxWorkers]
inline std::size_t worker_count(std::size_t requested) {
    return std::clamp<std::size_t>(requested, 1, kMaxWorkers);
}

/**
 * @brief Worker threads of one run, joined on destruction
 *
 * When start() fails part way, the threads already running keep waiting
 * for work: the caller must release them (close the queue, exhaust the
 * cursor) before the group goes out of scope.
 */
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    template<typename Body>
    Status start(std::size_t count, const Body& body) {
        try {
            threads_.reserve(count);
            for (std::size_t i = 0; i < count; ++i) {
                threads_.emplace_back(body);
            }
        } catch (const std::system_error& e) {
            spdlog::error("Started {} of {} workers: {}", threads_.size(), count, e.what());
            return Err<void>(TransferError::other(std::string("Cannot start worker threads: ") + e.what()));
        }
        return Ok<TransferError>();
    }

    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::vector<std::thread> threads_;
};

/**
 * @brief Path of `path` below `root`, "" when they are equal
 *
 * Walk results always start with the root string exactly as given, so a
 * prefix strip is enough; anything else falls back to lexical relativity.
 */
inline std::string relative_to(const std::string& path, const std::string& root) {
    if (path.compare(0, root.size(), root) == 0) {
        std::size_t pos = root.size();
        const bool at_boundary = pos == path.size() || path[pos] == '/' || (!root.empty() && root.back() == '/');
        if (at_boundary) {
            while (pos < path.size() && path[pos] == '/') {
                ++pos;
            }
            return path.substr(pos);
        }
    }
    const auto relative = std::filesystem::path(path).lexically_relative(root);
    if (relative.empty() || relative == ".") {
        return std::string();
    }
    return relative.generic_string();
}

/**
 * @brief `root` joined with `relative`, `root` itself for an empty relative part
 */
inline std::string join_path(const std::string& root, const std::string& relative) {
    if (relative.empty()) {
        return root;
    }
    return (std::filesystem::path(root) / relative).string();
}

} // namespace psync::transfer::detail
