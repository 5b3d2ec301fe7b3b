#pragma once

#include "psync/core/error.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace psync {

/**
 * @brief Shared sink for per-item failures of one engine invocation
 *
 * Workers push into it and carry on; the engine inspects it after all
 * workers have been joined. Mutated rarely compared to progress updates,
 * so a single mutex is enough.
 */
class ErrorCollector {
public:
    ErrorCollector() = default;

    ErrorCollector(const ErrorCollector&) = delete;
    ErrorCollector& operator=(const ErrorCollector&) = delete;

    void push(TransferError error) {
        std::lock_guard lock(mutex_);
        errors_.push_back(std::move(error));
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return errors_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return errors_.empty();
    }

    std::vector<TransferError> take() {
        std::lock_guard lock(mutex_);
        std::vector<TransferError> out;
        out.swap(errors_);
        return out;
    }

    /**
     * @brief Ok when nothing failed, else Other("<n> errors occurred during <operation>")
     */
    Status into_status(const std::string& operation) const {
        const auto count = size();
        if (count == 0) {
            return Ok<TransferError>();
        }
        return Err<void>(TransferError::other(std::to_string(count) + " errors occurred during " + operation));
    }

private:
    mutable std::mutex mutex_;
    std::vector<TransferError> errors_;
};

} // namespace psync
