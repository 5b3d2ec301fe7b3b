#pragma once

#include "psync/events/event_bus.hpp"
#include "psync/progress/progress.hpp"
#include "psync/transfer/fast_copy.hpp"

#include <cstddef>
#include <regex>
#include <string>

namespace psync::transfer {

/// Upper bound on worker threads per engine run; larger requests are clamped
constexpr std::size_t kMaxWorkers = 1024;

/**
 * @brief Collaborators handed to an engine invocation
 *
 * Every member is optional:
 * - progress: nullptr builds a reporter from the options' no_progress flag
 * - events:   nullptr publishes nothing
 * - copier:   nullptr uses FastCopier::shared()
 */
struct EngineContext {
    progress::ProgressReporter* progress = nullptr;
    events::EventBus* events = nullptr;
    const FastCopier* copier = nullptr;
};

/**
 * @brief Include then exclude, both searched anywhere in the full path
 *
 * A null pattern does not filter.
 */
inline bool passes_filters(const std::string& path, const std::regex* include, const std::regex* exclude) {
    if (include && !std::regex_search(path, *include)) {
        return false;
    }
    if (exclude && std::regex_search(path, *exclude)) {
        return false;
    }
    return true;
}

} // namespace psync::transfer
