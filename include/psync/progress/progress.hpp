#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace psync::progress {

enum class ProgressUnit {
    Bytes,
    Items
};

/**
 * @brief Progress sink shared by the producer and every worker of one engine run
 *
 * All methods may be called concurrently. The discovered total may keep
 * growing while traversal is running; processed may transiently overshoot
 * it by one increment.
 */
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void increment(std::uint64_t n) = 0;
    virtual void increment_total(std::uint64_t n) = 0;
    virtual void set_total(std::uint64_t total) = 0;
    virtual void finish(const std::string& message) = 0;

    [[nodiscard]] virtual std::uint64_t position() const = 0;
    [[nodiscard]] virtual std::uint64_t total() const = 0;
};

/**
 * @brief Null object used when progress output is disabled
 */
class NullProgress final : public ProgressReporter {
public:
    void increment(std::uint64_t) override {}
    void increment_total(std::uint64_t) override {}
    void set_total(std::uint64_t) override {}
    void finish(const std::string&) override {}

    std::uint64_t position() const override { return 0; }
    std::uint64_t total() const override { return 0; }
};

/**
 * @brief Lock-free counters, no output
 */
class CountingProgress : public ProgressReporter {
public:
    void increment(std::uint64_t n) override { position_.fetch_add(n, std::memory_order_relaxed); }
    void increment_total(std::uint64_t n) override { total_.fetch_add(n, std::memory_order_relaxed); }
    void set_total(std::uint64_t total) override { total_.store(total, std::memory_order_relaxed); }
    void finish(const std::string& message) override;

    std::uint64_t position() const override { return position_.load(std::memory_order_relaxed); }
    std::uint64_t total() const override { return total_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool finished() const noexcept { return finished_.load(); }
    [[nodiscard]] std::string finish_message() const;

private:
    std::atomic<std::uint64_t> position_{0};
    std::atomic<std::uint64_t> total_{0};
    std::atomic<bool> finished_{false};
    mutable std::mutex message_mutex_;
    std::string finish_message_;
};

/**
 * @brief Text progress bar, redrawn at most every 100ms
 *
 * Rendering is serialized by an internal mutex; a worker that finds the
 * bar busy simply skips the redraw.
 */
class ConsoleProgress final : public CountingProgress {
public:
    ConsoleProgress(std::ostream& out, ProgressUnit unit, std::string label);

    void increment(std::uint64_t n) override;
    void increment_total(std::uint64_t n) override;
    void finish(const std::string& message) override;

    [[nodiscard]] std::string render_line() const;

private:
    void maybe_render();

    std::ostream& out_;
    ProgressUnit unit_;
    std::string label_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_render_;
    std::mutex render_mutex_;
};

/**
 * @brief NullProgress when disabled, a ConsoleProgress on stderr otherwise
 */
std::unique_ptr<ProgressReporter> make_progress(bool no_progress, ProgressUnit unit, std::string label);

} // namespace psync::progress
