#include "psync/progress/progress.hpp"

#include "psync/core/format.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace psync::progress {
namespace {

constexpr std::size_t kBarWidth = 40;
constexpr auto kRenderInterval = std::chrono::milliseconds(100);

std::string format_elapsed(std::chrono::steady_clock::duration elapsed) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << seconds / 3600 << ':'
        << std::setw(2) << (seconds / 60) % 60 << ':'
        << std::setw(2) << seconds % 60;
    return oss.str();
}

std::string format_amount(std::uint64_t value, ProgressUnit unit) {
    if (unit == ProgressUnit::Bytes) {
        return human_readable_size(value);
    }
    return std::to_string(value);
}

} // namespace

void CountingProgress::finish(const std::string& message) {
    {
        std::lock_guard lock(message_mutex_);
        finish_message_ = message;
    }
    finished_.store(true);
}

std::string CountingProgress::finish_message() const {
    std::lock_guard lock(message_mutex_);
    return finish_message_;
}

ConsoleProgress::ConsoleProgress(std::ostream& out, ProgressUnit unit, std::string label)
    : out_(out),
      unit_(unit),
      label_(std::move(label)),
      started_(std::chrono::steady_clock::now()),
      last_render_(started_) {}

void ConsoleProgress::increment(std::uint64_t n) {
    CountingProgress::increment(n);
    maybe_render();
}

void ConsoleProgress::increment_total(std::uint64_t n) {
    CountingProgress::increment_total(n);
    maybe_render();
}

void ConsoleProgress::finish(const std::string& message) {
    CountingProgress::finish(message);
    std::lock_guard lock(render_mutex_);
    out_ << '\r' << render_line() << ' ' << message << std::endl;
}

std::string ConsoleProgress::render_line() const {
    const auto done = position();
    const auto all = total();
    std::size_t filled = 0;
    if (all > 0) {
        filled = static_cast<std::size_t>((static_cast<double>(done) / static_cast<double>(all)) * kBarWidth);
        if (filled > kBarWidth) {
            filled = kBarWidth;
        }
    }

    std::ostringstream line;
    line << '[' << format_elapsed(std::chrono::steady_clock::now() - started_) << "] ["
         << std::string(filled, '#') << std::string(kBarWidth - filled, '-') << "] "
         << format_amount(done, unit_) << '/' << format_amount(all, unit_);
    if (!label_.empty()) {
        line << ' ' << label_;
    }
    return line.str();
}

void ConsoleProgress::maybe_render() {
    std::unique_lock lock(render_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now - last_render_ < kRenderInterval) {
        return;
    }
    last_render_ = now;
    out_ << '\r' << render_line() << std::flush;
}

std::unique_ptr<ProgressReporter> make_progress(bool no_progress, ProgressUnit unit, std::string label) {
    if (no_progress) {
        return std::make_unique<NullProgress>();
    }
    return std::make_unique<ConsoleProgress>(std::cerr, unit, std::move(label));
}

} // namespace psync::progress
