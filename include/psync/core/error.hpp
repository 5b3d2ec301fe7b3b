#pragma once

#include "psync/core/result.hpp"

#include <string>
#include <system_error>
#include <variant>

namespace psync {

enum class ErrorKind {
    Io,        // Underlying I/O fault, carries the OS error code
    NotFound,  // Referenced path did not exist at access time
    Other      // Protocol/backend specific or aggregate failure
};

/**
 * @brief Failure of a single transfer step (copy, delete, chunk write, listing)
 *
 * Per-item failures are accumulated in an ErrorCollector and never cancel
 * other in-flight work. Engines fold them into one aggregate Other error.
 */
class TransferError {
public:
    static TransferError io(std::string reason, std::error_code code = {});
    static TransferError not_found(std::string path);
    static TransferError other(std::string message);

    /// Maps ENOENT to NotFound(path), anything else to Io
    static TransferError from_error_code(const std::error_code& code, const std::string& path);

    [[nodiscard]] ErrorKind kind() const noexcept;
    [[nodiscard]] bool is_not_found() const noexcept { return kind() == ErrorKind::NotFound; }

    /// Reason, missing path or message depending on kind()
    [[nodiscard]] const std::string& message() const noexcept;

    /// OS error code for Io failures, empty otherwise
    [[nodiscard]] std::error_code code() const noexcept;

    [[nodiscard]] std::string to_string() const;

private:
    struct Io {
        std::string reason;
        std::error_code code;
    };
    struct NotFound {
        std::string path;
    };
    struct Other {
        std::string message;
    };

    using Payload = std::variant<Io, NotFound, Other>;

    explicit TransferError(Payload payload) : data_(std::move(payload)) {}

    Payload data_;
};

const char* to_string(ErrorKind kind) noexcept;

using Status = Result<void, TransferError>;

template<typename T>
using TransferResult = Result<T, TransferError>;

} // namespace psync
