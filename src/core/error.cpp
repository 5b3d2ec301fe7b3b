#include "psync/core/error.hpp"

namespace psync {

TransferError TransferError::io(std::string reason, std::error_code code) {
    return TransferError(Io{std::move(reason), code});
}

TransferError TransferError::not_found(std::string path) {
    return TransferError(NotFound{std::move(path)});
}

TransferError TransferError::other(std::string message) {
    return TransferError(Other{std::move(message)});
}

TransferError TransferError::from_error_code(const std::error_code& code, const std::string& path) {
    if (code == std::errc::no_such_file_or_directory) {
        return not_found(path);
    }
    return io(path + ": " + code.message(), code);
}

ErrorKind TransferError::kind() const noexcept {
    switch (data_.index()) {
        case 0: return ErrorKind::Io;
        case 1: return ErrorKind::NotFound;
        default: return ErrorKind::Other;
    }
}

const std::string& TransferError::message() const noexcept {
    if (const auto* io = std::get_if<Io>(&data_)) {
        return io->reason;
    }
    if (const auto* missing = std::get_if<NotFound>(&data_)) {
        return missing->path;
    }
    return std::get<Other>(data_).message;
}

std::error_code TransferError::code() const noexcept {
    if (const auto* io = std::get_if<Io>(&data_)) {
        return io->code;
    }
    return {};
}

std::string TransferError::to_string() const {
    return std::string(psync::to_string(kind())) + ": " + message();
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Io: return "Io";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Other: return "Other";
    }
    return "Unknown";
}

} // namespace psync
