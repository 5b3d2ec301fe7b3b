#include "psync/storage/resolve.hpp"

#include "psync/storage/local_backend.hpp"

#include <regex>

namespace psync::storage {

TransferResult<ResolvedLocation> resolve_backend(const std::string& location) {
    static const std::regex url_pattern(R"(^([A-Za-z][A-Za-z0-9+.\-]*)://(.*)$)");
    static const std::regex remote_shell_pattern(R"(^([^@/:]+)@([^:/]+):(.*)$)");

    std::smatch match;
    if (std::regex_match(location, match, url_pattern)) {
        const std::string scheme = match[1].str();
        if (scheme == "file") {
            return Ok<TransferError>(ResolvedLocation{std::make_shared<LocalBackend>(), match[2].str()});
        }
        return Err<ResolvedLocation>(TransferError::other("Unsupported protocol: " + scheme));
    }

    if (std::regex_match(location, match, remote_shell_pattern)) {
        return Err<ResolvedLocation>(TransferError::other(
            "Unsupported protocol: remote shell location " + match[1].str() + "@" + match[2].str()));
    }

    return Ok<TransferError>(ResolvedLocation{std::make_shared<LocalBackend>(), location});
}

} // namespace psync::storage
