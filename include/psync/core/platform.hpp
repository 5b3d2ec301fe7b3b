#pragma once

#ifdef _WIN32
    #define PSYNC_PLATFORM_WINDOWS
#else
    #define PSYNC_PLATFORM_POSIX
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

// Reflink, copy_file_range and sendfile tiers
#if defined(__linux__)
    #define PSYNC_PLATFORM_LINUX
    #define PSYNC_HAS_ACCELERATED_COPY 1
#else
    #define PSYNC_HAS_ACCELERATED_COPY 0
#endif

namespace psync {

constexpr const char* platform_name() noexcept {
#if defined(PSYNC_PLATFORM_LINUX)
    return "Linux";
#elif defined(PSYNC_PLATFORM_WINDOWS)
    return "Windows";
#else
    return "POSIX";
#endif
}

/// True when FastCopier's default chain starts with kernel-side copy tiers
constexpr bool has_accelerated_copy() noexcept {
    return PSYNC_HAS_ACCELERATED_COPY != 0;
}

} // namespace psync
