#include "psync/storage/resolve.hpp"

#include <gtest/gtest.h>

using psync::ErrorKind;
using psync::storage::Locality;
using psync::storage::resolve_backend;

TEST(ResolveBackendTest, FileUrlMapsToLocalPath) {
    auto resolved = resolve_backend("file:///tmp/data");
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value().path, "/tmp/data");
    EXPECT_EQ(resolved.value().backend->locality(), Locality::Local);
    EXPECT_EQ(resolved.value().backend->name(), "local");
}

TEST(ResolveBackendTest, BarePathsAreLocal) {
    auto absolute = resolve_backend("/var/backups");
    ASSERT_TRUE(absolute.is_ok());
    EXPECT_EQ(absolute.value().path, "/var/backups");

    auto relative = resolve_backend("some/dir");
    ASSERT_TRUE(relative.is_ok());
    EXPECT_EQ(relative.value().path, "some/dir");
}

TEST(ResolveBackendTest, UnknownSchemeIsRejected) {
    auto resolved = resolve_backend("ftp://example.com/pub");
    ASSERT_TRUE(resolved.is_error());
    EXPECT_EQ(resolved.error().kind(), ErrorKind::Other);
    EXPECT_EQ(resolved.error().message(), "Unsupported protocol: ftp");
}

TEST(ResolveBackendTest, RemoteShellLocationNamesHost) {
    auto resolved = resolve_backend("alice@backup.example.com:/srv/data");
    ASSERT_TRUE(resolved.is_error());
    EXPECT_EQ(resolved.error().kind(), ErrorKind::Other);
    EXPECT_NE(resolved.error().message().find("alice@backup.example.com"), std::string::npos);
}
