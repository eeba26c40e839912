#include <gtest/gtest.h>
#include <mcpmgr/config.hpp>
#include <mcpmgr/version.hpp>

TEST(VersionTest, VersionString)
{
    std::string version = mcpmgr::version_string();
    EXPECT_FALSE(version.empty());
    std::string expected = std::to_string(mcpmgr::VERSION_MAJOR) + "." +
                           std::to_string(mcpmgr::VERSION_MINOR) + "." +
                           std::to_string(mcpmgr::VERSION_PATCH);
    EXPECT_EQ(version, expected);
}

TEST(VersionTest, DefaultClientVersionFollowsLibrary)
{
    // An empty client_version is filled in from version_string() at construction
    mcpmgr::ClientOptions options;
    EXPECT_TRUE(options.client_version.empty());
    EXPECT_EQ(options.client_name, "mcpmgr");
}
