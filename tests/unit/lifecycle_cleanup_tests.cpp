#include <gtest/gtest.h>

#include "coordination/LifecycleCleanup.hpp"
#include "coordination/SingleInstance.hpp"
#include "logger.hpp"
#include "test_utils.hpp"

#include <cstdlib>
#include <filesystem>

using namespace coordination;

namespace {

CoordinatorSettings filesystem_in(const std::filesystem::path& dir) {
    CoordinatorSettings settings;
    settings.mode = CoordinationMode::Filesystem;
    settings.lock_dirs = {dir};
    return settings;
}

} // namespace

TEST(LifecycleCleanupTest, ReleaseTwice) {
    test_utils::TempDir dir;
    SingleInstance instance(nullptr, filesystem_in(dir.path()));
    auto result = instance.acquire(InstanceIdentity::for_current_user(test_utils::unique_app_name("twice")));
    ASSERT_TRUE(result.is_primary());
    const auto sock = *result.cleanup->cleanup_path();
    ASSERT_TRUE(std::filesystem::exists(sock));

    EXPECT_FALSE(result.cleanup.released());
    EXPECT_NO_THROW(result.cleanup.release());
    EXPECT_TRUE(result.cleanup.released());
    EXPECT_FALSE(std::filesystem::exists(sock));
    EXPECT_EQ(result.cleanup->native_handle(), -1);
    EXPECT_NO_THROW(result.cleanup.release());
}

TEST(LifecycleCleanupTest, PathRemovedExternally) {
    test_utils::TempDir dir;
    SingleInstance instance(nullptr, filesystem_in(dir.path()));
    auto result = instance.acquire(InstanceIdentity::for_current_user(test_utils::unique_app_name("ext")));
    ASSERT_TRUE(result.is_primary());
    const auto sock = *result.cleanup->cleanup_path();

    std::filesystem::remove(sock);
    EXPECT_NO_THROW(result.cleanup.release());
    EXPECT_FALSE(std::filesystem::exists(sock));
}

TEST(LifecycleCleanupTest, ScopeExitReleases) {
    test_utils::TempDir dir;
    std::filesystem::path sock;
    {
        SingleInstance instance(nullptr, filesystem_in(dir.path()));
        auto result = instance.acquire(InstanceIdentity::for_current_user(test_utils::unique_app_name("scope")));
        ASSERT_TRUE(result.is_primary());
        sock = *result.cleanup->cleanup_path();
        ASSERT_TRUE(std::filesystem::exists(sock));
    }
    EXPECT_FALSE(std::filesystem::exists(sock));
}

TEST(LifecycleCleanupTest, MoveTransfersOwnership) {
    test_utils::TempDir dir;
    SingleInstance instance(nullptr, filesystem_in(dir.path()));
    auto result = instance.acquire(InstanceIdentity::for_current_user(test_utils::unique_app_name("move")));
    const auto sock = *result.cleanup->cleanup_path();

    LifecycleCleanup moved(std::move(result.cleanup));
    EXPECT_TRUE(result.cleanup.released());
    EXPECT_TRUE(std::filesystem::exists(sock));
    moved.release();
    EXPECT_FALSE(std::filesystem::exists(sock));
}

TEST(LifecycleCleanupTest, ReleaseIsLogged) {
    test_utils::TempDir dir;
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    logger->add_sink(sink);
    logger->set_level(LogLevel::Debug);

    SingleInstance instance(logger, filesystem_in(dir.path()));
    auto result = instance.acquire(InstanceIdentity::for_current_user(test_utils::unique_app_name("log")));
    result.cleanup.release();
    EXPECT_TRUE(sink->contains("Released primary handle"));
}

TEST(LifecycleCleanupDeathTest, ExitRemovesSocketPath) {
    test_utils::TempDir dir;
    const auto id = InstanceIdentity::for_current_user(test_utils::unique_app_name("exit"));
    const auto sock = dir.path() / (id.coordination_name() + ".sock");

    EXPECT_EXIT(
        {
            SingleInstance instance(nullptr, filesystem_in(dir.path()));
            auto result = instance.acquire(id);
            if (!result.is_primary() || !std::filesystem::exists(sock)) std::_Exit(1);
            // std::exit skips the destructor of `result`; the exit hook must release
            std::exit(0);
        },
        ::testing::ExitedWithCode(0), "");
    EXPECT_FALSE(std::filesystem::exists(sock));
}

TEST(LifecycleCleanupDeathTest, ForkedChildDoesNotUnlinkParentPath) {
    test_utils::TempDir dir;
    SingleInstance instance(nullptr, filesystem_in(dir.path()));
    auto result = instance.acquire(InstanceIdentity::for_current_user(test_utils::unique_app_name("fork")));
    ASSERT_TRUE(result.is_primary());
    const auto sock = *result.cleanup->cleanup_path();

    EXPECT_EXIT(
        {
            result.cleanup.release();
            std::_Exit(0);
        },
        ::testing::ExitedWithCode(0), "");
    EXPECT_TRUE(std::filesystem::exists(sock));
}
