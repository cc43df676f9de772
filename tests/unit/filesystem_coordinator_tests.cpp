#include <gtest/gtest.h>

#include "coordination/CoordinationErrors.hpp"
#include "coordination/FilesystemLockCoordinator.hpp"
#include "coordination/PrimaryConnector.hpp"
#include "logger.hpp"
#include "test_utils.hpp"
#include "transport/socket/posix/PosixSocket.hpp"

#include <chrono>
#include <fcntl.h>
#include <filesystem>

using namespace coordination;

namespace {

InstanceIdentity test_identity(const std::string& stem) {
    return InstanceIdentity::for_current_user(test_utils::unique_app_name(stem));
}

FilesystemLockCoordinator coordinator_for(const std::vector<std::filesystem::path>& dirs,
                                          std::shared_ptr<Logger> logger = nullptr) {
    return FilesystemLockCoordinator(CandidateDirectories::from_paths(dirs), std::move(logger));
}

} // namespace

TEST(FilesystemCoordinatorTest, FirstIsPrimarySecondIsSecondary) {
    test_utils::TempDir dir;
    auto id = test_identity("fs");
    auto coordinator = coordinator_for({dir.path()});

    auto first = coordinator.acquire_or_connect(id);
    ASSERT_EQ(first.role, InstanceRole::Primary);
    const auto sock = dir.path() / (id.coordination_name() + ".sock");
    const auto lock = dir.path() / (id.coordination_name() + ".lock");
    EXPECT_TRUE(std::filesystem::exists(sock));
    EXPECT_TRUE(std::filesystem::exists(lock));
    ASSERT_TRUE(first.handle->cleanup_path().has_value());
    EXPECT_EQ(*first.handle->cleanup_path(), sock);
    EXPECT_EQ(first.handle->lock_path(), lock);
    EXPECT_EQ(first.handle->endpoint(), "unix:" + sock.string());

    auto second = coordinator.acquire_or_connect(id);
    EXPECT_EQ(second.role, InstanceRole::Secondary);
    EXPECT_FALSE(second.handle->cleanup_path().has_value());
    EXPECT_GE(second.handle->native_handle(), 0);

    std::error_code ec;
    auto peer = first.handle->accept(ec, std::chrono::milliseconds(500));
    EXPECT_FALSE(ec) << ec.message();
    EXPECT_NE(peer, nullptr);
}

TEST(FilesystemCoordinatorTest, PrimarySocketIsNotInheritable) {
    test_utils::TempDir dir;
    auto outcome = coordinator_for({dir.path()}).acquire_or_connect(test_identity("cloexec"));
    ASSERT_EQ(outcome.role, InstanceRole::Primary);
    int flags = ::fcntl(outcome.handle->native_handle(), F_GETFD);
    ASSERT_GE(flags, 0);
    EXPECT_TRUE(flags & FD_CLOEXEC);
}

TEST(FilesystemCoordinatorTest, ReleaseAllowsNewPrimary) {
    test_utils::TempDir dir;
    auto id = test_identity("again");
    auto coordinator = coordinator_for({dir.path()});

    auto first = coordinator.acquire_or_connect(id);
    ASSERT_EQ(first.role, InstanceRole::Primary);
    const auto sock = *first.handle->cleanup_path();
    first.handle.reset();
    EXPECT_FALSE(std::filesystem::exists(sock));

    auto second = coordinator.acquire_or_connect(id);
    EXPECT_EQ(second.role, InstanceRole::Primary);
}

TEST(FilesystemCoordinatorTest, StaleSocketIsReplaced) {
    test_utils::TempDir dir;
    auto id = test_identity("stale");
    const auto sock = dir.path() / (id.coordination_name() + ".sock");

    // Leave a socket file with no listener behind, as a crashed primary would
    {
        transport::PosixSocket crashed;
        std::error_code ec;
        ASSERT_TRUE(crashed.start_listening(transport::EndpointAddress::unix_path(sock), 1, ec)) << ec.message();
    }
    ASSERT_TRUE(std::filesystem::exists(sock));
    // A second link keeps the old inode alive so its number cannot be reused
    const auto keep = dir.path() / "old-inode";
    std::filesystem::create_hard_link(sock, keep);
    const auto old_inode = test_utils::inode_of(sock);

    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    logger->add_sink(sink);

    auto outcome = coordinator_for({dir.path()}, logger).acquire_or_connect(id);
    EXPECT_EQ(outcome.role, InstanceRole::Primary);
    EXPECT_NE(test_utils::inode_of(sock), old_inode);
    EXPECT_TRUE(sink->contains("Removing stale socket"));

    // The new socket actually listens
    transport::PosixSocket client;
    std::error_code ec;
    client.connect(transport::EndpointAddress::unix_path(sock), ec);
    EXPECT_FALSE(ec) << ec.message();
}

TEST(FilesystemCoordinatorTest, AdvancesPastUnusableDirectory) {
    test_utils::TempDir dir;
    auto id = test_identity("advance");
    // Pretend every directory is live so the missing one fails at open time
    auto candidates = CandidateDirectories::from_paths({dir.path() / "missing", dir.path()});
    candidates.with_liveness_check([](const std::filesystem::path&) { return true; });

    auto outcome = FilesystemLockCoordinator(candidates).acquire_or_connect(id);
    EXPECT_EQ(outcome.role, InstanceRole::Primary);
    EXPECT_EQ(outcome.handle->lock_path().parent_path(), dir.path());
}

TEST(FilesystemCoordinatorTest, ExhaustedDirectoriesAreFatal) {
    test_utils::TempDir dir;
    auto candidates = CandidateDirectories::from_paths({dir.path() / "a", dir.path() / "b"});
    candidates.with_liveness_check([](const std::filesystem::path&) { return true; });

    try {
        FilesystemLockCoordinator(candidates).acquire_or_connect(test_identity("none"));
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.cause(), std::errc::no_such_file_or_directory);
    }
}

TEST(FilesystemCoordinatorTest, NoLiveDirectoriesAreFatal) {
    auto candidates = CandidateDirectories::from_paths({"/nonexistent/ic-test"});
    try {
        FilesystemLockCoordinator(candidates).acquire_or_connect(test_identity("empty"));
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.cause(), CoordinationErrc::candidate_directory_unusable);
    }
}

TEST(FilesystemCoordinatorTest, HeldLockWithoutListenerIsFatal) {
    test_utils::TempDir dir;
    auto id = test_identity("nolistener");

    // Someone holds the lock but never creates the socket
    LockFile holder;
    std::error_code ec;
    ASSERT_TRUE(holder.open(dir.path() / (id.coordination_name() + ".lock"), ec)) << ec.message();
    ASSERT_TRUE(holder.try_lock_exclusive(ec)) << ec.message();

    FilesystemLockCoordinator coordinator(CandidateDirectories::from_paths({dir.path()}), nullptr,
                                          ConnectPolicy{3, std::chrono::milliseconds(1)});
    EXPECT_THROW(coordinator.acquire_or_connect(id), AcquisitionError);
}

TEST(PrimaryConnectorTest, SingleAttemptDoesNotWait) {
    test_utils::TempDir dir;
    const auto addr = transport::EndpointAddress::unix_path(dir.path() / "nobody.sock");
    // A long interval would show up if a single attempt still slept
    const ConnectPolicy strict{1, std::chrono::seconds(5)};

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(connect_to_primary(addr, strict, nullptr), AcquisitionError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(PrimaryConnectorTest, RefusedConnectsAreRetried) {
    test_utils::TempDir dir;
    const auto addr = transport::EndpointAddress::unix_path(dir.path() / "late.sock");
    const ConnectPolicy policy{4, std::chrono::milliseconds(20)};

    const auto start = std::chrono::steady_clock::now();
    try {
        connect_to_primary(addr, policy, nullptr);
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.cause(), std::errc::no_such_file_or_directory);
    }
    // Three sleeps between four attempts
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(60));
}
