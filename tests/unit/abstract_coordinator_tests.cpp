#include <gtest/gtest.h>

#include "coordination/AbstractSocketCoordinator.hpp"
#include "coordination/CoordinationErrors.hpp"
#include "test_utils.hpp"

using namespace coordination;

#if defined(__linux__)

TEST(AbstractCoordinatorTest, FirstIsPrimarySecondIsSecondary) {
    auto id = InstanceIdentity::for_current_user(test_utils::unique_app_name("abs"));
    AbstractSocketCoordinator coordinator;

    auto first = coordinator.acquire_or_connect(id);
    ASSERT_EQ(first.role, InstanceRole::Primary);
    EXPECT_FALSE(first.handle->cleanup_path().has_value());
    EXPECT_TRUE(first.handle->lock_path().empty());
    EXPECT_EQ(first.handle->endpoint(), "unix:@" + id.coordination_name());

    auto second = coordinator.acquire_or_connect(id);
    EXPECT_EQ(second.role, InstanceRole::Secondary);
    EXPECT_EQ(second.handle->endpoint(), "unix:@" + id.coordination_name());
}

TEST(AbstractCoordinatorTest, GroupsDoNotCollide) {
    const auto app = test_utils::unique_app_name("grp");
    AbstractSocketCoordinator coordinator;

    auto a = coordinator.acquire_or_connect(InstanceIdentity::for_current_user(app, "a"));
    auto b = coordinator.acquire_or_connect(InstanceIdentity::for_current_user(app, "b"));
    EXPECT_EQ(a.role, InstanceRole::Primary);
    EXPECT_EQ(b.role, InstanceRole::Primary);
}

TEST(AbstractCoordinatorTest, NameIsFreedOnRelease) {
    auto id = InstanceIdentity::for_current_user(test_utils::unique_app_name("free"));
    AbstractSocketCoordinator coordinator;

    auto first = coordinator.acquire_or_connect(id);
    ASSERT_EQ(first.role, InstanceRole::Primary);
    first.handle.reset();

    EXPECT_EQ(coordinator.acquire_or_connect(id).role, InstanceRole::Primary);
}

TEST(AbstractCoordinatorTest, OverlongNameIsFatalNotFallback) {
    test_utils::TempDir dir;
    AbstractSocketCoordinator coordinator(FilesystemLockCoordinator(CandidateDirectories::from_paths({dir.path()})));
    auto id = InstanceIdentity::for_current_user(std::string(200, 'x'));
    EXPECT_THROW(coordinator.acquire_or_connect(id), AcquisitionError);
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

#endif

namespace {

// Behaves like a kernel without the abstract socket namespace.
class NoAbstractNamespaceSocket : public transport::PosixSocket {
public:
    explicit NoAbstractNamespaceSocket(std::shared_ptr<Logger> logger) : transport::PosixSocket(std::move(logger)) {}

    bool start_listening(const transport::EndpointAddress& address, int backlog, std::error_code& error) override {
        if (const auto* u = address.as_unix(); u && u->is_abstract) {
            error = std::make_error_code(std::errc::no_such_file_or_directory);
            return false;
        }
        return transport::PosixSocket::start_listening(address, backlog, error);
    }
};

std::unique_ptr<transport::PosixSocket> without_abstract_namespace(std::shared_ptr<Logger> logger) {
    return std::make_unique<NoAbstractNamespaceSocket>(std::move(logger));
}

} // namespace

TEST(AbstractCoordinatorTest, UnsupportedNamespaceFallsBackToLockFiles) {
    test_utils::TempDir dir;
    auto id = InstanceIdentity::for_current_user(test_utils::unique_app_name("fallback"));
    AbstractSocketCoordinator coordinator(FilesystemLockCoordinator(CandidateDirectories::from_paths({dir.path()})));
    coordinator.with_listener_factory(&without_abstract_namespace);

    auto first = coordinator.acquire_or_connect(id);
    ASSERT_EQ(first.role, InstanceRole::Primary);
    const auto sock = dir.path() / (id.coordination_name() + ".sock");
    ASSERT_TRUE(first.handle->cleanup_path().has_value());
    EXPECT_EQ(*first.handle->cleanup_path(), sock);
    EXPECT_EQ(first.handle->lock_path(), dir.path() / (id.coordination_name() + ".lock"));
    EXPECT_EQ(first.handle->endpoint(), "unix:" + sock.string());

    auto second = coordinator.acquire_or_connect(id);
    EXPECT_EQ(second.role, InstanceRole::Secondary);
    EXPECT_EQ(second.handle->endpoint(), "unix:" + sock.string());
}

TEST(AbstractCoordinatorTest, UnsupportedNamespaceWithoutFallbackIsFatal) {
    AbstractSocketCoordinator coordinator;
    coordinator.with_listener_factory(&without_abstract_namespace);

    try {
        coordinator.acquire_or_connect(InstanceIdentity::for_current_user(test_utils::unique_app_name("nofb")));
        FAIL() << "expected AcquisitionError";
    } catch (const AcquisitionError& e) {
        EXPECT_EQ(e.cause(), std::errc::no_such_file_or_directory);
    }
}
