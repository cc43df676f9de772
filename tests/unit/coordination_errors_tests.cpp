#include <gtest/gtest.h>

#include "coordination/CoordinationErrors.hpp"

#include <cerrno>

using namespace coordination;

namespace {
std::error_code os(int value) { return {value, std::generic_category()}; }
}

TEST(CoordinationErrorsTest, AbstractBind) {
    EXPECT_EQ(classify_abstract_bind({}), CoordinationErrc::success);
    EXPECT_EQ(classify_abstract_bind(os(EADDRINUSE)), CoordinationErrc::address_in_use);
    EXPECT_EQ(classify_abstract_bind(os(ENOENT)), CoordinationErrc::unsupported_addressing_mode);
    // Only "not supported" may trigger the fallback
    EXPECT_EQ(classify_abstract_bind(os(EACCES)), CoordinationErrc::fatal_acquisition_failure);
    EXPECT_EQ(classify_abstract_bind(os(EINVAL)), CoordinationErrc::fatal_acquisition_failure);
}

TEST(CoordinationErrorsTest, PathBind) {
    EXPECT_EQ(classify_path_bind(os(EADDRINUSE)), CoordinationErrc::stale_resource);
    EXPECT_EQ(classify_path_bind(os(EEXIST)), CoordinationErrc::stale_resource);
    EXPECT_EQ(classify_path_bind(os(EACCES)), CoordinationErrc::candidate_directory_unusable);
    EXPECT_EQ(classify_path_bind(os(EROFS)), CoordinationErrc::candidate_directory_unusable);
    EXPECT_EQ(classify_path_bind(os(ENAMETOOLONG)), CoordinationErrc::candidate_directory_unusable);
    EXPECT_EQ(classify_path_bind(os(EMFILE)), CoordinationErrc::fatal_acquisition_failure);
}

TEST(CoordinationErrorsTest, Lock) {
    EXPECT_EQ(classify_lock(os(EWOULDBLOCK)), CoordinationErrc::lock_held);
    EXPECT_EQ(classify_lock(os(EAGAIN)), CoordinationErrc::lock_held);
    EXPECT_EQ(classify_lock(os(EACCES)), CoordinationErrc::lock_held);
    EXPECT_EQ(classify_lock(os(ENOLCK)), CoordinationErrc::candidate_directory_unusable);
    EXPECT_EQ(classify_lock(os(EBADF)), CoordinationErrc::fatal_acquisition_failure);
}

TEST(CoordinationErrorsTest, LockOpenAndConnect) {
    EXPECT_EQ(classify_lock_open(os(EACCES)), CoordinationErrc::candidate_directory_unusable);
    EXPECT_EQ(classify_lock_open(os(ENOENT)), CoordinationErrc::candidate_directory_unusable);
    EXPECT_EQ(classify_lock_open(os(EMFILE)), CoordinationErrc::fatal_acquisition_failure);

    EXPECT_EQ(classify_connect(os(ECONNREFUSED)), CoordinationErrc::peer_not_listening);
    EXPECT_EQ(classify_connect(os(ENOENT)), CoordinationErrc::peer_not_listening);
    EXPECT_EQ(classify_connect(os(EACCES)), CoordinationErrc::fatal_acquisition_failure);
}

TEST(CoordinationErrorsTest, NonOsCodesAreFatal) {
    auto foreign = make_error_code(std::io_errc::stream);
    EXPECT_EQ(classify_abstract_bind(foreign), CoordinationErrc::fatal_acquisition_failure);
    EXPECT_EQ(classify_lock(foreign), CoordinationErrc::fatal_acquisition_failure);
}

TEST(CoordinationErrorsTest, CategoryAndException) {
    std::error_code ec = CoordinationErrc::lock_held;
    EXPECT_EQ(ec.category().name(), std::string("coordination"));
    EXPECT_EQ(ec, CoordinationErrc::lock_held);
    EXPECT_FALSE(ec.message().empty());

    AcquisitionError err("cannot bind /x", os(EMFILE));
    EXPECT_EQ(err.cause(), std::errc::too_many_files_open);
    EXPECT_EQ(std::string(err.what()).rfind("cannot bind /x: ", 0), 0u);
}
