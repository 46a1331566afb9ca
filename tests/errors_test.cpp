#include <gtest/gtest.h>
#include "mergington/errors.hpp"

using namespace mergington;

// =============================================================================
// Introspection Tests
// =============================================================================

TEST(ErrorsTest, NotFoundError_ShouldReportNotFound) {
    NotFoundError error("Activity not found");
    EXPECT_TRUE(error.is_not_found());
    EXPECT_FALSE(error.is_conflict());
    EXPECT_FALSE(error.is_invalid_argument());
}

TEST(ErrorsTest, ConflictError_ShouldReportConflict) {
    ConflictError error("Activity is full");
    EXPECT_TRUE(error.is_conflict());
    EXPECT_FALSE(error.is_not_found());
}

TEST(ErrorsTest, InvalidArgumentError_ShouldReportInvalidArgument) {
    InvalidArgumentError error("bad input");
    EXPECT_TRUE(error.is_invalid_argument());
    EXPECT_FALSE(error.is_conflict());
}

TEST(ErrorsTest, RegistryError_ShouldHaveDefaultFalseForAllIntrospectionMethods) {
    RegistryError error("generic error");
    EXPECT_FALSE(error.is_not_found());
    EXPECT_FALSE(error.is_conflict());
    EXPECT_FALSE(error.is_invalid_argument());
    EXPECT_EQ(error.http_status(), 500);
}

// =============================================================================
// Status Mapping Tests
// =============================================================================

TEST(ErrorsTest, HttpStatus_ShouldMatchErrorKind) {
    EXPECT_EQ(NotFoundError("x").http_status(), 404);
    EXPECT_EQ(ConflictError("x").http_status(), 400);
    EXPECT_EQ(InvalidArgumentError("x").http_status(), 422);
}

TEST(ErrorsTest, GrpcStatus_ShouldCarryCodeAndMessage) {
    auto not_found = NotFoundError("Activity not found").to_grpc_status();
    EXPECT_EQ(not_found.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(not_found.error_message(), "Activity not found");

    EXPECT_EQ(ConflictError("x").to_grpc_status().error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(InvalidArgumentError("x").to_grpc_status().error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(ErrorsTest, CatchByBase_ShouldDispatchVirtually) {
    try {
        throw ConflictError("Student already signed up");
    } catch (const RegistryError& e) {
        EXPECT_TRUE(e.is_conflict());
        EXPECT_EQ(e.http_status(), 400);
        EXPECT_STREQ(e.what(), "Student already signed up");
    }
}
