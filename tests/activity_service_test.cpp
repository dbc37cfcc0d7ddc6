#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <grpcpp/grpcpp.h>
#include "activities/activity_service.hpp"
#include "activities/catalog.hpp"

using namespace activities;

class ActivityServiceTest : public ::testing::Test {
protected:
    ActivityRegistry registry{catalog::default_catalog()};
    ActivityServiceImpl service{registry};
    grpc::ServerContext context;

    grpc::Status signup(const std::string& activity, const std::string& email,
                        RegistrationResponse* response) {
        SignupRequest request;
        request.set_activity(activity);
        request.set_email(email);
        return service.Signup(&context, &request, response);
    }

    grpc::Status unregister(const std::string& activity, const std::string& email,
                            RegistrationResponse* response) {
        UnregisterRequest request;
        request.set_activity(activity);
        request.set_email(email);
        return service.Unregister(&context, &request, response);
    }

    std::vector<std::string> participants(const std::string& activity) {
        ListActivitiesRequest request;
        ListActivitiesResponse response;
        EXPECT_TRUE(service.ListActivities(&context, &request, &response).ok());
        const auto& details = response.activities().at(activity);
        return {details.participants().begin(), details.participants().end()};
    }
};

// =============================================================================
// ListActivities
// =============================================================================

TEST_F(ActivityServiceTest, ListActivities_ShouldMirrorRegistry) {
    ListActivitiesRequest request;
    ListActivitiesResponse response;

    auto status = service.ListActivities(&context, &request, &response);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(static_cast<size_t>(response.activities_size()), registry.size());
    const auto& chess = response.activities().at("Chess Club");
    EXPECT_EQ(chess.description(), "Learn strategies and compete in chess tournaments");
    EXPECT_EQ(chess.schedule(), "Fridays, 3:30 PM - 5:00 PM");
    EXPECT_EQ(chess.max_participants(), 12);
    ASSERT_EQ(chess.participants_size(), 2);
    EXPECT_EQ(chess.participants(0), "michael@mergington.edu");
}

// =============================================================================
// Signup
// =============================================================================

TEST_F(ActivityServiceTest, Signup_Success_ShouldReturnMessage) {
    RegistrationResponse response;

    auto status = signup("Chess Club", "newstudent@mergington.edu", &response);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(response.message(), "Signed up newstudent@mergington.edu for Chess Club");
    EXPECT_EQ(participants("Chess Club").size(), 3u);
}

TEST_F(ActivityServiceTest, Signup_UnknownActivity_ShouldReturnNotFound) {
    RegistrationResponse response;

    auto status = signup("NonExistent Activity", "student@mergington.edu", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(status.error_message(), "Activity not found");
}

TEST_F(ActivityServiceTest, Signup_Duplicate_ShouldReturnFailedPrecondition) {
    RegistrationResponse response;

    auto status = signup("Chess Club", "michael@mergington.edu", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(participants("Chess Club").size(), 2u);
}

TEST_F(ActivityServiceTest, Signup_EmptyEmail_ShouldReturnInvalidArgument) {
    RegistrationResponse response;

    auto status = signup("Chess Club", "", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(participants("Chess Club").size(), 2u);
}

// =============================================================================
// Unregister
// =============================================================================

TEST_F(ActivityServiceTest, Unregister_Success_ShouldRemoveParticipant) {
    RegistrationResponse response;

    auto status = unregister("Chess Club", "michael@mergington.edu", &response);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(response.message(), "Unregistered michael@mergington.edu from Chess Club");
    auto roster = participants("Chess Club");
    EXPECT_EQ(std::count(roster.begin(), roster.end(), "michael@mergington.edu"), 0);
}

TEST_F(ActivityServiceTest, Unregister_NotRegistered_ShouldReturnFailedPrecondition) {
    RegistrationResponse response;

    auto status = unregister("Chess Club", "notregistered@mergington.edu", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_NE(status.error_message().find("not registered"), std::string::npos);
}

TEST_F(ActivityServiceTest, Unregister_UnknownActivity_ShouldReturnNotFound) {
    RegistrationResponse response;

    auto status = unregister("NonExistent Activity", "student@mergington.edu", &response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(ActivityServiceTest, SignupThenUnregister_ShouldRestoreRoster) {
    auto before = participants("Gym Class");
    RegistrationResponse response;

    ASSERT_TRUE(signup("Gym Class", "testuser@mergington.edu", &response).ok());
    ASSERT_TRUE(unregister("Gym Class", "testuser@mergington.edu", &response).ok());

    EXPECT_EQ(participants("Gym Class"), before);
}
