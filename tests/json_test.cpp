#include <gtest/gtest.h>
#include "mergington/errors.hpp"
#include "mergington/json.hpp"

using namespace mergington;

TEST(JsonTest, ToJson_Activity_ShouldEmitFourFields) {
    Activity activity{"Chess Club", "Learn chess", "Fridays", 12, {"a@m.edu", "b@m.edu"}};

    auto body = json::to_json(activity);

    EXPECT_EQ(body.dump(),
        R"({"description":"Learn chess","schedule":"Fridays","max_participants":12,"participants":["a@m.edu","b@m.edu"]})");
}

TEST(JsonTest, ToJson_EmptyRoster_ShouldEmitEmptyArray) {
    Activity activity{"Quiet Club", "Shh", "Never", 3, {}};

    auto body = json::to_json(activity);

    ASSERT_TRUE(body["participants"].is_array());
    EXPECT_TRUE(body["participants"].empty());
}

TEST(JsonTest, ToJson_Registry_ShouldKeepGivenOrder) {
    std::vector<Activity> activities{
        {"Zebra Club", "", "", 1, {}},
        {"Alpha Club", "", "", 1, {}},
    };

    auto body = json::to_json(activities);

    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body.begin().key(), "Zebra Club");
}

TEST(JsonTest, ToJson_NoActivities_ShouldEmitEmptyObject) {
    EXPECT_EQ(json::to_json(std::vector<Activity>{}).dump(), "{}");
}

TEST(JsonTest, MessageAndDetailBodies_ShouldWrapText) {
    EXPECT_EQ(json::message_body("Signed up a for b").dump(), R"({"message":"Signed up a for b"})");
    EXPECT_EQ(json::detail_body("Activity not found").dump(), R"({"detail":"Activity not found"})");
}

// =============================================================================
// Parsing Tests
// =============================================================================

TEST(JsonTest, ActivitiesFromJson_ShouldParseEveryActivity) {
    auto document = json::Json::parse(R"({
        "Art Studio": {"description": "Paint", "schedule": "Wed", "max_participants": 15,
                       "participants": ["amelia@mergington.edu"]},
        "Debate Team": {"description": "Argue", "schedule": "Thu", "max_participants": 10}
    })");

    auto activities = json::activities_from_json(document);

    ASSERT_EQ(activities.size(), 2u);
    EXPECT_EQ(activities[0].name, "Art Studio");
    EXPECT_EQ(activities[0].max_participants, 15);
    EXPECT_EQ(activities[0].participants, std::vector<std::string>{"amelia@mergington.edu"});
    EXPECT_EQ(activities[1].name, "Debate Team");
    EXPECT_TRUE(activities[1].participants.empty());
}

TEST(JsonTest, ActivityFromJson_MissingField_ShouldThrow) {
    auto body = json::Json::parse(R"({"description": "Paint", "max_participants": 15})");

    EXPECT_THROW(json::activity_from_json("Art Studio", body), InvalidArgumentError);
}

TEST(JsonTest, ActivityFromJson_WrongType_ShouldThrow) {
    auto body = json::Json::parse(
        R"({"description": "Paint", "schedule": "Wed", "max_participants": "many"})");

    EXPECT_THROW(json::activity_from_json("Art Studio", body), InvalidArgumentError);

    // Values that would otherwise narrow to some other positive capacity
    for (const char* capacity : {"4294967297", "2.9", "true", "-2147483649"}) {
        body["max_participants"] = json::Json::parse(capacity);
        EXPECT_THROW(json::activity_from_json("Art Studio", body), InvalidArgumentError) << capacity;
    }
}

TEST(JsonTest, ActivityFromJson_Int32Bounds_ShouldParse) {
    auto body = json::Json::parse(
        R"({"description": "Paint", "schedule": "Wed", "max_participants": 2147483647})");

    EXPECT_EQ(json::activity_from_json("Art Studio", body).max_participants, 2147483647);
}

TEST(JsonTest, ActivitiesFromJson_NotAnObject_ShouldThrow) {
    EXPECT_THROW(json::activities_from_json(json::Json::array()), InvalidArgumentError);
}
