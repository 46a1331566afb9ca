#include <gtest/gtest.h>
#include "mergington/activity_registry.hpp"
#include "mergington/errors.hpp"
#include "mergington/seed.hpp"

using namespace mergington;

TEST(SeedTest, DefaultActivities_ShouldHoldBuiltInSet) {
    auto activities = seed::default_activities();

    ASSERT_EQ(activities.size(), 3u);
    EXPECT_EQ(activities[0].name, "Chess Club");
    EXPECT_EQ(activities[1].name, "Programming Class");
    EXPECT_EQ(activities[1].max_participants, 20);
    EXPECT_EQ(activities[2].name, "Gym Class");
    EXPECT_EQ(activities[2].schedule, "Mondays, Wednesdays, Fridays, 2:00 PM - 3:00 PM");
    EXPECT_EQ(activities[2].participants,
              (std::vector<std::string>{"john@mergington.edu", "olivia@mergington.edu"}));
}

TEST(SeedTest, DefaultActivities_ShouldSatisfyRegistryInvariants) {
    ActivityRegistry registry;
    EXPECT_NO_THROW(registry.reset(seed::default_activities()));
    EXPECT_EQ(registry.size(), 3u);
}

TEST(SeedTest, LoadActivities_ValidFile_ShouldParse) {
    auto activities = seed::load_activities(MERGINGTON_TEST_DATA_DIR "/activities.json");

    ASSERT_EQ(activities.size(), 2u);
    EXPECT_EQ(activities[0].name, "Art Studio");
    EXPECT_EQ(activities[0].participants.size(), 1u);
    EXPECT_EQ(activities[1].name, "Debate Team");
    EXPECT_EQ(activities[1].max_participants, 10);
}

TEST(SeedTest, LoadActivities_MissingFile_ShouldThrow) {
    EXPECT_THROW(seed::load_activities(MERGINGTON_TEST_DATA_DIR "/does_not_exist.json"),
                 InvalidArgumentError);
}

TEST(SeedTest, LoadActivities_MalformedFile_ShouldThrow) {
    EXPECT_THROW(seed::load_activities(MERGINGTON_TEST_DATA_DIR "/malformed.json"),
                 InvalidArgumentError);
}

TEST(SeedTest, LoadActivities_MissingCapacity_ShouldThrow) {
    EXPECT_THROW(seed::load_activities(MERGINGTON_TEST_DATA_DIR "/missing_capacity.json"),
                 InvalidArgumentError);
}
