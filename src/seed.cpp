#include "mergington/seed.hpp"
#include "mergington/errors.hpp"
#include "mergington/json.hpp"
#include <fstream>

namespace mergington {
namespace seed {

std::vector<Activity> default_activities() {
    return {
        {"Chess Club",
         "Learn strategies and compete in chess tournaments",
         "Fridays, 3:30 PM - 5:00 PM",
         12,
         {"michael@mergington.edu", "daniel@mergington.edu"}},
        {"Programming Class",
         "Learn programming fundamentals and build software projects",
         "Tuesdays and Thursdays, 3:30 PM - 4:30 PM",
         20,
         {"emma@mergington.edu", "sophia@mergington.edu"}},
        {"Gym Class",
         "Physical education and sports activities",
         "Mondays, Wednesdays, Fridays, 2:00 PM - 3:00 PM",
         30,
         {"john@mergington.edu", "olivia@mergington.edu"}},
    };
}

std::vector<Activity> load_activities(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidArgumentError("Cannot open activities file: " + path);
    }

    json::Json document;
    try {
        document = json::Json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError("Malformed activities file " + path + ": " + e.what());
    }
    return json::activities_from_json(document);
}

} // namespace seed
} // namespace mergington
