#include "mergington/json.hpp"
#include "mergington/errors.hpp"
#include <cstdint>
#include <limits>

namespace mergington {
namespace json {

namespace {

template<typename T>
T required_field(const std::string& name, const Json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end()) {
        throw InvalidArgumentError("Activity " + name + " is missing field: " + field);
    }
    try {
        return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
        throw InvalidArgumentError("Activity " + name + " has invalid field: " + field);
    }
}

int32_t required_int32(const std::string& name, const Json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end()) {
        throw InvalidArgumentError("Activity " + name + " is missing field: " + field);
    }
    // get<int32_t>() would silently truncate floats, booleans and wide integers.
    bool in_range = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
        : it->is_number_integer()
            && it->get<int64_t>() >= std::numeric_limits<int32_t>::min()
            && it->get<int64_t>() <= std::numeric_limits<int32_t>::max();
    if (!in_range) {
        throw InvalidArgumentError("Activity " + name + " has invalid field: " + field);
    }
    return static_cast<int32_t>(it->get<int64_t>());
}

} // anonymous namespace

Json to_json(const Activity& activity) {
    return Json{
        {"description", activity.description},
        {"schedule", activity.schedule},
        {"max_participants", activity.max_participants},
        {"participants", activity.participants}
    };
}

Json to_json(const std::vector<Activity>& activities) {
    Json body = Json::object();
    for (const auto& activity : activities) {
        body[activity.name] = to_json(activity);
    }
    return body;
}

Activity activity_from_json(const std::string& name, const Json& body) {
    if (!body.is_object()) {
        throw InvalidArgumentError("Activity " + name + " must be a JSON object");
    }

    Activity activity;
    activity.name = name;
    activity.description = required_field<std::string>(name, body, "description");
    activity.schedule = required_field<std::string>(name, body, "schedule");
    activity.max_participants = required_int32(name, body, "max_participants");
    if (body.contains("participants")) {
        activity.participants = required_field<std::vector<std::string>>(name, body, "participants");
    }
    return activity;
}

std::vector<Activity> activities_from_json(const Json& document) {
    if (!document.is_object()) {
        throw InvalidArgumentError("Activities document must be a JSON object");
    }

    std::vector<Activity> activities;
    activities.reserve(document.size());
    for (const auto& [name, body] : document.items()) {
        activities.push_back(activity_from_json(name, body));
    }
    return activities;
}

Json message_body(const std::string& text) {
    return Json{{"message", text}};
}

Json detail_body(const std::string& text) {
    return Json{{"detail", text}};
}

} // namespace json
} // namespace mergington
