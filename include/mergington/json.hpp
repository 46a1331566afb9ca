#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "activity.hpp"

namespace mergington {

/**
 * JSON encoding of activities, in the shape served by GET /activities.
 *
 * Object keys of the registry body keep registry order, so ordered_json
 * is used throughout.
 */
namespace json {

using Json = nlohmann::ordered_json;

/// {description, schedule, max_participants, participants}
Json to_json(const Activity& activity);

/// name -> activity, in the given order
Json to_json(const std::vector<Activity>& activities);

/// Parse a single activity body; missing "participants" means an empty roster.
/// @throws InvalidArgumentError on a missing or mistyped field
Activity activity_from_json(const std::string& name, const Json& body);

/// Parse a name -> activity object.
/// @throws InvalidArgumentError if the document is not an object
std::vector<Activity> activities_from_json(const Json& document);

/// {"message": text}
Json message_body(const std::string& text);

/// {"detail": text}
Json detail_body(const std::string& text);

} // namespace json
} // namespace mergington
