#pragma once

#include <string>
#include <vector>
#include "activity.hpp"

namespace mergington {
namespace seed {

/// The activities the registry starts with when no seed file is configured.
std::vector<Activity> default_activities();

/**
 * Read activities from a JSON file shaped like the GET /activities body.
 *
 * @throws InvalidArgumentError if the file cannot be read or parsed
 */
std::vector<Activity> load_activities(const std::string& path);

} // namespace seed
} // namespace mergington
