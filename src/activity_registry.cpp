#include "mergington/activity_registry.hpp"
#include "mergington/errors.hpp"
#include "mergington/validation.hpp"
#include <algorithm>
#include <utility>

namespace mergington {

namespace {

void validate_definition(const Activity& activity) {
    validation::require_not_empty(activity.name, "activity name");
    validation::require_positive(activity.max_participants, "max_participants");
    validation::require_unique(activity.participants, "participants");
    if (static_cast<int64_t>(activity.participants.size()) > activity.max_participants) {
        throw InvalidArgumentError("participants exceed max_participants for " + activity.name);
    }
}

} // anonymous namespace

ActivityRegistry::ActivityRegistry(const std::vector<Activity>& activities) {
    reset(activities);
}

std::vector<Activity> ActivityRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activities_;
}

std::optional<Activity> ActivityRegistry::find(const std::string& activity_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(activity_name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return activities_[it->second];
}

std::string ActivityRegistry::sign_up(const std::string& activity_name, const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Guard
    Activity* activity = find_locked(activity_name);
    if (!activity) {
        throw NotFoundError("Activity not found");
    }

    // Validate
    if (activity->has_participant(email)) {
        throw ConflictError("Student already signed up");
    }
    if (activity->is_full()) {
        throw ConflictError("Activity is full");
    }

    activity->participants.push_back(email);
    return "Signed up " + email + " for " + activity_name;
}

std::string ActivityRegistry::unregister(const std::string& activity_name, const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);

    Activity* activity = find_locked(activity_name);
    if (!activity) {
        throw NotFoundError("Activity not found");
    }

    auto& roster = activity->participants;
    auto it = std::find(roster.begin(), roster.end(), email);
    if (it == roster.end()) {
        throw ConflictError("Student is not registered for this activity");
    }

    roster.erase(it);
    return "Unregistered " + email + " from " + activity_name;
}

void ActivityRegistry::add_activity(const Activity& activity) {
    validate_definition(activity);

    std::lock_guard<std::mutex> lock(mutex_);
    add_locked(activity);
}

void ActivityRegistry::reset(const std::vector<Activity>& activities) {
    std::vector<Activity> staged;
    std::unordered_map<std::string, size_t> staged_index;
    staged.reserve(activities.size());

    for (const auto& activity : activities) {
        validate_definition(activity);
        if (!staged_index.emplace(activity.name, staged.size()).second) {
            throw ConflictError("Activity already exists");
        }
        staged.push_back(activity);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    activities_ = std::move(staged);
    index_ = std::move(staged_index);
}

size_t ActivityRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activities_.size();
}

Activity* ActivityRegistry::find_locked(const std::string& activity_name) {
    auto it = index_.find(activity_name);
    return it == index_.end() ? nullptr : &activities_[it->second];
}

void ActivityRegistry::add_locked(const Activity& activity) {
    if (index_.count(activity.name) > 0) {
        throw ConflictError("Activity already exists");
    }
    index_.emplace(activity.name, activities_.size());
    activities_.push_back(activity);
}

} // namespace mergington
