#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "activity.hpp"

namespace mergington {

/**
 * In-memory registry of activities keyed by name.
 *
 * Every operation holds the registry lock for its whole duration, so the
 * duplicate and capacity checks in sign_up() and the membership check in
 * unregister() cannot race with another mutation. Reads return copies.
 *
 * Iteration order is insertion order.
 */
class ActivityRegistry {
public:
    ActivityRegistry() = default;
    explicit ActivityRegistry(const std::vector<Activity>& activities);

    ActivityRegistry(const ActivityRegistry&) = delete;
    ActivityRegistry& operator=(const ActivityRegistry&) = delete;

    /**
     * Snapshot of every activity, in insertion order.
     */
    std::vector<Activity> list() const;

    /**
     * Snapshot of a single activity, if present.
     */
    std::optional<Activity> find(const std::string& activity_name) const;

    /**
     * Add a student to an activity's roster.
     *
     * @throws NotFoundError  activity does not exist
     * @throws ConflictError  email already registered, or activity full
     * @return confirmation message
     */
    std::string sign_up(const std::string& activity_name, const std::string& email);

    /**
     * Remove a student from an activity's roster.
     *
     * @throws NotFoundError  activity does not exist
     * @throws ConflictError  email not registered
     * @return confirmation message
     */
    std::string unregister(const std::string& activity_name, const std::string& email);

    /**
     * Define a new activity.
     *
     * @throws InvalidArgumentError  empty name, non-positive capacity,
     *                               duplicate or excess seeded participants
     * @throws ConflictError         name already taken
     */
    void add_activity(const Activity& activity);

    /**
     * Replace the whole registry contents. Either every activity is
     * accepted or the registry is left unchanged.
     */
    void reset(const std::vector<Activity>& activities);

    size_t size() const;

private:
    Activity* find_locked(const std::string& activity_name);
    void add_locked(const Activity& activity);

    mutable std::mutex mutex_;
    std::vector<Activity> activities_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mergington
