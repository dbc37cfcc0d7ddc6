#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "activity.hpp"

namespace activities {

/**
 * In-memory catalog of activities keyed by name.
 *
 * The catalog is fixed at construction; only rosters change afterwards.
 * Every operation holds one registry-wide lock, so the membership and
 * capacity checks and the roster update happen atomically.
 */
class ActivityRegistry {
public:
    using Catalog = std::map<std::string, Activity>;

    /**
     * Build a registry from a list of activities.
     * @throws CatalogError if two activities share a name.
     */
    explicit ActivityRegistry(std::vector<Activity> catalog, bool enforce_capacity = true);

    ActivityRegistry(const ActivityRegistry&) = delete;
    ActivityRegistry& operator=(const ActivityRegistry&) = delete;

    /**
     * Snapshot of every activity, keyed by name.
     */
    Catalog list() const;

    /**
     * Snapshot of one activity, or nullopt when the name is unknown.
     */
    std::optional<Activity> find(const std::string& name) const;

    /**
     * Add a participant to an activity's roster.
     * @return confirmation message
     * @throws CommandRejectedError not_found for an unknown activity,
     *         conflict when already enrolled or the activity is full.
     */
    std::string signup(const std::string& activity_name, const std::string& email);

    /**
     * Remove a participant from an activity's roster.
     * @return confirmation message
     * @throws CommandRejectedError not_found for an unknown activity,
     *         conflict when the participant is not enrolled.
     */
    std::string unregister(const std::string& activity_name, const std::string& email);

    size_t size() const;
    bool enforces_capacity() const { return enforce_capacity_; }

private:
    Activity& require_activity(const std::string& name);

    mutable std::mutex mutex_;
    Catalog activities_;
    bool enforce_capacity_;
};

} // namespace activities
