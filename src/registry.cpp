#include "activities/registry.hpp"
#include "activities/errors.hpp"
#include "activities/logging.hpp"
#include <algorithm>

namespace activities {

ActivityRegistry::ActivityRegistry(std::vector<Activity> catalog, bool enforce_capacity)
    : enforce_capacity_(enforce_capacity) {
    for (auto& activity : catalog) {
        std::string name = activity.name;
        if (!activities_.emplace(name, std::move(activity)).second) {
            throw CatalogError("Duplicate activity name: " + name);
        }
    }
}

ActivityRegistry::Catalog ActivityRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activities_;
}

std::optional<Activity> ActivityRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = activities_.find(name);
    if (it == activities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ActivityRegistry::signup(const std::string& activity_name, const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Guard
    Activity& activity = require_activity(activity_name);

    // Validate
    if (activity.has_participant(email)) {
        throw CommandRejectedError::conflict("Student is already signed up for this activity");
    }
    if (enforce_capacity_ && activity.is_full()) {
        throw CommandRejectedError::conflict("Activity is full");
    }

    std::string message = "Signed up " + email + " for " + activity_name;
    nlohmann::json fields = {{"activity", activity_name}, {"email", email},
                             {"participants", activity.participant_count() + 1}};

    // Apply
    activity.participants.push_back(email);

    log_info(LOG_DOMAIN, "participant_signed_up", fields);
    return message;
}

std::string ActivityRegistry::unregister(const std::string& activity_name, const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Guard
    Activity& activity = require_activity(activity_name);

    // Validate
    auto it = std::find(activity.participants.begin(), activity.participants.end(), email);
    if (it == activity.participants.end()) {
        throw CommandRejectedError::conflict("Student is not registered for this activity");
    }

    std::string message = "Unregistered " + email + " from " + activity_name;
    nlohmann::json fields = {{"activity", activity_name}, {"email", email},
                             {"participants", activity.participant_count() - 1}};

    // Apply
    activity.participants.erase(it);

    log_info(LOG_DOMAIN, "participant_unregistered", fields);
    return message;
}

size_t ActivityRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activities_.size();
}

Activity& ActivityRegistry::require_activity(const std::string& name) {
    auto it = activities_.find(name);
    if (it == activities_.end()) {
        throw CommandRejectedError::not_found("Activity not found");
    }
    return it->second;
}

} // namespace activities
