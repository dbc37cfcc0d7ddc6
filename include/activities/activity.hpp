#pragma once

#include <algorithm>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace activities {

/// One extracurricular activity and its current roster.
struct Activity {
    std::string name;
    std::string description;
    std::string schedule;
    int max_participants = 0;
    std::vector<std::string> participants;

    bool has_participant(const std::string& email) const {
        return std::find(participants.begin(), participants.end(), email) != participants.end();
    }

    int participant_count() const { return static_cast<int>(participants.size()); }
    bool is_full() const { return participant_count() >= max_participants; }

    bool operator==(const Activity& other) const {
        return name == other.name && description == other.description &&
               schedule == other.schedule && max_participants == other.max_participants &&
               participants == other.participants;
    }
};

/// Serializes the catalog entry without its name; the name is the enclosing key.
inline void to_json(nlohmann::json& j, const Activity& activity) {
    j = nlohmann::json{
        {"description", activity.description},
        {"schedule", activity.schedule},
        {"max_participants", activity.max_participants},
        {"participants", activity.participants}
    };
}

} // namespace activities
