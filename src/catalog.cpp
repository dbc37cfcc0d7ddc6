#include "activities/catalog.hpp"
#include "activities/errors.hpp"
#include "activities/validation.hpp"
#include <fstream>

namespace activities {
namespace catalog {

std::vector<Activity> default_catalog() {
    return {
        {"Chess Club",
         "Learn strategies and compete in chess tournaments",
         "Fridays, 3:30 PM - 5:00 PM", 12,
         {"michael@mergington.edu", "daniel@mergington.edu"}},
        {"Programming Class",
         "Learn programming fundamentals and build software projects",
         "Tuesdays and Thursdays, 3:30 PM - 4:30 PM", 20,
         {"emma@mergington.edu", "sophia@mergington.edu"}},
        {"Gym Class",
         "Physical education and sports activities",
         "Mondays, Wednesdays, Fridays, 2:00 PM - 3:00 PM", 30,
         {"john@mergington.edu", "olivia@mergington.edu"}},
        {"Soccer Team",
         "Join the school soccer team and compete in matches",
         "Tuesdays and Thursdays, 4:00 PM - 5:30 PM", 22,
         {"liam@mergington.edu", "noah@mergington.edu"}},
        {"Basketball Team",
         "Practice and play basketball with the school team",
         "Wednesdays and Fridays, 3:30 PM - 5:00 PM", 15,
         {"ava@mergington.edu", "mia@mergington.edu"}},
        {"Art Club",
         "Explore your creativity through painting and drawing",
         "Thursdays, 3:30 PM - 5:00 PM", 15,
         {"amelia@mergington.edu", "harper@mergington.edu"}},
        {"Drama Club",
         "Act, direct, and produce plays and performances",
         "Mondays and Wednesdays, 4:00 PM - 5:30 PM", 20,
         {"ella@mergington.edu", "scarlett@mergington.edu"}},
        {"Math Club",
         "Solve challenging problems and participate in math competitions",
         "Tuesdays, 3:30 PM - 4:30 PM", 10,
         {"james@mergington.edu", "benjamin@mergington.edu"}},
        {"Debate Team",
         "Develop public speaking and argumentation skills",
         "Fridays, 4:00 PM - 5:30 PM", 12,
         {"charlotte@mergington.edu", "henry@mergington.edu"}},
    };
}

namespace {

Activity parse_entry(const std::string& name, const nlohmann::json& entry) {
    validation::require_not_empty(name, "activity name");
    if (!entry.is_object()) {
        throw CatalogError("Catalog entry for " + name + " must be an object");
    }

    Activity activity;
    activity.name = name;
    try {
        activity.description = entry.value("description", std::string{});
        activity.schedule = entry.value("schedule", std::string{});
        activity.max_participants = entry.at("max_participants").get<int>();
        activity.participants = entry.value("participants", std::vector<std::string>{});
    } catch (const nlohmann::json::exception& e) {
        throw CatalogError("Invalid catalog entry for " + name + ": " + e.what());
    }

    validation::require_positive(activity.max_participants, name + " max_participants");
    validation::require_unique(activity.participants, name + " participants");
    validation::require_at_most(activity.participants,
        static_cast<size_t>(activity.max_participants), name + " participants");
    return activity;
}

} // anonymous namespace

std::vector<Activity> from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw CatalogError("Catalog must be a JSON object keyed by activity name");
    }

    std::vector<Activity> result;
    result.reserve(document.size());
    for (const auto& [name, entry] : document.items()) {
        result.push_back(parse_entry(name, entry));
    }
    return result;
}

std::vector<Activity> load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw CatalogError("Cannot open catalog file: " + path);
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw CatalogError("Cannot parse catalog file " + path + ": " + e.what());
    }
    return from_json(document);
}

} // namespace catalog
} // namespace activities
