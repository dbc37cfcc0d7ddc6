#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "activity.hpp"

namespace activities {
namespace catalog {

/// Activities offered at the start of the term.
std::vector<Activity> default_catalog();

/**
 * Parse a catalog in the same shape ListActivities returns:
 * an object keyed by activity name.
 * @throws CatalogError on a malformed document or an invalid entry.
 */
std::vector<Activity> from_json(const nlohmann::json& document);

/// @throws CatalogError if the file cannot be opened or parsed.
std::vector<Activity> load_file(const std::string& path);

} // namespace catalog
} // namespace activities
