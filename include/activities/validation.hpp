#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include "errors.hpp"

namespace activities {
namespace validation {

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw CatalogError(field_name + " must not be empty");
    }
}

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw CatalogError(field_name + " must be positive");
    }
}

/**
 * Require that a collection holds no repeated entries.
 */
inline void require_unique(const std::vector<std::string>& values, const std::string& field_name = "collection") {
    std::unordered_set<std::string> seen;
    for (const auto& value : values) {
        if (!seen.insert(value).second) {
            throw CatalogError(field_name + " contains duplicate entry: " + value);
        }
    }
}

/**
 * Require that a collection holds at most `limit` entries.
 */
template<typename T>
void require_at_most(const std::vector<T>& collection, size_t limit, const std::string& field_name = "collection") {
    if (collection.size() > limit) {
        throw CatalogError(field_name + " exceeds limit of " + std::to_string(limit));
    }
}

} // namespace validation
} // namespace activities
