#pragma once

#include "Aera.Core/poco.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace aera::data {
/// @brief JSON parser namespace alias.
///
/// Store rows serialisation / de-serialisation mapping specific to the
/// `JSON for Modern C++` library adopted by the project. Null and missing
/// columns map to empty optional members.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
using json = nlohmann::json;

/// @brief Gets an optional value from a JSON object
/// @tparam T Value type
/// @param j JSON object
/// @param key Key to value
/// @return The value, empty if the key is missing or null
template <class T> std::optional<T> get_optional(const json &j, const std::string &key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }

    return it->template get<T>();
}

/// @brief Converts an optional value to JSON
/// @tparam T Value type
/// @param value The optional value
/// @return The value, or JSON null if empty
template <class T> json to_nullable(const std::optional<T> &value) {
    if (value.has_value()) {
        return json(value.value());
    }

    return json(nullptr);
}

} // namespace aera::data

// Store rows mapping, declared with the record types for argument-dependent lookup
namespace aera::core {
using json = nlohmann::json;

// Vulnerability profiles
void to_json(json &j, const EntityRecord &p);
void from_json(const json &j, EntityRecord &p);

void to_json(json &j, const ScoreUpdate &p);

// Region snapshots
void to_json(json &j, const RegionSnapshot &p);
void from_json(const json &j, RegionSnapshot &p);

void from_json(const json &j, SnapshotBaseline &p);

// Audit log
json metrics_to_json(const AuditMetrics &metrics);

void to_json(json &j, const AuditRecord &p);

} // namespace aera::core
