#pragma once

#include <string>

/// @brief Schema folder given on the test command line, empty for the default
extern std::string test_schema_path;

/// @brief Finds a relative path in the current folder or any of its parents
/// @param relative_path The path to find
/// @return The absolute path
std::string resolve_path(const std::string &relative_path);

/// @brief Gets the JSON schemas folder used by the tests
/// @return The schemas folder
std::string default_schema_path();
