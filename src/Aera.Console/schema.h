#pragma once

#include <filesystem>
#include <istream>

//! The name of the configuration schema file
#define AERA_CONFIG_SCHEMA_FILENAME "config.json"

namespace aera::host {
/// @brief Validate a configuration file against its JSON schema
/// @param schema_directory The root folder for JSON schemas
/// @param config_stream The input stream for the configuration file
/// @throws ConfigurationError for an invalid configuration or missing schema.
void validate_config(const std::filesystem::path &schema_directory, std::istream &config_stream);
} // namespace aera::host
