#pragma once

#include "command_options.h"
#include "version.h"

#include "Aera.Core/date_util.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace aera::host {

/// @brief Store selection and connection settings
struct StoreInfo {
    /// @brief Store type, <c>rest</c> or <c>file</c>
    std::string type{"rest"};

    /// @brief REST service base URL, without trailing slash
    std::string url;

    /// @brief REST service role key
    std::string key;

    /// @brief File-based store root folder
    std::filesystem::path folder;

    /// @brief Timeout of read requests, in seconds
    long read_timeout_seconds{60};

    /// @brief Timeout of write requests, in seconds
    long write_timeout_seconds{120};
};

/// @brief Model identification and fitting settings
struct ModelInfo {
    std::string name{"aera-level3"};
    std::string version{"level3-2026.02"};
    unsigned int seed{42};
    std::size_t trees{100};
};

/// @brief Pipeline run settings
struct PipelineInfo {
    std::string initiated_by{"nightly_pipeline"};
    int baseline_days{30};
};

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The configuration file, empty when running on defaults
    std::filesystem::path config_file;

    /// @brief The store settings
    StoreInfo store;

    /// @brief The model settings
    ModelInfo model;

    /// @brief The pipeline run settings
    PipelineInfo pipeline;

    /// @brief The date of the snapshots produced by the run
    core::Date snapshot_date{};

    /// @brief The maximum number of threads (0: no limit)
    std::size_t threads{1};

    /// @brief Application logging verbosity
    bool verbose{};

    /// @brief Application name
    const char *app_name = PROJECT_NAME;

    /// @brief Application version
    const char *app_version = PROJECT_VERSION;
};

/// @brief Represents an error in the application configuration
class ConfigurationError : public std::runtime_error {
  public:
    ConfigurationError(const std::string &msg);
};

/// @brief Environment variable lookup function type
using EnvironmentReader = std::function<std::optional<std::string>(const std::string &)>;

/// @brief Reads a process environment variable
/// @param variable The variable name
/// @return The variable value, empty if not set or set to an empty string
std::optional<std::string> read_environment(const std::string &variable);

/// @brief Loads a configuration file into the configuration, validated against its schema
/// @param config_file The configuration file
/// @param schema_directory The root folder for JSON schemas
/// @param config The configuration to update
/// @throws ConfigurationError for missing, unparsable or invalid files.
void load_config_file(const std::filesystem::path &config_file,
                      const std::filesystem::path &schema_directory, Configuration &config);

/// @brief Builds the application configuration
///
/// @details Sources are applied in precedence order: command line, environment, configuration
/// file, then the built-in defaults.
///
/// @param options The command line options
/// @param schema_directory The root folder for JSON schemas
/// @param environment The environment lookup function
/// @return The validated configuration
/// @throws ConfigurationError for missing connection settings or an invalid file store.
Configuration get_configuration(const CommandOptions &options,
                                const std::filesystem::path &schema_directory,
                                const EnvironmentReader &environment = read_environment);

/// @brief Strips trailing slashes from a URL
/// @param url The URL
/// @return The URL without trailing slashes
std::string trim_url(std::string url);

} // namespace aera::host
