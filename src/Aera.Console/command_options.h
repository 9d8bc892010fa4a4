/**
 * @file
 * @brief Functionality for parsing console application's command-line arguments
 */
#pragma once

#include <cxxopts.hpp>

#include "Aera.Core/date_util.h"

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace aera::host {
/// @brief Defines the Command Line Interface (CLI) arguments options
struct CommandOptions {
    /// @brief The configuration file, optional
    std::optional<std::filesystem::path> config_file;

    /// @brief The file-based store root folder, selects the file store when given
    std::optional<std::filesystem::path> storage_folder;

    /// @brief The snapshot date override
    std::optional<core::Date> snapshot_date;

    /// @brief The maximum number of threads to use (0: no limit).
    std::optional<std::size_t> num_threads;

    /// @brief Indicates whether the application logging is verbose
    bool verbose{};
};

/// @brief Creates the command-line interface (CLI) options
/// @return AERA CLI options
cxxopts::Options create_options();

/// @brief Parses the command-line interface (CLI) arguments
/// @param options The valid CLI options
/// @param argc Number of input arguments
/// @param argv List of input arguments
/// @return User command-line options or std::nullopt if program should exit
/// @throws std::invalid_argument for malformed argument values.
std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv);

/// @brief Prints an error line in red, on the standard error stream by default
/// @param message The error message
/// @param stream The output stream
void print_error(std::string_view message, std::FILE *stream = stderr);

} // namespace aera::host
