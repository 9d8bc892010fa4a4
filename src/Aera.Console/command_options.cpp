#include "command_options.h"
#include "version.h"

#include <fmt/color.h>

#include <iostream>
#include <stdexcept>

namespace aera::host {

cxxopts::Options create_options() {
    cxxopts::Options options("Aera.Console",
                             "AERA nightly vulnerability risk analytics pipeline.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("s,storage", "Path to root folder of the file-based store.",
            cxxopts::value<std::string>())
        ("d,date", "Snapshot date, YYYY-MM-DD (default: today, UTC).",
            cxxopts::value<std::string>())
        ("T,threads", "The maximum number of threads to create (0: no limit, default: 1).",
            cxxopts::value<size_t>())
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}\n\n", PROJECT_VERSION);
        return std::nullopt;
    }

    cmd.verbose = result["verbose"].as<bool>();
    if (cmd.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (result.count("config")) {
        cmd.config_file = std::filesystem::path{result["config"].as<std::string>()};
        fmt::print("Configuration file: {}\n", cmd.config_file->string());
    }

    if (result.count("storage")) {
        cmd.storage_folder = std::filesystem::path{result["storage"].as<std::string>()};
        fmt::print("Data source: {}\n", cmd.storage_folder->string());
    }

    if (result.count("date")) {
        auto text = result["date"].as<std::string>();
        try {
            cmd.snapshot_date = core::parse_iso_date(text);
        } catch (const std::invalid_argument &) {
            throw std::invalid_argument(
                fmt::format("Snapshot date must be YYYY-MM-DD, given: {}.", text));
        }
    }

    if (result.count("threads")) {
        cmd.num_threads = result["threads"].as<size_t>();
    }

    return cmd;
}

void print_error(std::string_view message, std::FILE *stream) {
    fmt::print(stream, fg(fmt::color::red), "\n{}\n", message);
}
} // namespace aera::host
