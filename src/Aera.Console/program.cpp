#include "Aera.Datastore/file_repository.h"
#include "Aera.Datastore/http_transport.h"
#include "Aera.Datastore/rest_repository.h"
#include "Aera/aera.h"
#include "command_options.h"
#include "configuration.h"
#include "event_monitor.h"
#include "program_dirs.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>

namespace {
/// @brief Get a string representation of current system time
/// @return The system time as string
std::string get_time_now_str() {
    auto tp = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch());
}

/// @brief Prints application start-up messages
void print_app_title() {
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold,
               "\n# AERA Level 3 Vulnerability Risk Analytics #\n\n");

    fmt::print("Today: {}\n\n", get_time_now_str());
}

/// @brief Prints application exit message
/// @param exit_code The application exit code
/// @return The respective exit code
int exit_application(int exit_code) {
    fmt::print("\n\n");
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "Goodbye.");
    fmt::print(" {}.\n\n", get_time_now_str());
    return exit_code;
}

aera::ModelParameters create_model_parameters(const aera::host::Configuration &config) {
    auto parameters = aera::ModelParameters{};
    parameters.kmeans.seed = config.model.seed;
    parameters.forest.seed = config.model.seed;
    parameters.forest.trees = config.model.trees;
    return parameters;
}

aera::RunSettings create_run_settings(const aera::host::Configuration &config) {
    return aera::RunSettings{.model_name = config.model.name,
                             .model_version = config.model.version,
                             .initiated_by = config.pipeline.initiated_by,
                             .baseline_days = config.pipeline.baseline_days};
}

/// @brief Runs the pipeline against a store implementing the three collaborator interfaces
template <class Store>
aera::PipelineResult run_pipeline(Store &store, const aera::host::Configuration &config) {
    auto event_bus = aera::DefaultEventBus();
    auto event_monitor = aera::host::EventMonitor{event_bus, config.verbose};

    auto pipeline =
        aera::Pipeline{store, store, store, event_bus, create_model_parameters(config)};
    auto context = aera::RunContext{create_run_settings(config), config.snapshot_date};
    return pipeline.run(context);
}
} // anonymous namespace

/// @brief AERA host application entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace aera;
    using namespace aera::host;

    // Parse command line arguments
    auto options = create_options();
    print_app_title();

    std::optional<CommandOptions> cmd_args_opt;
    try {
        cmd_args_opt = parse_arguments(options, argc, argv);

        // Nothing to run, e.g. the user chooses the --help option
        if (!cmd_args_opt) {
            return exit_application(EXIT_SUCCESS);
        }
    } catch (const std::exception &ex) {
        print_error(fmt::format("Invalid command line argument: {}", ex.what()));
        fmt::print("\n{}\n", options.help());
        return exit_application(EXIT_FAILURE);
    }

    const auto &cmd_args = cmd_args_opt.value();

    // Build the configuration, fails before touching any data
    Configuration config;
    try {
        config = get_configuration(cmd_args, get_schema_directory());
    } catch (const std::exception &ex) {
        print_error(fmt::format("Invalid configuration - {}.", ex.what()));
        return exit_application(EXIT_FAILURE);
    }

    auto threads = config.threads > 0 ? config.threads
                                      : static_cast<std::size_t>(
                                            tbb::this_task_arena::max_concurrency());
    auto thread_control =
        tbb::global_control(tbb::global_control::max_allowed_parallelism, threads);

    fmt::print("Snapshot date: {}\nStore: {}\nModel: {} {}\nMaximum threads: {}\n\n",
               core::to_iso_string(config.snapshot_date), config.store.type, config.model.name,
               config.model.version, threads);

    try {
        auto result = PipelineResult{};
        if (config.store.type == "file") {
            auto store = data::FileRepository{config.store.folder};
            result = run_pipeline(store, config);
        } else {
            auto transport = data::CurlTransport{};
            auto store = data::RestRepository{
                data::RestSettings{.url = config.store.url,
                                   .key = config.store.key,
                                   .read_timeout_seconds = config.store.read_timeout_seconds,
                                   .write_timeout_seconds = config.store.write_timeout_seconds},
                transport};
            result = run_pipeline(store, config);
        }

        fmt::print(fg(fmt::color::light_green),
                   "\nPipeline completed. run_id={}, profiles={}, snapshots={}\n", result.run_id,
                   result.processed, result.snapshots);
    } catch (const std::exception &ex) {
        print_error(fmt::format("Pipeline failed: {}", ex.what()));
        return exit_application(EXIT_FAILURE);
    }

    return exit_application(EXIT_SUCCESS);
}
