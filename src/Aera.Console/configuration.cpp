#include "configuration.h"
#include "schema.h"

#include <fmt/color.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace { // anonymous namespace

using json = nlohmann::json;

void load_store_info(const json &j, const std::filesystem::path &config_dir,
                     aera::host::StoreInfo &store) {
    store.type = j.value("type", store.type);
    store.url = j.value("url", store.url);
    if (j.contains("folder")) {
        auto folder = std::filesystem::path{j.at("folder").get<std::string>()};
        store.folder = folder.is_relative() ? config_dir / folder : folder;
    }

    store.read_timeout_seconds = j.value("read_timeout_seconds", store.read_timeout_seconds);
    store.write_timeout_seconds = j.value("write_timeout_seconds", store.write_timeout_seconds);
}

void load_model_info(const json &j, aera::host::ModelInfo &model) {
    model.name = j.value("name", model.name);
    model.version = j.value("version", model.version);
    model.seed = j.value("seed", model.seed);
    model.trees = j.value("trees", model.trees);
}

void load_pipeline_info(const json &j, aera::host::PipelineInfo &pipeline) {
    pipeline.initiated_by = j.value("initiated_by", pipeline.initiated_by);
    pipeline.baseline_days = j.value("baseline_days", pipeline.baseline_days);
}

} // anonymous namespace

namespace aera::host {

ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error{msg} {}

std::optional<std::string> read_environment(const std::string &variable) {
    const char *value = std::getenv(variable.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }

    return std::string{value};
}

std::string trim_url(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    return url;
}

void load_config_file(const std::filesystem::path &config_file,
                      const std::filesystem::path &schema_directory, Configuration &config) {
    std::ifstream ifs(config_file, std::ifstream::in);
    if (!ifs) {
        throw ConfigurationError(fmt::format("File {} doesn't exist.", config_file.string()));
    }

    validate_config(schema_directory, ifs);

    ifs.clear();
    ifs.seekg(0);
    const auto opt = [&ifs]() {
        try {
            return json::parse(ifs);
        } catch (const std::exception &e) {
            throw ConfigurationError(fmt::format("Could not parse JSON: {}", e.what()));
        }
    }();

    // Base dir for relative paths
    const auto config_dir = std::filesystem::absolute(config_file).parent_path();

    config.config_file = config_file;
    try {
        if (opt.contains("store")) {
            load_store_info(opt.at("store"), config_dir, config.store);
        }
        if (opt.contains("model")) {
            load_model_info(opt.at("model"), config.model);
        }
        if (opt.contains("pipeline")) {
            load_pipeline_info(opt.at("pipeline"), config.pipeline);
        }
    } catch (const json::exception &e) {
        throw ConfigurationError(fmt::format("Could not load configuration: {}", e.what()));
    }
}

Configuration get_configuration(const CommandOptions &options,
                                const std::filesystem::path &schema_directory,
                                const EnvironmentReader &environment) {
    Configuration config;
    config.verbose = options.verbose;

    // Configuration file
    if (options.config_file.has_value()) {
        load_config_file(options.config_file.value(), schema_directory, config);
    }

    // Environment
    if (auto url = environment("SUPABASE_URL")) {
        config.store.url = url.value();
    }
    if (auto key = environment("SUPABASE_SERVICE_ROLE_KEY")) {
        config.store.key = key.value();
    }
    if (auto version = environment("AERA_MODEL_VERSION")) {
        config.model.version = version.value();
    }

    // Command line
    if (options.storage_folder.has_value()) {
        config.store.type = "file";
        config.store.folder = options.storage_folder.value();
    }

    config.snapshot_date = options.snapshot_date.value_or(core::today_utc());
    config.threads = options.num_threads.value_or(config.threads);
    config.store.url = trim_url(config.store.url);

    // Validation
    if (config.store.type == "rest") {
        if (config.store.url.empty() || config.store.key.empty()) {
            throw ConfigurationError("Missing SUPABASE_URL or SUPABASE_SERVICE_ROLE_KEY");
        }
    } else if (config.store.type == "file") {
        if (config.store.folder.empty()) {
            throw ConfigurationError("The file store requires a root folder.");
        }
        if (!std::filesystem::is_directory(config.store.folder)) {
            throw ConfigurationError(
                fmt::format("File store folder: {} not found.", config.store.folder.string()));
        }
    } else {
        throw ConfigurationError(fmt::format("Unknown store type: {}.", config.store.type));
    }

    if (config.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Store: {}, model: {} {}, seed: {}, trees: {}\n",
                   config.store.type, config.model.name, config.model.version, config.model.seed,
                   config.model.trees);
    }

    return config;
}

} // namespace aera::host
