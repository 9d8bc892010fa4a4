#include "schema.h"
#include "configuration.h"

#include <fmt/format.h>
#include <jsoncons/json.hpp>
#include <jsoncons_ext/jsonschema/jsonschema.hpp>

#include <fstream>

namespace aera::host {
using namespace jsoncons;

void validate_config(const std::filesystem::path &schema_directory, std::istream &config_stream) {
    // Parsed again with jsoncons, the validator does not read the nlohmann-json representation
    auto config = json{};
    try {
        config = json::parse(config_stream);
    } catch (const ser_error &ex) {
        throw ConfigurationError(fmt::format("Could not parse JSON: {}", ex.what()));
    }

    // Load schema
    auto schema_path = schema_directory / AERA_CONFIG_SCHEMA_FILENAME;
    auto ifs_schema = std::ifstream{schema_path};
    if (!ifs_schema) {
        throw ConfigurationError(
            fmt::format("Failed to load schema: {}", schema_path.string()));
    }

    const auto schema = jsonschema::make_json_schema(json::parse(ifs_schema));

    // Perform validation
    try {
        schema.validate(config);
    } catch (const jsonschema::validation_error &ex) {
        throw ConfigurationError(fmt::format("Schema validation failed: {}", ex.what()));
    }
}
} // namespace aera::host
