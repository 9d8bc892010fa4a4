#include "data_config.h"
#include "pch.h"

#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>

cxxopts::Options create_options() {
    cxxopts::Options options("Aera.Tests", "AERA vulnerability risk analytics test.");
    options.add_options()("s,schemas", "Path to the JSON schemas folder.",
                          cxxopts::value<std::string>())("help",
                                                         "Help about this test application.");

    return options;
}

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "\nInitialising with a custom GTest main function.\n\n";

    auto options = create_options();
    options.allow_unrecognised_options();
    auto result = options.parse(argc, argv);
    auto schema_path = std::filesystem::path{};
    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return EXIT_SUCCESS;
    }
    if (result.count("schemas")) {
        schema_path = std::filesystem::path{result["schemas"].as<std::string>()};
        if (schema_path.is_relative()) {
            schema_path = std::filesystem::absolute(schema_path);
        }
    } else {
        schema_path = TEST_SCHEMA_PATH;
        std::cout << "Using default schemas folder ...\n\n";
    }

    auto start_path = std::filesystem::current_path();
    std::cout << "Test location: " << start_path.string() << "\n";
    if (std::filesystem::exists(schema_path)) {
        std::cout << "Test schemas.: " << schema_path.string() << "\n\n";
        test_schema_path = schema_path.string();
    } else {
        std::cerr << "Test schemas.: " << schema_path.string() << " *** not found ***.\n\n";
    }

    return RUN_ALL_TESTS();
}
