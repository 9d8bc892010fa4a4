#pragma once

#include <filesystem>

namespace aera::host {
//! Get the path to the directory of the currently executing program
std::filesystem::path get_program_directory();

//! Get the path to the currently executing program
std::filesystem::path get_program_path();

//! Get the path to the JSON schemas shipped beside the program
std::filesystem::path get_schema_directory();
} // namespace aera::host
