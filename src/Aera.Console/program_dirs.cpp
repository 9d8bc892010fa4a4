#include "program_dirs.h"

#ifdef __linux__
#include <climits>
#include <unistd.h>
#endif

#include "Aera.Core/exception.h"

#include <array>

namespace {
void throw_path_error() { throw aera::core::AeraException("Could not get program path"); }
} // anonymous namespace

namespace aera::host {
std::filesystem::path get_program_directory() { return get_program_path().parent_path(); }

std::filesystem::path get_program_path() {
#if defined(__linux__)
    std::array<char, PATH_MAX> path{};
    if (readlink("/proc/self/exe", path.data(), path.size() - 1) == -1) {
        throw_path_error();
    }
#else
#error "Unsupported platform"
#endif

    return path.data();
}

std::filesystem::path get_schema_directory() {
    return get_program_directory() / "schemas" / "v1";
}
} // namespace aera::host
