#include "exception.h"

#include <filesystem>

#include <fmt/format.h>

namespace aera::core {

AeraException::AeraException(const std::string &what_arg, const std::source_location location)
    : std::runtime_error{what_arg}, location_{location} {
    auto file = std::filesystem::path{location_.file_name()}.filename().string();
    what_arg_ = fmt::format("{}:{}: {}", file, line(), std::runtime_error::what());
}

const char *AeraException::what() const noexcept { return what_arg_.c_str(); }

std::uint_least32_t AeraException::line() const noexcept { return location_.line(); }

const char *AeraException::file_name() const noexcept { return location_.file_name(); }

const char *AeraException::function_name() const noexcept { return location_.function_name(); }

UpstreamIOError::UpstreamIOError(const std::string &what_arg, const std::source_location location)
    : AeraException{what_arg, location} {}

} // namespace aera::core
