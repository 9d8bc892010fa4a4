#pragma once

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>

namespace aera::core {

/// @brief AERA base exception class, with source location information
class AeraException : public std::runtime_error {
  public:
    /// @brief Construct a new AeraException
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    AeraException(const std::string &what_arg,
                  const std::source_location location = std::source_location::current());

    /// @brief Gets the exception message, prefixed by the source location
    /// @return The exception message
    const char *what() const noexcept override;

    /// @brief Gets the exception source location line
    /// @return The location line
    std::uint_least32_t line() const noexcept;

    /// @brief Gets the exception source location file name
    /// @return The location file name
    const char *file_name() const noexcept;

    /// @brief Gets the exception source location function name
    /// @return The location function name
    const char *function_name() const noexcept;

  private:
    std::source_location location_;
    std::string what_arg_;
};

/// @brief Failure of an external collaborator: population store, snapshot store or audit sink.
///
/// Raised for transport errors, rejected requests (HTTP status >= 400), unreadable payloads
/// and file system errors. A run that sees this error is aborted as a whole.
class UpstreamIOError final : public AeraException {
  public:
    /// @brief Construct a new UpstreamIOError
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    UpstreamIOError(const std::string &what_arg,
                    const std::source_location location = std::source_location::current());
};

} // namespace aera::core
