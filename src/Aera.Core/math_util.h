#pragma once

namespace aera::core {

/// @brief Numeric helper functions shared by the analytics stages.
///
/// Values published by the pipeline (risk scores, snapshot statistics, drift) are rounded
/// half away from zero to a fixed number of decimal places, and floating point comparisons
/// are made with relative precision.
class MathHelper {
  public:
    MathHelper() = delete;

    /// @brief Number of decimal places used for every published statistic.
    static constexpr int published_decimals = 4;

    /// @brief Gets the difference between 1.0 and the next representable double.
    /// @return The machine precision value
    static double machine_precision() noexcept;

    /// @brief Gets the typical meaningful precision for numerical calculations.
    /// @return The square root of the machine precision
    static double default_numerical_precision() noexcept;

    /// @brief Rounds a value to a number of decimal places, half away from zero.
    /// @param value The value to round
    /// @param decimals Number of decimal places, non-negative
    /// @return The rounded value
    static double round_to(double value, int decimals) noexcept;

    /// @brief Rounds a value to the published number of decimal places.
    /// @param value The value to round
    /// @return The rounded value
    static double round_published(double value) noexcept;

    /// @brief Compares two floating-point numbers for relative equality using
    ///        the default numerical precision.
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right) noexcept;

    /// @brief Compares two floating-point numbers for relative equality.
    ///
    /// <c>x = |a - b| / max(|a|, |b|)</c> is compared with the precision; when the
    /// denominator itself is below the precision the numbers are considered equal.
    ///
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @param precision The comparison precision.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right, double precision) noexcept;

    /// @brief Checks whether a standard deviation is too small to be used as a divisor.
    /// @param std_deviation The column standard deviation
    /// @param average The column average, used to scale the tolerance
    /// @return true if the column must be treated as constant; otherwise, false.
    static bool is_negligible_scale(double std_deviation, double average) noexcept;
};

} // namespace aera::core
