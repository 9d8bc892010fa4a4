#pragma once
#include <string>
#include <vector>

namespace aera::core {

/// @brief Defines an univariate statistical summary data type
///
/// @details Calculates running summaries using the first two statistical moments, with
/// constant storage size and without storing the data points. The running average is
/// updated incrementally, so a sequence of identical values has exactly that average and
/// exactly zero variance.
class UnivariateSummary {
  public:
    /// @brief Initialises a new instance of the UnivariateSummary class.
    UnivariateSummary();

    /// @brief Initialises a new instance of the UnivariateSummary class.
    /// @param name The feature or variable name
    explicit UnivariateSummary(std::string name);

    /// @brief Initialises a new instance of the UnivariateSummary class.
    /// @param values The values to summary
    explicit UnivariateSummary(const std::vector<double> &values);

    /// @brief Gets the feature or variable name
    /// @return The name identification
    const std::string &name() const noexcept;

    /// @brief Determine whether the summary is empty
    /// @return true if the summary has is empty; otherwise, false.
    bool is_empty() const noexcept;

    /// @brief Gets the number of data points included in the summary
    /// @return Number of data points
    std::size_t count() const noexcept;

    /// @brief Gets the minimum, NaN when empty
    /// @return Minimum value
    double min() const noexcept;

    /// @brief Gets the maximum, NaN when empty
    /// @return Maximum value
    double max() const noexcept;

    /// @brief Gets the sum value
    /// @return Sum value
    double sum() const noexcept;

    /// @brief Gets the average or mean
    /// @return Average value
    double average() const noexcept;

    /// @brief Gets the population variance (divisor n)
    /// @return Variance value, NaN when empty
    double population_variance() const noexcept;

    /// @brief Gets the population standard deviation
    /// @return Standard deviation value
    double std_deviation() const noexcept;

    /// @brief Appends a new value to the summary
    /// @param value The new value
    void append(double value) noexcept;

    /// @brief Appends a collection of values to the summary
    /// @param values The new values
    void append(const std::vector<double> &values) noexcept;

  private:
    std::string name_;
    double min_;
    double max_;
    double count_{};
    double mean_{};
    double second_moment_{};
};
} // namespace aera::core
