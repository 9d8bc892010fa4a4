#pragma once

#include "Aera.Core/poco.h"

#include <vector>

namespace aera {

/// @brief Vulnerability attributes of one profile, after the missing value defaults
///
/// Missing risk factors are false, missing transportation access is true, and the
/// household size is 1 when missing and never less than 1.
struct RiskProfile {
    double household_size{1.0};
    bool medication_dependency{};
    bool insulin_dependency{};
    bool oxygen_powered_device{};
    bool mobility_limitation{};
    bool transportation_access{true};
    bool financial_strain{};
};

/// @brief Additive vulnerability risk scoring model.
///
/// @details The score is the capped household component plus a fixed weight for each
/// dependency flag, rounded to four decimal places:
///
/// <c>min(max(household, 1) * 0.4, 3.2) + 1.8 medication + 2.2 insulin + 2.5 oxygen
/// + 1.5 mobility + 1.2 (1 - transport) + 1.4 financial</c>
class RiskScorer {
  public:
    /// @brief Weight applied to each household member
    static constexpr double household_weight = 0.4;

    /// @brief Upper bound of the household component
    static constexpr double household_cap = 3.2;

    static constexpr double medication_weight = 1.8;
    static constexpr double insulin_weight = 2.2;
    static constexpr double oxygen_device_weight = 2.5;
    static constexpr double mobility_weight = 1.5;
    static constexpr double no_transport_weight = 1.2;
    static constexpr double financial_strain_weight = 1.4;

    /// @brief Applies the missing value defaults to a profile record
    /// @param record The vulnerability profile record
    /// @return The resolved risk attributes
    static RiskProfile resolve(const core::EntityRecord &record) noexcept;

    /// @brief Calculates the household component of the score
    /// @param household_size The household size, floored at one
    /// @return The household component, in [0.4, 3.2]
    static double household_component(double household_size) noexcept;

    /// @brief Calculates the risk score of resolved attributes
    /// @param profile The resolved risk attributes
    /// @return The non-negative risk score, rounded to four decimal places
    static double score(const RiskProfile &profile) noexcept;

    /// @brief Calculates the risk score of a profile record
    /// @param record The vulnerability profile record
    /// @return The non-negative risk score, rounded to four decimal places
    static double score(const core::EntityRecord &record) noexcept;

    /// @brief Recalculates the risk score of every record, replacing the stored value
    /// @param population The population records to update in place
    /// @return The write-back rows, in population order
    static std::vector<core::ScoreUpdate> score_all(std::vector<core::EntityRecord> &population);
};

} // namespace aera
