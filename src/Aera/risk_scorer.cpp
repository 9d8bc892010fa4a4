#include "risk_scorer.h"

#include "Aera.Core/math_util.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double indicator(bool value) noexcept { return value ? 1.0 : 0.0; }
} // anonymous namespace

namespace aera {

RiskProfile RiskScorer::resolve(const core::EntityRecord &record) noexcept {
    auto household = record.household_size.value_or(1.0);
    if (!std::isfinite(household) || household < 1.0) {
        household = 1.0;
    }

    return RiskProfile{.household_size = household,
                       .medication_dependency = record.medication_dependency.value_or(false),
                       .insulin_dependency = record.insulin_dependency.value_or(false),
                       .oxygen_powered_device = record.oxygen_powered_device.value_or(false),
                       .mobility_limitation = record.mobility_limitation.value_or(false),
                       .transportation_access = record.transportation_access.value_or(true),
                       .financial_strain = record.financial_strain.value_or(false)};
}

double RiskScorer::household_component(double household_size) noexcept {
    return std::min(std::max(household_size, 1.0) * household_weight, household_cap);
}

double RiskScorer::score(const RiskProfile &profile) noexcept {
    auto value = household_component(profile.household_size) +
                 medication_weight * indicator(profile.medication_dependency) +
                 insulin_weight * indicator(profile.insulin_dependency) +
                 oxygen_device_weight * indicator(profile.oxygen_powered_device) +
                 mobility_weight * indicator(profile.mobility_limitation) +
                 no_transport_weight * (1.0 - indicator(profile.transportation_access)) +
                 financial_strain_weight * indicator(profile.financial_strain);

    return core::MathHelper::round_published(value);
}

double RiskScorer::score(const core::EntityRecord &record) noexcept {
    return score(resolve(record));
}

std::vector<core::ScoreUpdate> RiskScorer::score_all(std::vector<core::EntityRecord> &population) {
    auto updates = std::vector<core::ScoreUpdate>{};
    updates.reserve(population.size());
    for (auto &record : population) {
        auto value = score(record);
        record.risk_score = value;
        updates.push_back(core::ScoreUpdate{.id = record.id, .risk_score = value});
    }

    return updates;
}

} // namespace aera
