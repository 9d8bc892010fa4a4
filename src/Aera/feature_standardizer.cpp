#include "feature_standardizer.h"
#include "risk_scorer.h"

#include "Aera.Core/math_util.h"

#include <stdexcept>

namespace {
double flag(bool value) noexcept { return value ? 1.0 : 0.0; }
} // anonymous namespace

namespace aera {

const std::array<std::string, feature_count> &feature_names() {
    static const auto names = std::array<std::string, feature_count>{
        "risk_score",          "household_size",        "medication_dependency",
        "insulin_dependency",  "oxygen_powered_device", "mobility_limitation",
        "transportation_access", "financial_strain"};
    return names;
}

FeatureMatrix
FeatureStandardizer::build_features(const std::vector<core::EntityRecord> &population) {
    auto features = FeatureMatrix(static_cast<Eigen::Index>(population.size()), feature_count);
    auto row = Eigen::Index{0};
    for (const auto &record : population) {
        auto profile = RiskScorer::resolve(record);
        features(row, static_cast<Eigen::Index>(Feature::risk_score)) =
            record.risk_score.value_or(0.0);
        features(row, static_cast<Eigen::Index>(Feature::household_size)) = profile.household_size;
        features(row, static_cast<Eigen::Index>(Feature::medication_dependency)) =
            flag(profile.medication_dependency);
        features(row, static_cast<Eigen::Index>(Feature::insulin_dependency)) =
            flag(profile.insulin_dependency);
        features(row, static_cast<Eigen::Index>(Feature::oxygen_powered_device)) =
            flag(profile.oxygen_powered_device);
        features(row, static_cast<Eigen::Index>(Feature::mobility_limitation)) =
            flag(profile.mobility_limitation);
        features(row, static_cast<Eigen::Index>(Feature::transportation_access)) =
            flag(profile.transportation_access);
        features(row, static_cast<Eigen::Index>(Feature::financial_strain)) =
            flag(profile.financial_strain);
        row++;
    }

    return features;
}

FeatureMatrix FeatureStandardizer::fit_transform(const FeatureMatrix &features) {
    if (features.rows() < 1) {
        throw std::invalid_argument("Feature standardisation requires at least one row.");
    }

    summaries_.clear();
    summaries_.reserve(static_cast<std::size_t>(features.cols()));

    auto result = FeatureMatrix(features.rows(), features.cols());
    for (auto col = Eigen::Index{0}; col < features.cols(); col++) {
        auto name = col < feature_count ? feature_names()[static_cast<std::size_t>(col)]
                                        : std::to_string(col);
        auto summary = core::UnivariateSummary{std::move(name)};
        for (auto row = Eigen::Index{0}; row < features.rows(); row++) {
            summary.append(features(row, col));
        }

        auto average = summary.average();
        auto deviation = summary.std_deviation();
        if (core::MathHelper::is_negligible_scale(deviation, average)) {
            result.col(col).setZero();
        } else {
            result.col(col) = (features.col(col).array() - average) / deviation;
        }

        summaries_.emplace_back(std::move(summary));
    }

    return result;
}

const std::vector<core::UnivariateSummary> &FeatureStandardizer::summaries() const noexcept {
    return summaries_;
}

} // namespace aera
