#include "region_aggregator.h"

#include "Aera.Core/math_util.h"
#include "Aera.Core/univariate_summary.h"

#include <fmt/core.h>

#include <stdexcept>
#include <tuple>

namespace { // anonymous namespace

using GroupKey = std::tuple<std::string, std::string, std::optional<std::string>>;

struct RegionGroup {
    aera::core::UnivariateSummary risk{"risk_score"};
    std::size_t anomalies{};
    std::map<int, std::size_t> kmeans;
    std::map<int, std::size_t> dbscan;
};

/// @brief Region identifier, missing or empty identifiers resolve to UNKNOWN
std::string region_or_unknown(const std::optional<std::string> &region) {
    if (!region.has_value() || region->empty()) {
        return aera::unknown_region;
    }

    return region.value();
}

/// @brief Most frequent value, ties resolve to the smallest value
std::optional<int> dominant(const std::map<int, std::size_t> &frequency) {
    auto result = std::optional<int>{};
    auto best = std::size_t{0};
    for (const auto &[value, count] : frequency) {
        if (count > best) {
            best = count;
            result = value;
        }
    }

    return result;
}

} // anonymous namespace

namespace aera {

core::DriftStatus classify_drift(double drift) noexcept {
    if (drift > accelerating_drift) {
        return core::DriftStatus::accelerating;
    }
    if (drift > escalating_drift) {
        return core::DriftStatus::escalating;
    }

    return core::DriftStatus::stable;
}

double calculate_drift(double average, std::optional<double> baseline) noexcept {
    if (!baseline.has_value() || baseline.value() == 0.0) {
        return 0.0;
    }

    return core::MathHelper::round_published((average - baseline.value()) / baseline.value());
}

double project_risk(double average, double drift) noexcept {
    return core::MathHelper::round_published(average * (1.0 + drift * projection_drift_weight));
}

BaselineIndex index_baselines(const std::vector<core::SnapshotBaseline> &baselines) {
    auto result = BaselineIndex{};
    for (const auto &row : baselines) {
        if (!row.county_id.has_value() || !row.state_id.has_value() || row.county_id->empty() ||
            row.state_id->empty()) {
            continue;
        }

        result.insert_or_assign(std::make_pair(row.county_id.value(), row.state_id.value()),
                                row.avg_risk_score.value_or(0.0));
    }

    return result;
}

RegionAggregator::RegionAggregator(const RunContext &context) : context_{context} {}

std::vector<core::RegionSnapshot>
RegionAggregator::aggregate(const std::vector<core::EntityRecord> &population,
                            const ModelLabels &labels, const BaselineIndex &baselines) const {
    auto size = population.size();
    if (labels.kmeans.size() != size || labels.dbscan.size() != size ||
        labels.outliers.size() != size) {
        throw std::invalid_argument(
            fmt::format("Model outputs size mismatch, population: {}, kmeans: {}, dbscan: {}, "
                        "outliers: {}.",
                        size, labels.kmeans.size(), labels.dbscan.size(),
                        labels.outliers.size()));
    }

    auto groups = std::map<GroupKey, RegionGroup>{};
    for (auto i = std::size_t{0}; i < size; i++) {
        const auto &entity = population[i];
        auto key = GroupKey{region_or_unknown(entity.county_id),
                            region_or_unknown(entity.state_id), entity.organization_id};

        auto &group = groups[key];
        group.risk.append(entity.risk_score.value_or(0.0));
        group.kmeans[labels.kmeans[i]]++;
        group.dbscan[labels.dbscan[i]]++;
        if (labels.outliers[i]) {
            group.anomalies++;
        }
    }

    const auto &settings = context_.settings();
    auto result = std::vector<core::RegionSnapshot>{};
    result.reserve(groups.size());
    for (const auto &[key, group] : groups) {
        const auto &[county_id, state_id, organization_id] = key;

        auto average = group.risk.average();
        auto baseline = std::optional<double>{};
        if (auto it = baselines.find(std::make_pair(county_id, state_id)); it != baselines.end()) {
            baseline = it->second;
        }

        auto drift = calculate_drift(average, baseline);
        result.emplace_back(core::RegionSnapshot{
            .snapshot_date = context_.snapshot_date(),
            .window_days = settings.baseline_days,
            .organization_id = organization_id,
            .county_id = county_id,
            .state_id = state_id,
            .profile_count = group.risk.count(),
            .avg_risk_score = core::MathHelper::round_published(average),
            .max_risk_score = core::MathHelper::round_published(group.risk.max()),
            .min_risk_score = core::MathHelper::round_published(group.risk.min()),
            .anomaly_count = group.anomalies,
            .kmeans_cluster = dominant(group.kmeans),
            .dbscan_cluster = dominant(group.dbscan),
            .risk_growth_pct = drift,
            .drift_value = drift,
            .drift_status = classify_drift(drift),
            .projection_14d = project_risk(average, drift),
            .model_version = settings.model_version,
            .pipeline_run_id = context_.run_id(),
            .metadata = {{"generated_by", settings.generated_by}}});
    }

    return result;
}

} // namespace aera
