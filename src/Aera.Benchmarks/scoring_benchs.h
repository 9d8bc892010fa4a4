#pragma once
#include <benchmark/benchmark.h>
#include "Aera/feature_standardizer.h"
#include "Aera/region_aggregator.h"
#include "Aera/risk_scorer.h"

#include <string>
#include <vector>

static std::vector<aera::core::EntityRecord> create_population(std::size_t size) {
    auto result = std::vector<aera::core::EntityRecord>{};
    result.reserve(size);
    for (auto i = std::size_t{0}; i < size; i++) {
        result.push_back(aera::core::EntityRecord{
            .id = std::to_string(i),
            .organization_id = "org-" + std::to_string(i % 7),
            .county_id = "county-" + std::to_string(i % 31),
            .state_id = "state-" + std::to_string(i % 3),
            .household_size = static_cast<double>(1 + i % 6),
            .medication_dependency = (i % 2 == 0),
            .insulin_dependency = (i % 5 == 0),
            .oxygen_powered_device = (i % 11 == 0),
            .mobility_limitation = (i % 4 == 0),
            .transportation_access = (i % 9 != 0),
            .financial_strain = (i % 3 == 0)});
    }

    return result;
}

static void risk_score_all(benchmark::State &state) {
    auto population = create_population(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(aera::RiskScorer::score_all(population));
    }
}

static void standardize_features(benchmark::State &state) {
    auto population = create_population(static_cast<std::size_t>(state.range(0)));
    aera::RiskScorer::score_all(population);
    for (auto _ : state) {
        auto standardizer = aera::FeatureStandardizer{};
        benchmark::DoNotOptimize(
            standardizer.fit_transform(aera::FeatureStandardizer::build_features(population)));
    }
}

static void aggregate_regions(benchmark::State &state) {
    auto size = static_cast<std::size_t>(state.range(0));
    auto population = create_population(size);
    aera::RiskScorer::score_all(population);
    auto labels = aera::ModelLabels{.kmeans = std::vector<int>(size, 0),
                                    .dbscan = std::vector<int>(size, 0),
                                    .outliers = std::vector<bool>(size, false)};
    auto context = aera::RunContext{"bench", std::chrono::system_clock::now(), aera::RunSettings{},
                                    aera::core::today_utc()};
    auto aggregator = aera::RegionAggregator{context};
    for (auto _ : state) {
        benchmark::DoNotOptimize(aggregator.aggregate(population, labels, {}));
    }
}

BENCHMARK(risk_score_all)->Range(1 << 10, 1 << 16);
BENCHMARK(standardize_features)->Range(1 << 10, 1 << 16);
BENCHMARK(aggregate_regions)->Range(1 << 10, 1 << 16);
