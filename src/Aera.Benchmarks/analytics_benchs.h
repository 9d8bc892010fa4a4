#pragma once
#include <benchmark/benchmark.h>
#include "Aera/density_clusterer.h"
#include "Aera/isolation_forest.h"
#include "Aera/kmeans_clusterer.h"
#include "Aera/mtrandom.h"

#include <random>

using namespace aera;

static FeatureMatrix create_standard_normal(Eigen::Index rows) {
    auto rnd = MTRandom32{123};
    auto normal = std::normal_distribution<double>{};
    auto data = FeatureMatrix(rows, feature_count);
    for (auto row = Eigen::Index{0}; row < rows; row++) {
        for (auto col = Eigen::Index{0}; col < feature_count; col++) {
            data(row, col) = normal(rnd);
        }
    }

    return data;
}

static void kmeans_fit_predict(benchmark::State &state) {
    auto data = create_standard_normal(state.range(0));
    for (auto _ : state) {
        auto kmeans = KMeansClusterer{};
        benchmark::DoNotOptimize(kmeans.fit_predict(data));
    }

    state.SetComplexityN(state.range(0));
}

static void density_fit_predict(benchmark::State &state) {
    auto data = create_standard_normal(state.range(0));
    auto density = DensityClusterer::for_population(static_cast<std::size_t>(data.rows()));
    for (auto _ : state) {
        benchmark::DoNotOptimize(density.fit_predict(data));
    }

    state.SetComplexityN(state.range(0));
}

static void isolation_forest_fit_predict(benchmark::State &state) {
    auto data = create_standard_normal(state.range(0));
    for (auto _ : state) {
        auto forest = IsolationForest{};
        benchmark::DoNotOptimize(forest.fit_predict(data));
    }

    state.SetComplexityN(state.range(0));
}

BENCHMARK(kmeans_fit_predict)->RangeMultiplier(4)->Range(64, 4096)->Complexity();
BENCHMARK(density_fit_predict)->RangeMultiplier(4)->Range(64, 4096)->Complexity();
BENCHMARK(isolation_forest_fit_predict)->RangeMultiplier(4)->Range(64, 4096)->Complexity();
