#include "pch.h"

#include "Aera/region_aggregator.h"
#include "mock_repository.h"

#include <stdexcept>

namespace {
aera::RunContext create_context() {
    return aera::RunContext{"run-0001", std::chrono::system_clock::now(), aera::RunSettings{},
                            aera::core::parse_iso_date("2026-02-14")};
}

aera::core::EntityRecord scored(std::string id, std::optional<std::string> county,
                                std::optional<std::string> state,
                                std::optional<std::string> organization, double score) {
    auto entity = aera::testing::create_entity(std::move(id), std::move(county), std::move(state),
                                               std::move(organization));
    entity.risk_score = score;
    return entity;
}
} // anonymous namespace

TEST(TestRegionAggregator, ClassifyDriftThresholds) {
    using namespace aera;
    using core::DriftStatus;

    ASSERT_EQ(DriftStatus::accelerating, classify_drift(0.30));
    ASSERT_EQ(DriftStatus::escalating, classify_drift(0.20));
    ASSERT_EQ(DriftStatus::stable, classify_drift(0.15));
    ASSERT_EQ(DriftStatus::stable, classify_drift(0.10));
    ASSERT_EQ(DriftStatus::escalating, classify_drift(0.25));
    ASSERT_EQ(DriftStatus::accelerating, classify_drift(0.2501));
    ASSERT_EQ(DriftStatus::stable, classify_drift(-0.5));
}

TEST(TestRegionAggregator, CalculateDrift) {
    using namespace aera;

    ASSERT_DOUBLE_EQ(0.0, calculate_drift(3.0, std::nullopt));
    ASSERT_DOUBLE_EQ(0.0, calculate_drift(3.0, 0.0));
    ASSERT_DOUBLE_EQ(0.2, calculate_drift(3.0, 2.5));
    ASSERT_DOUBLE_EQ(-0.25, calculate_drift(3.0, 4.0));
    ASSERT_DOUBLE_EQ(0.3333, calculate_drift(4.0, 3.0));
}

TEST(TestRegionAggregator, ProjectRisk) {
    using namespace aera;

    ASSERT_DOUBLE_EQ(3.3, project_risk(3.0, 0.2));
    ASSERT_DOUBLE_EQ(3.0, project_risk(3.0, 0.0));
    ASSERT_DOUBLE_EQ(2.625, project_risk(3.0, -0.25));
}

TEST(TestRegionAggregator, IndexBaselines) {
    using namespace aera;

    auto rows = std::vector<core::SnapshotBaseline>{
        {.county_id = "c1", .state_id = "s1", .avg_risk_score = 2.0},
        {.county_id = "c1", .state_id = "s1", .avg_risk_score = 2.5},
        {.county_id = "c2", .state_id = "s1", .avg_risk_score = std::nullopt},
        {.county_id = std::nullopt, .state_id = "s1", .avg_risk_score = 9.0},
        {.county_id = "", .state_id = "s1", .avg_risk_score = 7.0}};

    auto index = index_baselines(rows);
    ASSERT_EQ(2, index.size());
    ASSERT_DOUBLE_EQ(2.5, index.at({"c1", "s1"}));
    ASSERT_DOUBLE_EQ(0.0, index.at({"c2", "s1"}));
}

TEST(TestRegionAggregator, GroupsByRegionAndOrganisation) {
    using namespace aera;

    auto population = std::vector<core::EntityRecord>{
        scored("a", "c1", "s1", "o1", 1.0), scored("b", "c1", "s1", "o1", 2.0),
        scored("c", "c1", "s1", std::nullopt, 4.0), scored("d", std::nullopt, "s1", "o1", 3.0),
        scored("e", "c1", "s1", "o1", 3.0)};
    auto labels = ModelLabels{.kmeans = {1, 0, 2, 3, 1},
                              .dbscan = {-1, 0, 0, -1, 0},
                              .outliers = {true, false, false, true, false}};

    auto context = create_context();
    auto snapshots = RegionAggregator{context}.aggregate(population, labels, {});
    ASSERT_EQ(3, snapshots.size());

    // Ascending key order: UNKNOWN sorts before lower case identifiers, no organisation first
    const auto &unknown = snapshots[0];
    ASSERT_EQ(unknown_region, unknown.county_id);
    ASSERT_EQ("s1", unknown.state_id);
    ASSERT_EQ(1, unknown.anomaly_count);
    ASSERT_EQ(-1, unknown.dbscan_cluster.value());

    const auto &no_org = snapshots[1];
    ASSERT_EQ("c1", no_org.county_id);
    ASSERT_FALSE(no_org.organization_id.has_value());
    ASSERT_EQ(1, no_org.profile_count);

    const auto &group = snapshots[2];
    ASSERT_EQ("c1", group.county_id);
    ASSERT_EQ("s1", group.state_id);
    ASSERT_EQ("o1", group.organization_id.value());
    ASSERT_EQ(3, group.profile_count);
    ASSERT_DOUBLE_EQ(2.0, group.avg_risk_score);
    ASSERT_DOUBLE_EQ(3.0, group.max_risk_score);
    ASSERT_DOUBLE_EQ(1.0, group.min_risk_score);
    ASSERT_EQ(1, group.anomaly_count);
    ASSERT_EQ(1, group.kmeans_cluster.value());
    ASSERT_EQ(0, group.dbscan_cluster.value());
}

TEST(TestRegionAggregator, EmptyRegionIdentifiersAreUnknown) {
    using namespace aera;

    auto population = std::vector<core::EntityRecord>{
        scored("a", "", "s1", std::nullopt, 1.0), scored("b", std::nullopt, "s1", std::nullopt, 3.0),
        scored("c", "c1", "", std::nullopt, 2.0)};
    auto labels = ModelLabels{.kmeans = {0, 0, 1}, .dbscan = {0, 0, 0},
                              .outliers = {false, false, false}};

    auto context = create_context();
    auto snapshots = RegionAggregator{context}.aggregate(population, labels, {});
    ASSERT_EQ(2, snapshots.size());

    const auto &county = snapshots[0];
    ASSERT_EQ(unknown_region, county.county_id);
    ASSERT_EQ("s1", county.state_id);
    ASSERT_EQ(2, county.profile_count);
    ASSERT_DOUBLE_EQ(2.0, county.avg_risk_score);

    const auto &state = snapshots[1];
    ASSERT_EQ("c1", state.county_id);
    ASSERT_EQ(unknown_region, state.state_id);
    ASSERT_EQ(1, state.profile_count);
}

TEST(TestRegionAggregator, DominantClusterTieIsOneOfTied) {
    using namespace aera;
    using namespace ::testing;

    auto population = std::vector<core::EntityRecord>{
        scored("a", "c1", "s1", "o1", 1.0), scored("b", "c1", "s1", "o1", 1.0),
        scored("c", "c1", "s1", "o1", 1.0), scored("d", "c1", "s1", "o1", 1.0)};
    auto labels = ModelLabels{.kmeans = {3, 1, 3, 1},
                              .dbscan = {0, -1, -1, 0},
                              .outliers = {false, false, false, false}};

    auto context = create_context();
    auto snapshots = RegionAggregator{context}.aggregate(population, labels, {});
    ASSERT_EQ(1, snapshots.size());
    ASSERT_THAT(snapshots[0].kmeans_cluster.value(), AnyOf(1, 3));
    ASSERT_THAT(snapshots[0].dbscan_cluster.value(), AnyOf(-1, 0));
}

TEST(TestRegionAggregator, DriftAgainstRegionBaseline) {
    using namespace aera;

    auto population = std::vector<core::EntityRecord>{scored("a", "c1", "s1", "o1", 3.0),
                                                      scored("b", "c1", "s1", "o2", 3.9),
                                                      scored("c", "c2", "s1", "o1", 1.0)};
    auto labels = ModelLabels{
        .kmeans = {0, 0, 1}, .dbscan = {0, 0, 0}, .outliers = {false, false, false}};
    auto baselines = BaselineIndex{{{"c1", "s1"}, 3.0}};

    auto context = create_context();
    auto snapshots = RegionAggregator{context}.aggregate(population, labels, baselines);
    ASSERT_EQ(3, snapshots.size());

    ASSERT_DOUBLE_EQ(0.0, snapshots[0].drift_value);
    ASSERT_EQ(core::DriftStatus::stable, snapshots[0].drift_status);
    ASSERT_DOUBLE_EQ(3.0, snapshots[0].projection_14d);

    ASSERT_DOUBLE_EQ(0.3, snapshots[1].drift_value);
    ASSERT_DOUBLE_EQ(0.3, snapshots[1].risk_growth_pct);
    ASSERT_EQ(core::DriftStatus::accelerating, snapshots[1].drift_status);
    ASSERT_DOUBLE_EQ(4.485, snapshots[1].projection_14d);

    // No baseline for the second county
    ASSERT_EQ("c2", snapshots[2].county_id);
    ASSERT_DOUBLE_EQ(0.0, snapshots[2].drift_value);
    ASSERT_DOUBLE_EQ(1.0, snapshots[2].projection_14d);
}

TEST(TestRegionAggregator, SnapshotsStampedWithRun) {
    using namespace aera;

    auto population = std::vector<core::EntityRecord>{scored("a", "c1", "s1", "o1", 1.23456)};
    auto labels = ModelLabels{.kmeans = {0}, .dbscan = {0}, .outliers = {false}};

    auto context = create_context();
    auto snapshots = RegionAggregator{context}.aggregate(population, labels, {});
    ASSERT_EQ(1, snapshots.size());

    const auto &row = snapshots.front();
    ASSERT_EQ("2026-02-14", core::to_iso_string(row.snapshot_date));
    ASSERT_EQ(30, row.window_days);
    ASSERT_EQ("run-0001", row.pipeline_run_id);
    ASSERT_EQ("level3-2026.02", row.model_version);
    ASSERT_EQ("aera-level3-pipeline", row.metadata.at("generated_by"));
    ASSERT_DOUBLE_EQ(1.2346, row.avg_risk_score);
}

TEST(TestRegionAggregator, MisalignedLabelsThrow) {
    using namespace aera;

    auto population = std::vector<core::EntityRecord>{scored("a", "c1", "s1", "o1", 1.0)};
    auto labels = ModelLabels{.kmeans = {0, 1}, .dbscan = {0}, .outliers = {false}};

    auto context = create_context();
    ASSERT_THROW(RegionAggregator{context}.aggregate(population, labels, {}),
                 std::invalid_argument);
}
