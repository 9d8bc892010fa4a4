#include "pipeline.h"
#include "error_message.h"
#include "feature_standardizer.h"
#include "info_message.h"
#include "region_aggregator.h"
#include "risk_scorer.h"
#include "stage_message.h"

#include "Aera.Core/univariate_summary.h"

#include <fmt/format.h>

#include <chrono>

namespace aera {

Pipeline::Pipeline(core::PopulationStore &population, core::SnapshotStore &snapshots,
                   core::AuditSink &audit, const EventAggregator &bus, ModelParameters parameters)
    : population_{population}, snapshots_{snapshots}, audit_{audit}, event_bus_{bus},
      parameters_{parameters} {}

const std::vector<std::string> &Pipeline::feature_set() {
    static const auto features = std::vector<std::string>{
        "household_size",      "medication_dependency", "insulin_dependency",
        "oxygen_powered_device", "mobility_limitation", "transportation_access",
        "financial_strain",    "risk_score"};
    return features;
}

PipelineResult Pipeline::run(const RunContext &context) {
    notify(std::make_unique<InfoEventMessage>(
        pipeline_id_, context.run_id(), PipelineAction::start,
        fmt::format("snapshot date {}", core::to_iso_string(context.snapshot_date()))));

    try {
        auto result = execute(context);
        notify(std::make_unique<InfoEventMessage>(
            pipeline_id_, context.run_id(), PipelineAction::finish,
            fmt::format("profiles: {}, snapshots: {}", result.processed, result.snapshots)));
        return result;
    } catch (const std::exception &ex) {
        try {
            log_stage(context, "pipeline", core::StageStatus::failed, 0, {}, ex.what());
        } catch (const std::exception &audit_ex) {
            notify(std::make_unique<ErrorEventMessage>(
                pipeline_id_, context.run_id(),
                fmt::format("Failed to record the run failure: {}", audit_ex.what())));
        }

        notify(std::make_unique<ErrorEventMessage>(pipeline_id_, context.run_id(), ex.what()));
        throw;
    }
}

PipelineResult Pipeline::execute(const RunContext &context) {
    auto population = population_.select_population();
    notify(std::make_unique<InfoEventMessage>(pipeline_id_, context.run_id(),
                                              PipelineAction::load,
                                              fmt::format("{} profiles", population.size())));

    if (population.empty()) {
        log_stage(context, "pipeline", core::StageStatus::success, 0,
                  {{"message", std::string{"no records"}}});
        return PipelineResult{.run_id = context.run_id()};
    }

    auto processed = population.size();

    // 1. Risk scores, written back before any model runs
    auto updates = RiskScorer::score_all(population);
    population_.upsert_risk_scores(updates);

    auto risk_summary = core::UnivariateSummary{"risk_score"};
    for (const auto &update : updates) {
        risk_summary.append(update.risk_score);
    }

    log_stage(context, "risk_score", core::StageStatus::success, processed,
              {{"mean_risk", risk_summary.average()}});

    // 2. Standardised feature space shared by the three models
    auto standardizer = FeatureStandardizer{};
    auto scaled = standardizer.fit_transform(FeatureStandardizer::build_features(population));

    auto labels = ModelLabels{};
    auto clusters = KMeansClusterer::cluster_count(processed);
    auto kmeans = KMeansClusterer{parameters_.kmeans};
    labels.kmeans = kmeans.fit_predict(scaled, clusters);
    log_stage(context, "kmeans", core::StageStatus::success, processed,
              {{"clusters", static_cast<std::int64_t>(clusters)}});

    auto density = DensityClusterer{parameters_.density_eps,
                                    DensityClusterer::min_samples_for(processed)};
    labels.dbscan = density.fit_predict(scaled);
    log_stage(context, "dbscan", core::StageStatus::success, processed,
              {{"noise_points", static_cast<std::int64_t>(count_noise(labels.dbscan))}});

    auto forest = IsolationForest{parameters_.forest};
    labels.outliers = forest.fit_predict(scaled);
    log_stage(context, "isolation_forest", core::StageStatus::success, processed,
              {{"outliers", static_cast<std::int64_t>(count_outliers(labels.outliers))}});

    // 3. Region snapshots and drift against the baseline period
    auto baselines = index_baselines(snapshots_.select_snapshots(context.baseline_date()));
    auto aggregator = RegionAggregator{context};
    auto rows = aggregator.aggregate(population, labels, baselines);
    snapshots_.upsert_snapshots(rows);
    log_stage(context, "drift", core::StageStatus::success, rows.size(),
              {{"snapshot_rows", static_cast<std::int64_t>(rows.size())}});

    log_stage(context, "pipeline", core::StageStatus::success, processed,
              {{"run_id", context.run_id()}});

    return PipelineResult{
        .run_id = context.run_id(), .processed = processed, .snapshots = rows.size()};
}

void Pipeline::log_stage(const RunContext &context, std::string stage, core::StageStatus status,
                         std::size_t processed, core::AuditMetrics metrics,
                         std::optional<std::string> error) {
    const auto &settings = context.settings();
    auto finished_at = std::chrono::system_clock::now();
    auto record = core::AuditRecord{.run_id = context.run_id(),
                                    .model_name = settings.model_name,
                                    .model_version = settings.model_version,
                                    .stage = std::move(stage),
                                    .status = status,
                                    .started_at = context.started_at(),
                                    .finished_at = finished_at,
                                    .duration_ms = context.elapsed_ms(finished_at),
                                    .processed_records = processed,
                                    .feature_set = feature_set(),
                                    .metrics = std::move(metrics),
                                    .error_message = std::move(error),
                                    .initiated_by = settings.initiated_by};

    audit_.insert(record);
    if (status == core::StageStatus::success) {
        notify(std::make_unique<StageEventMessage>(pipeline_id_, context.run_id(),
                                                   std::move(record)));
    }
}

void Pipeline::notify(std::unique_ptr<EventMessage> message) const {
    event_bus_.publish(std::move(message));
}

} // namespace aera
