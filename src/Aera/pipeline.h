#pragma once

#include "density_clusterer.h"
#include "event_aggregator.h"
#include "isolation_forest.h"
#include "kmeans_clusterer.h"
#include "run_context.h"

#include "Aera.Core/datastore.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aera {

/// @brief Analytics models parameters
struct ModelParameters {
    /// @brief Centroid clustering parameters
    KMeansParameters kmeans{};

    /// @brief Isolation forest parameters
    IsolationForestParameters forest{};

    /// @brief Density clustering neighbourhood radius
    double density_eps{DensityClusterer::default_eps};
};

/// @brief Pipeline run outcome
struct PipelineResult {
    /// @brief The run identifier
    std::string run_id;

    /// @brief Number of scored profiles
    std::size_t processed{};

    /// @brief Number of region snapshots written
    std::size_t snapshots{};
};

/// @brief Defines the nightly analytics pipeline executive.
///
/// @details A run loads the full population, recalculates and writes back the risk scores,
/// fits the clustering and outlier models on the standardised features, then aggregates
/// region snapshots with drift against the baseline period. Each completed stage appends an
/// audit record and publishes a StageEventMessage.
///
/// Any failure aborts the run: a best-effort FAILED audit record is written, an
/// ErrorEventMessage published, and the original exception rethrown. Writes completed before
/// the failure are not rolled back.
class Pipeline {
  public:
    Pipeline() = delete;

    /// @brief Initialises a new instance of the Pipeline class.
    /// @param population The vulnerability profiles store
    /// @param snapshots The region snapshots store
    /// @param audit The execution audit sink
    /// @param bus The message bus instance to use for notification
    /// @param parameters The analytics models parameters
    Pipeline(core::PopulationStore &population, core::SnapshotStore &snapshots,
             core::AuditSink &audit, const EventAggregator &bus, ModelParameters parameters = {});

    /// @brief Executes one pipeline run
    /// @param context The run context
    /// @return The run outcome
    /// @throws core::UpstreamIOError for store or sink failures, other exceptions from the models.
    PipelineResult run(const RunContext &context);

    /// @brief Gets the feature set recorded in the audit trail
    /// @return The feature names
    static const std::vector<std::string> &feature_set();

  private:
    core::PopulationStore &population_;
    core::SnapshotStore &snapshots_;
    core::AuditSink &audit_;
    const EventAggregator &event_bus_;
    ModelParameters parameters_;
    std::string pipeline_id_{"pipeline"};

    PipelineResult execute(const RunContext &context);

    void log_stage(const RunContext &context, std::string stage, core::StageStatus status,
                   std::size_t processed, core::AuditMetrics metrics,
                   std::optional<std::string> error = std::nullopt);

    void notify(std::unique_ptr<EventMessage> message) const;
};

} // namespace aera
