#pragma once

#include "Aera.Core/date_util.h"

#include <cstdint>
#include <string>

namespace aera {

/// @brief Run-wide identification and lookback settings
struct RunSettings {
    /// @brief Model name recorded in the audit trail
    std::string model_name{"aera-level3"};

    /// @brief Model version recorded in snapshots and audit records
    std::string model_version{"level3-2026.02"};

    /// @brief Initiator recorded in the audit trail
    std::string initiated_by{"nightly_pipeline"};

    /// @brief Snapshot producer recorded in the snapshot metadata
    std::string generated_by{"aera-level3-pipeline"};

    /// @brief Lookback of the drift baseline, also the snapshot window, in days
    int baseline_days{30};
};

/// @brief Defines the pipeline run context data type
///
/// @details The context holds the run identity and start time shared by every stage of a
/// run. It is created once per run and passed explicitly to the stages that stamp their
/// outputs.
class RunContext {
  public:
    RunContext() = delete;

    /// @brief Initialises a new run, with a new identifier and the current time as start
    /// @param settings The run settings
    /// @param snapshot_date The date of the snapshots produced by the run
    RunContext(RunSettings settings, core::Date snapshot_date);

    /// @brief Initialises a run context with a given identity
    /// @param run_id The run unique identifier
    /// @param started_at The run start time
    /// @param settings The run settings
    /// @param snapshot_date The date of the snapshots produced by the run
    /// @throws std::invalid_argument for empty run identifier or invalid date.
    RunContext(std::string run_id, core::TimePoint started_at, RunSettings settings,
               core::Date snapshot_date);

    /// @brief Gets the run unique identifier
    /// @return The run identifier
    const std::string &run_id() const noexcept;

    /// @brief Gets the run start time
    /// @return The start time point
    const core::TimePoint &started_at() const noexcept;

    /// @brief Gets the date of the snapshots produced by the run
    /// @return The snapshot date
    const core::Date &snapshot_date() const noexcept;

    /// @brief Gets the date of the drift baseline snapshots
    /// @return The snapshot date minus the baseline lookback
    core::Date baseline_date() const;

    /// @brief Gets the run settings
    /// @return The run settings
    const RunSettings &settings() const noexcept;

    /// @brief Calculates the milliseconds elapsed since the run start
    /// @param now The time to measure up to
    /// @return Elapsed time in milliseconds
    std::int64_t elapsed_ms(const core::TimePoint &now) const noexcept;

  private:
    std::string run_id_;
    core::TimePoint started_at_;
    RunSettings settings_;
    core::Date snapshot_date_;
};

} // namespace aera
