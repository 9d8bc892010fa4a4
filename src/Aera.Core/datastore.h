#pragma once

#include "date_util.h"
#include "poco.h"

#include <vector>

namespace aera::core {

/// @brief Defines the population store interface: the vulnerability profiles source.
class PopulationStore {
  public:
    /// @brief Destroys a PopulationStore instance
    virtual ~PopulationStore() = default;

    /// @brief Reads the full current population
    /// @return The collection of vulnerability profiles, in store order
    /// @throws UpstreamIOError if the store can not be read.
    virtual std::vector<EntityRecord> select_population() const = 0;

    /// @brief Writes back the recalculated risk scores, keyed by profile identifier
    /// @param updates The risk score rows, only the risk score column is changed
    /// @throws UpstreamIOError if the store rejects the write.
    virtual void upsert_risk_scores(const std::vector<ScoreUpdate> &updates) = 0;
};

/// @brief Defines the region snapshot store interface.
class SnapshotStore {
  public:
    /// @brief Destroys a SnapshotStore instance
    virtual ~SnapshotStore() = default;

    /// @brief Reads the snapshots recorded for a calendar date
    /// @param snapshot_date The snapshot date to filter
    /// @return The baseline columns of the matching snapshots
    /// @throws UpstreamIOError if the store can not be read.
    virtual std::vector<SnapshotBaseline> select_snapshots(const Date &snapshot_date) const = 0;

    /// @brief Merges snapshots by (snapshot_date, county_id, state_id, organization_id),
    ///        existing rows with the same key are replaced.
    /// @param snapshots The snapshot rows to write
    /// @throws UpstreamIOError if the store rejects the write.
    virtual void upsert_snapshots(const std::vector<RegionSnapshot> &snapshots) = 0;
};

/// @brief Defines the append-only execution audit sink interface.
class AuditSink {
  public:
    /// @brief Destroys an AuditSink instance
    virtual ~AuditSink() = default;

    /// @brief Appends one audit record
    /// @param record The audit record to append
    /// @throws UpstreamIOError if the sink rejects the write.
    virtual void insert(const AuditRecord &record) = 0;
};

} // namespace aera::core
