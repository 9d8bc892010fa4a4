#pragma once

#include "Aera.Core/datastore.h"
#include "Aera.Core/exception.h"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace aera::testing {

/// In-memory implementation of the three store interfaces, with failure injection by
/// operation name: select_population, upsert_risk_scores, select_snapshots, upsert_snapshots,
/// insert, or insert_failed to reject only FAILED audit records.
class MockStore final : public core::PopulationStore,
                        public core::SnapshotStore,
                        public core::AuditSink {
  public:
    MockStore() = default;

    explicit MockStore(std::vector<core::EntityRecord> population)
        : population_{std::move(population)} {}

    std::vector<core::EntityRecord> select_population() const override {
        throw_if("select_population");
        return population_;
    }

    void upsert_risk_scores(const std::vector<core::ScoreUpdate> &updates) override {
        throw_if("upsert_risk_scores");
        score_writes_++;
        for (const auto &update : updates) {
            auto it = std::find_if(population_.begin(), population_.end(),
                                   [&update](const auto &p) { return p.id == update.id; });
            if (it != population_.end()) {
                it->risk_score = update.risk_score;
            }
        }
    }

    std::vector<core::SnapshotBaseline>
    select_snapshots(const core::Date &snapshot_date) const override {
        throw_if("select_snapshots");
        auto target = core::to_iso_string(snapshot_date);
        auto result = std::vector<core::SnapshotBaseline>{};
        for (const auto &row : baselines_) {
            if (row.snapshot_date == target) {
                result.push_back(row);
            }
        }

        for (const auto &row : snapshots_) {
            if (row.snapshot_date == snapshot_date) {
                result.push_back(core::SnapshotBaseline{.county_id = row.county_id,
                                                        .state_id = row.state_id,
                                                        .avg_risk_score = row.avg_risk_score,
                                                        .snapshot_date = target});
            }
        }

        return result;
    }

    void upsert_snapshots(const std::vector<core::RegionSnapshot> &snapshots) override {
        throw_if("upsert_snapshots");
        for (const auto &snapshot : snapshots) {
            auto it = std::find_if(snapshots_.begin(), snapshots_.end(), [&snapshot](auto &s) {
                return s.snapshot_date == snapshot.snapshot_date &&
                       s.county_id == snapshot.county_id && s.state_id == snapshot.state_id &&
                       s.organization_id == snapshot.organization_id;
            });

            if (it != snapshots_.end()) {
                *it = snapshot;
            } else {
                snapshots_.push_back(snapshot);
            }
        }
    }

    void insert(const core::AuditRecord &record) override {
        throw_if("insert");
        if (record.status == core::StageStatus::failed) {
            throw_if("insert_failed");
        }

        audit_.push_back(record);
    }

    void fail_on(std::string operation) { failures_.insert(std::move(operation)); }

    void add_baseline(core::SnapshotBaseline baseline) { baselines_.push_back(std::move(baseline)); }

    const std::vector<core::EntityRecord> &population() const noexcept { return population_; }

    const std::vector<core::RegionSnapshot> &snapshots() const noexcept { return snapshots_; }

    const std::vector<core::AuditRecord> &audit() const noexcept { return audit_; }

    std::size_t score_writes() const noexcept { return score_writes_; }

  private:
    std::vector<core::EntityRecord> population_;
    std::vector<core::SnapshotBaseline> baselines_;
    std::vector<core::RegionSnapshot> snapshots_;
    std::vector<core::AuditRecord> audit_;
    std::set<std::string> failures_;
    std::size_t score_writes_{};

    void throw_if(const std::string &operation) const {
        if (failures_.contains(operation)) {
            throw core::UpstreamIOError("Mock store rejected " + operation);
        }
    }
};

/// Creates a profile with all risk factors unset
inline core::EntityRecord create_entity(std::string id, std::optional<std::string> county,
                                        std::optional<std::string> state,
                                        std::optional<std::string> organization = std::nullopt) {
    return core::EntityRecord{.id = std::move(id),
                              .organization_id = std::move(organization),
                              .county_id = std::move(county),
                              .state_id = std::move(state)};
}

} // namespace aera::testing
