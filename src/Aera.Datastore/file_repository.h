#pragma once

#include "jsonparser.h"

#include "Aera.Core/datastore.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace aera::data {

/// @brief Defines the file-based store for local runs.
///
/// @details The store folder holds three files:
/// - <c>vulnerability_profiles.csv</c>, one header row then one profile per row, empty cells
///   are null; the <c>risk_score</c> column is rewritten by the score write-back.
/// - <c>region_snapshots.json</c>, array of snapshot rows merged by natural key.
/// - <c>model_audit_log.json</c>, append-only array of audit rows.
///
/// Missing JSON files read as empty arrays and are created on first write.
class FileRepository final : public core::PopulationStore,
                             public core::SnapshotStore,
                             public core::AuditSink {
  public:
    FileRepository() = delete;

    /// @brief Initialises a new instance of the FileRepository class.
    /// @param root_directory The store root folder
    /// @throws std::invalid_argument if the root folder does not exist.
    explicit FileRepository(std::filesystem::path root_directory);

    std::vector<core::EntityRecord> select_population() const override;

    void upsert_risk_scores(const std::vector<core::ScoreUpdate> &updates) override;

    std::vector<core::SnapshotBaseline>
    select_snapshots(const core::Date &snapshot_date) const override;

    void upsert_snapshots(const std::vector<core::RegionSnapshot> &snapshots) override;

    void insert(const core::AuditRecord &record) override;

    /// @brief Reads all stored region snapshots
    /// @return The snapshot rows, in file order
    std::vector<core::RegionSnapshot> read_snapshots() const;

    /// @brief Reads the audit log
    /// @return The JSON array of audit rows
    json read_audit_log() const;

    /// @brief Gets the store root folder
    /// @return The root folder
    const std::filesystem::path &root_directory() const noexcept;

    /// @brief Gets the population file name
    /// @return The file name
    static const char *population_file() noexcept;

    /// @brief Gets the snapshots file name
    /// @return The file name
    static const char *snapshots_file() noexcept;

    /// @brief Gets the audit log file name
    /// @return The file name
    static const char *audit_file() noexcept;

  private:
    std::filesystem::path root_;

    json read_array(const std::filesystem::path &file_name) const;
    void write_array(const std::filesystem::path &file_name, const json &rows) const;

    static std::map<std::string, std::size_t>
    create_fields_index_mapping(const std::vector<std::string> &column_names,
                                const std::vector<std::string> &fields);
};

} // namespace aera::data
