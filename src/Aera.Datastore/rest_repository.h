#pragma once

#include "http_transport.h"
#include "jsonparser.h"

#include "Aera.Core/datastore.h"

#include <map>
#include <string>
#include <vector>

namespace aera::data {

/// @brief REST store connection settings
struct RestSettings {
    /// @brief Service base URL, without trailing slash
    std::string url;

    /// @brief Service role key, sent as API key and bearer token
    std::string key;

    /// @brief Timeout of read requests, in seconds
    long read_timeout_seconds{60};

    /// @brief Timeout of write requests, in seconds
    long write_timeout_seconds{120};
};

/// @brief Minimal PostgREST dialect client: filtered select, insert and merge upsert.
class PostgrestClient {
  public:
    PostgrestClient() = delete;

    /// @brief Initialises a new instance of the PostgrestClient class.
    /// @param settings The connection settings
    /// @param transport The HTTP transport instance
    /// @throws std::invalid_argument for empty URL or key.
    PostgrestClient(RestSettings settings, HttpTransport &transport);

    /// @brief Reads table rows
    /// @param table The table name
    /// @param columns Comma separated columns to select
    /// @param filters Column filters, e.g. <c>{"snapshot_date", "eq.2026-01-31"}</c>
    /// @return The JSON array of rows
    /// @throws core::UpstreamIOError for failed requests or non-array responses.
    json select(const std::string &table, const std::string &columns,
                const std::map<std::string, std::string> &filters = {}) const;

    /// @brief Merges rows by the conflict columns, existing rows are replaced
    /// @param table The table name
    /// @param rows The JSON array of rows, empty arrays are not sent
    /// @param on_conflict Comma separated conflict columns
    /// @throws core::UpstreamIOError for failed requests.
    void upsert(const std::string &table, const json &rows, const std::string &on_conflict) const;

    /// @brief Appends rows
    /// @param table The table name
    /// @param rows The JSON array of rows, empty arrays are not sent
    /// @throws core::UpstreamIOError for failed requests.
    void insert(const std::string &table, const json &rows) const;

    /// @brief Gets the connection settings
    /// @return The settings
    const RestSettings &settings() const noexcept;

  private:
    RestSettings settings_;
    HttpTransport &transport_;

    std::list<std::string> headers(const std::string &prefer) const;
    HttpResponse send(HttpRequest request) const;
};

/// @brief Vulnerability profiles, region snapshots and audit log served by a PostgREST API.
class RestRepository final : public core::PopulationStore,
                             public core::SnapshotStore,
                             public core::AuditSink {
  public:
    RestRepository() = delete;

    /// @brief Initialises a new instance of the RestRepository class.
    /// @param settings The connection settings
    /// @param transport The HTTP transport instance
    RestRepository(RestSettings settings, HttpTransport &transport);

    std::vector<core::EntityRecord> select_population() const override;

    void upsert_risk_scores(const std::vector<core::ScoreUpdate> &updates) override;

    std::vector<core::SnapshotBaseline>
    select_snapshots(const core::Date &snapshot_date) const override;

    void upsert_snapshots(const std::vector<core::RegionSnapshot> &snapshots) override;

    void insert(const core::AuditRecord &record) override;

  private:
    PostgrestClient client_;
};

} // namespace aera::data
