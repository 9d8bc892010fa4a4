#include "rest_repository.h"

#include "Aera.Core/exception.h"

#include <fmt/format.h>

#include <stdexcept>

namespace { // anonymous namespace

constexpr auto population_table = "vulnerability_profiles";
constexpr auto snapshots_table = "region_snapshots";
constexpr auto audit_table = "model_audit_log";

constexpr auto population_columns =
    "id,organization_id,county_id,state_id,household_size,medication_dependency,"
    "insulin_dependency,oxygen_powered_device,mobility_limitation,transportation_access,"
    "financial_strain,risk_score,updated_at";

constexpr auto baseline_columns = "county_id,state_id,avg_risk_score,snapshot_date";

constexpr auto snapshot_key = "snapshot_date,county_id,state_id,organization_id";

} // anonymous namespace

namespace aera::data {

PostgrestClient::PostgrestClient(RestSettings settings, HttpTransport &transport)
    : settings_{std::move(settings)}, transport_{transport} {
    while (!settings_.url.empty() && settings_.url.back() == '/') {
        settings_.url.pop_back();
    }

    if (settings_.url.empty() || settings_.key.empty()) {
        throw std::invalid_argument("The REST store URL and key must not be empty.");
    }
}

const RestSettings &PostgrestClient::settings() const noexcept { return settings_; }

json PostgrestClient::select(const std::string &table, const std::string &columns,
                             const std::map<std::string, std::string> &filters) const {
    auto url = fmt::format("{}/rest/v1/{}?select={}", settings_.url, table, columns);
    for (const auto &[column, filter] : filters) {
        url += fmt::format("&{}={}", column, filter);
    }

    auto response = send(HttpRequest{.method = "GET",
                                     .url = std::move(url),
                                     .headers = headers("return=representation"),
                                     .timeout_seconds = settings_.read_timeout_seconds});
    try {
        auto rows = json::parse(response.body);
        if (!rows.is_array()) {
            throw core::UpstreamIOError(
                fmt::format("Select from {} returned a non-array payload.", table));
        }

        return rows;
    } catch (const json::parse_error &ex) {
        throw core::UpstreamIOError(
            fmt::format("Select from {} returned an invalid payload: {}", table, ex.what()));
    }
}

void PostgrestClient::upsert(const std::string &table, const json &rows,
                             const std::string &on_conflict) const {
    if (rows.empty()) {
        return;
    }

    send(HttpRequest{
        .method = "POST",
        .url = fmt::format("{}/rest/v1/{}?on_conflict={}", settings_.url, table, on_conflict),
        .headers = headers("resolution=merge-duplicates,return=representation"),
        .body = rows.dump(),
        .timeout_seconds = settings_.write_timeout_seconds});
}

void PostgrestClient::insert(const std::string &table, const json &rows) const {
    if (rows.empty()) {
        return;
    }

    send(HttpRequest{.method = "POST",
                     .url = fmt::format("{}/rest/v1/{}", settings_.url, table),
                     .headers = headers("return=representation"),
                     .body = rows.dump(),
                     .timeout_seconds = settings_.write_timeout_seconds});
}

std::list<std::string> PostgrestClient::headers(const std::string &prefer) const {
    return {fmt::format("apikey: {}", settings_.key),
            fmt::format("Authorization: Bearer {}", settings_.key),
            "Content-Type: application/json", fmt::format("Prefer: {}", prefer)};
}

HttpResponse PostgrestClient::send(HttpRequest request) const {
    auto response = transport_.send(request);
    if (response.status >= 400) {
        throw core::UpstreamIOError(fmt::format("{} {} failed with HTTP {}: {}", request.method,
                                                request.url, response.status, response.body));
    }

    return response;
}

RestRepository::RestRepository(RestSettings settings, HttpTransport &transport)
    : client_{std::move(settings), transport} {}

std::vector<core::EntityRecord> RestRepository::select_population() const {
    auto rows = client_.select(population_table, population_columns);
    try {
        return rows.get<std::vector<core::EntityRecord>>();
    } catch (const json::exception &ex) {
        throw core::UpstreamIOError(
            fmt::format("Invalid {} row: {}", population_table, ex.what()));
    }
}

void RestRepository::upsert_risk_scores(const std::vector<core::ScoreUpdate> &updates) {
    client_.upsert(population_table, json(updates), "id");
}

std::vector<core::SnapshotBaseline>
RestRepository::select_snapshots(const core::Date &snapshot_date) const {
    auto rows =
        client_.select(snapshots_table, baseline_columns,
                       {{"snapshot_date", fmt::format("eq.{}", core::to_iso_string(snapshot_date))}});
    try {
        return rows.get<std::vector<core::SnapshotBaseline>>();
    } catch (const json::exception &ex) {
        throw core::UpstreamIOError(fmt::format("Invalid {} row: {}", snapshots_table, ex.what()));
    }
}

void RestRepository::upsert_snapshots(const std::vector<core::RegionSnapshot> &snapshots) {
    client_.upsert(snapshots_table, json(snapshots), snapshot_key);
}

void RestRepository::insert(const core::AuditRecord &record) {
    client_.insert(audit_table, json::array({json(record)}));
}

} // namespace aera::data
