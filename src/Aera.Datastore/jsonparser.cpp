#include "jsonparser.h"

#include "Aera.Core/date_util.h"

#include <variant>

namespace { // anonymous namespace

/// @brief Reads an identifier column, numeric keys are kept as their text
std::string get_identifier(const nlohmann::json &j, const std::string &key) {
    const auto &value = j.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }

    return value.dump();
}

} // anonymous namespace

namespace aera::core {
using data::get_optional;
using data::to_nullable;

//--------------------------------------------------------
// Vulnerability profiles
//--------------------------------------------------------
void to_json(json &j, const EntityRecord &p) {
    j = json{{"id", p.id},
             {"organization_id", to_nullable(p.organization_id)},
             {"county_id", to_nullable(p.county_id)},
             {"state_id", to_nullable(p.state_id)},
             {"household_size", to_nullable(p.household_size)},
             {"medication_dependency", to_nullable(p.medication_dependency)},
             {"insulin_dependency", to_nullable(p.insulin_dependency)},
             {"oxygen_powered_device", to_nullable(p.oxygen_powered_device)},
             {"mobility_limitation", to_nullable(p.mobility_limitation)},
             {"transportation_access", to_nullable(p.transportation_access)},
             {"financial_strain", to_nullable(p.financial_strain)},
             {"risk_score", to_nullable(p.risk_score)},
             {"updated_at", to_nullable(p.updated_at)}};
}

void from_json(const json &j, EntityRecord &p) {
    p.id = get_identifier(j, "id");
    p.organization_id = get_optional<std::string>(j, "organization_id");
    p.county_id = get_optional<std::string>(j, "county_id");
    p.state_id = get_optional<std::string>(j, "state_id");
    p.household_size = get_optional<double>(j, "household_size");
    p.medication_dependency = get_optional<bool>(j, "medication_dependency");
    p.insulin_dependency = get_optional<bool>(j, "insulin_dependency");
    p.oxygen_powered_device = get_optional<bool>(j, "oxygen_powered_device");
    p.mobility_limitation = get_optional<bool>(j, "mobility_limitation");
    p.transportation_access = get_optional<bool>(j, "transportation_access");
    p.financial_strain = get_optional<bool>(j, "financial_strain");
    p.risk_score = get_optional<double>(j, "risk_score");
    p.updated_at = get_optional<std::string>(j, "updated_at");
}

void to_json(json &j, const ScoreUpdate &p) {
    j = json{{"id", p.id}, {"risk_score", p.risk_score}};
}

//--------------------------------------------------------
// Region snapshots
//--------------------------------------------------------
void to_json(json &j, const RegionSnapshot &p) {
    j = json{{"snapshot_date", to_iso_string(p.snapshot_date)},
             {"snapshot_window_days", p.window_days},
             {"organization_id", to_nullable(p.organization_id)},
             {"county_id", p.county_id},
             {"state_id", p.state_id},
             {"profile_count", p.profile_count},
             {"avg_risk_score", p.avg_risk_score},
             {"max_risk_score", p.max_risk_score},
             {"min_risk_score", p.min_risk_score},
             {"risk_growth_pct", p.risk_growth_pct},
             {"drift_value", p.drift_value},
             {"drift_status", to_string(p.drift_status)},
             {"kmeans_cluster", to_nullable(p.kmeans_cluster)},
             {"dbscan_cluster", to_nullable(p.dbscan_cluster)},
             {"anomaly_count", p.anomaly_count},
             {"projection_14d", p.projection_14d},
             {"model_version", p.model_version},
             {"pipeline_run_id", p.pipeline_run_id},
             {"metadata", p.metadata}};
}

void from_json(const json &j, RegionSnapshot &p) {
    p.snapshot_date = parse_iso_date(j.at("snapshot_date").get<std::string>());
    j.at("snapshot_window_days").get_to(p.window_days);
    p.organization_id = get_optional<std::string>(j, "organization_id");
    j.at("county_id").get_to(p.county_id);
    j.at("state_id").get_to(p.state_id);
    j.at("profile_count").get_to(p.profile_count);
    j.at("avg_risk_score").get_to(p.avg_risk_score);
    j.at("max_risk_score").get_to(p.max_risk_score);
    j.at("min_risk_score").get_to(p.min_risk_score);
    j.at("risk_growth_pct").get_to(p.risk_growth_pct);
    j.at("drift_value").get_to(p.drift_value);
    p.drift_status = parse_drift_status(j.at("drift_status").get<std::string>());
    p.kmeans_cluster = get_optional<int>(j, "kmeans_cluster");
    p.dbscan_cluster = get_optional<int>(j, "dbscan_cluster");
    j.at("anomaly_count").get_to(p.anomaly_count);
    j.at("projection_14d").get_to(p.projection_14d);
    j.at("model_version").get_to(p.model_version);
    j.at("pipeline_run_id").get_to(p.pipeline_run_id);
    p.metadata = get_optional<std::map<std::string, std::string>>(j, "metadata").value_or(
        std::map<std::string, std::string>{});
}

void from_json(const json &j, SnapshotBaseline &p) {
    p.county_id = get_optional<std::string>(j, "county_id");
    p.state_id = get_optional<std::string>(j, "state_id");
    p.avg_risk_score = get_optional<double>(j, "avg_risk_score");
    p.snapshot_date = get_optional<std::string>(j, "snapshot_date");
}

//--------------------------------------------------------
// Audit log
//--------------------------------------------------------
json metrics_to_json(const AuditMetrics &metrics) {
    auto result = json::object();
    for (const auto &[name, value] : metrics) {
        std::visit([&result, &name](const auto &item) { result[name] = item; }, value);
    }

    return result;
}

void to_json(json &j, const AuditRecord &p) {
    j = json{{"run_id", p.run_id},
             {"model_name", p.model_name},
             {"model_version", p.model_version},
             {"stage", p.stage},
             {"status", to_string(p.status)},
             {"started_at", to_iso_timestamp(p.started_at)},
             {"finished_at", to_iso_timestamp(p.finished_at)},
             {"duration_ms", p.duration_ms},
             {"processed_records", p.processed_records},
             {"feature_set", p.feature_set},
             {"metrics", metrics_to_json(p.metrics)},
             {"error_message", to_nullable(p.error_message)},
             {"initiated_by", p.initiated_by}};
}

} // namespace aera::core
