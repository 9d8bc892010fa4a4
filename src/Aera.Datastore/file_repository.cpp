#include "file_repository.h"

#include "Aera.Core/exception.h"

#include <fmt/format.h>
#include <rapidcsv.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace { // anonymous namespace

const std::vector<std::string> profile_fields{
    "id",           "organization_id",       "county_id",          "state_id",
    "household_size", "medication_dependency", "insulin_dependency", "oxygen_powered_device",
    "mobility_limitation", "transportation_access", "financial_strain", "risk_score",
    "updated_at"};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

class ProfileRowReader {
  public:
    ProfileRowReader(const std::vector<std::string> &row,
                     const std::map<std::string, std::size_t> &mapping, std::size_t line)
        : row_{row}, mapping_{mapping}, line_{line} {}

    std::optional<std::string> text(const std::string &field) const {
        auto it = mapping_.find(field);
        if (it == mapping_.end() || it->second >= row_.size() || row_[it->second].empty()) {
            return std::nullopt;
        }

        return row_[it->second];
    }

    std::optional<double> number(const std::string &field) const {
        auto value = text(field);
        if (!value.has_value()) {
            return std::nullopt;
        }

        try {
            std::size_t used{};
            auto result = std::stod(value.value(), &used);
            if (used == value->size()) {
                return result;
            }
        } catch (const std::logic_error &) {
        }

        throw invalid(field, value.value());
    }

    std::optional<bool> flag(const std::string &field) const {
        auto value = text(field);
        if (!value.has_value()) {
            return std::nullopt;
        }

        auto lower = to_lower(value.value());
        if (lower == "true" || lower == "t" || lower == "1") {
            return true;
        }
        if (lower == "false" || lower == "f" || lower == "0") {
            return false;
        }

        throw invalid(field, value.value());
    }

  private:
    const std::vector<std::string> &row_;
    const std::map<std::string, std::size_t> &mapping_;
    std::size_t line_;

    aera::core::UpstreamIOError invalid(const std::string &field, const std::string &value) const {
        return aera::core::UpstreamIOError(
            fmt::format("File-based store, invalid {} value '{}' at row {}.", field, value, line_));
    }
};

bool same_snapshot_key(const aera::data::json &left, const aera::data::json &right) {
    for (const auto *key : {"snapshot_date", "county_id", "state_id", "organization_id"}) {
        auto left_value = left.contains(key) ? left.at(key) : aera::data::json(nullptr);
        auto right_value = right.contains(key) ? right.at(key) : aera::data::json(nullptr);
        if (left_value != right_value) {
            return false;
        }
    }

    return true;
}

} // anonymous namespace

namespace aera::data {

FileRepository::FileRepository(std::filesystem::path root_directory)
    : root_{std::move(root_directory)} {
    if (!std::filesystem::is_directory(root_)) {
        throw std::invalid_argument(
            fmt::format("File-based store, root folder: {} not found.", root_.string()));
    }
}

const std::filesystem::path &FileRepository::root_directory() const noexcept { return root_; }

const char *FileRepository::population_file() noexcept { return "vulnerability_profiles.csv"; }

const char *FileRepository::snapshots_file() noexcept { return "region_snapshots.json"; }

const char *FileRepository::audit_file() noexcept { return "model_audit_log.json"; }

std::vector<core::EntityRecord> FileRepository::select_population() const {
    auto filename = (root_ / population_file()).string();
    if (!std::filesystem::exists(filename)) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, population file: '{}' not found.", filename));
    }

    auto results = std::vector<core::EntityRecord>{};
    try {
        rapidcsv::Document doc(filename);
        auto columns = doc.GetColumnNames();
        auto mapping = create_fields_index_mapping(columns, {"id"});
        for (const auto &field : profile_fields) {
            auto index = doc.GetColumnIdx(field);
            if (index >= 0) {
                mapping.emplace(field, static_cast<std::size_t>(index));
            }
        }

        results.reserve(doc.GetRowCount());
        for (size_t i = 0; i < doc.GetRowCount(); i++) {
            auto row = doc.GetRow<std::string>(i);
            auto reader = ProfileRowReader{row, mapping, i + 1};
            auto id = reader.text("id");
            if (!id.has_value()) {
                throw core::UpstreamIOError(
                    fmt::format("File-based store, missing profile id at row {}.", i + 1));
            }

            results.push_back(core::EntityRecord{
                .id = id.value(),
                .organization_id = reader.text("organization_id"),
                .county_id = reader.text("county_id"),
                .state_id = reader.text("state_id"),
                .household_size = reader.number("household_size"),
                .medication_dependency = reader.flag("medication_dependency"),
                .insulin_dependency = reader.flag("insulin_dependency"),
                .oxygen_powered_device = reader.flag("oxygen_powered_device"),
                .mobility_limitation = reader.flag("mobility_limitation"),
                .transportation_access = reader.flag("transportation_access"),
                .financial_strain = reader.flag("financial_strain"),
                .risk_score = reader.number("risk_score"),
                .updated_at = reader.text("updated_at")});
        }
    } catch (const std::out_of_range &ex) {
        throw core::UpstreamIOError(ex.what());
    } catch (const std::ios_base::failure &ex) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, failed to read '{}': {}", filename, ex.what()));
    }

    return results;
}

void FileRepository::upsert_risk_scores(const std::vector<core::ScoreUpdate> &updates) {
    if (updates.empty()) {
        return;
    }

    auto filename = (root_ / population_file()).string();
    try {
        rapidcsv::Document doc(filename);
        auto id_column = create_fields_index_mapping(doc.GetColumnNames(), {"id"}).at("id");
        auto score_index = doc.GetColumnIdx("risk_score");
        if (score_index < 0) {
            doc.InsertColumn(doc.GetColumnCount(),
                             std::vector<std::string>(doc.GetRowCount(), std::string{}),
                             "risk_score");
            score_index = doc.GetColumnIdx("risk_score");
        }

        auto rows_by_id = std::map<std::string, std::size_t>{};
        auto ids = doc.GetColumn<std::string>(id_column);
        for (std::size_t row = 0; row < ids.size(); row++) {
            rows_by_id.emplace(ids[row], row);
        }

        // Scores for unknown identifiers have no row to update
        auto score_column = static_cast<std::size_t>(score_index);
        for (const auto &update : updates) {
            if (auto it = rows_by_id.find(update.id); it != rows_by_id.end()) {
                doc.SetCell<std::string>(score_column, it->second,
                                         fmt::format("{}", update.risk_score));
            }
        }

        doc.Save();
    } catch (const std::out_of_range &ex) {
        throw core::UpstreamIOError(ex.what());
    } catch (const std::ios_base::failure &ex) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, failed to write '{}': {}", filename, ex.what()));
    }
}

std::vector<core::SnapshotBaseline>
FileRepository::select_snapshots(const core::Date &snapshot_date) const {
    auto target = core::to_iso_string(snapshot_date);
    auto results = std::vector<core::SnapshotBaseline>{};
    for (const auto &row : read_array(snapshots_file())) {
        auto baseline = row.get<core::SnapshotBaseline>();
        if (baseline.snapshot_date == target) {
            results.push_back(std::move(baseline));
        }
    }

    return results;
}

void FileRepository::upsert_snapshots(const std::vector<core::RegionSnapshot> &snapshots) {
    if (snapshots.empty()) {
        return;
    }

    auto rows = read_array(snapshots_file());
    for (const auto &snapshot : snapshots) {
        auto entry = json(snapshot);
        auto existing = std::find_if(rows.begin(), rows.end(), [&entry](const auto &row) {
            return same_snapshot_key(row, entry);
        });

        if (existing != rows.end()) {
            *existing = std::move(entry);
        } else {
            rows.push_back(std::move(entry));
        }
    }

    write_array(snapshots_file(), rows);
}

void FileRepository::insert(const core::AuditRecord &record) {
    auto rows = read_array(audit_file());
    rows.push_back(json(record));
    write_array(audit_file(), rows);
}

std::vector<core::RegionSnapshot> FileRepository::read_snapshots() const {
    try {
        return read_array(snapshots_file()).get<std::vector<core::RegionSnapshot>>();
    } catch (const json::exception &ex) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, invalid snapshot row: {}", ex.what()));
    }
}

json FileRepository::read_audit_log() const { return read_array(audit_file()); }

json FileRepository::read_array(const std::filesystem::path &file_name) const {
    auto full_name = root_ / file_name;
    if (!std::filesystem::exists(full_name)) {
        return json::array();
    }

    std::ifstream ifs(full_name, std::ifstream::in);
    if (!ifs) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, failed to open '{}'.", full_name.string()));
    }

    try {
        auto rows = json::parse(ifs);
        if (!rows.is_array()) {
            throw core::UpstreamIOError(
                fmt::format("File-based store, '{}' is not a JSON array.", full_name.string()));
        }

        return rows;
    } catch (const json::parse_error &ex) {
        throw core::UpstreamIOError(fmt::format("File-based store, invalid JSON in '{}': {}",
                                                full_name.string(), ex.what()));
    }
}

void FileRepository::write_array(const std::filesystem::path &file_name, const json &rows) const {
    auto full_name = root_ / file_name;
    std::ofstream ofs(full_name, std::ofstream::out | std::ofstream::trunc);
    if (!ofs) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, failed to create '{}'.", full_name.string()));
    }

    ofs << rows.dump(2) << std::endl;
    if (!ofs) {
        throw core::UpstreamIOError(
            fmt::format("File-based store, failed to write '{}'.", full_name.string()));
    }
}

std::map<std::string, std::size_t>
FileRepository::create_fields_index_mapping(const std::vector<std::string> &column_names,
                                            const std::vector<std::string> &fields) {
    auto mapping = std::map<std::string, std::size_t>();
    for (const auto &field : fields) {
        auto it = std::find_if(column_names.begin(), column_names.end(),
                               [&field](const auto &name) { return to_lower(name) == field; });
        if (it == column_names.end()) {
            throw std::out_of_range(
                fmt::format("File-based store, required field {} not found", field));
        }

        mapping.emplace(field, static_cast<std::size_t>(std::distance(column_names.begin(), it)));
    }

    return mapping;
}

} // namespace aera::data
