#include "pch.h"

#include "Aera.Core/exception.h"
#include "Aera.Datastore/file_repository.h"
#include "temp_dir.h"

#include <fstream>
#include <sstream>

namespace {

constexpr auto *POPULATION_CSV = R"(id,organization_id,county_id,state_id,household_size,medication_dependency,insulin_dependency,oxygen_powered_device,mobility_limitation,transportation_access,financial_strain,risk_score
p1,o1,c1,s1,2,false,TRUE,f,0,t,,1.5
p2,,c1,s1,,1,,,,false,true,
p3,o2,,,4,F,false,false,false,true,false,0
)";

class FileRepositoryFixture : public ::testing::Test {
  protected:
    void write_file(const std::string &name, const std::string &content) const {
        std::ofstream ofs{dir_.path() / name};
        ofs << content;
    }

    std::string read_file(const std::string &name) const {
        std::ifstream ifs{dir_.path() / name};
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    const std::filesystem::path &root() const { return dir_.path(); }

    static aera::core::RegionSnapshot create_snapshot(std::string county, double average) {
        return aera::core::RegionSnapshot{.snapshot_date = aera::core::parse_iso_date("2026-02-14"),
                                          .window_days = 30,
                                          .organization_id = "o1",
                                          .county_id = std::move(county),
                                          .state_id = "s1",
                                          .profile_count = 2,
                                          .avg_risk_score = average,
                                          .model_version = "level3-2026.02",
                                          .pipeline_run_id = "run-1"};
    }

  private:
    aera::testing::TempDir dir_;
};

} // anonymous namespace

TEST_F(FileRepositoryFixture, MissingRootFolderThrows) {
    using namespace aera::data;

    ASSERT_THROW(FileRepository{root() / "missing"}, std::invalid_argument);
    ASSERT_NO_THROW(FileRepository{root()});
}

TEST_F(FileRepositoryFixture, MissingPopulationFileThrows) {
    using namespace aera;

    auto repository = data::FileRepository{root()};
    ASSERT_THROW(repository.select_population(), core::UpstreamIOError);
}

TEST_F(FileRepositoryFixture, SelectPopulationParsesNullableColumns) {
    using namespace aera;

    write_file(data::FileRepository::population_file(), POPULATION_CSV);
    auto repository = data::FileRepository{root()};
    auto population = repository.select_population();
    ASSERT_EQ(3, population.size());

    const auto &first = population[0];
    ASSERT_EQ("p1", first.id);
    ASSERT_EQ("o1", first.organization_id.value());
    ASSERT_DOUBLE_EQ(2.0, first.household_size.value());
    ASSERT_FALSE(first.medication_dependency.value());
    ASSERT_TRUE(first.insulin_dependency.value());
    ASSERT_FALSE(first.oxygen_powered_device.value());
    ASSERT_FALSE(first.mobility_limitation.value());
    ASSERT_TRUE(first.transportation_access.value());
    ASSERT_FALSE(first.financial_strain.has_value());
    ASSERT_DOUBLE_EQ(1.5, first.risk_score.value());
    ASSERT_FALSE(first.updated_at.has_value());

    const auto &second = population[1];
    ASSERT_FALSE(second.organization_id.has_value());
    ASSERT_FALSE(second.household_size.has_value());
    ASSERT_TRUE(second.medication_dependency.value());
    ASSERT_FALSE(second.transportation_access.value());
    ASSERT_FALSE(second.risk_score.has_value());

    const auto &third = population[2];
    ASSERT_FALSE(third.county_id.has_value());
    ASSERT_FALSE(third.state_id.has_value());
    ASSERT_FALSE(third.medication_dependency.value());
}

TEST_F(FileRepositoryFixture, InvalidFlagThrows) {
    using namespace aera;
    using namespace ::testing;

    write_file(data::FileRepository::population_file(),
               "id,insulin_dependency\np1,true\np2,maybe\n");
    auto repository = data::FileRepository{root()};
    try {
        repository.select_population();
        FAIL() << "Invalid flag must be rejected.";
    } catch (const core::UpstreamIOError &ex) {
        ASSERT_THAT(ex.what(), HasSubstr("insulin_dependency"));
        ASSERT_THAT(ex.what(), HasSubstr("maybe"));
    }
}

TEST_F(FileRepositoryFixture, MissingIdColumnThrows) {
    using namespace aera;

    write_file(data::FileRepository::population_file(), "county_id,state_id\nc1,s1\n");
    auto repository = data::FileRepository{root()};
    ASSERT_THROW(repository.select_population(), core::UpstreamIOError);
}

TEST_F(FileRepositoryFixture, UpsertRiskScoresUpdatesRows) {
    using namespace aera;

    write_file(data::FileRepository::population_file(), POPULATION_CSV);
    auto repository = data::FileRepository{root()};
    repository.upsert_risk_scores({{"p2", 3.0}, {"p1", 2.6}, {"unknown", 9.0}});

    auto population = repository.select_population();
    ASSERT_EQ(3, population.size());
    ASSERT_DOUBLE_EQ(2.6, population[0].risk_score.value());
    ASSERT_DOUBLE_EQ(3.0, population[1].risk_score.value());
    ASSERT_DOUBLE_EQ(0.0, population[2].risk_score.value());
    ASSERT_TRUE(population[0].insulin_dependency.value());
}

TEST_F(FileRepositoryFixture, UpsertRiskScoresAddsMissingColumn) {
    using namespace aera;

    write_file(data::FileRepository::population_file(), "id,county_id\np1,c1\np2,c2\n");
    auto repository = data::FileRepository{root()};
    repository.upsert_risk_scores({{"p1", 0.4}});

    auto population = repository.select_population();
    ASSERT_DOUBLE_EQ(0.4, population[0].risk_score.value());
    ASSERT_FALSE(population[1].risk_score.has_value());
}

TEST_F(FileRepositoryFixture, SnapshotsMergedByNaturalKey) {
    using namespace aera;

    auto repository = data::FileRepository{root()};
    ASSERT_TRUE(repository.read_snapshots().empty());

    repository.upsert_snapshots({create_snapshot("c1", 2.0), create_snapshot("c2", 3.0)});
    repository.upsert_snapshots({create_snapshot("c1", 2.5)});

    auto rows = repository.read_snapshots();
    ASSERT_EQ(2, rows.size());
    ASSERT_EQ("c1", rows[0].county_id);
    ASSERT_DOUBLE_EQ(2.5, rows[0].avg_risk_score);
    ASSERT_DOUBLE_EQ(3.0, rows[1].avg_risk_score);

    auto baselines = repository.select_snapshots(core::parse_iso_date("2026-02-14"));
    ASSERT_EQ(2, baselines.size());
    ASSERT_DOUBLE_EQ(2.5, baselines[0].avg_risk_score.value());
    ASSERT_TRUE(repository.select_snapshots(core::parse_iso_date("2026-01-15")).empty());
}

TEST_F(FileRepositoryFixture, AuditLogAppends) {
    using namespace aera;

    auto repository = data::FileRepository{root()};
    repository.insert(core::AuditRecord{.run_id = "run-1", .stage = "kmeans"});
    repository.insert(core::AuditRecord{.run_id = "run-1",
                                        .stage = "pipeline",
                                        .status = core::StageStatus::failed,
                                        .error_message = "store offline"});

    auto log = repository.read_audit_log();
    ASSERT_EQ(2, log.size());
    ASSERT_EQ("kmeans", log[0].at("stage").get<std::string>());
    ASSERT_EQ("FAILED", log[1].at("status").get<std::string>());
    ASSERT_EQ("store offline", log[1].at("error_message").get<std::string>());
}

TEST_F(FileRepositoryFixture, CorruptJsonThrows) {
    using namespace aera;

    write_file(data::FileRepository::snapshots_file(), "{ not json");
    auto repository = data::FileRepository{root()};
    ASSERT_THROW(repository.select_snapshots(core::parse_iso_date("2026-02-14")),
                 core::UpstreamIOError);

    write_file(data::FileRepository::audit_file(), R"({"stage": "kmeans"})");
    ASSERT_THROW(repository.insert(core::AuditRecord{}), core::UpstreamIOError);
}
