#include "pch.h"

#include "Aera.Core/exception.h"
#include "Aera.Datastore/rest_repository.h"

#include <algorithm>
#include <deque>

namespace {

/// Records requests and replies with queued responses, empty arrays when none are queued
class FakeTransport final : public aera::data::HttpTransport {
  public:
    aera::data::HttpResponse send(const aera::data::HttpRequest &request) override {
        requests.push_back(request);
        if (responses.empty()) {
            return aera::data::HttpResponse{.status = 200, .body = "[]"};
        }

        auto response = responses.front();
        responses.pop_front();
        return response;
    }

    bool has_header(std::size_t index, const std::string &header) const {
        const auto &headers = requests.at(index).headers;
        return std::find(headers.begin(), headers.end(), header) != headers.end();
    }

    std::vector<aera::data::HttpRequest> requests;
    std::deque<aera::data::HttpResponse> responses;
};

aera::data::RestSettings create_settings() {
    return aera::data::RestSettings{.url = "https://example.supabase.co/", .key = "secret"};
}

} // anonymous namespace

TEST(TestRestRepository, InvalidSettingsThrow) {
    using namespace aera::data;

    auto transport = FakeTransport{};
    ASSERT_THROW(RestRepository(RestSettings{.url = "", .key = "k"}, transport),
                 std::invalid_argument);
    ASSERT_THROW(RestRepository(RestSettings{.url = "https://x", .key = ""}, transport),
                 std::invalid_argument);
    ASSERT_THROW(RestRepository(RestSettings{.url = "///", .key = "k"}, transport),
                 std::invalid_argument);
}

TEST(TestRestRepository, SelectPopulationRequest) {
    using namespace aera::data;

    auto transport = FakeTransport{};
    transport.responses.push_back(HttpResponse{
        .status = 200,
        .body = R"([{"id": "p1", "county_id": "c1", "state_id": null, "insulin_dependency": true},
                    {"id": 7, "household_size": 3}])"});

    auto repository = RestRepository{create_settings(), transport};
    auto population = repository.select_population();
    ASSERT_EQ(2, population.size());
    ASSERT_EQ("p1", population[0].id);
    ASSERT_FALSE(population[0].state_id.has_value());
    ASSERT_EQ("7", population[1].id);

    ASSERT_EQ(1, transport.requests.size());
    const auto &request = transport.requests.front();
    ASSERT_EQ("GET", request.method);
    ASSERT_EQ("https://example.supabase.co/rest/v1/vulnerability_profiles?select=id,"
              "organization_id,county_id,state_id,household_size,medication_dependency,"
              "insulin_dependency,oxygen_powered_device,mobility_limitation,"
              "transportation_access,financial_strain,risk_score,updated_at",
              request.url);
    ASSERT_EQ(60, request.timeout_seconds);
    ASSERT_TRUE(transport.has_header(0, "apikey: secret"));
    ASSERT_TRUE(transport.has_header(0, "Authorization: Bearer secret"));
    ASSERT_TRUE(transport.has_header(0, "Content-Type: application/json"));
    ASSERT_TRUE(transport.has_header(0, "Prefer: return=representation"));
}

TEST(TestRestRepository, SelectBaselineFilter) {
    using namespace aera;

    auto transport = FakeTransport{};
    transport.responses.push_back(data::HttpResponse{
        .status = 200,
        .body = R"([{"county_id": "c1", "state_id": "s1", "avg_risk_score": 2.5,
                     "snapshot_date": "2026-01-15"}])"});

    auto repository = data::RestRepository{create_settings(), transport};
    auto rows = repository.select_snapshots(core::parse_iso_date("2026-01-15"));
    ASSERT_EQ(1, rows.size());
    ASSERT_DOUBLE_EQ(2.5, rows[0].avg_risk_score.value());
    ASSERT_EQ("https://example.supabase.co/rest/v1/region_snapshots?select=county_id,state_id,"
              "avg_risk_score,snapshot_date&snapshot_date=eq.2026-01-15",
              transport.requests.front().url);
}

TEST(TestRestRepository, UpsertRiskScoresRequest) {
    using namespace aera;

    auto transport = FakeTransport{};
    auto repository = data::RestRepository{create_settings(), transport};
    repository.upsert_risk_scores({{"p1", 3.0}, {"p2", 0.4}});

    ASSERT_EQ(1, transport.requests.size());
    const auto &request = transport.requests.front();
    ASSERT_EQ("POST", request.method);
    ASSERT_EQ("https://example.supabase.co/rest/v1/vulnerability_profiles?on_conflict=id",
              request.url);
    ASSERT_EQ(120, request.timeout_seconds);
    ASSERT_TRUE(
        transport.has_header(0, "Prefer: resolution=merge-duplicates,return=representation"));

    auto body = nlohmann::json::parse(request.body);
    ASSERT_EQ(2, body.size());
    ASSERT_EQ("p1", body[0].at("id").get<std::string>());
    ASSERT_DOUBLE_EQ(0.4, body[1].at("risk_score").get<double>());
}

TEST(TestRestRepository, UpsertSnapshotsConflictKey) {
    using namespace aera;

    auto transport = FakeTransport{};
    auto repository = data::RestRepository{create_settings(), transport};
    repository.upsert_snapshots({core::RegionSnapshot{
        .snapshot_date = core::parse_iso_date("2026-02-14"), .county_id = "c1", .state_id = "s1"}});

    ASSERT_EQ("https://example.supabase.co/rest/v1/region_snapshots?on_conflict=snapshot_date,"
              "county_id,state_id,organization_id",
              transport.requests.front().url);
    auto body = nlohmann::json::parse(transport.requests.front().body);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ("STABLE", body[0].at("drift_status").get<std::string>());
}

TEST(TestRestRepository, InsertAuditRecordAsArray) {
    using namespace aera;

    auto transport = FakeTransport{};
    auto repository = data::RestRepository{create_settings(), transport};
    repository.insert(core::AuditRecord{.run_id = "run-1", .stage = "pipeline"});

    const auto &request = transport.requests.front();
    ASSERT_EQ("https://example.supabase.co/rest/v1/model_audit_log", request.url);
    ASSERT_TRUE(transport.has_header(0, "Prefer: return=representation"));
    auto body = nlohmann::json::parse(request.body);
    ASSERT_EQ(1, body.size());
    ASSERT_EQ("pipeline", body[0].at("stage").get<std::string>());
}

TEST(TestRestRepository, EmptyBatchesNotSent) {
    using namespace aera;

    auto transport = FakeTransport{};
    auto repository = data::RestRepository{create_settings(), transport};
    repository.upsert_risk_scores({});
    repository.upsert_snapshots({});
    ASSERT_TRUE(transport.requests.empty());
}

TEST(TestRestRepository, HttpErrorStatusThrows) {
    using namespace aera;
    using namespace ::testing;

    auto transport = FakeTransport{};
    transport.responses.push_back(
        data::HttpResponse{.status = 401, .body = R"({"message":"Invalid API key"})"});
    auto repository = data::RestRepository{create_settings(), transport};

    try {
        repository.select_population();
        FAIL() << "HTTP error status must be rejected.";
    } catch (const core::UpstreamIOError &ex) {
        ASSERT_THAT(ex.what(), HasSubstr("HTTP 401"));
        ASSERT_THAT(ex.what(), HasSubstr("Invalid API key"));
    }

    transport.responses.push_back(data::HttpResponse{.status = 500, .body = "boom"});
    ASSERT_THROW(repository.insert(core::AuditRecord{}), core::UpstreamIOError);
}

TEST(TestRestRepository, InvalidPayloadThrows) {
    using namespace aera;

    auto transport = FakeTransport{};
    auto repository = data::RestRepository{create_settings(), transport};

    transport.responses.push_back(data::HttpResponse{.status = 200, .body = "<html>"});
    ASSERT_THROW(repository.select_population(), core::UpstreamIOError);

    transport.responses.push_back(data::HttpResponse{.status = 200, .body = R"({"id": "p1"})"});
    ASSERT_THROW(repository.select_population(), core::UpstreamIOError);

    transport.responses.push_back(data::HttpResponse{.status = 200, .body = R"([{"state_id": 1}])"});
    ASSERT_THROW(repository.select_population(), core::UpstreamIOError);
}
