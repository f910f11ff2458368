#include <gtest/gtest.h>
#include "handlers/health_handler.hpp"
#include "test_support.hpp"

using namespace bhumi;
using namespace bhumi::testing;

class HealthHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
        config.admin_token = "s3cret-admin-token";
    }

    http::request<http::string_body> get(const std::string& target) {
        http::request<http::string_body> req{http::verb::get, target, 11};
        return req;
    }

    ServerConfig config;
    net::io_context ioc;
    ConnectionRegistry registry{std::make_shared<AcceptAllVerifier>()};
    CapabilityStore capabilities;
    ResponseCache cache;
    SendOrchestrator orchestrator{ioc, registry, capabilities, cache,
                                  std::chrono::seconds(30), std::chrono::seconds(300)};
    Ed25519Verifier verifier;
    PresenceService presence{verifier, registry, nullptr, PresenceService::Options{}};
    RelayServices services{registry, capabilities, cache, orchestrator, presence};
    HealthHandler handler{config, services};
};

TEST_F(HealthHandlerTest, HealthReportsStatus) {
    auto res = handler.handle_health(11);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    json::value parsed = json::parse(res.body());
    auto& body = parsed.as_object();
    EXPECT_TRUE(body["status"].as_string() == "healthy");
    EXPECT_FALSE(body["tls"].as_bool());
}

TEST_F(HealthHandlerTest, StatsReflectRelayState) {
    auto conn = std::make_shared<FakeConnection>();
    registry.register_connection(conn);
    registry.bind(conn->handle(), filled_id(0xB0), Signature{});
    capabilities.install(filled_id(0xB0), {commit_of(random_preimage())});
    cache.store(random_preimage(), to_bytes("r"), std::chrono::seconds(60));

    auto stats = handler.collect_stats();
    EXPECT_EQ(stats["connections"].as_int64(), 1);
    EXPECT_EQ(stats["bound_identities"].as_int64(), 1);
    EXPECT_EQ(stats["identities_with_commits"].as_int64(), 1);
    EXPECT_EQ(stats["cache_entries"].as_int64(), 1);
    EXPECT_EQ(stats["pending_sends"].as_int64(), 0);
    EXPECT_EQ(stats["presence_records"].as_int64(), 0);
}

TEST_F(HealthHandlerTest, MetricsArePrometheusText) {
    MetricsRegistry::instance().increment_counter("send_total");
    auto res = handler.handle_metrics(11);

    EXPECT_EQ(res[http::field::content_type], "text/plain; version=0.0.4");
    EXPECT_NE(res.body().find("send_total 1"), std::string::npos);
    EXPECT_NE(res.body().find("cache_entries 0"), std::string::npos);
}

TEST_F(HealthHandlerTest, AdminTokenCheck) {
    auto req = get("/stats");
    EXPECT_FALSE(handler.verify_admin_request(req));

    req.set("X-Admin-Token", "wrong");
    EXPECT_FALSE(handler.verify_admin_request(req));

    req.set("X-Admin-Token", "s3cret-admin-token");
    EXPECT_TRUE(handler.verify_admin_request(req));
}

TEST_F(HealthHandlerTest, NoTokenConfiguredDeniesRemote) {
    config.admin_token.clear();
    auto req = get("/metrics");
    req.set("X-Admin-Token", "");
    EXPECT_FALSE(handler.verify_admin_request(req));
}
