#include <gtest/gtest.h>
#include "connection_registry.hpp"
#include "metrics.hpp"
#include "test_support.hpp"

using namespace bhumi;
using namespace bhumi::testing;

class ConnectionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
        registry.add_unbind_listener([this](ConnectionHandle handle, const std::optional<Id52>& released) {
            events.push_back({handle, released});
        });
    }

    std::shared_ptr<FakeConnection> open_bound(const TestIdentity& who) {
        auto conn = std::make_shared<FakeConnection>();
        auto handle = registry.register_connection(conn);
        EXPECT_EQ(registry.bind(handle, who.id52(), who.sign_handshake(conn->nonce())),
                  ConnectionRegistry::BindResult::BOUND);
        return conn;
    }

    struct Event {
        ConnectionHandle handle;
        std::optional<Id52> released;
    };

    ConnectionRegistry registry{std::make_shared<Ed25519Verifier>()};
    std::vector<Event> events;
};

TEST_F(ConnectionRegistryTest, HandlesAreUniqueAndNonZero) {
    auto a = std::make_shared<FakeConnection>();
    auto b = std::make_shared<FakeConnection>();
    auto ha = registry.register_connection(a);
    auto hb = registry.register_connection(b);

    EXPECT_NE(ha, 0u);
    EXPECT_NE(ha, hb);
    EXPECT_EQ(a->handle(), ha);
    EXPECT_EQ(registry.connection_count(), 2u);
}

TEST_F(ConnectionRegistryTest, BindRequiresValidSignature) {
    TestIdentity alice;
    auto conn = std::make_shared<FakeConnection>();
    auto handle = registry.register_connection(conn);

    // Signed over the wrong nonce.
    auto result = registry.bind(handle, alice.id52(), alice.sign_handshake(conn->nonce() + 1));
    EXPECT_EQ(result, ConnectionRegistry::BindResult::BAD_SIGNATURE);
    EXPECT_EQ(registry.lookup(alice.id52()), nullptr);
    EXPECT_FALSE(registry.is_live(handle));
    EXPECT_EQ(MetricsRegistry::instance().get_counter("auth_failure_total"), 1.0);
}

TEST_F(ConnectionRegistryTest, UnknownHandle) {
    TestIdentity alice;
    EXPECT_EQ(registry.bind(12345, alice.id52(), alice.sign_handshake(0)),
              ConnectionRegistry::BindResult::UNKNOWN_HANDLE);
}

TEST_F(ConnectionRegistryTest, LookupReturnsBoundConnection) {
    TestIdentity alice;
    auto conn = open_bound(alice);

    EXPECT_EQ(registry.lookup(alice.id52()), conn);
    EXPECT_EQ(registry.identity_of(conn->handle()), alice.id52());
    EXPECT_TRUE(registry.is_live(conn->handle()));
    EXPECT_EQ(registry.bound_count(), 1u);
}

TEST_F(ConnectionRegistryTest, ClosedConnectionIsNotReturned) {
    TestIdentity alice;
    auto conn = open_bound(alice);
    conn->close();

    EXPECT_EQ(registry.lookup(alice.id52()), nullptr);
    EXPECT_FALSE(registry.is_live(conn->handle()));
}

TEST_F(ConnectionRegistryTest, UnbindReleasesIdentity) {
    TestIdentity alice;
    auto conn = open_bound(alice);
    auto handle = conn->handle();

    registry.unbind(handle);
    EXPECT_EQ(registry.lookup(alice.id52()), nullptr);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].handle, handle);
    EXPECT_EQ(events[0].released, alice.id52());

    // Idempotent.
    registry.unbind(handle);
    EXPECT_EQ(events.size(), 1u);
}

TEST_F(ConnectionRegistryTest, UnboundConnectionReleasesNothing) {
    auto conn = std::make_shared<FakeConnection>();
    auto handle = registry.register_connection(conn);
    registry.unbind(handle);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events[0].released.has_value());
}

TEST_F(ConnectionRegistryTest, SecondBindDisplacesFirst) {
    TestIdentity alice;
    auto first = open_bound(alice);
    auto second = open_bound(alice);

    EXPECT_EQ(registry.lookup(alice.id52()), second);
    EXPECT_EQ(first->close_calls(), 1);
    EXPECT_FALSE(registry.is_live(first->handle()));
    EXPECT_FALSE(registry.identity_of(first->handle()).has_value());

    // The identity stays bound, so nothing is released.
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].handle, first->handle());
    EXPECT_FALSE(events[0].released.has_value());

    // The displaced session tearing down must not unbind the new holder.
    registry.unbind(first->handle());
    EXPECT_EQ(registry.lookup(alice.id52()), second);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("identity_displaced_total"), 1.0);
}

TEST_F(ConnectionRegistryTest, RebindSameIdentityKeepsBinding) {
    TestIdentity alice;
    auto conn = open_bound(alice);
    EXPECT_EQ(registry.bind(conn->handle(), alice.id52(), alice.sign_handshake(conn->nonce())),
              ConnectionRegistry::BindResult::BOUND);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(conn->close_calls(), 0);
}

TEST_F(ConnectionRegistryTest, RebindToOtherIdentityReleasesOld) {
    TestIdentity alice;
    TestIdentity carol;
    auto conn = open_bound(alice);

    EXPECT_EQ(registry.bind(conn->handle(), carol.id52(), carol.sign_handshake(conn->nonce())),
              ConnectionRegistry::BindResult::BOUND);
    EXPECT_EQ(registry.lookup(alice.id52()), nullptr);
    EXPECT_EQ(registry.lookup(carol.id52()), conn);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].released, alice.id52());
}

TEST_F(ConnectionRegistryTest, BoundConnectionsSnapshot) {
    TestIdentity alice;
    TestIdentity bob;
    auto a = open_bound(alice);
    auto b = open_bound(bob);
    auto loose = std::make_shared<FakeConnection>();
    registry.register_connection(loose);

    EXPECT_EQ(registry.bound_connections().size(), 2u);
}

TEST_F(ConnectionRegistryTest, IpAdmission) {
    EXPECT_TRUE(registry.increment_ip_count("1.2.3.4", 2, 10));
    EXPECT_TRUE(registry.increment_ip_count("1.2.3.4", 2, 10));
    EXPECT_FALSE(registry.increment_ip_count("1.2.3.4", 2, 10));
    EXPECT_EQ(registry.connection_count_for_ip("1.2.3.4"), 2u);

    registry.decrement_ip_count("1.2.3.4");
    EXPECT_TRUE(registry.increment_ip_count("1.2.3.4", 2, 10));
    EXPECT_EQ(MetricsRegistry::instance().get_counter("connection_rejected_limit_total"), 1.0);
}

TEST_F(ConnectionRegistryTest, GlobalAdmissionLimit) {
    EXPECT_TRUE(registry.increment_ip_count("1.1.1.1", 5, 2));
    EXPECT_TRUE(registry.increment_ip_count("2.2.2.2", 5, 2));
    EXPECT_FALSE(registry.increment_ip_count("3.3.3.3", 5, 2));
    EXPECT_EQ(registry.connection_count_for_ip("3.3.3.3"), 0u);
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("active_connections"), 2.0);
}

TEST_F(ConnectionRegistryTest, CloseAllClosesEverything) {
    TestIdentity alice;
    auto bound = open_bound(alice);
    auto loose = std::make_shared<FakeConnection>();
    registry.register_connection(loose);

    registry.close_all_connections();
    EXPECT_FALSE(bound->is_open());
    EXPECT_FALSE(loose->is_open());
}
