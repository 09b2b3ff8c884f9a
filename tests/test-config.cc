/**
 * @file test-config.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Tests for the YAML configuration loader.
 * @version 0.3
 * @date 2019-08-11
 *
 * @copyright Copyright (c) 2019
 *
 */
#include <gtest/gtest.h>
#include "bgp-config-loader.h"
#include "test-common.h"

using namespace bgpd;
using namespace bgpd::test;

static const char *full_config =
    "global:\n"
    "  asn: 4200000001\n"
    "  router_id: 10.0.0.1\n"
    "  listen_address: 10.0.0.1\n"
    "  listen_port: 1179\n"
    "  hold_time: 30\n"
    "  connect_retry: 10\n"
    "  always_compare_med: true\n"
    "  log_level: debug\n"
    "networks:\n"
    "  - prefix: 192.0.2.0/24\n"
    "  - prefix: 198.51.100.0/24\n"
    "    next_hop: 10.0.0.254\n"
    "    local_pref: 200\n"
    "    med: 10\n"
    "neighbors:\n"
    "  - address: 10.0.0.2\n"
    "    asn: 65001\n"
    "  - address: 10.0.0.3\n"
    "    asn: 4200000001\n"
    "    local_address: 10.0.0.1\n"
    "    hold_time: 0\n"
    "    keepalive: 5\n"
    "    connect_retry: 60\n"
    "    passive: true\n"
    "    route_reflector_client: true\n"
    "    next_hop_self: true\n"
    "    port: 1790\n"
    "    allow_local_as: 1\n";

class ConfigTest : public ::testing::Test {
protected:
    ConfigTest() : loader(&logger) {}

    bool load(const char *yaml) {
        return loader.loadString(yaml, config);
    }

    CapturingLogHandler logger;
    BgpConfigLoader loader;
    BgpServerConfig config;
};

TEST_F(ConfigTest, FullExample) {
    ASSERT_TRUE(load(full_config));

    EXPECT_EQ(config.asn, 4200000001u);
    EXPECT_EQ(config.router_id, ip("10.0.0.1"));
    EXPECT_EQ(config.listen_address, ip("10.0.0.1"));
    EXPECT_EQ(config.listen_port, 1179);
    EXPECT_EQ(config.hold_time, 30);
    EXPECT_EQ(config.connect_retry, 10);
    EXPECT_TRUE(config.always_compare_med);
    EXPECT_EQ(config.log_level, DEBUG);

    ASSERT_EQ(config.networks.size(), 2u);
    EXPECT_EQ(config.networks[0].route, prefix("192.0.2.0/24"));
    EXPECT_EQ(config.networks[0].next_hop, 0u);
    EXPECT_FALSE(config.networks[0].has_local_pref);
    EXPECT_FALSE(config.networks[0].has_med);
    EXPECT_EQ(config.networks[1].next_hop, ip("10.0.0.254"));
    EXPECT_TRUE(config.networks[1].has_local_pref);
    EXPECT_EQ(config.networks[1].local_pref, 200u);
    EXPECT_TRUE(config.networks[1].has_med);
    EXPECT_EQ(config.networks[1].med, 10u);

    ASSERT_EQ(config.neighbors.size(), 2u);

    const BgpNeighborConfig &b = config.neighbors[1];
    EXPECT_EQ(b.address, ip("10.0.0.3"));
    EXPECT_EQ(b.asn, 4200000001u);
    EXPECT_EQ(b.local_address, ip("10.0.0.1"));
    EXPECT_EQ(b.hold_time, 0);
    EXPECT_EQ(b.keepalive, 5);
    EXPECT_EQ(b.connect_retry, 60);
    EXPECT_TRUE(b.passive);
    EXPECT_TRUE(b.route_reflector_client);
    EXPECT_TRUE(b.next_hop_self);
    EXPECT_EQ(b.port, 1790);
    EXPECT_EQ(b.allow_local_as, 1);
}

TEST_F(ConfigTest, NeighborDefaultsFollowGlobal) {
    ASSERT_TRUE(load(full_config));

    const BgpNeighborConfig &a = config.neighbors[0];
    EXPECT_EQ(a.hold_time, 30);
    EXPECT_EQ(a.connect_retry, 10);
    EXPECT_EQ(a.keepalive, 0);
    EXPECT_FALSE(a.passive);
    EXPECT_FALSE(a.route_reflector_client);
    EXPECT_FALSE(a.next_hop_self);
    EXPECT_EQ(a.port, 179);
    EXPECT_EQ(a.allow_local_as, 0);
    EXPECT_EQ(a.local_address, 0u);
}

TEST_F(ConfigTest, MinimalConfig) {
    ASSERT_TRUE(load("global: { asn: 65000, router_id: 10.0.0.1 }\n"));

    EXPECT_EQ(config.asn, 65000u);
    EXPECT_EQ(config.listen_port, 179);
    EXPECT_EQ(config.hold_time, 90);
    EXPECT_EQ(config.log_level, INFO);
    EXPECT_FALSE(config.always_compare_med);
    EXPECT_EQ(config.networks.size(), 0u);
    EXPECT_EQ(config.neighbors.size(), 0u);
}

TEST_F(ConfigTest, MissingAsnIsRejected) {
    EXPECT_FALSE(load("global: { router_id: 10.0.0.1 }\n"));
    EXPECT_TRUE(logger.contains("asn"));
    EXPECT_FALSE(load("global: { asn: 0, router_id: 10.0.0.1 }\n"));
    EXPECT_FALSE(load("global: { asn: -1, router_id: 10.0.0.1 }\n"));
    EXPECT_FALSE(load("global: { asn: 4294967296, router_id: 10.0.0.1 }\n"));
}

TEST_F(ConfigTest, BadValuesAreRejected) {
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 10.0.0.256 }\n"));
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 0.0.0.0 }\n"));
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 10.0.0.1, hold_time: 2 }\n"));
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 10.0.0.1, log_level: loud }\n"));
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 10.0.0.1, always_compare_med: maybe }\n"));
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 10.0.0.1, connect_retry: 0 }\n"));
    EXPECT_TRUE(logger.contains("connect_retry must be at least 1"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "networks:\n"
        "  - prefix: 192.0.2.0/33\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "networks:\n"
        "  - next_hop: 10.0.0.1\n"));
}

TEST_F(ConfigTest, BadNeighborsAreRejected) {
    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "neighbors:\n"
        "  - address: 10.0.0.2\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "neighbors:\n"
        "  - asn: 65001\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "neighbors:\n"
        "  - { address: 10.0.0.2, asn: 65001, port: 0 }\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "neighbors:\n"
        "  - { address: 10.0.0.2, asn: 65001, allow_local_as: 200 }\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "neighbors:\n"
        "  - { address: 10.0.0.2, asn: 65001, connect_retry: 0 }\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65000, router_id: 10.0.0.1 }\n"
        "neighbors:\n"
        "  - { address: 10.0.0.2, asn: 65001 }\n"
        "  - { address: 10.0.0.2, asn: 65002 }\n"));
    EXPECT_TRUE(logger.contains("duplicated neighbor"));
}

TEST_F(ConfigTest, FailedLoadKeepsOutput) {
    ASSERT_TRUE(load("global: { asn: 65000, router_id: 10.0.0.1 }\n"));

    EXPECT_FALSE(load(
        "global: { asn: 65001, router_id: 10.0.0.2 }\n"
        "neighbors: { address: 10.0.0.2 }\n"));
    EXPECT_EQ(config.asn, 65000u);
    EXPECT_EQ(config.router_id, ip("10.0.0.1"));
}

TEST_F(ConfigTest, SyntaxErrorIsRejected) {
    EXPECT_FALSE(load("global: { asn: 65000, router_id: 10.0.0.1\n"));
    EXPECT_FALSE(load("- just\n- a list\n"));
    EXPECT_FALSE(load("neighbors: []\n"));
}

TEST_F(ConfigTest, MissingFileIsRejected) {
    EXPECT_FALSE(loader.loadFile("/nonexistent/bgpd.yaml", config));
    EXPECT_TRUE(logger.contains("can't open"));
}
