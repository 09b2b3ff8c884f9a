/**
 * @file test-query.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Tests for the query text format.
 * @version 0.3
 * @date 2019-08-11
 *
 * @copyright Copyright (c) 2019
 *
 */
#include <gtest/gtest.h>
#include "bgp-query.h"

using namespace bgpd;

TEST(QueryTest, KindNames) {
    BgpQueryKind kind = NEIGHBORS;

    ASSERT_TRUE(queryKindFromString("adj-rib-out", &kind));
    EXPECT_EQ(kind, ADJ_RIB_OUT);
    ASSERT_TRUE(queryKindFromString("loc-rib-best", &kind));
    EXPECT_EQ(kind, LOC_RIB_BEST);
    EXPECT_FALSE(queryKindFromString("rib", &kind));
    EXPECT_EQ(kind, LOC_RIB_BEST);

    EXPECT_STREQ(queryKindToString(NEIGHBOR), "neighbor");
    EXPECT_STREQ(queryErrorToString(NOT_FOUND), "not-found");
}

TEST(QueryTest, EmptyResponse) {
    BgpQueryResponse response;

    EXPECT_EQ(formatQueryResponse(response, false), "{\"error\":\"none\",\"neighbors\":[],\"routes\":[]}");
    EXPECT_EQ(formatQueryResponse(response, true),
        "{\n"
        "  \"error\": \"none\",\n"
        "  \"neighbors\": [],\n"
        "  \"routes\": []\n"
        "}\n");
}

TEST(QueryTest, ErrorCarriesMessage) {
    BgpQueryResponse response;
    response.error = BAD_REQUEST;
    response.message = "bad \"address\"";

    EXPECT_EQ(formatQueryResponse(response, false),
        "{\"error\":\"bad-request\",\"message\":\"bad \\\"address\\\"\",\"neighbors\":[],\"routes\":[]}");
}

TEST(QueryTest, RoutesAndNeighbors) {
    BgpQueryResponse response;

    BgpNeighborSummary neighbor;
    neighbor.address = "10.0.0.2";
    neighbor.asn = 65001;
    neighbor.state = "Established";
    neighbor.router_id = "10.0.0.2";
    neighbor.updates_in = 3;
    neighbor.prefixes = 1;
    response.neighbors.push_back(neighbor);

    BgpRouteSummary route;
    route.prefix = "10.0.0.0/24";
    route.next_hop = "10.0.0.2";
    route.as_path = "65001";
    route.origin = "IGP";
    route.contributor = "10.0.0.2";
    route.best = true;
    response.routes.push_back(route);

    route.has_med = true;
    route.med = 5;
    route.best = false;
    response.routes.push_back(route);

    EXPECT_EQ(formatQueryResponse(response, false),
        "{\"error\":\"none\","
        "\"neighbors\":[{\"accepted\":0,\"address\":\"10.0.0.2\",\"asn\":65001,\"flaps\":0,\"prefixes\":1,"
        "\"rejected\":0,\"router_id\":\"10.0.0.2\",\"state\":\"Established\",\"updates_in\":3,\"updates_out\":0,\"uptime\":0}],"
        "\"routes\":[{\"as_path\":\"65001\",\"best\":true,\"contributor\":\"10.0.0.2\",\"local_pref\":100,"
        "\"next_hop\":\"10.0.0.2\",\"origin\":\"IGP\",\"prefix\":\"10.0.0.0/24\"},"
        "{\"as_path\":\"65001\",\"best\":false,\"contributor\":\"10.0.0.2\",\"local_pref\":100,\"med\":5,"
        "\"next_hop\":\"10.0.0.2\",\"origin\":\"IGP\",\"prefix\":\"10.0.0.0/24\"}]}");
}

TEST(QueryTest, ControlCharactersAreEscaped) {
    BgpQueryResponse response;
    response.error = NOT_FOUND;
    response.message = "no peer\n\x01";

    EXPECT_EQ(formatQueryResponse(response, false),
        "{\"error\":\"not-found\",\"message\":\"no peer\\n\\u0001\",\"neighbors\":[],\"routes\":[]}");
}
