/**
 * @file test-rib.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Tests for the decision process and the RIB diffs.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "bgp-rib.h"
#include "test-common.h"

using namespace bgpd;
using namespace bgpd::test;

#define LOCAL_ASN 65000

static const BgpRibOut* outFor(const std::vector<BgpRibOut> &out, uint32_t peer) {
    for (const BgpRibOut &o : out) {
        if (o.peer_addr == peer) return &o;
    }

    return NULL;
}

static bool announces(const std::vector<BgpRibOut> &out, uint32_t peer, const Prefix4 &route) {
    const BgpRibOut *o = outFor(out, peer);
    if (o == NULL) return false;

    for (const BgpRibOutRoute &r : o->announce) {
        if (r.route == route) return true;
    }

    return false;
}

static bool withdraws(const std::vector<BgpRibOut> &out, uint32_t peer, const Prefix4 &route) {
    const BgpRibOut *o = outFor(out, peer);
    if (o == NULL) return false;
    return std::find(o->withdraw.begin(), o->withdraw.end(), route) != o->withdraw.end();
}

static BgpRibConfig ribConfig(bool always_compare_med = false) {
    BgpRibConfig config;
    config.local_asn = LOCAL_ASN;
    config.router_id = ip("10.0.0.1");
    config.always_compare_med = always_compare_med;
    return config;
}

class RibTest : public ::testing::Test {
protected:
    RibTest() : rib(&logger, ribConfig()) {
        peer_a = ip("10.0.0.2");
        peer_b = ip("10.0.0.3");
        peer_c = ip("10.0.0.4");
        peer_d = ip("10.0.0.5");
        peer_e = ip("10.0.0.6");
        route = prefix("10.0.0.0/24");
    }

    void up(uint32_t addr, uint32_t asn, bool rr_client = false) {
        std::vector<BgpRibOut> out;
        ASSERT_TRUE(rib.addPeer(addr, asn, rr_client));
        ASSERT_TRUE(rib.peerUp(addr, addr, 1, out));
    }

    // A, B: eBGP. C, E: iBGP. D: iBGP route reflector client.
    void upAll() {
        up(peer_a, 65001);
        up(peer_b, 65002);
        up(peer_c, LOCAL_ASN);
        up(peer_d, LOCAL_ASN, true);
        up(peer_e, LOCAL_ASN);
    }

    BgpRibUpdateResult announce(uint32_t from, const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs, std::vector<BgpRibOut> &out) {
        std::vector<Prefix4> nlri(1, route);
        return rib.update(from, std::vector<Prefix4>(), attribs, nlri, out);
    }

    BgpRibUpdateResult withdraw(uint32_t from, std::vector<BgpRibOut> &out) {
        std::vector<Prefix4> withdrawn(1, route);
        return rib.update(from, withdrawn, std::vector<std::shared_ptr<BgpPathAttrib>>(), std::vector<Prefix4>(), out);
    }

    CapturingLogHandler logger;
    BgpRib rib;
    uint32_t peer_a, peer_b, peer_c, peer_d, peer_e;
    Prefix4 route;
};

TEST_F(RibTest, HigherLocalPrefWinsInEitherOrder) {
    for (int order = 0; order < 2; order++) {
        BgpRib this_rib(&logger, ribConfig());
        std::vector<BgpRibOut> out;

        ASSERT_TRUE(this_rib.addPeer(peer_c, LOCAL_ASN, false));
        ASSERT_TRUE(this_rib.addPeer(peer_e, LOCAL_ASN, false));
        ASSERT_TRUE(this_rib.peerUp(peer_c, peer_c, 1, out));
        ASSERT_TRUE(this_rib.peerUp(peer_e, peer_e, 1, out));

        std::vector<Prefix4> nlri(1, route);
        std::vector<std::shared_ptr<BgpPathAttrib>> from_c = makeAttribs(&logger, {65010, 65011}, "10.0.0.4", 100);
        std::vector<std::shared_ptr<BgpPathAttrib>> from_e = makeAttribs(&logger, {65012}, "10.0.0.6", 200);

        if (order == 0) {
            this_rib.update(peer_c, std::vector<Prefix4>(), from_c, nlri, out);
            this_rib.update(peer_e, std::vector<Prefix4>(), from_e, nlri, out);
        } else {
            this_rib.update(peer_e, std::vector<Prefix4>(), from_e, nlri, out);
            this_rib.update(peer_c, std::vector<Prefix4>(), from_c, nlri, out);
        }

        ASSERT_EQ(this_rib.getLocRib().size(), 1u);
        const BgpRibEntry *best = this_rib.lookup(ip("10.0.0.1"));
        ASSERT_NE(best, (const BgpRibEntry *) NULL);
        EXPECT_EQ(best->src_addr, peer_e);
        EXPECT_EQ(best->attribs->local_pref, 200u);
    }
}

TEST_F(RibTest, SameWinnerForEveryArrivalOrder) {
    uint32_t peer_f = ip("10.0.0.7");
    uint32_t senders[3] = { peer_a, peer_b, peer_f };
    uint32_t sender_asn[3] = { 65001, 65002, 65001 };

    // MED only compares A with F (same neighbor AS), so the ranking is not
    // transitive. the winner must still be stable.
    std::vector<std::vector<std::shared_ptr<BgpPathAttrib>>> attribs;
    attribs.push_back(makeAttribs(&logger, {65001}, "10.0.0.2", 0, 10));
    attribs.push_back(makeAttribs(&logger, {65002}, "10.0.0.3", 0, 0));
    attribs.push_back(makeAttribs(&logger, {65001}, "10.0.0.7", 0, 5));

    int order[3] = { 0, 1, 2 };
    uint32_t winner = 0;

    do {
        BgpRib this_rib(&logger, ribConfig());
        std::vector<BgpRibOut> out;

        for (int i = 0; i < 3; i++) {
            ASSERT_TRUE(this_rib.addPeer(senders[i], sender_asn[i], false));
            ASSERT_TRUE(this_rib.peerUp(senders[i], senders[i], 1, out));
        }

        std::vector<Prefix4> nlri(1, route);
        for (int i = 0; i < 3; i++) {
            this_rib.update(senders[order[i]], std::vector<Prefix4>(), attribs[order[i]], nlri, out);
        }

        const BgpRibEntry *best = this_rib.lookup(ip("10.0.0.1"));
        ASSERT_NE(best, (const BgpRibEntry *) NULL);

        if (winner == 0) winner = best->src_addr;
        EXPECT_EQ(best->src_addr, winner);

        std::vector<BgpRibEntry> candidates = this_rib.getCandidates(route);
        ASSERT_EQ(candidates.size(), 3u);
        EXPECT_EQ(candidates[0].src_addr, winner);
    } while (std::next_permutation(order, order + 3));
}

TEST_F(RibTest, SessionDropWithdrawsEverywhere) {
    upAll();

    std::vector<BgpRibOut> out;
    BgpRibUpdateResult result = announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);
    EXPECT_EQ(result.accepted, 1u);
    EXPECT_TRUE(announces(out, peer_b, route));
    EXPECT_TRUE(announces(out, peer_c, route));

    out.clear();
    ASSERT_TRUE(rib.peerDown(peer_a, out));

    EXPECT_EQ(rib.getPeer(peer_a)->rib_in.size(), 0u);
    EXPECT_EQ(rib.getLocRib().count(route), 0u);
    EXPECT_TRUE(withdraws(out, peer_b, route));
    EXPECT_TRUE(withdraws(out, peer_c, route));
    EXPECT_TRUE(withdraws(out, peer_d, route));
    EXPECT_TRUE(withdraws(out, peer_e, route));
    EXPECT_EQ(outFor(out, peer_a), (const BgpRibOut *) NULL);

    EXPECT_EQ(rib.getPeer(peer_b)->rib_out.size(), 0u);
    EXPECT_EQ(rib.getArenaSize(), 0u);
}

TEST_F(RibTest, NeverAnnouncedBackToSource) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);

    EXPECT_FALSE(announces(out, peer_a, route));
    EXPECT_EQ(rib.getPeer(peer_a)->rib_out.count(route), 0u);
}

TEST_F(RibTest, IbgpRoutesFollowReflectionRules) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_c, makeAttribs(&logger, {65010}, "10.0.0.4"), out);

    // from a non-client: clients and eBGP only.
    EXPECT_TRUE(announces(out, peer_a, route));
    EXPECT_TRUE(announces(out, peer_b, route));
    EXPECT_TRUE(announces(out, peer_d, route));
    EXPECT_FALSE(announces(out, peer_e, route));

    out.clear();
    withdraw(peer_c, out);

    // from a client: everyone but the client itself.
    out.clear();
    announce(peer_d, makeAttribs(&logger, {65010}, "10.0.0.5"), out);
    EXPECT_TRUE(announces(out, peer_a, route));
    EXPECT_TRUE(announces(out, peer_c, route));
    EXPECT_TRUE(announces(out, peer_e, route));
    EXPECT_FALSE(announces(out, peer_d, route));
}

TEST_F(RibTest, UnchangedBestSendsNothing) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);
    EXPECT_FALSE(out.empty());

    out.clear();
    BgpRibUpdateResult result = announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);
    EXPECT_EQ(result.accepted, 1u);
    EXPECT_TRUE(out.empty());

    // a worse route from another peer does not change the best either.
    announce(peer_b, makeAttribs(&logger, {65002, 65003}, "10.0.0.3"), out);
    EXPECT_TRUE(out.empty());
}

TEST_F(RibTest, BestMovingAwayWithdrawsFromNewSource) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001, 65005}, "10.0.0.2"), out);
    announce(peer_b, makeAttribs(&logger, {65002}, "10.0.0.3"), out);

    ASSERT_EQ(rib.lookup(ip("10.0.0.9"))->src_addr, peer_b);
    EXPECT_EQ(rib.getPeer(peer_a)->rib_out.count(route), 1u);

    out.clear();
    withdraw(peer_b, out);

    ASSERT_EQ(rib.lookup(ip("10.0.0.9"))->src_addr, peer_a);

    // A's own route is now the best: A loses what it had from B.
    EXPECT_TRUE(withdraws(out, peer_a, route));
    EXPECT_TRUE(announces(out, peer_b, route));
    EXPECT_TRUE(announces(out, peer_c, route));
}

TEST_F(RibTest, RefreshResendsAdjRibOut) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);

    std::map<Prefix4, BgpRibOutRoute> before = rib.getPeer(peer_b)->rib_out;

    out.clear();
    ASSERT_TRUE(rib.refresh(peer_b, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].peer_addr, peer_b);
    ASSERT_EQ(out[0].announce.size(), 1u);
    EXPECT_EQ(out[0].announce[0].route, route);
    EXPECT_TRUE(out[0].withdraw.empty());

    EXPECT_EQ(rib.getPeer(peer_b)->rib_out.size(), before.size());
    EXPECT_EQ(rib.getPeer(peer_b)->rib_out.at(route).attribs, before[route].attribs);
}

TEST_F(RibTest, LocalRoutesAnnouncedAndWithdrawn) {
    upAll();

    BgpLocalRoute local;
    local.route = prefix("192.0.2.0/24");
    local.has_med = true;
    local.med = 7;

    std::vector<BgpRibOut> out;
    rib.insertLocal(local, out);

    EXPECT_TRUE(announces(out, peer_a, local.route));
    EXPECT_TRUE(announces(out, peer_c, local.route));
    EXPECT_TRUE(outFor(out, peer_a)->announce[0].local);

    const BgpRibEntry *best = rib.lookup(ip("192.0.2.1"));
    ASSERT_NE(best, (const BgpRibEntry *) NULL);
    EXPECT_EQ(best->src, SRC_LOCAL);
    EXPECT_EQ(best->attribs->next_hop, ip("10.0.0.1"));
    EXPECT_EQ(best->attribs->as_path_len, 0u);

    out.clear();
    ASSERT_TRUE(rib.withdrawLocal(local.route, out));
    EXPECT_TRUE(withdraws(out, peer_a, local.route));
    EXPECT_EQ(rib.lookup(ip("192.0.2.1")), (const BgpRibEntry *) NULL);

    EXPECT_FALSE(rib.withdrawLocal(local.route, out));
}

TEST_F(RibTest, LocalRouteSentToPeerThatComesUpLater) {
    BgpLocalRoute local;
    local.route = prefix("192.0.2.0/24");

    std::vector<BgpRibOut> out;
    rib.insertLocal(local, out);
    EXPECT_TRUE(out.empty());

    ASSERT_TRUE(rib.addPeer(peer_a, 65001, false));
    ASSERT_TRUE(rib.peerUp(peer_a, peer_a, 3, out));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].session_id, 3u);
    EXPECT_TRUE(announces(out, peer_a, local.route));
}

TEST_F(RibTest, RouteWithoutNexthopIsRejected) {
    upAll();

    std::vector<std::shared_ptr<BgpPathAttrib>> attribs = makeAttribs(&logger, {65001}, "10.0.0.2");
    attribs.erase(attribs.begin() + 2);

    std::vector<BgpRibOut> out;
    BgpRibUpdateResult result = announce(peer_a, attribs, out);

    EXPECT_EQ(result.accepted, 0u);
    EXPECT_EQ(result.rejected, 1u);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(rib.getLocRib().size(), 0u);
}

TEST_F(RibTest, LocalPrefFromEbgpIsIgnored) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2", 500), out);

    const BgpRibEntry *best = rib.lookup(ip("10.0.0.1"));
    ASSERT_NE(best, (const BgpRibEntry *) NULL);
    EXPECT_FALSE(best->attribs->has_local_pref);
    EXPECT_EQ(best->attribs->local_pref, 100u);
}

TEST_F(RibTest, LongestPrefixMatch) {
    upAll();

    std::vector<BgpRibOut> out;
    std::vector<Prefix4> nlri;
    nlri.push_back(prefix("10.0.0.0/8"));
    nlri.push_back(prefix("10.1.0.0/16"));
    rib.update(peer_a, std::vector<Prefix4>(), makeAttribs(&logger, {65001}, "10.0.0.2"), nlri, out);

    ASSERT_NE(rib.lookup(ip("10.1.2.3")), (const BgpRibEntry *) NULL);
    EXPECT_EQ(rib.lookup(ip("10.1.2.3"))->route, prefix("10.1.0.0/16"));
    EXPECT_EQ(rib.lookup(ip("10.2.0.1"))->route, prefix("10.0.0.0/8"));
    EXPECT_EQ(rib.lookup(ip("11.0.0.1")), (const BgpRibEntry *) NULL);
}

TEST_F(RibTest, MedAcrossNeighborAsIsConfigurable) {
    for (int compare = 0; compare < 2; compare++) {
        BgpRib this_rib(&logger, ribConfig(compare == 1));
        std::vector<BgpRibOut> out;

        ASSERT_TRUE(this_rib.addPeer(peer_a, 65001, false));
        ASSERT_TRUE(this_rib.addPeer(peer_b, 65002, false));
        ASSERT_TRUE(this_rib.peerUp(peer_a, peer_a, 1, out));
        ASSERT_TRUE(this_rib.peerUp(peer_b, peer_b, 1, out));

        std::vector<Prefix4> nlri(1, route);
        this_rib.update(peer_a, std::vector<Prefix4>(), makeAttribs(&logger, {65001}, "10.0.0.2", 0, 50), nlri, out);
        this_rib.update(peer_b, std::vector<Prefix4>(), makeAttribs(&logger, {65002}, "10.0.0.3", 0, 10), nlri, out);

        const BgpRibEntry *best = this_rib.lookup(ip("10.0.0.1"));
        ASSERT_NE(best, (const BgpRibEntry *) NULL);

        // without MED, the lower router id wins.
        EXPECT_EQ(best->src_addr, compare == 1 ? peer_b : peer_a);
    }
}

TEST_F(RibTest, IgpCostBreaksTies) {
    rib.setIgpCostResolver([](uint32_t nexthop) {
        return nexthop == ip("10.0.0.2") ? 20u : 10u;
    });

    up(peer_a, 65001);
    up(peer_b, 65002);

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);
    announce(peer_b, makeAttribs(&logger, {65002}, "10.0.0.3"), out);

    EXPECT_EQ(rib.lookup(ip("10.0.0.1"))->src_addr, peer_b);
}

TEST_F(RibTest, RemovePeerDropsItsRoutes) {
    upAll();

    std::vector<BgpRibOut> out;
    announce(peer_a, makeAttribs(&logger, {65001}, "10.0.0.2"), out);

    out.clear();
    ASSERT_TRUE(rib.removePeer(peer_a, out));
    EXPECT_EQ(rib.getPeer(peer_a), (const BgpRibPeer *) NULL);
    EXPECT_TRUE(withdraws(out, peer_b, route));
    EXPECT_EQ(rib.getLocRib().size(), 0u);

    EXPECT_FALSE(rib.removePeer(peer_a, out));
    EXPECT_TRUE(rib.addPeer(peer_a, 65001, false));
    EXPECT_FALSE(rib.addPeer(peer_a, 65001, false));
}
