/**
 * @file test-attrib-set.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Tests for attribute sets and the arena.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#include <gtest/gtest.h>
#include <algorithm>
#include "bgp-attrib-set.h"
#include "test-common.h"

using namespace bgpd;
using namespace bgpd::test;

TEST(AttribSetTest, DecisionFields) {
    CapturingLogHandler logger;
    BgpAttribSet set(&logger, makeAttribs(&logger, {65001, 65002, 65003}, "10.0.0.2", 200, 30));

    EXPECT_EQ(set.local_pref, 200u);
    EXPECT_TRUE(set.has_local_pref);
    EXPECT_EQ(set.as_path_len, 3u);
    EXPECT_EQ(set.origin, IGP);
    EXPECT_EQ(set.med, 30u);
    EXPECT_TRUE(set.has_med);
    EXPECT_EQ(set.neighbor_asn, 65001u);
    EXPECT_EQ(set.next_hop, ip("10.0.0.2"));
    EXPECT_EQ(set.as_path, "65001 65002 65003");
}

TEST(AttribSetTest, Defaults) {
    CapturingLogHandler logger;
    BgpAttribSet set(&logger, makeAttribs(&logger, {}, "10.0.0.2"));

    EXPECT_EQ(set.local_pref, 100u);
    EXPECT_FALSE(set.has_local_pref);
    EXPECT_EQ(set.as_path_len, 0u);
    EXPECT_EQ(set.med, 0u);
    EXPECT_FALSE(set.has_med);
    EXPECT_EQ(set.neighbor_asn, 0u);
    EXPECT_EQ(set.as_path, "");
}

TEST(AttribSetTest, SortedByTypeCode) {
    CapturingLogHandler logger;
    std::vector<std::shared_ptr<BgpPathAttrib>> attribs = makeAttribs(&logger, {65001}, "10.0.0.2", 0, 10);
    std::reverse(attribs.begin(), attribs.end());

    BgpAttribSet set(&logger, attribs);
    const std::vector<std::shared_ptr<BgpPathAttrib>> &sorted = set.getAttribs();

    ASSERT_EQ(sorted.size(), 4u);
    for (size_t i = 1; i < sorted.size(); i++) {
        EXPECT_LT(sorted[i - 1]->type_code, sorted[i]->type_code);
    }
}

TEST(AttribArenaTest, IdenticalContentSharesInstance) {
    CapturingLogHandler logger;
    BgpAttribArena arena(&logger);

    std::vector<std::shared_ptr<BgpPathAttrib>> attribs = makeAttribs(&logger, {65001}, "10.0.0.2", 0, 10);
    std::vector<std::shared_ptr<BgpPathAttrib>> reversed(attribs.rbegin(), attribs.rend());

    std::shared_ptr<const BgpAttribSet> a = arena.intern(makeAttribs(&logger, {65001}, "10.0.0.2", 0, 10));
    std::shared_ptr<const BgpAttribSet> b = arena.intern(reversed);
    std::shared_ptr<const BgpAttribSet> c = arena.intern(makeAttribs(&logger, {65001}, "10.0.0.3", 0, 10));

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), c.get());
    EXPECT_EQ(arena.size(), 2u);
}

TEST(AttribArenaTest, ForgetsUnreferencedSets) {
    CapturingLogHandler logger;
    BgpAttribArena arena(&logger);

    std::shared_ptr<const BgpAttribSet> kept = arena.intern(makeAttribs(&logger, {65001}, "10.0.0.2"));

    {
        std::shared_ptr<const BgpAttribSet> dropped = arena.intern(makeAttribs(&logger, {65002}, "10.0.0.3"));
        EXPECT_EQ(arena.size(), 2u);
    }

    EXPECT_EQ(arena.size(), 1u);

    kept.reset();
    EXPECT_EQ(arena.size(), 0u);
}

TEST(AttribArenaTest, ReinternAfterReleaseGivesFreshInstance) {
    CapturingLogHandler logger;
    BgpAttribArena arena(&logger);

    std::shared_ptr<const BgpAttribSet> first = arena.intern(makeAttribs(&logger, {65001}, "10.0.0.2"));
    std::string key = first->getKey();
    first.reset();

    std::shared_ptr<const BgpAttribSet> second = arena.intern(makeAttribs(&logger, {65001}, "10.0.0.2"));
    ASSERT_TRUE(second.get() != NULL);
    EXPECT_EQ(second->getKey(), key);
    EXPECT_EQ(arena.size(), 1u);
}
