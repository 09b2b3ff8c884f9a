/**
 * @file test-fsm.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Tests for the session FSM, driven with a manual clock.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include "bgp-fsm.h"
#include "bgp-keepalive-message.h"
#include "bgp-notification-message.h"
#include "bgp-route-refresh-message.h"
#include "bgp-packet.h"
#include "bgp-sink.h"
#include "test-common.h"

using namespace bgpd;
using namespace bgpd::test;

// keeps the bytes written by the FSM.
class RecordingOutHandler : public BgpOutHandler {
public:
    RecordingOutHandler() : connects(0), closes(0), connect_ok(true) {}

    bool handleOut(const uint8_t *buffer, size_t length) {
        bytes.insert(bytes.end(), buffer, buffer + length);
        return true;
    }

    bool connect() {
        connects++;
        return connect_ok;
    }

    void close() {
        closes++;
    }

    std::vector<uint8_t> bytes;
    int connects;
    int closes;
    bool connect_ok;
};

class RecordingReceiver : public RouteEventReceiver {
public:
    bool handleRouteEvent(const RouteEvent &ev) {
        events.push_back(std::shared_ptr<RouteEvent>(ev.clone()));
        return true;
    }

    std::vector<std::shared_ptr<RouteEvent>> events;
};

class FsmTest : public ::testing::Test {
protected:
    FsmTest() : clock(1000) {}

    void SetUp() {
        init(65001);
    }

    void init(uint32_t peer_asn, bool passive = false, uint16_t connect_retry = 120) {
        this->peer_asn = peer_asn;

        BgpConfig config;
        config.out_handler = &out;
        config.log_handler = &logger;
        config.rev_receiver = &receiver;
        config.clock = &clock;
        config.asn = 65000;
        config.peer_asn = peer_asn;
        config.router_id = ip("10.0.0.1");
        config.peer_addr = ip("10.0.0.2");
        config.hold_timer = 90;
        config.connect_retry = connect_retry;
        config.passive = passive;

        fsm.reset(new BgpFsm(config));
    }

    int feed(const BgpMessage &msg) {
        BgpPacket pkt(&logger, true, &msg);
        uint8_t buf[4096];
        ssize_t len = pkt.write(buf, sizeof(buf));
        if (len <= 0) throw "test_write_failed";
        return fsm->run(buf, len);
    }

    int feedOpen(uint32_t asn, uint16_t hold_time = 90) {
        BgpOpenMessage open(&logger, true, asn, hold_time, ip("10.0.0.2"));
        return feed(open);
    }

    // everything sent since the last call, decoded.
    std::vector<std::shared_ptr<BgpPacket>> takeSent() {
        std::vector<std::shared_ptr<BgpPacket>> packets;
        BgpSink sink(&logger, true);
        sink.fill(out.bytes.data(), out.bytes.size());
        out.bytes.clear();

        while (sink.getBytesInSink() > 0) {
            BgpPacket *pkt = NULL;
            ssize_t ret = sink.pour(&pkt);
            if (ret == 0) break;
            packets.push_back(std::shared_ptr<BgpPacket>(pkt));
            if (ret < 0) break;
        }

        return packets;
    }

    size_t countSent(const std::vector<std::shared_ptr<BgpPacket>> &packets, uint8_t type) {
        size_t n = 0;
        for (const std::shared_ptr<BgpPacket> &pkt : packets) {
            if (pkt->getMessage() != NULL && pkt->getMessage()->type == type) n++;
        }
        return n;
    }

    void establish() {
        ASSERT_EQ(fsm->start(), 1);
        ASSERT_EQ(fsm->getState(), CONNECT);
        ASSERT_EQ(fsm->connected(), 1);
        ASSERT_EQ(fsm->getState(), OPEN_SENT);
        ASSERT_EQ(feedOpen(peer_asn), 1);
        ASSERT_EQ(fsm->getState(), OPEN_CONFIRM);

        BgpKeepaliveMessage keepalive(&logger);
        ASSERT_EQ(feed(keepalive), 1);
        ASSERT_EQ(fsm->getState(), ESTABLISHED);
    }

    std::vector<const PeerStateEvent *> stateEvents() const {
        std::vector<const PeerStateEvent *> states;
        for (const std::shared_ptr<RouteEvent> &ev : receiver.events) {
            if (ev->type == PEER_STATE) states.push_back(dynamic_cast<const PeerStateEvent *>(ev.get()));
        }
        return states;
    }

    const RouteEvent* lastEvent(RouteEventType type) const {
        for (std::vector<std::shared_ptr<RouteEvent>>::const_reverse_iterator it = receiver.events.rbegin(); it != receiver.events.rend(); it++) {
            if ((*it)->type == type) return it->get();
        }
        return NULL;
    }

    BgpRibOut ribOut(const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs, bool local = false) {
        BgpRibOutRoute route;
        route.route = prefix("192.0.2.0/24");
        route.attribs = std::make_shared<BgpAttribSet>(&logger, attribs);
        route.local = local;

        BgpRibOut rib_out;
        rib_out.peer_addr = ip("10.0.0.2");
        rib_out.session_id = fsm->getSessionId();
        rib_out.announce.push_back(route);
        return rib_out;
    }

    CapturingLogHandler logger;
    ManualClock clock;
    RecordingOutHandler out;
    RecordingReceiver receiver;
    std::unique_ptr<BgpFsm> fsm;
    uint32_t peer_asn;
};

TEST_F(FsmTest, EstablishesSession) {
    establish();

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 2u);
    ASSERT_EQ(sent[0]->getMessage()->type, OPEN);
    EXPECT_EQ(sent[1]->getMessage()->type, KEEPALIVE);

    const BgpOpenMessage *open = dynamic_cast<const BgpOpenMessage *>(sent[0]->getMessage());
    EXPECT_EQ(open->getAsn(), 65000u);
    EXPECT_EQ(open->hold_time, 90);
    EXPECT_EQ(open->bgp_id, ip("10.0.0.1"));
    EXPECT_TRUE(open->hasCapability(ASN_4B));
    EXPECT_TRUE(open->hasCapability(MP_BGP));
    EXPECT_TRUE(open->hasCapability(ROUTE_REFRESH));

    EXPECT_EQ(fsm->getPeerAsn(), 65001u);
    EXPECT_EQ(fsm->getPeerBgpId(), ip("10.0.0.2"));
    EXPECT_EQ(fsm->getHoldTimer(), 90);
    EXPECT_EQ(fsm->getKeepaliveInterval(), 30);
    EXPECT_EQ(fsm->getSessionId(), 1u);

    std::vector<const PeerStateEvent *> states = stateEvents();
    ASSERT_EQ(states.size(), 4u);
    EXPECT_EQ(states[0]->new_state, CONNECT);
    EXPECT_EQ(states[1]->new_state, OPEN_SENT);
    EXPECT_EQ(states[2]->new_state, OPEN_CONFIRM);
    EXPECT_EQ(states[3]->old_state, OPEN_CONFIRM);
    EXPECT_EQ(states[3]->new_state, ESTABLISHED);
    EXPECT_EQ(states[3]->peer_asn, 65001u);
    EXPECT_EQ(states[3]->session_id, 1u);
}

TEST_F(FsmTest, SmallerHoldTimeWins) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    ASSERT_EQ(feedOpen(peer_asn, 9), 1);

    EXPECT_EQ(fsm->getHoldTimer(), 9);
    EXPECT_EQ(fsm->getKeepaliveInterval(), 3);
}

TEST_F(FsmTest, HoldTimerOfOneIsRejected) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    takeSent();

    EXPECT_EQ(feedOpen(peer_asn, 1), 2);
    EXPECT_EQ(fsm->getState(), IDLE);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    ASSERT_NE(notify, (const BgpNotificationMessage *) NULL);
    EXPECT_EQ(notify->errcode, E_OPEN);
    EXPECT_EQ(notify->subcode, E_HOLD_TIME);
}

TEST_F(FsmTest, HoldTimerExpirySendsOneNotification) {
    establish();
    takeSent();

    EXPECT_EQ(fsm->nextDeadline(), 1030u);

    clock.advance(89);
    EXPECT_EQ(fsm->tick(), 1);
    EXPECT_EQ(fsm->getState(), ESTABLISHED);
    EXPECT_EQ(countSent(takeSent(), NOTIFICATION), 0u);

    clock.advance(1);
    EXPECT_EQ(fsm->tick(), 2);
    EXPECT_EQ(fsm->getState(), IDLE);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(countSent(sent, NOTIFICATION), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent.back()->getMessage());
    EXPECT_EQ(notify->errcode, E_HOLD);

    clock.advance(10);
    EXPECT_EQ(fsm->tick(), 1);
    EXPECT_EQ(countSent(takeSent(), NOTIFICATION), 0u);
    EXPECT_GE(out.closes, 1);
}

TEST_F(FsmTest, HoldTimerExpiryInOpenConfirm) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    ASSERT_EQ(feedOpen(peer_asn), 1);
    ASSERT_EQ(fsm->getState(), OPEN_CONFIRM);
    takeSent();

    clock.advance(90);
    EXPECT_EQ(fsm->tick(), 2);
    EXPECT_EQ(fsm->getState(), IDLE);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    ASSERT_NE(notify, (const BgpNotificationMessage *) NULL);
    EXPECT_EQ(notify->errcode, E_HOLD);

    const PeerStateEvent *last = stateEvents().back();
    EXPECT_EQ(last->old_state, OPEN_CONFIRM);
    EXPECT_EQ(last->new_state, IDLE);
}

TEST_F(FsmTest, KeepaliveSentOnSchedule) {
    establish();
    takeSent();

    clock.advance(29);
    EXPECT_EQ(fsm->tick(), 1);
    EXPECT_EQ(takeSent().size(), 0u);

    clock.advance(1);
    EXPECT_EQ(fsm->tick(), 1);
    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]->getMessage()->type, KEEPALIVE);

    EXPECT_EQ(fsm->nextDeadline(), 1060u);
}

TEST_F(FsmTest, WrongPeerAsIsRejected) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    takeSent();

    EXPECT_EQ(feedOpen(65009), 2);
    EXPECT_EQ(fsm->getState(), IDLE);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    ASSERT_NE(notify, (const BgpNotificationMessage *) NULL);
    EXPECT_EQ(notify->errcode, E_OPEN);
    EXPECT_EQ(notify->subcode, E_PEER_AS);
}

TEST_F(FsmTest, UnsupportedVersionIsRejected) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    takeSent();

    BgpOpenMessage open(&logger, true, peer_asn, 90, ip("10.0.0.2"));
    open.version = 3;
    EXPECT_EQ(feed(open), 2);
    EXPECT_EQ(fsm->getState(), IDLE);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    ASSERT_NE(notify, (const BgpNotificationMessage *) NULL);
    EXPECT_EQ(notify->errcode, E_OPEN);
    EXPECT_EQ(notify->subcode, E_VERSION);
    ASSERT_EQ(notify->data.size(), 2u);
    EXPECT_EQ(notify->data[1], 4);
}

TEST_F(FsmTest, UnexpectedMessageInOpenSent) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    takeSent();

    BgpKeepaliveMessage keepalive(&logger);
    EXPECT_EQ(feed(keepalive), 2);
    EXPECT_EQ(fsm->getState(), IDLE);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    EXPECT_EQ(notify->errcode, E_FSM);
    EXPECT_EQ(notify->subcode, E_OPEN_SENT);
}

TEST_F(FsmTest, NotificationFromPeerEndsSession) {
    establish();

    BgpNotificationMessage notify(&logger, E_CEASE, E_SHUTDOWN, NULL, 0);
    EXPECT_EQ(feed(notify), 0);
    EXPECT_EQ(fsm->getState(), IDLE);

    const PeerStateEvent *last = stateEvents().back();
    EXPECT_EQ(last->old_state, ESTABLISHED);
    EXPECT_EQ(last->new_state, IDLE);
}

TEST_F(FsmTest, StaleSessionOutputIsDropped) {
    establish();
    takeSent();

    BgpRibOut rib_out = ribOut(makeAttribs(&logger, {65010}, "10.0.0.9"));
    rib_out.session_id = 0;

    EXPECT_EQ(fsm->handleRibOut(rib_out), 0);
    EXPECT_EQ(takeSent().size(), 0u);
}

TEST_F(FsmTest, OutputBeforeEstablishedIsDropped) {
    ASSERT_EQ(fsm->start(), 1);
    ASSERT_EQ(fsm->connected(), 1);
    takeSent();

    EXPECT_EQ(fsm->handleRibOut(ribOut(makeAttribs(&logger, {65010}, "10.0.0.9"))), 0);
    EXPECT_EQ(takeSent().size(), 0u);
}

TEST_F(FsmTest, TransportDropReturnsToIdleAndRetries) {
    establish();
    int closes = out.closes;

    EXPECT_EQ(fsm->transportFailed(), 0);
    EXPECT_EQ(fsm->getState(), IDLE);
    EXPECT_GT(out.closes, closes);

    const PeerStateEvent *last = stateEvents().back();
    EXPECT_EQ(last->old_state, ESTABLISHED);
    EXPECT_EQ(last->new_state, IDLE);
    EXPECT_EQ(last->session_id, 1u);

    EXPECT_EQ(fsm->nextDeadline(), 1120u);

    clock.advance(120);
    EXPECT_EQ(fsm->tick(), 1);
    EXPECT_EQ(fsm->getState(), CONNECT);
    EXPECT_EQ(out.connects, 2);
}

TEST_F(FsmTest, StopSendsCeaseAndStaysIdle) {
    establish();
    takeSent();

    EXPECT_EQ(fsm->stop(E_DECONF), 1);
    EXPECT_EQ(fsm->getState(), IDLE);
    EXPECT_EQ(fsm->nextDeadline(), 0u);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    EXPECT_EQ(notify->errcode, E_CEASE);
    EXPECT_EQ(notify->subcode, E_DECONF);
}

TEST_F(FsmTest, PassiveWaitsForPeer) {
    init(65001, true);

    ASSERT_EQ(fsm->start(), 1);
    EXPECT_EQ(fsm->getState(), ACTIVE);
    EXPECT_EQ(out.connects, 0);

    EXPECT_EQ(fsm->connected(), 1);
    EXPECT_EQ(fsm->getState(), OPEN_SENT);
}

TEST_F(FsmTest, ZeroConnectRetryIsRaised) {
    init(65001, false, 0);

    ASSERT_EQ(fsm->start(), 1);
    EXPECT_EQ(fsm->getState(), CONNECT);
    EXPECT_EQ(fsm->nextDeadline(), 1001u);

    for (int i = 0; i < 5; i++) EXPECT_EQ(fsm->tick(), 1);
    EXPECT_EQ(out.connects, 1);
    EXPECT_EQ(out.closes, 0);

    init(65001, true, 0);
    ASSERT_EQ(fsm->start(), 1);
    EXPECT_EQ(fsm->getState(), ACTIVE);
    EXPECT_EQ(fsm->tick(), 1);
    EXPECT_GT(fsm->nextDeadline(), clock.getTime());
}

TEST_F(FsmTest, FailedConnectGoesActive) {
    out.connect_ok = false;

    ASSERT_EQ(fsm->start(), 1);
    EXPECT_EQ(fsm->getState(), ACTIVE);

    out.connect_ok = true;
    clock.advance(120);
    EXPECT_EQ(fsm->tick(), 1);
    EXPECT_EQ(fsm->getState(), CONNECT);
    EXPECT_EQ(out.connects, 2);
}

TEST_F(FsmTest, UpdateIsReported) {
    establish();

    BgpUpdateMessage update(&logger, true);
    update.setAttribs(makeAttribs(&logger, {65001}, "10.0.0.2"));
    update.nlri.push_back(prefix("198.51.100.0/24"));
    update.withdrawn_routes.push_back(prefix("203.0.113.0/24"));
    EXPECT_EQ(feed(update), 1);

    const PeerUpdateEvent *ev = dynamic_cast<const PeerUpdateEvent *>(lastEvent(PEER_UPDATE));
    ASSERT_NE(ev, (const PeerUpdateEvent *) NULL);
    EXPECT_EQ(ev->session_id, 1u);
    EXPECT_EQ(ev->peer_addr, ip("10.0.0.2"));
    ASSERT_EQ(ev->nlri.size(), 1u);
    EXPECT_EQ(ev->nlri[0], prefix("198.51.100.0/24"));
    ASSERT_EQ(ev->withdrawn.size(), 1u);
    EXPECT_EQ(ev->withdrawn[0], prefix("203.0.113.0/24"));
    EXPECT_EQ(ev->attribs.size(), 3u);
}

TEST_F(FsmTest, MalformedUpdateEndsSession) {
    establish();
    takeSent();

    // nlri without any path attribute.
    BgpUpdateMessage update(&logger, true);
    update.nlri.push_back(prefix("198.51.100.0/24"));
    EXPECT_EQ(feed(update), 2);
    EXPECT_EQ(fsm->getState(), IDLE);
    EXPECT_EQ(lastEvent(PEER_UPDATE), (const RouteEvent *) NULL);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(sent[0]->getMessage());
    ASSERT_NE(notify, (const BgpNotificationMessage *) NULL);
    EXPECT_EQ(notify->errcode, E_UPDATE);
    EXPECT_EQ(notify->subcode, E_MISS_WELL_KNOWN);

    const PeerStateEvent *last = stateEvents().back();
    EXPECT_EQ(last->old_state, ESTABLISHED);
    EXPECT_EQ(last->new_state, IDLE);
    EXPECT_EQ(last->session_id, 1u);
}

TEST_F(FsmTest, LoopedRoutesBecomeWithdrawals) {
    establish();

    BgpUpdateMessage update(&logger, true);
    update.setAttribs(makeAttribs(&logger, {65001, 65000, 65002}, "10.0.0.2"));
    update.nlri.push_back(prefix("198.51.100.0/24"));
    EXPECT_EQ(feed(update), 1);

    const PeerUpdateEvent *ev = dynamic_cast<const PeerUpdateEvent *>(lastEvent(PEER_UPDATE));
    ASSERT_NE(ev, (const PeerUpdateEvent *) NULL);
    EXPECT_EQ(ev->nlri.size(), 0u);
    ASSERT_EQ(ev->withdrawn.size(), 1u);
    EXPECT_EQ(ev->withdrawn[0], prefix("198.51.100.0/24"));
}

TEST_F(FsmTest, RouteRefreshIsReported) {
    establish();

    BgpRouteRefreshMessage refresh(&logger, IPV4, UNICAST);
    EXPECT_EQ(feed(refresh), 1);

    const RouteEvent *ev = lastEvent(PEER_REFRESH);
    ASSERT_NE(ev, (const RouteEvent *) NULL);
    EXPECT_EQ(ev->session_id, 1u);
}

TEST_F(FsmTest, EbgpExportPrependsAndRewritesNexthop) {
    establish();
    takeSent();

    EXPECT_EQ(fsm->handleRibOut(ribOut(makeAttribs(&logger, {65010}, "10.0.0.9", 200, 30))), 1);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpUpdateMessage *update = dynamic_cast<const BgpUpdateMessage *>(sent[0]->getMessage());
    ASSERT_NE(update, (const BgpUpdateMessage *) NULL);

    ASSERT_EQ(update->nlri.size(), 1u);
    EXPECT_EQ(update->nlri[0], prefix("192.0.2.0/24"));

    ASSERT_TRUE(update->hasAttrib(AS_PATH));
    EXPECT_EQ(dynamic_cast<const BgpPathAttribAsPath &>(update->getAttrib(AS_PATH)).toString(), "65000 65010");

    ASSERT_TRUE(update->hasAttrib(NEXT_HOP));
    EXPECT_EQ(dynamic_cast<const BgpPathAttribNexthop &>(update->getAttrib(NEXT_HOP)).next_hop, ip("10.0.0.1"));

    EXPECT_FALSE(update->hasAttrib(LOCAL_PREF));
    EXPECT_FALSE(update->hasAttrib(MULTI_EXIT_DISC));

    const PeerOutputEvent *ev = dynamic_cast<const PeerOutputEvent *>(lastEvent(PEER_OUTPUT));
    ASSERT_NE(ev, (const PeerOutputEvent *) NULL);
    EXPECT_EQ(ev->updates, 1u);
}

TEST_F(FsmTest, EbgpExportKeepsMedOfLocalRoutes) {
    establish();
    takeSent();

    EXPECT_EQ(fsm->handleRibOut(ribOut(makeAttribs(&logger, {}, "10.0.0.1", 0, 30), true)), 1);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpUpdateMessage *update = dynamic_cast<const BgpUpdateMessage *>(sent[0]->getMessage());
    ASSERT_TRUE(update->hasAttrib(MULTI_EXIT_DISC));
    EXPECT_EQ(dynamic_cast<const BgpPathAttribMed &>(update->getAttrib(MULTI_EXIT_DISC)).med, 30u);
    EXPECT_EQ(dynamic_cast<const BgpPathAttribAsPath &>(update->getAttrib(AS_PATH)).toString(), "65000");
}

TEST_F(FsmTest, IbgpExportKeepsNexthopAndAddsLocalPref) {
    init(65000);
    establish();
    takeSent();

    EXPECT_EQ(fsm->handleRibOut(ribOut(makeAttribs(&logger, {65010}, "10.0.0.9", 0, 30))), 1);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpUpdateMessage *update = dynamic_cast<const BgpUpdateMessage *>(sent[0]->getMessage());
    ASSERT_NE(update, (const BgpUpdateMessage *) NULL);

    EXPECT_EQ(dynamic_cast<const BgpPathAttribAsPath &>(update->getAttrib(AS_PATH)).toString(), "65010");
    EXPECT_EQ(dynamic_cast<const BgpPathAttribNexthop &>(update->getAttrib(NEXT_HOP)).next_hop, ip("10.0.0.9"));
    ASSERT_TRUE(update->hasAttrib(LOCAL_PREF));
    EXPECT_EQ(dynamic_cast<const BgpPathAttribLocalPref &>(update->getAttrib(LOCAL_PREF)).local_pref, 100u);
    EXPECT_TRUE(update->hasAttrib(MULTI_EXIT_DISC));
}

TEST_F(FsmTest, WithdrawalsAreSent) {
    establish();
    takeSent();

    BgpRibOut rib_out;
    rib_out.peer_addr = ip("10.0.0.2");
    rib_out.session_id = fsm->getSessionId();
    rib_out.withdraw.push_back(prefix("192.0.2.0/24"));

    EXPECT_EQ(fsm->handleRibOut(rib_out), 1);

    std::vector<std::shared_ptr<BgpPacket>> sent = takeSent();
    ASSERT_EQ(sent.size(), 1u);
    const BgpUpdateMessage *update = dynamic_cast<const BgpUpdateMessage *>(sent[0]->getMessage());
    ASSERT_NE(update, (const BgpUpdateMessage *) NULL);
    ASSERT_EQ(update->withdrawn_routes.size(), 1u);
    EXPECT_EQ(update->withdrawn_routes[0], prefix("192.0.2.0/24"));
    EXPECT_EQ(update->nlri.size(), 0u);
}
