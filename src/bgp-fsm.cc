/**
 * @file bgp-fsm.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP Finite State Machine.
 * @version 0.3
 * @date 2019-08-07
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-fsm.h"
#include "bgp-keepalive-message.h"
#include "bgp-notification-message.h"
#include "bgp-route-refresh-message.h"
#include "bgp-packet.h"
#include <algorithm>
#include <map>
#include <utility>

namespace bgpd {

const char* bgp_fsm_state_str[] = {
    "Idle",
    "Connect",
    "Active",
    "Open Sent",
    "Open Confirm",
    "Established"
};

const char* bgpStateToString(int state) {
    if (state < IDLE || state > ESTABLISHED) return "Invalid";
    return bgp_fsm_state_str[state];
}

/**
 * @brief Construct a new BgpFsm object.
 *
 * @param config The FSM configuration.
 * @throws "null_logger" No log handler in config.
 * @throws "null_out_handler" No output handler in config.
 */
BgpFsm::BgpFsm(const BgpConfig &config) : in_sink(config.log_handler, config.use_4b_asn) {
    if (config.log_handler == NULL) throw "null_logger";
    if (config.out_handler == NULL) throw "null_out_handler";

    this->config = config;
    state = IDLE;
    logger = config.log_handler;

    if (this->config.connect_retry == 0) {
        logger->log(WARN, "BgpFsm::BgpFsm: connect retry of 0 raised to 1 second.\n");
        this->config.connect_retry = 1;
    }

    if (!config.clock) {
        clock = new RealtimeClock();
        clock_local = true;
    } else {
        clock = config.clock;
        clock_local = false;
    }

    peer_bgp_id = 0;
    peer_asn = 0;
    hold_timer = 0;
    keepalive_timer = 0;
    last_sent = last_recv = 0;
    retry_at = 0;
    use_4b_asn = config.use_4b_asn;
    peer_route_refresh = false;
    ibgp = false;
    started = false;
    session_id = 0;
}

BgpFsm::~BgpFsm() {
    if (clock_local) delete clock;
}

uint32_t BgpFsm::getAsn() const {
    return config.asn;
}

uint32_t BgpFsm::getPeerAsn() const {
    return peer_asn;
}

uint32_t BgpFsm::getPeerBgpId() const {
    return peer_bgp_id;
}

uint16_t BgpFsm::getHoldTimer() const {
    return state >= OPEN_CONFIRM ? hold_timer : 0;
}

uint16_t BgpFsm::getKeepaliveInterval() const {
    return keepalive_timer;
}

BgpState BgpFsm::getState() const {
    return state;
}

uint64_t BgpFsm::getSessionId() const {
    return session_id;
}

int BgpFsm::start() {
    if (state != IDLE) {
        logger->log(ERROR, "BgpFsm::start: not in IDLE state.\n");
        return 0;
    }

    started = true;
    beginConnect();
    return 1;
}

int BgpFsm::beginConnect() {
    retry_at = clock->getTime() + config.connect_retry;

    if (config.passive) {
        logger->log(DEBUG, "BgpFsm::beginConnect: passive, waiting for peer.\n");
        setState(ACTIVE);
        return 1;
    }

    setState(CONNECT);

    if (!config.out_handler->connect()) {
        logger->log(ERROR, "BgpFsm::beginConnect: failed to start connection, retry in %u seconds.\n", config.connect_retry);
        setState(ACTIVE);
        return 0;
    }

    return 1;
}

int BgpFsm::stop(uint8_t cease_subcode) {
    started = false;
    retry_at = 0;

    if (state == IDLE) return 1;

    logger->log(INFO, "BgpFsm::stop: de-peering...\n");

    if (state >= OPEN_SENT) {
        BgpNotificationMessage notify (logger, E_CEASE, cease_subcode, NULL, 0);

        // a failed write already dropped the session.
        if (!writeMessage(notify)) return 1;
    }

    dropSession();
    return 1;
}

int BgpFsm::connected() {
    if (state != CONNECT && state != ACTIVE && !(state == IDLE && started)) {
        logger->log(ERROR, "BgpFsm::connected: not expecting a connection in %s state.\n", bgp_fsm_state_str[state]);
        return -1;
    }

    retry_at = 0;
    in_sink.drain();
    in_sink.setUse4bAsn(config.use_4b_asn);
    use_4b_asn = config.use_4b_asn;
    peer_bgp_id = 0;
    peer_asn = 0;
    peer_route_refresh = false;
    hold_timer = BGPD_FSM_OPEN_HOLD;
    keepalive_timer = 0;
    last_recv = clock->getTime();

    logger->log(DEBUG, "BgpFsm::connected: sending OPEN message to peer.\n");

    BgpOpenMessage open (logger, config.use_4b_asn, config.asn, config.hold_timer, config.router_id);

    BgpCapabilityMpBgp *mp = new BgpCapabilityMpBgp(logger);
    mp->afi = IPV4;
    mp->safi = UNICAST;
    open.addCapability(std::shared_ptr<BgpCapability>(mp));
    open.addCapability(std::shared_ptr<BgpCapability>(new BgpCapabilityRouteRefresh(logger)));

    setState(OPEN_SENT);
    if (!writeMessage(open)) return -1;
    return 1;
}

int BgpFsm::transportFailed() {
    switch (state) {
        case IDLE: return 1;
        case CONNECT:
            logger->log(WARN, "BgpFsm::transportFailed: connect failed, retry in %u seconds.\n", config.connect_retry);
            setState(ACTIVE);
            retry_at = clock->getTime() + config.connect_retry;
            return 0;
        case ACTIVE: return 1;
        default:
            logger->log(ERROR, "BgpFsm::transportFailed: transport went down in %s state.\n", bgp_fsm_state_str[state]);
            dropSession();
            return 0;
    }
}

int BgpFsm::run(const uint8_t *buffer, const size_t buffer_size) {
    if (state != OPEN_SENT && state != OPEN_CONFIRM && state != ESTABLISHED) {
        logger->log(ERROR, "BgpFsm::run: got data in %s state.\n", bgp_fsm_state_str[state]);
        return -1;
    }

    in_sink.fill(buffer, buffer_size);

    // keep running untill sink empty
    while (in_sink.getBytesInSink() > 0) {
        BgpPacket *packet = NULL;
        ssize_t poured = in_sink.pour(&packet);

        if (poured == 0) break;

        last_recv = clock->getTime();
        const BgpMessage *msg = packet->getMessage();

        // parse failed / packet invalid. errors like Unsupported Optional
        // Parameter falls in this catagory, since those errors are checked by
        // parsers. other errors like FSM error, Bad Peer AS, etc is handled in
        // fsmEval*.
        if (poured < 0) {
            if (msg != NULL && msg->type == NOTIFICATION) {
                logger->log(ERROR, "BgpFsm::run: got invalid NOTIFICATION message.\n");
                delete packet;
                dropSession();
                return 0;
            }

            logger->log(ERROR, "BgpFsm::run: got malformed message: %s: %s.\n",
                bgpErrorCodeToString(packet->getErrorCode()),
                bgpErrorSubcodeToString(packet->getErrorCode(), packet->getErrorSubCode()));

            int ret = notifyAndDrop(packet->getErrorCode(), packet->getErrorSubCode(), packet->getError(), packet->getErrorLength());
            delete packet;
            return ret;
        }

        BGPD_LOG(logger, DEBUG) {
            logger->log(DEBUG, "BgpFsm::run: got message (Current state: %s):\n", bgp_fsm_state_str[state]);
            logger->log(DEBUG, *packet);
        }

        if (msg->type == NOTIFICATION) {
            const BgpNotificationMessage *notify = dynamic_cast<const BgpNotificationMessage *>(msg);
            logger->log(ERROR, "BgpFsm::run: got NOTIFICATION: %s (%d): %s (%d).\n",
                bgpErrorCodeToString(notify->errcode), notify->errcode,
                bgpErrorSubcodeToString(notify->errcode, notify->subcode), notify->subcode);
            delete packet;
            dropSession();
            return 0;
        }

        int retval = validateState(msg->type);
        if (retval != 1) {
            delete packet;
            return retval;
        }

        switch (state) {
            case OPEN_SENT: retval = fsmEvalOpenSent(msg); break;
            case OPEN_CONFIRM: retval = fsmEvalOpenConfirm(msg); break;
            case ESTABLISHED: retval = fsmEvalEstablished(msg); break;
            default: {
                logger->log(ERROR, "BgpFsm::run: FSM in invalid state: %d.\n", state);
                retval = -1;
            }
        }

        delete packet;
        if (retval != 1) return retval;
    }

    return 1;
}

int BgpFsm::tick() {
    uint64_t now = clock->getTime();
    bool retry_expired = retry_at != 0 && now >= retry_at;

    switch (state) {
        case IDLE:
            if (started && retry_expired) {
                logger->log(INFO, "BgpFsm::tick: connect-retry timer expired, restarting.\n");
                beginConnect();
            }
            return 1;
        case CONNECT:
            if (retry_expired) {
                logger->log(INFO, "BgpFsm::tick: connection attempt timed out, retrying.\n");
                config.out_handler->close();
                beginConnect();
            }
            return 1;
        case ACTIVE:
            if (retry_expired) {
                if (config.passive) retry_at = now + config.connect_retry;
                else beginConnect();
            }
            return 1;
        default: break;
    }

    // peer hold-timer exipred?
    if (hold_timer > 0 && now >= last_recv && now - last_recv >= hold_timer) {
        logger->log(ERROR, "BgpFsm::tick: peer hold timer expired (last_recv: %lu, now: %lu, hold: %u).\n",
            (unsigned long) last_recv, (unsigned long) now, hold_timer);
        return notifyAndDrop(E_HOLD, 0, NULL, 0);
    }

    // send keepalive?
    if ((state == OPEN_CONFIRM || state == ESTABLISHED) && keepalive_timer > 0 && now >= last_sent && now - last_sent >= keepalive_timer) {
        BgpKeepaliveMessage keep (logger);
        if (!writeMessage(keep)) return -1;
    }

    return 1;
}

uint64_t BgpFsm::nextDeadline() const {
    switch (state) {
        case IDLE: return started ? retry_at : 0;
        case CONNECT:
        case ACTIVE: return retry_at;
        default: break;
    }

    uint64_t deadline = 0;

    if (hold_timer > 0) deadline = last_recv + hold_timer;

    if ((state == OPEN_CONFIRM || state == ESTABLISHED) && keepalive_timer > 0) {
        uint64_t ka = last_sent + keepalive_timer;
        if (deadline == 0 || ka < deadline) deadline = ka;
    }

    return deadline;
}

int BgpFsm::handleRibOut(const BgpRibOut &out) {
    if (state != ESTABLISHED) {
        logger->log(DEBUG, "BgpFsm::handleRibOut: not established, dropping %zu announce and %zu withdraw.\n", out.announce.size(), out.withdraw.size());
        return 0;
    }

    if (out.session_id != session_id) {
        logger->log(DEBUG, "BgpFsm::handleRibOut: dropping update for old session %lu (current: %lu).\n",
            (unsigned long) out.session_id, (unsigned long) session_id);
        return 0;
    }

    size_t sent = 0;

    if (out.withdraw.size() > 0) {
        ssize_t ret = sendWithdraw(out.withdraw);
        if (ret < 0) return -1;
        sent += ret;
    }

    // group routes with same attributes
    std::vector<std::pair<const BgpRibOutRoute*, std::vector<Prefix4>>> groups;
    std::map<std::pair<const BgpAttribSet*, bool>, size_t> group_idx;

    for (const BgpRibOutRoute &route : out.announce) {
        std::pair<const BgpAttribSet*, bool> key (route.attribs.get(), route.local);
        std::map<std::pair<const BgpAttribSet*, bool>, size_t>::const_iterator it = group_idx.find(key);

        if (it == group_idx.end()) {
            group_idx[key] = groups.size();
            groups.push_back(std::make_pair(&route, std::vector<Prefix4>()));
            groups.back().second.push_back(route.route);
        } else groups[it->second].second.push_back(route.route);
    }

    for (const std::pair<const BgpRibOutRoute*, std::vector<Prefix4>> &group : groups) {
        std::vector<std::shared_ptr<BgpPathAttrib>> attribs;
        prepareAttribs(*(group.first->attribs), group.first->local, attribs);

        ssize_t ret = sendAnnounce(attribs, group.second);
        if (ret < 0) return -1;
        sent += ret;
    }

    logger->log(DEBUG, "BgpFsm::handleRibOut: %zu announce and %zu withdraw sent in %zu updates.\n", out.announce.size(), out.withdraw.size(), sent);

    if (sent > 0 && config.rev_receiver != NULL) {
        PeerOutputEvent ev;
        ev.peer_addr = config.peer_addr;
        ev.session_id = session_id;
        ev.updates = sent;
        config.rev_receiver->handleRouteEvent(ev);
    }

    return 1;
}

void BgpFsm::prepareAttribs(const BgpAttribSet &set, bool local, std::vector<std::shared_ptr<BgpPathAttrib>> &out) const {
    bool ebgp = !ibgp;
    uint32_t self = config.local_addr != 0 ? config.local_addr : config.router_id;
    bool has_local_pref = false;

    for (const std::shared_ptr<BgpPathAttrib> &attr : set.getAttribs()) {
        switch (attr->type_code) {
            case LOCAL_PREF:
                if (ebgp) continue;
                has_local_pref = true;
                out.push_back(attr);
                break;
            case MULTI_EXIT_DISC:
                if (ebgp && !local) continue;
                out.push_back(attr);
                break;
            case NEXT_HOP:
                if (ebgp || config.next_hop_self) out.push_back(std::shared_ptr<BgpPathAttrib>(new BgpPathAttribNexthop(logger, self)));
                else out.push_back(attr);
                break;
            case AS_PATH: {
                std::shared_ptr<BgpPathAttrib> copy (attr->clone());
                BgpPathAttribAsPath &path = dynamic_cast<BgpPathAttribAsPath &>(*copy);
                path.is_4b = use_4b_asn;
                if (ebgp) path.prepend(config.asn);
                out.push_back(copy);
                break;
            }
            case AGGREGATOR: {
                std::shared_ptr<BgpPathAttrib> copy (attr->clone());
                dynamic_cast<BgpPathAttribAggregator &>(*copy).is_4b = use_4b_asn;
                out.push_back(copy);
                break;
            }
            case ORIGIN:
            case ATOMIC_AGGREGATE:
            case COMMUNITY:
                out.push_back(attr);
                break;
            default: {
                if (!attr->transitive) {
                    logger->log(DEBUG, "BgpFsm::prepareAttribs: dropping non-transitive attribute %u.\n", attr->type_code);
                    continue;
                }

                std::shared_ptr<BgpPathAttrib> copy (attr->clone());
                copy->partial = true;
                out.push_back(copy);
            }
        }
    }

    if (ibgp && !has_local_pref) {
        out.push_back(std::shared_ptr<BgpPathAttrib>(new BgpPathAttribLocalPref(logger, 100)));
        std::stable_sort(out.begin(), out.end(), [](const std::shared_ptr<BgpPathAttrib> &a, const std::shared_ptr<BgpPathAttrib> &b) {
            return a->type_code < b->type_code;
        });
    }
}

ssize_t BgpFsm::sendAnnounce(const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs, const std::vector<Prefix4> &routes) {
    size_t base_len = BGPD_HEADER_LEN + 4;
    for (const std::shared_ptr<BgpPathAttrib> &attr : attribs) base_len += attr->length();

    // one /32 takes 5 bytes.
    if (base_len + 5 > BGPD_MAX_MSG_LEN) {
        logger->log(ERROR, "BgpFsm::sendAnnounce: path attributes too large (%zu bytes), %zu routes not sent.\n", base_len, routes.size());
        return 0;
    }

    size_t sent = 0;
    size_t i = 0;

    while (i < routes.size()) {
        BgpUpdateMessage update (logger, use_4b_asn);
        update.setAttribs(attribs);

        size_t msg_len = base_len;
        while (i < routes.size() && msg_len + routes[i].wireLength() <= BGPD_MAX_MSG_LEN) {
            msg_len += routes[i].wireLength();
            update.nlri.push_back(routes[i]);
            i++;
        }

        if (!writeMessage(update)) return -1;
        sent++;
    }

    return sent;
}

ssize_t BgpFsm::sendWithdraw(const std::vector<Prefix4> &routes) {
    size_t sent = 0;
    size_t i = 0;

    while (i < routes.size()) {
        BgpUpdateMessage update (logger, use_4b_asn);

        size_t msg_len = BGPD_HEADER_LEN + 4;
        while (i < routes.size() && msg_len + routes[i].wireLength() <= BGPD_MAX_MSG_LEN) {
            msg_len += routes[i].wireLength();
            update.withdrawn_routes.push_back(routes[i]);
            i++;
        }

        if (!writeMessage(update)) return -1;
        sent++;
    }

    return sent;
}

int BgpFsm::openRecv(const BgpOpenMessage *open_msg) {
    if (open_msg->version != 4) {
        logger->log(ERROR, "BgpFsm::openRecv: unsupported version %d.\n", open_msg->version);
        uint8_t supported[2] = { 0, 4 };
        return notifyAndDrop(E_OPEN, E_VERSION, supported, 2);
    }

    uint32_t open_asn = open_msg->getAsn();

    if (config.peer_asn != 0 && open_asn != config.peer_asn) {
        logger->log(ERROR, "BgpFsm::openRecv: peer AS %u does not match configured AS %u.\n", open_asn, config.peer_asn);
        return notifyAndDrop(E_OPEN, E_PEER_AS, NULL, 0);
    }

    if (open_msg->bgp_id == 0 || open_msg->bgp_id == config.router_id) {
        logger->log(ERROR, "BgpFsm::openRecv: peer BGP ID (%s) invalid.\n", ipToString(open_msg->bgp_id).c_str());
        return notifyAndDrop(E_OPEN, E_BGP_ID, NULL, 0);
    }

    // if hold timer != 0 but < 3, reject witl E_HOLD_TIME (as per rfc4271)
    if (open_msg->hold_time < 3 && open_msg->hold_time != 0) {
        logger->log(ERROR, "BgpFsm::openRecv: invalid hold timer %d.\n", open_msg->hold_time);
        return notifyAndDrop(E_OPEN, E_HOLD_TIME, NULL, 0);
    }

    peer_asn = open_asn;
    ibgp = config.asn == peer_asn;
    peer_bgp_id = open_msg->bgp_id;
    hold_timer = config.hold_timer > open_msg->hold_time ? open_msg->hold_time : config.hold_timer;

    if (hold_timer == 0) keepalive_timer = 0;
    else {
        uint16_t max_ka = hold_timer / 3;
        keepalive_timer = config.keepalive_interval != 0 ? config.keepalive_interval : max_ka;
        if (keepalive_timer > max_ka) keepalive_timer = max_ka;
        if (keepalive_timer < 1) keepalive_timer = 1;
    }

    use_4b_asn = open_msg->hasCapability(ASN_4B) && config.use_4b_asn;
    peer_route_refresh = open_msg->hasCapability(ROUTE_REFRESH);
    in_sink.setUse4bAsn(use_4b_asn);

    logger->log(INFO, "BgpFsm::openRecv: peer AS%u, BGP ID %s, hold timer %u, keepalive %u, %s%s.\n",
        peer_asn, ipToString(peer_bgp_id).c_str(), hold_timer, keepalive_timer,
        use_4b_asn ? "4b-asn" : "2b-asn", peer_route_refresh ? ", route-refresh" : "");

    return 1;
}

int BgpFsm::validateState(uint8_t type) {
    switch(state) {
        case OPEN_SENT:
            if (type != OPEN) {
                logger->log(ERROR, "BgpFsm::validateState: got non-OPEN message in OPEN_SENT state.\n");
                return notifyAndDrop(E_FSM, E_OPEN_SENT, NULL, 0);
            }
            return 1;
        case OPEN_CONFIRM:
            if (type != KEEPALIVE) {
                logger->log(ERROR, "BgpFsm::validateState: got non-KEEPALIVE message in OPEN_CONFIRM state.\n");
                return notifyAndDrop(E_FSM, E_OPEN_CONFIRM, NULL, 0);
            }
            return 1;
        case ESTABLISHED:
            if (type != UPDATE && type != KEEPALIVE && type != ROUTE_REFRESH_MSG) {
                logger->log(ERROR, "BgpFsm::validateState: got invalid message (type %d) in ESTABLISHED state.\n", type);
                return notifyAndDrop(E_FSM, E_ESTABLISHED, NULL, 0);
            }
            return 1;
        default:
            logger->log(ERROR, "BgpFsm::validateState: got message in bad state.\n");
            return -1;
    }
}

int BgpFsm::fsmEvalOpenSent(const BgpMessage *msg) {
    const BgpOpenMessage *open_msg = dynamic_cast<const BgpOpenMessage *>(msg);

    int retval = openRecv(open_msg);
    if (retval != 1) return retval;

    BgpKeepaliveMessage keep (logger);
    setState(OPEN_CONFIRM);
    if (!writeMessage(keep)) return -1;

    return 1;
}

int BgpFsm::fsmEvalOpenConfirm(__attribute__((unused)) const BgpMessage *msg) {
    setState(ESTABLISHED);
    return 1;
}

int BgpFsm::fsmEvalEstablished(const BgpMessage *msg) {
    if (msg->type == KEEPALIVE) return 1;

    if (msg->type == ROUTE_REFRESH_MSG) {
        const BgpRouteRefreshMessage *rr = dynamic_cast<const BgpRouteRefreshMessage *>(msg);

        if (rr->afi != IPV4 || rr->safi != UNICAST) {
            logger->log(WARN, "BgpFsm::fsmEvalEstablished: ignoring ROUTE-REFRESH for afi %u safi %u.\n", rr->afi, rr->safi);
            return 1;
        }

        logger->log(INFO, "BgpFsm::fsmEvalEstablished: peer requested route refresh.\n");

        if (config.rev_receiver != NULL) {
            PeerRefreshEvent ev;
            ev.peer_addr = config.peer_addr;
            ev.session_id = session_id;
            config.rev_receiver->handleRouteEvent(ev);
        }

        return 1;
    }

    const BgpUpdateMessage *update = dynamic_cast<const BgpUpdateMessage *>(msg);

    PeerUpdateEvent ev;
    ev.peer_addr = config.peer_addr;
    ev.session_id = session_id;
    ev.withdrawn = update->withdrawn_routes;

    if (update->nlri.size() > 0) {
        bool ignore_routes = false;

        if (update->hasAttrib(AS_PATH)) {
            const BgpPathAttribAsPath &as_path = dynamic_cast<const BgpPathAttribAsPath &>(update->getAttrib(AS_PATH));
            size_t local_count = as_path.countAsn(config.asn);

            if (local_count > (size_t) config.allow_local_as) {
                logger->log(WARN, "BgpFsm::fsmEvalEstablished: ignoring %zu routes with %zu local asn in as_path (max %d are allowed).\n",
                    update->nlri.size(), local_count, config.allow_local_as);
                ignore_routes = true;
            }
        }

        // a looped route replaces nothing: withdraw what the peer sent before.
        if (ignore_routes) ev.withdrawn.insert(ev.withdrawn.end(), update->nlri.begin(), update->nlri.end());
        else {
            ev.attribs = update->path_attribute;
            ev.nlri = update->nlri;
        }
    }

    logger->log(DEBUG, "BgpFsm::fsmEvalEstablished: update with %zu withdrawn and %zu nlri.\n", ev.withdrawn.size(), ev.nlri.size());

    if (config.rev_receiver != NULL) config.rev_receiver->handleRouteEvent(ev);

    return 1;
}

int BgpFsm::notifyAndDrop(uint8_t errcode, uint8_t subcode, const uint8_t *data, size_t data_len) {
    BgpNotificationMessage notify (logger, errcode, subcode, data, data_len);
    if (!writeMessage(notify)) return -1;
    dropSession();
    return 2;
}

void BgpFsm::dropSession() {
    config.out_handler->close();
    in_sink.drain();
    hold_timer = 0;
    keepalive_timer = 0;
    setState(IDLE);
    retry_at = started ? clock->getTime() + config.connect_retry : 0;
}

void BgpFsm::setState(BgpState new_state) {
    if (state == new_state) return;

    BgpState old_state = state;

    if (new_state == ESTABLISHED) session_id++;

    config.out_handler->notifyStateChange(old_state, new_state);

    logger->log(INFO, "BgpFsm::setState: changing state: %s -> %s\n", bgp_fsm_state_str[old_state], bgp_fsm_state_str[new_state]);

    if (old_state == ESTABLISHED) {
        logger->log(INFO, "BgpFsm::setState: session ended, routes from peer will be dropped.\n");
    }

    state = new_state;
    emitState(old_state, new_state);
}

void BgpFsm::emitState(BgpState old_state, BgpState new_state) {
    if (config.rev_receiver == NULL) return;

    PeerStateEvent ev;
    ev.peer_addr = config.peer_addr;
    ev.session_id = session_id;
    ev.old_state = old_state;
    ev.new_state = new_state;
    ev.peer_asn = peer_asn;
    ev.peer_bgp_id = peer_bgp_id;
    config.rev_receiver->handleRouteEvent(ev);
}

bool BgpFsm::writeMessage(const BgpMessage &msg) {
    BgpPacket pkt(logger, use_4b_asn, &msg);
    BGPD_LOG(logger, DEBUG) {
        logger->log(DEBUG, "BgpFsm::writeMessage: write (Current state: %s):\n", bgp_fsm_state_str[state]);
        logger->log(DEBUG, pkt);
    }

    ssize_t pkt_len = pkt.write(out_buffer, BGPD_FSM_BUFFER_SIZE);

    if (pkt_len < 0) {
        logger->log(ERROR, "BgpFsm::writeMessage: failed to write message, abort.\n");
        dropSession();
        return false;
    }

    last_sent = clock->getTime();

    if (!config.out_handler->handleOut(out_buffer, pkt_len)) {
        logger->log(ERROR, "BgpFsm::writeMessage: out_handler failed, abort.\n");
        dropSession();
        return false;
    }

    return true;
}

}
