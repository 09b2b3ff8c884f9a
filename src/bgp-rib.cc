/**
 * @file bgp-rib.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP Routing Information Base.
 * @version 0.3
 * @date 2019-08-06
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-rib.h"
#include <arpa/inet.h>

namespace bgpd {

BgpRibEntry::BgpRibEntry() {
    src_addr = 0;
    src_router_id = 0;
    src = SRC_EBGP;
    src_rr_client = false;
    update_id = 0;
}

BgpLocalRoute::BgpLocalRoute() {
    next_hop = 0;
    has_local_pref = false;
    local_pref = 100;
    has_med = false;
    med = 0;
}

static uint32_t zeroIgpCost(uint32_t) {
    return 0;
}

/**
 * @brief Construct a new BgpRib object
 *
 * @param logger Pointer to logger object for error logging.
 * @param config RIB settings.
 */
BgpRib::BgpRib(BgpLogHandler *logger, const BgpRibConfig &config) : arena(logger) {
    this->logger = logger;
    this->config = config;
    igp_cost = zeroIgpCost;
    update_id = 0;
}

void BgpRib::setIgpCostResolver(const igp_cost_resolver_t &resolver) {
    igp_cost = resolver ? resolver : igp_cost_resolver_t(zeroIgpCost);
}

bool BgpRib::addPeer(uint32_t addr, uint32_t asn, bool rr_client) {
    if (addr == 0 || peers.count(addr) > 0) {
        logger->log(ERROR, "BgpRib::addPeer: peer %s already exists or invalid.\n", ipToString(addr).c_str());
        return false;
    }

    BgpRibPeer &peer = peers[addr];
    peer.addr = addr;
    peer.asn = asn;
    peer.router_id = 0;
    peer.ibgp = asn == config.local_asn;
    peer.rr_client = rr_client;
    peer.up = false;
    peer.session_id = 0;

    return true;
}

bool BgpRib::removePeer(uint32_t addr, std::vector<BgpRibOut> &out) {
    std::map<uint32_t, BgpRibPeer>::iterator it = peers.find(addr);
    if (it == peers.end()) return false;

    std::vector<Prefix4> affected;
    for (const auto &entry : it->second.rib_in) affected.push_back(entry.first);

    peers.erase(it);

    rib_out_batch_t batch;
    for (const Prefix4 &route : affected) decide(route, batch);
    flush(batch, out);

    logger->log(INFO, "BgpRib::removePeer: removed peer %s, %zu routes withdrawn.\n", ipToString(addr).c_str(), affected.size());

    return true;
}

/**
 * @brief Mark a peer as established and compute its initial Adj-RIB-Out.
 *
 * @param addr Peer address.
 * @param router_id BGP ID of the peer.
 * @param session_id Session ID, copied into every instruction for this peer.
 * @param out Instructions output.
 * @return true Peer marked up.
 * @return false No such peer.
 */
bool BgpRib::peerUp(uint32_t addr, uint32_t router_id, uint64_t session_id, std::vector<BgpRibOut> &out) {
    std::map<uint32_t, BgpRibPeer>::iterator it = peers.find(addr);
    if (it == peers.end()) return false;

    BgpRibPeer &peer = it->second;

    if (peer.up) {
        logger->log(WARN, "BgpRib::peerUp: peer %s is already up, resetting.\n", ipToString(addr).c_str());
        std::vector<BgpRibOut> discard;
        peerDown(addr, discard);
        out.insert(out.end(), discard.begin(), discard.end());
    }

    peer.up = true;
    peer.router_id = router_id;
    peer.session_id = session_id;
    peer.rib_in.clear();
    peer.rib_out.clear();

    rib_out_batch_t batch;
    for (const auto &entry : loc_rib) syncPeer(peer, entry.first, &entry.second, batch);
    flush(batch, out);

    return true;
}

/**
 * @brief Mark a peer as down and withdraw everything learned from it.
 *
 * @param addr Peer address.
 * @param out Instructions output.
 * @return true Peer marked down.
 * @return false No such peer.
 */
bool BgpRib::peerDown(uint32_t addr, std::vector<BgpRibOut> &out) {
    std::map<uint32_t, BgpRibPeer>::iterator it = peers.find(addr);
    if (it == peers.end()) return false;

    BgpRibPeer &peer = it->second;

    std::vector<Prefix4> affected;
    for (const auto &entry : peer.rib_in) affected.push_back(entry.first);

    peer.up = false;
    peer.rib_in.clear();
    peer.rib_out.clear();

    rib_out_batch_t batch;
    for (const Prefix4 &route : affected) decide(route, batch);
    flush(batch, out);

    logger->log(INFO, "BgpRib::peerDown: peer %s down, %zu routes withdrawn.\n", ipToString(addr).c_str(), affected.size());

    return true;
}

const char* BgpRib::validate(const BgpAttribSet &attribs) const {
    if (!attribs.hasAttrib(ORIGIN)) return "missing ORIGIN";
    if (!attribs.hasAttrib(AS_PATH)) return "missing AS_PATH";
    if (!attribs.hasAttrib(NEXT_HOP)) return "missing NEXT_HOP";
    if (attribs.next_hop == 0) return "next hop is 0.0.0.0";
    return NULL;
}

/**
 * @brief Apply an UPDATE from a peer.
 *
 * Routes failing validation are rejected. A rejected route withdraws the
 * previous route of the same prefix from that peer.
 *
 * @param addr Peer address.
 * @param withdrawn Withdrawn routes.
 * @param attribs Path attributes of the nlri.
 * @param nlri Announced routes.
 * @param out Instructions output.
 * @return BgpRibUpdateResult Accepted, rejected and withdrawn counts.
 */
BgpRibUpdateResult BgpRib::update(uint32_t addr, const std::vector<Prefix4> &withdrawn,
    const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs,
    const std::vector<Prefix4> &nlri, std::vector<BgpRibOut> &out) {
    BgpRibUpdateResult result;

    std::map<uint32_t, BgpRibPeer>::iterator it = peers.find(addr);
    if (it == peers.end() || !it->second.up) {
        logger->log(ERROR, "BgpRib::update: update from unknown or down peer %s ignored.\n", ipToString(addr).c_str());
        return result;
    }

    BgpRibPeer &peer = it->second;
    rib_out_batch_t batch;

    for (const Prefix4 &route : withdrawn) {
        if (peer.rib_in.erase(route) == 0) continue;
        result.withdrawn++;
        decide(route, batch);
    }

    if (nlri.size() > 0) {
        std::vector<std::shared_ptr<BgpPathAttrib>> filtered;
        for (const std::shared_ptr<BgpPathAttrib> &attr : attribs) {
            // LOCAL_PREF only has meaning inside the AS.
            if (!peer.ibgp && attr->type_code == LOCAL_PREF) continue;
            filtered.push_back(attr);
        }

        std::shared_ptr<const BgpAttribSet> set = arena.intern(filtered);
        const char *reason = validate(*set);
        uint64_t this_update = ++update_id;

        for (const Prefix4 &route : nlri) {
            if (reason != NULL) {
                logger->log(WARN, "BgpRib::update: rejected %s from %s: %s.\n", route.toString().c_str(), ipToString(addr).c_str(), reason);
                result.rejected++;
                if (peer.rib_in.erase(route) > 0) decide(route, batch);
                continue;
            }

            BgpRibEntry entry;
            entry.route = route;
            entry.attribs = set;
            entry.src_addr = addr;
            entry.src_router_id = peer.router_id;
            entry.src = peer.ibgp ? SRC_IBGP : SRC_EBGP;
            entry.src_rr_client = peer.rr_client;
            entry.update_id = this_update;

            peer.rib_in[route] = entry;
            result.accepted++;
            decide(route, batch);
        }
    }

    flush(batch, out);

    return result;
}

void BgpRib::insertLocal(const BgpLocalRoute &route, std::vector<BgpRibOut> &out) {
    std::vector<std::shared_ptr<BgpPathAttrib>> attribs;

    attribs.push_back(std::make_shared<BgpPathAttribOrigin>(logger, IGP));
    attribs.push_back(std::make_shared<BgpPathAttribAsPath>(logger, true));
    attribs.push_back(std::make_shared<BgpPathAttribNexthop>(logger, route.next_hop == 0 ? config.router_id : route.next_hop));
    if (route.has_med) attribs.push_back(std::make_shared<BgpPathAttribMed>(logger, route.med));
    if (route.has_local_pref) attribs.push_back(std::make_shared<BgpPathAttribLocalPref>(logger, route.local_pref));

    BgpRibEntry entry;
    entry.route = route.route;
    entry.attribs = arena.intern(attribs);
    entry.src_addr = 0;
    entry.src_router_id = config.router_id;
    entry.src = SRC_LOCAL;
    entry.update_id = ++update_id;

    local_routes[route.route] = entry;

    rib_out_batch_t batch;
    decide(route.route, batch);
    flush(batch, out);
}

bool BgpRib::withdrawLocal(const Prefix4 &route, std::vector<BgpRibOut> &out) {
    if (local_routes.erase(route) == 0) return false;

    rib_out_batch_t batch;
    decide(route, batch);
    flush(batch, out);

    return true;
}

bool BgpRib::refresh(uint32_t addr, std::vector<BgpRibOut> &out) {
    std::map<uint32_t, BgpRibPeer>::iterator it = peers.find(addr);
    if (it == peers.end() || !it->second.up) return false;

    const BgpRibPeer &peer = it->second;

    BgpRibOut rib_out;
    rib_out.peer_addr = addr;
    rib_out.session_id = peer.session_id;
    for (const auto &entry : peer.rib_out) rib_out.announce.push_back(entry.second);

    if (rib_out.announce.size() > 0) out.push_back(rib_out);

    return true;
}

const BgpRibEntry* BgpRib::lookup(uint32_t dest) const {
    for (int len = 32; len >= 0; len--) {
        std::map<Prefix4, BgpRibEntry>::const_iterator it = loc_rib.find(Prefix4(dest, len));
        if (it != loc_rib.end()) return &(it->second);
    }

    return NULL;
}

void BgpRib::collect(const Prefix4 &route, std::vector<const BgpRibEntry*> &candidates) const {
    std::map<Prefix4, BgpRibEntry>::const_iterator local = local_routes.find(route);
    if (local != local_routes.end()) candidates.push_back(&(local->second));

    for (const auto &peer : peers) {
        std::map<Prefix4, BgpRibEntry>::const_iterator it = peer.second.rib_in.find(route);
        if (it != peer.second.rib_in.end()) candidates.push_back(&(it->second));
    }
}

/**
 * @brief Pick the best entry.
 *
 * Candidates are always visited in the same order (local route first, then by
 * peer address), so the result does not depend on the arrival order even when
 * MED makes the ranking non-transitive.
 */
const BgpRibEntry* BgpRib::selectBest(const std::vector<const BgpRibEntry*> &candidates) const {
    const BgpRibEntry *best = NULL;

    for (const BgpRibEntry *candidate : candidates) {
        if (best == NULL || isBetter(*candidate, *best)) best = candidate;
    }

    return best;
}

std::vector<BgpRibEntry> BgpRib::getCandidates(const Prefix4 &route) const {
    std::vector<const BgpRibEntry*> left;
    collect(route, left);

    std::vector<BgpRibEntry> ranked;

    while (left.size() > 0) {
        const BgpRibEntry *best = selectBest(left);
        ranked.push_back(*best);
        for (std::vector<const BgpRibEntry*>::iterator it = left.begin(); it != left.end(); it++) {
            if (*it == best) {
                left.erase(it);
                break;
            }
        }
    }

    return ranked;
}

bool BgpRib::isBetter(const BgpRibEntry &a, const BgpRibEntry &b) const {
    const BgpAttribSet &x = *a.attribs;
    const BgpAttribSet &y = *b.attribs;

    if (x.local_pref != y.local_pref) return x.local_pref > y.local_pref;
    if (x.as_path_len != y.as_path_len) return x.as_path_len < y.as_path_len;
    if (x.origin != y.origin) return x.origin < y.origin;

    if ((config.always_compare_med || x.neighbor_asn == y.neighbor_asn) && x.med != y.med) {
        return x.med < y.med;
    }

    bool a_ibgp = a.src == SRC_IBGP;
    bool b_ibgp = b.src == SRC_IBGP;
    if (a_ibgp != b_ibgp) return !a_ibgp;

    uint32_t a_cost = igp_cost(x.next_hop);
    uint32_t b_cost = igp_cost(y.next_hop);
    if (a_cost != b_cost) return a_cost < b_cost;

    if (a.src_router_id != b.src_router_id) return ntohl(a.src_router_id) < ntohl(b.src_router_id);

    return ntohl(a.src_addr) < ntohl(b.src_addr);
}

bool BgpRib::canExport(const BgpRibEntry &entry, const BgpRibPeer &peer) const {
    if (entry.src_addr == peer.addr) return false;

    if (entry.src == SRC_IBGP && peer.ibgp) {
        return entry.src_rr_client || peer.rr_client;
    }

    return true;
}

void BgpRib::decide(const Prefix4 &route, rib_out_batch_t &batch) {
    std::vector<const BgpRibEntry*> candidates;
    collect(route, candidates);

    const BgpRibEntry *best = selectBest(candidates);

    if (best == NULL) loc_rib.erase(route);
    else loc_rib[route] = *best;

    for (auto &peer : peers) {
        if (!peer.second.up) continue;
        syncPeer(peer.second, route, best, batch);
    }
}

void BgpRib::syncPeer(BgpRibPeer &peer, const Prefix4 &route, const BgpRibEntry *best, rib_out_batch_t &batch) {
    std::map<Prefix4, BgpRibOutRoute>::iterator cur = peer.rib_out.find(route);

    if (best != NULL && canExport(*best, peer)) {
        bool local = best->src == SRC_LOCAL;

        if (cur != peer.rib_out.end() && cur->second.attribs == best->attribs && cur->second.local == local) return;

        BgpRibOutRoute out_route;
        out_route.route = route;
        out_route.attribs = best->attribs;
        out_route.local = local;

        peer.rib_out[route] = out_route;

        PendingOut &pending = batch[peer.addr];
        pending.withdraw.erase(route);
        pending.announce[route] = out_route;
        return;
    }

    if (cur == peer.rib_out.end()) return;

    peer.rib_out.erase(cur);

    PendingOut &pending = batch[peer.addr];
    pending.announce.erase(route);
    pending.withdraw.insert(route);
}

void BgpRib::flush(rib_out_batch_t &batch, std::vector<BgpRibOut> &out) {
    for (auto &pending : batch) {
        std::map<uint32_t, BgpRibPeer>::const_iterator peer = peers.find(pending.first);
        if (peer == peers.end() || !peer->second.up) continue;
        if (pending.second.announce.size() == 0 && pending.second.withdraw.size() == 0) continue;

        BgpRibOut rib_out;
        rib_out.peer_addr = pending.first;
        rib_out.session_id = peer->second.session_id;
        for (const auto &route : pending.second.announce) rib_out.announce.push_back(route.second);
        rib_out.withdraw.assign(pending.second.withdraw.begin(), pending.second.withdraw.end());

        out.push_back(rib_out);
    }

    batch.clear();
}

const std::map<Prefix4, BgpRibEntry>& BgpRib::getLocRib() const {
    return loc_rib;
}

const std::map<Prefix4, BgpRibEntry>& BgpRib::getLocalRoutes() const {
    return local_routes;
}

const BgpRibPeer* BgpRib::getPeer(uint32_t addr) const {
    std::map<uint32_t, BgpRibPeer>::const_iterator it = peers.find(addr);
    if (it == peers.end()) return NULL;
    return &(it->second);
}

const std::map<uint32_t, BgpRibPeer>& BgpRib::getPeers() const {
    return peers;
}

size_t BgpRib::getArenaSize() {
    return arena.size();
}

}
