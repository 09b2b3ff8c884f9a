/**
 * @file bgp-rib.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP Routing Information Base.
 * @version 0.3
 * @date 2019-08-06
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_RIB_H_
#define BGPD_RIB_H_
#include <stdint.h>
#include <map>
#include <set>
#include <memory>
#include <vector>
#include <functional>
#include "prefix4.h"
#include "bgp-attrib-set.h"
#include "bgp-log-handler.h"

namespace bgpd {

/**
 * @brief Source of the RIB entry.
 *
 */
enum BgpRouteSource {
    SRC_EBGP = 0,
    SRC_IBGP = 1,
    SRC_LOCAL = 2
};

/**
 * @brief The BgpRibEntry class.
 *
 * A route: a prefix and the interned attribute set, plus who contributed it.
 */
class BgpRibEntry {
public:
    BgpRibEntry();

    /**
     * @brief The prefix of this entry.
     *
     */
    Prefix4 route;

    /**
     * @brief Path attributes for this entry. Shared with every other entry
     * with the same attributes.
     *
     */
    std::shared_ptr<const BgpAttribSet> attribs;

    /**
     * @brief Address of the peer this entry was learned from, in network
     * bytes order. 0 for locally originated routes.
     *
     */
    uint32_t src_addr;

    /**
     * @brief The originating BGP speaker's ID of this entry. (network bytes order)
     *
     */
    uint32_t src_router_id;

    BgpRouteSource src;

    // the source peer is a route reflector client.
    bool src_rr_client;

    /**
     * @brief The update ID.
     *
     * Entries with same update ID are received from the same update message.
     * Only used for diagnostics, never in the decision process.
     *
     */
    uint64_t update_id;
};

/**
 * @brief A route in Adj-RIB-Out, or a route to send to a peer.
 */
class BgpRibOutRoute {
public:
    Prefix4 route;
    std::shared_ptr<const BgpAttribSet> attribs;

    // the route was originated by us. (MED is kept on eBGP export)
    bool local;
};

/**
 * @brief Announce and withdraw instructions for one peer.
 *
 * Computed for the session session_id. The FSM drops it if the session has
 * been replaced since.
 */
class BgpRibOut {
public:
    uint32_t peer_addr;
    uint64_t session_id;
    std::vector<BgpRibOutRoute> announce;
    std::vector<Prefix4> withdraw;
};

/**
 * @brief A route originated by the speaker.
 */
class BgpLocalRoute {
public:
    BgpLocalRoute();

    Prefix4 route;

    // network bytes order, 0 to use the router id.
    uint32_t next_hop;

    bool has_local_pref;
    uint32_t local_pref;

    bool has_med;
    uint32_t med;
};

/**
 * @brief Peer as seen by the RIB.
 */
class BgpRibPeer {
public:
    uint32_t addr;
    uint32_t asn;
    uint32_t router_id;
    bool ibgp;
    bool rr_client;

    // session established. only established peers get routes.
    bool up;
    uint64_t session_id;

    std::map<Prefix4, BgpRibEntry> rib_in;
    std::map<Prefix4, BgpRibOutRoute> rib_out;
};

/**
 * @brief Result of an update from a peer.
 */
class BgpRibUpdateResult {
public:
    BgpRibUpdateResult() : accepted(0), rejected(0), withdrawn(0) {}

    size_t accepted;
    size_t rejected;
    size_t withdrawn;
};

/**
 * @brief RIB settings.
 */
class BgpRibConfig {
public:
    BgpRibConfig() : local_asn(0), router_id(0), always_compare_med(false) {}

    uint32_t local_asn;

    // network bytes order
    uint32_t router_id;

    // compare MED between routes from different neighbor AS.
    bool always_compare_med;
};

/**
 * @brief IGP cost to a nexthop (network bytes order). The default resolver
 * returns 0 for everything.
 */
typedef std::function<uint32_t(uint32_t nexthop)> igp_cost_resolver_t;

/**
 * @brief The BgpRib class.
 *
 * Holds Adj-RIB-In and Adj-RIB-Out of every peer, the local routes and the
 * Loc-RIB. Every mutating call re-runs the decision process for the prefixes
 * it touches and appends the resulting per-peer instructions to out. The
 * Adj-RIB-Out of a peer is updated before the instruction is returned.
 *
 * BgpRib is not thread safe. It is meant to be owned by one thread (the
 * BgpServer loop).
 */
class BgpRib {
public:
    BgpRib(BgpLogHandler *logger, const BgpRibConfig &config);

    void setIgpCostResolver(const igp_cost_resolver_t &resolver);

    // register a peer. returns false if the address is taken.
    bool addPeer(uint32_t addr, uint32_t asn, bool rr_client);

    // drop a peer and everything it contributed.
    bool removePeer(uint32_t addr, std::vector<BgpRibOut> &out);

    // session established: compute the initial Adj-RIB-Out of the peer.
    bool peerUp(uint32_t addr, uint32_t router_id, uint64_t session_id, std::vector<BgpRibOut> &out);

    // session ended: implicit withdrawal of all routes from the peer.
    bool peerDown(uint32_t addr, std::vector<BgpRibOut> &out);

    // apply an UPDATE from a peer. withdrawn routes are processed first.
    BgpRibUpdateResult update(uint32_t addr, const std::vector<Prefix4> &withdrawn,
        const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs,
        const std::vector<Prefix4> &nlri, std::vector<BgpRibOut> &out);

    // originate a route. replaces the local route of same prefix.
    void insertLocal(const BgpLocalRoute &route, std::vector<BgpRibOut> &out);

    // returns false if there is no such local route.
    bool withdrawLocal(const Prefix4 &route, std::vector<BgpRibOut> &out);

    // re-send current Adj-RIB-Out of a peer (ROUTE-REFRESH).
    bool refresh(uint32_t addr, std::vector<BgpRibOut> &out);

    // longest prefix match in Loc-RIB, NULL if not found.
    const BgpRibEntry* lookup(uint32_t dest) const;

    // all contributors of a prefix, best first.
    std::vector<BgpRibEntry> getCandidates(const Prefix4 &route) const;

    const std::map<Prefix4, BgpRibEntry>& getLocRib() const;
    const std::map<Prefix4, BgpRibEntry>& getLocalRoutes() const;

    // NULL if not found.
    const BgpRibPeer* getPeer(uint32_t addr) const;
    const std::map<uint32_t, BgpRibPeer>& getPeers() const;

    // true if a ranks above b.
    bool isBetter(const BgpRibEntry &a, const BgpRibEntry &b) const;

    size_t getArenaSize();

private:
    // pending instructions of one peer. an announce cancels a pending
    // withdraw of the same prefix and the other way around.
    struct PendingOut {
        std::map<Prefix4, BgpRibOutRoute> announce;
        std::set<Prefix4> withdraw;
    };

    // collects instructions of one operation, per peer.
    typedef std::map<uint32_t, PendingOut> rib_out_batch_t;

    void decide(const Prefix4 &route, rib_out_batch_t &batch);
    void syncPeer(BgpRibPeer &peer, const Prefix4 &route, const BgpRibEntry *best, rib_out_batch_t &batch);
    bool canExport(const BgpRibEntry &entry, const BgpRibPeer &peer) const;
    void collect(const Prefix4 &route, std::vector<const BgpRibEntry*> &candidates) const;
    const BgpRibEntry* selectBest(const std::vector<const BgpRibEntry*> &candidates) const;
    void flush(rib_out_batch_t &batch, std::vector<BgpRibOut> &out);

    // returns NULL on success, reason otherwise.
    const char* validate(const BgpAttribSet &attribs) const;

    BgpLogHandler *logger;
    BgpRibConfig config;
    BgpAttribArena arena;
    igp_cost_resolver_t igp_cost;

    std::map<uint32_t, BgpRibPeer> peers;
    std::map<Prefix4, BgpRibEntry> local_routes;
    std::map<Prefix4, BgpRibEntry> loc_rib;
    uint64_t update_id;
};

}

#endif // BGPD_RIB_H_
