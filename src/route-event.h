/**
 * @file route-event.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Events sent from the peer FSMs to the server.
 * @version 0.3
 * @date 2019-08-07
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_ROUTE_EV_H_
#define BGPD_ROUTE_EV_H_
#include <stdint.h>
#include <memory>
#include <vector>
#include "prefix4.h"
#include "bgp-path-attrib.h"

namespace bgpd {

/**
 * @brief Type of route events.
 * 
 */
enum RouteEventType {
    PEER_STATE,
    PEER_UPDATE,
    PEER_REFRESH,
    PEER_OUTPUT
};

/**
 * @brief The RouteEvent base.
 * 
 */
class RouteEvent {
public:
    RouteEvent(RouteEventType type) : type(type), peer_addr(0), session_id(0) {}
    virtual ~RouteEvent() {}

    // copy of the event, owned by the caller.
    virtual RouteEvent* clone() const = 0;

    const RouteEventType type;

    /**
     * @brief Address of the peer the event is from. (network bytes order)
     * 
     */
    uint32_t peer_addr;

    /**
     * @brief Session the event belongs to.
     * 
     */
    uint64_t session_id;
};

/**
 * @brief FSM state changed.
 * 
 */
class PeerStateEvent : public RouteEvent {
public:
    PeerStateEvent() : RouteEvent(PEER_STATE), old_state(0), new_state(0), peer_asn(0), peer_bgp_id(0) {}
    RouteEvent* clone() const { return new PeerStateEvent(*this); }

    // BgpState values.
    int old_state;
    int new_state;

    uint32_t peer_asn;

    // network bytes order
    uint32_t peer_bgp_id;
};

/**
 * @brief A well-formed UPDATE was received.
 * 
 */
class PeerUpdateEvent : public RouteEvent {
public:
    PeerUpdateEvent() : RouteEvent(PEER_UPDATE) {}
    RouteEvent* clone() const { return new PeerUpdateEvent(*this); }

    std::vector<Prefix4> withdrawn;
    std::vector<std::shared_ptr<BgpPathAttrib>> attribs;
    std::vector<Prefix4> nlri;
};

/**
 * @brief The peer asked for a ROUTE-REFRESH.
 * 
 */
class PeerRefreshEvent : public RouteEvent {
public:
    PeerRefreshEvent() : RouteEvent(PEER_REFRESH) {}
    RouteEvent* clone() const { return new PeerRefreshEvent(*this); }
};

/**
 * @brief UPDATE messages were sent to the peer.
 * 
 */
class PeerOutputEvent : public RouteEvent {
public:
    PeerOutputEvent() : RouteEvent(PEER_OUTPUT), updates(0) {}
    RouteEvent* clone() const { return new PeerOutputEvent(*this); }

    size_t updates;
};

}

#endif // BGPD_ROUTE_EV_H_
