/**
 * @file route-event-receiver.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Route event receiver.
 * @version 0.3
 * @date 2019-08-07
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_ROUTE_EV_RECV_H_
#define BGPD_ROUTE_EV_RECV_H_
#include "route-event.h"

namespace bgpd {

/**
 * @brief The RouteEventReceiver interface.
 * 
 * Every BgpFsm reports state changes, received routes and refresh requests to
 * a RouteEventReceiver. In bgpd the receiver is the BgpServer, which queues
 * the event and applies it to the RIB on its own thread.
 * 
 * handleRouteEvent() is called from the FSM's thread. Implementations must
 * copy what they need before returning.
 */
class RouteEventReceiver {
public:
    virtual ~RouteEventReceiver() {};

    /**
     * @brief Handle the route event.
     * 
     * @param ev The event.
     * @return true Event handled.
     * @return false Event not handled.
     */
    virtual bool handleRouteEvent(const RouteEvent &ev) = 0;
};

}

#endif // BGPD_ROUTE_EV_RECV_H_
