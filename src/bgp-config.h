/**
 * @file bgp-config.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP FSM and speaker configuration objects.
 * @version 0.3
 * @date 2019-08-07
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_CONFIG_H_
#define BGPD_CONFIG_H_
#include <stdint.h>
#include <string>
#include <vector>
#include "clock.h"
#include "bgp-rib.h"
#include "bgp-out-handler.h"
#include "bgp-log-handler.h"
#include "route-event-receiver.h"

namespace bgpd {

/**
 * @brief The BGP FSM configuration object.
 *
 */
typedef struct BgpConfig {
    BgpConfig() {
        out_handler = NULL;
        log_handler = NULL;
        rev_receiver = NULL;
        clock = NULL;
        asn = 0;
        peer_asn = 0;
        router_id = 0;
        peer_addr = 0;
        local_addr = 0;
        hold_timer = 90;
        keepalive_interval = 0;
        connect_retry = 120;
        passive = false;
        use_4b_asn = true;
        next_hop_self = false;
        allow_local_as = 0;
    }

    /**
     * @brief The output handler.
     *
     * The output handler is invoked whenever BGP FSM needs to write data, open
     * or close the transport.
     * (required, no default value)
     */
    BgpOutHandler *out_handler;

    /**
     * @brief The log handler.
     *
     * The log handler is invoked whenever BGP FSM needs to log information.
     * (required, no default value)
     */
    BgpLogHandler *log_handler;

    /**
     * @brief The route event receiver.
     *
     * State changes, received routes and refresh requests are reported here.
     * Set to NULL to run the FSM without a RIB. (e.g. for testing)
     * (default: NULL)
     */
    RouteEventReceiver *rev_receiver;

    /**
     * @brief The clock to use for time-based events.
     *
     * Time-based events like hold timer expired needs to refer to the clock.
     * Tests use a ManualClock here to move time forward by hand. Set this to
     * NULL if you want to use a real-time clock.
     * (default: NULL)
     */
    Clock *clock;

    /**
     * @brief Local ASN.
     * (required, no default value)
     */
    uint32_t asn;

    /**
     * @brief Peer ASN. Set to 0 will make BGP FSM accept peer with any ASN.
     * (default: 0)
     */
    uint32_t peer_asn;

    /**
     * @brief Local BGP ID in network byte order.
     * (required, no default value)
     */
    uint32_t router_id;

    /**
     * @brief Peer address in network byte order. Used to tag route events.
     * (required, no default value)
     */
    uint32_t peer_addr;

    /**
     * @brief Local address in network byte order.
     *
     * Used as NEXT_HOP when exporting routes to EBGP peers (and IBGP peers if
     * next_hop_self is set). 0 to use router_id.
     * (default: 0)
     */
    uint32_t local_addr;

    /**
     * @brief The hold timer.
     * (default: 90)
     */
    uint16_t hold_timer;

    /**
     * @brief Keepalive interval override.
     *
     * 0 means one third of the negotiated hold timer. Any value is capped to
     * one third of the negotiated hold timer, with a minimum of 1 second.
     * (default: 0)
     */
    uint16_t keepalive_interval;

    /**
     * @brief The connect-retry timer.
     * (default: 120)
     */
    uint16_t connect_retry;

    /**
     * @brief Passive mode.
     *
     * A passive FSM never connects on its own and waits for the peer instead.
     * (default: false)
     */
    bool passive;

    /**
     * @brief Enable four octets ASN support (RFC 6793)
     *
     * Set this parameter to true will eable four octets ASN support.
     * (default: true)
     */
    bool use_4b_asn;

    /**
     * @brief Set NEXT_HOP to local_addr on IBGP export too.
     * (default: false)
     */
    bool next_hop_self;

    /**
     * @brief Allow numbers of local asn in as_path.
     * (default: 0)
     */
    int8_t allow_local_as;
} BgpConfig;

/**
 * @brief Settings of one neighbor, as read from the configuration file.
 *
 */
typedef struct BgpNeighborConfig {
    BgpNeighborConfig() {
        address = 0;
        local_address = 0;
        asn = 0;
        hold_time = 90;
        keepalive = 0;
        connect_retry = 120;
        passive = false;
        route_reflector_client = false;
        next_hop_self = false;
        port = 179;
        allow_local_as = 0;
    }

    // network byte order
    uint32_t address;

    // network byte order. source of outgoing connections and NEXT_HOP of
    // exported routes, 0 to use the router id.
    uint32_t local_address;

    uint32_t asn;
    uint16_t hold_time;

    // 0: hold_time / 3
    uint16_t keepalive;

    uint16_t connect_retry;
    bool passive;
    bool route_reflector_client;
    bool next_hop_self;
    uint16_t port;
    int8_t allow_local_as;
} BgpNeighborConfig;

/**
 * @brief The speaker configuration object.
 *
 */
typedef struct BgpServerConfig {
    BgpServerConfig() {
        asn = 0;
        router_id = 0;
        listen_address = 0;
        listen_port = 179;
        hold_time = 90;
        connect_retry = 120;
        always_compare_med = false;
        log_level = INFO;
    }

    /**
     * @brief Local ASN.
     * (required, no default value)
     */
    uint32_t asn;

    /**
     * @brief Local BGP ID in network byte order.
     * (required, no default value)
     */
    uint32_t router_id;

    /**
     * @brief Address to accept sessions on, in network byte order.
     * (default: 0.0.0.0)
     */
    uint32_t listen_address;

    /**
     * @brief Port to accept sessions on. 0 disables the listener.
     * (default: 179)
     */
    uint16_t listen_port;

    /**
     * @brief Default hold timer of neighbors.
     * (default: 90)
     */
    uint16_t hold_time;

    /**
     * @brief Default connect-retry timer of neighbors.
     * (default: 120)
     */
    uint16_t connect_retry;

    /**
     * @brief Compare MED between routes from different neighbor AS.
     * (default: false)
     */
    bool always_compare_med;

    /**
     * @brief Log level.
     * (default: INFO)
     */
    LogLevel log_level;

    /**
     * @brief Locally originated routes.
     * (default: none)
     */
    std::vector<BgpLocalRoute> networks;

    /**
     * @brief Neighbors.
     * (default: none)
     */
    std::vector<BgpNeighborConfig> neighbors;
} BgpServerConfig;

}

#endif // BGPD_CONFIG_H_
