/**
 * @file bgp-errcode.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief BGP error codes.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_ERRCODE_H_
#define BGPD_ERRCODE_H_
#include <stdint.h>

namespace bgpd {

/**
 * @brief BGP Error codes
 */
enum BgpErrorCode {
    E_UNSPEC = 0,
    E_HEADER = 1, // Message Header Error
    E_OPEN = 2, // OPEN Message Error 
    E_UPDATE = 3, // UPDATE Message Error
    E_HOLD = 4, // Hold Timer Expired
    E_FSM = 5, // Finite State Machine Error
    E_CEASE = 6, // Cease
    E_ROUTE_REFRESH = 7 // ROUTE-REFRESH Message Error (RFC 7313)
};

/**
 * @brief BGP header error subcodes.
 */
enum BgpHeaderErrorSubcode {
    E_UNSPEC_HEADER = 0,
    E_SYNC = 1, // Connection Not Synchronized
    E_LENGTH = 2, // Bad Message Length
    E_TYPE = 3 // Bad Message Type
};

/**
 * @brief BGP open message error subcodes.
 */
enum BgpOpenErrorSubcode {
    E_UNSPEC_OPEN = 0,
    E_VERSION = 1, // Unsupported Version Number
    E_PEER_AS = 2, // Bad Peer AS
    E_BGP_ID = 3, // Bad Peer BGP ID
    E_OPT_PARAM = 4, // Unsupported Optional Parameter
    E_AUTH_FAILED = 5, // Authentication Failure (Deprecated)
    E_HOLD_TIME = 6, // Unacceptable Hold Time
    E_CAPABILITY = 7 // Unsupported Capability
};

/**
 * @brief BGP update message error subcodes.
 */
enum BgpUpdateErrorSubcode {
    E_UNSPEC_UPDATE = 0,
    E_ATTR_LIST = 1, // Malformed Attribute List
    E_BAD_WELL_KNOWN = 2, // Unrecognized Well-known Attribute
    E_MISS_WELL_KNOWN = 3, // Missing Well-known Attribute
    E_ATTR_FLAG = 4, // Attribute Flags Error
    E_ATTR_LEN = 5, // Attribute Length Error
    E_ORIGIN = 6, // Invalid ORIGIN Attribute
    E_AS_LOOP = 7, // AS Routing Loop (Deprecated)
    E_NEXT_HOP = 8, // Invalid NEXT_HOP Attribute
    E_OPT_ATTR = 9, // Optional Attribute Error
    E_NETFIELD = 10, // Invalid Network Field
    E_AS_PATH = 11 // Malformed AS_PATH
};

/**
 * @brief BGP FSM error subcodes.
 */
enum BgpFsmErrorSubcode {
    E_UNSPEC_FSM = 0,
    E_OPEN_SENT = 1, // Receive Unexpected Message in OpenSent State
    E_OPEN_CONFIRM = 2, // Receive Unexpected Message in OpenConfirm State
    E_ESTABLISHED = 3 // Receive Unexpected Message in Established State
};

/**
 * @brief BGP cease error subcodes.
 */
enum BgpCeaseErrorSubcode {
    E_UNSPEC_CEASE = 0,
    E_MAX_PREFIX = 1, // Maximum Number of Prefixes Reached
    E_SHUTDOWN = 2, // Administrative Shutdown
    E_DECONF = 3, // Peer De-configured
    E_RESET = 4, // Administrative Reset
    E_REJECT = 5, // Connection Rejected
    E_CONFGCHANGE = 6, // Other Configuration Change
    E_COLLISION = 7, // Connection Collision Resolution
    E_RESOURCES = 8 // Out of Resources
};

/**
 * @brief ROUTE-REFRESH message error subcodes.
 */
enum BgpRouteRefreshErrorSubcode {
    E_UNSPEC_ROUTE_REFRESH = 0,
    E_RR_LENGTH = 1 // Invalid Message Length
};

const char* bgpErrorCodeToString(uint8_t code);
const char* bgpErrorSubcodeToString(uint8_t code, uint8_t subcode);

}

#endif // BGPD_ERRCODE_H_
