/**
 * @file bgp-errcode.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief BGP error code strings.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-errcode.h"

namespace bgpd {

static const char *bgp_error_code_str[] = {
    "Unspecific",
    "Message Header Error",
    "OPEN Message Error",
    "UPDATE Message Error",
    "Hold Timer Expired",
    "Finite State Machine Error",
    "Cease",
    "ROUTE-REFRESH Message Error"
};

static const char *bgp_header_error_subcode_str[] = {
    "Unspecific",
    "Connection Not Synchronized",
    "Bad Message Length",
    "Bad Message Type"
};

static const char *bgp_open_error_subcode_str[] = {
    "Unspecific",
    "Unsupported Version Number",
    "Bad Peer AS",
    "Bad BGP Identifier",
    "Unsupported Optional Parameter",
    "Authentication Failure",
    "Unacceptable Hold Time",
    "Unsupported Capability"
};

static const char *bgp_update_error_str[] = {
    "Unspecific",
    "Malformed Attribute List",
    "Unrecognized Well-known Attribute",
    "Missing Well-known Attribute",
    "Attribute Flags Error",
    "Attribute Length Error",
    "Invalid ORIGIN Attribute",
    "AS Routing Loop",
    "Invalid NEXT_HOP Attribute",
    "Optional Attribute Error",
    "Invalid Network Field",
    "Malformed AS_PATH"
};

static const char *bgp_fsm_error_str[] = {
    "Unspecified Error",
    "Receive Unexpected Message in OpenSent State",
    "Receive Unexpected Message in OpenConfirm State",
    "Receive Unexpected Message in Established State"
};

static const char *bgp_cease_error_str[] = {
    "Unspecific",
    "Maximum Number of Prefixes Reached",
    "Administrative Shutdown",
    "Peer De-configured",
    "Administrative Reset",
    "Connection Rejected",
    "Other Configuration Change",
    "Connection Collision Resolution",
    "Out of Resources"
};

static const char *bgp_route_refresh_error_str[] = {
    "Unspecific",
    "Invalid Message Length"
};

#define BGPD_TABLE_LOOKUP(table, idx) \
    ((idx) < sizeof(table) / sizeof(table[0]) ? table[(idx)] : "Unknown")

/**
 * @brief Get the name of a BGP error code.
 * 
 * @param code The error code.
 * @return const char* Name of the error code, or "Unknown".
 */
const char* bgpErrorCodeToString(uint8_t code) {
    return BGPD_TABLE_LOOKUP(bgp_error_code_str, code);
}

/**
 * @brief Get the name of a BGP error subcode.
 * 
 * @param code The error code the subcode belongs to.
 * @param subcode The error subcode.
 * @return const char* Name of the subcode, or "Unknown".
 */
const char* bgpErrorSubcodeToString(uint8_t code, uint8_t subcode) {
    switch (code) {
        case E_HEADER: return BGPD_TABLE_LOOKUP(bgp_header_error_subcode_str, subcode);
        case E_OPEN: return BGPD_TABLE_LOOKUP(bgp_open_error_subcode_str, subcode);
        case E_UPDATE: return BGPD_TABLE_LOOKUP(bgp_update_error_str, subcode);
        case E_FSM: return BGPD_TABLE_LOOKUP(bgp_fsm_error_str, subcode);
        case E_CEASE: return BGPD_TABLE_LOOKUP(bgp_cease_error_str, subcode);
        case E_ROUTE_REFRESH: return BGPD_TABLE_LOOKUP(bgp_route_refresh_error_str, subcode);
        default: return subcode == 0 ? "Unspecific" : "Unknown";
    }
}

}
