/**
 * @file bgp-query.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The management query request and response objects.
 * @version 0.3
 * @date 2019-08-09
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_QUERY_H_
#define BGPD_QUERY_H_
#include <stdint.h>
#include <string>
#include <vector>

namespace bgpd {

/**
 * @brief Kind of query.
 *
 */
enum BgpQueryKind {
    NEIGHBOR,
    NEIGHBORS,
    ADJ_RIB_IN,
    ADJ_RIB_OUT,
    LOC_RIB,
    LOC_RIB_BEST
};

/**
 * @brief Query errors.
 *
 */
enum BgpQueryError {
    NONE,
    NOT_FOUND,
    BAD_REQUEST,

    // server stopped before the request was served.
    UNAVAILABLE
};

const char* queryKindToString(BgpQueryKind kind);
bool queryKindFromString(const char *str, BgpQueryKind *kind);
const char* queryErrorToString(BgpQueryError error);

/**
 * @brief A query request.
 *
 * NEIGHBOR, ADJ_RIB_IN and ADJ_RIB_OUT need a peer address. LOC_RIB and
 * LOC_RIB_BEST take an optional one, to list only the routes won by that
 * peer.
 */
class BgpQueryRequest {
public:
    BgpQueryRequest();
    BgpQueryRequest(BgpQueryKind kind, const std::string &address = "");

    BgpQueryKind kind;

    // dotted quad, empty if not given.
    std::string address;
};

/**
 * @brief State and counters of a neighbor.
 *
 */
class BgpNeighborSummary {
public:
    BgpNeighborSummary();

    std::string address;
    uint32_t asn;
    std::string state;
    std::string router_id;

    uint64_t updates_in;
    uint64_t updates_out;
    uint64_t accepted;
    uint64_t rejected;

    // times the session left Established.
    uint64_t flaps;

    // seconds since the session entered Established, 0 if it is not.
    uint64_t uptime;

    // number of routes in Adj-RIB-In.
    uint64_t prefixes;
};

/**
 * @brief A route in a query response.
 *
 */
class BgpRouteSummary {
public:
    BgpRouteSummary();

    std::string prefix;
    std::string next_hop;
    std::string as_path;
    std::string origin;
    uint32_t local_pref;
    bool has_med;
    uint32_t med;

    // address of the peer the route came from, or "local".
    std::string contributor;

    bool best;
};

/**
 * @brief A query response.
 *
 */
class BgpQueryResponse {
public:
    BgpQueryResponse();

    BgpQueryError error;

    // reason of the error, empty on success.
    std::string message;

    std::vector<BgpNeighborSummary> neighbors;
    std::vector<BgpRouteSummary> routes;
};

/**
 * @brief Render a response as JSON text.
 *
 * Object keys are sorted. Indented output ends with a newline.
 *
 * @param response The response.
 * @param pretty Indent the output.
 * @return std::string The text.
 */
std::string formatQueryResponse(const BgpQueryResponse &response, bool pretty);

}

#endif // BGPD_QUERY_H_
