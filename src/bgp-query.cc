/**
 * @file bgp-query.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The management query request and response objects.
 * @version 0.3
 * @date 2019-08-09
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-query.h"
#include <string.h>
#include <nlohmann/json.hpp>

namespace bgpd {

const char* bgp_query_kind_str[] = {
    "neighbor",
    "neighbors",
    "adj-rib-in",
    "adj-rib-out",
    "loc-rib",
    "loc-rib-best"
};

const char* bgp_query_error_str[] = {
    "none",
    "not-found",
    "bad-request",
    "unavailable"
};

const char* queryKindToString(BgpQueryKind kind) {
    if (kind < NEIGHBOR || kind > LOC_RIB_BEST) return "invalid";
    return bgp_query_kind_str[kind];
}

bool queryKindFromString(const char *str, BgpQueryKind *kind) {
    for (int k = NEIGHBOR; k <= LOC_RIB_BEST; k++) {
        if (strcmp(str, bgp_query_kind_str[k]) == 0) {
            *kind = (BgpQueryKind) k;
            return true;
        }
    }

    return false;
}

const char* queryErrorToString(BgpQueryError error) {
    if (error < NONE || error > UNAVAILABLE) return "invalid";
    return bgp_query_error_str[error];
}

BgpQueryRequest::BgpQueryRequest() : kind(NEIGHBORS) {}

BgpQueryRequest::BgpQueryRequest(BgpQueryKind kind, const std::string &address) :
    kind(kind), address(address) {}

BgpNeighborSummary::BgpNeighborSummary() {
    asn = 0;
    updates_in = 0;
    updates_out = 0;
    accepted = 0;
    rejected = 0;
    flaps = 0;
    uptime = 0;
    prefixes = 0;
}

BgpRouteSummary::BgpRouteSummary() {
    local_pref = 100;
    has_med = false;
    med = 0;
    best = false;
}

BgpQueryResponse::BgpQueryResponse() : error(NONE) {}

std::string formatQueryResponse(const BgpQueryResponse &response, bool pretty) {
    nlohmann::json doc;

    doc["error"] = queryErrorToString(response.error);
    if (response.error != NONE) doc["message"] = response.message;

    nlohmann::json neighbors = nlohmann::json::array();
    for (const BgpNeighborSummary &n : response.neighbors) {
        nlohmann::json neighbor;
        neighbor["address"] = n.address;
        neighbor["asn"] = n.asn;
        neighbor["state"] = n.state;
        neighbor["router_id"] = n.router_id;
        neighbor["updates_in"] = n.updates_in;
        neighbor["updates_out"] = n.updates_out;
        neighbor["accepted"] = n.accepted;
        neighbor["rejected"] = n.rejected;
        neighbor["flaps"] = n.flaps;
        neighbor["uptime"] = n.uptime;
        neighbor["prefixes"] = n.prefixes;
        neighbors.push_back(neighbor);
    }
    doc["neighbors"] = neighbors;

    nlohmann::json routes = nlohmann::json::array();
    for (const BgpRouteSummary &r : response.routes) {
        nlohmann::json route;
        route["prefix"] = r.prefix;
        route["next_hop"] = r.next_hop;
        route["as_path"] = r.as_path;
        route["origin"] = r.origin;
        route["local_pref"] = r.local_pref;
        if (r.has_med) route["med"] = r.med;
        route["contributor"] = r.contributor;
        route["best"] = r.best;
        routes.push_back(route);
    }
    doc["routes"] = routes;

    if (!pretty) return doc.dump();
    return doc.dump(2) + "\n";
}

}
