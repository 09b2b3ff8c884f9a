/**
 * @file bgp-route-refresh-message.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP ROUTE-REFRESH message (RFC 2918).
 * @version 0.1
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-route-refresh-message.h"
#include "bgp-capability.h"
#include "bgp-errcode.h"
#include "value-op.h"

namespace bgpd {

BgpRouteRefreshMessage::BgpRouteRefreshMessage(BgpLogHandler *logger) : BgpMessage(logger, ROUTE_REFRESH_MSG) {
    afi = IPV4;
    safi = UNICAST;
}

BgpRouteRefreshMessage::BgpRouteRefreshMessage(BgpLogHandler *logger, uint16_t afi, uint8_t safi) : BgpMessage(logger, ROUTE_REFRESH_MSG) {
    this->afi = afi;
    this->safi = safi;
}

ssize_t BgpRouteRefreshMessage::parse(const uint8_t *from, size_t msg_sz) {
    if (msg_sz != 4) {
        setError(E_ROUTE_REFRESH, E_RR_LENGTH, from, msg_sz);
        logger->log(ERROR, "BgpRouteRefreshMessage::parse: invalid message length %zu.\n", msg_sz);
        return -1;
    }

    const uint8_t *buffer = from;
    afi = getU16(&buffer);
    getValue<uint8_t>(&buffer); // reserved
    safi = getValue<uint8_t>(&buffer);

    return 4;
}

ssize_t BgpRouteRefreshMessage::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < 4) {
        logger->log(ERROR, "BgpRouteRefreshMessage::write: dst buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;
    putU16(&buffer, afi);
    putValue<uint8_t>(&buffer, 0);
    putValue<uint8_t>(&buffer, safi);

    return 4;
}

ssize_t BgpRouteRefreshMessage::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "RouteRefreshMessage { Afi { %u } Safi { %u } }\n", afi, safi);
}

}
