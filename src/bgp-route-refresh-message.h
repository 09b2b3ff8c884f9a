/**
 * @file bgp-route-refresh-message.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP ROUTE-REFRESH message (RFC 2918).
 * @version 0.1
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_ROUTE_REFRESH_MSG_H_
#define BGPD_ROUTE_REFRESH_MSG_H_
#include "bgp-message.h"

namespace bgpd {

/**
 * @brief The BgpRouteRefreshMessage class.
 * 
 * Asks the peer to re-send its Adj-RIB-Out for one AFI/SAFI.
 */
class BgpRouteRefreshMessage : public BgpMessage {
public:
    BgpRouteRefreshMessage(BgpLogHandler *logger);
    BgpRouteRefreshMessage(BgpLogHandler *logger, uint16_t afi, uint8_t safi);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    uint16_t afi;
    uint8_t safi;
};

}

#endif // BGPD_ROUTE_REFRESH_MSG_H_
