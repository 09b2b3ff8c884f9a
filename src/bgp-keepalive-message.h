/**
 * @file bgp-keepalive-message.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP keepalive message.
 * @version 0.2
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_KEEPALIVE_MSG_H_
#define BGPD_KEEPALIVE_MSG_H_
#include "bgp-message.h"

namespace bgpd {

/**
 * @brief The BgpKeepaliveMessage class. The body is always empty.
 */
class BgpKeepaliveMessage : public BgpMessage {
public:
    BgpKeepaliveMessage(BgpLogHandler *logger);
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
};

}

#endif // BGPD_KEEPALIVE_MSG_H_
