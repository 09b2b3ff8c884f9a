/**
 * @file bgp-keepalive-message.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP keepalive message.
 * @version 0.2
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-keepalive-message.h"
#include "bgp-errcode.h"
#include "value-op.h"

namespace bgpd {

BgpKeepaliveMessage::BgpKeepaliveMessage(BgpLogHandler *logger) : BgpMessage(logger, KEEPALIVE) {}

ssize_t BgpKeepaliveMessage::parse(__attribute__((unused)) const uint8_t *from, size_t msg_sz) {
    if (msg_sz != 0) {
        // data of a bad length error is the offending length field.
        uint8_t err_data[2];
        uint8_t *ptr = err_data;
        putU16(&ptr, msg_sz + 19);
        setError(E_HEADER, E_LENGTH, err_data, 2);
        logger->log(ERROR, "BgpKeepaliveMessage::parse: keepalive with %zu bytes body.\n", msg_sz);
        return -1;
    }

    return 0;
}

ssize_t BgpKeepaliveMessage::write(__attribute__((unused)) uint8_t *to, __attribute__((unused)) size_t buf_sz) const {
    return 0;
}

ssize_t BgpKeepaliveMessage::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "KeepaliveMessage { }\n");
}

}
