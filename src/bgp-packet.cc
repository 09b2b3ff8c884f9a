/**
 * @file bgp-packet.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Top level deserialization/serialization entry point for BGP messages.
 * @version 0.3
 * @date 2019-08-04
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-packet.h"
#include "bgp-errcode.h"
#include "bgp-open-message.h"
#include "bgp-update-message.h"
#include "bgp-keepalive-message.h"
#include "bgp-notification-message.h"
#include "bgp-route-refresh-message.h"
#include "value-op.h"
#include <string.h>

namespace bgpd {

/**
 * @brief Construct a new BgpPacket object for deserializing BGP message.
 * 
 * @param logger Pointer to logger object for error logging.
 * @param is_4b Enable four octets ASN support.
 */
BgpPacket::BgpPacket(BgpLogHandler *logger, bool is_4b) : Serializable(logger) {
    msg = NULL;
    m_msg = NULL;
    is_message_owner = true;
    this->is_4b = is_4b;
}

/**
 * @brief Construct a new BgpPacket object for serializing BGP message.
 * 
 * @param logger Pointer to logger object for error logging.
 * @param is_4b Enable four octets ASN support.
 * @param msg The message to be serialized
 */
BgpPacket::BgpPacket(BgpLogHandler *logger, bool is_4b, const BgpMessage *msg) : Serializable(logger) {
    this->msg = msg;
    m_msg = NULL;
    this->is_4b = is_4b;
    is_message_owner = false;
}

BgpPacket::~BgpPacket() {
    if (m_msg != NULL && is_message_owner) delete m_msg;
}

ssize_t BgpPacket::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    const BgpMessage *m = getMessage();
    if (m == NULL) return _print(indent, to, buf_sz, "BadPacket { }\n");

    ssize_t written = m->print(indent, *to, *buf_sz);
    if (written < 0) return 0;

    *to += written;
    *buf_sz -= written;
    return written;
}

/**
 * @brief Deserialize a BGP message.
 * 
 * @param from Pointer to packet buffer.
 * @param buf_sz Size of packet.
 * @return ssize_t Bytes read.
 * @retval -1 Deserialization error. Error may be logged.
 * @retval >=0 Bytes read.
 * @throws "bad_parse" Internal deserialization error.
 * @throws "invalid_op" Invalid operation.
 */
ssize_t BgpPacket::parse(const uint8_t *from, size_t buf_sz) {
    if (!is_message_owner || m_msg != NULL) {
        logger->log(FATAL, "BgpPacket::parse: can't parse: read-only or already parsed packet.\n");
        throw "invalid_op";
    }

    if (buf_sz < BGPD_HEADER_LEN) {
        setError(E_HEADER, E_LENGTH, NULL, 0);
        logger->log(ERROR, "BgpPacket::parse: packet too short (%zu).\n", buf_sz);
        return -1;
    }

    static const uint8_t marker[16] = {
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff
    };

    if (memcmp(from, marker, 16) != 0) {
        setError(E_HEADER, E_SYNC, NULL, 0);
        logger->log(ERROR, "BgpPacket::parse: invalid BGP marker.\n");
        return -1;
    }

    const uint8_t *buffer = from + 16;
    uint16_t pkt_len = getU16(&buffer);

    if (pkt_len < BGPD_HEADER_LEN || pkt_len > BGPD_MAX_MSG_LEN || pkt_len > buf_sz) {
        setError(E_HEADER, E_LENGTH, from + 16, 2);
        logger->log(ERROR, "BgpPacket::parse: got a packet with invalid length (%u).\n", pkt_len);
        return -1;
    }

    uint8_t msg_type = getValue<uint8_t>(&buffer);

    switch (msg_type) {
        case OPEN: m_msg = new BgpOpenMessage(logger, is_4b); break;
        case UPDATE: m_msg = new BgpUpdateMessage(logger, is_4b); break;
        case KEEPALIVE: m_msg = new BgpKeepaliveMessage(logger); break;
        case NOTIFICATION: m_msg = new BgpNotificationMessage(logger); break;
        case ROUTE_REFRESH_MSG: m_msg = new BgpRouteRefreshMessage(logger); break;
        default:
            setError(E_HEADER, E_TYPE, &msg_type, 1);
            logger->log(ERROR, "BgpPacket::parse: unknown message type %u.\n", msg_type);
            return -1;
    }

    size_t msg_sz = pkt_len - BGPD_HEADER_LEN;
    ssize_t parsed_len = m_msg->parse(buffer, msg_sz);

    if (parsed_len < 0) {
        forwardParseError(*m_msg);
        return parsed_len;
    }

    if (msg_sz != (size_t) parsed_len) {
        logger->log(FATAL, "BgpPacket::parse: parsed message length invalid but no error reported.\n");
        throw "bad_parse";
    }

    return pkt_len;
}

/**
 * @brief Serialize a BGP message.
 * 
 * @param to Pointer to packet buffer.
 * @param buf_sz Max write size.
 * @return ssize_t Bytes written.
 * @retval -1 Serialization error. Error may be logged.
 * @retval >=0 Bytes written.
 * @throws "invalid_op" Invalid operation.
 */
ssize_t BgpPacket::write(uint8_t *to, size_t buf_sz) const {
    const BgpMessage *m = getMessage();

    if (m == NULL) {
        logger->log(FATAL, "BgpPacket::write: can't write: message pointer NULL.\n");
        throw "invalid_op";
    }

    if (buf_sz < BGPD_HEADER_LEN) {
        logger->log(ERROR, "BgpPacket::write: dst buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;
    memset(buffer, 0xff, 16);
    buffer += 16;

    // length is known after the body is written.
    uint8_t *pkt_len_ptr = buffer;
    buffer += 2;

    putValue<uint8_t>(&buffer, m->type);

    size_t body_max = buf_sz - BGPD_HEADER_LEN;
    if (body_max > BGPD_MAX_MSG_LEN - BGPD_HEADER_LEN) body_max = BGPD_MAX_MSG_LEN - BGPD_HEADER_LEN;

    ssize_t msg_len = m->write(buffer, body_max);
    if (msg_len < 0) return msg_len;

    size_t pkt_len = msg_len + BGPD_HEADER_LEN;
    putU16(&pkt_len_ptr, pkt_len);

    return pkt_len;
}

/**
 * @brief Get pointer to the contained message.
 * 
 * @return const BgpMessage* Pointer to the message.
 */
const BgpMessage *BgpPacket::getMessage() const {
    return is_message_owner ? m_msg : msg;
}

}
