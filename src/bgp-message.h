/**
 * @file bgp-message.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP message base.
 * @version 0.2
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_MESSAGE_H_
#define BGPD_MESSAGE_H_
#include <stdint.h>
#include <unistd.h>
#include "serializable.h"

namespace bgpd {

/**
 * @brief BGP Message types.
 * 
 */
enum BgpMessageType {
    OPEN = 1,
    UPDATE = 2,
    NOTIFICATION = 3,
    KEEPALIVE = 4,
    ROUTE_REFRESH_MSG = 5
};

/**
 * @brief The BgpMessage base class.
 * 
 */
class BgpMessage : public Serializable {
public:
    BgpMessage(BgpLogHandler *logger, uint8_t type) : Serializable(logger), type(type) {}

    /**
     * @brief Deserialize a BGP message *body*.
     * 
     * Only the body is parsed here (no marker, length or type). Use BgpPacket
     * to deserialize a full BGP message.
     * 
     * @param from Pointer to message body buffer.
     * @param msg_sz Size of message.
     * @return ssize_t Bytes read.
     * @retval -1 Deserialization error.
     * @retval >=0 Bytes read.
     */
    virtual ssize_t parse(const uint8_t *from, size_t msg_sz) = 0;

    /**
     * @brief Serialize a BGP message *body*.
     * 
     * @param to Pointer to destination buffer.
     * @param buf_sz Max write size.
     * @return ssize_t Bytes written.
     * @retval -1 Serialization error.
     * @retval >=0 Bytes written.
     */
    virtual ssize_t write(uint8_t *to, size_t buf_sz) const = 0;

    const uint8_t type;

    virtual ~BgpMessage() {}
};

}
#endif // BGPD_MESSAGE_H_
