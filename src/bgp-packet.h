/**
 * @file bgp-packet.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Top level deserialization/serialization entry point for BGP messages.
 * @version 0.3
 * @date 2019-08-04
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_PACKET_H_
#define BGPD_PACKET_H_
#include "serializable.h"
#include "bgp-message.h"

namespace bgpd {

#define BGPD_HEADER_LEN 19
#define BGPD_MAX_MSG_LEN 4096

/**
 * @brief The BgpPacket class.
 * 
 * BgpPacket class is the top level deserialization/serialization entry point 
 * for BGP messages: marker, length, type and the message body.
 * 
 */
class BgpPacket : public Serializable {
public:
    BgpPacket(BgpLogHandler *logger, bool is_4b, const BgpMessage *msg);
    BgpPacket(BgpLogHandler *logger, bool is_4b);
    virtual ~BgpPacket();
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

    // parse one full message. header errors (marker, length, type) are 
    // reported with the E_HEADER code.
    ssize_t parse(const uint8_t *from, size_t buf_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    // NULL when the header failed to parse.
    const BgpMessage *getMessage() const;

private:
    BgpMessage *m_msg;
    const BgpMessage *msg;

    // is the BgpMessage owned by us? (i.e. created by parse())
    bool is_message_owner;
    
    bool is_4b;
};

}
#endif // BGPD_PACKET_H_
