/**
 * @file bgp-update-message.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP update message
 * @version 0.3
 * @date 2019-08-04
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_UPDATE_MSG_H_
#define BGPD_UPDATE_MSG_H_
#include <vector>
#include <unistd.h>
#include <memory>
#include "prefix4.h"
#include "bgp-message.h"
#include "bgp-path-attrib.h"

namespace bgpd {

/**
 * @brief The BgpUpdateMessage class.
 *
 * This is deserializer/serializer for BGP update message body. If you want to
 * deserializer/serializer a full BGP message. Take a look at BgpPacket class.
 *
 * Parsing only checks the syntax of the message. Whether the well-known
 * mandatory attributes are present is checked when the route enters the RIB.
 */
class BgpUpdateMessage : public BgpMessage {
public:
    std::vector<Prefix4> withdrawn_routes;
    std::vector<std::shared_ptr<BgpPathAttrib>> path_attribute;
    std::vector<Prefix4> nlri;

    BgpUpdateMessage(BgpLogHandler *logger, bool use_4b_asn);

    // get attribute by type, throws "no_such_attribute" if not present.
    BgpPathAttrib& getAttrib(uint8_t type);
    const BgpPathAttrib& getAttrib(uint8_t type) const;

    bool hasAttrib(uint8_t type) const;

    // copy and add an attribute, return false if attrib of same type already exists
    bool addAttrib(const BgpPathAttrib &attrib);

    // replace attribute list. attributes are shared, not copied.
    void setAttribs(const std::vector<std::shared_ptr<BgpPathAttrib>> &attrs);

    bool dropAttrib(uint8_t type);

    // copy and replace attribute of the same type (appended if not exist)
    void updateAttribute(const BgpPathAttrib &attrib);

    void setNextHop(uint32_t nexthop);

    // bytes the path attribute list takes on the wire.
    size_t attribsLength() const;

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

private:
    ssize_t parsePrefixes(const uint8_t *from, size_t len, std::vector<Prefix4> &out, const char *what);

    bool use_4b_asn;
};

}
#endif // BGPD_UPDATE_MSG_H_
