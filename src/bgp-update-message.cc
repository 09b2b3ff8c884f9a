/**
 * @file bgp-update-message.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP update message
 * @version 0.3
 * @date 2019-08-04
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-update-message.h"
#include "bgp-errcode.h"
#include "value-op.h"
#include <string.h>

namespace bgpd {

/**
 * @brief Construct a new Bgp Update Message:: Bgp Update Message object
 *
 * @param logger Pointer to logger object for error logging.
 * @param use_4b_asn Use four octets ASN in AS_PATH and AGGREGATOR.
 */
BgpUpdateMessage::BgpUpdateMessage(BgpLogHandler *logger, bool use_4b_asn) : BgpMessage(logger, UPDATE) {
    this->use_4b_asn = use_4b_asn;
}

BgpPathAttrib& BgpUpdateMessage::getAttrib(uint8_t type) {
    for (const std::shared_ptr<BgpPathAttrib> &attrib : path_attribute) {
        if (attrib->type_code == type) return *attrib;
    }

    throw "no_such_attribute";
}

const BgpPathAttrib& BgpUpdateMessage::getAttrib(uint8_t type) const {
    for (const std::shared_ptr<BgpPathAttrib> &attrib : path_attribute) {
        if (attrib->type_code == type) return *attrib;
    }

    throw "no_such_attribute";
}

bool BgpUpdateMessage::hasAttrib(uint8_t type) const {
    for (const std::shared_ptr<BgpPathAttrib> &attrib : path_attribute) {
        if (attrib->type_code == type) return true;
    }

    return false;
}

bool BgpUpdateMessage::addAttrib(const BgpPathAttrib &attrib) {
    if (hasAttrib(attrib.type_code)) return false;

    path_attribute.push_back(std::shared_ptr<BgpPathAttrib>(attrib.clone()));
    return true;
}

void BgpUpdateMessage::setAttribs(const std::vector<std::shared_ptr<BgpPathAttrib>> &attrs) {
    path_attribute = attrs;
}

bool BgpUpdateMessage::dropAttrib(uint8_t type) {
    for (std::vector<std::shared_ptr<BgpPathAttrib>>::iterator it = path_attribute.begin(); it != path_attribute.end(); it++) {
        if ((*it)->type_code == type) {
            path_attribute.erase(it);
            return true;
        }
    }

    return false;
}

void BgpUpdateMessage::updateAttribute(const BgpPathAttrib &attrib) {
    for (std::shared_ptr<BgpPathAttrib> &attr : path_attribute) {
        if (attr->type_code == attrib.type_code) {
            attr.reset(attrib.clone());
            return;
        }
    }

    path_attribute.push_back(std::shared_ptr<BgpPathAttrib>(attrib.clone()));
}

/**
 * @brief Set the nexthop attribute.
 *
 * @param nexthop Nexthop in network byte order.
 */
void BgpUpdateMessage::setNextHop(uint32_t nexthop) {
    BgpPathAttribNexthop nh(logger, nexthop);
    updateAttribute(nh);
}

size_t BgpUpdateMessage::attribsLength() const {
    size_t len = 0;

    for (const std::shared_ptr<BgpPathAttrib> &attr : path_attribute) {
        len += attr->length();
    }

    return len;
}

ssize_t BgpUpdateMessage::parsePrefixes(const uint8_t *from, size_t len, std::vector<Prefix4> &out, const char *what) {
    size_t parsed = 0;

    while (parsed < len) {
        Prefix4 route;
        ssize_t ret = route.parse(from + parsed, len - parsed);
        if (ret < 0) {
            logger->log(ERROR, "BgpUpdateMessage::parse: invalid prefix in %s.\n", what);
            setError(E_UPDATE, E_NETFIELD, NULL, 0);
            return -1;
        }

        parsed += ret;
        out.push_back(route);
    }

    return parsed;
}

ssize_t BgpUpdateMessage::parse(const uint8_t *from, size_t msg_sz) {
    if (msg_sz < 4) {
        uint8_t err_data[2];
        uint8_t *ptr = err_data;
        putU16(&ptr, msg_sz + 19);
        setError(E_HEADER, E_LENGTH, err_data, 2);
        logger->log(ERROR, "BgpUpdateMessage::parse: invalid update message size: %zu.\n", msg_sz);
        return -1;
    }

    const uint8_t *buffer = from;

    uint16_t withdrawn_len = getU16(&buffer);

    if (withdrawn_len > msg_sz - 4) { // -4: two length fields (withdrawn len + attrib len)
        logger->log(ERROR, "BgpUpdateMessage::parse: withdrawn routes length overflows message.\n");
        setError(E_UPDATE, E_ATTR_LIST, NULL, 0);
        return -1;
    }

    if (parsePrefixes(buffer, withdrawn_len, withdrawn_routes, "withdrawn routes") < 0) return -1;
    buffer += withdrawn_len;

    uint16_t attribute_len = getU16(&buffer);
    if ((size_t) (attribute_len + withdrawn_len + 4) > msg_sz) {
        logger->log(ERROR, "BgpUpdateMessage::parse: attribute list length overflows message buffer.\n");
        setError(E_UPDATE, E_ATTR_LIST, NULL, 0);
        return -1;
    }

    // one bit per type code, for duplicate detection.
    uint8_t seen[32];
    memset(seen, 0, sizeof(seen));

    size_t parsed_attribute_len = 0;

    while (parsed_attribute_len < attribute_len) {
        size_t left = attribute_len - parsed_attribute_len;
        uint8_t attr_type = BgpPathAttrib::GetTypeFromBuffer(buffer, left);

        if (left < 3) {
            logger->log(ERROR, "BgpUpdateMessage::parse: unexpected end of attribute list.\n");
            setError(E_UPDATE, E_ATTR_LIST, NULL, 0);
            return -1;
        }

        if (seen[attr_type / 8] & (1 << (attr_type % 8))) {
            logger->log(ERROR, "BgpUpdateMessage::parse: attribute %u appears more than once.\n", attr_type);
            setError(E_UPDATE, E_ATTR_LIST, NULL, 0);
            return -1;
        }
        seen[attr_type / 8] |= 1 << (attr_type % 8);

        BgpPathAttrib *attrib = NULL;

        switch(attr_type) {
            case ORIGIN: attrib = new BgpPathAttribOrigin(logger); break;
            case AS_PATH: attrib = new BgpPathAttribAsPath(logger, use_4b_asn); break;
            case NEXT_HOP: attrib = new BgpPathAttribNexthop(logger); break;
            case MULTI_EXIT_DISC: attrib = new BgpPathAttribMed(logger); break;
            case LOCAL_PREF: attrib = new BgpPathAttribLocalPref(logger); break;
            case ATOMIC_AGGREGATE: attrib = new BgpPathAttribAtomicAggregate(logger); break;
            case AGGREGATOR: attrib = new BgpPathAttribAggregator(logger, use_4b_asn); break;
            case COMMUNITY: attrib = new BgpPathAttribCommunity(logger); break;
            default: attrib = new BgpPathAttrib(logger); break;
        }

        std::shared_ptr<BgpPathAttrib> attrib_ptr(attrib);
        ssize_t attrib_parsed = attrib->parse(buffer, left);

        if (attrib_parsed < 0) {
            forwardParseError(*attrib);
            return -1;
        }

        buffer += attrib_parsed;
        parsed_attribute_len += attrib_parsed;
        path_attribute.push_back(attrib_ptr);
    }

    size_t nlri_len = msg_sz - 4 - attribute_len - withdrawn_len;

    if (parsePrefixes(buffer, nlri_len, nlri, "nlri") < 0) return -1;

    if (nlri.size() > 0 && path_attribute.size() == 0) {
        logger->log(ERROR, "BgpUpdateMessage::parse: nlri present but no path attribute.\n");
        setError(E_UPDATE, E_MISS_WELL_KNOWN, NULL, 0);
        return -1;
    }

    return msg_sz;
}

ssize_t BgpUpdateMessage::write(uint8_t *to, size_t buf_sz) const {
    size_t withdrawn_len = 0, nlri_len = 0;

    for (const Prefix4 &route : withdrawn_routes) withdrawn_len += route.wireLength();
    for (const Prefix4 &route : nlri) nlri_len += route.wireLength();

    size_t attrib_len = attribsLength();
    size_t total = 4 + withdrawn_len + attrib_len + nlri_len;

    if (buf_sz < total) {
        logger->log(ERROR, "BgpUpdateMessage::write: destination buffer too small (need %zu, have %zu).\n", total, buf_sz);
        return -1;
    }

    uint8_t *buffer = to;

    putU16(&buffer, withdrawn_len);
    for (const Prefix4 &route : withdrawn_routes) {
        ssize_t ret = route.write(buffer, buf_sz - (buffer - to));
        if (ret < 0) {
            logger->log(ERROR, "BgpUpdateMessage::write: failed to write withdraw entry.\n");
            return -1;
        }
        buffer += ret;
    }

    putU16(&buffer, attrib_len);
    for (const std::shared_ptr<BgpPathAttrib> &attr : path_attribute) {
        ssize_t ret = attr->write(buffer, buf_sz - (buffer - to));
        if (ret < 0) return -1;
        buffer += ret;
    }

    for (const Prefix4 &route : nlri) {
        ssize_t ret = route.write(buffer, buf_sz - (buffer - to));
        if (ret < 0) {
            logger->log(ERROR, "BgpUpdateMessage::write: failed to write nlri entry.\n");
            return -1;
        }
        buffer += ret;
    }

    return buffer - to;
}

ssize_t BgpUpdateMessage::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    size_t written = 0;
    written += _print(indent, to, buf_sz, "UpdateMessage {\n");
    indent++; {
        if (withdrawn_routes.size() == 0) written += _print(indent, to, buf_sz, "WithdrawnRoutes { }\n");
        else {
            written += _print(indent, to, buf_sz, "WithdrawnRoutes {\n");
            indent++; {
                for (const Prefix4 &route : withdrawn_routes) {
                    written += _print(indent, to, buf_sz, "Prefix4 { %s }\n", route.toString().c_str());
                }
            }; indent--;
            written += _print(indent, to, buf_sz, "}\n");
        }

        if (path_attribute.size() == 0) written += _print(indent, to, buf_sz, "PathAttributes { }\n");
        else {
            written += _print(indent, to, buf_sz, "PathAttributes {\n");
            indent++; {
                for (const std::shared_ptr<BgpPathAttrib> &attr : path_attribute) {
                    written += attr->doPrint(indent, to, buf_sz);
                }
            }; indent--;
            written += _print(indent, to, buf_sz, "}\n");
        }

        if (nlri.size() == 0) written += _print(indent, to, buf_sz, "NLRI { }\n");
        else {
            written += _print(indent, to, buf_sz, "NLRI {\n");
            indent++; {
                for (const Prefix4 &route : nlri) {
                    written += _print(indent, to, buf_sz, "Prefix4 { %s }\n", route.toString().c_str());
                }
            }; indent--;
            written += _print(indent, to, buf_sz, "}\n");
        }
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");
    return written;
}

}
