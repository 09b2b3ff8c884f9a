/**
 * @file bgp-capability.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief BGP OPEN message capabilities.
 * @version 0.3
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-capability.h"
#include "bgp-errcode.h"
#include "value-op.h"

namespace bgpd {

BgpCapability::BgpCapability(BgpLogHandler *logger) : Serializable(logger) {
    code = 0;
    length = 0;
}

/**
 * @brief Parse the capability header (code, length).
 * 
 * @param from Pointer to buffer.
 * @param msg_sz Max read size.
 * @param expected_code Capability code this object handles, 0 for any.
 * @return ssize_t Bytes read.
 * @retval -1 Failed to deserialize header.
 * @retval >=0 Bytes read.
 * @throws "bad_type" The code in buffer does not match the object type.
 */
ssize_t BgpCapability::parseHeader(const uint8_t *from, size_t msg_sz, uint8_t expected_code) {
    if (msg_sz < 2) {
        setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
        logger->log(ERROR, "BgpCapability::parseHeader: unexpected end of capability.\n");
        return -1;
    }

    code = getValue<uint8_t>(&from);
    length = getValue<uint8_t>(&from);

    if (expected_code != 0 && code != expected_code) {
        logger->log(FATAL, "BgpCapability::parseHeader: code %u mismatch with object type %u.\n", code, expected_code);
        throw "bad_type";
    }

    if ((size_t) (length + 2) > msg_sz) {
        setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
        logger->log(ERROR, "BgpCapability::parseHeader: capability size exceed capabilities list.\n");
        return -1;
    }

    return 2;
}

/**
 * @brief Parse the header of a capability with fixed value length.
 * 
 * @return ssize_t Bytes read (header only).
 * @retval -1 Bad header or unexpected length.
 */
ssize_t BgpCapability::parseFixed(const uint8_t *from, size_t msg_sz, uint8_t expected_code, uint8_t expected_len, const char *name) {
    ssize_t hdr_len = parseHeader(from, msg_sz, expected_code);
    if (hdr_len < 0) return hdr_len;

    if (length != expected_len) {
        setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
        logger->log(ERROR, "%s::parse: bad length field (saw %u, want %u).\n", name, length, expected_len);
        return -1;
    }

    return hdr_len;
}

BgpCapability4BytesAsn::BgpCapability4BytesAsn(BgpLogHandler *logger) : BgpCapability(logger) {
    my_asn = 0;
    code = ASN_4B;
}

ssize_t BgpCapability4BytesAsn::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    ssize_t written = 0;
    written += _print(indent, to, buf_sz, "FourOctetAsnCapability {\n");
    indent++; {
        written += _print(indent, to, buf_sz, "MyAsn { %u }\n", my_asn);
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");

    return written;
}

ssize_t BgpCapability4BytesAsn::parse(const uint8_t *from, size_t msg_sz) {
    ssize_t hdr_len = parseFixed(from, msg_sz, ASN_4B, 4, "BgpCapability4BytesAsn");
    if (hdr_len < 0) return hdr_len;

    const uint8_t *buffer = from + hdr_len;
    my_asn = getU32(&buffer);

    return hdr_len + 4;
}

ssize_t BgpCapability4BytesAsn::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < 6) {
        logger->log(ERROR, "BgpCapability4BytesAsn::write: dest buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;
    putValue<uint8_t>(&buffer, ASN_4B);
    putValue<uint8_t>(&buffer, 4);
    putU32(&buffer, my_asn);

    return 6;
}

BgpCapabilityMpBgp::BgpCapabilityMpBgp(BgpLogHandler *logger) : BgpCapability(logger) {
    code = MP_BGP;
    afi = IPV4;
    safi = UNICAST;
}

ssize_t BgpCapabilityMpBgp::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    const char* afi_name = afi == IPV4 ? "IPv4" : (afi == IPV6 ? "IPv6" : "Unknown");
    const char* safi_name = safi == UNICAST ? "Unicast" : (safi == MULTICAST ? "Multicast" : "Unknown");

    ssize_t written = 0;
    written += _print(indent, to, buf_sz, "MpBgpCapability {\n");
    indent++; {
        written += _print(indent, to, buf_sz, "Afi { %s }\n", afi_name);
        written += _print(indent, to, buf_sz, "Safi { %s }\n", safi_name);
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");

    return written;
}

ssize_t BgpCapabilityMpBgp::parse(const uint8_t *from, size_t msg_sz) {
    ssize_t hdr_len = parseFixed(from, msg_sz, MP_BGP, 4, "BgpCapabilityMpBgp");
    if (hdr_len < 0) return hdr_len;

    const uint8_t *buffer = from + hdr_len;
    afi = getU16(&buffer);

    uint8_t res = getValue<uint8_t>(&buffer);
    if (res != 0) {
        logger->log(WARN, "BgpCapabilityMpBgp::parse: reserved bits != 0.\n");
    }

    safi = getValue<uint8_t>(&buffer);

    return hdr_len + 4;
}

ssize_t BgpCapabilityMpBgp::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < 6) {
        logger->log(ERROR, "BgpCapabilityMpBgp::write: dest buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;
    putValue<uint8_t>(&buffer, MP_BGP);
    putValue<uint8_t>(&buffer, 4);
    putU16(&buffer, afi);
    putValue<uint8_t>(&buffer, 0);
    putValue<uint8_t>(&buffer, safi);

    return 6;
}

BgpCapabilityRouteRefresh::BgpCapabilityRouteRefresh(BgpLogHandler *logger) : BgpCapability(logger) {
    code = ROUTE_REFRESH;
}

ssize_t BgpCapabilityRouteRefresh::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "RouteRefreshCapability { }\n");
}

ssize_t BgpCapabilityRouteRefresh::parse(const uint8_t *from, size_t msg_sz) {
    return parseFixed(from, msg_sz, ROUTE_REFRESH, 0, "BgpCapabilityRouteRefresh");
}

ssize_t BgpCapabilityRouteRefresh::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < 2) {
        logger->log(ERROR, "BgpCapabilityRouteRefresh::write: dest buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;
    putValue<uint8_t>(&buffer, ROUTE_REFRESH);
    putValue<uint8_t>(&buffer, 0);

    return 2;
}

BgpCapabilityUnknown::BgpCapabilityUnknown(BgpLogHandler *logger) : BgpCapability(logger) {}

ssize_t BgpCapabilityUnknown::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "UnknownCapability { Code { %u } Length { %zu } }\n", code, value.size());
}

ssize_t BgpCapabilityUnknown::parse(const uint8_t *from, size_t msg_sz) {
    ssize_t hdr_len = parseHeader(from, msg_sz, 0);
    if (hdr_len < 0) return hdr_len;

    value.assign(from + hdr_len, from + hdr_len + length);

    return hdr_len + length;
}

ssize_t BgpCapabilityUnknown::write(uint8_t *to, size_t buf_sz) const {
    if (value.size() > 255) {
        logger->log(ERROR, "BgpCapabilityUnknown::write: value too long.\n");
        return -1;
    }

    if (buf_sz < value.size() + 2) {
        logger->log(ERROR, "BgpCapabilityUnknown::write: dest buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;
    putValue<uint8_t>(&buffer, code);
    putValue<uint8_t>(&buffer, value.size());
    if (value.size() > 0) memcpy(buffer, value.data(), value.size());

    return value.size() + 2;
}

}
