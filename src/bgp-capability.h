/**
 * @file bgp-capability.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief BGP OPEN message capabilities.
 * @version 0.3
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_CAPABILITY_H_
#define BGPD_CAPABILITY_H_
#include "serializable.h"
#include <stdint.h>
#include <vector>

namespace bgpd {

/**
 * @brief Address Family Identifiers.
 */
enum Afi {
    IPV4 = 1,
    IPV6 = 2
};

/**
 * @brief Subsequent Address Family Identifiers
 */
enum Safi {
    UNICAST = 1,
    MULTICAST = 2
};

/**
 * @brief BGP capability codes
 */
enum BgpCapabilityCode {
    MP_BGP = 1,
    ROUTE_REFRESH = 2,
    GRACEFUL_RESTART = 64,
    ASN_4B = 65,
    ENHANCED_ROUTE_REFRESH = 70
};

/**
 * @brief The BgpCapability base class.
 */
class BgpCapability : public Serializable {
public:
    BgpCapability(BgpLogHandler *logger);

    uint8_t code;
    virtual ~BgpCapability() {}

    virtual ssize_t parse(const uint8_t *from, size_t msg_sz) = 0;
    virtual ssize_t write(uint8_t *to, size_t buf_sz) const = 0;

protected:
    ssize_t parseHeader(const uint8_t *from, size_t msg_sz, uint8_t expected_code);
    ssize_t parseFixed(const uint8_t *from, size_t msg_sz, uint8_t expected_code, uint8_t expected_len, const char *name);

    // value length from the wire, only meaningful after parse().
    uint8_t length;
};

/**
 * @brief Four-octet AS number support (RFC 6793).
 */
class BgpCapability4BytesAsn : public BgpCapability {
public:
    BgpCapability4BytesAsn(BgpLogHandler *logger);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    uint32_t my_asn;
};

/**
 * @brief Multiprotocol extensions (RFC 4760).
 */
class BgpCapabilityMpBgp : public BgpCapability {
public:
    BgpCapabilityMpBgp(BgpLogHandler *logger);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    uint16_t afi;
    uint8_t safi;
};

/**
 * @brief Route refresh (RFC 2918). Carries no value.
 */
class BgpCapabilityRouteRefresh : public BgpCapability {
public:
    BgpCapabilityRouteRefresh(BgpLogHandler *logger);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;
};

/**
 * @brief Any capability we do not implement, kept as raw bytes.
 */
class BgpCapabilityUnknown : public BgpCapability {
public:
    BgpCapabilityUnknown(BgpLogHandler *logger);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    std::vector<uint8_t> value;
};

}

#endif // BGPD_CAPABILITY_H_
