/**
 * @file bgp-path-attrib.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief BGP path attributes.
 * @version 0.3
 * @date 2019-08-04
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_PATH_ATTR_H_
#define BGPD_PATH_ATTR_H_

#include "serializable.h"
#include <stdint.h>
#include <unistd.h>
#include <string>
#include <vector>

namespace bgpd {

/**
 * @brief BGP attribute type codes.
 */
enum BgpPathAttribType {
    RESERVED = 0,
    ORIGIN = 1,
    AS_PATH = 2,
    NEXT_HOP = 3,
    MULTI_EXIT_DISC = 4,
    LOCAL_PREF = 5,
    ATOMIC_AGGREGATE = 6,
    AGGREGATOR = 7,
    COMMUNITY = 8
};

/**
 * @brief The BgpPathAttrib class.
 *
 * The base class is also the container of attributes we do not understand.
 * Their value is carried as raw bytes so optional transitive attributes can
 * be passed on with the partial bit set.
 */
class BgpPathAttrib : public Serializable {
public:
    bool optional;
    bool transitive;
    bool partial;
    bool extended;

    uint8_t type_code;

    BgpPathAttrib(BgpLogHandler *logger);
    BgpPathAttrib(BgpLogHandler *logger, uint8_t type_code, const uint8_t *value, size_t val_len);

    // get attribute type from buffer, return 0 if failed.
    static uint8_t GetTypeFromBuffer(const uint8_t *buffer, size_t buffer_sz);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

    /**
     * @brief Deserialize a path attribute (header included).
     *
     * @param from Pointer to the attribute.
     * @param msg_sz Bytes left in the attribute list.
     * @return ssize_t Bytes read.
     * @retval -1 Deserialization error.
     * @retval >=0 Bytes read.
     * @throws "bad_type" The type code in the buffer does not match the
     * attribute class.
     */
    virtual ssize_t parse(const uint8_t *from, size_t msg_sz);

    /**
     * @brief Serialize a path attribute (header included).
     *
     * @param to Pointer to destination buffer.
     * @param buf_sz Max write size.
     * @return ssize_t Bytes written.
     * @retval -1 Serialization error.
     * @retval >=0 Bytes written.
     */
    virtual ssize_t write(uint8_t *to, size_t buf_sz) const;

    ssize_t length() const;

    /**
     * @brief Clone the attribute.
     *
     * @return BgpPathAttrib* The clone, owned by the caller.
     * @throws "has_error" The attribute failed to parse.
     */
    virtual BgpPathAttrib* clone() const;

    const std::vector<uint8_t>& getRawValue() const;

    virtual ~BgpPathAttrib() {}

protected:
    // size of the value part, used to pick the length field size.
    virtual size_t valueLength() const;

    // parse flags, typecode and length. checks type_code when expected_type
    // is not 0.
    ssize_t parseHeader(const uint8_t *buffer, size_t length, uint8_t expected_type);

    // check the well-known/optional and transitive bits against the rules of
    // the attribute type. sets E_ATTR_FLAG on mismatch.
    bool checkFlags(const uint8_t *from, size_t header_len, bool want_optional, bool want_transitive, const char *name);

    // check value_len against a fixed length. sets E_ATTR_LEN on mismatch.
    bool checkLength(const uint8_t *from, size_t header_len, size_t want_len, const char *name);

    ssize_t printFlags(size_t indent, char **to, size_t *buf_sz) const;

    // write flags, type code and length. returns the header size.
    ssize_t writeHeader(uint8_t *buffer, size_t buffer_sz, size_t value_len) const;

    // length field from the wire, only meaningful after parse().
    uint16_t value_len;

private:
    std::vector<uint8_t> value;
};

/**
 * @brief BGP origin path attribute values
 */
enum BgpPathAttribOrigins {
    IGP = 0,
    EGP = 1,
    INCOMPLETE = 2
};

const char* originToString(uint8_t origin);

/**
 * @brief Origin Attribute
 */
class BgpPathAttribOrigin : public BgpPathAttrib {
public:
    BgpPathAttribOrigin(BgpLogHandler *logger);
    BgpPathAttribOrigin(BgpLogHandler *logger, uint8_t origin);
    uint8_t origin;

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief `AS_PATH` segment types.
 */
enum BgpAsPathSegmentType {
    AS_SET = 1,
    AS_SEQUENCE = 2,
    AS_CONFED_SEQUENCE = 3,
    AS_CONFED_SET = 4
};

/**
 * @brief An AS_PATH segment. ASNs are kept as four octets values.
 */
class BgpAsPathSegment {
public:
    BgpAsPathSegment(uint8_t type);

    uint8_t type;
    std::vector<uint32_t> value;

    bool prepend(uint32_t asn);
};

/**
 * @brief AS Path attribute.
 *
 * is_4b only selects the encoding on the wire. In two octets mode, ASNs that
 * do not fit are written as AS_TRANS.
 */
class BgpPathAttribAsPath : public BgpPathAttrib {
public:
    BgpPathAttribAsPath(BgpLogHandler *logger, bool is_4b);

    BgpPathAttrib* clone() const;

    std::vector<BgpAsPathSegment> as_paths;
    bool is_4b;

    bool prepend(uint32_t asn);

    // path length for the decision process: a set counts as one, confed
    // segments count as zero.
    size_t getPathLength() const;

    // first ASN of the path (the neighbor AS), 0 if there is none.
    uint32_t getFirstAsn() const;

    // number of times an ASN appears in the path.
    size_t countAsn(uint32_t asn) const;

    // "65001 65002 {65003 65004}"
    std::string toString() const;

    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief Nexthop attribute.
 */
class BgpPathAttribNexthop : public BgpPathAttrib {
public:
    BgpPathAttribNexthop(BgpLogHandler *logger);
    BgpPathAttribNexthop(BgpLogHandler *logger, uint32_t next_hop);

    // network byte order
    uint32_t next_hop;

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief Multi Exit Discriminator attribute
 */
class BgpPathAttribMed : public BgpPathAttrib {
public:
    BgpPathAttribMed(BgpLogHandler *logger);
    BgpPathAttribMed(BgpLogHandler *logger, uint32_t med);

    uint32_t med;

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief Local Pref attribute.
 */
class BgpPathAttribLocalPref : public BgpPathAttrib {
public:
    BgpPathAttribLocalPref(BgpLogHandler *logger);
    BgpPathAttribLocalPref(BgpLogHandler *logger, uint32_t local_pref);

    uint32_t local_pref;

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief Atomic aggregate attribute.
 */
class BgpPathAttribAtomicAggregate : public BgpPathAttrib {
public:
    BgpPathAttribAtomicAggregate(BgpLogHandler *logger);

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief Aggregator attribute.
 */
class BgpPathAttribAggregator : public BgpPathAttrib {
public:
    BgpPathAttribAggregator(BgpLogHandler *logger, bool is_4b);

    // network byte order
    uint32_t aggregator;
    uint32_t aggregator_asn;
    bool is_4b;

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

/**
 * @brief BGP community attribute (RFC 1997).
 */
class BgpPathAttribCommunity : public BgpPathAttrib {
public:
    BgpPathAttribCommunity(BgpLogHandler *logger);

    // host byte order, high 16 bits are the ASN.
    std::vector<uint32_t> communities;

    BgpPathAttrib* clone() const;
    ssize_t parse(const uint8_t *buffer, size_t length);
    ssize_t write(uint8_t *buffer, size_t buffer_sz) const;
    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;

protected:
    size_t valueLength() const;
};

}
#endif // BGPD_PATH_ATTR_H_
