/**
 * @file bgp-path-attrib.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief BGP path attributes.
 * @version 0.3
 * @date 2019-08-04
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-path-attrib.h"
#include "bgp-errcode.h"
#include "prefix4.h"
#include "value-op.h"

namespace bgpd {

#define BGPD_AS_TRANS_2B 23456

/**
 * @brief Get type of attribute from buffer.
 *
 * @param from Pointer to buffer.
 * @param buffer_sz Size of buffre.
 * @return uint8_t Attribute type.
 * @retval 0 Failed to get attribute type.
 * @retval >0 Attribute type.
 */
uint8_t BgpPathAttrib::GetTypeFromBuffer(const uint8_t *from, size_t buffer_sz) {
    if (buffer_sz < 3) return 0;
    return from[1];
}

/**
 * @brief Construct a new BgpPathAttrib object
 *
 * @param logger Pointer to logger object for error logging.
 */
BgpPathAttrib::BgpPathAttrib(BgpLogHandler *logger) : Serializable(logger) {
    optional = transitive = partial = extended = false;
    type_code = RESERVED;
    value_len = 0;
}

/**
 * @brief Construct an attribute of unknown type from raw value.
 *
 * @param logger Pointer to logger object for error logging.
 * @param type_code Type code.
 * @param value Pointer to value buffer.
 * @param val_len Length of the value buffer.
 * @throws "bad_value_buffer" val_len is not 0 but value is NULL.
 */
BgpPathAttrib::BgpPathAttrib(BgpLogHandler *logger, uint8_t type_code, const uint8_t *value, size_t val_len) : BgpPathAttrib(logger) {
    if (val_len > 0 && value == NULL) {
        logger->log(FATAL, "BgpPathAttrib::BgpPathAttrib: attribute created with length != 0 but buffer NULL.\n");
        throw "bad_value_buffer";
    }

    this->type_code = type_code;
    if (val_len > 0) this->value.assign(value, value + val_len);
    value_len = val_len;
}

BgpPathAttrib* BgpPathAttrib::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttrib::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }

    return new BgpPathAttrib(*this);
}

const std::vector<uint8_t>& BgpPathAttrib::getRawValue() const {
    return value;
}

size_t BgpPathAttrib::valueLength() const {
    return value.size();
}

ssize_t BgpPathAttrib::length() const {
    size_t vlen = valueLength();
    return vlen + ((extended || vlen > 0xff) ? 4 : 3);
}

ssize_t BgpPathAttrib::printFlags(size_t indent, char **to, size_t *buf_sz) const {
    size_t written = 0;

    if (!(transitive || optional || partial || extended)) {
        written += _print(indent, to, buf_sz, "Flags { }\n");
        return written;
    }

    written += _print(indent, to, buf_sz, "Flags {%s%s%s%s }\n",
        optional ? " Optional" : "", transitive ? " Transitive" : "",
        partial ? " Partial" : "", extended ? " Extended" : "");

    return written;
}

ssize_t BgpPathAttrib::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    size_t written = 0;

    written += _print(indent, to, buf_sz, "UnknownAttribute {\n");
    indent++; {
        written += printFlags(indent, to, buf_sz);
        written += _print(indent, to, buf_sz, "TypeCode { %u }\n", type_code);
        written += _print(indent, to, buf_sz, "Length { %zu }\n", value.size());
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");

    return written;
}

ssize_t BgpPathAttrib::parse(const uint8_t *from, size_t length) {
    ssize_t header_len = parseHeader(from, length, 0);
    if (header_len < 0) return -1;

    if (!optional) {
        setError(E_UPDATE, E_BAD_WELL_KNOWN, from, value_len + header_len);
        logger->log(ERROR, "BgpPathAttrib::parse: well-known attribute %u is not recognized.\n", type_code);
        return -1;
    }

    if (!transitive && partial) {
        setError(E_UPDATE, E_ATTR_FLAG, from, value_len + header_len);
        logger->log(ERROR, "BgpPathAttrib::parse: optional non-transitive attribute %u must not be partial.\n", type_code);
        return -1;
    }

    value.assign(from + header_len, from + header_len + value_len);

    return value_len + header_len;
}

ssize_t BgpPathAttrib::write(uint8_t *to, size_t buffer_sz) const {
    ssize_t hdr_len = writeHeader(to, buffer_sz, value.size());
    if (hdr_len < 0) return -1;

    if (buffer_sz < hdr_len + value.size()) {
        logger->log(ERROR, "BgpPathAttrib::write: destination buffer size too small.\n");
        return -1;
    }

    if (value.size() > 0) memcpy(to + hdr_len, value.data(), value.size());

    return hdr_len + value.size();
}

/**
 * @brief Utility function to parse attribute header. (Flag, type, length)
 *
 * @param from Pointer to buffer.
 * @param buffer_sz Size of buffer.
 * @param expected_type Type code the caller handles. 0 to accept any.
 * @return ssize_t Bytes read.
 * @retval -1 Failed to parse header.
 * @retval >=0 Bytes read.
 * @throws "bad_type" Type code mismatch.
 */
ssize_t BgpPathAttrib::parseHeader(const uint8_t *from, size_t buffer_sz, uint8_t expected_type) {
    if (buffer_sz < 3) {
        setError(E_UPDATE, E_ATTR_LIST, NULL, 0);
        logger->log(ERROR, "BgpPathAttrib::parseHeader: invalid attribute header size.\n");
        return -1;
    }

    const uint8_t *buffer = from;

    uint8_t flags = getValue<uint8_t>(&buffer);

    optional = (flags >> 7) & 0x1;
    transitive = (flags >> 6) & 0x1;
    partial = (flags >> 5) & 0x1;
    extended = (flags >> 4) & 0x1;
    type_code = getValue<uint8_t>(&buffer);

    if (expected_type != 0 && type_code != expected_type) {
        logger->log(FATAL, "BgpPathAttrib::parseHeader: type %u in header mismatch with object type %u.\n", type_code, expected_type);
        throw "bad_type";
    }

    if (extended && buffer_sz < 4) {
        setError(E_UPDATE, E_ATTR_LIST, NULL, 0);
        logger->log(ERROR, "BgpPathAttrib::parseHeader: invalid attribute header size (extended but size < 4).\n");
        return -1;
    }

    if (extended) value_len = getU16(&buffer);
    else value_len = getValue<uint8_t>(&buffer);

    size_t header_len = extended ? 4 : 3;

    if (value_len > buffer_sz - header_len) {
        setError(E_UPDATE, E_ATTR_LEN, NULL, 0);
        logger->log(ERROR, "BgpPathAttrib::parseHeader: value_length (%u) > buffer left (%zu).\n", value_len, buffer_sz - header_len);
        return -1;
    }

    return header_len;
}

bool BgpPathAttrib::checkFlags(const uint8_t *from, size_t header_len, bool want_optional, bool want_transitive, const char *name) {
    bool bad = optional != want_optional || transitive != want_transitive;

    // partial is only meaningful for optional transitive attributes.
    if (!(want_optional && want_transitive) && partial) bad = true;

    if (bad) {
        logger->log(ERROR, "%s::parse: bad flag bits, must be %soptional, %stransitive%s.\n", name,
            want_optional ? "" : "!", want_transitive ? "" : "!",
            (want_optional && want_transitive) ? "" : ", !partial");
        setError(E_UPDATE, E_ATTR_FLAG, from, value_len + header_len);
        return false;
    }

    return true;
}

bool BgpPathAttrib::checkLength(const uint8_t *from, size_t header_len, size_t want_len, const char *name) {
    if (value_len != want_len) {
        logger->log(ERROR, "%s::parse: bad length, want %zu, saw %u.\n", name, want_len, value_len);
        setError(E_UPDATE, E_ATTR_LEN, from, value_len + header_len);
        return false;
    }

    return true;
}

/**
 * @brief Write attribute header to buffer. (Flag, Type, Length)
 *
 * The extended length bit is set when the value does not fit in one octet
 * length field or when the attribute was received with it.
 *
 * @param to Destnation buiffer.
 * @param buffer_sz Max write size.
 * @param value_len Length of the value that follows.
 * @return ssize_t Bytes written.
 * @retval -1 Failed to write buffer.
 * @retval >=0 Bytes written.
 */
ssize_t BgpPathAttrib::writeHeader(uint8_t *to, size_t buffer_sz, size_t value_len) const {
    if (value_len > 0xffff) {
        logger->log(ERROR, "BgpPathAttrib::writeHeader: value too long: %zu\n", value_len);
        return -1;
    }

    bool ext = extended || value_len > 0xff;

    if (buffer_sz < (size_t) (ext ? 4 : 3)) {
        logger->log(ERROR, "BgpPathAttrib::writeHeader: dst buffer too small: %zu\n", buffer_sz);
        return -1;
    }

    uint8_t *buffer = to;
    uint8_t flags = (optional << 7) | (transitive << 6) | (partial << 5) | (ext << 4);
    putValue<uint8_t>(&buffer, flags);
    putValue<uint8_t>(&buffer, type_code);
    if (ext) putU16(&buffer, value_len);
    else putValue<uint8_t>(&buffer, value_len);

    return ext ? 4 : 3;
}

const char* originToString(uint8_t origin) {
    switch (origin) {
        case IGP: return "IGP";
        case EGP: return "EGP";
        case INCOMPLETE: return "Incomplete";
        default: return "Invalid";
    }
}

BgpPathAttribOrigin::BgpPathAttribOrigin(BgpLogHandler *logger) : BgpPathAttrib(logger) {
    transitive = true;
    type_code = ORIGIN;
    origin = IGP;
}

BgpPathAttribOrigin::BgpPathAttribOrigin(BgpLogHandler *logger, uint8_t origin) : BgpPathAttribOrigin(logger) {
    this->origin = origin;
}

BgpPathAttrib* BgpPathAttribOrigin::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribOrigin::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribOrigin(*this);
}

size_t BgpPathAttribOrigin::valueLength() const {
    return 1;
}

ssize_t BgpPathAttribOrigin::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "OriginAttribute { Origin { %s } }\n", originToString(origin));
}

ssize_t BgpPathAttribOrigin::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, ORIGIN);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, false, true, "BgpPathAttribOrigin")) return -1;
    if (!checkLength(from, header_length, 1, "BgpPathAttribOrigin")) return -1;

    const uint8_t *buffer = from + header_length;
    origin = getValue<uint8_t>(&buffer);

    if (origin > INCOMPLETE) {
        setError(E_UPDATE, E_ORIGIN, from, header_length + 1);
        logger->log(ERROR, "BgpPathAttribOrigin::parse: bad origin value: %u.\n", origin);
        return -1;
    }

    return header_length + 1;
}

ssize_t BgpPathAttribOrigin::write(uint8_t *to, size_t buffer_sz) const {
    ssize_t hdr_len = writeHeader(to, buffer_sz, 1);
    if (hdr_len < 0 || buffer_sz < (size_t) hdr_len + 1) {
        logger->log(ERROR, "BgpPathAttribOrigin::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;
    putValue<uint8_t>(&buffer, origin);

    return hdr_len + 1;
}

BgpAsPathSegment::BgpAsPathSegment(uint8_t type) {
    this->type = type;
}

/**
 * @brief Prepend ASN to AS segment.
 *
 * @param asn ASN to prepend.
 * @return true ASN prepended.
 * @return false Segment full.
 */
bool BgpAsPathSegment::prepend(uint32_t asn) {
    if (value.size() >= 255) return false;
    value.insert(value.begin(), asn);
    return true;
}

BgpPathAttribAsPath::BgpPathAttribAsPath(BgpLogHandler *logger, bool is_4b) : BgpPathAttrib(logger) {
    this->is_4b = is_4b;
    transitive = true;
    type_code = AS_PATH;
}

BgpPathAttrib* BgpPathAttribAsPath::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribAsPath::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribAsPath(*this);
}

/**
 * @brief Prepend an ASN into AS path.
 *
 * The ASN goes into the leading AS_SEQUENCE. A new AS_SEQUENCE is put in
 * front when the path is empty, starts with another segment type, or the
 * leading sequence is full (RFC 4271 5.1.2).
 *
 * @param asn The ASN to prepend.
 * @return true ASN prepended.
 */
bool BgpPathAttribAsPath::prepend(uint32_t asn) {
    if (as_paths.size() == 0 || as_paths.front().type != AS_SEQUENCE || !as_paths.front().prepend(asn)) {
        BgpAsPathSegment segment(AS_SEQUENCE);
        segment.value.push_back(asn);
        as_paths.insert(as_paths.begin(), segment);
    }

    return true;
}

size_t BgpPathAttribAsPath::getPathLength() const {
    size_t len = 0;

    for (const BgpAsPathSegment &seg : as_paths) {
        if (seg.type == AS_SEQUENCE) len += seg.value.size();
        else if (seg.type == AS_SET) len += 1;
    }

    return len;
}

uint32_t BgpPathAttribAsPath::getFirstAsn() const {
    for (const BgpAsPathSegment &seg : as_paths) {
        if (seg.type == AS_CONFED_SEQUENCE || seg.type == AS_CONFED_SET) continue;
        if (seg.type == AS_SEQUENCE && seg.value.size() > 0) return seg.value.front();
        return 0;
    }

    return 0;
}

size_t BgpPathAttribAsPath::countAsn(uint32_t asn) const {
    size_t n = 0;

    for (const BgpAsPathSegment &seg : as_paths) {
        for (uint32_t a : seg.value) {
            if (a == asn) n++;
        }
    }

    return n;
}

std::string BgpPathAttribAsPath::toString() const {
    std::string str;

    for (const BgpAsPathSegment &seg : as_paths) {
        const char *open = "", *close = "";
        switch (seg.type) {
            case AS_SET: open = "{"; close = "}"; break;
            case AS_CONFED_SEQUENCE: open = "("; close = ")"; break;
            case AS_CONFED_SET: open = "["; close = "]"; break;
        }

        if (str.size() > 0) str += " ";
        str += open;
        for (size_t i = 0; i < seg.value.size(); i++) {
            if (i > 0) str += " ";
            str += std::to_string(seg.value[i]);
        }
        str += close;
    }

    return str;
}

size_t BgpPathAttribAsPath::valueLength() const {
    size_t len = 0;

    for (const BgpAsPathSegment &seg : as_paths) {
        len += (is_4b ? 4 : 2) * seg.value.size() + 2;
    }

    return len;
}

ssize_t BgpPathAttribAsPath::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    size_t written = 0;
    written += _print(indent, to, buf_sz, "AsPathAttribute {\n");
    indent++; {
        written += _print(indent, to, buf_sz, "FourOctet { %s }\n", is_4b ? "true" : "false");
        written += _print(indent, to, buf_sz, "AsPath { %s }\n", toString().c_str());
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");

    return written;
}

ssize_t BgpPathAttribAsPath::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, AS_PATH);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, false, true, "BgpPathAttribAsPath")) return -1;

    const uint8_t *buffer = from + header_length;
    size_t asn_size = is_4b ? 4 : 2;
    size_t parsed_len = 0;

    while (parsed_len < value_len) {
        if (value_len - parsed_len < 2) {
            logger->log(ERROR, "BgpPathAttribAsPath::parse: incomplete as_path segment.\n");
            setError(E_UPDATE, E_AS_PATH, NULL, 0);
            return -1;
        }

        uint8_t type = getValue<uint8_t>(&buffer);
        uint8_t n_asn = getValue<uint8_t>(&buffer);
        parsed_len += 2;

        if (type < AS_SET || type > AS_CONFED_SET) {
            logger->log(ERROR, "BgpPathAttribAsPath::parse: bad segment type %u.\n", type);
            setError(E_UPDATE, E_AS_PATH, NULL, 0);
            return -1;
        }

        if (n_asn == 0) {
            logger->log(ERROR, "BgpPathAttribAsPath::parse: empty segment.\n");
            setError(E_UPDATE, E_AS_PATH, NULL, 0);
            return -1;
        }

        size_t asns_length = n_asn * asn_size;

        if (parsed_len + asns_length > value_len) {
            logger->log(ERROR, "BgpPathAttribAsPath::parse: as_path overflow attribute length.\n");
            setError(E_UPDATE, E_AS_PATH, NULL, 0);
            return -1;
        }

        BgpAsPathSegment path(type);
        for (int i = 0; i < n_asn; i++) {
            path.value.push_back(is_4b ? getU32(&buffer) : getU16(&buffer));
        }
        as_paths.push_back(path);

        parsed_len += asns_length;
    }

    return header_length + parsed_len;
}

ssize_t BgpPathAttribAsPath::write(uint8_t *to, size_t buffer_sz) const {
    size_t vlen = valueLength();
    ssize_t hdr_len = writeHeader(to, buffer_sz, vlen);
    if (hdr_len < 0 || buffer_sz < hdr_len + vlen) {
        logger->log(ERROR, "BgpPathAttribAsPath::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;

    for (const BgpAsPathSegment &seg : as_paths) {
        if (seg.value.size() > 255 || seg.value.size() == 0) {
            logger->log(ERROR, "BgpPathAttribAsPath::write: bad segment size: %zu\n", seg.value.size());
            return -1;
        }

        putValue<uint8_t>(&buffer, seg.type);
        putValue<uint8_t>(&buffer, seg.value.size());

        for (uint32_t asn : seg.value) {
            if (is_4b) putU32(&buffer, asn);
            else putU16(&buffer, asn > 0xffff ? BGPD_AS_TRANS_2B : asn);
        }
    }

    return hdr_len + vlen;
}

BgpPathAttribNexthop::BgpPathAttribNexthop(BgpLogHandler *logger) : BgpPathAttrib(logger) {
    type_code = NEXT_HOP;
    transitive = true;
    next_hop = 0;
}

BgpPathAttribNexthop::BgpPathAttribNexthop(BgpLogHandler *logger, uint32_t next_hop) : BgpPathAttribNexthop(logger) {
    this->next_hop = next_hop;
}

BgpPathAttrib* BgpPathAttribNexthop::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribNexthop::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribNexthop(*this);
}

size_t BgpPathAttribNexthop::valueLength() const {
    return 4;
}

ssize_t BgpPathAttribNexthop::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "NexthopAttribute { Nexthop { %s } }\n", ipToString(next_hop).c_str());
}

ssize_t BgpPathAttribNexthop::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, NEXT_HOP);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, false, true, "BgpPathAttribNexthop")) return -1;
    if (!checkLength(from, header_length, 4, "BgpPathAttribNexthop")) return -1;

    const uint8_t *buffer = from + header_length;
    next_hop = getValue<uint32_t>(&buffer);

    return header_length + 4;
}

ssize_t BgpPathAttribNexthop::write(uint8_t *to, size_t buffer_sz) const {
    ssize_t hdr_len = writeHeader(to, buffer_sz, 4);
    if (hdr_len < 0 || buffer_sz < (size_t) hdr_len + 4) {
        logger->log(ERROR, "BgpPathAttribNexthop::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;
    putValue<uint32_t>(&buffer, next_hop);

    return hdr_len + 4;
}

BgpPathAttribMed::BgpPathAttribMed(BgpLogHandler *logger) : BgpPathAttrib(logger) {
    type_code = MULTI_EXIT_DISC;
    optional = true;
    med = 0;
}

BgpPathAttribMed::BgpPathAttribMed(BgpLogHandler *logger, uint32_t med) : BgpPathAttribMed(logger) {
    this->med = med;
}

BgpPathAttrib* BgpPathAttribMed::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribMed::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribMed(*this);
}

size_t BgpPathAttribMed::valueLength() const {
    return 4;
}

ssize_t BgpPathAttribMed::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "MedAttribute { Med { %u } }\n", med);
}

ssize_t BgpPathAttribMed::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, MULTI_EXIT_DISC);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, true, false, "BgpPathAttribMed")) return -1;
    if (!checkLength(from, header_length, 4, "BgpPathAttribMed")) return -1;

    const uint8_t *buffer = from + header_length;
    med = getU32(&buffer);

    return header_length + 4;
}

ssize_t BgpPathAttribMed::write(uint8_t *to, size_t buffer_sz) const {
    ssize_t hdr_len = writeHeader(to, buffer_sz, 4);
    if (hdr_len < 0 || buffer_sz < (size_t) hdr_len + 4) {
        logger->log(ERROR, "BgpPathAttribMed::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;
    putU32(&buffer, med);

    return hdr_len + 4;
}

BgpPathAttribLocalPref::BgpPathAttribLocalPref(BgpLogHandler *logger) : BgpPathAttrib(logger) {
    type_code = LOCAL_PREF;
    transitive = true;
    local_pref = 100;
}

BgpPathAttribLocalPref::BgpPathAttribLocalPref(BgpLogHandler *logger, uint32_t local_pref) : BgpPathAttribLocalPref(logger) {
    this->local_pref = local_pref;
}

BgpPathAttrib* BgpPathAttribLocalPref::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribLocalPref::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribLocalPref(*this);
}

size_t BgpPathAttribLocalPref::valueLength() const {
    return 4;
}

ssize_t BgpPathAttribLocalPref::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "LocalPrefAttribute { LocalPref { %u } }\n", local_pref);
}

ssize_t BgpPathAttribLocalPref::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, LOCAL_PREF);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, false, true, "BgpPathAttribLocalPref")) return -1;
    if (!checkLength(from, header_length, 4, "BgpPathAttribLocalPref")) return -1;

    const uint8_t *buffer = from + header_length;
    local_pref = getU32(&buffer);

    return header_length + 4;
}

ssize_t BgpPathAttribLocalPref::write(uint8_t *to, size_t buffer_sz) const {
    ssize_t hdr_len = writeHeader(to, buffer_sz, 4);
    if (hdr_len < 0 || buffer_sz < (size_t) hdr_len + 4) {
        logger->log(ERROR, "BgpPathAttribLocalPref::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;
    putU32(&buffer, local_pref);

    return hdr_len + 4;
}

BgpPathAttribAtomicAggregate::BgpPathAttribAtomicAggregate(BgpLogHandler *logger) : BgpPathAttrib(logger) {
    type_code = ATOMIC_AGGREGATE;
    transitive = true;
}

BgpPathAttrib* BgpPathAttribAtomicAggregate::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribAtomicAggregate::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribAtomicAggregate(*this);
}

size_t BgpPathAttribAtomicAggregate::valueLength() const {
    return 0;
}

ssize_t BgpPathAttribAtomicAggregate::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "AtomicAggregateAttribute { }\n");
}

ssize_t BgpPathAttribAtomicAggregate::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, ATOMIC_AGGREGATE);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, false, true, "BgpPathAttribAtomicAggregate")) return -1;
    if (!checkLength(from, header_length, 0, "BgpPathAttribAtomicAggregate")) return -1;

    return header_length;
}

ssize_t BgpPathAttribAtomicAggregate::write(uint8_t *to, size_t buffer_sz) const {
    return writeHeader(to, buffer_sz, 0);
}

BgpPathAttribAggregator::BgpPathAttribAggregator(BgpLogHandler *logger, bool is_4b) : BgpPathAttrib(logger) {
    this->is_4b = is_4b;
    type_code = AGGREGATOR;
    optional = true;
    transitive = true;
    aggregator = 0;
    aggregator_asn = 0;
}

BgpPathAttrib* BgpPathAttribAggregator::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribAggregator::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribAggregator(*this);
}

size_t BgpPathAttribAggregator::valueLength() const {
    return is_4b ? 8 : 6;
}

ssize_t BgpPathAttribAggregator::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    return _print(indent, to, buf_sz, "AggregatorAttribute { Aggregator { %s } AggregatorAsn { %u } }\n",
        ipToString(aggregator).c_str(), aggregator_asn);
}

ssize_t BgpPathAttribAggregator::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, AGGREGATOR);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, true, true, "BgpPathAttribAggregator")) return -1;
    if (!checkLength(from, header_length, valueLength(), "BgpPathAttribAggregator")) return -1;

    const uint8_t *buffer = from + header_length;
    aggregator_asn = is_4b ? getU32(&buffer) : getU16(&buffer);
    aggregator = getValue<uint32_t>(&buffer);

    return header_length + valueLength();
}

ssize_t BgpPathAttribAggregator::write(uint8_t *to, size_t buffer_sz) const {
    size_t vlen = valueLength();
    ssize_t hdr_len = writeHeader(to, buffer_sz, vlen);
    if (hdr_len < 0 || buffer_sz < hdr_len + vlen) {
        logger->log(ERROR, "BgpPathAttribAggregator::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;
    if (is_4b) putU32(&buffer, aggregator_asn);
    else putU16(&buffer, aggregator_asn > 0xffff ? BGPD_AS_TRANS_2B : aggregator_asn);
    putValue<uint32_t>(&buffer, aggregator);

    return hdr_len + vlen;
}

BgpPathAttribCommunity::BgpPathAttribCommunity(BgpLogHandler *logger) : BgpPathAttrib(logger) {
    type_code = COMMUNITY;
    optional = true;
    transitive = true;
}

BgpPathAttrib* BgpPathAttribCommunity::clone() const {
    if (hasError()) {
        logger->log(FATAL, "BgpPathAttribCommunity::clone: can't clone an attribute with error.\n");
        throw "has_error";
    }
    return new BgpPathAttribCommunity(*this);
}

size_t BgpPathAttribCommunity::valueLength() const {
    return communities.size() * 4;
}

ssize_t BgpPathAttribCommunity::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    size_t written = 0;
    written += _print(indent, to, buf_sz, "CommunityAttribute {\n");
    indent++; {
        for (uint32_t c : communities) {
            written += _print(indent, to, buf_sz, "%u:%u\n", c >> 16, c & 0xffff);
        }
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");

    return written;
}

ssize_t BgpPathAttribCommunity::parse(const uint8_t *from, size_t length) {
    ssize_t header_length = parseHeader(from, length, COMMUNITY);
    if (header_length < 0) return -1;

    if (!checkFlags(from, header_length, true, true, "BgpPathAttribCommunity")) return -1;

    if (value_len % 4 != 0) {
        logger->log(ERROR, "BgpPathAttribCommunity::parse: bad length %u, not a multiple of 4.\n", value_len);
        setError(E_UPDATE, E_ATTR_LEN, from, value_len + header_length);
        return -1;
    }

    const uint8_t *buffer = from + header_length;
    for (size_t i = 0; i < value_len / 4; i++) {
        communities.push_back(getU32(&buffer));
    }

    return header_length + value_len;
}

ssize_t BgpPathAttribCommunity::write(uint8_t *to, size_t buffer_sz) const {
    size_t vlen = valueLength();
    ssize_t hdr_len = writeHeader(to, buffer_sz, vlen);
    if (hdr_len < 0 || buffer_sz < hdr_len + vlen) {
        logger->log(ERROR, "BgpPathAttribCommunity::write: destination buffer size too small.\n");
        return -1;
    }

    uint8_t *buffer = to + hdr_len;
    for (uint32_t c : communities) putU32(&buffer, c);

    return hdr_len + vlen;
}

}
