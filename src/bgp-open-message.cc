/**
 * @file bgp-open-message.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP open message.
 * @version 0.3
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-open-message.h"
#include "bgp-errcode.h"
#include "prefix4.h"
#include "value-op.h"

namespace bgpd {

/**
 * @brief Construct a new BgpOpenMessage object for parsing.
 * 
 * @param logger Pointer to logger object for error logging.
 * @param use_4b_asn Enable four octets ASN support.
 */
BgpOpenMessage::BgpOpenMessage(BgpLogHandler *logger, bool use_4b_asn) : BgpMessage(logger, OPEN) {
    version = 4;
    my_asn = 0;
    hold_time = 0;
    bgp_id = 0;
    this->use_4b_asn = use_4b_asn;
}

/**
 * @brief Construct a new BgpOpenMessage object for sending.
 * 
 * @param logger Pointer to logger object for error logging.
 * @param use_4b_asn Enable four octets ASN support.
 * @param my_asn Local ASN. ASNs above 65535 need use_4b_asn.
 * @param hold_time Hold timer.
 * @param bgp_id Local BGP ID in network byte order
 */
BgpOpenMessage::BgpOpenMessage(BgpLogHandler *logger, bool use_4b_asn, uint32_t my_asn, uint16_t hold_time, uint32_t bgp_id) : BgpOpenMessage(logger, use_4b_asn) {
    this->hold_time = hold_time;
    this->bgp_id = bgp_id;
    setAsn(my_asn);
}

/**
 * @brief Parse the capabilities inside one optional parameter.
 * 
 * @return ssize_t Bytes read.
 * @retval -1 Parse error.
 */
ssize_t BgpOpenMessage::parseCapabilities(const uint8_t *from, uint8_t param_length) {
    const uint8_t *buffer = from;
    size_t parsed = 0;

    while (parsed < param_length) {
        size_t left = param_length - parsed;
        if (left < 2) {
            setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
            logger->log(ERROR, "BgpOpenMessage::parseCapabilities: unexpected end of capability list.\n");
            return -1;
        }

        BgpCapability *cap = NULL;

        switch (buffer[0]) {
            case ASN_4B: cap = new BgpCapability4BytesAsn(logger); break;
            case MP_BGP: cap = new BgpCapabilityMpBgp(logger); break;
            case ROUTE_REFRESH: cap = new BgpCapabilityRouteRefresh(logger); break;
            default: cap = new BgpCapabilityUnknown(logger); break;
        }

        std::shared_ptr<BgpCapability> cap_ptr(cap);
        ssize_t cap_len = cap->parse(buffer, left);

        if (cap_len < 0) {
            forwardParseError(*cap);
            return -1;
        }

        capabilities.push_back(cap_ptr);
        parsed += cap_len;
        buffer += cap_len;
    }

    return parsed;
}

/**
 * @brief Parse a BGP open message body.
 * 
 * @param from Pointer to message body buffer.
 * @param msg_sz Size of message.
 * @return ssize_t Bytes read.
 * @retval -1 Parse error.
 * @retval >=0 Bytes read.
 */
ssize_t BgpOpenMessage::parse(const uint8_t *from, size_t msg_sz) {
    if (msg_sz < 10) {
        uint8_t err_data[2];
        uint8_t *ptr = err_data;
        putU16(&ptr, msg_sz + 19);
        setError(E_HEADER, E_LENGTH, err_data, 2);
        logger->log(ERROR, "BgpOpenMessage::parse: invalid open message size: %zu.\n", msg_sz);
        return -1;
    }

    const uint8_t *buffer = from;

    version = getValue<uint8_t>(&buffer);
    my_asn = getU16(&buffer);
    hold_time = getU16(&buffer);
    bgp_id = getValue<uint32_t>(&buffer);

    uint8_t opt_params_len = getValue<uint8_t>(&buffer);

    if ((size_t) opt_params_len != msg_sz - 10) {
        setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
        logger->log(ERROR, "BgpOpenMessage::parse: size of rest of message (%zu) != length of opt_param (%u).\n", msg_sz - 10, opt_params_len);
        return -1;
    }

    size_t parsed = 0;

    while (parsed < opt_params_len) {
        if (opt_params_len - parsed < 2) {
            setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
            logger->log(ERROR, "BgpOpenMessage::parse: unexpected end of opt param list.\n");
            return -1;
        }

        uint8_t param_type = getValue<uint8_t>(&buffer);
        uint8_t param_length = getValue<uint8_t>(&buffer);
        parsed += 2;

        if (parsed + param_length > opt_params_len) {
            setError(E_OPEN, E_UNSPEC_OPEN, NULL, 0);
            logger->log(ERROR, "BgpOpenMessage::parse: opt param size exceed opt_params_len.\n");
            return -1;
        }

        // 2: capabilities (RFC 5492). nothing else is supported.
        if (param_type != 2) {
            setError(E_OPEN, E_OPT_PARAM, NULL, 0);
            logger->log(ERROR, "BgpOpenMessage::parse: unknown opt param type: %u.\n", param_type);
            return -1;
        }

        ssize_t caps_len = parseCapabilities(buffer, param_length);
        if (caps_len < 0) return -1;

        buffer += caps_len;
        parsed += caps_len;
    }

    return parsed + 10;
}

ssize_t BgpOpenMessage::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < 10) {
        logger->log(ERROR, "BgpOpenMessage::write: buffer size too small (need 10, avaliable %zu).\n", buf_sz);
        return -1;
    }

    uint8_t *buffer = to;

    putValue<uint8_t>(&buffer, version);
    putU16(&buffer, my_asn);
    putU16(&buffer, hold_time);
    putValue<uint32_t>(&buffer, bgp_id);

    if (capabilities.size() == 0) {
        putValue<uint8_t>(&buffer, 0);
        return 10;
    }

    uint8_t *params_len_ptr = buffer++;

    if (buf_sz < 12) {
        logger->log(ERROR, "BgpOpenMessage::write: buffer size too small.\n");
        return -1;
    }

    // all capabilities go into a single opt param of type 2.
    putValue<uint8_t>(&buffer, 2);
    uint8_t *param_len_ptr = buffer++;

    size_t caps_len = 0;
    for (const std::shared_ptr<BgpCapability> &capa : capabilities) {
        ssize_t capa_wrt_ret = capa->write(buffer, buf_sz - 12 - caps_len);
        if (capa_wrt_ret < 0) return capa_wrt_ret;

        caps_len += capa_wrt_ret;
        buffer += capa_wrt_ret;
    }

    if (caps_len > 253) {
        logger->log(ERROR, "BgpOpenMessage::write: capabilities too long (%zu bytes).\n", caps_len);
        return -1;
    }

    putValue<uint8_t>(&param_len_ptr, caps_len);
    putValue<uint8_t>(&params_len_ptr, caps_len + 2);

    return caps_len + 12;
}

ssize_t BgpOpenMessage::doPrint(size_t indent, char **to, size_t *buf_left) const {
    size_t written = 0;
    written += _print(indent, to, buf_left, "OpenMessage {\n");

    indent++; {
        written += _print(indent, to, buf_left, "Version { %u }\n", version);
        written += _print(indent, to, buf_left, "MyAsn { %u }\n", my_asn);
        written += _print(indent, to, buf_left, "BgpId { %s }\n", ipToString(bgp_id).c_str());
        written += _print(indent, to, buf_left, "HoldTimer { %u }\n", hold_time);
        if (capabilities.size() == 0) written += _print(indent, to, buf_left, "Capabilities { }\n");
        else {
            written += _print(indent, to, buf_left, "Capabilities {\n");
            indent++; {
                for (const std::shared_ptr<BgpCapability> &capa : capabilities) {
                    ssize_t capa_written = capa->print(indent, *to, *buf_left);
                    if (capa_written < 0) return capa_written;
                    *to += capa_written;
                    *buf_left -= capa_written;
                    written += capa_written;
                }
            }; indent--;
            written += _print(indent, to, buf_left, "}\n");
        }
    }; indent--;

    written += _print(indent, to, buf_left, "}\n");

    return written;
}

uint32_t BgpOpenMessage::getAsn() const {
    if (!use_4b_asn) return my_asn;

    for (const std::shared_ptr<BgpCapability> &capa : capabilities) {
        if (capa->code == ASN_4B) {
            const BgpCapability4BytesAsn &as4_cap = dynamic_cast<const BgpCapability4BytesAsn &>(*capa);
            return as4_cap.my_asn;
        }
    }

    return my_asn;
}

/**
 * @brief Set ASN.
 * 
 * @param my_asn ASN
 * @return true ASN set
 * @return false ASN does not fit in two octets and 4b mode is off.
 */
bool BgpOpenMessage::setAsn(uint32_t my_asn) {
    if (my_asn > 0xffff && !use_4b_asn) {
        logger->log(ERROR, "BgpOpenMessage::setAsn: ASN %u needs four-octet ASN support.\n", my_asn);
        return false;
    }

    this->my_asn = my_asn > 0xffff ? BGPD_AS_TRANS : my_asn;

    if (!use_4b_asn) return true;
    
    for (std::shared_ptr<BgpCapability> &capa : capabilities) {
        if (capa->code == ASN_4B) {
            BgpCapability4BytesAsn &as4_cap = dynamic_cast<BgpCapability4BytesAsn &>(*capa);
            as4_cap.my_asn = my_asn;
            return true;
        }
    }

    BgpCapability4BytesAsn *as4_cap = new BgpCapability4BytesAsn(logger);
    as4_cap->my_asn = my_asn;

    capabilities.push_back(std::shared_ptr<BgpCapability>(as4_cap));

    return true;
}

bool BgpOpenMessage::hasCapability(uint8_t code) const {
    for (const std::shared_ptr<BgpCapability> &cap : capabilities) {
        if (cap->code == code) return true;
    }

    return false;
}

const std::vector<std::shared_ptr<BgpCapability>>& BgpOpenMessage::getCapabilities() const {
    return capabilities;
}

bool BgpOpenMessage::addCapability(std::shared_ptr<BgpCapability> capability) {
    capabilities.push_back(capability);
    return true;
}

}
