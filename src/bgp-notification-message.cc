/**
 * @file bgp-notification-message.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP notification message.
 * @version 0.2
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-notification-message.h"
#include "bgp-errcode.h"
#include "value-op.h"

namespace bgpd {

BgpNotificationMessage::BgpNotificationMessage(BgpLogHandler *logger) : BgpMessage(logger, NOTIFICATION) {
    errcode = 0;
    subcode = 0;
}

/**
 * @brief Construct a new BgpNotificationMessage object
 * 
 * @param logger Pointer to logger object for error logging.
 * @param errcode Error code
 * @param subcode Error subcode
 * @param data The error data, may be NULL.
 * @param data_len Length of error data.
 */
BgpNotificationMessage::BgpNotificationMessage(BgpLogHandler *logger, uint8_t errcode, uint8_t subcode, const uint8_t *data, size_t data_len) : BgpMessage(logger, NOTIFICATION) {
    this->errcode = errcode;
    this->subcode = subcode;
    if (data != NULL && data_len > 0) this->data.assign(data, data + data_len);
}

ssize_t BgpNotificationMessage::parse(const uint8_t *from, size_t msg_sz) {
    if (msg_sz < 2) {
        uint8_t err_data[2];
        uint8_t *ptr = err_data;
        putU16(&ptr, msg_sz + 19);
        setError(E_HEADER, E_LENGTH, err_data, 2);
        logger->log(ERROR, "BgpNotificationMessage::parse: message too short.\n");
        return -1;
    }

    const uint8_t *buffer = from;

    errcode = getValue<uint8_t>(&buffer);
    subcode = getValue<uint8_t>(&buffer);
    data.assign(buffer, from + msg_sz);

    return msg_sz;
}

ssize_t BgpNotificationMessage::write(uint8_t *to, size_t buf_sz) const {
    if (buf_sz < data.size() + 2) {
        logger->log(ERROR, "BgpNotificationMessage::write: dst buffer too small.\n");
        return -1;
    }

    uint8_t *buffer = to;

    putValue<uint8_t>(&buffer, errcode);
    putValue<uint8_t>(&buffer, subcode);
    if (data.size() > 0) memcpy(buffer, data.data(), data.size());

    return data.size() + 2;
}

ssize_t BgpNotificationMessage::doPrint(size_t indent, char **to, size_t *buf_sz) const {
    size_t written = 0;

    written += _print(indent, to, buf_sz, "NotificationMessage {\n");
    indent++; {
        written += _print(indent, to, buf_sz, "Error { %s }\n", bgpErrorCodeToString(errcode));
        written += _print(indent, to, buf_sz, "SubError { %s }\n", bgpErrorSubcodeToString(errcode, subcode));
        if (data.size() > 0) written += _print(indent, to, buf_sz, "DataLength { %zu }\n", data.size());
    }; indent--;
    written += _print(indent, to, buf_sz, "}\n");

    return written;
}

}
