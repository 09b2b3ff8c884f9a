/**
 * @file bgp-notification-message.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP notification message.
 * @version 0.2
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_NOTIFICATION_MSG_H_
#define BGPD_NOTIFICATION_MSG_H_
#include <vector>
#include "bgp-message.h"

namespace bgpd {

/**
 * @brief The BgpNotificationMessage class.
 */
class BgpNotificationMessage : public BgpMessage {
public:
    BgpNotificationMessage(BgpLogHandler *logger);
    BgpNotificationMessage(BgpLogHandler *logger, uint8_t errcode, uint8_t subcode, const uint8_t *data, size_t data_len);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    uint8_t errcode;
    uint8_t subcode;
    std::vector<uint8_t> data;
};

}

#endif // BGPD_NOTIFICATION_MSG_H_
