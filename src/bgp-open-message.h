/**
 * @file bgp-open-message.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP open message.
 * @version 0.3
 * @date 2019-08-03
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_OPEN_MSG_H_
#define BGPD_OPEN_MSG_H_
#include <vector>
#include <memory>
#include <unistd.h>
#include "bgp-message.h"
#include "bgp-capability.h"

namespace bgpd {

// AS_TRANS (RFC 6793), sent in the 2-octet field when the real ASN is bigger.
#define BGPD_AS_TRANS 23456

/**
 * @brief The BgpOpenMessage class.
 */
class BgpOpenMessage : public BgpMessage {
public:
    BgpOpenMessage(BgpLogHandler *logger, bool use_4b_asn);
    BgpOpenMessage(BgpLogHandler *logger, bool use_4b_asn, uint32_t my_asn, uint16_t hold_time, uint32_t bgp_id);

    uint8_t version;
    uint16_t my_asn;
    uint16_t hold_time;

    // bgp-id is in network-byte
    uint32_t bgp_id;

    // set ASN. adds or edits the four-octet ASN capability in 4b mode.
    bool setAsn(uint32_t my_asn);

    // get ASN. reads the four-octet ASN capability when present.
    uint32_t getAsn() const;

    bool hasCapability(uint8_t code) const;
    bool addCapability(std::shared_ptr<BgpCapability> capability);

    ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const;
    ssize_t parse(const uint8_t *from, size_t msg_sz);
    ssize_t write(uint8_t *to, size_t buf_sz) const;

    const std::vector<std::shared_ptr<BgpCapability>>& getCapabilities() const;

private:
    ssize_t parseCapabilities(const uint8_t *from, uint8_t param_length);

    std::vector<std::shared_ptr<BgpCapability>> capabilities;
    bool use_4b_asn;
};

}
#endif // BGPD_OPEN_MSG_H_
