/**
 * @file bgp-sink.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP sink.
 * @version 0.3
 * @date 2019-08-04
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-sink.h"
#include "value-op.h"
#include <string.h>

namespace bgpd {

/**
 * @brief Construct a new Bgp Sink:: Bgp Sink object
 * 
 * @param logger Pointer to logger object for error logging.
 * @param use_4b_asn Enable four octets ASN support.
 */
BgpSink::BgpSink(BgpLogHandler *logger, bool use_4b_asn) {
    this->logger = logger;
    this->use_4b_asn = use_4b_asn;
    offset_start = 0;
}

/**
 * @brief Fill the sink with data.
 * 
 * @param buffer The pointer to data buffer.
 * @param len The length of data.
 * @return ssize_t Bytes consumed.
 */
ssize_t BgpSink::fill(const uint8_t *buffer, size_t len) {
    settle();
    this->buffer.insert(this->buffer.end(), buffer, buffer + len);
    return len;
}

/**
 * @brief Pour BGP packet out from sink.
 * 
 * @param pkt Pointer to BgpPacket pointer. The packet is owned by the caller.
 * @return ssize_t Bytes poured.
 * @retval -1 Packet poured, but parse error occurred. The notification data
 * is available from the packet.
 * @retval 0 No full packet in sink.
 * @retval >0 Bytes poured.
 * @throws "bad_packet" Parsed packet length mismatch.
 */
ssize_t BgpSink::pour(BgpPacket **pkt) {
    size_t bytes = getBytesInSink();
    if (bytes < BGPD_HEADER_LEN) return 0;

    const uint8_t *cur = buffer.data() + offset_start;
    const uint8_t *len_ptr = cur + 16;
    uint16_t field_len = getU16(&len_ptr);

    bool framing_ok = field_len >= BGPD_HEADER_LEN && field_len <= BGPD_MAX_MSG_LEN;
    for (int i = 0; framing_ok && i < 16; i++) {
        if (cur[i] != 0xff) framing_ok = false;
    }

    if (framing_ok && field_len > bytes) return 0; // wait for more.

    BgpPacket *new_pkt = new BgpPacket(logger, use_4b_asn);
    *pkt = new_pkt;

    if (!framing_ok) {
        // the packet parser reports the header error, then the stream is
        // useless.
        new_pkt->parse(cur, BGPD_HEADER_LEN);
        drain();
        return -1;
    }

    offset_start += field_len;

    ssize_t par_ret = new_pkt->parse(cur, field_len);
    if (par_ret < 0) return -1;

    if (par_ret != field_len) throw "bad_packet";

    return par_ret;
}

void BgpSink::settle() {
    if (offset_start == 0) return;
    buffer.erase(buffer.begin(), buffer.begin() + offset_start);
    offset_start = 0;
}

/**
 * @brief Drain the sink. (Remove all data from sink buffer)
 * 
 */
void BgpSink::drain() {
    buffer.clear();
    offset_start = 0;
}

size_t BgpSink::getBytesInSink() const {
    return buffer.size() - offset_start;
}

void BgpSink::setUse4bAsn(bool use_4b_asn) {
    this->use_4b_asn = use_4b_asn;
}

}
