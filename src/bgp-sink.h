/**
 * @file bgp-sink.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP sink.
 * @version 0.3
 * @date 2019-08-04
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_SINK_H_
#define BGPD_SINK_H_
#include <stdint.h>
#include <unistd.h>
#include <vector>
#include "bgp-packet.h"
#include "bgp-log-handler.h"

namespace bgpd {

/**
 * @brief The BgpSink class.
 * 
 * BGP sink is a packet buffering utility for BGP. It consumes the TCP byte
 * stream and hands out full BGP packets. The sink is owned by one FSM and is
 * not thread safe.
 */
class BgpSink {
public:
    BgpSink(BgpLogHandler *logger, bool use_4b_asn);

    // feed stream of packets into sink
    ssize_t fill(const uint8_t *buffer, size_t len);

    // get a packet from sink and remove that packet from sink.
    // returns 0 if no full packet is available yet, bytes drained (> 0) if a
    // packet was parsed, and -1 if the packet has an error. in that case pkt
    // still points to the packet, which carries the error code, subcode and
    // data. a framing error (bad marker, bad length) drains the sink.
    ssize_t pour(BgpPacket **pkt);

    size_t getBytesInSink() const;

    // discard everything in sink
    void drain();

    // asn width of packets poured after this call
    void setUse4bAsn(bool use_4b_asn);

private:
    void settle();

    std::vector<uint8_t> buffer;
    size_t offset_start;
    bool use_4b_asn;
    BgpLogHandler *logger;
};

}

#endif // BGPD_SINK_H_
