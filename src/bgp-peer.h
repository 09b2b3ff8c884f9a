/**
 * @file bgp-peer.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The peer task: one thread running one BGP FSM.
 * @version 0.3
 * @date 2019-08-08
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_PEER_H_
#define BGPD_PEER_H_
#include <stdint.h>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>
#include "bgp-fsm.h"
#include "bgp-config.h"
#include "tcp-out-handler.h"

namespace bgpd {

/**
 * @brief A peer as seen by the BgpServer.
 *
 * All methods only queue work for the peer and return immediately. They are
 * called from the server thread.
 */
class BgpPeerHandle {
public:
    // start the FSM.
    virtual void start() = 0;

    // stop the FSM. a Cease notification with the subcode is sent if the
    // session is up.
    virtual void stop(uint8_t cease_subcode) = 0;

    // send routes computed by the RIB.
    virtual void postRibOut(const BgpRibOut &out) = 0;

    // hand over an accepted socket. the peer owns it from now on.
    virtual void acceptInbound(int fd) = 0;

    virtual ~BgpPeerHandle() {}
};

/**
 * @brief Type of peer events.
 *
 */
enum BgpPeerEventType {
    PE_START,
    PE_STOP,
    PE_CONNECTED,
    PE_DATA,
    PE_CLOSED,
    PE_INBOUND,
    PE_RIB_OUT,
    PE_EXIT
};

/**
 * @brief An event in the queue of a BgpPeer.
 *
 */
class BgpPeerEvent {
public:
    BgpPeerEvent(BgpPeerEventType type) : type(type), conn_id(0), fd(-1), cease_subcode(0) {}

    BgpPeerEventType type;
    uint64_t conn_id;
    int fd;
    uint8_t cease_subcode;
    std::vector<uint8_t> data;
    BgpRibOut rib_out;
};

/**
 * @brief The BgpPeer class.
 *
 * A BgpPeer owns a BgpFsm, the TCP transport of the FSM and a thread. Every
 * input of the FSM (transport events, RIB updates, start and stop) is put in
 * the event queue and handled by the thread, one at a time. Between events,
 * the thread sleeps until the next FSM timer deadline.
 */
class BgpPeer : public BgpPeerHandle, public TcpTransportListener {
public:
    /**
     * @brief Construct a new BgpPeer object.
     *
     * @param config FSM configuration. out_handler and log_handler are
     * replaced by the peer's own.
     * @param port TCP port of the peer.
     * @param log_level Log level of the peer's log handler.
     */
    BgpPeer(const BgpConfig &config, uint16_t port, LogLevel log_level);

    // stops the FSM and joins the thread.
    ~BgpPeer();

    void start();
    void stop(uint8_t cease_subcode);
    void postRibOut(const BgpRibOut &out);
    void acceptInbound(int fd);

    void onTransportUp(uint64_t conn_id);
    void onTransportData(uint64_t conn_id, const uint8_t *buffer, size_t length);
    void onTransportDown(uint64_t conn_id);

private:
    void post(BgpPeerEvent *ev);
    void loop();
    void handleEvent(const BgpPeerEvent &ev);
    void handleInbound(int fd);

    BgpPeerLogHandler logger;
    RealtimeClock clock;
    TcpOutHandler transport;
    BgpConfig config;
    BgpFsm *fsm;

    std::mutex queue_mtx;
    std::condition_variable queue_cv;
    std::deque<BgpPeerEvent*> queue;
    std::thread thread;
};

}

#endif // BGPD_PEER_H_
