/**
 * @file bgp-fsm.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP Finite State Machine.
 * @version 0.3
 * @date 2019-08-07
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_FSM_H_
#define BGPD_FSM_H_
#define BGPD_FSM_BUFFER_SIZE 4096
#define BGPD_FSM_OPEN_HOLD 240

#include "clock.h"
#include "bgp-rib.h"
#include "bgp-config.h"
#include "bgp-sink.h"
#include "bgp-errcode.h"
#include "bgp-open-message.h"
#include "bgp-update-message.h"
#include "route-event-receiver.h"
#include <stdint.h>
#include <unistd.h>

namespace bgpd {

/**
 * @brief BGP Finite State Machine status.
 *
 */
enum BgpState {
    IDLE,
    CONNECT,
    ACTIVE,
    OPEN_SENT,
    OPEN_CONFIRM,
    ESTABLISHED
};

const char* bgpStateToString(int state);

/**
 * @brief The BgpFsm class.
 *
 * BgpFsm is driven by discrete events: start(), stop(), connected(),
 * transportFailed(), run() (bytes received), tick() (timers) and
 * handleRibOut(). It writes to the transport with the BgpOutHandler and
 * reports to the RouteEventReceiver. BgpFsm itself does not create threads;
 * the caller (BgpPeer) must not call into it from more than one thread at a
 * time.
 */
class BgpFsm {
public:
    BgpFsm(const BgpConfig &config);
    ~BgpFsm();

    /**
     * @brief Get local ASN.
     *
     * @return uint32_t local ASN.
     */
    uint32_t getAsn() const;

    /**
     * @brief Get peer ASN.
     *
     * @return uint32_t peer ASN.
     * @retval 0 Peer ASN unknow at this time.
     * @retval >=0 Peer ASN.
     */
    uint32_t getPeerAsn() const;

    /**
     * @brief Get peer BGP ID.
     *
     * @return uint32_t peer BGP ID in network btyes order.
     * @retval 0 Peer BGP ID unknow at this time.
     * @retval >=0 Peer BGP ID.
     */
    uint32_t getPeerBgpId() const;

    /**
     * @brief Get the negotiated hold timer.
     *
     * @return uint16_t negotiated hold timer.
     * @retval 0 Hold timer was not negotiated yet, or disabled.
     * @retval >0 negotiated hold timer.
     */
    uint16_t getHoldTimer() const;

    /**
     * @brief Get the keepalive interval in use.
     *
     * @return uint16_t keepalive interval. 0 if no keepalive will be sent.
     */
    uint16_t getKeepaliveInterval() const;

    /**
     * @brief Get current FSM state.
     *
     * @return BgpState Current state.
     */
    BgpState getState() const;

    /**
     * @brief Get the current session ID.
     *
     * The session ID is incremented every time the FSM enters ESTABLISHED.
     *
     * @return uint64_t session ID. 0 if never established.
     */
    uint64_t getSessionId() const;

    /**
     * @brief Start the FSM. (IDLE -> CONNECT or ACTIVE)
     *
     * @retval 0 Failed to start. error may be written to stderr with log
     * handler.
     * @retval 1 Started.
     */
    int start();

    /**
     * @brief Stop the FSM. (Any -> IDLE)
     *
     * A Cease notification is sent if a session exists. The FSM won't retry
     * until start() is called again.
     *
     * @param cease_subcode Subcode of the Cease notification.
     * @retval 1 Stopped.
     */
    int stop(uint8_t cease_subcode = E_SHUTDOWN);

    /**
     * @brief The transport is up. Send OPEN. (CONNECT/ACTIVE -> OPEN_SENT)
     *
     * @retval -1 Not expecting a connection now. The caller should close the
     * transport.
     * @retval 1 OPEN sent.
     */
    int connected();

    /**
     * @brief The transport failed to connect or went down.
     *
     * @retval 0 Session closed (or connect failed), connect-retry armed.
     * @retval 1 Nothing to do.
     */
    int transportFailed();

    /**
     * @brief Run the FSM on buffer.
     *
     * @param buffer Pointer to buffer.
     * @param buffer_size Size of buffer.
     * @retval -1 Local error occurred (failed to write to transport, or there
     * is no session). error may be written to stderr with log handler.
     * @retval 0 Peer sent NOTIFICATION. FSM is now in IDLE state.
     * @retval 1 Success.
     * @retval 2 Protocol error occurred on the other side. Notification message
     * was sent to peer and FSM is now IDLE state. error may be written to
     * stderr with log handler.
     */
    int run(const uint8_t *buffer, const size_t buffer_size);

    /**
     * @brief Tick the clock (Check for time-based events)
     *
     * tick() should be called at nextDeadline() to check for hold timer
     * expiry, keepalive sending and connect retry.
     *
     * @retval -1 Failed to write to transport.
     * @retval 1 Success.
     * @retval 2 Hold timer expired. Notification message was sent to the peer.
     * FSM is now in IDLE state.
     */
    int tick();

    /**
     * @brief Get the time of the next timer event.
     *
     * @return uint64_t the time tick() needs to be called at. 0 if no timer
     * is armed.
     */
    uint64_t nextDeadline() const;

    /**
     * @brief Send announcements and withdrawals to the peer.
     *
     * @param out Instructions from the RIB.
     * @retval -1 Failed to write to transport.
     * @retval 0 Dropped: not established, or computed for an older session.
     * @retval 1 Sent.
     */
    int handleRibOut(const BgpRibOut &out);

private:
    int validateState(uint8_t type);
    int fsmEvalOpenSent(const BgpMessage *msg);
    int fsmEvalOpenConfirm(const BgpMessage *msg);
    int fsmEvalEstablished(const BgpMessage *msg);
    int openRecv(const BgpOpenMessage *open);

    // start a connection attempt, or wait for one if passive.
    int beginConnect();

    // close transport, go IDLE and arm connect-retry if still started.
    void dropSession();

    // send a NOTIFICATION and drop the session. returns 2, or -1 if the write
    // failed.
    int notifyAndDrop(uint8_t errcode, uint8_t subcode, const uint8_t *data, size_t data_len);

    // setState: set the state of FSM. additional operations may be performed.
    void setState(BgpState state);

    bool writeMessage(const BgpMessage &msg);

    // build export attributes for one route group.
    void prepareAttribs(const BgpAttribSet &set, bool local, std::vector<std::shared_ptr<BgpPathAttrib>> &out) const;

    // send updates for routes sharing the same attributes, packed to fit
    // the maximum message size. returns updates sent, or -1.
    ssize_t sendAnnounce(const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs, const std::vector<Prefix4> &routes);
    ssize_t sendWithdraw(const std::vector<Prefix4> &routes);

    void emitState(BgpState old_state, BgpState new_state);

    bool clock_local;

    BgpSink in_sink;
    BgpState state;
    BgpConfig config;
    Clock *clock;
    BgpLogHandler *logger;

    // output buffer
    uint8_t out_buffer[BGPD_FSM_BUFFER_SIZE];

    // peer's bgp id
    uint32_t peer_bgp_id;

    // hold timer in use. (provisional in OPEN_SENT, negotiated after)
    uint16_t hold_timer;

    uint16_t keepalive_timer;

    // time last message sent
    uint64_t last_sent;

    // time last message received
    uint64_t last_recv;

    // connect-retry deadline, 0 if not armed.
    uint64_t retry_at;

    // true if both peer & local support 4B ASN
    bool use_4b_asn;

    // peer supports ROUTE-REFRESH
    bool peer_route_refresh;

    bool ibgp;

    // start() called, and no stop() since.
    bool started;

    uint32_t peer_asn;
    uint64_t session_id;
};

/**
 * @example bgpd.cc
 * The bgpd daemon: read a YAML config file, then peer with every neighbor in
 * it and exchange routes until SIGINT/SIGTERM.
 */

}

#endif // BGPD_FSM_H_
