/**
 * @file bgp-peer.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The peer task: one thread running one BGP FSM.
 * @version 0.3
 * @date 2019-08-08
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-peer.h"
#include "prefix4.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <chrono>

namespace bgpd {

BgpPeer::BgpPeer(const BgpConfig &config, uint16_t port, LogLevel log_level) :
    logger(ipToString(config.peer_addr)),
    transport(&logger, this, config.local_addr, config.peer_addr, port) {
    logger.setLogLevel(log_level);

    this->config = config;
    this->config.out_handler = &transport;
    this->config.log_handler = &logger;
    this->config.clock = &clock;
    fsm = new BgpFsm(this->config);

    thread = std::thread(&BgpPeer::loop, this);
}

BgpPeer::~BgpPeer() {
    post(new BgpPeerEvent(PE_EXIT));
    thread.join();

    // no more transport events after this.
    transport.close();

    for (BgpPeerEvent *ev : queue) {
        if (ev->type == PE_INBOUND) ::close(ev->fd);
        delete ev;
    }
    queue.clear();

    delete fsm;
}

void BgpPeer::start() {
    post(new BgpPeerEvent(PE_START));
}

void BgpPeer::stop(uint8_t cease_subcode) {
    BgpPeerEvent *ev = new BgpPeerEvent(PE_STOP);
    ev->cease_subcode = cease_subcode;
    post(ev);
}

void BgpPeer::postRibOut(const BgpRibOut &out) {
    BgpPeerEvent *ev = new BgpPeerEvent(PE_RIB_OUT);
    ev->rib_out = out;
    post(ev);
}

void BgpPeer::acceptInbound(int fd) {
    BgpPeerEvent *ev = new BgpPeerEvent(PE_INBOUND);
    ev->fd = fd;
    post(ev);
}

void BgpPeer::onTransportUp(uint64_t conn_id) {
    BgpPeerEvent *ev = new BgpPeerEvent(PE_CONNECTED);
    ev->conn_id = conn_id;
    post(ev);
}

void BgpPeer::onTransportData(uint64_t conn_id, const uint8_t *buffer, size_t length) {
    BgpPeerEvent *ev = new BgpPeerEvent(PE_DATA);
    ev->conn_id = conn_id;
    ev->data.assign(buffer, buffer + length);
    post(ev);
}

void BgpPeer::onTransportDown(uint64_t conn_id) {
    BgpPeerEvent *ev = new BgpPeerEvent(PE_CLOSED);
    ev->conn_id = conn_id;
    post(ev);
}

void BgpPeer::post(BgpPeerEvent *ev) {
    {
        std::lock_guard<std::mutex> lock(queue_mtx);
        queue.push_back(ev);
    }

    queue_cv.notify_one();
}

void BgpPeer::loop() {
    while (true) {
        BgpPeerEvent *ev = NULL;

        {
            std::unique_lock<std::mutex> lock(queue_mtx);

            if (queue.empty()) {
                uint64_t deadline = fsm->nextDeadline();
                uint64_t now = clock.getTime();

                if (deadline == 0) {
                    queue_cv.wait(lock, [this] { return !queue.empty(); });
                } else if (deadline > now) {
                    queue_cv.wait_for(lock, std::chrono::seconds(deadline - now), [this] { return !queue.empty(); });
                }
            }

            if (!queue.empty()) {
                ev = queue.front();
                queue.pop_front();
            }
        }

        if (ev != NULL) {
            bool exit = ev->type == PE_EXIT;
            handleEvent(*ev);
            delete ev;
            if (exit) break;
        }

        fsm->tick();

        if (fsm->getPeerAsn() != 0) logger.setAsn(fsm->getPeerAsn());
    }
}

void BgpPeer::handleEvent(const BgpPeerEvent &ev) {
    switch (ev.type) {
        case PE_START: fsm->start(); break;
        case PE_STOP: fsm->stop(ev.cease_subcode); break;
        case PE_CONNECTED:
            if (ev.conn_id != transport.getConnId()) break;
            if (fsm->connected() < 0) transport.close();
            break;
        case PE_DATA:
            if (ev.conn_id != transport.getConnId()) break;
            fsm->run(ev.data.data(), ev.data.size());
            break;
        case PE_CLOSED:
            if (ev.conn_id != transport.getConnId()) break;
            fsm->transportFailed();
            break;
        case PE_INBOUND: handleInbound(ev.fd); break;
        case PE_RIB_OUT: fsm->handleRibOut(ev.rib_out); break;
        case PE_EXIT:
            fsm->stop(E_SHUTDOWN);
            transport.close();
            break;
    }
}

/**
 * @brief Decide what to do with an inbound connection.
 *
 * While our own connection attempt is pending, the connection started by the
 * side with the higher address wins. Once a session exists, inbound
 * connections are refused.
 *
 * @param fd The accepted socket.
 */
void BgpPeer::handleInbound(int fd) {
    BgpState state = fsm->getState();
    bool accept = false;

    switch (state) {
        case IDLE:
        case ACTIVE:
            accept = true;
            break;
        case CONNECT: {
            struct sockaddr_in local;
            socklen_t local_len = sizeof(local);
            memset(&local, 0, sizeof(local));

            if (getsockname(fd, (struct sockaddr *) &local, &local_len) < 0) {
                logger.log(ERROR, "BgpPeer::handleInbound: getsockname(): %s.\n", strerror(errno));
                break;
            }

            accept = ntohl(config.peer_addr) > ntohl(local.sin_addr.s_addr);
            break;
        }
        default: break;
    }

    if (!accept) {
        logger.log(INFO, "BgpPeer::handleInbound: refusing inbound connection in %s state.\n", bgpStateToString(state));
        ::close(fd);
        return;
    }

    logger.log(INFO, "BgpPeer::handleInbound: accepting inbound connection in %s state.\n", bgpStateToString(state));
    transport.adopt(fd);
}

}
