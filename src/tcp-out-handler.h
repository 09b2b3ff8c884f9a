/**
 * @file tcp-out-handler.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The TCP session transport.
 * @version 0.3
 * @date 2019-08-08
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_TCP_OUT_HANDLER_H_
#define BGPD_TCP_OUT_HANDLER_H_
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <thread>
#include "bgp-out-handler.h"
#include "bgp-log-handler.h"

namespace bgpd {

/**
 * @brief Receiver of transport events.
 *
 * Callbacks run on the transport's reader thread. Every callback carries the
 * ID of the connection it is about, so events of a connection that has been
 * replaced can be told apart.
 */
class TcpTransportListener {
public:
    virtual void onTransportUp(uint64_t conn_id) = 0;
    virtual void onTransportData(uint64_t conn_id, const uint8_t *buffer, size_t length) = 0;
    virtual void onTransportDown(uint64_t conn_id) = 0;
    virtual ~TcpTransportListener() {}
};

/**
 * @brief The TcpOutHandler class.
 *
 * One TCP connection to one peer, either connected by us (connect()) or
 * accepted by the listener and handed over (adopt()). A reader thread runs
 * for each connection and feeds the listener.
 *
 * handleOut(), connect(), adopt() and close() must be called from one thread
 * (the peer thread).
 */
class TcpOutHandler : public BgpOutHandler {
public:
    /**
     * @brief Construct a new TcpOutHandler object.
     *
     * @param logger Log handler.
     * @param listener Listener of transport events.
     * @param local_addr Address to bind outgoing connections to. (network
     * bytes order, 0 for any)
     * @param peer_addr Peer address. (network bytes order)
     * @param port Peer port.
     */
    TcpOutHandler(BgpLogHandler *logger, TcpTransportListener *listener, uint32_t local_addr, uint32_t peer_addr, uint16_t port);
    ~TcpOutHandler();

    bool handleOut(const uint8_t *buffer, size_t length);
    bool connect();
    void close();

    /**
     * @brief Take over an accepted socket.
     *
     * Any existing connection or connection attempt is closed. The socket is
     * owned (and eventually closed) by the TcpOutHandler.
     *
     * @param fd The socket.
     */
    void adopt(int fd);

    // ID of the current connection.
    uint64_t getConnId() const;

private:
    void worker(uint64_t conn_id, int fd);
    int doConnect();
    void setFd(uint64_t conn_id, int fd);

    BgpLogHandler *logger;
    TcpTransportListener *listener;
    uint32_t local_addr;
    uint32_t peer_addr;
    uint16_t port;

    mutable std::mutex fd_mtx;
    int fd;
    std::atomic<uint64_t> conn_id;
    std::atomic<bool> closing;
    std::thread reader;
};

}

#endif // BGPD_TCP_OUT_HANDLER_H_
