/**
 * @file tcp-out-handler.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The TCP session transport.
 * @version 0.3
 * @date 2019-08-08
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "tcp-out-handler.h"
#include "prefix4.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace bgpd {

// how often a pending connect checks for close(), in milliseconds.
#define BGPD_CONNECT_POLL_MS 500

TcpOutHandler::TcpOutHandler(BgpLogHandler *logger, TcpTransportListener *listener, uint32_t local_addr, uint32_t peer_addr, uint16_t port) {
    this->logger = logger;
    this->listener = listener;
    this->local_addr = local_addr;
    this->peer_addr = peer_addr;
    this->port = port;
    fd = -1;
    conn_id = 0;
    closing = false;
}

TcpOutHandler::~TcpOutHandler() {
    close();
}

bool TcpOutHandler::handleOut(const uint8_t *buffer, size_t length) {
    std::lock_guard<std::mutex> lock(fd_mtx);

    if (fd < 0) {
        logger->log(ERROR, "TcpOutHandler::handleOut: not connected.\n");
        return false;
    }

    size_t written = 0;

    while (written < length) {
        ssize_t ret = send(fd, buffer + written, length - written, MSG_NOSIGNAL);

        if (ret < 0) {
            if (errno == EINTR) continue;
            logger->log(ERROR, "TcpOutHandler::handleOut: send(): %s.\n", strerror(errno));
            return false;
        }

        written += ret;
    }

    return true;
}

bool TcpOutHandler::connect() {
    close();

    uint64_t id = ++conn_id;
    logger->log(DEBUG, "TcpOutHandler::connect: connecting to %s:%u.\n", ipToString(peer_addr).c_str(), port);
    reader = std::thread(&TcpOutHandler::worker, this, id, -1);

    return true;
}

void TcpOutHandler::adopt(int new_fd) {
    close();

    uint64_t id = ++conn_id;
    reader = std::thread(&TcpOutHandler::worker, this, id, new_fd);
}

void TcpOutHandler::close() {
    closing = true;

    {
        std::lock_guard<std::mutex> lock(fd_mtx);
        if (fd >= 0) shutdown(fd, SHUT_RDWR);
    }

    if (reader.joinable()) reader.join();

    // events still queued for the old connection are now stale.
    conn_id++;
    closing = false;
}

uint64_t TcpOutHandler::getConnId() const {
    return conn_id;
}

void TcpOutHandler::setFd(uint64_t id, int new_fd) {
    std::lock_guard<std::mutex> lock(fd_mtx);
    fd = new_fd;

    // connected before close() took the lock: close() has nothing to
    // shutdown, so do it here.
    if (new_fd >= 0 && closing && id == conn_id) shutdown(new_fd, SHUT_RDWR);
}

/**
 * @brief Connect to the peer, giving up if close() is called.
 *
 * @return int The connected socket, or -1 on failure.
 */
int TcpOutHandler::doConnect() {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        logger->log(ERROR, "TcpOutHandler::doConnect: socket(): %s.\n", strerror(errno));
        return -1;
    }

    if (local_addr != 0) {
        struct sockaddr_in local;
        memset(&local, 0, sizeof(local));
        local.sin_family = AF_INET;
        local.sin_addr.s_addr = local_addr;

        if (bind(sock, (struct sockaddr *) &local, sizeof(local)) < 0) {
            logger->log(ERROR, "TcpOutHandler::doConnect: bind(): %s.\n", strerror(errno));
            ::close(sock);
            return -1;
        }
    }

    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) {
        logger->log(ERROR, "TcpOutHandler::doConnect: fcntl(): %s.\n", strerror(errno));
        ::close(sock);
        return -1;
    }

    struct sockaddr_in remote;
    memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_addr.s_addr = peer_addr;
    remote.sin_port = htons(port);

    if (::connect(sock, (struct sockaddr *) &remote, sizeof(remote)) < 0 && errno != EINPROGRESS) {
        logger->log(WARN, "TcpOutHandler::doConnect: connect(): %s.\n", strerror(errno));
        ::close(sock);
        return -1;
    }

    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;

    while (true) {
        if (closing) {
            ::close(sock);
            return -1;
        }

        pfd.revents = 0;
        int ret = poll(&pfd, 1, BGPD_CONNECT_POLL_MS);

        if (ret < 0) {
            if (errno == EINTR) continue;
            logger->log(ERROR, "TcpOutHandler::doConnect: poll(): %s.\n", strerror(errno));
            ::close(sock);
            return -1;
        }

        if (ret > 0) break;
    }

    int err = 0;
    socklen_t err_len = sizeof(err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &err_len) < 0 || err != 0) {
        logger->log(WARN, "TcpOutHandler::doConnect: connect(): %s.\n", strerror(err != 0 ? err : errno));
        ::close(sock);
        return -1;
    }

    if (fcntl(sock, F_SETFL, flags) < 0) {
        logger->log(ERROR, "TcpOutHandler::doConnect: fcntl(): %s.\n", strerror(errno));
        ::close(sock);
        return -1;
    }

    return sock;
}

void TcpOutHandler::worker(uint64_t id, int sock) {
    if (sock < 0) {
        sock = doConnect();

        if (sock < 0) {
            if (!closing) listener->onTransportDown(id);
            return;
        }
    }

    setFd(id, sock);
    logger->log(INFO, "TcpOutHandler::worker: connected with %s.\n", ipToString(peer_addr).c_str());
    listener->onTransportUp(id);

    uint8_t buffer[4096];
    ssize_t read_ret;

    while (true) {
        read_ret = read(sock, buffer, sizeof(buffer));
        if (read_ret < 0 && errno == EINTR) continue;
        if (read_ret <= 0) break;
        listener->onTransportData(id, buffer, read_ret);
    }

    if (read_ret < 0 && !closing) {
        logger->log(WARN, "TcpOutHandler::worker: read(): %s.\n", strerror(errno));
    }

    setFd(id, -1);
    ::close(sock);

    if (!closing) {
        logger->log(INFO, "TcpOutHandler::worker: connection with %s closed.\n", ipToString(peer_addr).c_str());
        listener->onTransportDown(id);
    }
}

}
