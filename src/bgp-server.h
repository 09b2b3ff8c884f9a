/**
 * @file bgp-server.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP speaker: peers, RIB and the coordinator loop.
 * @version 0.3
 * @date 2019-08-09
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_SERVER_H_
#define BGPD_SERVER_H_
#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "bgp-config.h"
#include "bgp-peer.h"
#include "bgp-query.h"
#include "bgp-rib.h"
#include "clock.h"
#include "route-event-receiver.h"

namespace bgpd {

class BgpServer;
class ServerMessage;

/**
 * @brief Creates the peer of a neighbor.
 *
 * The BgpConfig is complete except for the out_handler and the log_handler,
 * which belong to the peer.
 */
typedef std::function<BgpPeerHandle*(const BgpConfig &config, const BgpNeighborConfig &neighbor)> peer_factory_t;

/**
 * @brief Route event receiver of one neighbor.
 *
 * Forwards events to the server channel, tagged with the generation of the
 * neighbor. Events of a removed neighbor are then told apart from events of
 * a neighbor added later with the same address.
 */
class BgpServerEventTap : public RouteEventReceiver {
public:
    BgpServerEventTap(BgpServer *server, uint64_t generation);
    bool handleRouteEvent(const RouteEvent &ev);

private:
    BgpServer *server;
    uint64_t generation;
};

/**
 * @brief The BgpServer class.
 *
 * The server owns the RIB and the peers. Route events from peers, queries
 * and administrative requests are put on one channel and handled one at a
 * time, in arrival order. Only the thread handling the channel touches the
 * RIB.
 *
 * The channel is handled either by the server thread (start() / stop()) or
 * by the caller (processOne() / processAll()).
 */
class BgpServer {
public:
    /**
     * @brief Construct a new BgpServer object.
     *
     * Networks and neighbors of the config are queued for addition. Nothing
     * happens until the channel is processed.
     *
     * @param logger Log handler.
     * @param config Speaker configuration.
     * @param clock Clock for neighbor uptime. NULL for real time.
     */
    BgpServer(BgpLogHandler *logger, const BgpServerConfig &config, Clock *clock = NULL);
    ~BgpServer();

    // replace the peer factory. call before the channel is processed.
    void setPeerFactory(const peer_factory_t &factory);

    // call before the channel is processed.
    void setIgpCostResolver(const igp_cost_resolver_t &resolver);

    /**
     * @brief Start the server thread and the listener.
     *
     * @return true Started.
     * @return false Already started, or failed to listen.
     */
    bool start();

    /**
     * @brief Stop the server thread and the listener. Peers are kept.
     *
     */
    void stop();

    /**
     * @brief Handle one message from the channel, on the caller's thread.
     *
     * @return true A message was handled.
     * @return false The channel is empty.
     */
    bool processOne();

    // handle messages until the channel is empty. returns number handled.
    size_t processAll();

    // add a neighbor and start it. false if the address is taken or invalid.
    std::future<bool> addPeer(const BgpNeighborConfig &neighbor);

    // stop and remove a neighbor. false if there is no such neighbor.
    std::future<bool> removePeer(uint32_t address);

    // originate a route. replaces the local route of the same prefix.
    std::future<bool> originate(const BgpLocalRoute &route);

    // withdraw a local route. false if there is no such route.
    std::future<bool> withdrawLocal(const Prefix4 &route);

    // run a management query.
    std::future<BgpQueryResponse> query(const BgpQueryRequest &request);

private:
    friend class BgpServerEventTap;

    // mirror of a neighbor, built from its events.
    struct Neighbor {
        BgpNeighborConfig config;
        uint64_t generation;

        // tap must outlive the peer.
        std::unique_ptr<BgpServerEventTap> tap;
        std::unique_ptr<BgpPeerHandle> peer;

        BgpState state;
        uint32_t asn;
        uint32_t router_id;
        uint64_t session_id;

        uint64_t updates_in;
        uint64_t updates_out;
        uint64_t accepted;
        uint64_t rejected;
        uint64_t flaps;
        uint64_t established_at;
    };

    void post(ServerMessage *msg);
    void reject(ServerMessage &msg);
    size_t rejectPending();
    void handleMessage(ServerMessage &msg);
    void handleRouteEvent(const RouteEvent &ev, uint64_t generation);
    bool doAddPeer(const BgpNeighborConfig &config);
    bool doRemovePeer(uint32_t address);
    void doInbound(int fd, uint32_t address);
    BgpQueryResponse doQuery(const BgpQueryRequest &request);
    void dispatch(const std::vector<BgpRibOut> &out);

    void queryNeighbor(const Neighbor &neighbor, BgpQueryResponse &response);
    void queryAdjRibIn(uint32_t address, BgpQueryResponse &response);
    void queryAdjRibOut(uint32_t address, BgpQueryResponse &response);
    void queryLocRib(uint32_t address, bool best_only, BgpQueryResponse &response);
    BgpRouteSummary summarize(const Prefix4 &route, const BgpAttribSet &attribs, uint32_t contributor, bool best);

    void loop();
    void listen();

    BgpLogHandler *logger;
    BgpServerConfig config;
    RealtimeClock realtime_clock;
    Clock *clock;
    BgpRib rib;
    peer_factory_t peer_factory;
    uint64_t generation;

    std::map<uint32_t, Neighbor> neighbors;

    std::mutex channel_mtx;
    std::condition_variable channel_cv;
    std::deque<std::unique_ptr<ServerMessage>> channel;

    std::atomic<bool> running;

    // set by stop(). messages posted afterwards are answered at once.
    bool stopped;
    std::thread loop_thread;
    std::thread listen_thread;
    int listen_fd;
};

}

#endif // BGPD_SERVER_H_
