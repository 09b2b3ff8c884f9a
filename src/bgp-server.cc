/**
 * @file bgp-server.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP speaker: peers, RIB and the coordinator loop.
 * @version 0.3
 * @date 2019-08-09
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-server.h"
#include "bgp-errcode.h"
#include "route-event.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace bgpd {

/**
 * @brief Type of messages in the server channel.
 *
 */
enum ServerMessageType {
    SM_ROUTE_EVENT,
    SM_QUERY,
    SM_ADD_PEER,
    SM_REMOVE_PEER,
    SM_ORIGINATE,
    SM_WITHDRAW_LOCAL,
    SM_INBOUND
};

class ServerMessage {
public:
    ServerMessage(ServerMessageType type) : type(type) {}
    virtual ~ServerMessage() {}

    const ServerMessageType type;
};

class RouteEventMessage : public ServerMessage {
public:
    RouteEventMessage(const RouteEvent &ev, uint64_t generation) :
        ServerMessage(SM_ROUTE_EVENT), ev(ev.clone()), generation(generation) {}

    std::unique_ptr<RouteEvent> ev;
    uint64_t generation;
};

class QueryMessage : public ServerMessage {
public:
    QueryMessage(const BgpQueryRequest &request) : ServerMessage(SM_QUERY), request(request) {}

    BgpQueryRequest request;
    std::promise<BgpQueryResponse> response;
};

class AddPeerMessage : public ServerMessage {
public:
    AddPeerMessage(const BgpNeighborConfig &neighbor) : ServerMessage(SM_ADD_PEER), neighbor(neighbor) {}

    BgpNeighborConfig neighbor;
    std::promise<bool> result;
};

class RemovePeerMessage : public ServerMessage {
public:
    RemovePeerMessage(uint32_t address) : ServerMessage(SM_REMOVE_PEER), address(address) {}

    uint32_t address;
    std::promise<bool> result;
};

class OriginateMessage : public ServerMessage {
public:
    OriginateMessage(const BgpLocalRoute &route) : ServerMessage(SM_ORIGINATE), route(route) {}

    BgpLocalRoute route;
    std::promise<bool> result;
};

class WithdrawLocalMessage : public ServerMessage {
public:
    WithdrawLocalMessage(const Prefix4 &route) : ServerMessage(SM_WITHDRAW_LOCAL), route(route) {}

    Prefix4 route;
    std::promise<bool> result;
};

// the socket is closed with the message unless someone took it.
class InboundMessage : public ServerMessage {
public:
    InboundMessage(int fd, uint32_t address) : ServerMessage(SM_INBOUND), fd(fd), address(address) {}
    ~InboundMessage() { if (fd >= 0) ::close(fd); }

    int fd;
    uint32_t address;
};

BgpServerEventTap::BgpServerEventTap(BgpServer *server, uint64_t generation) {
    this->server = server;
    this->generation = generation;
}

bool BgpServerEventTap::handleRouteEvent(const RouteEvent &ev) {
    server->post(new RouteEventMessage(ev, generation));
    return true;
}

static BgpRibConfig makeRibConfig(const BgpServerConfig &config) {
    BgpRibConfig rib_config;
    rib_config.local_asn = config.asn;
    rib_config.router_id = config.router_id;
    rib_config.always_compare_med = config.always_compare_med;
    return rib_config;
}

BgpServer::BgpServer(BgpLogHandler *logger, const BgpServerConfig &config, Clock *clock) :
    rib(logger, makeRibConfig(config)) {
    if (logger == NULL) throw "null_logger";

    this->logger = logger;
    this->config = config;
    this->clock = clock == NULL ? &realtime_clock : clock;
    generation = 0;
    running = false;
    stopped = false;
    listen_fd = -1;

    LogLevel peer_log_level = config.log_level;
    peer_factory = [peer_log_level](const BgpConfig &fsm_config, const BgpNeighborConfig &neighbor) {
        return (BgpPeerHandle *) new BgpPeer(fsm_config, neighbor.port, peer_log_level);
    };

    for (const BgpLocalRoute &route : config.networks) post(new OriginateMessage(route));
    for (const BgpNeighborConfig &neighbor : config.neighbors) post(new AddPeerMessage(neighbor));
}

BgpServer::~BgpServer() {
    stop();

    {
        std::lock_guard<std::mutex> lock(channel_mtx);
        stopped = true;
    }

    // peers may still post events while they shut down.
    neighbors.clear();

    rejectPending();
}

void BgpServer::setPeerFactory(const peer_factory_t &factory) {
    peer_factory = factory;
}

void BgpServer::setIgpCostResolver(const igp_cost_resolver_t &resolver) {
    rib.setIgpCostResolver(resolver);
}

bool BgpServer::start() {
    if (running) {
        logger->log(ERROR, "BgpServer::start: server already running.\n");
        return false;
    }

    if (config.listen_port != 0) {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd < 0) {
            logger->log(FATAL, "BgpServer::start: socket(): %s.\n", strerror(errno));
            return false;
        }

        int reuse = 1;
        if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            logger->log(WARN, "BgpServer::start: setsockopt(): %s.\n", strerror(errno));
        }

        struct sockaddr_in server_addr;
        memset(&server_addr, 0, sizeof(server_addr));
        server_addr.sin_family = AF_INET;
        server_addr.sin_addr.s_addr = config.listen_address;
        server_addr.sin_port = htons(config.listen_port);

        if (bind(listen_fd, (struct sockaddr *) &server_addr, sizeof(server_addr)) < 0) {
            logger->log(FATAL, "BgpServer::start: bind(): %s.\n", strerror(errno));
            ::close(listen_fd);
            listen_fd = -1;
            return false;
        }

        if (::listen(listen_fd, 16) < 0) {
            logger->log(FATAL, "BgpServer::start: listen(): %s.\n", strerror(errno));
            ::close(listen_fd);
            listen_fd = -1;
            return false;
        }

        logger->log(INFO, "BgpServer::start: listening on %s:%u.\n", ipToString(config.listen_address).c_str(), config.listen_port);
    }

    {
        std::lock_guard<std::mutex> lock(channel_mtx);
        running = true;
        stopped = false;
    }

    loop_thread = std::thread(&BgpServer::loop, this);
    if (listen_fd >= 0) listen_thread = std::thread(&BgpServer::listen, this);

    return true;
}

void BgpServer::stop() {
    {
        std::lock_guard<std::mutex> lock(channel_mtx);
        if (!running) return;
        running = false;
        stopped = true;
    }

    channel_cv.notify_all();
    if (loop_thread.joinable()) loop_thread.join();

    size_t rejected = rejectPending();
    if (rejected > 0) logger->log(WARN, "BgpServer::stop: %zu queued messages not served.\n", rejected);

    if (listen_fd >= 0) {
        shutdown(listen_fd, SHUT_RDWR);
        if (listen_thread.joinable()) listen_thread.join();
        ::close(listen_fd);
        listen_fd = -1;
    }

    logger->log(INFO, "BgpServer::stop: server stopped.\n");
}

bool BgpServer::processOne() {
    std::unique_ptr<ServerMessage> msg;

    {
        std::lock_guard<std::mutex> lock(channel_mtx);
        if (channel.empty()) return false;
        msg = std::move(channel.front());
        channel.pop_front();
    }

    handleMessage(*msg);
    return true;
}

size_t BgpServer::processAll() {
    size_t handled = 0;
    while (processOne()) handled++;
    return handled;
}

std::future<bool> BgpServer::addPeer(const BgpNeighborConfig &neighbor) {
    AddPeerMessage *msg = new AddPeerMessage(neighbor);
    std::future<bool> result = msg->result.get_future();
    post(msg);
    return result;
}

std::future<bool> BgpServer::removePeer(uint32_t address) {
    RemovePeerMessage *msg = new RemovePeerMessage(address);
    std::future<bool> result = msg->result.get_future();
    post(msg);
    return result;
}

std::future<bool> BgpServer::originate(const BgpLocalRoute &route) {
    OriginateMessage *msg = new OriginateMessage(route);
    std::future<bool> result = msg->result.get_future();
    post(msg);
    return result;
}

std::future<bool> BgpServer::withdrawLocal(const Prefix4 &route) {
    WithdrawLocalMessage *msg = new WithdrawLocalMessage(route);
    std::future<bool> result = msg->result.get_future();
    post(msg);
    return result;
}

std::future<BgpQueryResponse> BgpServer::query(const BgpQueryRequest &request) {
    QueryMessage *msg = new QueryMessage(request);
    std::future<BgpQueryResponse> response = msg->response.get_future();
    post(msg);
    return response;
}

void BgpServer::post(ServerMessage *msg) {
    std::unique_ptr<ServerMessage> owned(msg);

    {
        std::lock_guard<std::mutex> lock(channel_mtx);
        if (!stopped) channel.push_back(std::move(owned));
    }

    if (owned) {
        reject(*owned);
        return;
    }

    channel_cv.notify_one();
}

/**
 * @brief Answer a message that will never be served.
 *
 * Queries get UNAVAILABLE and requests get false. Route events are dropped.
 * An inbound socket is closed when the message is deleted.
 *
 * @param msg The message.
 */
void BgpServer::reject(ServerMessage &msg) {
    switch (msg.type) {
        case SM_QUERY: {
            BgpQueryResponse response;
            response.error = UNAVAILABLE;
            response.message = "server stopped";
            static_cast<QueryMessage &>(msg).response.set_value(response);
            break;
        }
        case SM_ADD_PEER: static_cast<AddPeerMessage &>(msg).result.set_value(false); break;
        case SM_REMOVE_PEER: static_cast<RemovePeerMessage &>(msg).result.set_value(false); break;
        case SM_ORIGINATE: static_cast<OriginateMessage &>(msg).result.set_value(false); break;
        case SM_WITHDRAW_LOCAL: static_cast<WithdrawLocalMessage &>(msg).result.set_value(false); break;
        case SM_ROUTE_EVENT:
        case SM_INBOUND: break;
    }
}

size_t BgpServer::rejectPending() {
    std::deque<std::unique_ptr<ServerMessage>> pending;

    {
        std::lock_guard<std::mutex> lock(channel_mtx);
        pending.swap(channel);
    }

    for (std::unique_ptr<ServerMessage> &msg : pending) reject(*msg);
    return pending.size();
}

void BgpServer::loop() {
    logger->log(DEBUG, "BgpServer::loop: server thread started.\n");

    while (true) {
        std::unique_ptr<ServerMessage> msg;

        {
            std::unique_lock<std::mutex> lock(channel_mtx);
            channel_cv.wait(lock, [this] { return !running || !channel.empty(); });
            if (!running) break;
            msg = std::move(channel.front());
            channel.pop_front();
        }

        handleMessage(*msg);
    }

    logger->log(DEBUG, "BgpServer::loop: server thread stopped.\n");
}

void BgpServer::listen() {
    while (running) {
        struct sockaddr_in client_addr;
        socklen_t caddr_len = sizeof(client_addr);
        memset(&client_addr, 0, sizeof(client_addr));

        int fd_conn = accept(listen_fd, (struct sockaddr *) &client_addr, &caddr_len);

        if (fd_conn < 0) {
            if (!running) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            logger->log(ERROR, "BgpServer::listen: accept(): %s.\n", strerror(errno));
            break;
        }

        logger->log(INFO, "BgpServer::listen: new connection from %s.\n", ipToString(client_addr.sin_addr.s_addr).c_str());
        post(new InboundMessage(fd_conn, client_addr.sin_addr.s_addr));
    }
}

void BgpServer::handleMessage(ServerMessage &msg) {
    switch (msg.type) {
        case SM_ROUTE_EVENT: {
            RouteEventMessage &m = static_cast<RouteEventMessage &>(msg);
            handleRouteEvent(*m.ev, m.generation);
            break;
        }
        case SM_QUERY: {
            QueryMessage &m = static_cast<QueryMessage &>(msg);
            m.response.set_value(doQuery(m.request));
            break;
        }
        case SM_ADD_PEER: {
            AddPeerMessage &m = static_cast<AddPeerMessage &>(msg);
            m.result.set_value(doAddPeer(m.neighbor));
            break;
        }
        case SM_REMOVE_PEER: {
            RemovePeerMessage &m = static_cast<RemovePeerMessage &>(msg);
            m.result.set_value(doRemovePeer(m.address));
            break;
        }
        case SM_ORIGINATE: {
            OriginateMessage &m = static_cast<OriginateMessage &>(msg);
            std::vector<BgpRibOut> out;
            rib.insertLocal(m.route, out);
            dispatch(out);
            logger->log(INFO, "BgpServer::handleMessage: originated %s.\n", m.route.route.toString().c_str());
            m.result.set_value(true);
            break;
        }
        case SM_WITHDRAW_LOCAL: {
            WithdrawLocalMessage &m = static_cast<WithdrawLocalMessage &>(msg);
            std::vector<BgpRibOut> out;
            bool withdrawn = rib.withdrawLocal(m.route, out);
            dispatch(out);
            m.result.set_value(withdrawn);
            break;
        }
        case SM_INBOUND: {
            InboundMessage &m = static_cast<InboundMessage &>(msg);
            int fd = m.fd;
            m.fd = -1;
            doInbound(fd, m.address);
            break;
        }
    }
}

void BgpServer::handleRouteEvent(const RouteEvent &ev, uint64_t generation) {
    std::map<uint32_t, Neighbor>::iterator it = neighbors.find(ev.peer_addr);

    if (it == neighbors.end() || it->second.generation != generation) {
        logger->log(DEBUG, "BgpServer::handleRouteEvent: dropping event from removed peer %s.\n", ipToString(ev.peer_addr).c_str());
        return;
    }

    Neighbor &n = it->second;
    std::vector<BgpRibOut> out;

    switch (ev.type) {
        case PEER_STATE: {
            const PeerStateEvent &state_ev = static_cast<const PeerStateEvent &>(ev);
            n.state = (BgpState) state_ev.new_state;

            if (state_ev.new_state == ESTABLISHED) {
                n.asn = state_ev.peer_asn;
                n.router_id = state_ev.peer_bgp_id;
                n.session_id = state_ev.session_id;
                n.established_at = clock->getTime();
                rib.peerUp(ev.peer_addr, state_ev.peer_bgp_id, state_ev.session_id, out);
                logger->log(INFO, "BgpServer::handleRouteEvent: peer %s (AS%u) established.\n", ipToString(ev.peer_addr).c_str(), n.asn);
            } else if (state_ev.old_state == ESTABLISHED) {
                n.flaps++;
                n.established_at = 0;
                rib.peerDown(ev.peer_addr, out);
                logger->log(INFO, "BgpServer::handleRouteEvent: peer %s went down.\n", ipToString(ev.peer_addr).c_str());
            }

            break;
        }
        case PEER_UPDATE: {
            if (n.state != ESTABLISHED || ev.session_id != n.session_id) {
                logger->log(DEBUG, "BgpServer::handleRouteEvent: dropping update of old session from %s.\n", ipToString(ev.peer_addr).c_str());
                return;
            }

            const PeerUpdateEvent &update_ev = static_cast<const PeerUpdateEvent &>(ev);
            n.updates_in++;

            BgpRibUpdateResult result = rib.update(ev.peer_addr, update_ev.withdrawn, update_ev.attribs, update_ev.nlri, out);
            n.accepted += result.accepted;
            n.rejected += result.rejected;

            break;
        }
        case PEER_REFRESH: {
            if (n.state != ESTABLISHED || ev.session_id != n.session_id) return;
            logger->log(INFO, "BgpServer::handleRouteEvent: route refresh from %s.\n", ipToString(ev.peer_addr).c_str());
            rib.refresh(ev.peer_addr, out);
            break;
        }
        case PEER_OUTPUT: {
            const PeerOutputEvent &output_ev = static_cast<const PeerOutputEvent &>(ev);
            n.updates_out += output_ev.updates;
            break;
        }
    }

    dispatch(out);
}

bool BgpServer::doAddPeer(const BgpNeighborConfig &neighbor) {
    std::string addr_str = ipToString(neighbor.address);

    if (neighbor.address == 0 || neighbor.asn == 0) {
        logger->log(ERROR, "BgpServer::doAddPeer: neighbor needs an address and an asn.\n");
        return false;
    }

    if (neighbors.count(neighbor.address) > 0 || !rib.addPeer(neighbor.address, neighbor.asn, neighbor.route_reflector_client)) {
        logger->log(ERROR, "BgpServer::doAddPeer: peer %s already exists.\n", addr_str.c_str());
        return false;
    }

    Neighbor &n = neighbors[neighbor.address];
    n.config = neighbor;
    n.generation = ++generation;
    n.tap.reset(new BgpServerEventTap(this, n.generation));
    n.state = IDLE;
    n.asn = neighbor.asn;
    n.router_id = 0;
    n.session_id = 0;
    n.updates_in = 0;
    n.updates_out = 0;
    n.accepted = 0;
    n.rejected = 0;
    n.flaps = 0;
    n.established_at = 0;

    BgpConfig fsm_config;
    fsm_config.rev_receiver = n.tap.get();
    fsm_config.asn = config.asn;
    fsm_config.peer_asn = neighbor.asn;
    fsm_config.router_id = config.router_id;
    fsm_config.peer_addr = neighbor.address;
    fsm_config.local_addr = neighbor.local_address;
    fsm_config.hold_timer = neighbor.hold_time;
    fsm_config.keepalive_interval = neighbor.keepalive;
    fsm_config.connect_retry = neighbor.connect_retry;
    fsm_config.passive = neighbor.passive;
    fsm_config.use_4b_asn = true;
    fsm_config.next_hop_self = neighbor.next_hop_self;
    fsm_config.allow_local_as = neighbor.allow_local_as;

    n.peer.reset(peer_factory(fsm_config, neighbor));

    if (!n.peer) {
        logger->log(ERROR, "BgpServer::doAddPeer: failed to create peer %s.\n", addr_str.c_str());
        std::vector<BgpRibOut> discard;
        rib.removePeer(neighbor.address, discard);
        neighbors.erase(neighbor.address);
        return false;
    }

    logger->log(INFO, "BgpServer::doAddPeer: added peer %s (AS%u).\n", addr_str.c_str(), neighbor.asn);
    n.peer->start();

    return true;
}

bool BgpServer::doRemovePeer(uint32_t address) {
    std::map<uint32_t, Neighbor>::iterator it = neighbors.find(address);

    if (it == neighbors.end()) {
        logger->log(ERROR, "BgpServer::doRemovePeer: no such peer: %s.\n", ipToString(address).c_str());
        return false;
    }

    it->second.peer->stop(E_DECONF);

    // joins the peer thread.
    it->second.peer.reset();
    neighbors.erase(it);

    std::vector<BgpRibOut> out;
    rib.removePeer(address, out);
    dispatch(out);

    logger->log(INFO, "BgpServer::doRemovePeer: removed peer %s.\n", ipToString(address).c_str());

    return true;
}

void BgpServer::doInbound(int fd, uint32_t address) {
    std::map<uint32_t, Neighbor>::iterator it = neighbors.find(address);

    if (it == neighbors.end()) {
        logger->log(WARN, "BgpServer::doInbound: connection from unknown peer %s, closing.\n", ipToString(address).c_str());
        ::close(fd);
        return;
    }

    it->second.peer->acceptInbound(fd);
}

void BgpServer::dispatch(const std::vector<BgpRibOut> &out) {
    for (const BgpRibOut &rib_out : out) {
        std::map<uint32_t, Neighbor>::iterator it = neighbors.find(rib_out.peer_addr);
        if (it == neighbors.end()) continue;

        BGPD_LOG(logger, DEBUG) {
            logger->log(DEBUG, "BgpServer::dispatch: %zu announce(s), %zu withdraw(s) to %s.\n",
                rib_out.announce.size(), rib_out.withdraw.size(), ipToString(rib_out.peer_addr).c_str());
        }

        it->second.peer->postRibOut(rib_out);
    }
}

BgpQueryResponse BgpServer::doQuery(const BgpQueryRequest &request) {
    BgpQueryResponse response;
    uint32_t address = 0;
    bool has_address = request.address.size() > 0;

    if (has_address && !ipFromString(request.address, &address)) {
        response.error = BAD_REQUEST;
        response.message = "malformed address: " + request.address;
        return response;
    }

    bool need_address = request.kind == NEIGHBOR || request.kind == ADJ_RIB_IN || request.kind == ADJ_RIB_OUT;

    if (need_address && !has_address) {
        response.error = BAD_REQUEST;
        response.message = std::string("address required for ") + queryKindToString(request.kind);
        return response;
    }

    if (has_address && request.kind != NEIGHBORS && neighbors.count(address) == 0) {
        response.error = NOT_FOUND;
        response.message = "no such peer: " + request.address;
        return response;
    }

    switch (request.kind) {
        case NEIGHBOR:
            queryNeighbor(neighbors[address], response);
            break;
        case NEIGHBORS:
            for (const auto &n : neighbors) queryNeighbor(n.second, response);
            break;
        case ADJ_RIB_IN:
            queryAdjRibIn(address, response);
            break;
        case ADJ_RIB_OUT:
            queryAdjRibOut(address, response);
            break;
        case LOC_RIB:
        case LOC_RIB_BEST:
            queryLocRib(address, request.kind == LOC_RIB_BEST, response);
            break;
        default:
            response.error = BAD_REQUEST;
            response.message = "unknown query";
            break;
    }

    return response;
}

void BgpServer::queryNeighbor(const Neighbor &neighbor, BgpQueryResponse &response) {
    BgpNeighborSummary summary;

    summary.address = ipToString(neighbor.config.address);
    summary.asn = neighbor.asn;
    summary.state = bgpStateToString(neighbor.state);
    summary.router_id = ipToString(neighbor.router_id);
    summary.updates_in = neighbor.updates_in;
    summary.updates_out = neighbor.updates_out;
    summary.accepted = neighbor.accepted;
    summary.rejected = neighbor.rejected;
    summary.flaps = neighbor.flaps;

    if (neighbor.state == ESTABLISHED) {
        uint64_t now = clock->getTime();
        summary.uptime = now > neighbor.established_at ? now - neighbor.established_at : 0;
    }

    const BgpRibPeer *peer = rib.getPeer(neighbor.config.address);
    if (peer != NULL) summary.prefixes = peer->rib_in.size();

    response.neighbors.push_back(summary);
}

void BgpServer::queryAdjRibIn(uint32_t address, BgpQueryResponse &response) {
    const BgpRibPeer *peer = rib.getPeer(address);
    if (peer == NULL) return;

    const std::map<Prefix4, BgpRibEntry> &loc_rib = rib.getLocRib();

    for (const auto &entry : peer->rib_in) {
        std::map<Prefix4, BgpRibEntry>::const_iterator best = loc_rib.find(entry.first);
        bool is_best = best != loc_rib.end() && best->second.src != SRC_LOCAL && best->second.src_addr == address;
        response.routes.push_back(summarize(entry.first, *entry.second.attribs, address, is_best));
    }
}

void BgpServer::queryAdjRibOut(uint32_t address, BgpQueryResponse &response) {
    const BgpRibPeer *peer = rib.getPeer(address);
    if (peer == NULL) return;

    const std::map<Prefix4, BgpRibEntry> &loc_rib = rib.getLocRib();

    for (const auto &entry : peer->rib_out) {
        uint32_t contributor = 0;

        if (!entry.second.local) {
            std::map<Prefix4, BgpRibEntry>::const_iterator best = loc_rib.find(entry.first);
            if (best != loc_rib.end()) contributor = best->second.src_addr;
        }

        response.routes.push_back(summarize(entry.first, *entry.second.attribs, contributor, true));
    }
}

void BgpServer::queryLocRib(uint32_t address, bool best_only, BgpQueryResponse &response) {
    for (const auto &entry : rib.getLocRib()) {
        const BgpRibEntry &best = entry.second;

        if (address != 0 && (best.src == SRC_LOCAL || best.src_addr != address)) continue;

        if (best_only) {
            response.routes.push_back(summarize(entry.first, *best.attribs, best.src_addr, true));
            continue;
        }

        std::vector<BgpRibEntry> candidates = rib.getCandidates(entry.first);
        for (size_t i = 0; i < candidates.size(); i++) {
            const BgpRibEntry &candidate = candidates[i];
            response.routes.push_back(summarize(entry.first, *candidate.attribs, candidate.src_addr, i == 0));
        }
    }
}

BgpRouteSummary BgpServer::summarize(const Prefix4 &route, const BgpAttribSet &attribs, uint32_t contributor, bool best) {
    BgpRouteSummary summary;

    summary.prefix = route.toString();
    summary.next_hop = ipToString(attribs.next_hop);
    summary.as_path = attribs.as_path;
    summary.origin = originToString(attribs.origin);
    summary.local_pref = attribs.local_pref;
    summary.has_med = attribs.has_med;
    summary.med = attribs.med;
    summary.contributor = contributor == 0 ? "local" : ipToString(contributor);
    summary.best = best;

    return summary;
}

}
