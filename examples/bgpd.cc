/**
 * @file bgpd.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP speaker daemon.
 * @version 0.3
 * @date 2019-08-10
 *
 * Loads a YAML configuration, starts the speaker and runs until SIGINT or
 * SIGTERM. SIGUSR1 dumps the neighbors and the Loc-RIB to stdout.
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp.h"
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <getopt.h>
#include <future>
#include <string>

// tag lines of the speaker itself, peers tag their own.
class DaemonLogHandler : public bgpd::BgpLogHandler {
protected:
    void logImpl(const char* str) {
        fprintf(stderr, "[bgpd] %s", str);
    }
};

void dump(bgpd::BgpServer &server) {
    std::future<bgpd::BgpQueryResponse> neighbors = server.query(bgpd::BgpQueryRequest(bgpd::NEIGHBORS));
    std::future<bgpd::BgpQueryResponse> loc_rib = server.query(bgpd::BgpQueryRequest(bgpd::LOC_RIB));

    printf("%s", bgpd::formatQueryResponse(neighbors.get(), true).c_str());
    printf("%s", bgpd::formatQueryResponse(loc_rib.get(), true).c_str());
    fflush(stdout);
}

void print_help (const char* me) {
    fprintf(stderr, "bgp-4 speaker for ipv4 unicast.\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [-v] [-t] -c config\n", me);
    fprintf(stderr, "    -c config             path to the yaml configuration file.\n");
    fprintf(stderr, "    -t                    check the configuration and exit.\n");
    fprintf(stderr, "    -v                    enable debug output.\n");
    fprintf(stderr, "    -h                    show this message.\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "send SIGUSR1 to dump neighbors and routes to stdout.\n");
}

int main (int argc, char **argv) {
    const char *config_path = NULL;
    bool verbose = false;
    bool check_only = false;

    int opt;
    while ((opt = getopt(argc, argv, "c:tvh")) != -1) {
        switch (opt) {
            case 'c': config_path = optarg; break;
            case 't': check_only = true; break;
            case 'v': verbose = true; break;
            case 'h':
                print_help(argv[0]);
                return 0;
            default:
                print_help(argv[0]);
                return 1;
        }
    }

    if (config_path == NULL) {
        print_help(argv[0]);
        return 1;
    }

    DaemonLogHandler logger;

    bgpd::BgpServerConfig config;
    bgpd::BgpConfigLoader loader(&logger);

    if (!loader.loadFile(config_path, config)) {
        logger.log(bgpd::FATAL, "main: failed to load configuration from %s.\n", config_path);
        return 1;
    }

    if (verbose) config.log_level = bgpd::DEBUG;
    logger.setLogLevel(config.log_level);

    logger.log(bgpd::INFO, "main: AS%u, router id %s, %zu neighbor(s), %zu network(s).\n",
        config.asn, bgpd::ipToString(config.router_id).c_str(), config.neighbors.size(), config.networks.size());

    if (check_only) return 0;

    // signals are taken by sigwait() below. block them before any thread
    // is started, so every thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);

    int ret = pthread_sigmask(SIG_BLOCK, &signals, NULL);
    if (ret != 0) {
        logger.log(bgpd::FATAL, "main: pthread_sigmask(): %s.\n", strerror(ret));
        return 1;
    }

    bgpd::BgpServer server(&logger, config);

    if (!server.start()) {
        logger.log(bgpd::FATAL, "main: failed to start.\n");
        return 1;
    }

    while (true) {
        int sig = 0;

        ret = sigwait(&signals, &sig);
        if (ret != 0) {
            logger.log(bgpd::FATAL, "main: sigwait(): %s.\n", strerror(ret));
            break;
        }

        if (sig == SIGUSR1) {
            dump(server);
            continue;
        }

        logger.log(bgpd::INFO, "main: got signal %d, shutting down.\n", sig);
        break;
    }

    server.stop();

    return 0;
}
