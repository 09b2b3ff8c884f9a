/**
 * @file bgp-config-loader.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Loads the speaker configuration from YAML.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_CONFIG_LOADER_H_
#define BGPD_CONFIG_LOADER_H_
#include <stdint.h>
#include <string>
#include "bgp-config.h"
#include "bgp-log-handler.h"

namespace YAML {
class Node;
}

namespace bgpd {

/**
 * @brief The BgpConfigLoader class.
 *
 * Reads a BgpServerConfig from a YAML document with three top-level keys:
 * `global` (required), `networks` and `neighbors`. Neighbor timers default
 * to the global ones.
 *
 * Any error (missing file, bad YAML, missing or invalid field) is logged and
 * makes the load fail. The output config is only written on success.
 */
class BgpConfigLoader {
public:
    BgpConfigLoader(BgpLogHandler *logger);

    // load from file.
    bool loadFile(const std::string &path, BgpServerConfig &config);

    // load from a YAML string.
    bool loadString(const std::string &yaml, BgpServerConfig &config);

private:
    bool load(const YAML::Node &root, BgpServerConfig &config);
    bool loadGlobal(const YAML::Node &node, BgpServerConfig &config);
    bool loadNetwork(const YAML::Node &node, BgpLocalRoute &route);
    bool loadNeighbor(const YAML::Node &node, const BgpServerConfig &global, BgpNeighborConfig &neighbor);

    bool readUint(const YAML::Node &node, const char *key, bool required, uint64_t max, uint64_t *value);
    bool readBool(const YAML::Node &node, const char *key, bool *value);
    bool readAddress(const YAML::Node &node, const char *key, bool required, uint32_t *address);
    bool readHoldTime(const YAML::Node &node, const char *key, uint16_t *hold_time);
    bool readConnectRetry(const YAML::Node &node, const char *key, uint16_t *connect_retry);

    BgpLogHandler *logger;
};

}

#endif // BGPD_CONFIG_LOADER_H_
