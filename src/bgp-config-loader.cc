/**
 * @file bgp-config-loader.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Loads the speaker configuration from YAML.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#include "bgp-config-loader.h"
#include "prefix4.h"
#include <yaml-cpp/yaml.h>
#include <set>

namespace bgpd {

BgpConfigLoader::BgpConfigLoader(BgpLogHandler *logger) {
    if (logger == NULL) throw "null_logger";
    this->logger = logger;
}

bool BgpConfigLoader::loadFile(const std::string &path, BgpServerConfig &config) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        logger->log(ERROR, "BgpConfigLoader::loadFile: can't open %s.\n", path.c_str());
        return false;
    } catch (const YAML::Exception &e) {
        logger->log(ERROR, "BgpConfigLoader::loadFile: %s: %s.\n", path.c_str(), e.what());
        return false;
    }

    return load(root, config);
}

bool BgpConfigLoader::loadString(const std::string &yaml, BgpServerConfig &config) {
    YAML::Node root;

    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception &e) {
        logger->log(ERROR, "BgpConfigLoader::loadString: %s.\n", e.what());
        return false;
    }

    return load(root, config);
}

bool BgpConfigLoader::load(const YAML::Node &root, BgpServerConfig &config) {
    if (!root.IsMap()) {
        logger->log(ERROR, "BgpConfigLoader::load: configuration is not a map.\n");
        return false;
    }

    if (!root["global"] || !root["global"].IsMap()) {
        logger->log(ERROR, "BgpConfigLoader::load: missing global section.\n");
        return false;
    }

    BgpServerConfig loaded;
    if (!loadGlobal(root["global"], loaded)) return false;

    const YAML::Node networks = root["networks"];
    if (networks) {
        if (!networks.IsSequence()) {
            logger->log(ERROR, "BgpConfigLoader::load: networks must be a list.\n");
            return false;
        }

        for (const YAML::Node &node : networks) {
            BgpLocalRoute route;
            if (!loadNetwork(node, route)) return false;
            loaded.networks.push_back(route);
        }
    }

    const YAML::Node neighbors = root["neighbors"];
    if (neighbors) {
        if (!neighbors.IsSequence()) {
            logger->log(ERROR, "BgpConfigLoader::load: neighbors must be a list.\n");
            return false;
        }

        std::set<uint32_t> seen;

        for (const YAML::Node &node : neighbors) {
            BgpNeighborConfig neighbor;
            if (!loadNeighbor(node, loaded, neighbor)) return false;

            if (!seen.insert(neighbor.address).second) {
                logger->log(ERROR, "BgpConfigLoader::load: duplicated neighbor %s.\n", ipToString(neighbor.address).c_str());
                return false;
            }

            loaded.neighbors.push_back(neighbor);
        }
    }

    config = loaded;
    return true;
}

bool BgpConfigLoader::loadGlobal(const YAML::Node &node, BgpServerConfig &config) {
    uint64_t value;

    if (!readUint(node, "asn", true, 0xffffffff, &value)) return false;
    if (value == 0) {
        logger->log(ERROR, "BgpConfigLoader::loadGlobal: asn can't be 0.\n");
        return false;
    }
    config.asn = value;

    if (!readAddress(node, "router_id", true, &config.router_id)) return false;
    if (config.router_id == 0) {
        logger->log(ERROR, "BgpConfigLoader::loadGlobal: router_id can't be 0.0.0.0.\n");
        return false;
    }

    if (!readAddress(node, "listen_address", false, &config.listen_address)) return false;

    value = config.listen_port;
    if (!readUint(node, "listen_port", false, 65535, &value)) return false;
    config.listen_port = value;

    if (!readHoldTime(node, "hold_time", &config.hold_time)) return false;

    if (!readConnectRetry(node, "connect_retry", &config.connect_retry)) return false;

    if (!readBool(node, "always_compare_med", &config.always_compare_med)) return false;

    if (node["log_level"]) {
        std::string level;

        try {
            level = node["log_level"].as<std::string>();
        } catch (const YAML::BadConversion &) {
            logger->log(ERROR, "BgpConfigLoader::loadGlobal: log_level must be a string.\n");
            return false;
        }

        if (!logLevelFromString(level.c_str(), &config.log_level)) {
            logger->log(ERROR, "BgpConfigLoader::loadGlobal: unknown log_level: %s.\n", level.c_str());
            return false;
        }
    }

    return true;
}

bool BgpConfigLoader::loadNetwork(const YAML::Node &node, BgpLocalRoute &route) {
    if (!node.IsMap() || !node["prefix"]) {
        logger->log(ERROR, "BgpConfigLoader::loadNetwork: network needs a prefix.\n");
        return false;
    }

    std::string prefix_str;

    try {
        prefix_str = node["prefix"].as<std::string>();
    } catch (const YAML::BadConversion &) {
        logger->log(ERROR, "BgpConfigLoader::loadNetwork: prefix must be a string.\n");
        return false;
    }

    if (!Prefix4::fromString(prefix_str, &route.route)) {
        logger->log(ERROR, "BgpConfigLoader::loadNetwork: invalid prefix: %s.\n", prefix_str.c_str());
        return false;
    }

    if (!readAddress(node, "next_hop", false, &route.next_hop)) return false;

    uint64_t value;

    if (node["local_pref"]) {
        if (!readUint(node, "local_pref", true, 0xffffffff, &value)) return false;
        route.has_local_pref = true;
        route.local_pref = value;
    }

    if (node["med"]) {
        if (!readUint(node, "med", true, 0xffffffff, &value)) return false;
        route.has_med = true;
        route.med = value;
    }

    return true;
}

bool BgpConfigLoader::loadNeighbor(const YAML::Node &node, const BgpServerConfig &global, BgpNeighborConfig &neighbor) {
    if (!node.IsMap()) {
        logger->log(ERROR, "BgpConfigLoader::loadNeighbor: neighbor must be a map.\n");
        return false;
    }

    uint64_t value;

    if (!readAddress(node, "address", true, &neighbor.address)) return false;
    if (neighbor.address == 0) {
        logger->log(ERROR, "BgpConfigLoader::loadNeighbor: address can't be 0.0.0.0.\n");
        return false;
    }

    std::string addr_str = ipToString(neighbor.address);

    if (!readUint(node, "asn", true, 0xffffffff, &value)) return false;
    if (value == 0) {
        logger->log(ERROR, "BgpConfigLoader::loadNeighbor: asn of %s can't be 0.\n", addr_str.c_str());
        return false;
    }
    neighbor.asn = value;

    if (!readAddress(node, "local_address", false, &neighbor.local_address)) return false;

    neighbor.hold_time = global.hold_time;
    if (!readHoldTime(node, "hold_time", &neighbor.hold_time)) return false;

    value = 0;
    if (!readUint(node, "keepalive", false, 65535, &value)) return false;
    neighbor.keepalive = value;

    neighbor.connect_retry = global.connect_retry;
    if (!readConnectRetry(node, "connect_retry", &neighbor.connect_retry)) return false;

    if (!readBool(node, "passive", &neighbor.passive)) return false;
    if (!readBool(node, "route_reflector_client", &neighbor.route_reflector_client)) return false;
    if (!readBool(node, "next_hop_self", &neighbor.next_hop_self)) return false;

    value = neighbor.port;
    if (!readUint(node, "port", false, 65535, &value)) return false;
    if (value == 0) {
        logger->log(ERROR, "BgpConfigLoader::loadNeighbor: port of %s can't be 0.\n", addr_str.c_str());
        return false;
    }
    neighbor.port = value;

    value = 0;
    if (!readUint(node, "allow_local_as", false, 127, &value)) return false;
    neighbor.allow_local_as = value;

    return true;
}

/**
 * @brief Read an unsigned integer field.
 *
 * @param node The map.
 * @param key The field.
 * @param required Fail if the field is absent.
 * @param max Largest valid value.
 * @param value Where to put the value. Untouched if the field is absent.
 * @return true Field read or absent.
 * @return false Field invalid, or required and absent.
 */
bool BgpConfigLoader::readUint(const YAML::Node &node, const char *key, bool required, uint64_t max, uint64_t *value) {
    const YAML::Node field = node[key];

    if (!field) {
        if (!required) return true;
        logger->log(ERROR, "BgpConfigLoader::readUint: missing required field: %s.\n", key);
        return false;
    }

    uint64_t parsed;

    try {
        if (!field.IsScalar() || field.Scalar().size() == 0 || field.Scalar()[0] == '-') {
            throw YAML::BadConversion(field.Mark());
        }

        parsed = field.as<uint64_t>();
    } catch (const YAML::BadConversion &) {
        logger->log(ERROR, "BgpConfigLoader::readUint: %s is not an unsigned integer.\n", key);
        return false;
    }

    if (parsed > max) {
        logger->log(ERROR, "BgpConfigLoader::readUint: %s out of range (max %lu).\n", key, (unsigned long) max);
        return false;
    }

    *value = parsed;
    return true;
}

bool BgpConfigLoader::readBool(const YAML::Node &node, const char *key, bool *value) {
    const YAML::Node field = node[key];
    if (!field) return true;

    try {
        *value = field.as<bool>();
    } catch (const YAML::BadConversion &) {
        logger->log(ERROR, "BgpConfigLoader::readBool: %s is not a boolean.\n", key);
        return false;
    }

    return true;
}

bool BgpConfigLoader::readAddress(const YAML::Node &node, const char *key, bool required, uint32_t *address) {
    const YAML::Node field = node[key];

    if (!field) {
        if (!required) return true;
        logger->log(ERROR, "BgpConfigLoader::readAddress: missing required field: %s.\n", key);
        return false;
    }

    std::string str;

    try {
        str = field.as<std::string>();
    } catch (const YAML::BadConversion &) {
        logger->log(ERROR, "BgpConfigLoader::readAddress: %s is not a string.\n", key);
        return false;
    }

    if (!ipFromString(str, address)) {
        logger->log(ERROR, "BgpConfigLoader::readAddress: %s: invalid address: %s.\n", key, str.c_str());
        return false;
    }

    return true;
}

// hold time is 0 or at least 3 seconds.
bool BgpConfigLoader::readHoldTime(const YAML::Node &node, const char *key, uint16_t *hold_time) {
    uint64_t value = *hold_time;
    if (!readUint(node, key, false, 65535, &value)) return false;

    if (value == 1 || value == 2) {
        logger->log(ERROR, "BgpConfigLoader::readHoldTime: %s must be 0 or at least 3.\n", key);
        return false;
    }

    *hold_time = value;
    return true;
}

bool BgpConfigLoader::readConnectRetry(const YAML::Node &node, const char *key, uint16_t *connect_retry) {
    uint64_t value = *connect_retry;
    if (!readUint(node, key, false, 65535, &value)) return false;

    if (value == 0) {
        logger->log(ERROR, "BgpConfigLoader::readConnectRetry: %s must be at least 1.\n", key);
        return false;
    }

    *connect_retry = value;
    return true;
}

}
