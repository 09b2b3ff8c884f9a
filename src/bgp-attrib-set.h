/**
 * @file bgp-attrib-set.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Interned path attribute sets.
 * @version 0.3
 * @date 2019-08-06
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_ATTRIB_SET_H_
#define BGPD_ATTRIB_SET_H_
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include "bgp-path-attrib.h"
#include "bgp-log-handler.h"

namespace bgpd {

/**
 * @brief An immutable set of path attributes.
 * 
 * Attributes are kept sorted by type code, with four octets ASNs. The fields
 * the decision process looks at are extracted once at construction.
 */
class BgpAttribSet {
public:
    BgpAttribSet(BgpLogHandler *logger, const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs);

    const std::vector<std::shared_ptr<BgpPathAttrib>>& getAttribs() const;

    // NULL if the set does not have this type of attribute.
    const BgpPathAttrib* getAttrib(uint8_t type) const;
    bool hasAttrib(uint8_t type) const;

    // canonical wire encoding of the attribute list.
    const std::string& getKey() const;

    uint32_t local_pref;
    bool has_local_pref;
    uint32_t as_path_len;
    uint8_t origin;
    uint32_t med;
    bool has_med;
    uint32_t neighbor_asn;

    // network byte order, 0 if there is no NEXT_HOP.
    uint32_t next_hop;

    std::string as_path;

private:
    std::vector<std::shared_ptr<BgpPathAttrib>> attribs;
    std::string key;
};

/**
 * @brief The attribute arena.
 * 
 * Attribute sets with the same content are interned to the same instance. The
 * arena only holds weak references: a set goes away with the last RIB entry
 * using it, and its slot is reclaimed on the next intern() or size().
 */
class BgpAttribArena {
public:
    BgpAttribArena(BgpLogHandler *logger);

    std::shared_ptr<const BgpAttribSet> intern(const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs);

    // number of live sets.
    size_t size();

private:
    void prune();

    BgpLogHandler *logger;
    std::unordered_map<std::string, std::weak_ptr<const BgpAttribSet>> sets;
    size_t interned_since_prune;
};

}

#endif // BGPD_ATTRIB_SET_H_
