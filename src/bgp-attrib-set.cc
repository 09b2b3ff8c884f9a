/**
 * @file bgp-attrib-set.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Interned path attribute sets.
 * @version 0.3
 * @date 2019-08-06
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-attrib-set.h"
#include <algorithm>

namespace bgpd {

#define BGPD_ARENA_PRUNE_INTERVAL 1024

static bool attribTypeLess(const std::shared_ptr<BgpPathAttrib> &a, const std::shared_ptr<BgpPathAttrib> &b) {
    return a->type_code < b->type_code;
}

/**
 * @brief Construct a new attribute set.
 * 
 * The attributes are copied. AS_PATH and AGGREGATOR are switched to four
 * octets mode so the same path always gets the same key.
 * 
 * @param logger Pointer to logger object for error logging.
 * @param attribs Path attributes.
 * @throws "bad_attrib_set" An attribute failed to serialize.
 */
BgpAttribSet::BgpAttribSet(BgpLogHandler *logger, const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs) {
    local_pref = 100;
    has_local_pref = false;
    as_path_len = 0;
    origin = INCOMPLETE;
    med = 0;
    has_med = false;
    neighbor_asn = 0;
    next_hop = 0;

    for (const std::shared_ptr<BgpPathAttrib> &attr : attribs) {
        std::shared_ptr<BgpPathAttrib> copy(attr->clone());
        copy->extended = false;

        switch (copy->type_code) {
            case ORIGIN:
                origin = dynamic_cast<const BgpPathAttribOrigin &>(*copy).origin;
                break;
            case AS_PATH: {
                BgpPathAttribAsPath &path = dynamic_cast<BgpPathAttribAsPath &>(*copy);
                path.is_4b = true;
                as_path_len = path.getPathLength();
                neighbor_asn = path.getFirstAsn();
                as_path = path.toString();
                break;
            }
            case NEXT_HOP:
                next_hop = dynamic_cast<const BgpPathAttribNexthop &>(*copy).next_hop;
                break;
            case MULTI_EXIT_DISC:
                med = dynamic_cast<const BgpPathAttribMed &>(*copy).med;
                has_med = true;
                break;
            case LOCAL_PREF:
                local_pref = dynamic_cast<const BgpPathAttribLocalPref &>(*copy).local_pref;
                has_local_pref = true;
                break;
            case AGGREGATOR:
                dynamic_cast<BgpPathAttribAggregator &>(*copy).is_4b = true;
                break;
        }

        this->attribs.push_back(copy);
    }

    std::stable_sort(this->attribs.begin(), this->attribs.end(), attribTypeLess);

    for (const std::shared_ptr<BgpPathAttrib> &attr : this->attribs) {
        std::vector<uint8_t> buf(attr->length());
        ssize_t written = attr->write(buf.data(), buf.size());
        if (written < 0) {
            logger->log(FATAL, "BgpAttribSet::BgpAttribSet: failed to serialize attribute %u.\n", attr->type_code);
            throw "bad_attrib_set";
        }
        key.append((const char *) buf.data(), written);
    }
}

const std::vector<std::shared_ptr<BgpPathAttrib>>& BgpAttribSet::getAttribs() const {
    return attribs;
}

const BgpPathAttrib* BgpAttribSet::getAttrib(uint8_t type) const {
    for (const std::shared_ptr<BgpPathAttrib> &attr : attribs) {
        if (attr->type_code == type) return attr.get();
    }

    return NULL;
}

bool BgpAttribSet::hasAttrib(uint8_t type) const {
    return getAttrib(type) != NULL;
}

const std::string& BgpAttribSet::getKey() const {
    return key;
}

BgpAttribArena::BgpAttribArena(BgpLogHandler *logger) {
    this->logger = logger;
    interned_since_prune = 0;
}

/**
 * @brief Intern an attribute list.
 * 
 * @param attribs Path attributes.
 * @return std::shared_ptr<const BgpAttribSet> The shared set. Identical
 * content gives the same pointer as long as the first one is alive.
 */
std::shared_ptr<const BgpAttribSet> BgpAttribArena::intern(const std::vector<std::shared_ptr<BgpPathAttrib>> &attribs) {
    if (++interned_since_prune >= BGPD_ARENA_PRUNE_INTERVAL) {
        interned_since_prune = 0;
        prune();
    }

    std::shared_ptr<const BgpAttribSet> set(new BgpAttribSet(logger, attribs));

    std::weak_ptr<const BgpAttribSet> &slot = sets[set->getKey()];
    std::shared_ptr<const BgpAttribSet> existing = slot.lock();
    if (existing) return existing;

    slot = set;
    return set;
}

size_t BgpAttribArena::size() {
    prune();
    return sets.size();
}

void BgpAttribArena::prune() {
    for (auto it = sets.begin(); it != sets.end();) {
        if (it->second.expired()) it = sets.erase(it);
        else it++;
    }
}

}
