/**
 * @file test-common.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Helpers shared by the test suites.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_TEST_COMMON_H_
#define BGPD_TEST_COMMON_H_
#include <stdint.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "bgp-log-handler.h"
#include "bgp-path-attrib.h"
#include "prefix4.h"

namespace bgpd {
namespace test {

// keeps log lines instead of printing them.
class CapturingLogHandler : public BgpLogHandler {
public:
    CapturingLogHandler() {
        setLogLevel(DEBUG);
    }

    bool contains(const std::string &needle) {
        std::lock_guard<std::mutex> lock(lines_mtx);
        for (const std::string &line : lines) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

protected:
    void logImpl(const char *str) {
        std::lock_guard<std::mutex> lock(lines_mtx);
        lines.push_back(str);
    }

private:
    std::mutex lines_mtx;
    std::vector<std::string> lines;
};

inline uint32_t ip(const char *str) {
    uint32_t addr = 0;
    if (!ipFromString(str, &addr)) throw "bad_test_address";
    return addr;
}

inline Prefix4 prefix(const char *str) {
    Prefix4 route;
    if (!Prefix4::fromString(str, &route)) throw "bad_test_prefix";
    return route;
}

/**
 * @brief Build the attributes of a received route.
 *
 * @param logger Log handler.
 * @param path AS_SEQUENCE, first element is the neighbor AS.
 * @param next_hop Next hop.
 * @param local_pref LOCAL_PREF, 0 to leave it out.
 * @param med MED, negative to leave it out.
 */
inline std::vector<std::shared_ptr<BgpPathAttrib>> makeAttribs(BgpLogHandler *logger,
    const std::vector<uint32_t> &path, const char *next_hop, uint32_t local_pref = 0, int64_t med = -1) {
    std::vector<std::shared_ptr<BgpPathAttrib>> attribs;

    attribs.push_back(std::make_shared<BgpPathAttribOrigin>(logger, IGP));

    std::shared_ptr<BgpPathAttribAsPath> as_path = std::make_shared<BgpPathAttribAsPath>(logger, true);
    if (path.size() > 0) {
        BgpAsPathSegment seg(AS_SEQUENCE);
        seg.value = path;
        as_path->as_paths.push_back(seg);
    }
    attribs.push_back(as_path);

    attribs.push_back(std::make_shared<BgpPathAttribNexthop>(logger, ip(next_hop)));
    if (local_pref != 0) attribs.push_back(std::make_shared<BgpPathAttribLocalPref>(logger, local_pref));
    if (med >= 0) attribs.push_back(std::make_shared<BgpPathAttribMed>(logger, (uint32_t) med));

    return attribs;
}

}
}

#endif // BGPD_TEST_COMMON_H_
