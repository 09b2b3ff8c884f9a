/**
 * @file clock.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Clock implementations.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "clock.h"
#include <time.h>

namespace bgpd {

uint64_t RealtimeClock::getTime() const {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) return time(NULL);
    return ts.tv_sec;
}

ManualClock::ManualClock(uint64_t start) : now(start) {}

uint64_t ManualClock::getTime() const {
    return now;
}

void ManualClock::setTime(uint64_t time) {
    now = time;
}

void ManualClock::advance(uint64_t seconds) {
    now += seconds;
}

}
