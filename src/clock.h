/**
 * @file clock.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The bgpd clock interface.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_CLOCK_H_
#define BGPD_CLOCK_H_
#include <stdint.h>
#include <atomic>

namespace bgpd {

/**
 * @brief The Clock interface.
 * 
 * BgpFsm reads the time from a Clock to evaluate the connect-retry, hold and
 * keepalive timers. Time is counted in seconds. Only differences between two
 * readings are meaningful.
 */
class Clock {
public:

    /**
     * @brief Get the current time.
     * 
     * @return uint64_t current time in second.
     */
    virtual uint64_t getTime() const = 0;
    virtual ~Clock() {}
};

/**
 * @brief Clock backed by the system monotonic clock.
 */
class RealtimeClock : public Clock {
public:
    uint64_t getTime() const;
};

/**
 * @brief Clock that only moves when told to.
 * 
 * Used to drive FSM timers deterministically (tests, simulation).
 */
class ManualClock : public Clock {
public:
    ManualClock(uint64_t start = 0);

    uint64_t getTime() const;
    void setTime(uint64_t time);
    void advance(uint64_t seconds);

private:
    std::atomic<uint64_t> now;
};

}

#endif // BGPD_CLOCK_H_
