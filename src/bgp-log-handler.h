/**
 * @file bgp-log-handler.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Log handlers used by every bgpd component.
 * @version 0.3
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_LOG_HANDLER_H_
#define BGPD_LOG_HANDLER_H_
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>

// formatting some log lines (a decoded packet, an address) is expensive. the
// macro skips that work entirely when the level is filtered out.
#ifndef BGPD_DISABLE_LOG_MACROS
#define BGPD_LOG(logger, level) if ((logger)->getLogLevel() >= (level))
#else
#define BGPD_LOG(logger, level) if (0)
#endif

namespace bgpd {

class Serializable;

/**
 * @brief Log levels for logger (BgpLogHandler)
 * 
 */
enum LogLevel {
    FATAL,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

const char* logLevelToString(LogLevel level);
bool logLevelFromString(const char *str, LogLevel *level);

/**
 * @brief The BgpLogHandler class.
 * 
 * The log handler is shared by the codec, the FSMs, the RIB and the server.
 * Lines are formatted printf-style and prefixed with the level. log() may be
 * called from any thread.
 * 
 */
class BgpLogHandler {
public:
    BgpLogHandler();

    void log(LogLevel level, const char* format_str, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 3, 4)))
#endif
        ;
    void log(LogLevel level, const Serializable &serializable);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    virtual ~BgpLogHandler() {}
protected:

    /**
     * @brief Log implementation. By default, it writes to stderr. Override it
     * to send lines somewhere else.
     * 
     * @param str Log message, already prefixed with the level.
     */
    virtual void logImpl(const char* str);

private:
    LogLevel level;
    std::mutex buf_mtx;
    char out_buffer[4096];
};

/**
 * @brief Log handler that tags every line with the peer it belongs to.
 * 
 * The ASN is unknown until the OPEN exchange completes, in that case the line
 * is tagged "AS???".
 */
class BgpPeerLogHandler : public BgpLogHandler {
public:
    BgpPeerLogHandler(const std::string &peer_addr);

    void setAsn(uint32_t asn);

protected:
    void logImpl(const char* str);

private:
    std::string peer_addr;
    std::atomic<uint32_t> asn;
};

}

#endif // BGPD_LOG_HANDLER_H_
