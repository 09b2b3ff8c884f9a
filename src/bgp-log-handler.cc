/**
 * @file bgp-log-handler.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief Log handlers used by every bgpd component.
 * @version 0.3
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "bgp-log-handler.h"
#include "serializable.h"
#include <stdarg.h>
#include <stdio.h>
#include <strings.h>

namespace bgpd {

static const char* bgp_log_level_str[] = {
    "FATAL",
    "ERROR",
    "WARN ",
    "INFO ",
    "DEBUG"
};

static const char* bgp_log_level_name[] = {
    "fatal",
    "error",
    "warn",
    "info",
    "debug"
};

/**
 * @brief Get the lowercase name of a log level.
 * 
 * @param level Log level.
 * @return const char* Name of the level.
 */
const char* logLevelToString(LogLevel level) {
    if (level < FATAL || level > DEBUG) return "unknown";
    return bgp_log_level_name[level];
}

/**
 * @brief Parse a log level name (case-insensitive).
 * 
 * @param str The name, one of fatal, error, warn, info, debug.
 * @param level Where to store the parsed level.
 * @return true Parsed.
 * @return false Unknown level name.
 */
bool logLevelFromString(const char *str, LogLevel *level) {
    for (int i = FATAL; i <= DEBUG; i++) {
        if (strcasecmp(str, bgp_log_level_name[i]) == 0) {
            *level = (LogLevel) i;
            return true;
        }
    }

    return false;
}

BgpLogHandler::BgpLogHandler() {
    level = INFO;
}

/**
 * @brief Set the log level.
 * 
 * @param level Log level.
 */
void BgpLogHandler::setLogLevel(LogLevel level) {
    this->level = level;
}

/**
 * @brief Get the log level.
 * 
 * @return LogLevel log level.
 */
LogLevel BgpLogHandler::getLogLevel() const {
    return level;
}

/**
 * @brief Log a message. Wrap the call in BGPD_LOG when building the arguments
 * is costly.
 * 
 * @param level Log level.
 * @param format_str printf format string.
 * @param ... printf variables.
 */
void BgpLogHandler::log(LogLevel level, const char* format_str, ...) {
    if (level > this->level) return;

    std::lock_guard<std::mutex> lock(buf_mtx);
    int pre_sz = snprintf(out_buffer, sizeof(out_buffer), "[%s] ", bgp_log_level_str[level]);

    va_list args;
    va_start(args, format_str);
    vsnprintf(out_buffer + pre_sz, sizeof(out_buffer) - pre_sz, format_str, args);
    va_end(args);
    logImpl(out_buffer);
}

/**
 * @brief Log the printable form of a Serializable (a decoded message).
 * 
 * @param level Log level.
 * @param serializable Serializable object to log.
 */
void BgpLogHandler::log(LogLevel level, const Serializable &serializable) {
    if (level > this->level) return;

    std::lock_guard<std::mutex> lock(buf_mtx);
    int pre_sz = snprintf(out_buffer, sizeof(out_buffer), "[%s] ", bgp_log_level_str[level]);
    serializable.print(out_buffer + pre_sz, sizeof(out_buffer) - pre_sz);
    logImpl(out_buffer);
}

void BgpLogHandler::logImpl(const char* str) {
    fprintf(::stderr, "%s", str);
}

BgpPeerLogHandler::BgpPeerLogHandler(const std::string &peer_addr) : peer_addr(peer_addr) {
    asn = 0;
}

/**
 * @brief Set the ASN shown in the tag. 0 shows "AS???".
 * 
 * @param asn ASN of the peer.
 */
void BgpPeerLogHandler::setAsn(uint32_t asn) {
    this->asn = asn;
}

void BgpPeerLogHandler::logImpl(const char* str) {
    uint32_t tag_asn = asn;
    if (tag_asn == 0) fprintf(::stderr, "[AS??? %s] %s", peer_addr.c_str(), str);
    else fprintf(::stderr, "[AS%u %s] %s", tag_asn, peer_addr.c_str(), str);
}

}
