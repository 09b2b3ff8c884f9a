/**
 * @file serializable.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief The serializable base.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "serializable.h"
#include <stdio.h>
#include <stdarg.h>
#include <string.h>

namespace bgpd {

/**
 * @brief Construct a new Serializable object
 * 
 * @param logger Logger for serializer/deserializer errors.
 */
Serializable::Serializable(BgpLogHandler *logger) {
    if (logger == NULL) throw "null_logger";
    err_code = 0;
    err_subcode = 0;
    this->logger = logger;
}

/**
 * @brief Check if error information available.
 * 
 * @return true information avaliable.
 * @return false information not avaliable.
 */
bool Serializable::hasError() const {
    return err_code != 0;
}

/**
 * @brief Set the error information.
 * 
 * @param err The error code.
 * @param suberr The error subcode.
 * @param data The error data buffer.
 * @param data_len The length of error data buffer.
 * @throws "err_exist" Error already set.
 */
void Serializable::setError(uint8_t err, uint8_t suberr, const uint8_t *data, size_t data_len) {
    if (err_code != 0) {
        logger->log(FATAL, "Serializable::setError: error already exists.\n");
        throw "err_exist";
    }

    err_code = err;
    err_subcode = suberr;

    if (data_len == 0 || data == NULL) return;
    err_data.assign(data, data + data_len);
}

uint8_t Serializable::getErrorCode() const {
    return err_code;
}

uint8_t Serializable::getErrorSubCode() const {
    return err_subcode;
}

const uint8_t* Serializable::getError() const {
    return err_data.size() > 0 ? err_data.data() : NULL;
}

size_t Serializable::getErrorLength() const {
    return err_data.size();
}

/**
 * @brief Forward error information from other Serializable object.
 * 
 * @param other The other Serializable object.
 */
void Serializable::forwardParseError(const Serializable &other) {
    setError(other.getErrorCode(), other.getErrorSubCode(), other.getError(), other.getErrorLength());
}

/**
 * @brief Print the Serializable object as human readable string.
 * 
 * @param to The pointer to the string buffer.
 * @param buf_sz The length of string buffer.
 * @return ssize_t Bytes written.
 */
ssize_t Serializable::print(char *to, size_t buf_sz) const {
    if (buf_sz > 0) to[0] = 0;
    return doPrint(0, &to, &buf_sz);
}

/**
 * @brief Print the Serializable object as human readable string, with 
 * indentation.
 * 
 * @param indent indent level.
 * @param to The pointer to the string buffer.
 * @param buf_sz The length of string buffer.
 * @return ssize_t Bytes written.
 */
ssize_t Serializable::print(size_t indent, char *to, size_t buf_sz) const {
    if (buf_sz > 0) to[0] = 0;
    return doPrint(indent, &to, &buf_sz);
}

/**
 * @brief Print helper.
 * 
 * @param indent indent level.
 * @param to The pointer to the pointer to the string buffer.
 * @param buf_left The pointer to the counter of avaliable buffer space.
 * @param format The printf format string.
 * @param ... 
 * @return ssize_t Bytes written.
 * @retval -1 Failed to print.
 * @retval >=0 Bytes written.
 */
ssize_t Serializable::_print(size_t indent, char **to, size_t *buf_left, const char* format, ...) {
    if (*buf_left <= indent * 4 + 1) return 0;
    for (size_t i = 0; i < indent; i++) {
        memcpy(*to, "    ", 4);
        *to += 4;
        *buf_left -= 4;
    }
    **to = 0;

    va_list args;
    va_start(args, format);
    ssize_t sz = vsnprintf(*to, *buf_left, format, args);
    va_end(args);

    if (sz < 0) return sz;

    // truncated: leave the terminating null in place.
    if ((size_t) sz >= *buf_left) {
        size_t written = *buf_left - 1;
        *to += written;
        *buf_left = 1;
        return written + indent * 4;
    }

    *buf_left -= sz;
    *to += sz;

    return sz + indent * 4;
}

/**
 * @brief Get size in bytes required to serialize the object.
 * 
 * @return ssize_t Size in btyes.
 * @retval -1 Failed to get size.
 * @retval >=0 Size in btyes.
 */
ssize_t Serializable::length() const {
    uint8_t buffer[4096];
    return write(buffer, sizeof(buffer));
}

/**
 * @brief Replace logger for this object.
 * 
 * @param logger The new logger.
 */
void Serializable::setLogger(BgpLogHandler *logger) {
    this->logger = logger;
}

}
