/**
 * @file value-op.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief Buffer operation helpers.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_VALUE_OP_H_
#define BGPD_VALUE_OP_H_
#include <stdint.h>
#include <unistd.h>
#include <string.h>
#include <arpa/inet.h>

namespace bgpd {

/**
 * @brief Get value from buffer.
 * 
 * Read value from buffer pointer and move buffer pointer. The value is copied
 * as-is, byte order is the caller's business.
 * 
 * @tparam T Type of value.
 * @param buffer Pointer to buffer.
 * @return T The value.
 */
template <typename T> T getValue(const uint8_t **buffer) {
    const uint8_t *buf = *buffer;
    T var;
    memcpy(&var, buf, sizeof(T));
    *buffer = buf + sizeof(T);
    return var;
}

/**
 * @brief Put value to buffer.
 * 
 * Write the value to buffer pointer and move the buffer pointer.
 * 
 * @tparam T Type of value.
 * @param buffer Pointer to pointer to buffer.
 * @param value Value to write.
 * @return size_t Bytes written.
 */
template <typename T> size_t putValue(uint8_t **buffer, T value) {
    uint8_t *buf = *buffer;
    memcpy(buf, &value, sizeof(T));
    *buffer = buf + sizeof(T);
    return sizeof(T);
}

// network byte order shorthands.
inline uint16_t getU16(const uint8_t **buffer) {
    return ntohs(getValue<uint16_t>(buffer));
}

inline uint32_t getU32(const uint8_t **buffer) {
    return ntohl(getValue<uint32_t>(buffer));
}

inline size_t putU16(uint8_t **buffer, uint16_t value) {
    return putValue<uint16_t>(buffer, htons(value));
}

inline size_t putU32(uint8_t **buffer, uint32_t value) {
    return putValue<uint32_t>(buffer, htonl(value));
}

}
#endif // BGPD_VALUE_OP_H_
