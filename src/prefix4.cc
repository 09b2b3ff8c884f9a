/**
 * @file prefix4.cc
 * @author Nato Morichika <nat@nat.moe>
 * @brief IPv4 prefix utilities.
 * @version 0.3
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#include "prefix4.h"
#include "value-op.h"
#include <arpa/inet.h>
#include <stdlib.h>

namespace bgpd {

/**
 * @brief Convert netmask in CIDR notation to network bytes integer.
 * 
 * @param cidr The netmask in CIDR notation.
 * @return uint32_t The netmask in network byte order.
 * @throws "bad_route_length" Netmask invalid.
 */
uint32_t cidr_to_mask(uint8_t cidr) {
    if (cidr > 32) throw "bad_route_length";
    if (cidr == 0) return 0;
    return htonl(0xffffffff << (32 - cidr));
}

/**
 * @brief Format an address in network byte order as dotted string.
 */
std::string ipToString(uint32_t address) {
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &address, buf, INET_ADDRSTRLEN) == NULL) return "?";
    return std::string(buf);
}

/**
 * @brief Parse a dotted string address into network byte order.
 * 
 * @return true Parsed.
 * @return false Not a valid IPv4 address.
 */
bool ipFromString(const std::string &str, uint32_t *address) {
    return inet_pton(AF_INET, str.c_str(), address) == 1;
}

Prefix4::Prefix4() {
    prefix = length = 0;
}

/**
 * @brief Construct a new Prefix4 object
 * 
 * @param prefix Prefix in network bytes order.
 * @param length Netmask in CIDR notation.
 * @throws "bad_route_length" Netmask invalid.
 */
Prefix4::Prefix4(uint32_t prefix, uint8_t length) {
    this->length = length;
    this->prefix = prefix & cidr_to_mask(length);
}

/**
 * @brief Construct a new Prefix4 object
 * 
 * @param prefix Prefix in dotted string notation.
 * @param length Netmask in CIDR notation.
 * @throws "bad_route_length" Netmask invalid.
 * @throws "bad_prefix" Prefix is not a valid address.
 */
Prefix4::Prefix4(const char* prefix, uint8_t length) {
    uint32_t addr = 0;
    if (inet_pton(AF_INET, prefix, &addr) != 1) throw "bad_prefix";
    this->length = length;
    this->prefix = addr & cidr_to_mask(length);
}

bool Prefix4::fromString(const std::string &str, Prefix4 *out) {
    size_t slash = str.find('/');
    if (slash == std::string::npos) return false;

    uint32_t addr = 0;
    if (!ipFromString(str.substr(0, slash), &addr)) return false;

    std::string len_str = str.substr(slash + 1);
    if (len_str.size() == 0 || len_str.size() > 2) return false;

    char *end = NULL;
    long len = strtol(len_str.c_str(), &end, 10);
    if (*end != 0 || len < 0 || len > 32) return false;

    *out = Prefix4(addr, (uint8_t) len);
    return true;
}

/**
 * @brief Parse a IPv4 NLRI prefix from buffer.
 * 
 * @param buffer Buffer to parse from.
 * @param buf_sz Size of the buffer.
 * @return ssize_t Bytes read.
 * @retval -1 Failed to parse prefix.
 * @retval >=0 Bytes read.
 */
ssize_t Prefix4::parse(const uint8_t *buffer, size_t buf_sz) {
    if (buf_sz < 1) return -1;
    uint8_t len = getValue<uint8_t>(&buffer);
    if (len > 32) return -1;
    size_t prefix_buf_len = (len + 7) / 8;
    if (prefix_buf_len + 1 > buf_sz) return -1;
    uint32_t addr = 0;
    memcpy(&addr, buffer, prefix_buf_len);
    length = len;
    prefix = addr & cidr_to_mask(len);
    return prefix_buf_len + 1;
}

/**
 * @brief Write a IPv4 prefix to NLRI buffer.
 * 
 * @param buffer Buffer to write to.
 * @param buf_sz Size of the buffer (max write size).
 * @return ssize_t Bytes written.
 * @retval -1 Failed to write.
 * @retval >=0 Bytes written.
 */
ssize_t Prefix4::write(uint8_t *buffer, size_t buf_sz) const {
    size_t prefix_buf_len = (length + 7) / 8;
    if (buf_sz < 1 + prefix_buf_len) return -1;
    putValue<uint8_t>(&buffer, length);
    memcpy(buffer, &prefix, prefix_buf_len);
    return prefix_buf_len + 1;
}

size_t Prefix4::wireLength() const {
    return 1 + (length + 7) / 8;
}

/**
 * @brief Test if an address is inside this prefix.
 * 
 * @param address The address in network bytes order.
 * @return true The address is in the prefix.
 * @return false The address in not in the prefix.
 */
bool Prefix4::includes (uint32_t address) const {
    return (address & cidr_to_mask(length)) == prefix;
}

/**
 * @brief Test if another prefix is inside this prefix.
 * 
 * @param other The other prefix.
 * @return true The other prefix is in this prefix.
 * @return false The other prefix is not in this prefix.
 */
bool Prefix4::includes (const Prefix4 &other) const {
    if (other.length < length) return false;
    return (other.prefix & cidr_to_mask(length)) == prefix;
}

bool Prefix4::operator== (const Prefix4 &other) const {
    return other.prefix == prefix && other.length == length;
}

bool Prefix4::operator!= (const Prefix4 &other) const {
    return !(*this == other);
}

bool Prefix4::operator< (const Prefix4 &other) const {
    uint32_t a = ntohl(prefix), b = ntohl(other.prefix);
    if (a != b) return a < b;
    return length < other.length;
}

/**
 * @brief Get prefix.
 * 
 * @return uint32_t The prefix in network byte order.
 */
uint32_t Prefix4::getPrefix() const {
    return prefix;
}

/**
 * @brief Get netmask.
 * 
 * @return uint8_t The netmask in CIDR notation.
 */
uint8_t Prefix4::getLength() const {
    return length;
}

/**
 * @brief Get netmask.
 * 
 * @return uint32_t The netmask in network byte order.
 */
uint32_t Prefix4::getMask() const {
    return cidr_to_mask(length);
}

std::string Prefix4::toString() const {
    return ipToString(prefix) + "/" + std::to_string(length);
}

}
