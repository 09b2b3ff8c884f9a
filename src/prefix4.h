/**
 * @file prefix4.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief IPv4 prefix utilities.
 * @version 0.3
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_PREFIX4_H_
#define BGPD_PREFIX4_H_
#include <stdint.h>
#include <unistd.h>
#include <string>

namespace bgpd {

uint32_t cidr_to_mask(uint8_t cidr);

/**
 * @brief IPv4 prefix.
 * 
 * The prefix is stored in network byte order. Host bits are always cleared.
 */
class Prefix4 {
public:
    Prefix4();
    Prefix4(uint32_t prefix, uint8_t length);
    Prefix4(const char* prefix, uint8_t length);

    // parse "a.b.c.d/len", returns false on bad input.
    static bool fromString(const std::string &str, Prefix4 *out);

    ssize_t parse(const uint8_t *buffer, size_t buf_sz);
    ssize_t write(uint8_t *buffer, size_t buf_sz) const;
    size_t wireLength() const;

    // test if address in prefix
    bool includes (uint32_t address) const;

    // test if route other is sub-prefix
    bool includes (const Prefix4 &other) const;

    bool operator== (const Prefix4 &other) const;
    bool operator!= (const Prefix4 &other) const;

    // total order: address (host order) first, then length.
    bool operator< (const Prefix4 &other) const;

    uint32_t getPrefix() const;
    uint8_t getLength() const;
    uint32_t getMask() const;

    std::string toString() const;

private:
    uint8_t length;
    uint32_t prefix;
};

std::string ipToString(uint32_t address);
bool ipFromString(const std::string &str, uint32_t *address);

}

#endif // BGPD_PREFIX4_H_
