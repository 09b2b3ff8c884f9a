/**
 * @file serializable.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The serializable base.
 * @version 0.2
 * @date 2019-08-02
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_SERIALIZABLE_H_
#define BGPD_SERIALIZABLE_H_
#include <stdint.h>
#include <unistd.h>
#include <vector>
#include "bgp-log-handler.h"

namespace bgpd {

/**
 * @brief The serializable base class.
 * 
 * Every wire object (message, capability, path attribute) derives from this
 * class. A failed parse records the BGP error code, subcode and data so the
 * FSM can put them into a NOTIFICATION.
 * 
 */
class Serializable {
public:
    Serializable(BgpLogHandler *logger);
    virtual ~Serializable() {}

    // print the object as human readable string.
    ssize_t print(char *to, size_t buf_sz) const;

    // print the object as human readable string, pre-indented.
    ssize_t print(size_t indent, char *to, size_t buf_sz) const;

    /**
     * @brief Deserialize the object from buffer.
     * 
     * @param from The pointer to buffer.
     * @param msg_sz The max read length of deserializer.
     * @return ssize_t Bytes read.
     * @retval -1 Deserialization failed. Error details are available with
     * getErrorCode(), getErrorSubCode() and getError().
     * @retval >=0 Bytes read.
     */
    virtual ssize_t parse(const uint8_t *from, size_t msg_sz) = 0;

    /**
     * @brief Serialize the object and write to buffer.
     * 
     * @param to The pointer to buffer.
     * @param buf_sz The max write size of serializer.
     * @return ssize_t Btyes written.
     * @retval -1 Serialization failed.
     * @retval >=0 Bytes written.
     */
    virtual ssize_t write(uint8_t *to, size_t buf_sz) const = 0;

    virtual ssize_t length() const;

    bool hasError() const;
    uint8_t getErrorCode() const;
    uint8_t getErrorSubCode() const;

    // data field of the NOTIFICATION message
    const uint8_t* getError() const;
    size_t getErrorLength() const;

    void setLogger(BgpLogHandler *logger);

protected:
    // print string with format to the buffer, moves the buffer pointer and
    // decreases buf_left. returns bytes written.
    static ssize_t _print(size_t indent, char **to, size_t *buf_left, const char* format, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 4, 5)))
#endif
        ;

    /**
     * @brief Print implementation.
     * 
     * @param indent indent level.
     * @param to The pointer to the pointer to the string buffer.
     * @param buf_sz The pointer to the counter of avaliable buffer space.
     * @return ssize_t Bytes written.
     */
    virtual ssize_t doPrint(size_t indent, char **to, size_t *buf_sz) const = 0;

    void setError(uint8_t err, uint8_t suberr, const uint8_t *data, size_t data_len);
    void forwardParseError(const Serializable &other);

    uint8_t err_code;
    uint8_t err_subcode;
    std::vector<uint8_t> err_data;
    BgpLogHandler *logger;
};

}

#endif // BGPD_SERIALIZABLE_H_
