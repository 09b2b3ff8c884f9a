/**
 * @file bgp-out-handler.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP FSM output handler.
 * @version 0.3
 * @date 2019-08-07
 * 
 * @copyright Copyright (c) 2019
 * 
 */
#ifndef BGPD_OUT_HANDLER_H_
#define BGPD_OUT_HANDLER_H_
#include <stdint.h>
#include <unistd.h>

namespace bgpd {

/**
 * @brief The BGP FSM output handler.
 * 
 * BgpOutHandler is the session transport as seen by the FSM. It writes BGP
 * messages to the peer and opens or closes the byte stream. The result of
 * connect() comes back to the FSM later, as BgpFsm::connected() or
 * BgpFsm::transportFailed().
 * 
 */
class BgpOutHandler {
public:

    /**
     * @brief The output implementation.
     * 
     * @param buffer Pointer to the outgoing message buffer.
     * @param length Length of the message.
     * @return true The output was handled.
     * @return false The out was not handled.
     */
    virtual bool handleOut(const uint8_t *buffer, size_t length) = 0;

    /**
     * @brief Start an active open.
     * 
     * @return true Connection attempt started.
     * @return false Can't connect.
     */
    virtual bool connect() = 0;

    /**
     * @brief Close the byte stream. Nothing is reported back to the FSM.
     * 
     */
    virtual void close() = 0;

    /**
     * @brief State change notification. Will be call if FSM state changed.
     * 
     * @param old_state Old state.
     * @param new_state New state.
     */
    virtual void notifyStateChange(__attribute__((unused)) int old_state, __attribute__((unused)) int new_state) {}
    virtual ~BgpOutHandler() {}
};

}

#endif // BGPD_OUT_HANDLER_H_
