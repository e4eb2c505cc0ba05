/**
 * @file ParkGateHAL_Link.hpp
 * @brief Abstract byte stream to one relay board endpoint
 */

#pragma once

#include "core/ParkGateCore.h"

namespace ParkGateHAL {

class ILink {
public:
    enum Result {
        SUCCESS,
        NODATA,                 // Nothing arrived before the timeout
        ERR_CONNECT,
        ERR_NOT_CONNECTED,
        ERR_SEND,
        ERR_RECV,
        ERR_CLOSED,             // Peer closed the connection
        ERR_OVERFLOW            // No room left in the destination buffer
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case NODATA: return "no data";
            case ERR_CONNECT: return "connect failed";
            case ERR_NOT_CONNECTED: return "not connected";
            case ERR_SEND: return "send failed";
            case ERR_RECV: return "receive failed";
            case ERR_CLOSED: return "closed by peer";
            case ERR_OVERFLOW: return "receive buffer full";
            default: return "unknown result";
        }
    }

    virtual ~ILink() = default;

    /* @brief Open the connection (no-op if already open)
     * @param timeoutMs Max time to establish the connection
     */
    virtual Result open(uint32_t timeoutMs) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /* @brief Send a whole frame
     * @param timeoutMs Max time to wait for the socket to accept more bytes
     */
    virtual Result send(const ByteBuffer& bytes, uint32_t timeoutMs) = 0;

    /* @brief Wait up to timeoutMs for data and append what arrived to dst
     * @return SUCCESS if at least one byte was appended, NODATA on timeout
     */
    virtual Result receive(ByteBuffer& dst, uint32_t timeoutMs) = 0;

    virtual const char* getHost() const = 0;
    virtual uint16_t getPort() const = 0;
};

} // namespace ParkGateHAL
