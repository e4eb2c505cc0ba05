/**
 * @file ParkGateHAL_TCP.h
 * @brief BSD socket link to a relay board (lwIP on ESP32, libc on host ports)
 */

#pragma once

#include "drivers/ParkGateHAL_Link.hpp"
#include "utils/ParkGateDebug.hpp"

#include <string>

namespace ParkGateHAL {

class TCP : public ILink {
public:
    TCP(const char* host, uint16_t port);
    ~TCP() override;

    TCP(const TCP&) = delete;
    TCP& operator=(const TCP&) = delete;

    Result open(uint32_t timeoutMs) override;
    void close() override;
    bool isOpen() const override { return _socket >= 0; }
    Result send(const ByteBuffer& bytes, uint32_t timeoutMs) override;
    Result receive(ByteBuffer& dst, uint32_t timeoutMs) override;

    const char* getHost() const override { return _host.c_str(); }
    uint16_t getPort() const override { return _port; }

private:
    bool resolve(uint32_t& ipAddr) const;
    bool waitReady(bool forWrite, uint32_t timeoutMs);

    std::string _host;
    uint16_t _port;
    int _socket = -1;
};

} // namespace ParkGateHAL
