/**
 * @file ParkGateAudit.h
 * @brief Audit events emitted for every state-changing operation
 */

#pragma once

#include "core/ParkGateCore.h"
#include "utils/ParkGateDebug.hpp"

#include <ctime>
#include <cstdio>
#include <utility>

namespace ParkGate {

struct AuditEvent {
    time_t timestamp;
    const char* action;         // "lift", "close", ..., "auto-release", "emergency-off", "error"
    std::string source;         // "api", "mcp", "system", ...
    std::string details;
};

using AuditCallback = void (*)(const AuditEvent& event, void* ctx);

/* @brief Forwards audit events to the external sink (if any)
 * @note Never call emit() while holding a board gate
 */
class AuditSink {
public:
    static constexpr size_t MAX_DETAILS_SIZE = 192;
    static constexpr const char* SYSTEM_SOURCE = "system";

    void setCallback(AuditCallback cb, void* ctx = nullptr) {
        Lock guard(_mutex);
        _cb = cb;
        _ctx = ctx;
    }

    template<typename... Args>
    void emit(const char* action, const char* source, const char* format, Args&&... args) {
        AuditEvent event;
        event.timestamp = time(nullptr);
        event.action = action;
        event.source = source ? source : "";

        char details[MAX_DETAILS_SIZE];
        snprintf(details, sizeof(details), format, std::forward<Args>(args)...);
        event.details = details;

        ParkGate::Debug::LOG_MSGF("[audit] %s by %s: %s", action, event.source.c_str(), details);

        Lock guard(_mutex);
        if (_cb) _cb(event, _ctx);
    }

private:
    Mutex _mutex;
    AuditCallback _cb = nullptr;
    void* _ctx = nullptr;
};

} // namespace ParkGate
