/**
 * @file ParkGateDebug.hpp
 * @brief Debug logging helpers (compiled out unless PARKGATE_DEBUG is defined)
 */

#pragma once

#include "core/ParkGateCore.h"

namespace ParkGate {
namespace Debug {

/* @brief Call site captured by default arguments
 */
struct CallCtx {
    const char* file;
    const char* function;
    int line;

    CallCtx(const char* f = __builtin_FILE(),
            const char* func = __builtin_FUNCTION(),
            int l = __builtin_LINE())
        : file(f), function(func), line(l) {}
};

constexpr size_t MAX_DEBUG_MSG_SIZE = (size_t)PARKGATE_MAX_DEBUG_MSG_SIZE;

} // namespace Debug
} // namespace ParkGate

// Native builds have no log task, debug output is only available on FreeRTOS
#if defined(PARKGATE_DEBUG) && !defined(NATIVE_TEST)
    #define PARKGATE_DEBUG_ACTIVE
#endif

#ifdef PARKGATE_DEBUG_ACTIVE

#include <cstdio>
#include <cstring>
#include <utility>
#include "utils/ParkGateLogger.hpp"

namespace ParkGate {
namespace Debug {

inline const char* getBasename(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

inline void LOG_MSG(const char* message = "", CallCtx ctx = CallCtx()) {
    ParkGate::Logger::logf("[%s::%s:%d] %s", getBasename(ctx.file), ctx.function, ctx.line, message);
}

template<typename... Args>
inline void LOG_MSGF_CTX(CallCtx ctx, const char* format, Args&&... args) {
    char buffer[MAX_DEBUG_MSG_SIZE];
    int written = snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
    if (written < 0) return;

    const char* suffix = (written >= static_cast<int>(sizeof(buffer))) ? " ..." : "";
    ParkGate::Logger::logf("[%s::%s:%d] %s%s",
                           getBasename(ctx.file), ctx.function, ctx.line,
                           buffer, suffix);
}

#define LOG_MSGF(format, ...) LOG_MSGF_CTX(ParkGate::Debug::CallCtx(), format, ##__VA_ARGS__)

/* @brief Dump a frame as hex, truncated with "..." past MAX_DEBUG_MSG_SIZE
 * @param bytes Bytes to dump
 * @param desc Prefix (e.g. "TX", "RX")
 */
inline void LOG_HEXDUMP(const ByteBuffer& bytes, const char* desc = "Hexdump", CallCtx ctx = CallCtx()) {
    char buffer[MAX_DEBUG_MSG_SIZE];
    size_t idx = snprintf(buffer, sizeof(buffer), "%s (%u bytes): ", desc, (unsigned)bytes.size());

    for (uint8_t b : bytes) {
        if (idx + 4 >= sizeof(buffer)) {
            snprintf(buffer + idx, sizeof(buffer) - idx, "...");
            break;
        }
        idx += snprintf(buffer + idx, sizeof(buffer) - idx, "%02X ", b);
    }

    ParkGate::Logger::logf("[%s::%s:%d] %s", getBasename(ctx.file), ctx.function, ctx.line, buffer);
}

} // namespace Debug
} // namespace ParkGate

#else // PARKGATE_DEBUG_ACTIVE

namespace ParkGate {
namespace Debug {

    // No-op templates when debug output is disabled

    template<typename... Args>
    inline void LOG_MSG(Args&&...) {}

    template<typename... Args>
    inline void LOG_MSGF(Args&&...) {}

    template<typename... Args>
    inline void LOG_HEXDUMP(Args&&...) {}

} // namespace Debug
} // namespace ParkGate

#endif // PARKGATE_DEBUG_ACTIVE
