/**
 * @file ParkGateConfig.h
 * @brief Compile-time tunables (override any of them with a -D flag)
 */

#pragma once

// Max time for one request/response exchange with a relay board
#ifndef PARKGATE_TRANSPORT_TIMEOUT_MS
    #define PARKGATE_TRANSPORT_TIMEOUT_MS 5000
#endif

// Max time for the TCP connect to a relay board
#ifndef PARKGATE_CONNECT_TIMEOUT_MS
    #define PARKGATE_CONNECT_TIMEOUT_MS 3000
#endif

// Extra attempts after a connect error or a timeout (protocol errors are never retried)
#ifndef PARKGATE_TRANSPORT_RETRIES
    #define PARKGATE_TRANSPORT_RETRIES 1
#endif

#ifndef PARKGATE_HEARTBEAT_MS
    #define PARKGATE_HEARTBEAT_MS 5000
#endif

// Delay between the "clear conflicting coils" writes and the "set target coil" write
#ifndef PARKGATE_SETTLE_MS
    #define PARKGATE_SETTLE_MS 50
#endif

// Auto-release of the close coil
#ifndef PARKGATE_CLOSE_RELEASE_MS
    #define PARKGATE_CLOSE_RELEASE_MS 4000
#endif

#ifndef PARKGATE_STOP_PULSE_MS
    #define PARKGATE_STOP_PULSE_MS 500
#endif

// 0 = lift is held until the next action
#ifndef PARKGATE_LIFT_PULSE_MS
    #define PARKGATE_LIFT_PULSE_MS 0
#endif

// Raw channel pulse (diagnostics)
#ifndef PARKGATE_CHANNEL_PULSE_MS
    #define PARKGATE_CHANNEL_PULSE_MS 500
#endif

// Upper bound on channels per board (sizes the coil snapshots)
#ifndef PARKGATE_MAX_CHANNELS
    #define PARKGATE_MAX_CHANNELS 32
#endif

#ifndef PARKGATE_MAX_DEBUG_MSG_SIZE
    #define PARKGATE_MAX_DEBUG_MSG_SIZE 256
#endif
