/**
 * @file ParkGateController.h
 * @brief Entry point for the HTTP/CLI layer: status, barrier actions, emergency-off
 */

#pragma once

#include "apps/ParkGateRegistry.h"
#include "apps/ParkGateAudit.h"
#include "apps/ParkGateCoils.h"
#include "apps/ParkGateMonitor.h"
#include "apps/ParkGateActuator.h"
#include "apps/ParkGateEmergency.h"

namespace ParkGate {

class Controller {
public:
    using Action = BarrierActuator::Action;

    // ===================================================================================
    // CONFIGURATION
    // ===================================================================================

    struct Config {
        ParkGateInterface::Transport::Config transport;
        BoardMonitor::Config monitor;
        BarrierActuator::Timings timings;
        uint32_t channelPulseMs = PARKGATE_CHANNEL_PULSE_MS;   // Raw channel pulse width
    };

    // ===================================================================================
    // RESULT TYPES
    // ===================================================================================

    enum Result {
        SUCCESS,
        ERR_UNKNOWN_BARRIER,
        ERR_UNKNOWN_ACTION,
        ERR_BARRIER_LOCKED,
        ERR_UNKNOWN_BOARD,
        ERR_INVALID_CHANNEL,
        ERR_UNAVAILABLE,
        ERR_TRANSPORT,
        ERR_PROTOCOL,
        ERR_TIMER_FAILED,
        ERR_NOT_INITIALIZED,
        ERR_INIT_FAILED
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case ERR_UNKNOWN_BARRIER: return "unknown barrier";
            case ERR_UNKNOWN_ACTION: return "unknown action";
            case ERR_BARRIER_LOCKED: return "barrier is locked";
            case ERR_UNKNOWN_BOARD: return "unknown board";
            case ERR_INVALID_CHANNEL: return "invalid channel";
            case ERR_UNAVAILABLE: return "board unavailable";
            case ERR_TRANSPORT: return "transport error";
            case ERR_PROTOCOL: return "protocol error";
            case ERR_TIMER_FAILED: return "auto-release timer failed";
            case ERR_NOT_INITIALIZED: return "controller not initialized";
            case ERR_INIT_FAILED: return "init failed";
            default: return "unknown result";
        }
    }

    static inline Result Error(Result res, const char* desc = nullptr
                        #ifdef PARKGATE_DEBUG_ACTIVE
                        , Debug::CallCtx ctx = Debug::CallCtx()
                        #endif
                        ) {
        #ifdef PARKGATE_DEBUG_ACTIVE
            if (desc && *desc != '\0') {
                Debug::LOG_MSGF_CTX(ctx, "Error: %s (%s)", toString(res), desc);
            } else {
                Debug::LOG_MSGF_CTX(ctx, "Error: %s", toString(res));
            }
        #endif
        return res;
    }

    // ===================================================================================
    // STATUS & OPERATION OUTPUTS
    // ===================================================================================

    struct ChannelStatus {
        uint16_t index;                 // 1-based channel number
        bool active;
    };

    struct BoardStatus {
        const char* key;
        const char* host;
        uint16_t port;
        bool connected;
        Dialect dialect;
        uint32_t latencyMs;
        std::vector<ChannelStatus> channels;
    };

    struct BarrierStatus {
        uint16_t id;
        const char* stringId;
        const char* name;
        const char* board;
        uint16_t lift;                  // Coil indices (0-based)
        uint16_t close;
        uint16_t stop;
        bool liftActive;                // Coil states from the board snapshot
        bool closeActive;
        bool stopActive;
        bool locked;
        BarrierState state;
        const char* lastAction;         // nullptr if none yet
        time_t lastActionTime;
    };

    // Live state of a barrier's relays
    struct RelayStatus {
        bool lift = false;
        bool close = false;
        bool stop = false;
    };

    struct Status {
        std::vector<BoardStatus> boards;
        std::vector<BarrierStatus> barriers;
    };

    struct ActionResult {
        const char* barrierName = nullptr;
        Action action = BarrierActuator::UNKNOWN_ACTION;
        uint16_t channel = 0;           // 1-based coil driven, 0 if the action writes none
    };

    using EmergencyResult = EmergencyOff::Report;

    // ===================================================================================
    // PUBLIC METHODS
    // ===================================================================================

    explicit Controller(Registry& registry) : Controller(registry, Config()) {}
    Controller(Registry& registry, const Config& cfg);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    /* @brief Check the registry wiring, then start the auto-release machinery and
     *        (optionally) the heartbeat task
     * @param startMonitor false to drive BoardMonitor::pollOnce() manually
     * @return ERR_INIT_FAILED if a board has 0 or more than MAX_CHANNELS channels,
     *         or a barrier is wired to a coil its board doesn't have
     */
    Result begin(bool startMonitor = true);

    void setAuditCallback(AuditCallback cb, void* ctx = nullptr) { _audit.setCallback(cb, ctx); }
    void setEdgeCallback(BoardMonitor::EdgeCallback cb, void* ctx = nullptr) { _monitor.setEdgeCallback(cb, ctx); }

    /* @brief Find a barrier by numeric id (fully numeric token) or string id
     */
    Barrier* resolveBarrier(const char* token) const { return _registry.resolveBarrier(token); }

    /* @brief Copy the last known state of every board & barrier
     * @note Never waits on network I/O
     */
    void getStatus(Status& status) const;

    /* @brief Run a named action on a barrier
     * @param token Numeric or string barrier id
     * @param action Action name ("lift", "close", "stop", "latch-open", ...)
     * @param source Origin of the request ("api", "mcp"...)
     * @param out Output (optional): barrier name, action & driven channel
     */
    Result performAction(const char* token, const char* action, const char* source,
                         ActionResult* out = nullptr);

    /* @brief Every channel of every board to OFF, ignoring locks
     * @return SUCCESS only if every board was fully swept (the sweep runs to the end regardless)
     */
    Result emergencyOff(const char* source, EmergencyResult* out = nullptr);

    /* @brief Pulse one relay: ON, wait, OFF
     * @param boardKey Board key
     * @param channel 1-based channel number
     */
    Result pulseChannel(const char* boardKey, uint16_t channel, const char* source);

    /* @brief Live read of every channel of a board (refreshes its snapshot)
     */
    Result readBoard(const char* boardKey, std::vector<bool>& coils);

    /* @brief Live read of a barrier's lift/close/stop relays
     */
    Result readBarrierRelays(const char* token, RelayStatus& out);

    Registry& registry() { return _registry; }
    BoardMonitor& monitor() { return _monitor; }
    BarrierActuator& actuator() { return _actuator; }
    const Config& getConfig() const { return _cfg; }

private:
    Result checkRegistry() const;
    static Result fromActuator(BarrierActuator::Result res);
    static Result fromCoils(CoilRegister::Result res);

    Registry& _registry;
    Config _cfg;
    AuditSink _audit;
    ParkGateInterface::Transport _transport;
    ParkGateInterface::ModeNegotiator _negotiator;
    CoilRegister _coils;
    BoardMonitor _monitor;
    BarrierActuator _actuator;
    EmergencyOff _emergency;
};

} // namespace ParkGate
