/**
 * @file ParkGateActuator.h
 * @brief Barrier state machine: coil sequences, lock flag & auto-release timers
 */

#pragma once

#include "apps/ParkGateRegistry.h"
#include "apps/ParkGateCoils.h"
#include "apps/ParkGateAudit.h"
#include "apps/ParkGateSerializer.hpp"

#include "freertos/queue.h"

namespace ParkGate {

class BarrierActuator {
public:
    // ===================================================================================
    // ACTIONS
    // ===================================================================================

    enum Action {
        LIFT,
        CLOSE,
        STOP,
        LATCH_OPEN,
        LATCH_CLOSE,
        UNLATCH,
        LOCK,
        UNLOCK,
        UNKNOWN_ACTION
    };
    static constexpr const char* toString(const Action action) {
        switch (action) {
            case LIFT: return "lift";
            case CLOSE: return "close";
            case STOP: return "stop";
            case LATCH_OPEN: return "latch-open";
            case LATCH_CLOSE: return "latch-close";
            case UNLATCH: return "unlatch";
            case LOCK: return "lock";
            case UNLOCK: return "unlock";
            default: return "unknown";
        }
    }

    /* @brief Map an action name to its enum value
     * @return UNKNOWN_ACTION if the name is not part of the vocabulary
     */
    static Action parseAction(const char* name) {
        if (!name) return UNKNOWN_ACTION;
        for (int a = LIFT; a < UNKNOWN_ACTION; a++) {
            if (strcmp(name, toString(static_cast<Action>(a))) == 0) return static_cast<Action>(a);
        }
        return UNKNOWN_ACTION;
    }

    // Refused while the barrier is locked (stop & unlatch always go through)
    static constexpr bool requiresUnlocked(const Action action) {
        return action == LIFT || action == CLOSE || action == LATCH_OPEN || action == LATCH_CLOSE;
    }

    // ===================================================================================
    // CONFIGURATION & RESULTS
    // ===================================================================================

    struct Timings {
        uint32_t settleMs = PARKGATE_SETTLE_MS;             // Between clear & set writes
        uint32_t closeReleaseMs = PARKGATE_CLOSE_RELEASE_MS;
        uint32_t stopPulseMs = PARKGATE_STOP_PULSE_MS;
        uint32_t liftPulseMs = PARKGATE_LIFT_PULSE_MS;       // 0 = lift holds
    };

    enum Result {
        SUCCESS,
        ERR_UNKNOWN_ACTION,
        ERR_BARRIER_LOCKED,
        ERR_INVALID_COIL,
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
            case ERR_UNKNOWN_ACTION: return "unknown action";
            case ERR_BARRIER_LOCKED: return "barrier is locked";
            case ERR_INVALID_COIL: return "coil out of board range";
            case ERR_UNAVAILABLE: return "board unavailable";
            case ERR_TRANSPORT: return "transport error";
            case ERR_PROTOCOL: return "protocol error";
            case ERR_TIMER_FAILED: return "auto-release timer failed";
            case ERR_NOT_INITIALIZED: return "actuator not initialized";
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

    static Result fromCoils(CoilRegister::Result res) {
        switch (res) {
            case CoilRegister::SUCCESS: return SUCCESS;
            case CoilRegister::ERR_INVALID_ADDRESS: return ERR_INVALID_COIL;
            case CoilRegister::ERR_UNAVAILABLE: return ERR_UNAVAILABLE;
            case CoilRegister::ERR_TRANSPORT: return ERR_TRANSPORT;
            default: return ERR_PROTOCOL;
        }
    }

    // ===================================================================================
    // PUBLIC METHODS
    // ===================================================================================

    static constexpr size_t RELEASE_QUEUE_SIZE = 16;
    static constexpr size_t RELEASE_TASK_STACK_SIZE = 4096;

    BarrierActuator(Registry& registry, CoilRegister& coils, AuditSink& audit)
        : BarrierActuator(registry, coils, audit, Timings()) {}
    BarrierActuator(Registry& registry, CoilRegister& coils, AuditSink& audit, const Timings& timings)
        : _registry(registry), _coils(coils), _audit(audit), _timings(timings) {}
    ~BarrierActuator();

    BarrierActuator(const BarrierActuator&) = delete;
    BarrierActuator& operator=(const BarrierActuator&) = delete;

    /* @brief Create the auto-release timers, queue & task
     */
    Result begin();

    /* @brief Run an action on a barrier
     * @note Lock checks happen before any I/O. Coil writes run inside the board gate
     *       in the order: clear conflicting coils, settle, set target coil.
     *       lastAction is only recorded once every write succeeded.
     * @param barrier Target barrier
     * @param action Action to perform
     * @param source Origin of the request, copied to the audit event ("api", "mcp"...)
     * @param channel Output (optional): 1-based coil driven by the action, 0 if none
     * @return The result of the action
     */
    Result perform(Barrier& barrier, Action action, const char* source, uint16_t* channel = nullptr);

    /* @brief Stop & disarm a pending auto-release
     * @note Caller must hold barrier.board.gate
     */
    void cancelRelease(Barrier& barrier);

    const Timings& getTimings() const { return _timings; }
    bool isInitialized() const { return _isInitialized; }

private:
    // Coil plan of a state-changing action
    struct Sequence {
        uint16_t target;
        uint16_t clear[2];
        BarrierState state;
        uint32_t releaseMs;                 // 0 = hold
        bool latch;
    };
    Sequence sequenceFor(const Barrier& barrier, Action action) const;

    Result apply(Barrier& barrier, Action action, uint16_t& channel);
    Result write(Barrier& barrier, uint16_t coil, bool value);
    Result armRelease(Barrier& barrier, uint16_t coil, uint32_t ms);

    static void releaseTimerCallback(TimerHandle_t timer);
    static void releaseTask(void* param);
    void runReleaseTask();
    void applyRelease(Barrier& barrier);

    Registry& _registry;
    CoilRegister& _coils;
    AuditSink& _audit;
    Timings _timings;
    bool _isInitialized = false;

    QueueHandle_t _releaseQueue = nullptr;
    StaticQueue_t _releaseQueueBuf;
    uint8_t _releaseQueueStorage[RELEASE_QUEUE_SIZE * sizeof(Barrier*)];

    TaskHandle_t _releaseTaskHandle = nullptr;
    StaticTask_t _releaseTaskBuf;
    StackType_t _releaseTaskStack[RELEASE_TASK_STACK_SIZE];
};

} // namespace ParkGate
