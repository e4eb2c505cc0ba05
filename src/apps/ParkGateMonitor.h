/**
 * @file ParkGateMonitor.h
 * @brief Periodic heartbeat: dialect negotiation, coil snapshot & reachability per board
 */

#pragma once

#include "apps/ParkGateRegistry.h"
#include "apps/ParkGateCoils.h"
#include "apps/ParkGateSerializer.hpp"

namespace ParkGate {

class BoardMonitor {
public:
    static constexpr size_t TASK_STACK_SIZE = 4096;

    struct Config {
        uint32_t intervalMs = PARKGATE_HEARTBEAT_MS;
        UBaseType_t priority = tskIDLE_PRIORITY + 1;
    };

    enum Result {
        SUCCESS,
        SKIPPED,                // Gate held by a command, cycle skipped
        ERR_UNAVAILABLE,        // Negotiation failed, reachability untouched
        ERR_READ_FAILED,
        ERR_INIT_FAILED
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case SKIPPED: return "skipped (gate held)";
            case ERR_UNAVAILABLE: return "board unavailable";
            case ERR_READ_FAILED: return "coil read failed";
            case ERR_INIT_FAILED: return "init failed";
            default: return "unknown result";
        }
    }

    // Called outside of the gate, from the monitor task
    using EdgeCallback = void (*)(Board& board, bool reachable, void* ctx);

    BoardMonitor(Registry& registry, CoilRegister& coils, ParkGateInterface::ModeNegotiator& negotiator)
        : BoardMonitor(registry, coils, negotiator, Config()) {}
    BoardMonitor(Registry& registry, CoilRegister& coils, ParkGateInterface::ModeNegotiator& negotiator,
                 const Config& cfg)
        : _registry(registry), _coils(coils), _negotiator(negotiator), _cfg(cfg) {}
    ~BoardMonitor();

    BoardMonitor(const BoardMonitor&) = delete;
    BoardMonitor& operator=(const BoardMonitor&) = delete;

    /* @brief Start the heartbeat task
     */
    Result begin();

    /* @brief Run one heartbeat cycle for a board
     * @note Returns SKIPPED immediately if a command holds the board gate
     */
    Result pollOnce(Board& board);

    void setEdgeCallback(EdgeCallback cb, void* ctx = nullptr) {
        _edgeCb = cb;
        _edgeCtx = ctx;
    }

    bool isRunning() const { return _taskHandle != nullptr; }

private:
    static void monitorTask(void* param);
    void run();

    Registry& _registry;
    CoilRegister& _coils;
    ParkGateInterface::ModeNegotiator& _negotiator;
    Config _cfg;

    EdgeCallback _edgeCb = nullptr;
    void* _edgeCtx = nullptr;

    TaskHandle_t _taskHandle = nullptr;
    StaticTask_t _taskBuf;
    StackType_t _taskStack[TASK_STACK_SIZE];
};

} // namespace ParkGate
