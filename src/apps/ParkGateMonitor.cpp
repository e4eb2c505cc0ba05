/**
 * @file ParkGateMonitor.cpp
 * @brief Board heartbeat (implementation)
 */

#include "apps/ParkGateMonitor.h"

namespace ParkGate {

BoardMonitor::~BoardMonitor() {
    if (_taskHandle) {
        vTaskDelete(_taskHandle);
        _taskHandle = nullptr;
    }
}

BoardMonitor::Result BoardMonitor::begin() {
    if (_taskHandle) return SUCCESS;

    _taskHandle = xTaskCreateStatic(
        monitorTask,
        "ParkGateMonitor",
        TASK_STACK_SIZE,
        this,
        _cfg.priority,
        _taskStack,
        &_taskBuf
    );
    if (!_taskHandle) {
        Debug::LOG_MSG("Failed to create heartbeat task");
        return ERR_INIT_FAILED;
    }
    Debug::LOG_MSGF("Heartbeat started (%u boards, every %u ms)",
                    (unsigned)_registry.boardCount(), (unsigned)_cfg.intervalMs);
    return SUCCESS;
}

void BoardMonitor::monitorTask(void* param) {
    BoardMonitor* self = static_cast<BoardMonitor*>(param);
    self->run();
    vTaskDelete(nullptr);
}

void BoardMonitor::run() {
    TickType_t lastWake = xTaskGetTickCount();
    const TickType_t period = pdMS_TO_TICKS(_cfg.intervalMs) > 0 ? pdMS_TO_TICKS(_cfg.intervalMs) : 1;

    while (true) {
        for (size_t i = 0; i < _registry.boardCount(); i++) {
            pollOnce(_registry.board(i));
        }
        vTaskDelayUntil(&lastWake, period);
    }
}

BoardMonitor::Result BoardMonitor::pollOnce(Board& board) {
    Result res = SUCCESS;
    bool edge = false;
    bool reachable = false;

    bool ran = CommandSerializer::tryWithGate(board, [&]() {
        if (board.dialect() == UNDETECTED) {
            if (_negotiator.detect(board) != ParkGateInterface::ModeNegotiator::SUCCESS) {
                res = ERR_UNAVAILABLE;
                return;
            }
        }

        std::vector<bool> coils;
        CoilRegister::Result readRes = _coils.readAll(board, coils);
        reachable = (readRes == CoilRegister::SUCCESS);
        edge = board.setReachable(reachable);
        if (!reachable) {
            // Rediscover the framing next cycle (board may have been reconfigured)
            board.setDialect(UNDETECTED);
            res = ERR_READ_FAILED;
        }
    });

    if (!ran) return SKIPPED;

    if (edge) {
        Debug::LOG_MSGF("%s: %s", board.key, reachable ? "reachable" : "unreachable");
        if (_edgeCb) _edgeCb(board, reachable, _edgeCtx);
    }
    return res;
}

} // namespace ParkGate
