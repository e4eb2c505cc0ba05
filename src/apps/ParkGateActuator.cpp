/**
 * @file ParkGateActuator.cpp
 * @brief Barrier state machine (implementation)
 */

#include "apps/ParkGateActuator.h"

namespace ParkGate {

// Retry delay when the release queue is full at timer expiry
static constexpr TickType_t RELEASE_REQUEUE_TICKS = pdMS_TO_TICKS(10) > 0 ? pdMS_TO_TICKS(10) : 1;

BarrierActuator::~BarrierActuator() {
    if (_releaseTaskHandle) {
        vTaskDelete(_releaseTaskHandle);
        _releaseTaskHandle = nullptr;
    }
    for (size_t i = 0; i < _registry.barrierCount(); i++) {
        Barrier& barrier = _registry.barrier(i);
        if (barrier.release.owner == this && barrier.release.timer) {
            xTimerDelete(barrier.release.timer, portMAX_DELAY);
            barrier.release.timer = nullptr;
            barrier.release.owner = nullptr;
        }
    }
    if (_releaseQueue) {
        vQueueDelete(_releaseQueue);
        _releaseQueue = nullptr;
    }
}

BarrierActuator::Result BarrierActuator::begin() {
    if (_isInitialized) return SUCCESS;

    _releaseQueue = xQueueCreateStatic(RELEASE_QUEUE_SIZE, sizeof(Barrier*),
                                       _releaseQueueStorage, &_releaseQueueBuf);
    if (!_releaseQueue) return Error(ERR_INIT_FAILED, "release queue");

    for (size_t i = 0; i < _registry.barrierCount(); i++) {
        Barrier& barrier = _registry.barrier(i);
        barrier.release.timer = xTimerCreateStatic(
            "ParkGateRelease",
            1,                  // Period set when armed
            pdFALSE,            // one-shot
            &barrier,           // timer ID = barrier
            releaseTimerCallback,
            &barrier.release.timerBuf
        );
        if (!barrier.release.timer) return Error(ERR_INIT_FAILED, barrier.name);
        barrier.release.owner = this;
        barrier.release.armed = false;
    }

    _releaseTaskHandle = xTaskCreateStatic(
        releaseTask,
        "ParkGateRelease",
        RELEASE_TASK_STACK_SIZE,
        this,
        tskIDLE_PRIORITY + 1,
        _releaseTaskStack,
        &_releaseTaskBuf
    );
    if (!_releaseTaskHandle) return Error(ERR_INIT_FAILED, "release task");

    _isInitialized = true;
    return SUCCESS;
}

// ===================================================================================
// ACTIONS
// ===================================================================================

BarrierActuator::Sequence BarrierActuator::sequenceFor(const Barrier& barrier, Action action) const {
    switch (action) {
        case LIFT:
            return { barrier.liftCoil, { barrier.closeCoil, barrier.stopCoil }, LIFTING, _timings.liftPulseMs, false };
        case CLOSE:
            return { barrier.closeCoil, { barrier.liftCoil, barrier.stopCoil }, CLOSING, _timings.closeReleaseMs, false };
        case STOP:
            return { barrier.stopCoil, { barrier.liftCoil, barrier.closeCoil }, STOPPED, _timings.stopPulseMs, false };
        case LATCH_OPEN:
            return { barrier.liftCoil, { barrier.closeCoil, barrier.stopCoil }, LATCHED_OPEN, 0, true };
        case LATCH_CLOSE:
        default:
            return { barrier.closeCoil, { barrier.liftCoil, barrier.stopCoil }, LATCHED_CLOSED, 0, true };
    }
}

BarrierActuator::Result BarrierActuator::write(Barrier& barrier, uint16_t coil, bool value) {
    return fromCoils(_coils.writeCoil(barrier.board, coil, value));
}

BarrierActuator::Result BarrierActuator::perform(Barrier& barrier, Action action, const char* source,
                                                 uint16_t* channel) {
    if (channel) *channel = 0;
    if (!_isInitialized) return Error(ERR_NOT_INITIALIZED);
    if (action < LIFT || action >= UNKNOWN_ACTION) return Error(ERR_UNKNOWN_ACTION);
    if (requiresUnlocked(action) && barrier.isLocked()) return Error(ERR_BARRIER_LOCKED, barrier.name);

    uint16_t driven = 0;
    Result res = CommandSerializer::withGate(barrier.board, [&]() -> Result {
        // The flag may have been set while waiting for the gate
        if (requiresUnlocked(action) && barrier.isLocked()) return ERR_BARRIER_LOCKED;
        return apply(barrier, action, driven);
    });

    if (res != SUCCESS) {
        if (res != ERR_BARRIER_LOCKED) {
            _audit.emit("error", source, "%s: %s failed (%s)", barrier.name, toString(action), toString(res));
        }
        return Error(res, barrier.name);
    }

    if (channel) *channel = driven;
    _audit.emit(toString(action), source, "%s (%s)", barrier.name, barrier.board.key);
    return SUCCESS;
}

BarrierActuator::Result BarrierActuator::apply(Barrier& barrier, Action action, uint16_t& channel) {
    Result res;

    switch (action) {
        case LOCK:
        case UNLOCK:
            barrier.setLocked(action == LOCK);
            barrier.recordAction(toString(action));
            return SUCCESS;

        case UNLATCH:
            cancelRelease(barrier);
            if ((res = write(barrier, barrier.liftCoil, false)) != SUCCESS) return res;
            if ((res = write(barrier, barrier.closeCoil, false)) != SUCCESS) return res;
            if ((res = write(barrier, barrier.stopCoil, false)) != SUCCESS) return res;
            barrier.setLocked(false);
            barrier.setState(IDLE);
            barrier.recordAction(toString(action));
            return SUCCESS;

        default:
            break;
    }

    const Sequence seq = sequenceFor(barrier, action);

    cancelRelease(barrier);
    for (uint16_t coil : seq.clear) {
        if ((res = write(barrier, coil, false)) != SUCCESS) return res;
    }
    if (_timings.settleMs > 0) WAIT_MS(_timings.settleMs);
    if ((res = write(barrier, seq.target, true)) != SUCCESS) return res;

    if (seq.releaseMs > 0) {
        res = armRelease(barrier, seq.target, seq.releaseMs);
        if (res != SUCCESS) {
            // Nothing would ever release the coil, drop it now
            if (write(barrier, seq.target, false) != SUCCESS) {
                Debug::LOG_MSGF("%s: coil %u left energized", barrier.name, (unsigned)(seq.target + 1));
            }
            return res;
        }
    }

    if (seq.latch) barrier.setLocked(true);
    barrier.setState(seq.state);
    channel = seq.target + 1;
    barrier.recordAction(toString(action));
    return SUCCESS;
}

// ===================================================================================
// AUTO-RELEASE
// ===================================================================================

void BarrierActuator::cancelRelease(Barrier& barrier) {
    if (!barrier.release.armed) return;
    xTimerStop(barrier.release.timer, 0);
    barrier.release.armed = false;
}

BarrierActuator::Result BarrierActuator::armRelease(Barrier& barrier, uint16_t coil, uint32_t ms) {
    Barrier::AutoRelease& rel = barrier.release;
    TickType_t ticks = pdMS_TO_TICKS(ms) > 0 ? pdMS_TO_TICKS(ms) : 1;

    rel.coil = coil;
    rel.dueTick = xTaskGetTickCount() + ticks;
    rel.armed = true;

    // Also starts a dormant timer
    if (xTimerChangePeriod(rel.timer, ticks, pdMS_TO_TICKS(100)) != pdPASS) {
        rel.armed = false;
        return Error(ERR_TIMER_FAILED, barrier.name);
    }
    return SUCCESS;
}

// Timer service task context: never touch the network here
void BarrierActuator::releaseTimerCallback(TimerHandle_t timer) {
    Barrier* barrier = static_cast<Barrier*>(pvTimerGetTimerID(timer));
    if (!barrier || !barrier->release.owner) return;
    BarrierActuator* self = static_cast<BarrierActuator*>(barrier->release.owner);

    if (xQueueSend(self->_releaseQueue, &barrier, 0) != pdPASS) {
        xTimerChangePeriod(timer, RELEASE_REQUEUE_TICKS, 0);
    }
}

void BarrierActuator::releaseTask(void* param) {
    BarrierActuator* self = static_cast<BarrierActuator*>(param);
    self->runReleaseTask();
    vTaskDelete(nullptr);
}

void BarrierActuator::runReleaseTask() {
    Barrier* barrier = nullptr;
    while (true) {
        if (xQueueReceive(_releaseQueue, &barrier, portMAX_DELAY) == pdTRUE && barrier) {
            applyRelease(*barrier);
        }
    }
}

void BarrierActuator::applyRelease(Barrier& barrier) {
    bool applied = false;
    uint16_t coil = 0;

    Result res = CommandSerializer::withGate(barrier.board, [&]() -> Result {
        Barrier::AutoRelease& rel = barrier.release;
        if (!rel.armed) return SUCCESS;                                     // Canceled
        if ((int32_t)(xTaskGetTickCount() - rel.dueTick) < 0) return SUCCESS; // Re-armed since
        rel.armed = false;
        applied = true;
        coil = rel.coil;

        Result writeRes = write(barrier, coil, false);
        if (writeRes == SUCCESS) barrier.setState(IDLE);
        return writeRes;
    });

    if (!applied) return;

    if (res == SUCCESS) {
        _audit.emit("auto-release", AuditSink::SYSTEM_SOURCE, "%s: coil %u released",
                    barrier.name, (unsigned)(coil + 1));
    } else {
        Debug::LOG_MSGF("%s: auto-release of coil %u failed (%s)", barrier.name, (unsigned)(coil + 1), toString(res));
        _audit.emit("error", AuditSink::SYSTEM_SOURCE, "%s: auto-release of coil %u failed (%s)",
                    barrier.name, (unsigned)(coil + 1), toString(res));
    }
}

} // namespace ParkGate
