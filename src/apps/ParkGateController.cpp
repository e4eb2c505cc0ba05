/**
 * @file ParkGateController.cpp
 * @brief Controller facade (implementation)
 */

#include "apps/ParkGateController.h"
#include "drivers/ParkGateHAL_Link.hpp"

namespace ParkGate {

Controller::Controller(Registry& registry, const Config& cfg)
    : _registry(registry), _cfg(cfg),
      _transport(cfg.transport),
      _negotiator(_transport),
      _coils(_transport, _negotiator),
      _monitor(registry, _coils, _negotiator, cfg.monitor),
      _actuator(registry, _coils, _audit, cfg.timings),
      _emergency(registry, _coils, _actuator, _audit) {}

Controller::Result Controller::begin(bool startMonitor) {
    Result res = checkRegistry();
    if (res != SUCCESS) return res;
    if (_actuator.begin() != BarrierActuator::SUCCESS) return Error(ERR_INIT_FAILED, "actuator");
    if (startMonitor && _monitor.begin() != BoardMonitor::SUCCESS) return Error(ERR_INIT_FAILED, "monitor");
    Debug::LOG_MSGF("Controller ready: %u boards, %u barriers",
                    (unsigned)_registry.boardCount(), (unsigned)_registry.barrierCount());
    return SUCCESS;
}

Controller::Result Controller::checkRegistry() const {
    for (size_t i = 0; i < _registry.boardCount(); i++) {
        const Board& board = _registry.board(i);
        if (!board.hasValidChannelCount()) {
            Debug::LOG_MSGF("%s: %u channels (1..%u supported)", board.key,
                            (unsigned)board.channelCount, (unsigned)MAX_CHANNELS);
            return Error(ERR_INIT_FAILED, board.key);
        }
    }
    for (size_t i = 0; i < _registry.barrierCount(); i++) {
        const Barrier& barrier = _registry.barrier(i);
        const uint16_t count = barrier.board.channelCount;
        if (barrier.liftCoil >= count || barrier.closeCoil >= count || barrier.stopCoil >= count) {
            Debug::LOG_MSGF("%s: coil beyond the %u channels of %s", barrier.name,
                            (unsigned)count, barrier.board.key);
            return Error(ERR_INIT_FAILED, barrier.name);
        }
    }
    return SUCCESS;
}

Controller::Result Controller::fromActuator(BarrierActuator::Result res) {
    switch (res) {
        case BarrierActuator::SUCCESS: return SUCCESS;
        case BarrierActuator::ERR_UNKNOWN_ACTION: return ERR_UNKNOWN_ACTION;
        case BarrierActuator::ERR_BARRIER_LOCKED: return ERR_BARRIER_LOCKED;
        case BarrierActuator::ERR_INVALID_COIL: return ERR_INVALID_CHANNEL;
        case BarrierActuator::ERR_UNAVAILABLE: return ERR_UNAVAILABLE;
        case BarrierActuator::ERR_TRANSPORT: return ERR_TRANSPORT;
        case BarrierActuator::ERR_PROTOCOL: return ERR_PROTOCOL;
        case BarrierActuator::ERR_TIMER_FAILED: return ERR_TIMER_FAILED;
        case BarrierActuator::ERR_NOT_INITIALIZED: return ERR_NOT_INITIALIZED;
        default: return ERR_INIT_FAILED;
    }
}

Controller::Result Controller::fromCoils(CoilRegister::Result res) {
    return fromActuator(BarrierActuator::fromCoils(res));
}

// ===================================================================================
// STATUS
// ===================================================================================

void Controller::getStatus(Status& status) const {
    status.boards.clear();
    status.barriers.clear();
    status.boards.reserve(_registry.boardCount());
    status.barriers.reserve(_registry.barrierCount());

    for (size_t i = 0; i < _registry.boardCount(); i++) {
        const Board& board = _registry.board(i);
        const BoardSnapshot snap = board.snapshot();

        BoardStatus bs;
        bs.key = board.key;
        bs.host = board.link.getHost();
        bs.port = board.link.getPort();
        bs.connected = snap.reachable;
        bs.dialect = snap.dialect;
        bs.latencyMs = snap.latencyMs;
        const uint16_t count = board.snapshotSize();
        bs.channels.reserve(count);
        for (uint16_t ch = 0; ch < count; ch++) {
            bs.channels.push_back({ static_cast<uint16_t>(ch + 1), snap.coils[ch] });
        }
        status.boards.push_back(std::move(bs));
    }

    for (size_t i = 0; i < _registry.barrierCount(); i++) {
        const Barrier& barrier = _registry.barrier(i);
        const BarrierSnapshot snap = barrier.snapshot();
        const BoardSnapshot coils = barrier.board.snapshot();
        const uint16_t count = barrier.board.snapshotSize();

        BarrierStatus bs;
        bs.id = barrier.id;
        bs.stringId = barrier.stringId;
        bs.name = barrier.name;
        bs.board = barrier.board.key;
        bs.lift = barrier.liftCoil;
        bs.close = barrier.closeCoil;
        bs.stop = barrier.stopCoil;
        bs.liftActive = barrier.liftCoil < count && coils.coils[barrier.liftCoil];
        bs.closeActive = barrier.closeCoil < count && coils.coils[barrier.closeCoil];
        bs.stopActive = barrier.stopCoil < count && coils.coils[barrier.stopCoil];
        bs.locked = snap.locked;
        bs.state = snap.state;
        bs.lastAction = snap.lastAction;
        bs.lastActionTime = snap.lastActionTime;
        status.barriers.push_back(bs);
    }
}

// ===================================================================================
// OPERATIONS
// ===================================================================================

Controller::Result Controller::performAction(const char* token, const char* action, const char* source,
                                             ActionResult* out) {
    Barrier* barrier = resolveBarrier(token);
    if (!barrier) return Error(ERR_UNKNOWN_BARRIER, token);

    Action act = BarrierActuator::parseAction(action);
    if (act == BarrierActuator::UNKNOWN_ACTION) return Error(ERR_UNKNOWN_ACTION, action);

    uint16_t channel = 0;
    Result res = fromActuator(_actuator.perform(*barrier, act, source, &channel));
    if (res != SUCCESS) return Error(res, barrier->name);

    if (out) {
        out->barrierName = barrier->name;
        out->action = act;
        out->channel = channel;
    }
    return SUCCESS;
}

Controller::Result Controller::emergencyOff(const char* source, EmergencyResult* out) {
    EmergencyResult report;
    _emergency.run(source, &report);
    if (out) *out = report;
    if (report.boardsFailed > 0) return Error(ERR_TRANSPORT, "emergency-off incomplete");
    return SUCCESS;
}

Controller::Result Controller::pulseChannel(const char* boardKey, uint16_t channel, const char* source) {
    Board* board = _registry.findBoard(boardKey);
    if (!board) return Error(ERR_UNKNOWN_BOARD, boardKey);
    if (channel < 1 || channel > board->channelCount) return Error(ERR_INVALID_CHANNEL);

    const uint16_t coil = channel - 1;
    CoilRegister::Result res = CommandSerializer::withGate(*board, [&]() {
        CoilRegister::Result r = _coils.writeCoil(*board, coil, true);
        if (r != CoilRegister::SUCCESS) return r;
        if (_cfg.channelPulseMs > 0) WAIT_MS(_cfg.channelPulseMs);
        return _coils.writeCoil(*board, coil, false);
    });

    if (res != CoilRegister::SUCCESS) {
        _audit.emit("error", source, "%s: pulse of channel %u failed (%s)",
                    board->key, (unsigned)channel, CoilRegister::toString(res));
        return Error(fromCoils(res), board->key);
    }
    _audit.emit("pulse", source, "%s: channel %u", board->key, (unsigned)channel);
    return SUCCESS;
}

Controller::Result Controller::readBoard(const char* boardKey, std::vector<bool>& coils) {
    Board* board = _registry.findBoard(boardKey);
    if (!board) return Error(ERR_UNKNOWN_BOARD, boardKey);

    CoilRegister::Result res = CommandSerializer::withGate(*board, [&]() {
        return _coils.readAll(*board, coils);
    });
    if (res != CoilRegister::SUCCESS) return Error(fromCoils(res), board->key);
    return SUCCESS;
}

Controller::Result Controller::readBarrierRelays(const char* token, RelayStatus& out) {
    Barrier* barrier = resolveBarrier(token);
    if (!barrier) return Error(ERR_UNKNOWN_BARRIER, token);

    Board& board = barrier->board;
    std::vector<bool> coils;
    CoilRegister::Result res = CommandSerializer::withGate(board, [&]() {
        return _coils.readAll(board, coils);
    });
    if (res != CoilRegister::SUCCESS) return Error(fromCoils(res), barrier->name);

    if (barrier->liftCoil >= coils.size() || barrier->closeCoil >= coils.size()
        || barrier->stopCoil >= coils.size()) {
        return Error(ERR_INVALID_CHANNEL, barrier->name);
    }
    out.lift = coils[barrier->liftCoil];
    out.close = coils[barrier->closeCoil];
    out.stop = coils[barrier->stopCoil];
    return SUCCESS;
}

} // namespace ParkGate
