/**
 * @file ParkGateEmergency.cpp
 * @brief Global kill switch (implementation)
 */

#include "apps/ParkGateEmergency.h"

namespace ParkGate {

// Gate holder only. Returns the number of failed writes.
uint16_t EmergencyOff::sweepBoard(Board& board) {
    for (size_t i = 0; i < _registry.barrierCount(); i++) {
        Barrier& barrier = _registry.barrier(i);
        if (&barrier.board != &board) continue;
        _actuator.cancelRelease(barrier);
    }

    uint16_t failed = 0;
    for (uint16_t ch = 0; ch < board.channelCount; ch++) {
        CoilRegister::Result res = _coils.writeCoil(board, ch, false);
        if (res != CoilRegister::SUCCESS) {
            Debug::LOG_MSGF("%s: channel %u OFF failed (%s)", board.key, (unsigned)(ch + 1),
                            CoilRegister::toString(res));
            failed++;
            // Neither dialect answers: the remaining channels would only pile up probe timeouts
            if (res == CoilRegister::ERR_UNAVAILABLE) {
                failed += board.channelCount - ch - 1;
                break;
            }
        }
    }

    for (size_t i = 0; i < _registry.barrierCount(); i++) {
        Barrier& barrier = _registry.barrier(i);
        if (&barrier.board != &board) continue;
        barrier.setState(IDLE);
        barrier.recordAction("emergency-off");
    }
    return failed;
}

void EmergencyOff::run(const char* source, Report* report) {
    Report rep;

    for (size_t i = 0; i < _registry.boardCount(); i++) {
        Board& board = _registry.board(i);
        uint16_t failed = CommandSerializer::withGate(board, [&]() { return sweepBoard(board); });
        rep.writesFailed += failed;
        if (failed == 0) rep.boardsSwept++;
        else rep.boardsFailed++;
    }

    _audit.emit("emergency-off", source, "%u/%u boards swept, %u writes failed",
                (unsigned)rep.boardsSwept, (unsigned)_registry.boardCount(), (unsigned)rep.writesFailed);
    if (report) *report = rep;
}

} // namespace ParkGate
