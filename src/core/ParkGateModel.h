/**
 * @file ParkGateModel.h
 * @brief Board & Barrier records of the static registry
 */

#pragma once

#include "core/ParkGateCore.h"

#include <ctime>

namespace ParkGateHAL { class ILink; }

namespace ParkGate {

// ===================================================================================
// BOARD
// ===================================================================================

/* @brief Last known state of a board, readable without waiting on network I/O
 */
struct BoardSnapshot {
    bool reachable = false;
    bool hasCoils = false;                      // At least one successful read
    Dialect dialect = UNDETECTED;
    uint16_t channelCount = 0;
    std::array<bool, MAX_CHANNELS> coils{};
    uint32_t latencyMs = 0;                     // Round trip of the last successful exchange
    uint32_t lastPollMs = 0;                    // TIME_MS() of the last heartbeat cycle
};

/* @brief One relay board: identity, link, command gate & runtime state
 * @note Dialect and transaction counter are only touched while holding the gate.
 *       The snapshot is guarded by a short internal mutex so status readers
 *       never block behind an in-flight exchange.
 */
class Board {
public:
    /* @note channelCount is kept as configured. A board with more than MAX_CHANNELS
     *       channels is refused by Controller::begin(), its snapshot only mirrors
     *       the first MAX_CHANNELS coils.
     */
    Board(const char* key, ParkGateHAL::ILink& link,
          uint8_t unitId = DEFAULT_UNIT_ID, uint16_t channelCount = 8)
        : key(key), unitId(unitId), channelCount(channelCount), link(link) {
        _snapshot.channelCount = channelCount;
    }

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

    bool hasValidChannelCount() const { return channelCount > 0 && channelCount <= MAX_CHANNELS; }

    const char* const key;
    const uint8_t unitId;
    const uint16_t channelCount;
    ParkGateHAL::ILink& link;
    Mutex gate;                                 // Held for every exchange sequence

    // Gate holders only

    Dialect dialect() const { return _dialect; }
    void setDialect(Dialect d) {
        _dialect = d;
        Lock guard(_stateMutex);
        _snapshot.dialect = d;
    }
    uint16_t nextTransactionId() { return ++_transactionId; }

    // Snapshot updates

    /* @brief Record reachability
     * @return true if the flag changed (edge)
     */
    bool setReachable(bool reachable) {
        Lock guard(_stateMutex);
        _snapshot.lastPollMs = TIME_MS();
        if (_snapshot.reachable == reachable) return false;
        _snapshot.reachable = reachable;
        return true;
    }
    void storeCoils(const std::vector<bool>& coils, uint16_t start = 0) {
        Lock guard(_stateMutex);
        for (size_t i = 0; i < coils.size() && start + i < snapshotSize(); i++) {
            _snapshot.coils[start + i] = coils[i];
        }
        if (start == 0 && coils.size() >= channelCount) _snapshot.hasCoils = true;
    }
    void storeCoil(uint16_t index, bool value) {
        if (index >= snapshotSize()) return;
        Lock guard(_stateMutex);
        _snapshot.coils[index] = value;
    }
    void setLatency(uint32_t ms) {
        Lock guard(_stateMutex);
        _snapshot.latencyMs = ms;
    }

    BoardSnapshot snapshot() const {
        Lock guard(_stateMutex);
        return _snapshot;
    }

    // Number of coils mirrored in the snapshot
    uint16_t snapshotSize() const { return channelCount < MAX_CHANNELS ? channelCount : (uint16_t)MAX_CHANNELS; }

private:
    Dialect _dialect = UNDETECTED;
    uint16_t _transactionId = 0;
    mutable Mutex _stateMutex;
    BoardSnapshot _snapshot;
};

// ===================================================================================
// BARRIER
// ===================================================================================

enum BarrierState {
    IDLE,
    LIFTING,
    CLOSING,
    STOPPED,
    LATCHED_OPEN,
    LATCHED_CLOSED
};
static constexpr const char* toString(const BarrierState state) {
    switch (state) {
        case IDLE: return "idle";
        case LIFTING: return "lifting";
        case CLOSING: return "closing";
        case STOPPED: return "stopped";
        case LATCHED_OPEN: return "latched-open";
        case LATCHED_CLOSED: return "latched-closed";
        default: return "invalid state";
    }
}

struct BarrierSnapshot {
    bool locked = false;
    BarrierState state = IDLE;
    const char* lastAction = nullptr;           // nullptr until the first action
    time_t lastActionTime = 0;                  // Wall clock (seconds)
};

/* @brief One barrier: identity, coil mapping on its board & runtime state
 */
class Barrier {
public:
    Barrier(uint16_t id, const char* stringId, const char* name, Board& board,
            uint16_t liftCoil, uint16_t closeCoil, uint16_t stopCoil)
        : id(id), stringId(stringId), name(name), board(board),
          liftCoil(liftCoil), closeCoil(closeCoil), stopCoil(stopCoil) {}

    Barrier(const Barrier&) = delete;
    Barrier& operator=(const Barrier&) = delete;

    const uint16_t id;
    const char* const stringId;
    const char* const name;
    Board& board;
    const uint16_t liftCoil;
    const uint16_t closeCoil;
    const uint16_t stopCoil;

    /* @brief Pending auto-release, owned by the actuator
     * @note Only touched while holding board.gate. A release is applied only if it
     *       is still armed and its due tick has passed, so a timer callback that
     *       fired before a cancel or a re-arm has no effect.
     */
    struct AutoRelease {
        StaticTimer_t timerBuf;
        TimerHandle_t timer = nullptr;
        void* owner = nullptr;
        bool armed = false;
        uint16_t coil = 0;
        TickType_t dueTick = 0;
    } release;

    bool isLocked() const {
        Lock guard(_stateMutex);
        return _state.locked;
    }
    void setLocked(bool locked) {
        Lock guard(_stateMutex);
        _state.locked = locked;
    }
    void setState(BarrierState state) {
        Lock guard(_stateMutex);
        _state.state = state;
    }
    void recordAction(const char* action) {
        Lock guard(_stateMutex);
        _state.lastAction = action;
        _state.lastActionTime = time(nullptr);
    }
    BarrierSnapshot snapshot() const {
        Lock guard(_stateMutex);
        return _state;
    }

private:
    mutable Mutex _stateMutex;
    BarrierSnapshot _state;
};

} // namespace ParkGate
