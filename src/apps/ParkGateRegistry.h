/**
 * @file ParkGateRegistry.h
 * @brief Static registry of boards & barriers, fixed at startup
 */

#pragma once

#include "core/ParkGateModel.h"

#include <cstdlib>
#include <cstring>

namespace ParkGate {

class Registry {
public:
    /* @brief Build from two static arrays of pointers
     * @note The arrays and the objects they point to must outlive the registry
     */
    template<size_t NB, size_t NR>
    Registry(Board* (&boards)[NB], Barrier* (&barriers)[NR])
        : _boards(boards), _boardCount(NB), _barriers(barriers), _barrierCount(NR) {}

    Registry(Board* const* boards, size_t boardCount, Barrier* const* barriers, size_t barrierCount)
        : _boards(boards), _boardCount(boardCount), _barriers(barriers), _barrierCount(barrierCount) {}

    size_t boardCount() const { return _boardCount; }
    size_t barrierCount() const { return _barrierCount; }
    Board& board(size_t i) const { return *_boards[i]; }
    Barrier& barrier(size_t i) const { return *_barriers[i]; }

    Board* findBoard(const char* key) const {
        if (!key) return nullptr;
        for (size_t i = 0; i < _boardCount; i++) {
            if (strcmp(_boards[i]->key, key) == 0) return _boards[i];
        }
        return nullptr;
    }

    Barrier* findBarrier(uint16_t id) const {
        for (size_t i = 0; i < _barrierCount; i++) {
            if (_barriers[i]->id == id) return _barriers[i];
        }
        return nullptr;
    }

    Barrier* findBarrier(const char* stringId) const {
        if (!stringId) return nullptr;
        for (size_t i = 0; i < _barrierCount; i++) {
            if (strcmp(_barriers[i]->stringId, stringId) == 0) return _barriers[i];
        }
        return nullptr;
    }

    /* @brief Resolve a barrier from a user token
     * @note A fully numeric token is looked up by numeric id first, anything
     *       that doesn't match falls back to the string id
     * @return The barrier, nullptr if not found
     */
    Barrier* resolveBarrier(const char* token) const {
        if (!token || *token == '\0') return nullptr;

        char* end = nullptr;
        unsigned long numeric = strtoul(token, &end, 10);
        if (end && *end == '\0' && numeric <= 0xFFFF) {
            Barrier* barrier = findBarrier(static_cast<uint16_t>(numeric));
            if (barrier) return barrier;
        }
        return findBarrier(token);
    }

private:
    Board* const* _boards;
    size_t _boardCount;
    Barrier* const* _barriers;
    size_t _barrierCount;
};

} // namespace ParkGate
