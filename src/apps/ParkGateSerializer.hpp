/**
 * @file ParkGateSerializer.hpp
 * @brief Per-board command gate: one exchange sequence at a time per board
 */

#pragma once

#include "core/ParkGateModel.h"

namespace ParkGate {

/* @brief Runs work while holding a board's gate
 * @note Waiters for the same board are served in arrival order (equal task
 *       priorities). Gates of different boards are independent.
 */
class CommandSerializer {
public:
    /* @brief Run fn with the board gate held, release it on return
     * @return Whatever fn returns
     */
    template<typename Fn>
    static auto withGate(Board& board, Fn&& fn) -> decltype(fn()) {
        Lock guard(board.gate);
        return fn();
    }

    /* @brief Run fn only if the gate is free right now
     * @return false if the gate was held (fn not called)
     */
    template<typename Fn>
    static bool tryWithGate(Board& board, Fn&& fn) {
        Lock guard(board.gate, 0);
        if (!guard.isLocked()) return false;
        fn();
        return true;
    }
};

} // namespace ParkGate
