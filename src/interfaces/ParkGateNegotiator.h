/**
 * @file ParkGateNegotiator.h
 * @brief Live-probe detection of the framing a relay board accepts
 */

#pragma once

#include "interfaces/ParkGateTransport.h"

namespace ParkGateInterface {

/* @brief Detects the board dialect with a real ReadCoils(0, channelCount) round trip
 * @note Boards drop frames of the wrong dialect silently, so a wrong guess shows up
 *       as a timeout rather than an error reply. TCP is tried first, then RTU.
 */
class ModeNegotiator {
public:
    enum Result {
        SUCCESS,
        ERR_UNAVAILABLE                 // Neither dialect answered
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case ERR_UNAVAILABLE: return "board unavailable";
            default: return "unknown result";
        }
    }

    explicit ModeNegotiator(Transport& transport) : _transport(transport) {}

    /* @brief Probe the board and cache the dialect on success
     * @note Caller must hold board.gate. On failure the dialect stays UNDETECTED.
     * @param board Board to probe
     * @param coils Output (optional): coil states returned by the successful probe
     * @return SUCCESS (board.dialect() is TCP or RTU) or ERR_UNAVAILABLE
     */
    Result detect(ParkGate::Board& board, std::vector<bool>* coils = nullptr);

    /* @brief detect() only if the board dialect is unknown
     */
    Result ensure(ParkGate::Board& board) {
        if (board.dialect() != ParkGate::UNDETECTED) return SUCCESS;
        return detect(board);
    }

private:
    Transport::Result probe(ParkGate::Board& board, ParkGate::Dialect dialect, std::vector<bool>& coils);

    Transport& _transport;
};

} // namespace ParkGateInterface
