/**
 * @file ParkGateCoils.h
 * @brief Typed read-coils / write-coil operations on a board
 */

#pragma once

#include "core/ParkGateModel.h"
#include "interfaces/ParkGateTransport.h"
#include "interfaces/ParkGateNegotiator.h"

namespace ParkGate {

class CoilRegister {
public:
    enum Result {
        SUCCESS,
        ERR_INVALID_ADDRESS,
        ERR_UNAVAILABLE,        // No dialect could be negotiated
        ERR_TRANSPORT,          // Connect error / timeout
        ERR_PROTOCOL            // Exception, checksum or malformed response
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case ERR_INVALID_ADDRESS: return "invalid coil address";
            case ERR_UNAVAILABLE: return "board unavailable";
            case ERR_TRANSPORT: return "transport error";
            case ERR_PROTOCOL: return "protocol error";
            default: return "unknown result";
        }
    }

    CoilRegister(ParkGateInterface::Transport& transport, ParkGateInterface::ModeNegotiator& negotiator)
        : _transport(transport), _negotiator(negotiator) {}

    /* @brief Read a range of coils
     * @note Caller must hold board.gate. Negotiates the dialect first if unknown.
     *       The read range is copied into the board snapshot.
     * @param board Target board
     * @param start First coil
     * @param quantity Number of coils
     * @param coils Output, resized to quantity
     * @param detail Output (optional): underlying transport result
     * @return The result of the operation
     */
    Result readCoils(Board& board, uint16_t start, uint16_t quantity, std::vector<bool>& coils,
                     ParkGateInterface::Transport::Result* detail = nullptr);

    /* @brief Write one coil (FC 0x05) and check the echo
     * @note Caller must hold board.gate
     */
    Result writeCoil(Board& board, uint16_t address, bool value,
                     ParkGateInterface::Transport::Result* detail = nullptr);

    Result readAll(Board& board, std::vector<bool>& coils) {
        return readCoils(board, 0, board.channelCount, coils);
    }

private:
    Result prepare(Board& board);
    Result fromTransport(ParkGateInterface::Transport::Result res,
                         ParkGateInterface::Transport::Result* detail);
    Result badResponse(Board& board, ParkGateInterface::Transport::Result* detail);

    ParkGateInterface::Transport& _transport;
    ParkGateInterface::ModeNegotiator& _negotiator;
};

} // namespace ParkGate
