/**
 * @file ParkGateNegotiator.cpp
 * @brief Live-probe detection of the board dialect (implementation)
 */

#include "interfaces/ParkGateNegotiator.h"

namespace ParkGateInterface {

Transport::Result ModeNegotiator::probe(ParkGate::Board& board, ParkGate::Dialect dialect,
                                        std::vector<bool>& coils) {
    ByteArray<ParkGateCodec::PDU::READ_REQUEST_SIZE> payload;
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;

    if (ParkGateCodec::PDU::readCoilsRequest(0, board.channelCount, *payload) != ParkGateCodec::SUCCESS) {
        return Transport::ERR_INVALID_REQUEST;
    }

    Transport::Result res = _transport.exchange(board, dialect, ParkGate::READ_COILS, *payload, *pdu);
    if (res != Transport::SUCCESS) return res;

    if (ParkGateCodec::PDU::unpackCoils(*pdu, board.channelCount, coils) != ParkGateCodec::SUCCESS) {
        board.link.close();
        return Transport::ERR_INVALID_FRAME;
    }
    return Transport::SUCCESS;
}

ModeNegotiator::Result ModeNegotiator::detect(ParkGate::Board& board, std::vector<bool>* coils) {
    board.setDialect(ParkGate::UNDETECTED);

    std::vector<bool> probed;
    static constexpr ParkGate::Dialect ORDER[] = { ParkGate::DIALECT_TCP, ParkGate::DIALECT_RTU };

    for (ParkGate::Dialect dialect : ORDER) {
        Transport::Result res = probe(board, dialect, probed);
        if (res == Transport::SUCCESS) {
            board.setDialect(dialect);
            board.storeCoils(probed);
            if (coils) *coils = probed;
            ParkGate::Debug::LOG_MSGF("%s: dialect detected: %s", board.key, ParkGate::toString(dialect));
            return SUCCESS;
        }
        ParkGate::Debug::LOG_MSGF("%s: %s probe failed (%s)", board.key,
                                  ParkGate::toString(dialect), Transport::toString(res));
        // A refused connect still gets the RTU attempt
    }

    return ERR_UNAVAILABLE;
}

} // namespace ParkGateInterface
