/**
 * @file ParkGateCoils.cpp
 * @brief Typed coil operations (implementation)
 */

#include "apps/ParkGateCoils.h"

namespace ParkGate {

using ParkGateInterface::Transport;
using ParkGateInterface::ModeNegotiator;

CoilRegister::Result CoilRegister::prepare(Board& board) {
    if (_negotiator.ensure(board) != ModeNegotiator::SUCCESS) return ERR_UNAVAILABLE;
    return SUCCESS;
}

CoilRegister::Result CoilRegister::fromTransport(Transport::Result res, Transport::Result* detail) {
    if (detail) *detail = res;
    if (res == Transport::SUCCESS) return SUCCESS;
    if (res == Transport::ERR_NOT_DETECTED) return ERR_UNAVAILABLE;
    if (Transport::isTransportError(res)) return ERR_TRANSPORT;
    return ERR_PROTOCOL;
}

CoilRegister::Result CoilRegister::badResponse(Board& board, Transport::Result* detail) {
    // Framed correctly but not the expected answer: resync & renegotiate
    board.link.close();
    board.setDialect(UNDETECTED);
    return fromTransport(Transport::ERR_INVALID_FRAME, detail);
}

CoilRegister::Result CoilRegister::readCoils(Board& board, uint16_t start, uint16_t quantity,
                                             std::vector<bool>& coils, Transport::Result* detail) {
    if (quantity == 0 || quantity > MAX_COILS_READ || start + quantity > 0x10000) return ERR_INVALID_ADDRESS;

    Result res = prepare(board);
    if (res != SUCCESS) return res;

    ByteArray<ParkGateCodec::PDU::READ_REQUEST_SIZE> payload;
    ByteArray<MAX_PDU_SIZE> pdu;
    if (ParkGateCodec::PDU::readCoilsRequest(start, quantity, *payload) != ParkGateCodec::SUCCESS) {
        return ERR_INVALID_ADDRESS;
    }

    Transport::Result txRes = _transport.request(board, READ_COILS, *payload, *pdu);
    if (txRes != Transport::SUCCESS) return fromTransport(txRes, detail);

    if (ParkGateCodec::PDU::unpackCoils(*pdu, quantity, coils) != ParkGateCodec::SUCCESS) {
        return badResponse(board, detail);
    }

    board.storeCoils(coils, start);
    return fromTransport(Transport::SUCCESS, detail);
}

CoilRegister::Result CoilRegister::writeCoil(Board& board, uint16_t address, bool value,
                                             Transport::Result* detail) {
    if (address >= board.channelCount) return ERR_INVALID_ADDRESS;

    Result res = prepare(board);
    if (res != SUCCESS) return res;

    ByteArray<ParkGateCodec::PDU::WRITE_REQUEST_SIZE> payload;
    ByteArray<MAX_PDU_SIZE> pdu;
    ParkGateCodec::PDU::writeCoilRequest(address, value, *payload);

    Transport::Result txRes = _transport.request(board, WRITE_COIL, *payload, *pdu);
    if (txRes != Transport::SUCCESS) return fromTransport(txRes, detail);

    if (ParkGateCodec::PDU::checkWriteEcho(*pdu, address, value) != ParkGateCodec::SUCCESS) {
        return badResponse(board, detail);
    }

    board.storeCoil(address, value);
    ParkGate::Debug::LOG_MSGF("%s: coil %u <- %s", board.key, address, value ? "ON" : "OFF");
    return fromTransport(Transport::SUCCESS, detail);
}

} // namespace ParkGate
