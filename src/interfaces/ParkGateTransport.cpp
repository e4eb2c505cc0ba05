/**
 * @file ParkGateTransport.cpp
 * @brief Request/response exchange with a relay board (implementation)
 */

#include "interfaces/ParkGateTransport.h"

namespace ParkGateInterface {

using ParkGate::Board;
using ParkGate::Dialect;

Transport::Result Transport::fromCodec(ParkGateCodec::Result res) {
    switch (res) {
        case ParkGateCodec::SUCCESS: return SUCCESS;
        case ParkGateCodec::ERR_EXCEPTION: return ERR_EXCEPTION;
        case ParkGateCodec::ERR_INVALID_CRC: return ERR_INVALID_CRC;
        default: return ERR_INVALID_FRAME;
    }
}

Transport::Result Transport::request(Board& board, ParkGate::FunctionCode fc,
                                     const ByteBuffer& payload, ByteBuffer& pdu,
                                     ParkGate::ExceptionCode* ec) {
    Dialect dialect = board.dialect();
    if (dialect == ParkGate::UNDETECTED) return Error(ERR_NOT_DETECTED, board.key);

    Result res = SUCCESS;
    for (uint8_t attempt = 0; attempt <= _cfg.retries; attempt++) {
        res = exchange(board, dialect, fc, payload, pdu, ec);
        if (res == SUCCESS) return Success();
        if (!isTransportError(res)) break;
        ParkGate::Debug::LOG_MSGF("%s: attempt %u failed (%s)", board.key, attempt + 1, toString(res));
    }

    // Force re-negotiation on the next cycle
    board.setDialect(ParkGate::UNDETECTED);
    return Error(res, board.key);
}

Transport::Result Transport::exchange(Board& board, Dialect dialect, ParkGate::FunctionCode fc,
                                      const ByteBuffer& payload, ByteBuffer& pdu,
                                      ParkGate::ExceptionCode* ec) {
    if (dialect == ParkGate::UNDETECTED) return Error(ERR_NOT_DETECTED);
    if (!ParkGate::isRequestable(fc)) return Error(ERR_INVALID_REQUEST, "unsupported function code");

    ParkGateHAL::ILink& link = board.link;
    uint32_t startMs = TIME_MS();

    if (link.open(_cfg.connectTimeoutMs) != ParkGateHAL::ILink::SUCCESS) {
        return Error(ERR_CONNECT, board.key);
    }

    // Build the request
    ByteArray<ParkGate::MAX_ADU_SIZE> tx;
    uint16_t transactionId = 0;
    ParkGateCodec::Result encRes;
    if (dialect == ParkGate::DIALECT_TCP) {
        transactionId = board.nextTransactionId();
        encRes = ParkGateCodec::TCP::buildFrame(transactionId, board.unitId, fc, payload, *tx);
    } else {
        encRes = ParkGateCodec::RTU::buildFrame(board.unitId, fc, payload, *tx);
    }
    if (encRes != ParkGateCodec::SUCCESS) return Error(ERR_INVALID_REQUEST, ParkGateCodec::toString(encRes));

    ParkGate::Debug::LOG_HEXDUMP(*tx, ParkGate::toString(dialect));
    if (link.send(*tx, _cfg.timeoutMs) != ParkGateHAL::ILink::SUCCESS) {
        link.close();
        return Error(ERR_TX_FAILED, board.key);
    }

    // Accumulate until the codec has a full frame or the deadline passes
    FrameAccumulator rx;
    uint32_t sentMs = TIME_MS();
    uint16_t rxTransactionId = 0;
    ParkGate::ExceptionCode rxEc = ParkGate::NULL_EXCEPTION;
    size_t frameSize = 0;
    ParkGateCodec::Result decRes;

    while ((decRes = rx.tryParse(dialect, pdu, &rxTransactionId, &rxEc, &frameSize)) == ParkGateCodec::INCOMPLETE) {
        uint32_t elapsed = TIME_MS() - sentMs;
        if (elapsed >= _cfg.timeoutMs) {
            link.close(); // A late reply must not be read as the next one
            return Error(ERR_TIMEOUT, board.key);
        }

        ParkGateHAL::ILink::Result rxRes = link.receive(rx.bytes(), _cfg.timeoutMs - elapsed);
        if (rxRes == ParkGateHAL::ILink::NODATA) continue;
        if (rxRes != ParkGateHAL::ILink::SUCCESS) {
            link.close();
            return Error(ERR_LINK_LOST, ParkGateHAL::ILink::toString(rxRes));
        }
    }
    ParkGate::Debug::LOG_HEXDUMP(rx.bytes(), "RX");

    if (decRes != ParkGateCodec::SUCCESS && decRes != ParkGateCodec::ERR_EXCEPTION) {
        link.close();
        return Error(fromCodec(decRes), ParkGateCodec::toString(decRes));
    }
    if (dialect == ParkGate::DIALECT_TCP && rxTransactionId != transactionId) {
        link.close();
        return Error(ERR_INVALID_TRANSACTION_ID, board.key);
    }
    // Trailing bytes mean the stream is out of sync
    if (frameSize < rx.size()) link.close();

    if (decRes == ParkGateCodec::ERR_EXCEPTION) {
        if ((pdu[0] & ~ParkGate::EXCEPTION_FLAG) != static_cast<uint8_t>(fc)) {
            link.close();
            return Error(ERR_INVALID_FRAME, "exception for another function code");
        }
        if (ec) *ec = rxEc;
        return Error(ERR_EXCEPTION, ParkGate::toString(rxEc));
    }
    if (pdu.empty() || pdu[0] != static_cast<uint8_t>(fc)) {
        link.close();
        return Error(ERR_INVALID_FRAME, "function code mismatch");
    }

    board.setLatency(TIME_MS() - startMs);
    return SUCCESS;
}

} // namespace ParkGateInterface
