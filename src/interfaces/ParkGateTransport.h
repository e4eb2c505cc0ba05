/**
 * @file ParkGateTransport.h
 * @brief Request/response exchange with a relay board over its byte link
 */

#pragma once

#include "core/ParkGateCore.h"
#include "core/ParkGateCodec.hpp"
#include "core/ParkGateModel.h"
#include "drivers/ParkGateHAL_Link.hpp"
#include "utils/ParkGateDebug.hpp"

namespace ParkGateInterface {

/* @brief Buffers partial responses until the codec reports a complete frame
 */
class FrameAccumulator {
public:
    FrameAccumulator() = default;
    FrameAccumulator(const FrameAccumulator&) = delete;
    FrameAccumulator& operator=(const FrameAccumulator&) = delete;

    void reset() { _rx->clear(); }
    ByteBuffer& bytes() { return *_rx; }
    size_t size() const { return _rx->size(); }

    /* @brief Try to extract a response from the bytes received so far
     * @param dialect Framing to parse with
     * @param pdu Output: FC + data
     * @param transactionId Output (TCP only)
     * @param ec Output: exception code on ERR_EXCEPTION
     * @param frameSize Output: bytes consumed by the frame
     * @return ParkGateCodec::INCOMPLETE until enough bytes are buffered
     */
    ParkGateCodec::Result tryParse(ParkGate::Dialect dialect, ByteBuffer& pdu,
                                   uint16_t* transactionId, ParkGate::ExceptionCode* ec,
                                   size_t* frameSize) const {
        if (dialect == ParkGate::DIALECT_TCP) {
            return ParkGateCodec::TCP::parseResponse(*_rx, pdu, transactionId, ec, frameSize);
        }
        return ParkGateCodec::RTU::parseResponse(*_rx, pdu, ec, frameSize);
    }

private:
    ByteArray<ParkGate::MAX_ADU_SIZE> _rx;
};

class Transport {
public:
    // ===================================================================================
    // CONFIGURATION
    // ===================================================================================

    struct Config {
        uint32_t timeoutMs = PARKGATE_TRANSPORT_TIMEOUT_MS;           // Deadline for a complete response
        uint32_t connectTimeoutMs = PARKGATE_CONNECT_TIMEOUT_MS;
        uint8_t retries = PARKGATE_TRANSPORT_RETRIES;                 // Transport-kind failures only
    };

    // ===================================================================================
    // RESULT TYPES
    // ===================================================================================

    enum Result {
        SUCCESS,
        ERR_INVALID_REQUEST,
        ERR_NOT_DETECTED,               // No dialect known for the board
        // Transport-kind
        ERR_CONNECT,
        ERR_TX_FAILED,
        ERR_LINK_LOST,
        ERR_TIMEOUT,
        // Protocol-kind
        ERR_EXCEPTION,
        ERR_INVALID_CRC,
        ERR_INVALID_FRAME,
        ERR_INVALID_TRANSACTION_ID
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case ERR_INVALID_REQUEST: return "invalid request";
            case ERR_NOT_DETECTED: return "dialect not detected";
            case ERR_CONNECT: return "connect error";
            case ERR_TX_FAILED: return "tx failed";
            case ERR_LINK_LOST: return "link lost before response";
            case ERR_TIMEOUT: return "transport timeout";
            case ERR_EXCEPTION: return "modbus exception";
            case ERR_INVALID_CRC: return "checksum error";
            case ERR_INVALID_FRAME: return "malformed response";
            case ERR_INVALID_TRANSACTION_ID: return "transaction id mismatch";
            default: return "unknown result";
        }
    }
    static constexpr bool isTransportError(const Result result) {
        return result >= ERR_CONNECT && result <= ERR_TIMEOUT;
    }
    static constexpr bool isProtocolError(const Result result) {
        return result >= ERR_EXCEPTION && result <= ERR_INVALID_TRANSACTION_ID;
    }

    static inline Result Error(Result res, const char* desc = nullptr
                        #ifdef PARKGATE_DEBUG_ACTIVE
                        , ParkGate::Debug::CallCtx ctx = ParkGate::Debug::CallCtx()
                        #endif
                        ) {
        #ifdef PARKGATE_DEBUG_ACTIVE
            if (desc && *desc != '\0') {
                ParkGate::Debug::LOG_MSGF_CTX(ctx, "Error: %s (%s)", toString(res), desc);
            } else {
                ParkGate::Debug::LOG_MSGF_CTX(ctx, "Error: %s", toString(res));
            }
        #endif
        return res;
    }

    static inline Result Success(const char* desc = nullptr
                          #ifdef PARKGATE_DEBUG_ACTIVE
                          , ParkGate::Debug::CallCtx ctx = ParkGate::Debug::CallCtx()
                          #endif
                          ) {
        #ifdef PARKGATE_DEBUG_ACTIVE
            if (desc && *desc != '\0') {
                ParkGate::Debug::LOG_MSGF_CTX(ctx, "Success: %s", desc);
            }
        #endif
        return SUCCESS;
    }

    // ===================================================================================
    // PUBLIC METHODS
    // ===================================================================================

    Transport() : _cfg() {}
    explicit Transport(const Config& cfg) : _cfg(cfg) {}

    /* @brief Exchange with the board using its cached dialect
     * @note Caller must hold board.gate. Transport-kind failures are retried up to
     *       Config::retries times. Any final failure invalidates the board dialect.
     * @param board Target board
     * @param fc Function code (READ_COILS or WRITE_COIL)
     * @param payload Request data after the function code
     * @param pdu Output: response FC + data
     * @param ec Output: exception code on ERR_EXCEPTION
     * @return The result of the exchange
     */
    Result request(ParkGate::Board& board, ParkGate::FunctionCode fc,
                   const ByteBuffer& payload, ByteBuffer& pdu,
                   ParkGate::ExceptionCode* ec = nullptr);

    /* @brief Single exchange with an explicit dialect (used by probes)
     * @note Caller must hold board.gate. Does not touch the board dialect.
     */
    Result exchange(ParkGate::Board& board, ParkGate::Dialect dialect, ParkGate::FunctionCode fc,
                    const ByteBuffer& payload, ByteBuffer& pdu,
                    ParkGate::ExceptionCode* ec = nullptr);

    const Config& getConfig() const { return _cfg; }

private:
    static Result fromCodec(ParkGateCodec::Result res);

    Config _cfg;
};

} // namespace ParkGateInterface
