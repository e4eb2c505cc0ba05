/**
 * @file ParkGateCodec.hpp
 * @brief Modbus/TCP & RTU-over-TCP framing for relay boards (no I/O, no state)
 */

#pragma once

#include "core/ParkGateCore.h"
#include "utils/ParkGateDebug.hpp"

namespace ParkGateCodec {

    enum Result {
        SUCCESS,
        INCOMPLETE,                     // Not an error: keep buffering
        // General errors
        ERR_INVALID_LEN,
        ERR_BUFFER_OVERFLOW,
        // PDU errors
        ERR_INVALID_FC,
        ERR_INVALID_REG_COUNT,
        ERR_INVALID_BYTE_COUNT,
        ERR_INVALID_ECHO,
        ERR_EXCEPTION,                  // Well-formed Modbus exception response
        // RTU errors
        ERR_INVALID_CRC,
        // TCP errors
        ERR_INVALID_MBAP_LEN,
        ERR_INVALID_MBAP_PROTOCOL_ID
    };
    static constexpr const char* toString(const Result result) {
        switch (result) {
            case SUCCESS: return "success";
            case INCOMPLETE: return "incomplete frame";
            case ERR_INVALID_LEN: return "invalid length";
            case ERR_BUFFER_OVERFLOW: return "buffer overflow";
            case ERR_INVALID_FC: return "invalid function code";
            case ERR_INVALID_REG_COUNT: return "invalid coil count";
            case ERR_INVALID_BYTE_COUNT: return "invalid byte count";
            case ERR_INVALID_ECHO: return "write echo mismatch";
            case ERR_EXCEPTION: return "modbus exception";
            case ERR_INVALID_CRC: return "invalid CRC";
            case ERR_INVALID_MBAP_LEN: return "invalid MBAP length";
            case ERR_INVALID_MBAP_PROTOCOL_ID: return "invalid MBAP protocol ID";
            default: return "unknown error";
        }
    }

    // Helper to cast an error
    // - Returns a Result
    // - Logs the call site when debug is enabled
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

    inline uint16_t readU16(const ByteBuffer& bytes, size_t offset) {
        return (uint16_t)((bytes[offset] << 8) | bytes[offset + 1]);
    }

    // Copy an exception PDU (FC | 0x80, code) and report the code
    inline Result exceptionPdu(uint8_t rawFc, uint8_t rawEc, ByteBuffer& pdu, ParkGate::ExceptionCode* ec) {
        pdu.clear();
        pdu.push_back(rawFc);
        pdu.push_back(rawEc);
        if (ec) *ec = static_cast<ParkGate::ExceptionCode>(rawEc);
        return ERR_EXCEPTION;
    }

/* @brief Dialect-independent PDU payloads for the two supported function codes
 * @note "payload" = data after the function code, "pdu" = function code + data
 */
class PDU {

public:

    static constexpr size_t READ_REQUEST_SIZE = 4;    // start + quantity
    static constexpr size_t WRITE_REQUEST_SIZE = 4;   // address + value

    /* @brief Build the payload of a ReadCoils request
     * @param start First coil address
     * @param quantity Number of coils (1..2000)
     * @param payload Output buffer (cleared first)
     * @return The result of the operation.
     */
    static Result readCoilsRequest(uint16_t start, uint16_t quantity, ByteBuffer& payload) {
        payload.clear();
        if (quantity == 0 || quantity > ParkGate::MAX_COILS_READ) return Error(ERR_INVALID_REG_COUNT);
        if (payload.capacity() < READ_REQUEST_SIZE) return Error(ERR_BUFFER_OVERFLOW);
        payload.push_u16(start);
        payload.push_u16(quantity);
        return SUCCESS;
    }

    static Result writeCoilRequest(uint16_t address, bool value, ByteBuffer& payload) {
        payload.clear();
        if (payload.capacity() < WRITE_REQUEST_SIZE) return Error(ERR_BUFFER_OVERFLOW);
        payload.push_u16(address);
        payload.push_u16(value ? ParkGate::COIL_ON : ParkGate::COIL_OFF);
        return SUCCESS;
    }

    /* @brief Pack coil states into "byte count + data" (LSB-first, zero padded)
     * @param coils Coil states, index 0 = bit 0 of the first byte
     * @param payload Output buffer (cleared first)
     * @return The result of the operation.
     */
    static Result packCoils(const std::vector<bool>& coils, ByteBuffer& payload) {
        payload.clear();
        size_t byteCount = (coils.size() + 7) / 8;
        if (byteCount > 0xFF || payload.capacity() < byteCount + 1) return Error(ERR_BUFFER_OVERFLOW);
        payload.push_back(static_cast<uint8_t>(byteCount));
        for (size_t i = 0; i < byteCount; i++) payload.push_back(0);
        for (size_t i = 0; i < coils.size(); i++) {
            if (coils[i]) payload.write_at(1 + i / 8, static_cast<uint8_t>(payload[1 + i / 8] | (1 << (i % 8))));
        }
        return SUCCESS;
    }

    /* @brief Unpack a ReadCoils response PDU
     * @param pdu Response PDU (FC + byte count + data)
     * @param quantity Number of coils that were requested
     * @param coils Output, resized to quantity. Coil i = byte i/8, bit i%8.
     * @return The result of the operation.
     */
    static Result unpackCoils(const ByteBuffer& pdu, uint16_t quantity, std::vector<bool>& coils) {
        if (pdu.size() < 2) return Error(ERR_INVALID_LEN);
        if (pdu[0] != ParkGate::READ_COILS) return Error(ERR_INVALID_FC);
        size_t byteCount = pdu[1];
        if (byteCount != (size_t)((quantity + 7) / 8) || pdu.size() != byteCount + 2) {
            return Error(ERR_INVALID_BYTE_COUNT);
        }

        coils.assign(quantity, false);
        for (size_t i = 0; i < quantity; i++) {
            coils[i] = (pdu[2 + i / 8] >> (i % 8)) & 0x01;
        }
        return SUCCESS;
    }

    /* @brief Check that a WriteSingleCoil response echoes the request
     */
    static Result checkWriteEcho(const ByteBuffer& pdu, uint16_t address, bool value) {
        if (pdu.size() != 1 + WRITE_REQUEST_SIZE) return Error(ERR_INVALID_LEN);
        if (pdu[0] != ParkGate::WRITE_COIL) return Error(ERR_INVALID_FC);
        uint16_t expected = value ? ParkGate::COIL_ON : ParkGate::COIL_OFF;
        if (readU16(pdu, 1) != address || readU16(pdu, 3) != expected) return Error(ERR_INVALID_ECHO);
        return SUCCESS;
    }

}; // class PDU

/* @brief RTU-over-TCP framing: unit id + FC + data + CRC16 (little-endian)
 */
class RTU {

public:

    static constexpr size_t MIN_RESPONSE_SIZE = 5;
    static constexpr size_t EXCEPTION_FRAME_SIZE = 5;
    static constexpr size_t MAX_FRAME_SIZE = ParkGate::MAX_PDU_SIZE + 3;

    /* @brief Build a request frame
     * @param unitId Unit (slave) id
     * @param fc Function code
     * @param payload Data following the function code
     * @param bytes Output buffer (cleared first)
     * @return The result of the operation.
     */
    static Result buildFrame(uint8_t unitId, ParkGate::FunctionCode fc,
                             const ByteBuffer& payload, ByteBuffer& bytes) {
        bytes.clear();
        if (payload.size() + 1 > ParkGate::MAX_PDU_SIZE) return Error(ERR_INVALID_LEN);
        if (bytes.capacity() < payload.size() + 4) return Error(ERR_BUFFER_OVERFLOW);

        bytes.push_back(unitId);
        bytes.push_back(static_cast<uint8_t>(fc));
        bytes.push_back(payload.data(), payload.size());
        appendCRC(bytes);
        return SUCCESS;
    }

    /* @brief Size of the complete response frame starting at bytes[0]
     * @param bytes Received bytes (at least unit id + FC, + byte count for reads)
     * @return Frame size, 0 if it can't be determined yet or the FC is unsupported
     */
    static size_t expectedResponseSize(const ByteBuffer& bytes) {
        if (bytes.size() < 2) return 0;
        uint8_t fc = bytes[1];
        if (fc & ParkGate::EXCEPTION_FLAG) return EXCEPTION_FRAME_SIZE;

        switch (fc) {
            case ParkGate::READ_COILS:
            case ParkGate::READ_DISCRETE_INPUTS:
                if (bytes.size() < 3) return 0;
                return 3 + bytes[2] + 2;
            case ParkGate::WRITE_COIL:
            case ParkGate::WRITE_REGISTER:
                return 8;
            default:
                return 0;
        }
    }

    /* @brief Parse a (possibly partial) response
     * @param bytes Bytes received so far
     * @param pdu Output: FC + data (unit id and CRC stripped)
     * @param ec Output: exception code when ERR_EXCEPTION is returned
     * @param frameSize Output: bytes consumed by the frame
     * @return SUCCESS, INCOMPLETE while more bytes are needed, or an error
     */
    static Result parseResponse(const ByteBuffer& bytes, ByteBuffer& pdu,
                                ParkGate::ExceptionCode* ec = nullptr,
                                size_t* frameSize = nullptr) {
        pdu.clear();
        if (bytes.size() < MIN_RESPONSE_SIZE) return INCOMPLETE;

        uint8_t rawFc = bytes[1];
        if (rawFc & ParkGate::EXCEPTION_FLAG) {
            if (!validateCRC(bytes.slice(0, EXCEPTION_FRAME_SIZE))) return Error(ERR_INVALID_CRC, "exception frame");
            if (frameSize) *frameSize = EXCEPTION_FRAME_SIZE;
            return exceptionPdu(rawFc, bytes[2], pdu, ec);
        }

        size_t expected = expectedResponseSize(bytes);
        if (expected == 0) return Error(ERR_INVALID_FC);
        if (expected > MAX_FRAME_SIZE) return Error(ERR_INVALID_BYTE_COUNT);
        if (bytes.size() < expected) return INCOMPLETE;

        if (!validateCRC(bytes.slice(0, expected))) return Error(ERR_INVALID_CRC);

        if (!pdu.push_back(bytes.data() + 1, expected - 3)) return Error(ERR_BUFFER_OVERFLOW);
        if (frameSize) *frameSize = expected;
        return Success();
    }

    // CRC16 Look-Up Table (Modbus polynomial 0xA001, reflected)
    static constexpr uint16_t CRC16_TABLE[256] = {
        0x0000, 0xC0C1, 0xC181, 0x0140, 0xC301, 0x03C0, 0x0280, 0xC241,
        0xC601, 0x06C0, 0x0780, 0xC741, 0x0500, 0xC5C1, 0xC481, 0x0440,
        0xCC01, 0x0CC0, 0x0D80, 0xCD41, 0x0F00, 0xCFC1, 0xCE81, 0x0E40,
        0x0A00, 0xCAC1, 0xCB81, 0x0B40, 0xC901, 0x09C0, 0x0880, 0xC841,
        0xD801, 0x18C0, 0x1980, 0xD941, 0x1B00, 0xDBC1, 0xDA81, 0x1A40,
        0x1E00, 0xDEC1, 0xDF81, 0x1F40, 0xDD01, 0x1DC0, 0x1C80, 0xDC41,
        0x1400, 0xD4C1, 0xD581, 0x1540, 0xD701, 0x17C0, 0x1680, 0xD641,
        0xD201, 0x12C0, 0x1380, 0xD341, 0x1100, 0xD1C1, 0xD081, 0x1040,
        0xF001, 0x30C0, 0x3180, 0xF141, 0x3300, 0xF3C1, 0xF281, 0x3240,
        0x3600, 0xF6C1, 0xF781, 0x3740, 0xF501, 0x35C0, 0x3480, 0xF441,
        0x3C00, 0xFCC1, 0xFD81, 0x3D40, 0xFF01, 0x3FC0, 0x3E80, 0xFE41,
        0xFA01, 0x3AC0, 0x3B80, 0xFB41, 0x3900, 0xF9C1, 0xF881, 0x3840,
        0x2800, 0xE8C1, 0xE981, 0x2940, 0xEB01, 0x2BC0, 0x2A80, 0xEA41,
        0xEE01, 0x2EC0, 0x2F80, 0xEF41, 0x2D00, 0xEDC1, 0xEC81, 0x2C40,
        0xE401, 0x24C0, 0x2580, 0xE541, 0x2700, 0xE7C1, 0xE681, 0x2640,
        0x2200, 0xE2C1, 0xE381, 0x2340, 0xE101, 0x21C0, 0x2080, 0xE041,
        0xA001, 0x60C0, 0x6180, 0xA141, 0x6300, 0xA3C1, 0xA281, 0x6240,
        0x6600, 0xA6C1, 0xA781, 0x6740, 0xA501, 0x65C0, 0x6480, 0xA441,
        0x6C00, 0xACC1, 0xAD81, 0x6D40, 0xAF01, 0x6FC0, 0x6E80, 0xAE41,
        0xAA01, 0x6AC0, 0x6B80, 0xAB41, 0x6900, 0xA9C1, 0xA881, 0x6840,
        0x7800, 0xB8C1, 0xB981, 0x7940, 0xBB01, 0x7BC0, 0x7A80, 0xBA41,
        0xBE01, 0x7EC0, 0x7F80, 0xBF41, 0x7D00, 0xBDC1, 0xBC81, 0x7C40,
        0xB401, 0x74C0, 0x7580, 0xB541, 0x7700, 0xB7C1, 0xB681, 0x7640,
        0x7200, 0xB2C1, 0xB381, 0x7340, 0xB101, 0x71C0, 0x7080, 0xB041,
        0x5000, 0x90C1, 0x9181, 0x5140, 0x9301, 0x53C0, 0x5280, 0x9241,
        0x9601, 0x56C0, 0x5780, 0x9741, 0x5500, 0x95C1, 0x9481, 0x5440,
        0x9C01, 0x5CC0, 0x5D80, 0x9D41, 0x5F00, 0x9FC1, 0x9E81, 0x5E40,
        0x5A00, 0x9AC1, 0x9B81, 0x5B40, 0x9901, 0x59C0, 0x5880, 0x9841,
        0x8801, 0x48C0, 0x4980, 0x8941, 0x4B00, 0x8BC1, 0x8A81, 0x4A40,
        0x4E00, 0x8EC1, 0x8F81, 0x4F40, 0x8D01, 0x4DC0, 0x4C80, 0x8C41,
        0x4400, 0x84C1, 0x8581, 0x4540, 0x8701, 0x47C0, 0x4680, 0x8641,
        0x8201, 0x42C0, 0x4380, 0x8341, 0x4100, 0x81C1, 0x8081, 0x4040
    };

    static uint16_t calculateCRC(const ByteBuffer& bytes) {
        uint16_t crc = 0xFFFF;
        for (uint8_t b : bytes) {
            crc = (crc >> 8) ^ CRC16_TABLE[(crc ^ b) & 0xFF];
        }
        return crc;
    }

    /* @brief Check the trailing CRC (last 2 bytes, low byte first)
     */
    static bool validateCRC(const ByteBuffer& bytes) {
        if (bytes.size() < 3) return false;
        uint16_t received = (bytes[bytes.size() - 1] << 8) | bytes[bytes.size() - 2];
        return received == calculateCRC(bytes.slice(0, bytes.size() - 2));
    }

    /* @brief Append the CRC of the current content
     * @return false (buffer untouched) if fewer than 2 bytes are free
     */
    static bool appendCRC(ByteBuffer& frame) {
        if (frame.free_space() < 2) return false;
        uint16_t crc = calculateCRC(frame);
        frame.push_back(crc & 0xFF);
        frame.push_back((crc >> 8) & 0xFF);
        return true;
    }

}; // class RTU

/* @brief Modbus/TCP framing: MBAP header + PDU
 */
class TCP {

public:

    struct MBAP {
        uint16_t transactionId;
        uint16_t protocolId = 0;
        uint16_t length;            // unit id + PDU
        uint8_t unitId = ParkGate::DEFAULT_UNIT_ID;

        void appendTo(ByteBuffer& bytes) const {
            bytes.push_u16(transactionId);
            bytes.push_u16(protocolId);
            bytes.push_u16(length);
            bytes.push_back(unitId);
        }
    };

    static constexpr size_t MBAP_SIZE = 7;
    static constexpr size_t MIN_RESPONSE_SIZE = MBAP_SIZE + 2;   // Shortest reply is an exception
    static constexpr size_t MAX_FRAME_SIZE = MBAP_SIZE + ParkGate::MAX_PDU_SIZE;

    /* @brief Build a request frame
     * @param transactionId Transaction id (echoed back by the board)
     * @param unitId Unit id
     * @param fc Function code
     * @param payload Data following the function code
     * @param bytes Output buffer (cleared first)
     * @return The result of the operation.
     */
    static Result buildFrame(uint16_t transactionId, uint8_t unitId, ParkGate::FunctionCode fc,
                             const ByteBuffer& payload, ByteBuffer& bytes) {
        bytes.clear();
        if (payload.size() + 1 > ParkGate::MAX_PDU_SIZE) return Error(ERR_INVALID_LEN);
        if (bytes.capacity() < MBAP_SIZE + 1 + payload.size()) return Error(ERR_BUFFER_OVERFLOW);

        MBAP mbap = {
            .transactionId = transactionId,
            .protocolId = 0,
            .length = (uint16_t)(payload.size() + 2),    // unit id + FC + payload
            .unitId = unitId
        };
        mbap.appendTo(bytes);
        bytes.push_back(static_cast<uint8_t>(fc));
        bytes.push_back(payload.data(), payload.size());
        return SUCCESS;
    }

    /* @brief Parse a (possibly partial) response
     * @param bytes Bytes received so far
     * @param pdu Output: bytes from offset 7 (FC + data)
     * @param transactionId Output: transaction id of the response
     * @param ec Output: exception code when ERR_EXCEPTION is returned
     * @param frameSize Output: bytes consumed by the frame
     * @return SUCCESS, INCOMPLETE while more bytes are needed, or an error
     */
    static Result parseResponse(const ByteBuffer& bytes, ByteBuffer& pdu,
                                uint16_t* transactionId = nullptr,
                                ParkGate::ExceptionCode* ec = nullptr,
                                size_t* frameSize = nullptr) {
        pdu.clear();
        if (bytes.size() < MIN_RESPONSE_SIZE) return INCOMPLETE;

        MBAP mbap = {
            .transactionId = readU16(bytes, 0),
            .protocolId = readU16(bytes, 2),
            .length = readU16(bytes, 4),
            .unitId = bytes[6]
        };
        if (mbap.protocolId != 0) return Error(ERR_INVALID_MBAP_PROTOCOL_ID);
        if (mbap.length < 2 || mbap.length > ParkGate::MAX_PDU_SIZE + 1) return Error(ERR_INVALID_MBAP_LEN);
        if (transactionId) *transactionId = mbap.transactionId;

        size_t total = MBAP_SIZE - 1 + mbap.length;
        if (bytes.size() < total) return INCOMPLETE;
        if (frameSize) *frameSize = total;

        uint8_t rawFc = bytes[MBAP_SIZE];
        if (rawFc & ParkGate::EXCEPTION_FLAG) {
            return exceptionPdu(rawFc, bytes[MBAP_SIZE + 1], pdu, ec);
        }

        if (!pdu.push_back(bytes.data() + MBAP_SIZE, total - MBAP_SIZE)) return Error(ERR_BUFFER_OVERFLOW);
        return Success();
    }

}; // class TCP

} // namespace ParkGateCodec
