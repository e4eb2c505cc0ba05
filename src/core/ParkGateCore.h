/**
 * @file ParkGateCore.h
 * @brief Protocol constants & enums shared by every layer
 */

#pragma once

#include "core/ParkGateTypes.h"
#include "core/ParkGateConfig.h"

namespace ParkGate {

// ===================================================================================
// MODBUS CONSTANTS
// ===================================================================================

    static constexpr size_t MAX_PDU_SIZE = 253;         // FC + data
    static constexpr size_t MAX_ADU_SIZE = 260;         // MBAP (7) + PDU, larger than any RTU frame
    static constexpr uint16_t MAX_COILS_READ = 2000;
    static constexpr uint16_t COIL_ON = 0xFF00;
    static constexpr uint16_t COIL_OFF = 0x0000;
    static constexpr uint8_t EXCEPTION_FLAG = 0x80;
    static constexpr uint8_t DEFAULT_UNIT_ID = 1;
    static constexpr size_t MAX_CHANNELS = (size_t)PARKGATE_MAX_CHANNELS;

// ===================================================================================
// FUNCTION CODES
// ===================================================================================

    /* @brief Function codes understood by the codec
     * @note Only READ_COILS and WRITE_COIL are ever sent. The other two are known
     *       so that RTU response lengths can be computed for them.
     */
    enum FunctionCode {
        NULL_FC = 0x00,
        READ_COILS = 0x01,
        READ_DISCRETE_INPUTS = 0x02,
        WRITE_COIL = 0x05,
        WRITE_REGISTER = 0x06
    };
    static constexpr const char* toString(FunctionCode fc) {
        switch (fc) {
            case NULL_FC: return "null function code";
            case READ_COILS: return "read coils";
            case READ_DISCRETE_INPUTS: return "read discrete inputs";
            case WRITE_COIL: return "write single coil";
            case WRITE_REGISTER: return "write single register";
            default: return "invalid function code";
        }
    }
    static constexpr bool isRequestable(const FunctionCode fc) {
        return fc == READ_COILS || fc == WRITE_COIL;
    }

// ===================================================================================
// EXCEPTION CODES
// ===================================================================================

    enum ExceptionCode {
        NULL_EXCEPTION = 0x00,
        ILLEGAL_FUNCTION = 0x01,
        ILLEGAL_DATA_ADDRESS = 0x02,
        ILLEGAL_DATA_VALUE = 0x03,
        SLAVE_DEVICE_FAILURE = 0x04,
        ACKNOWLEDGE = 0x05,
        SLAVE_DEVICE_BUSY = 0x06,
        NEGATIVE_ACKNOWLEDGE = 0x07,
        MEMORY_PARITY_ERROR = 0x08
    };
    static constexpr const char* toString(ExceptionCode ec) {
        switch (ec) {
            case NULL_EXCEPTION: return "no exception";
            case ILLEGAL_FUNCTION: return "illegal function";
            case ILLEGAL_DATA_ADDRESS: return "illegal data address";
            case ILLEGAL_DATA_VALUE: return "illegal data value";
            case SLAVE_DEVICE_FAILURE: return "slave device failure";
            case ACKNOWLEDGE: return "acknowledge";
            case SLAVE_DEVICE_BUSY: return "slave device busy";
            case NEGATIVE_ACKNOWLEDGE: return "negative acknowledge";
            case MEMORY_PARITY_ERROR: return "memory parity error";
            default: return "unknown exception";
        }
    }

// ===================================================================================
// WIRE DIALECTS
// ===================================================================================

    /* @brief Framing a relay board accepts on its TCP port
     * @note UNDETECTED until a probe succeeds, and again after any failed exchange
     */
    enum Dialect {
        UNDETECTED = 0,
        DIALECT_TCP,
        DIALECT_RTU
    };
    static constexpr const char* toString(const Dialect dialect) {
        switch (dialect) {
            case UNDETECTED: return "undetected";
            case DIALECT_TCP: return "tcp";
            case DIALECT_RTU: return "rtu";
            default: return "invalid dialect";
        }
    }

} // namespace ParkGate
