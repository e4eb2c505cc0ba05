#include <unity.h>
#include <initializer_list>
#include <vector>

#include "core/ParkGateCodec.hpp"

using namespace ParkGateCodec;
using ParkGate::ExceptionCode;

// ===================================================================================
// HELPERS
// ===================================================================================

template<size_t N>
static void assertBytes(const ByteArray<N>& arr, std::initializer_list<uint8_t> expected) {
    TEST_ASSERT_EQUAL_UINT32(expected.size(), arr->size());
    size_t i = 0;
    for (uint8_t b : expected) {
        TEST_ASSERT_EQUAL_HEX8_MESSAGE(b, (*arr)[i], "byte mismatch");
        i++;
    }
}

// Reference frames (CRC computed offline)
static const uint8_t RTU_READ_REQ[]      = { 0x01, 0x01, 0x00, 0x00, 0x00, 0x08, 0x3D, 0xCC };
static const uint8_t RTU_WRITE_ON[]      = { 0x01, 0x05, 0x00, 0x00, 0xFF, 0x00, 0x8C, 0x3A };
static const uint8_t RTU_READ_8_RESP[]   = { 0x01, 0x01, 0x01, 0x05, 0x91, 0x8B };
static const uint8_t RTU_READ_9_RESP[]   = { 0x01, 0x01, 0x02, 0x05, 0x01, 0x7B, 0x6C };
static const uint8_t RTU_EXCEPTION[]     = { 0x01, 0x81, 0x02, 0xC1, 0x91 };
static const uint8_t TCP_READ_8_RESP[]   = { 0x01, 0x02, 0x00, 0x00, 0x00, 0x04, 0x01, 0x01, 0x01, 0x05 };

static ByteBuffer view(const uint8_t* bytes, size_t size) { return ByteBuffer(bytes, size); }

// ===================================================================================
// CRC
// ===================================================================================

void test_crc_known_vectors() {
    TEST_ASSERT_EQUAL_HEX16(0xCC3D, RTU::calculateCRC(view(RTU_READ_REQ, 6)));
    TEST_ASSERT_EQUAL_HEX16(0x3A8C, RTU::calculateCRC(view(RTU_WRITE_ON, 6)));
    TEST_ASSERT_TRUE(RTU::validateCRC(view(RTU_READ_REQ, sizeof(RTU_READ_REQ))));
    TEST_ASSERT_TRUE(RTU::validateCRC(view(RTU_EXCEPTION, sizeof(RTU_EXCEPTION))));
    TEST_ASSERT_FALSE(RTU::validateCRC(view(RTU_READ_REQ, 2)));
}

void test_crc_detects_single_bit_flip() {
    for (size_t byte = 0; byte < sizeof(RTU_WRITE_ON); byte++) {
        for (int bit = 0; bit < 8; bit++) {
            uint8_t frame[sizeof(RTU_WRITE_ON)];
            memcpy(frame, RTU_WRITE_ON, sizeof(frame));
            frame[byte] ^= (uint8_t)(1 << bit);
            TEST_ASSERT_FALSE_MESSAGE(RTU::validateCRC(view(frame, sizeof(frame))), "bit flip undetected");
        }
    }
}

// ===================================================================================
// REQUEST BUILDERS
// ===================================================================================

void test_rtu_build_read_coils() {
    ByteArray<PDU::READ_REQUEST_SIZE> payload;
    ByteArray<ParkGate::MAX_ADU_SIZE> frame;
    TEST_ASSERT_EQUAL(SUCCESS, PDU::readCoilsRequest(0, 8, *payload));
    TEST_ASSERT_EQUAL(SUCCESS, RTU::buildFrame(1, ParkGate::READ_COILS, *payload, *frame));
    assertBytes(frame, { 0x01, 0x01, 0x00, 0x00, 0x00, 0x08, 0x3D, 0xCC });
}

void test_rtu_build_write_coil() {
    ByteArray<PDU::WRITE_REQUEST_SIZE> payload;
    ByteArray<ParkGate::MAX_ADU_SIZE> frame;
    TEST_ASSERT_EQUAL(SUCCESS, PDU::writeCoilRequest(0, true, *payload));
    TEST_ASSERT_EQUAL(SUCCESS, RTU::buildFrame(1, ParkGate::WRITE_COIL, *payload, *frame));
    assertBytes(frame, { 0x01, 0x05, 0x00, 0x00, 0xFF, 0x00, 0x8C, 0x3A });

    TEST_ASSERT_EQUAL(SUCCESS, PDU::writeCoilRequest(3, false, *payload));
    TEST_ASSERT_EQUAL(SUCCESS, RTU::buildFrame(1, ParkGate::WRITE_COIL, *payload, *frame));
    assertBytes(frame, { 0x01, 0x05, 0x00, 0x03, 0x00, 0x00, 0x3D, 0xCA });
}

void test_tcp_build_read_coils() {
    ByteArray<PDU::READ_REQUEST_SIZE> payload;
    ByteArray<ParkGate::MAX_ADU_SIZE> frame;
    TEST_ASSERT_EQUAL(SUCCESS, PDU::readCoilsRequest(0, 8, *payload));
    TEST_ASSERT_EQUAL(SUCCESS, TCP::buildFrame(0x1234, 1, ParkGate::READ_COILS, *payload, *frame));
    // length = unit id + FC + 4 bytes of payload
    assertBytes(frame, { 0x12, 0x34, 0x00, 0x00, 0x00, 0x06, 0x01, 0x01, 0x00, 0x00, 0x00, 0x08 });
}

void test_read_request_quantity_bounds() {
    ByteArray<PDU::READ_REQUEST_SIZE> payload;
    TEST_ASSERT_EQUAL(ERR_INVALID_REG_COUNT, PDU::readCoilsRequest(0, 0, *payload));
    TEST_ASSERT_EQUAL(ERR_INVALID_REG_COUNT, PDU::readCoilsRequest(0, 2001, *payload));
    TEST_ASSERT_EQUAL(SUCCESS, PDU::readCoilsRequest(0, 2000, *payload));
}

// ===================================================================================
// RESPONSE PARSING
// ===================================================================================

void test_rtu_parse_read_8_coils() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    size_t frameSize = 0;
    TEST_ASSERT_EQUAL(SUCCESS, RTU::parseResponse(view(RTU_READ_8_RESP, sizeof(RTU_READ_8_RESP)),
                                                  *pdu, nullptr, &frameSize));
    TEST_ASSERT_EQUAL_UINT32(sizeof(RTU_READ_8_RESP), frameSize);
    assertBytes(pdu, { 0x01, 0x01, 0x05 });

    std::vector<bool> coils;
    TEST_ASSERT_EQUAL(SUCCESS, PDU::unpackCoils(*pdu, 8, coils));
    TEST_ASSERT_EQUAL_UINT32(8, coils.size());
    TEST_ASSERT_TRUE(coils[0]);
    TEST_ASSERT_FALSE(coils[1]);
    TEST_ASSERT_TRUE(coils[2]);
    for (size_t i = 3; i < 8; i++) TEST_ASSERT_FALSE(coils[i]);
}

void test_rtu_parse_read_9_coils() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    TEST_ASSERT_EQUAL(SUCCESS, RTU::parseResponse(view(RTU_READ_9_RESP, sizeof(RTU_READ_9_RESP)), *pdu));

    std::vector<bool> coils;
    TEST_ASSERT_EQUAL(SUCCESS, PDU::unpackCoils(*pdu, 9, coils));
    TEST_ASSERT_TRUE(coils[0]);
    TEST_ASSERT_TRUE(coils[2]);
    TEST_ASSERT_TRUE(coils[8]);
    TEST_ASSERT_FALSE(coils[7]);

    // Byte count must match the requested quantity
    TEST_ASSERT_EQUAL(ERR_INVALID_BYTE_COUNT, PDU::unpackCoils(*pdu, 8, coils));
    TEST_ASSERT_EQUAL(ERR_INVALID_BYTE_COUNT, PDU::unpackCoils(*pdu, 17, coils));
}

void test_rtu_parse_write_echo() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    TEST_ASSERT_EQUAL(SUCCESS, RTU::parseResponse(view(RTU_WRITE_ON, sizeof(RTU_WRITE_ON)), *pdu));
    TEST_ASSERT_EQUAL(SUCCESS, PDU::checkWriteEcho(*pdu, 0, true));
    TEST_ASSERT_EQUAL(ERR_INVALID_ECHO, PDU::checkWriteEcho(*pdu, 0, false));
    TEST_ASSERT_EQUAL(ERR_INVALID_ECHO, PDU::checkWriteEcho(*pdu, 1, true));
}

void test_rtu_exception_decoded() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    ExceptionCode ec = ParkGate::NULL_EXCEPTION;
    size_t frameSize = 0;
    TEST_ASSERT_EQUAL(ERR_EXCEPTION, RTU::parseResponse(view(RTU_EXCEPTION, sizeof(RTU_EXCEPTION)),
                                                        *pdu, &ec, &frameSize));
    TEST_ASSERT_EQUAL(ParkGate::ILLEGAL_DATA_ADDRESS, ec);
    TEST_ASSERT_EQUAL_UINT32(5, frameSize);

    // Same frame with a broken checksum is a checksum error, not an exception
    const uint8_t broken[] = { 0x01, 0x81, 0x02, 0xC1, 0x90 };
    TEST_ASSERT_EQUAL(ERR_INVALID_CRC, RTU::parseResponse(view(broken, sizeof(broken)), *pdu, &ec));
}

void test_rtu_checksum_error() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    const uint8_t bad[] = { 0x01, 0x01, 0x01, 0x05, 0x91, 0x8C };
    TEST_ASSERT_EQUAL(ERR_INVALID_CRC, RTU::parseResponse(view(bad, sizeof(bad)), *pdu));
}

void test_rtu_unknown_function_code() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    const uint8_t frame[] = { 0x01, 0x03, 0x02, 0x00, 0x00, 0x00, 0x00 };
    TEST_ASSERT_EQUAL(ERR_INVALID_FC, RTU::parseResponse(view(frame, sizeof(frame)), *pdu));
}

void test_tcp_parse_read_coils() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    uint16_t tid = 0;
    size_t frameSize = 0;
    TEST_ASSERT_EQUAL(SUCCESS, TCP::parseResponse(view(TCP_READ_8_RESP, sizeof(TCP_READ_8_RESP)),
                                                  *pdu, &tid, nullptr, &frameSize));
    TEST_ASSERT_EQUAL_HEX16(0x0102, tid);
    TEST_ASSERT_EQUAL_UINT32(sizeof(TCP_READ_8_RESP), frameSize);
    assertBytes(pdu, { 0x01, 0x01, 0x05 });
}

void test_tcp_trailing_bytes_not_consumed() {
    ByteArray<ParkGate::MAX_ADU_SIZE> rx;
    rx->push_back(TCP_READ_8_RESP, sizeof(TCP_READ_8_RESP));
    rx->push_back(0xAA);

    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    size_t frameSize = 0;
    TEST_ASSERT_EQUAL(SUCCESS, TCP::parseResponse(*rx, *pdu, nullptr, nullptr, &frameSize));
    TEST_ASSERT_EQUAL_UINT32(sizeof(TCP_READ_8_RESP), frameSize);
    TEST_ASSERT_LESS_THAN_UINT32(rx->size(), frameSize);
}

void test_tcp_exception_decoded() {
    const uint8_t frame[] = { 0x00, 0x07, 0x00, 0x00, 0x00, 0x03, 0x01, 0x85, 0x04 };
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    ExceptionCode ec = ParkGate::NULL_EXCEPTION;
    uint16_t tid = 0;
    TEST_ASSERT_EQUAL(ERR_EXCEPTION, TCP::parseResponse(view(frame, sizeof(frame)), *pdu, &tid, &ec));
    TEST_ASSERT_EQUAL(ParkGate::SLAVE_DEVICE_FAILURE, ec);
    TEST_ASSERT_EQUAL_HEX16(0x0007, tid);
}

void test_tcp_mbap_validation() {
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;

    const uint8_t badProto[] = { 0x00, 0x01, 0x00, 0x01, 0x00, 0x04, 0x01, 0x01, 0x01, 0x05 };
    TEST_ASSERT_EQUAL(ERR_INVALID_MBAP_PROTOCOL_ID, TCP::parseResponse(view(badProto, sizeof(badProto)), *pdu));

    const uint8_t badLen[] = { 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01, 0x01, 0x05 };
    TEST_ASSERT_EQUAL(ERR_INVALID_MBAP_LEN, TCP::parseResponse(view(badLen, sizeof(badLen)), *pdu));

    const uint8_t hugeLen[] = { 0x00, 0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x01, 0x01, 0x05 };
    TEST_ASSERT_EQUAL(ERR_INVALID_MBAP_LEN, TCP::parseResponse(view(hugeLen, sizeof(hugeLen)), *pdu));
}

// ===================================================================================
// INCREMENTAL REASSEMBLY
// ===================================================================================

// Every prefix must report INCOMPLETE, and the full frame must decode to the same PDU
static void checkEverySplit(ParkGate::Dialect dialect, const uint8_t* frame, size_t size, size_t pduSize) {
    for (size_t split = 1; split < size; split++) {
        ByteArray<ParkGate::MAX_ADU_SIZE> rx;
        ByteArray<ParkGate::MAX_PDU_SIZE> pdu;

        rx->push_back(frame, split);
        Result res = dialect == ParkGate::DIALECT_TCP
                   ? TCP::parseResponse(*rx, *pdu)
                   : RTU::parseResponse(*rx, *pdu);
        TEST_ASSERT_EQUAL_MESSAGE(INCOMPLETE, res, "prefix should be incomplete");

        rx->push_back(frame + split, size - split);
        res = dialect == ParkGate::DIALECT_TCP
            ? TCP::parseResponse(*rx, *pdu)
            : RTU::parseResponse(*rx, *pdu);
        TEST_ASSERT_EQUAL_MESSAGE(SUCCESS, res, "reassembled frame should decode");
        TEST_ASSERT_EQUAL_UINT32(pduSize, pdu->size());
    }
}

void test_tcp_reassembly_every_split() {
    checkEverySplit(ParkGate::DIALECT_TCP, TCP_READ_8_RESP, sizeof(TCP_READ_8_RESP), 3);
}

void test_rtu_reassembly_every_split() {
    checkEverySplit(ParkGate::DIALECT_RTU, RTU_READ_8_RESP, sizeof(RTU_READ_8_RESP), 3);
    checkEverySplit(ParkGate::DIALECT_RTU, RTU_READ_9_RESP, sizeof(RTU_READ_9_RESP), 4);
    checkEverySplit(ParkGate::DIALECT_RTU, RTU_WRITE_ON, sizeof(RTU_WRITE_ON), 5);
}

void test_pack_coils_layout() {
    ByteArray<ParkGate::MAX_PDU_SIZE> payload;
    std::vector<bool> coils(10, false);
    coils[0] = true;
    coils[7] = true;
    coils[9] = true;
    TEST_ASSERT_EQUAL(SUCCESS, PDU::packCoils(coils, *payload));
    assertBytes(payload, { 0x02, 0x81, 0x02 });
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_crc_known_vectors);
    RUN_TEST(test_crc_detects_single_bit_flip);
    RUN_TEST(test_rtu_build_read_coils);
    RUN_TEST(test_rtu_build_write_coil);
    RUN_TEST(test_tcp_build_read_coils);
    RUN_TEST(test_read_request_quantity_bounds);
    RUN_TEST(test_rtu_parse_read_8_coils);
    RUN_TEST(test_rtu_parse_read_9_coils);
    RUN_TEST(test_rtu_parse_write_echo);
    RUN_TEST(test_rtu_exception_decoded);
    RUN_TEST(test_rtu_checksum_error);
    RUN_TEST(test_rtu_unknown_function_code);
    RUN_TEST(test_tcp_parse_read_coils);
    RUN_TEST(test_tcp_trailing_bytes_not_consumed);
    RUN_TEST(test_tcp_exception_decoded);
    RUN_TEST(test_tcp_mbap_validation);
    RUN_TEST(test_tcp_reassembly_every_split);
    RUN_TEST(test_rtu_reassembly_every_split);
    RUN_TEST(test_pack_coils_layout);
    return UNITY_END();
}
