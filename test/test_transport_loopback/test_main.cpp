#include <unity.h>
#include <cstdlib>

#include "ParkGate.h"
#include "apps/ParkGateMonitor.h"
#include "../common/dummy_board.h"

using ParkGateHAL::Dummy;
using ParkGateInterface::Transport;
using ParkGateInterface::ModeNegotiator;
using ParkGate::Board;
using ParkGate::CoilRegister;
using ParkGate::BoardMonitor;

// ===================================================================================
// TEST FIXTURE
// ===================================================================================

static constexpr uint16_t CHANNELS = 8;

static Transport::Config transportConfig() {
    Transport::Config cfg;
    cfg.timeoutMs = 200;
    cfg.connectTimeoutMs = 100;
    cfg.retries = 1;
    return cfg;
}

Dummy link(Dummy::ACCEPT_TCP, CHANNELS);
Board board("test-board", link, 1, CHANNELS);
Board* boards[] = { &board };
ParkGate::Registry registry(boards, 1, nullptr, 0);

Transport transport(transportConfig());
ModeNegotiator negotiator(transport);
CoilRegister coils(transport, negotiator);
BoardMonitor monitor(registry, coils, negotiator);

static volatile int edgeCount = 0;
static volatile bool lastEdge = false;

static void onEdge(Board&, bool reachable, void*) {
    edgeCount++;
    lastEdge = reachable;
}

void setUp() {
    link.accepts = Dummy::ACCEPT_TCP;
    link.refuseConnect = false;
    link.corruptCrc = false;
    link.wrongTransactionId = false;
    link.trailingGarbage = false;
    link.exceptionCode = 0;
    link.chunkSize = 0;
    link.chunkDelayMs = 0;
    link.close();
    link.resetLog();
    for (uint16_t i = 0; i < CHANNELS; i++) link.setCoil(i, false);

    board.setDialect(ParkGate::UNDETECTED);
    board.setReachable(false);
    edgeCount = 0;
    lastEdge = false;
}

void tearDown() {}

// Raw ReadCoils(0, CHANNELS) through Transport::request()
static Transport::Result readAllRaw(std::vector<bool>& out, ParkGate::ExceptionCode* ec = nullptr) {
    ByteArray<ParkGateCodec::PDU::READ_REQUEST_SIZE> payload;
    ByteArray<ParkGate::MAX_PDU_SIZE> pdu;
    ParkGateCodec::PDU::readCoilsRequest(0, CHANNELS, *payload);
    Transport::Result res = transport.request(board, ParkGate::READ_COILS, *payload, *pdu, ec);
    if (res == Transport::SUCCESS) {
        TEST_ASSERT_EQUAL(ParkGateCodec::SUCCESS, ParkGateCodec::PDU::unpackCoils(*pdu, CHANNELS, out));
    }
    return res;
}

// ===================================================================================
// TRANSPORT
// ===================================================================================

void test_tcp_request_roundtrip() {
    link.setCoil(1, true);
    link.setCoil(6, true);
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_EQUAL_UINT32(CHANNELS, out.size());
    TEST_ASSERT_TRUE(out[1]);
    TEST_ASSERT_TRUE(out[6]);
    TEST_ASSERT_FALSE(out[0]);
    TEST_ASSERT_EQUAL(ParkGate::DIALECT_TCP, board.dialect());
    TEST_ASSERT_TRUE(link.isOpen());
}

void test_request_without_dialect_rejected() {
    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::ERR_NOT_DETECTED, readAllRaw(out));
    TEST_ASSERT_EQUAL_UINT32(0, link.requestCount());
}

void test_connection_reused_between_exchanges() {
    board.setDialect(ParkGate::DIALECT_TCP);
    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_EQUAL_UINT32(1, link.connectCount());
    TEST_ASSERT_EQUAL_UINT32(3, link.requestCount());
}

void test_send_uses_configured_timeout() {
    board.setDialect(ParkGate::DIALECT_TCP);
    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_EQUAL_UINT32(transport.getConfig().timeoutMs, link.lastSendTimeoutMs());
    TEST_ASSERT_NOT_EQUAL(PARKGATE_CONNECT_TIMEOUT_MS, link.lastSendTimeoutMs());
}

void test_split_delivery_tcp() {
    link.setCoil(3, true);
    link.chunkSize = 1;
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_TRUE(out[3]);
}

void test_split_delivery_rtu() {
    link.accepts = Dummy::ACCEPT_RTU;
    link.setCoil(7, true);
    link.chunkSize = 2;
    board.setDialect(ParkGate::DIALECT_RTU);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_TRUE(out[7]);
}

void test_timeout_invalidates_dialect() {
    link.accepts = Dummy::ACCEPT_NONE;
    board.setDialect(ParkGate::DIALECT_TCP);

    uint32_t start = TIME_MS();
    std::vector<bool> out;
    Transport::Result res = readAllRaw(out);
    uint32_t elapsed = TIME_MS() - start;

    TEST_ASSERT_EQUAL(Transport::ERR_TIMEOUT, res);
    TEST_ASSERT_TRUE(Transport::isTransportError(res));
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());
    TEST_ASSERT_FALSE(link.isOpen());
    // One retry: two frames sent, two deadlines waited
    TEST_ASSERT_EQUAL_UINT32(2, link.requestCount());
    TEST_ASSERT_GREATER_OR_EQUAL_UINT32(2 * transport.getConfig().timeoutMs, elapsed);
}

void test_connect_failure() {
    link.refuseConnect = true;
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::ERR_CONNECT, readAllRaw(out));
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());
    TEST_ASSERT_EQUAL_UINT32(0, link.requestCount());
}

void test_exception_is_protocol_error_not_retried() {
    link.exceptionCode = ParkGate::SLAVE_DEVICE_FAILURE;
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    ParkGate::ExceptionCode ec = ParkGate::NULL_EXCEPTION;
    Transport::Result res = readAllRaw(out, &ec);
    TEST_ASSERT_EQUAL(Transport::ERR_EXCEPTION, res);
    TEST_ASSERT_TRUE(Transport::isProtocolError(res));
    TEST_ASSERT_EQUAL(ParkGate::SLAVE_DEVICE_FAILURE, ec);
    TEST_ASSERT_EQUAL_UINT32(1, link.requestCount());
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());
}

void test_rtu_checksum_error() {
    link.accepts = Dummy::ACCEPT_RTU;
    link.corruptCrc = true;
    board.setDialect(ParkGate::DIALECT_RTU);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::ERR_INVALID_CRC, readAllRaw(out));
    TEST_ASSERT_FALSE(link.isOpen());
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());
}

void test_transaction_id_mismatch() {
    link.wrongTransactionId = true;
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::ERR_INVALID_TRANSACTION_ID, readAllRaw(out));
    TEST_ASSERT_FALSE(link.isOpen());
}

void test_trailing_bytes_close_link() {
    link.trailingGarbage = true;
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_FALSE(link.isOpen());
}

void test_latency_recorded() {
    link.chunkDelayMs = 20;
    board.setDialect(ParkGate::DIALECT_TCP);

    std::vector<bool> out;
    TEST_ASSERT_EQUAL(Transport::SUCCESS, readAllRaw(out));
    TEST_ASSERT_GREATER_OR_EQUAL_UINT32(20, board.snapshot().latencyMs);
}

// ===================================================================================
// MODE NEGOTIATION
// ===================================================================================

void test_detect_tcp() {
    std::vector<bool> probed;
    link.setCoil(0, true);
    TEST_ASSERT_EQUAL(ModeNegotiator::SUCCESS, negotiator.detect(board, &probed));
    TEST_ASSERT_EQUAL(ParkGate::DIALECT_TCP, board.dialect());
    TEST_ASSERT_EQUAL_UINT32(0, link.rtuRequestCount());
    TEST_ASSERT_TRUE(probed[0]);
    TEST_ASSERT_TRUE(board.snapshot().coils[0]);
}

void test_detect_falls_back_to_rtu() {
    link.accepts = Dummy::ACCEPT_RTU;
    TEST_ASSERT_EQUAL(ModeNegotiator::SUCCESS, negotiator.detect(board));
    TEST_ASSERT_EQUAL(ParkGate::DIALECT_RTU, board.dialect());
    TEST_ASSERT_EQUAL_UINT32(1, link.tcpRequestCount());
    TEST_ASSERT_EQUAL_UINT32(1, link.rtuRequestCount());
}

void test_detect_unavailable() {
    link.accepts = Dummy::ACCEPT_NONE;
    TEST_ASSERT_EQUAL(ModeNegotiator::ERR_UNAVAILABLE, negotiator.detect(board));
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());
    TEST_ASSERT_EQUAL_UINT32(2, link.requestCount());
}

void test_detect_unreachable_tries_both_dialects() {
    link.refuseConnect = true;
    TEST_ASSERT_EQUAL(ModeNegotiator::ERR_UNAVAILABLE, negotiator.detect(board));
    TEST_ASSERT_EQUAL_UINT32(2, link.openAttemptCount());
    TEST_ASSERT_EQUAL_UINT32(0, link.requestCount());
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());
}

void test_dialect_rediscovered_after_failure() {
    TEST_ASSERT_EQUAL(ModeNegotiator::SUCCESS, negotiator.detect(board));
    TEST_ASSERT_EQUAL(ParkGate::DIALECT_TCP, board.dialect());

    // Board reconfigured behind our back
    link.accepts = Dummy::ACCEPT_RTU;
    std::vector<bool> out;
    TEST_ASSERT_EQUAL(CoilRegister::ERR_TRANSPORT, coils.readAll(board, out));
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());

    link.setCoil(5, true);
    TEST_ASSERT_EQUAL(CoilRegister::SUCCESS, coils.readAll(board, out));
    TEST_ASSERT_EQUAL(ParkGate::DIALECT_RTU, board.dialect());
    TEST_ASSERT_TRUE(out[5]);
}

// ===================================================================================
// COIL REGISTER
// ===================================================================================

void test_write_coil_negotiates_and_updates_snapshot() {
    TEST_ASSERT_EQUAL(CoilRegister::SUCCESS, coils.writeCoil(board, 2, true));
    TEST_ASSERT_EQUAL(ParkGate::DIALECT_TCP, board.dialect());
    TEST_ASSERT_TRUE(link.coil(2));
    TEST_ASSERT_TRUE(board.snapshot().coils[2]);

    TEST_ASSERT_EQUAL(CoilRegister::SUCCESS, coils.writeCoil(board, 2, false));
    TEST_ASSERT_FALSE(link.coil(2));
    TEST_ASSERT_FALSE(board.snapshot().coils[2]);
}

void test_write_coil_out_of_range() {
    TEST_ASSERT_EQUAL(CoilRegister::ERR_INVALID_ADDRESS, coils.writeCoil(board, CHANNELS, true));
    TEST_ASSERT_EQUAL_UINT32(0, link.requestCount());
}

void test_coil_ops_unavailable_board() {
    link.accepts = Dummy::ACCEPT_NONE;
    std::vector<bool> out;
    TEST_ASSERT_EQUAL(CoilRegister::ERR_UNAVAILABLE, coils.readAll(board, out));
}

// ===================================================================================
// BOARD MONITOR
// ===================================================================================

void test_monitor_reports_edges_only() {
    monitor.setEdgeCallback(onEdge);
    link.setCoil(4, true);

    TEST_ASSERT_EQUAL(BoardMonitor::SUCCESS, monitor.pollOnce(board));
    TEST_ASSERT_EQUAL_INT(1, edgeCount);
    TEST_ASSERT_TRUE(lastEdge);
    TEST_ASSERT_TRUE(board.snapshot().reachable);
    TEST_ASSERT_TRUE(board.snapshot().coils[4]);

    TEST_ASSERT_EQUAL(BoardMonitor::SUCCESS, monitor.pollOnce(board));
    TEST_ASSERT_EQUAL_INT(1, edgeCount);

    // Board goes silent with a known dialect: read fails, unreachable edge
    link.accepts = Dummy::ACCEPT_NONE;
    TEST_ASSERT_EQUAL(BoardMonitor::ERR_READ_FAILED, monitor.pollOnce(board));
    TEST_ASSERT_EQUAL_INT(2, edgeCount);
    TEST_ASSERT_FALSE(lastEdge);
    TEST_ASSERT_EQUAL(ParkGate::UNDETECTED, board.dialect());

    // Next cycle: negotiation fails, reachability untouched
    TEST_ASSERT_EQUAL(BoardMonitor::ERR_UNAVAILABLE, monitor.pollOnce(board));
    TEST_ASSERT_EQUAL_INT(2, edgeCount);
    TEST_ASSERT_FALSE(board.snapshot().reachable);

    monitor.setEdgeCallback(nullptr);
}

void test_monitor_skips_when_gate_held() {
    Lock guard(board.gate);
    TEST_ASSERT_TRUE(guard.isLocked());
    TEST_ASSERT_EQUAL(BoardMonitor::SKIPPED, monitor.pollOnce(board));
    TEST_ASSERT_EQUAL_UINT32(0, link.requestCount());
}

void test_monitor_task_polls_periodically() {
    // Uses its own monitor so the interval can be short
    BoardMonitor::Config cfg;
    cfg.intervalMs = 50;
    static BoardMonitor fastMonitor(registry, coils, negotiator, cfg);

    TEST_ASSERT_EQUAL(BoardMonitor::SUCCESS, fastMonitor.begin());
    vTaskDelay(pdMS_TO_TICKS(300));
    {
        Lock guard(board.gate);     // Wait for any in-flight cycle
        TEST_ASSERT_TRUE(board.snapshot().reachable);
        TEST_ASSERT_GREATER_OR_EQUAL_UINT32(3, link.requestCount());
    }
}

// ===================================================================================
// TEST RUNNER
// ===================================================================================

static void testTask(void*) {
    UNITY_BEGIN();
    RUN_TEST(test_tcp_request_roundtrip);
    RUN_TEST(test_request_without_dialect_rejected);
    RUN_TEST(test_connection_reused_between_exchanges);
    RUN_TEST(test_send_uses_configured_timeout);
    RUN_TEST(test_split_delivery_tcp);
    RUN_TEST(test_split_delivery_rtu);
    RUN_TEST(test_timeout_invalidates_dialect);
    RUN_TEST(test_connect_failure);
    RUN_TEST(test_exception_is_protocol_error_not_retried);
    RUN_TEST(test_rtu_checksum_error);
    RUN_TEST(test_transaction_id_mismatch);
    RUN_TEST(test_trailing_bytes_close_link);
    RUN_TEST(test_latency_recorded);
    RUN_TEST(test_detect_tcp);
    RUN_TEST(test_detect_falls_back_to_rtu);
    RUN_TEST(test_detect_unavailable);
    RUN_TEST(test_detect_unreachable_tries_both_dialects);
    RUN_TEST(test_dialect_rediscovered_after_failure);
    RUN_TEST(test_write_coil_negotiates_and_updates_snapshot);
    RUN_TEST(test_write_coil_out_of_range);
    RUN_TEST(test_coil_ops_unavailable_board);
    RUN_TEST(test_monitor_reports_edges_only);
    RUN_TEST(test_monitor_skips_when_gate_held);
    RUN_TEST(test_monitor_task_polls_periodically);
    int failures = UNITY_END();
    ParkGate::Logger::waitQueueFlushed();
    exit(failures);
}

int main(void) {
    xTaskCreate(testTask, "testTask", 16384, nullptr, tskIDLE_PRIORITY + 2, nullptr);
    vTaskStartScheduler();
    return EXIT_FAILURE;
}
