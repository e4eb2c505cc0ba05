/**
 * @file main.cpp
 * @brief Example: two relay boards driving three car-park barriers
 */

#include "ParkGate.h"

#include <cstdlib>
#include <ctime>

// ===================================================================================
// PARKGATE ALIASES
// ===================================================================================

using TCP        = ParkGateHAL::TCP;
using Board      = ParkGate::Board;
using Barrier    = ParkGate::Barrier;
using Registry   = ParkGate::Registry;
using Controller = ParkGate::Controller;
using Logger     = ParkGate::Logger;


// ===================================================================================
// SITE CONFIGURATION
// ===================================================================================

#define RELAY_PORT      4196
#define RELAY_UNIT_ID   1
#define RELAY_CHANNELS  8

// Links (one TCP endpoint per relay board)
TCP linkA("10.10.10.64", RELAY_PORT);
TCP linkB("10.10.10.65", RELAY_PORT);

// Boards
Board boardA("krs-a", linkA, RELAY_UNIT_ID, RELAY_CHANNELS);
Board boardB("krs-b", linkB, RELAY_UNIT_ID, RELAY_CHANNELS);

// Barriers                 id  string id      name                   board   lift close stop
Barrier entry(              1, "krs-entry",  "Entry Barrier",       boardA,    0,    2,   1);
Barrier exitBarrier(        2, "krs-exit",   "Exit Barrier",        boardA,    3,    5,   4);
Barrier combo(              3, "krs-combo",  "Entry/Exit Barrier",  boardB,    4,    3,   5);

Board* boards[] = { &boardA, &boardB };
Barrier* barriers[] = { &entry, &exitBarrier, &combo };

Registry registry(boards, barriers);
Controller controller(registry);


// ===================================================================================
// CALLBACKS
// ===================================================================================

static void onAudit(const ParkGate::AuditEvent& event, void*) {
    Logger::logf("[audit] %ld %s by %s: %s", (long)event.timestamp, event.action,
                 event.source.c_str(), event.details.c_str());
}

static void onEdge(Board& board, bool reachable, void*) {
    Logger::logf("[monitor] %s is now %s", board.key, reachable ? "reachable" : "unreachable");
}

static void printStatus() {
    Controller::Status status;
    controller.getStatus(status);

    for (const auto& b : status.boards) {
        char channels[ParkGate::MAX_CHANNELS + 1];
        size_t n = 0;
        for (const auto& ch : b.channels) channels[n++] = ch.active ? '1' : '0';
        channels[n] = '\0';
        Logger::logf("board %s (%s:%u) %s, dialect %s, %u ms, channels %s",
                     b.key, b.host, b.port, b.connected ? "up" : "down",
                     ParkGate::toString(b.dialect), (unsigned)b.latencyMs, channels);
    }
    for (const auto& r : status.barriers) {
        Logger::logf("barrier %u %s [%s] %s%s, relays L%d C%d S%d, last: %s",
                     r.id, r.stringId, r.board, ParkGate::toString(r.state),
                     r.locked ? " (locked)" : "", (int)r.liftActive, (int)r.closeActive,
                     (int)r.stopActive, r.lastAction ? r.lastAction : "-");
    }
}


// ===================================================================================
// APP TASK
// ===================================================================================

static void appTask(void*) {
    controller.setAuditCallback(onAudit);
    controller.setEdgeCallback(onEdge);

    Controller::Result res = controller.begin();
    if (res != Controller::SUCCESS) {
        Logger::logf("[app] controller init failed: %s", Controller::toString(res));
        vTaskDelete(nullptr);
        return;
    }
    Logger::logln("[app] controller started");

    // Give the heartbeat one cycle to detect the boards
    vTaskDelay(pdMS_TO_TICKS(PARKGATE_HEARTBEAT_MS));
    printStatus();

    // Let a car in
    Controller::ActionResult out;
    res = controller.performAction("krs-entry", "lift", "cli", &out);
    if (res == Controller::SUCCESS) {
        Logger::logf("[app] %s: %s on channel %u", out.barrierName,
                     ParkGate::BarrierActuator::toString(out.action), out.channel);
    } else {
        Logger::logf("[app] lift failed: %s", Controller::toString(res));
    }

    vTaskDelay(pdMS_TO_TICKS(5000));

    res = controller.performAction("1", "close", "cli", &out);
    if (res != Controller::SUCCESS) Logger::logf("[app] close failed: %s", Controller::toString(res));

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(30000));
        printStatus();
    }
}


// ===================================================================================
// MAIN
// ===================================================================================

#ifdef ESP_PLATFORM
extern "C" void app_main(void) {
    xTaskCreate(appTask, "parkgateApp", 8192, nullptr, 5, nullptr);
}
#else
int main(void) {
    xTaskCreate(appTask, "parkgateApp", 8192, nullptr, 5, nullptr);
    vTaskStartScheduler();
    return EXIT_FAILURE; // Scheduler only returns if it couldn't start
}
#endif
