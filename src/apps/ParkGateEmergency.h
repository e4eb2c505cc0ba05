/**
 * @file ParkGateEmergency.h
 * @brief Global kill switch: every channel of every board to OFF
 */

#pragma once

#include "apps/ParkGateActuator.h"

namespace ParkGate {

/* @brief Best-effort sweep of all boards, bypassing barrier locks
 * @note A failed write doesn't stop the sweep. Pending auto-releases of every
 *       barrier are canceled, whatever the outcome on its board.
 */
class EmergencyOff {
public:
    struct Report {
        uint16_t boardsSwept = 0;       // Boards whose every channel was written OFF
        uint16_t boardsFailed = 0;
        uint16_t writesFailed = 0;
    };

    EmergencyOff(Registry& registry, CoilRegister& coils, BarrierActuator& actuator, AuditSink& audit)
        : _registry(registry), _coils(coils), _actuator(actuator), _audit(audit) {}

    /* @brief Sweep every board
     * @param source Origin of the request, copied to the audit event
     * @param report Output (optional): sweep summary
     */
    void run(const char* source, Report* report = nullptr);

private:
    uint16_t sweepBoard(Board& board);

    Registry& _registry;
    CoilRegister& _coils;
    BarrierActuator& _actuator;
    AuditSink& _audit;
};

} // namespace ParkGate
