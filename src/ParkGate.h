/**
 * @file ParkGate.h
 * @brief Main include file for the ParkGate library
 */

#pragma once

// Core components
#include "core/ParkGateCore.h"
#include "core/ParkGateCodec.hpp"
#include "core/ParkGateModel.h"

// Drivers
#include "drivers/ParkGateHAL_TCP.h"

// Interfaces
#include "interfaces/ParkGateTransport.h"
#include "interfaces/ParkGateNegotiator.h"

// Application components
#include "apps/ParkGateRegistry.h"
#include "apps/ParkGateController.h"

// Logging
#include "utils/ParkGateLogger.hpp"
