#pragma once
/**
 * @file hornet.h
 * @brief Main include file for HornetArena
 *
 * HornetArena - Multi-Agent Drone Combat Simulation Engine
 *
 * Include this single header to access all public HornetArena APIs.
 */

#include "hornet/core/types.h"
#include "hornet/core/constants.h"
#include "hornet/core/random.h"
#include "hornet/core/logging.h"

#include "hornet/physics/drone.h"
#include "hornet/physics/munitions.h"

#include "hornet/sim/world_state.h"
#include "hornet/sim/tick_phases.h"
#include "hornet/sim/observation_encoder.h"

#include "hornet/ml/combat_environment.h"

#include "hornet/interface/config.h"

/**
 * @namespace hornet
 * @brief Root namespace for all HornetArena components
 */
namespace hornet {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace hornet
