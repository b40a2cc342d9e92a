#pragma once

/// @defgroup plant Plant Library
/// @brief Production network model on top of the core clock.
///
/// Devices exchange parts through a give/notify flow-control protocol.
/// The Simulation owns the clock, the resource manager and every device.

/// @defgroup plant_parts Parts
/// @ingroup plant
/// @brief Parts and their routing history.

/// @defgroup plant_graph Device Graph
/// @ingroup plant
/// @brief Device base class, wiring and the Simulation context.

/// @defgroup plant_devices Devices
/// @ingroup plant
/// @brief Sources, handlers, machines, buffers, sinks and gates.

/// @defgroup plant_groups Routing Groups
/// @ingroup plant
/// @brief Sub-graphs entered from several paths.

/// @defgroup plant_maintenance Maintenance
/// @ingroup plant
/// @brief Work-order scheduling.

/// @defgroup plant_schedules Schedules
/// @ingroup plant
/// @brief Timed state sequences acting on devices and resource pools.

#include <flowsim/plant/ids.hpp>
#include <flowsim/plant/part.hpp>
#include <flowsim/plant/asset.hpp>
#include <flowsim/plant/device.hpp>
#include <flowsim/plant/flow_controller.hpp>
#include <flowsim/plant/part_handler.hpp>
#include <flowsim/plant/maintainable.hpp>
#include <flowsim/plant/machine.hpp>
#include <flowsim/plant/buffer.hpp>
#include <flowsim/plant/source.hpp>
#include <flowsim/plant/sink.hpp>
#include <flowsim/plant/group.hpp>
#include <flowsim/plant/maintainer.hpp>
#include <flowsim/plant/action_scheduler.hpp>
#include <flowsim/plant/simulation.hpp>
