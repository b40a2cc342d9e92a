#pragma once

/// @defgroup core Core Library
/// @brief Simulation clock, events, resources and types.
///
/// The core library provides the foundational simulation infrastructure:
/// the event-driven Clock, strong time types, the resource manager and the
/// trace writer interface. It knows nothing about devices or parts.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for simulation time.

/// @defgroup core_clock Clock
/// @ingroup core
/// @brief Event queue, simulation loop, cancellation and pause/resume.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event keys and priorities.

/// @defgroup core_resources Resources
/// @ingroup core
/// @brief Resource pools and reservations.

#include <flowsim/core/types.hpp>
#include <flowsim/core/error.hpp>
#include <flowsim/core/event.hpp>
#include <flowsim/core/trace_writer.hpp>
#include <flowsim/core/clock.hpp>
#include <flowsim/core/resource_manager.hpp>
