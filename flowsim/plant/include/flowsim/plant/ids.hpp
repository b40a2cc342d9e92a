#pragma once

#include <cstddef>

namespace flowsim::plant {

/// @brief Stable index of a device in its Simulation.
/// @ingroup plant_graph
using DeviceId = std::size_t;

/// @brief Stable index of a routing group in its Simulation.
/// @ingroup plant_graph
using GroupId = std::size_t;

} // namespace flowsim::plant
