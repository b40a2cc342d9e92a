#pragma once

/// @file line_loader.hpp
/// @brief Build a production line from a JSON description.
/// @ingroup io_loaders

#include <flowsim/core/types.hpp>
#include <flowsim/plant/ids.hpp>
#include <flowsim/plant/maintainer.hpp>
#include <flowsim/plant/simulation.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace flowsim::io {

/// @brief Draws one duration per call.
/// @ingroup io_loaders
using DurationSampler = std::function<core::Duration()>;

/// @brief A simulation built by the loader, with name lookups.
///
/// The random engine behind every sampled timing lives here so that the
/// samplers installed on devices stay valid as long as the line does.
///
/// @ingroup io_loaders
struct LoadedLine {
    std::unique_ptr<plant::Simulation> simulation;
    std::map<std::string, plant::DeviceId, std::less<>> devices;
    std::map<std::string, plant::Maintainer*, std::less<>> maintainers;
    std::map<std::string, plant::ActionScheduler*, std::less<>> schedules;
    std::shared_ptr<std::mt19937_64> rng;

    /// @throws LoaderError if no device has that name.
    [[nodiscard]] plant::Device& device(std::string_view name) const;
};

/// @brief Load a line description from a JSON file.
///
/// Schema:
/// @code{.json}
/// {
///   "seed": 7,
///   "downstream_priority": "longest_waiting",
///   "resources": {"operator": 2},
///   "maintainers": [{"name": "crew", "capacity": 1}],
///   "devices": [
///     {"type": "source", "name": "src", "cycle_time": 1,
///      "part": {"name": "blank", "value": 2.0}, "max_parts": 100},
///     {"type": "machine", "name": "lathe", "upstream": ["src"],
///      "cycle_time": {"uniform": [1, 2]}, "resources": {"operator": 1},
///      "failure": {"time_to_failure": {"exponential": 50},
///                  "time_to_repair": 5, "maintainer": "crew",
///                  "capacity": 1, "cost": 10}},
///     {"type": "buffer", "name": "queue", "upstream": ["lathe"],
///      "capacity": 5, "minimum_delay": 0.5},
///     {"type": "gate", "name": "good", "upstream": ["queue"], "min_quality": 0.5},
///     {"type": "sink", "name": "out", "upstream": ["good"]}
///   ],
///   "schedules": [
///     {"name": "shifts", "steps": [[8, true], [16, false]], "devices": ["lathe"]},
///     {"name": "crew", "steps": [[8, 2], [16, 0]], "resource": "operator"}
///   ]
/// }
/// @endcode
///
/// Device types: `source`, `handler`, `machine`, `buffer`,
/// `flow_controller`, `gate`, `sink`. Timings are a non-negative number,
/// `{"uniform": [a, b]}` or `{"exponential": mean}`. Upstream names may
/// refer to devices declared later. A schedule's steps are
/// `[duration, state]` pairs; listed devices accept parts only while the
/// state is non-zero, and a named resource pool takes the state as its
/// capacity. Schedules are cyclical unless `"cyclical": false`.
///
/// @param seed Overrides the file's `seed` (default 0). Seeds both the
///             clock's tie-breaks and the timing samplers.
/// @throws LoaderError on unreadable files, malformed JSON, invalid values
///         or an invalid topology.
[[nodiscard]] LoadedLine load_line(const std::filesystem::path& path,
                                   std::optional<uint64_t> seed = std::nullopt);

/// @brief Same as load_line() with the JSON text given directly.
[[nodiscard]] LoadedLine load_line_from_string(std::string_view json,
                                               std::optional<uint64_t> seed = std::nullopt);

} // namespace flowsim::io
