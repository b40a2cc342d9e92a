#pragma once

#include <flowsim/core/clock.hpp>
#include <flowsim/core/resource_manager.hpp>
#include <flowsim/core/types.hpp>
#include <flowsim/plant/asset.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowsim::plant {

class Device;

/// @brief One state of an ActionScheduler and how long it lasts.
/// @ingroup plant_schedules
struct ScheduleStep {
    core::Duration duration;
    double state;
};

/// @brief Time-based sequence of states that drives registered actions.
///
/// On initialize() the first step becomes current; every time a step's
/// duration elapses the next one does, and each registered action is
/// called with the new state in registration order. A cyclical schedule
/// wraps around after its last step; otherwise the last state persists.
/// A schedule with a single step never changes state.
///
/// Transitions are OTHER_HIGH_PRIORITY events on the scheduler's actor,
/// so they take effect before any device event of the same instant.
///
/// @code
/// auto& shifts = sim.add_action_scheduler(
///     "shifts", {{duration_from_units(8.0), 1.0}, {duration_from_units(16.0), 0.0}});
/// gate_input_on_state(shifts, lathe);
/// @endcode
///
/// @ingroup plant_schedules
class ActionScheduler : public Asset {
public:
    using Action = std::function<void(ActionScheduler& scheduler, double state)>;

    /// @throws core::InvalidScheduleError if @p steps is empty, a duration
    ///         is negative, or a cyclical schedule has no positive duration.
    ActionScheduler(core::Clock& clock, std::string name, std::vector<ScheduleStep> steps,
                    bool cyclical = true);

    /// @brief Run @p action on every state change, under the key @p target.
    ///
    /// When the scheduler is already running the action is not called for
    /// the current state; it is called from the next transition on.
    ///
    /// @return False if @p target is already registered.
    bool register_action(std::string target, Action action);

    /// @return False if @p target was not registered.
    bool unregister_action(std::string_view target);

    [[nodiscard]] bool is_registered(std::string_view target) const noexcept;

    /// @brief Enter the first step and apply it. Called by the Simulation.
    /// @throws core::InvalidStateError if called twice.
    void initialize();
    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

    [[nodiscard]] double current_state() const noexcept { return steps_[index_].state; }
    [[nodiscard]] std::size_t current_step() const noexcept { return index_; }
    [[nodiscard]] const std::vector<ScheduleStep>& steps() const noexcept { return steps_; }
    [[nodiscard]] bool is_cyclical() const noexcept { return cyclical_; }

private:
    void enter_step();
    void advance();

    std::vector<ScheduleStep> steps_;
    bool cyclical_;
    std::size_t index_{0};
    bool initialized_{false};
    std::vector<std::pair<std::string, Action>> actions_;
};

/// @brief Let @p device accept new parts only while the state is non-zero.
///
/// A part already inside the device is finished normally. Registered under
/// the device name.
///
/// @ingroup plant_schedules
bool gate_input_on_state(ActionScheduler& scheduler, Device& device);

/// @brief Set the capacity of the @p resource pool to the current state.
///
/// Capacity may drop below what is in use; nothing is taken back from
/// current holders. Registered under "resource:<name>".
///
/// @ingroup plant_schedules
bool drive_resource_capacity(ActionScheduler& scheduler, core::ResourceManager& resources,
                             std::string resource);

} // namespace flowsim::plant
