#pragma once

#include <flowsim/core/types.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace flowsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the flowsim libraries derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, running a Clock that has been terminated, or calling
/// Clock::run() from inside an executing event.
///
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example, requesting a device by an id that the simulation never
/// handed out.
///
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an event is scheduled before the current time, or
///        a state schedule is malformed.
/// @ingroup core
class InvalidScheduleError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a resource operation breaks pool accounting.
///
/// Covers a pool capacity driven below zero and negative request amounts.
/// The more specific OverReleaseError and UnknownResourceError derive
/// from it.
///
/// @ingroup core
class CapacityViolationError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when releasing more of a resource than a reservation holds.
/// @ingroup core
class OverReleaseError : public CapacityViolationError {
public:
    using CapacityViolationError::CapacityViolationError;
};

/// @brief Thrown when releasing a resource a reservation never held.
/// @ingroup core
class UnknownResourceError : public CapacityViolationError {
public:
    using CapacityViolationError::CapacityViolationError;
};

/// @brief Thrown when a device graph edit would produce an invalid topology.
///
/// Self-loops, a Sink with downstream devices, a Source with upstream
/// devices and edges crossing group boundaries all raise this.
///
/// @ingroup core
class TopologyError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a device reaches a state that must never happen.
///
/// These are invariant violations (finishing a cycle on a failed device,
/// initializing a device twice). They abort the current run.
///
/// @ingroup core
class StateViolationError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Raised by Clock::step() when an event action throws.
///
/// The original exception is attached with `std::throw_with_nested` and
/// can be recovered with `std::rethrow_if_nested`.
///
/// @ingroup core
class EventFailure : public SimulationError {
public:
    EventFailure(TimePoint time, ActorId actor, int priority, std::string label)
        : SimulationError("event '" + label + "' of actor " + std::to_string(actor) +
                          " failed at t=" + std::to_string(time_to_units(time)))
        , time_(time)
        , actor_(actor)
        , priority_(priority)
        , label_(std::move(label)) {}

    /// @brief Simulation time at which the event executed.
    [[nodiscard]] TimePoint time() const noexcept { return time_; }

    /// @brief Actor that owned the failing event.
    [[nodiscard]] ActorId actor() const noexcept { return actor_; }

    [[nodiscard]] int priority() const noexcept { return priority_; }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    TimePoint time_;
    ActorId actor_;
    int priority_;
    std::string label_;
};

/// @brief Message of @p error followed by those of its nested causes,
///        outermost first, joined by ": ".
/// @ingroup core
[[nodiscard]] std::string describe_exception_chain(const std::exception& error);

} // namespace flowsim::core
