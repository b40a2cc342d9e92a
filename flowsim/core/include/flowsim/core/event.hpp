#pragma once

#include <flowsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace flowsim::core {

/// @brief Deterministic ordering key for events in the queue.
///
/// Events are ordered by simulation time, then by priority (lower values
/// fire first), then by a tie-break value drawn when the event was created,
/// then by the owning actor. The insertion sequence number comes last and
/// only keeps keys unique; it never overrides the four leading terms.
///
/// @see EventPriority, Clock::schedule
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: simulation time at which the event fires.
    int priority;        ///< Secondary: lower values fire first within a timestep.
    double tie_break;    ///< Tertiary: random draw made at scheduling time.
    ActorId actor;       ///< Quaternary: owning actor.
    uint64_t sequence;   ///< Uniqueness only.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief Named constants for event dispatch priority.
///
/// Lower numeric values fire first within the same simulation time.
/// Processing completions run before parts are passed downstream, so a
/// device that finishes and a neighbour that frees space at the same
/// instant hand parts over without losing a step. The terminate marker
/// of Clock::run() always sorts last.
///
/// @see EventKey, Clock::schedule
/// @ingroup core_events
struct EventPriority {
    static constexpr int OTHER_HIGH_PRIORITY = -500; ///< Housekeeping (resource re-checks).
    static constexpr int RESTORE             = -400; ///< Device restoration.
    static constexpr int FINISH_WORK         = -300; ///< Maintenance work finishes.
    static constexpr int START_WORK          = -200; ///< Maintenance work starts.
    static constexpr int FINISH_PROCESSING   = -100; ///< A device finishes a cycle.
    static constexpr int PASS_PART           = 0;    ///< A device passes a part downstream.
    static constexpr int RELEASE_RESOURCES   = 50;   ///< An idle machine releases resources.
    static constexpr int FAIL                = 100;  ///< Device failure.
    static constexpr int SENSOR              = 200;  ///< Sampling.
    static constexpr int OTHER_LOW_PRIORITY  = 300;  ///< Default catch-all.
    static constexpr int TERMINATE           = std::numeric_limits<int>::max(); ///< Run end marker.
};

/// @brief A scheduled action.
///
/// The Clock owns events by value inside its queue. A cancelled event stays
/// in the queue until it reaches the head, where it is dropped without
/// advancing time.
///
/// @see EventKey
/// @ingroup core_events
struct Event {
    std::function<void()> action; ///< Invoked when the event fires.
    std::string label;             ///< Human-readable tag for traces and diagnostics.
    bool cancelled{false};         ///< Set by Clock::cancel_matching().
};

} // namespace flowsim::core
