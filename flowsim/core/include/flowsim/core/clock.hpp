#pragma once

#include <flowsim/core/event.hpp>
#include <flowsim/core/trace_writer.hpp>
#include <flowsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace flowsim::core {

/// @brief Discrete-event simulation clock and event queue.
///
/// The Clock owns the event queue and the current simulation time. It
/// advances time by executing events in `EventKey` order: time, then
/// priority, then a random tie-break drawn at scheduling time, then the
/// owning actor. The tie-break source is a per-Clock Mersenne Twister
/// seeded at construction, so a fixed seed gives a fixed execution order.
///
/// Events belong to an actor. All events of one actor can be cancelled,
/// paused (their remaining delay is preserved) and resumed together.
///
/// The Clock is non-copyable and non-movable. A typical usage pattern is:
///
/// @code
/// core::Clock clock{42};
/// auto actor = clock.new_actor_id();
/// clock.schedule(core::time_from_units(5.0), actor, [] { ... });
/// clock.run(core::duration_from_units(100.0));
/// @endcode
///
/// @see EventKey, EventPriority, TraceWriter
/// @ingroup core_clock
class Clock {
public:
    /// @brief Actor id owned by the Clock itself (terminate markers).
    static constexpr ActorId kClockActor = 0;

    /// @brief Construct a clock at time zero.
    /// @param seed Seed of the tie-break generator.
    explicit Clock(uint64_t seed = 0);
    ~Clock();

    Clock(const Clock&) = delete;
    Clock& operator=(const Clock&) = delete;
    Clock(Clock&&) = delete;
    Clock& operator=(Clock&&) = delete;

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint now() const noexcept { return current_time_; }

    /// @brief Hand out a fresh actor id (never 0).
    [[nodiscard]] ActorId new_actor_id() noexcept { return next_actor_id_++; }

    /// @brief Insert an event into the queue.
    /// @param when Absolute time to fire (must be >= now()).
    /// @param actor Owning actor, used by the *_matching operations.
    /// @param action Invoked when the event fires.
    /// @param priority Lower values fire first within the same time.
    /// @param label Tag reported in traces and failures.
    /// @throws InvalidScheduleError if @p when is before now() or not a number.
    void schedule(TimePoint when, ActorId actor, std::function<void()> action,
                  int priority = EventPriority::OTHER_LOW_PRIORITY, std::string label = {});

    /// @brief Execute the next non-cancelled event.
    ///
    /// Cancelled events at the head of the queue are dropped without
    /// advancing time.
    ///
    /// @return False when the queue held nothing to execute.
    /// @throws EventFailure (with the original exception nested) if the
    ///         action throws. The Clock is terminated afterwards.
    bool step();

    /// @brief Run the simulation for @p duration time units.
    ///
    /// A terminate marker is scheduled at `now() + duration` with the lowest
    /// possible ordering, so every other event at that time runs first.
    /// Returns when the marker fires, when the queue empties or when
    /// terminate() is called. May be called repeatedly to continue.
    ///
    /// @throws InvalidStateError if the Clock is terminated or already running.
    /// @throws InvalidScheduleError if @p duration is negative.
    void run(Duration duration);

    /// @brief Stop the current run after the executing event and refuse
    ///        any further run() call.
    void terminate() noexcept;

    /// @brief Returns true once terminate() was called or an event failed.
    [[nodiscard]] bool is_terminated() const noexcept { return terminated_; }

    /// @brief Returns true while run() is executing.
    [[nodiscard]] bool is_running() const noexcept { return running_; }

    /// @brief Cancel every queued and paused event of @p actor.
    void cancel_matching(ActorId actor);

    /// @brief Park every queued event of @p actor, remembering the pause time.
    void pause_matching(ActorId actor);

    /// @brief Re-queue the paused events of @p actor, delayed by the time
    ///        they spent paused.
    void resume_matching(ActorId actor);

    /// @brief Number of events in the queue, cancelled ones included.
    [[nodiscard]] std::size_t pending_events() const noexcept { return event_queue_.size(); }

    /// @brief Number of parked events.
    [[nodiscard]] std::size_t paused_events() const noexcept { return paused_.size(); }

    /// @brief Replace the tie-break source.
    ///
    /// Values only need to be comparable; the default draws uniformly
    /// from [0, 1).
    void set_tie_breaker(std::function<double()> tie_breaker);

    /// @brief Set the trace writer. The Clock does not own it.
    /// @param writer Pointer to a TraceWriter, or nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Record an `event_executed` datapoint for every executed event.
    void enable_event_tracing(bool enabled) noexcept { trace_events_ = enabled; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

private:
    struct PausedEvent {
        EventKey key;
        Event event;
        TimePoint paused_at;
    };

    void execute(const EventKey& key, Event& event);
    double draw_tie_break();

    TimePoint current_time_{};
    uint64_t sequence_{0};
    ActorId next_actor_id_{kClockActor + 1};
    bool running_{false};
    bool stop_requested_{false};
    bool terminated_{false};
    bool trace_events_{false};

    std::map<EventKey, Event> event_queue_;
    std::vector<PausedEvent> paused_;
    std::mt19937_64 rng_;
    std::function<double()> tie_breaker_;
    TraceWriter* trace_writer_{nullptr};
};

template<typename F>
void Clock::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace flowsim::core
