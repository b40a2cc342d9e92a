#include <flowsim/core/clock.hpp>
#include <flowsim/core/error.hpp>

#include <cmath>
#include <exception>
#include <iterator>
#include <limits>
#include <utility>

namespace flowsim::core {

Clock::Clock(uint64_t seed)
    : rng_(seed) {}

Clock::~Clock() = default;

void Clock::schedule(TimePoint when, ActorId actor, std::function<void()> action,
                     int priority, std::string label) {
    if (std::isnan(time_to_units(when))) {
        throw InvalidScheduleError("Cannot schedule event '" + label + "' at NaN time");
    }
    if (when < current_time_) {
        throw InvalidScheduleError("Cannot schedule event '" + label + "' in the past (t=" +
                                   std::to_string(time_to_units(when)) + " < now=" +
                                   std::to_string(time_to_units(current_time_)) + ")");
    }

    EventKey key{when, priority, draw_tie_break(), actor, sequence_++};
    event_queue_.emplace(key, Event{std::move(action), std::move(label), false});
}

bool Clock::step() {
    while (!event_queue_.empty()) {
        auto node = event_queue_.extract(event_queue_.begin());
        if (node.mapped().cancelled) {
            continue;
        }
        current_time_ = node.key().time;
        execute(node.key(), node.mapped());
        return true;
    }
    return false;
}

void Clock::run(Duration duration) {
    if (terminated_) {
        throw InvalidStateError("Cannot run a terminated clock");
    }
    if (running_) {
        throw InvalidStateError("Clock::run() called from inside a running event");
    }
    if (std::isnan(duration.units()) || duration < Duration::zero()) {
        throw InvalidScheduleError("Run duration must be a non-negative number");
    }

    // An unbounded run drains the queue instead of scheduling a marker at infinity.
    if (std::isfinite(duration.units())) {
        EventKey key{current_time_ + duration, EventPriority::TERMINATE,
                     std::numeric_limits<double>::infinity(), kClockActor, sequence_++};
        event_queue_.emplace(key, Event{[this]() { stop_requested_ = true; }, "terminate", false});
    }

    struct RunningGuard {
        bool& flag;
        explicit RunningGuard(bool& f) : flag(f) { flag = true; }
        ~RunningGuard() { flag = false; }
    } guard{running_};

    stop_requested_ = false;
    while (!stop_requested_ && step()) {
    }
}

void Clock::terminate() noexcept {
    terminated_ = true;
    stop_requested_ = true;
}

void Clock::cancel_matching(ActorId actor) {
    for (auto& [key, event] : event_queue_) {
        if (key.actor == actor) {
            event.cancelled = true;
        }
    }
    for (auto& paused : paused_) {
        if (paused.key.actor == actor) {
            paused.event.cancelled = true;
        }
    }
}

void Clock::pause_matching(ActorId actor) {
    for (auto it = event_queue_.begin(); it != event_queue_.end();) {
        if (it->first.actor != actor) {
            ++it;
            continue;
        }
        auto next = std::next(it);
        auto node = event_queue_.extract(it);
        paused_.push_back(PausedEvent{node.key(), std::move(node.mapped()), current_time_});
        it = next;
    }
}

void Clock::resume_matching(ActorId actor) {
    std::vector<PausedEvent> still_paused;
    still_paused.reserve(paused_.size());

    for (auto& paused : paused_) {
        if (paused.key.actor != actor) {
            still_paused.push_back(std::move(paused));
            continue;
        }
        EventKey key = paused.key;
        key.time += current_time_ - paused.paused_at;
        event_queue_.emplace(key, std::move(paused.event));
    }
    paused_ = std::move(still_paused);
}

void Clock::set_tie_breaker(std::function<double()> tie_breaker) {
    tie_breaker_ = std::move(tie_breaker);
}

double Clock::draw_tie_break() {
    if (tie_breaker_) {
        return tie_breaker_();
    }
    // 53 random mantissa bits, identical on every standard library
    return static_cast<double>(rng_() >> 11) * 0x1.0p-53;
}

void Clock::execute(const EventKey& key, Event& event) {
    if (trace_events_) {
        trace([&](TraceWriter& w) {
            w.type("event_executed");
            w.field("actor", static_cast<uint64_t>(key.actor));
            w.field("priority", static_cast<double>(key.priority));
            w.field("label", event.label);
        });
    }

    try {
        event.action();
    } catch (const std::exception& e) {
        terminated_ = true;
        stop_requested_ = true;
        trace([&](TraceWriter& w) {
            w.type("event_failed");
            w.field("actor", static_cast<uint64_t>(key.actor));
            w.field("label", event.label);
            w.field("error", std::string_view{e.what()});
        });
        std::throw_with_nested(EventFailure(key.time, key.actor, key.priority, event.label));
    }
}

} // namespace flowsim::core
