#include <flowsim/plant/buffer.hpp>

#include <flowsim/core/error.hpp>
#include <flowsim/core/event.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace flowsim::plant {

namespace {

// Comparison slack that grows with the magnitude of the current time.
double time_tolerance(core::TimePoint now) {
    return 4.0 * std::numeric_limits<double>::epsilon() *
           std::max(1.0, std::abs(core::time_to_units(now)));
}

} // namespace

Buffer::Buffer(Simulation& simulation, DeviceId id, std::string name, std::size_t capacity,
               core::Duration minimum_delay)
    : Device(simulation, id, std::move(name))
    , capacity_(capacity)
    , minimum_delay_(minimum_delay) {
    if (capacity_ == 0) {
        throw core::TopologyError("Buffer '" + this->name() + "' needs a capacity of at least 1");
    }
}

bool Buffer::give_part(PartPtr& part) {
    if (!part || !is_operational() || input_blocked() || parts_.size() >= capacity_) {
        return false;
    }

    part->add_routing_history(id());
    stop_waiting();
    record("received_part", [&](core::TraceWriter& w) {
        w.field("part_id", part->id());
        w.field("part", std::string_view{part->name()});
        w.field("level", static_cast<uint64_t>(parts_.size() + 1));
    });
    parts_.push_back(Entry{std::move(part), clock().now()});
    schedule_pass();
    return true;
}

void Buffer::space_available_downstream() {
    if (is_operational() && waiting_for_downstream_) {
        schedule_pass();
    }
}

std::vector<const Part*> Buffer::contents() const {
    std::vector<const Part*> out;
    out.reserve(parts_.size());
    for (const auto& entry : parts_) {
        out.push_back(entry.part.get());
    }
    return out;
}

void Buffer::on_initialize() {
    notify_upstream_of_available_space();
}

void Buffer::on_shutdown(bool is_failure) {
    if (is_failure) {
        // Cancelled events will never clear these.
        pass_scheduled_ = false;
        retry_at_.reset();
    }
}

void Buffer::on_restore() {
    schedule_pass();
    if (parts_.size() < capacity_) {
        notify_upstream_of_available_space();
    }
}

bool Buffer::delay_elapsed(core::TimePoint entered) const {
    core::TimePoint now = clock().now();
    return (now - entered).units() + time_tolerance(now) >= minimum_delay_.units();
}

void Buffer::schedule_pass() {
    waiting_for_downstream_ = false;
    if (pass_scheduled_) {
        return;
    }
    pass_scheduled_ = true;
    clock().schedule(clock().now(), actor_id(),
                     [this]() {
                         pass_scheduled_ = false;
                         pass_parts_downstream();
                     },
                     core::EventPriority::PASS_PART, name() + ": pass parts");
}

void Buffer::schedule_retry(core::TimePoint when) {
    // Strictly later than now, so a delay below the time resolution still progresses.
    double now_units = core::time_to_units(clock().now());
    double next_units = std::nextafter(now_units, std::numeric_limits<double>::infinity());
    when = std::max(when, core::time_from_units(next_units));

    if (retry_at_ && *retry_at_ <= when) {
        return;
    }
    retry_at_ = when;
    clock().schedule(when, actor_id(),
                     [this]() {
                         retry_at_.reset();
                         pass_parts_downstream();
                     },
                     core::EventPriority::PASS_PART, name() + ": minimum delay elapsed");
}

void Buffer::pass_parts_downstream() {
    if (!is_operational()) {
        return;
    }

    bool passed_any = false;
    while (!parts_.empty()) {
        Entry& head = parts_.front();
        if (!delay_elapsed(head.entered)) {
            schedule_retry(head.entered + minimum_delay_);
            break;
        }
        if (!offer_downstream(head.part)) {
            waiting_for_downstream_ = true;
            break;
        }
        parts_.pop_front();
        ++passed_;
        passed_any = true;
    }

    if (passed_any && parts_.size() < capacity_) {
        notify_upstream_of_available_space();
    }
}

} // namespace flowsim::plant
