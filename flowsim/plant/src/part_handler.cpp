#include <flowsim/plant/part_handler.hpp>

#include <flowsim/core/error.hpp>
#include <flowsim/core/event.hpp>

#include <algorithm>
#include <utility>

namespace flowsim::plant {

PartHandler::PartHandler(Simulation& simulation, DeviceId id, std::string name,
                         core::Duration cycle_time)
    : Device(simulation, id, std::move(name))
    , cycle_time_(cycle_time) {}

bool PartHandler::give_part(PartPtr& part) {
    if (!part || !is_operational() || input_blocked() || input_ || output_) {
        return false;
    }
    if (!can_accept(*part)) {
        return false;
    }

    input_ = std::move(part);
    input_->add_routing_history(id());
    stop_waiting();
    ++received_;
    record("received_part", [&](core::TraceWriter& w) {
        w.field("part_id", input_->id());
        w.field("part", std::string_view{input_->name()});
    });

    on_received_part(*input_);
    for (auto& callback : receive_part_callbacks_) {
        if (!input_) {
            break;
        }
        callback(*this, *input_);
    }
    try_start_cycle();
    return true;
}

void PartHandler::space_available_downstream() {
    if (is_operational() && output_ && waiting_for_downstream_) {
        schedule_pass_part();
    }
}

void PartHandler::add_receive_part_callback(PartCallback callback) {
    receive_part_callbacks_.push_back(std::move(callback));
}

void PartHandler::add_finish_processing_callback(PartCallback callback) {
    finish_processing_callbacks_.push_back(std::move(callback));
}

void PartHandler::try_start_cycle() {
    if (is_operational() && input_ && !output_) {
        schedule_finish_cycle();
    }
}

void PartHandler::schedule_finish_cycle() {
    core::Duration delay = std::max(core::Duration::zero(), cycle_time_ + next_cycle_offset_);
    next_cycle_offset_ = core::Duration::zero();

    if (delay <= core::Duration::zero()) {
        finish_cycle();
        return;
    }
    clock().schedule(clock().now() + delay, actor_id(), [this]() { finish_cycle(); },
                     core::EventPriority::FINISH_PROCESSING, name() + ": finish cycle");
}

void PartHandler::finish_cycle() {
    if (!is_operational()) {
        throw core::StateViolationError("Device '" + name() +
                                        "' finished a cycle while not operational");
    }
    if (!input_) {
        throw core::StateViolationError("Device '" + name() + "' finished a cycle without a part");
    }
    if (output_) {
        throw core::StateViolationError("Device '" + name() +
                                        "' finished a cycle with its output slot occupied");
    }

    output_ = std::move(input_);
    on_cycle_finished(*output_);
    for (auto& callback : finish_processing_callbacks_) {
        if (!output_) {
            break;
        }
        callback(*this, *output_);
    }
    if (output_) {
        dispatch_output();
    }
}

void PartHandler::dispatch_output() {
    record("produced_part", [&](core::TraceWriter& w) {
        w.field("part_id", output_->id());
        w.field("part", std::string_view{output_->name()});
    });
    schedule_pass_part();
}

void PartHandler::schedule_pass_part() {
    waiting_for_downstream_ = false;
    clock().schedule(clock().now(), actor_id(), [this]() { pass_part_downstream(); },
                     core::EventPriority::PASS_PART, name() + ": pass part");
}

void PartHandler::pass_part_downstream() {
    if (!is_operational() || !output_) {
        return;
    }
    if (!offer_downstream(output_)) {
        waiting_for_downstream_ = true;
        return;
    }

    output_.reset();
    ++passed_;
    on_part_passed();
    if (!input_ && !output_) {
        notify_upstream_of_available_space();
    }
}

void PartHandler::on_initialize() {
    notify_upstream_of_available_space();
}

PartPtr PartHandler::release_input_part() {
    return std::move(input_);
}

void PartHandler::on_restore() {
    if (output_) {
        schedule_pass_part();
    } else if (!input_) {
        notify_upstream_of_available_space();
    }
}

} // namespace flowsim::plant
