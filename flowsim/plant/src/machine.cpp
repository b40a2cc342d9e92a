#include <flowsim/plant/machine.hpp>
#include <flowsim/plant/simulation.hpp>

#include <flowsim/core/event.hpp>

#include <utility>

namespace flowsim::plant {

Machine::Machine(Simulation& simulation, DeviceId id, std::string name, core::Duration cycle_time,
                 core::ResourceRequest resources)
    : PartHandler(simulation, id, std::move(name), cycle_time)
    , resources_for_processing_(std::move(resources)) {}

void Machine::set_resources_for_processing(core::ResourceRequest resources) {
    resources_for_processing_ = std::move(resources);
}

void Machine::schedule_failure(core::TimePoint when, std::string label) {
    clock().schedule(when, actor_id(), [this]() { fail(); }, core::EventPriority::FAIL,
                     name() + ": " + label);
}

core::Duration Machine::uptime() const {
    core::Duration total = uptime_;
    if (operational_since_) {
        total += clock().now() - *operational_since_;
    }
    return total;
}

core::Duration Machine::utilization_time() const {
    core::Duration total = utilization_;
    if (busy_since_) {
        total += clock().now() - *busy_since_;
    }
    return total;
}

core::Duration Machine::get_work_order_duration(const WorkTag& tag) {
    return policy_.duration ? policy_.duration(tag) : core::Duration::zero();
}

double Machine::get_work_order_capacity(const WorkTag& tag) {
    return policy_.capacity ? policy_.capacity(tag) : 0.0;
}

double Machine::get_work_order_cost(const WorkTag& tag) {
    return policy_.cost ? policy_.cost(tag) : 0.0;
}

void Machine::start_work(const WorkTag& /*tag*/) {
    shutdown();
}

void Machine::end_work(const WorkTag& /*tag*/) {
    restore();
}

bool Machine::can_accept(const Part& /*part*/) {
    if (resources_for_processing_.empty() || holds_resources()) {
        return true;
    }

    auto& resources = simulation().resources();
    auto reservation = resources.reserve(resources_for_processing_);
    if (reservation) {
        reservation_ = std::move(reservation);
        return true;
    }

    if (!waiting_for_resources_) {
        waiting_for_resources_ = true;
        resources.reserve_with_callback(resources_for_processing_,
                                        [this](const core::ResourceRequest&) {
                                            waiting_for_resources_ = false;
                                            if (is_operational() && !input_ && !output_) {
                                                notify_upstream_of_available_space();
                                            }
                                        });
    }
    return false;
}

void Machine::on_received_part(Part& /*part*/) {
    busy_since_ = clock().now();
}

void Machine::on_cycle_finished(Part& /*part*/) {
    if (busy_since_) {
        utilization_ += clock().now() - *busy_since_;
        busy_since_.reset();
    }
    if (holds_resources()) {
        // Runs after the PASS_PART events of this instant, so a machine that
        // is handed its next part right away keeps the reservation, while
        // one whose output is blocked gives it back.
        clock().schedule(clock().now(), actor_id(), [this]() { release_if_idle(); },
                         core::EventPriority::RELEASE_RESOURCES, name() + ": release resources");
    }
}

void Machine::on_initialize() {
    operational_since_ = clock().now();
    PartHandler::on_initialize();
}

void Machine::on_shutdown(bool is_failure) {
    if (operational_since_) {
        uptime_ += clock().now() - *operational_since_;
        operational_since_.reset();
    }
    if (busy_since_) {
        utilization_ += clock().now() - *busy_since_;
        busy_since_.reset();
    }
    if (is_failure) {
        release_resources();
    }
}

void Machine::on_restore() {
    operational_since_ = clock().now();
    if (input_) {
        busy_since_ = clock().now();
    }
    PartHandler::on_restore();
}

void Machine::release_resources() {
    if (reservation_) {
        reservation_->release();
        reservation_.reset();
    }
}

void Machine::release_if_idle() {
    if (!input_) {
        release_resources();
    }
}

} // namespace flowsim::plant
