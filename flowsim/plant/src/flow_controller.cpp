#include <flowsim/plant/flow_controller.hpp>
#include <flowsim/plant/simulation.hpp>

#include <utility>

namespace flowsim::plant {

FlowController::FlowController(Simulation& simulation, DeviceId id, std::string name)
    : Device(simulation, id, std::move(name)) {}

bool FlowController::give_part(PartPtr& part) {
    if (!part || !is_operational() || input_blocked() || !admits(*part)) {
        return false;
    }

    const uint64_t part_id = part->id();
    if (records_routing()) {
        part->add_routing_history(id());
    }
    if (offer_downstream(part)) {
        ++forwarded_;
        record("forwarded_part", [&](core::TraceWriter& w) { w.field("part_id", part_id); });
        return true;
    }
    if (records_routing()) {
        part->remove_last_routing_history();
    }
    return false;
}

void FlowController::space_available_downstream() {
    if (is_operational() && !input_blocked()) {
        notify_upstream_of_available_space();
    }
}

std::optional<core::TimePoint> FlowController::waiting_since() const {
    // A cycle of pass-through devices would recurse forever.
    if (resolving_wait_) {
        return std::nullopt;
    }
    resolving_wait_ = true;

    std::optional<core::TimePoint> earliest;
    for (DeviceId down : downstream()) {
        auto since = simulation().device(down).waiting_since();
        if (since && (!earliest || *since < *earliest)) {
            earliest = since;
        }
    }

    resolving_wait_ = false;
    return earliest;
}

DecisionGate::DecisionGate(Simulation& simulation, DeviceId id, std::string name,
                           Predicate predicate)
    : FlowController(simulation, id, std::move(name))
    , predicate_(std::move(predicate)) {}

bool DecisionGate::admits(const Part& part) const {
    if (predicate_ && predicate_(part)) {
        return true;
    }
    ++rejected_;
    return false;
}

} // namespace flowsim::plant
