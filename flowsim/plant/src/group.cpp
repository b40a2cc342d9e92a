#include <flowsim/plant/group.hpp>
#include <flowsim/plant/simulation.hpp>

#include <flowsim/core/error.hpp>

#include <utility>

namespace flowsim::plant {

// ============================================================================
// GroupInput
// ============================================================================

GroupInput::GroupInput(Simulation& simulation, DeviceId id, std::string name, Group& group)
    : FlowController(simulation, id, std::move(name))
    , group_(group) {}

void GroupInput::notify_upstream_of_available_space() {
    for (GroupPath* path : group_.paths()) {
        path->notify_upstream_of_available_space();
    }
}

// ============================================================================
// GroupOutput
// ============================================================================

GroupOutput::GroupOutput(Simulation& simulation, DeviceId id, std::string name, Group& group)
    : Device(simulation, id, std::move(name))
    , group_(group) {}

bool GroupOutput::give_part(PartPtr& part) {
    if (!part || !is_operational()) {
        return false;
    }

    auto path_id = part->pop_group_path();
    if (!path_id) {
        throw core::StateViolationError("Part '" + part->name() + "' reached the output of group '" +
                                        group_.name() + "' without a return address");
    }
    auto* path = dynamic_cast<GroupPath*>(&simulation().device(*path_id));
    if (path == nullptr || &path->group() != &group_) {
        throw core::StateViolationError("Part '" + part->name() +
                                        "' carries a return address outside group '" +
                                        group_.name() + "'");
    }

    if (path->pass_part_out(part)) {
        return true;
    }
    part->push_group_path(*path_id);
    return false;
}

void GroupOutput::space_available_downstream() {
    if (is_operational()) {
        notify_upstream_of_available_space();
    }
}

// ============================================================================
// GroupPath
// ============================================================================

GroupPath::GroupPath(Simulation& simulation, DeviceId id, std::string name, Group& group)
    : FlowController(simulation, id, std::move(name))
    , group_(group) {}

bool GroupPath::give_part(PartPtr& part) {
    if (!part || !is_operational() || input_blocked()) {
        return false;
    }

    part->push_group_path(id());
    part->add_routing_history(id());
    if (group_.input().give_part(part)) {
        return true;
    }
    part->remove_last_routing_history();
    (void)part->pop_group_path();
    return false;
}

void GroupPath::space_available_downstream() {
    if (is_operational()) {
        group_.output().space_available_downstream();
    }
}

std::optional<core::TimePoint> GroupPath::waiting_since() const {
    return group_.input().waiting_since();
}

bool GroupPath::pass_part_out(PartPtr& part) {
    if (!is_operational()) {
        return false;
    }
    return offer_downstream(part);
}

// ============================================================================
// Group
// ============================================================================

Group::Group(Simulation& simulation, GroupId id, std::string name)
    : simulation_(simulation)
    , id_(id)
    , name_(std::move(name)) {}

GroupPath& Group::add_path(std::string name, std::vector<DeviceId> upstream) {
    return simulation_.add_group_path(*this, std::move(name), std::move(upstream));
}

} // namespace flowsim::plant
