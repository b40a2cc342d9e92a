#include <flowsim/plant/simulation.hpp>

#include <flowsim/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace flowsim::plant {

namespace {

bool contains(const std::vector<DeviceId>& ids, DeviceId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

Simulation::Simulation(uint64_t seed)
    : clock_(seed)
    , resources_(clock_) {}

Simulation::~Simulation() {
    // Devices are torn down while still holding reservations.
    resources_.suppress_leak_reports();
}

template <typename T, typename... Args>
T& Simulation::emplace_device(Args&&... args) {
    DeviceId id = devices_.size();
    auto device = std::make_unique<T>(*this, id, std::forward<Args>(args)...);
    T& ref = *device;
    devices_.push_back(std::move(device));
    return ref;
}

void Simulation::attach(Device& device, std::vector<DeviceId> upstream) {
    wire_or_discard(device, std::move(upstream));
    if (finalized_) {
        device.initialize();
    }
}

void Simulation::wire_or_discard(Device& device, std::vector<DeviceId> upstream) {
    try {
        set_upstream(device.id(), std::move(upstream));
    } catch (const core::SimulationError&) {
        // The device is the newest one and nothing points at it yet.
        devices_.pop_back();
        throw;
    }
}

Source& Simulation::add_source(std::string name, PartPtr part_template, core::Duration cycle_time,
                               std::optional<uint64_t> max_parts) {
    auto& source =
        emplace_device<Source>(std::move(name), std::move(part_template), cycle_time, max_parts);
    attach(source, {});
    return source;
}

PartHandler& Simulation::add_part_handler(std::string name, std::vector<DeviceId> upstream,
                                          core::Duration cycle_time) {
    auto& handler = emplace_device<PartHandler>(std::move(name), cycle_time);
    attach(handler, std::move(upstream));
    return handler;
}

Machine& Simulation::add_machine(std::string name, std::vector<DeviceId> upstream,
                                 core::Duration cycle_time, core::ResourceRequest resources) {
    auto& machine = emplace_device<Machine>(std::move(name), cycle_time, std::move(resources));
    attach(machine, std::move(upstream));
    return machine;
}

Buffer& Simulation::add_buffer(std::string name, std::vector<DeviceId> upstream,
                               std::size_t capacity, core::Duration minimum_delay) {
    auto& buffer = emplace_device<Buffer>(std::move(name), capacity, minimum_delay);
    attach(buffer, std::move(upstream));
    return buffer;
}

Sink& Simulation::add_sink(std::string name, std::vector<DeviceId> upstream, bool collect_parts,
                           core::Duration cycle_time) {
    auto& sink = emplace_device<Sink>(std::move(name), collect_parts, cycle_time);
    attach(sink, std::move(upstream));
    return sink;
}

FlowController& Simulation::add_flow_controller(std::string name, std::vector<DeviceId> upstream) {
    auto& controller = emplace_device<FlowController>(std::move(name));
    attach(controller, std::move(upstream));
    return controller;
}

DecisionGate& Simulation::add_decision_gate(std::string name, std::vector<DeviceId> upstream,
                                            DecisionGate::Predicate predicate) {
    auto& gate = emplace_device<DecisionGate>(std::move(name), std::move(predicate));
    attach(gate, std::move(upstream));
    return gate;
}

Group& Simulation::add_group(std::string name, const std::vector<DeviceId>& devices,
                             std::vector<DeviceId> inputs, std::vector<DeviceId> outputs) {
    if (devices.empty()) {
        throw core::TopologyError("Group '" + name + "' has no devices");
    }

    std::vector<DeviceId> members;
    for (DeviceId id : devices) {
        check_id(id);
        Device& member = *devices_[id];
        if (!member.groups_.empty() || dynamic_cast<GroupPath*>(&member) != nullptr) {
            throw core::TopologyError("Device '" + member.name() +
                                      "' already belongs to a group and groups do not nest");
        }
        if (!contains(members, id)) {
            members.push_back(id);
        }
    }

    for (DeviceId id : members) {
        const Device& member = *devices_[id];
        auto is_member = [&](DeviceId other) { return contains(members, other); };
        if (!std::all_of(member.upstream_.begin(), member.upstream_.end(), is_member) ||
            !std::all_of(member.downstream_.begin(), member.downstream_.end(), is_member)) {
            throw core::TopologyError("Device '" + member.name() +
                                      "' is wired outside group '" + name + "'");
        }
    }

    if (inputs.empty()) {
        for (DeviceId id : members) {
            if (devices_[id]->upstream_.empty() && devices_[id]->accepts_upstream()) {
                inputs.push_back(id);
            }
        }
    }
    if (outputs.empty()) {
        for (DeviceId id : members) {
            if (devices_[id]->downstream_.empty() && devices_[id]->accepts_downstream()) {
                outputs.push_back(id);
            }
        }
    }
    if (inputs.empty() || outputs.empty()) {
        throw core::TopologyError("Group '" + name + "' needs at least one input and one output");
    }
    for (DeviceId id : inputs) {
        if (!contains(members, id)) {
            throw core::TopologyError("Input of group '" + name + "' is not a member");
        }
    }
    for (DeviceId id : outputs) {
        if (!contains(members, id)) {
            throw core::TopologyError("Output of group '" + name + "' is not a member");
        }
    }

    GroupId gid = groups_.size();
    groups_.push_back(std::make_unique<Group>(*this, gid, name));
    Group& group = *groups_.back();
    group.devices_ = members;
    group.inputs_ = inputs;
    group.outputs_ = outputs;

    auto& input = emplace_device<GroupInput>(name + ".input", group);
    auto& output = emplace_device<GroupOutput>(name + ".output", group);
    input.groups_.push_back(gid);
    output.groups_.push_back(gid);
    for (DeviceId id : members) {
        devices_[id]->groups_.push_back(gid);
    }
    group.input_ = &input;
    group.output_ = &output;

    for (DeviceId id : inputs) {
        std::vector<DeviceId> upstream = devices_[id]->upstream_;
        upstream.push_back(input.id());
        set_upstream(id, std::move(upstream));
    }
    set_upstream(output.id(), outputs);

    if (finalized_) {
        input.initialize();
        output.initialize();
    }
    return group;
}

GroupPath& Simulation::add_group_path(Group& group, std::string name,
                                      std::vector<DeviceId> upstream) {
    if (group.id() >= groups_.size() || groups_[group.id()].get() != &group) {
        throw core::TopologyError("Group '" + group.name() + "' belongs to another simulation");
    }
    auto& path = emplace_device<GroupPath>(std::move(name), group);
    wire_or_discard(path, std::move(upstream));
    // Registered only once wired: a rejected path is already destroyed.
    group.paths_.push_back(&path);
    if (finalized_) {
        path.initialize();
    }
    return path;
}

Maintainer& Simulation::add_maintainer(std::string name, double capacity) {
    maintainers_.push_back(std::make_unique<Maintainer>(clock_, std::move(name), capacity));
    return *maintainers_.back();
}

ActionScheduler& Simulation::add_action_scheduler(std::string name,
                                                  std::vector<ScheduleStep> steps, bool cyclical) {
    action_schedulers_.push_back(
        std::make_unique<ActionScheduler>(clock_, std::move(name), std::move(steps), cyclical));
    auto& scheduler = *action_schedulers_.back();
    if (finalized_) {
        scheduler.initialize();
    }
    return scheduler;
}

void Simulation::set_upstream(DeviceId id, std::vector<DeviceId> upstream) {
    check_id(id);
    Device& target = *devices_[id];

    std::vector<DeviceId> unique;
    unique.reserve(upstream.size());
    for (DeviceId up : upstream) {
        if (!contains(unique, up)) {
            unique.push_back(up);
        }
    }

    if (!unique.empty() && !target.accepts_upstream()) {
        throw core::TopologyError("Device '" + target.name() + "' cannot have upstream devices");
    }
    for (DeviceId up : unique) {
        check_id(up);
        const Device& source = *devices_[up];
        if (up == id) {
            throw core::TopologyError("Device '" + target.name() + "' cannot feed itself");
        }
        if (!source.accepts_downstream()) {
            throw core::TopologyError("Device '" + source.name() +
                                      "' cannot have downstream devices");
        }
        if (source.groups_ != target.groups_) {
            throw core::TopologyError("Devices '" + source.name() + "' and '" + target.name() +
                                      "' are in different groups");
        }
    }

    for (DeviceId old : target.upstream_) {
        auto& down = devices_[old]->downstream_;
        down.erase(std::remove(down.begin(), down.end(), id), down.end());
    }

    std::vector<DeviceId> previous = std::move(target.upstream_);
    target.upstream_ = unique;
    for (DeviceId up : unique) {
        devices_[up]->downstream_.push_back(id);
    }

    if (finalized_ && target.is_initialized()) {
        for (DeviceId up : unique) {
            if (!contains(previous, up)) {
                devices_[up]->space_available_downstream();
            }
        }
    }
}

void Simulation::check_id(DeviceId id) const {
    if (id >= devices_.size()) {
        throw core::OutOfRangeError("Unknown device id " + std::to_string(id));
    }
}

Device& Simulation::device(DeviceId id) {
    check_id(id);
    return *devices_[id];
}

const Device& Simulation::device(DeviceId id) const {
    check_id(id);
    return *devices_[id];
}

Device* Simulation::find_device(std::string_view name) noexcept {
    for (auto& device : devices_) {
        if (device->name() == name) {
            return device.get();
        }
    }
    return nullptr;
}

Group& Simulation::group(GroupId id) {
    if (id >= groups_.size()) {
        throw core::OutOfRangeError("Unknown group id " + std::to_string(id));
    }
    return *groups_[id];
}

Maintainer& Simulation::maintainer(std::size_t idx) {
    if (idx >= maintainers_.size()) {
        throw core::OutOfRangeError("Unknown maintainer index " + std::to_string(idx));
    }
    return *maintainers_[idx];
}

ActionScheduler& Simulation::action_scheduler(std::size_t idx) {
    if (idx >= action_schedulers_.size()) {
        throw core::OutOfRangeError("Unknown action scheduler index " + std::to_string(idx));
    }
    return *action_schedulers_[idx];
}

void Simulation::set_downstream_priority(DownstreamPriority priority) {
    if (!priority) {
        throw core::InvalidStateError("Downstream priority must be callable");
    }
    downstream_priority_ = std::move(priority);
}

void Simulation::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;
    for (auto& device : devices_) {
        if (!device->is_initialized()) {
            device->initialize();
        }
    }
    for (auto& scheduler : action_schedulers_) {
        if (!scheduler->is_initialized()) {
            scheduler->initialize();
        }
    }
}

void Simulation::run(core::Duration duration) {
    finalize();
    clock_.run(duration);
}

} // namespace flowsim::plant
