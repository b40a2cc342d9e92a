#pragma once

#include <flowsim/plant/device.hpp>
#include <flowsim/plant/flow_controller.hpp>
#include <flowsim/plant/ids.hpp>

#include <string>
#include <vector>

namespace flowsim::plant {

class Group;

/// @brief Entry node of a Group. Forwards parts to the group's input devices.
///
/// It is not recorded in routing histories. Its upstream neighbours are
/// the group's paths, which are not graph edges, so space notifications go
/// to every path instead.
///
/// @ingroup plant_groups
class GroupInput : public FlowController {
public:
    GroupInput(Simulation& simulation, DeviceId id, std::string name, Group& group);

    [[nodiscard]] bool accepts_upstream() const noexcept override { return false; }
    void notify_upstream_of_available_space() override;

protected:
    [[nodiscard]] bool records_routing() const noexcept override { return false; }

private:
    Group& group_;
};

/// @brief Exit node of a Group. Sends each part back out through the path
///        it entered by.
/// @ingroup plant_groups
class GroupOutput : public Device {
public:
    GroupOutput(Simulation& simulation, DeviceId id, std::string name, Group& group);

    /// @throws core::StateViolationError if the part carries no return address.
    bool give_part(PartPtr& part) override;
    void space_available_downstream() override;
    [[nodiscard]] bool accepts_downstream() const noexcept override { return false; }

private:
    Group& group_;
};

/// @brief One use of a Group from the surrounding graph.
///
/// Upstream devices are wired to the path as usual, and downstream devices
/// list the path as their upstream. A part entering through the path
/// records it as its return address; when it reaches the group output it
/// leaves through the same path.
///
/// @ingroup plant_groups
class GroupPath : public FlowController {
public:
    GroupPath(Simulation& simulation, DeviceId id, std::string name, Group& group);

    bool give_part(PartPtr& part) override;
    void space_available_downstream() override;
    [[nodiscard]] std::optional<core::TimePoint> waiting_since() const override;

    [[nodiscard]] Group& group() noexcept { return group_; }

    /// @brief Offer a part leaving the group to this path's downstream devices.
    bool pass_part_out(PartPtr& part);

private:
    Group& group_;
};

/// @brief Sub-graph that can be entered from several places.
///
/// Member devices may only be wired to each other (or to the group's own
/// input and output nodes). Inputs default to the members with no
/// upstream, outputs to the members with no downstream.
///
/// @code
/// auto& cell = sim.add_group("cell", {m1.id(), m2.id()});
/// auto& from_line_a = cell.add_path("from_a", {line_a.id()});
/// sink_a.set_upstream({from_line_a.id()});
/// @endcode
///
/// @ingroup plant_groups
class Group {
public:
    Group(Simulation& simulation, GroupId id, std::string name);

    Group(const Group&) = delete;
    Group& operator=(const Group&) = delete;

    [[nodiscard]] GroupId id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::vector<DeviceId>& devices() const noexcept { return devices_; }
    [[nodiscard]] const std::vector<DeviceId>& inputs() const noexcept { return inputs_; }
    [[nodiscard]] const std::vector<DeviceId>& outputs() const noexcept { return outputs_; }
    [[nodiscard]] const std::vector<GroupPath*>& paths() const noexcept { return paths_; }

    [[nodiscard]] GroupInput& input() noexcept { return *input_; }
    [[nodiscard]] GroupOutput& output() noexcept { return *output_; }

    /// @brief Add an entry point wired to @p upstream.
    GroupPath& add_path(std::string name, std::vector<DeviceId> upstream = {});

private:
    friend class Simulation;

    Simulation& simulation_;
    GroupId id_;
    std::string name_;
    std::vector<DeviceId> devices_;
    std::vector<DeviceId> inputs_;
    std::vector<DeviceId> outputs_;
    GroupInput* input_{nullptr};
    GroupOutput* output_{nullptr};
    std::vector<GroupPath*> paths_;
};

} // namespace flowsim::plant
