#pragma once

#include <flowsim/core/clock.hpp>
#include <flowsim/core/resource_manager.hpp>
#include <flowsim/core/trace_writer.hpp>
#include <flowsim/core/types.hpp>
#include <flowsim/plant/action_scheduler.hpp>
#include <flowsim/plant/buffer.hpp>
#include <flowsim/plant/device.hpp>
#include <flowsim/plant/flow_controller.hpp>
#include <flowsim/plant/group.hpp>
#include <flowsim/plant/ids.hpp>
#include <flowsim/plant/machine.hpp>
#include <flowsim/plant/maintainer.hpp>
#include <flowsim/plant/part.hpp>
#include <flowsim/plant/part_handler.hpp>
#include <flowsim/plant/sink.hpp>
#include <flowsim/plant/source.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowsim::plant {

/// @brief Context object owning one production network and its clock.
///
/// The Simulation owns the Clock, the ResourceManager, every device,
/// group and maintainer. Components receive it by reference; nothing is
/// global, so independent replications are independent Simulations.
///
/// Devices are created by the add_* factories and addressed by DeviceId,
/// their index in the arena. References returned by the factories stay
/// valid for the Simulation's lifetime.
///
/// Edges are stored on both ends and only changed through set_upstream(),
/// which validates the edge and keeps the reverse lists in sync.
///
/// @code
/// Simulation sim(42);
/// auto& src = sim.add_source("src", std::make_unique<Part>(), duration_from_units(1.0));
/// auto& m = sim.add_machine("m", {src.id()}, duration_from_units(2.0));
/// auto& sink = sim.add_sink("sink", {m.id()});
/// sim.run(duration_from_units(100.0));
/// @endcode
///
/// @see Device, Group, Maintainer
/// @ingroup plant_graph
class Simulation {
public:
    /// @param seed Seed of the clock's tie-break generator.
    explicit Simulation(uint64_t seed = 0);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    [[nodiscard]] core::Clock& clock() noexcept { return clock_; }
    [[nodiscard]] const core::Clock& clock() const noexcept { return clock_; }
    [[nodiscard]] core::ResourceManager& resources() noexcept { return resources_; }
    [[nodiscard]] const core::ResourceManager& resources() const noexcept { return resources_; }

    /// @name Device factories
    /// @brief Devices added after finalize() are initialized once wired.
    /// @{

    Source& add_source(std::string name, PartPtr part_template, core::Duration cycle_time,
                       std::optional<uint64_t> max_parts = std::nullopt);

    PartHandler& add_part_handler(std::string name, std::vector<DeviceId> upstream,
                                  core::Duration cycle_time);

    Machine& add_machine(std::string name, std::vector<DeviceId> upstream,
                         core::Duration cycle_time, core::ResourceRequest resources = {});

    Buffer& add_buffer(std::string name, std::vector<DeviceId> upstream,
                       std::size_t capacity = Buffer::kUnlimited,
                       core::Duration minimum_delay = core::Duration::zero());

    Sink& add_sink(std::string name, std::vector<DeviceId> upstream, bool collect_parts = false,
                   core::Duration cycle_time = core::Duration::zero());

    FlowController& add_flow_controller(std::string name, std::vector<DeviceId> upstream);

    DecisionGate& add_decision_gate(std::string name, std::vector<DeviceId> upstream,
                                    DecisionGate::Predicate predicate);

    /// @}

    /// @brief Turn already wired devices into a reusable group.
    ///
    /// @param inputs  Members fed by the group input. Defaults to the members
    ///                with no upstream.
    /// @param outputs Members feeding the group output. Defaults to the
    ///                members with no downstream.
    /// @throws core::TopologyError if a device is already in a group, or a
    ///         member is wired to a non-member.
    Group& add_group(std::string name, const std::vector<DeviceId>& devices,
                     std::vector<DeviceId> inputs = {}, std::vector<DeviceId> outputs = {});

    /// @brief Add an entry point of @p group. Prefer Group::add_path().
    GroupPath& add_group_path(Group& group, std::string name, std::vector<DeviceId> upstream = {});

    Maintainer& add_maintainer(std::string name,
                               double capacity = std::numeric_limits<double>::infinity());

    /// @brief Add a state schedule. Started at finalize(), or at once when
    ///        the simulation is already running.
    ActionScheduler& add_action_scheduler(std::string name, std::vector<ScheduleStep> steps,
                                          bool cyclical = true);

    /// @brief Replace the upstream list of @p id and update reverse edges.
    ///
    /// Duplicate ids are dropped. When the network is already running, the
    /// new upstream devices are told that space may be available.
    ///
    /// @throws core::OutOfRangeError for an unknown id.
    /// @throws core::TopologyError for a self edge, a device that takes no
    ///         upstream (or no downstream) or devices in different groups.
    void set_upstream(DeviceId id, std::vector<DeviceId> upstream);

    /// @throws core::OutOfRangeError for an unknown id.
    [[nodiscard]] Device& device(DeviceId id);
    /// @throws core::OutOfRangeError for an unknown id.
    [[nodiscard]] const Device& device(DeviceId id) const;

    /// @brief First device named @p name, or nullptr.
    [[nodiscard]] Device* find_device(std::string_view name) noexcept;

    [[nodiscard]] std::size_t device_count() const noexcept { return devices_.size(); }
    [[nodiscard]] std::size_t group_count() const noexcept { return groups_.size(); }
    [[nodiscard]] std::size_t maintainer_count() const noexcept { return maintainers_.size(); }
    [[nodiscard]] std::size_t action_scheduler_count() const noexcept {
        return action_schedulers_.size();
    }

    [[nodiscard]] Group& group(GroupId id);
    [[nodiscard]] Maintainer& maintainer(std::size_t idx);
    [[nodiscard]] ActionScheduler& action_scheduler(std::size_t idx);

    void set_downstream_priority(DownstreamPriority priority);
    [[nodiscard]] const DownstreamPriority& downstream_priority() const noexcept {
        return downstream_priority_;
    }

    /// @brief Next identifier handed to a produced part, starting at 1.
    [[nodiscard]] uint64_t next_part_id() noexcept { return ++last_part_id_; }

    /// @brief Initialize every device, then start every schedule. Idempotent.
    void finalize();
    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

    /// @brief Finalize if needed, then advance the clock by @p duration.
    void run(core::Duration duration);

    /// @brief Route trace records of the clock and every asset to @p writer.
    void set_trace_writer(core::TraceWriter* writer) noexcept { clock_.set_trace_writer(writer); }

private:
    template <typename T, typename... Args>
    T& emplace_device(Args&&... args);

    /// @brief Wire and, when running, initialize a freshly created device.
    void attach(Device& device, std::vector<DeviceId> upstream);
    /// @brief Wire the newest device, or drop it from the arena and rethrow.
    void wire_or_discard(Device& device, std::vector<DeviceId> upstream);

    void check_id(DeviceId id) const;

    core::Clock clock_;
    core::ResourceManager resources_;
    DownstreamPriority downstream_priority_{longest_waiting_first};
    std::vector<std::unique_ptr<Device>> devices_;
    std::vector<std::unique_ptr<Group>> groups_;
    std::vector<std::unique_ptr<Maintainer>> maintainers_;
    std::vector<std::unique_ptr<ActionScheduler>> action_schedulers_;
    uint64_t last_part_id_{0};
    bool finalized_{false};
};

} // namespace flowsim::plant
