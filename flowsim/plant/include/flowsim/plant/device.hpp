#pragma once

#include <flowsim/core/types.hpp>
#include <flowsim/plant/asset.hpp>
#include <flowsim/plant/ids.hpp>
#include <flowsim/plant/part.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace flowsim::plant {

class Device;
class Simulation;

/// @brief Lifecycle state of a device.
/// @ingroup plant_graph
enum class DeviceState {
    Operational, ///< Accepts and processes parts.
    Shutdown,    ///< Events paused, resumes where it left off.
    Failed,      ///< Events cancelled, in-flight input part lost.
};

/// @brief Strict weak ordering used to rank downstream candidates.
///
/// Returns true when @p lhs should be offered a part before @p rhs.
/// @ingroup plant_graph
using DownstreamPriority = std::function<bool(const Device& lhs, const Device& rhs)>;

/// @brief Default DownstreamPriority: longest-waiting device first,
///        devices that are not waiting last.
/// @ingroup plant_graph
bool longest_waiting_first(const Device& lhs, const Device& rhs);

/// @brief Node of the device graph.
///
/// A Device owns its slot in the Simulation arena and is addressed by
/// its DeviceId. Edges are stored on both ends as id lists and are only
/// changed by Simulation::set_upstream(), which keeps them consistent.
///
/// Flow control is a two-message protocol:
///   - give_part() offers a part. On acceptance the device takes
///     ownership (the caller's pointer becomes null).
///   - space_available_downstream() tells a device that one of its
///     downstream neighbours may now accept a part. Devices that were
///     blocked schedule a PASS_PART retry instead of retrying inline.
///
/// Lifecycle: shutdown() pauses the device's events, fail() cancels
/// them and drops the input part, restore() resumes. Shutdown and
/// restored callbacks fire in registration order.
///
/// @see Simulation, PartHandler, Buffer, FlowController
/// @ingroup plant_graph
class Device : public Asset {
public:
    /// @brief Called after shutdown() or fail(). @p lost_part is the input
    ///        part dropped by a failure, or nullptr. It is destroyed after
    ///        all callbacks ran.
    using ShutdownCallback = std::function<void(Device& device, bool is_failure, Part* lost_part)>;
    using RestoredCallback = std::function<void(Device& device)>;

    Device(Simulation& simulation, DeviceId id, std::string name);
    ~Device() override;

    [[nodiscard]] DeviceId id() const noexcept { return id_; }
    [[nodiscard]] const std::vector<DeviceId>& upstream() const noexcept { return upstream_; }
    [[nodiscard]] const std::vector<DeviceId>& downstream() const noexcept { return downstream_; }

    /// @brief Replace the upstream list. Shorthand for Simulation::set_upstream().
    void set_upstream(std::vector<DeviceId> upstream);

    /// @brief Groups this device belongs to, innermost last.
    [[nodiscard]] const std::vector<GroupId>& groups() const noexcept { return groups_; }

    [[nodiscard]] DeviceState state() const noexcept { return state_; }
    [[nodiscard]] bool is_operational() const noexcept {
        return state_ == DeviceState::Operational;
    }

    [[nodiscard]] bool input_blocked() const noexcept { return block_input_; }

    /// @brief Manually refuse (true) or accept again (false) new parts.
    void set_block_input(bool blocked);

    /// @brief Offer a part. Ownership moves on acceptance.
    /// @return True if the part was accepted.
    virtual bool give_part(PartPtr& part) = 0;

    /// @brief A downstream neighbour may have room again.
    virtual void space_available_downstream() = 0;

    /// @brief Tell every upstream neighbour this device can take a part.
    virtual void notify_upstream_of_available_space();

    /// @brief Since when this device has been waiting for a part, if it is.
    [[nodiscard]] virtual std::optional<core::TimePoint> waiting_since() const {
        return waiting_since_;
    }

    /// @brief False for devices that cannot have upstream neighbours.
    [[nodiscard]] virtual bool accepts_upstream() const noexcept { return true; }

    /// @brief False for devices that cannot have downstream neighbours.
    [[nodiscard]] virtual bool accepts_downstream() const noexcept { return true; }

    void shutdown();
    void fail();
    void restore();

    void add_shutdown_callback(ShutdownCallback callback);
    void add_restored_callback(RestoredCallback callback);

    /// @brief Override the Simulation-wide downstream ordering for this device.
    void set_downstream_priority(DownstreamPriority priority);

    /// @brief Called once by the Simulation before the device first runs.
    /// @throws core::StateViolationError on a second call.
    void initialize();

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

protected:
    [[nodiscard]] Simulation& simulation() noexcept { return simulation_; }
    [[nodiscard]] const Simulation& simulation() const noexcept { return simulation_; }

    /// @brief Downstream devices in offer order.
    [[nodiscard]] std::vector<Device*> sorted_downstream();

    /// @brief Offer @p part to each downstream device in order.
    /// @return True once a device accepted it.
    bool offer_downstream(PartPtr& part);

    void stop_waiting() noexcept { waiting_since_.reset(); }

    virtual void on_initialize() {}

    /// @brief Hand over the in-flight input part lost by fail().
    virtual PartPtr release_input_part() { return nullptr; }

    virtual void on_shutdown(bool /*is_failure*/) {}
    virtual void on_restore() {}

private:
    friend class Simulation;

    Simulation& simulation_;
    DeviceId id_;
    std::vector<DeviceId> upstream_;
    std::vector<DeviceId> downstream_;
    std::vector<GroupId> groups_;
    DeviceState state_{DeviceState::Operational};
    bool block_input_{false};
    bool initialized_{false};
    std::optional<core::TimePoint> waiting_since_;
    std::optional<DownstreamPriority> downstream_priority_;
    std::vector<ShutdownCallback> shutdown_callbacks_;
    std::vector<RestoredCallback> restored_callbacks_;
};

} // namespace flowsim::plant
