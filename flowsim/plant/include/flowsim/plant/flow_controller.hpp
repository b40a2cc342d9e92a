#pragma once

#include <flowsim/plant/device.hpp>

#include <functional>
#include <optional>
#include <string>

namespace flowsim::plant {

/// @brief Pass-through device that never holds a part.
///
/// A FlowController forwards each offered part to its downstream devices
/// in priority order. It appends itself to the part's routing history
/// before forwarding and removes the entry again if no downstream device
/// takes the part. Space notifications are relayed upstream unchanged.
///
/// Its waiting time is that of its longest-waiting downstream device, so
/// upstream ranking sees through it.
///
/// @ingroup plant_devices
class FlowController : public Device {
public:
    FlowController(Simulation& simulation, DeviceId id, std::string name);

    bool give_part(PartPtr& part) override;
    void space_available_downstream() override;
    [[nodiscard]] std::optional<core::TimePoint> waiting_since() const override;

    /// @brief Number of parts forwarded so far.
    [[nodiscard]] uint64_t forwarded_parts() const noexcept { return forwarded_; }

protected:
    /// @brief Extra admission test applied before forwarding.
    [[nodiscard]] virtual bool admits(const Part& /*part*/) const { return true; }

    /// @brief Whether forwarded parts record this device in their history.
    [[nodiscard]] virtual bool records_routing() const noexcept { return true; }

private:
    uint64_t forwarded_{0};
    mutable bool resolving_wait_{false};
};

/// @brief FlowController that only forwards parts matching a predicate.
/// @ingroup plant_devices
class DecisionGate : public FlowController {
public:
    using Predicate = std::function<bool(const Part&)>;

    DecisionGate(Simulation& simulation, DeviceId id, std::string name, Predicate predicate);

    /// @brief Number of parts turned away by the predicate.
    [[nodiscard]] uint64_t rejected_parts() const noexcept { return rejected_; }

protected:
    [[nodiscard]] bool admits(const Part& part) const override;

private:
    Predicate predicate_;
    mutable uint64_t rejected_{0};
};

} // namespace flowsim::plant
