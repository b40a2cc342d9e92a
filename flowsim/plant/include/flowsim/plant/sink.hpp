#pragma once

#include <flowsim/core/types.hpp>
#include <flowsim/plant/part_handler.hpp>

#include <string>
#include <vector>

namespace flowsim::plant {

/// @brief End of the line: absorbs parts and credits their value.
///
/// A Sink cannot have downstream devices. Its cycle time, zero by
/// default, limits how often it takes a part. Collected parts are
/// destroyed unless `collect_parts` is set.
///
/// @ingroup plant_devices
class Sink : public PartHandler {
public:
    Sink(Simulation& simulation, DeviceId id, std::string name, bool collect_parts = false,
         core::Duration cycle_time = core::Duration::zero());

    [[nodiscard]] bool accepts_downstream() const noexcept override { return false; }

    /// @brief Total value of every received part.
    [[nodiscard]] double value_of_received_parts() const noexcept { return received_value_; }

    /// @brief Parts kept when constructed with `collect_parts`.
    [[nodiscard]] const std::vector<PartPtr>& collected_parts() const noexcept {
        return collected_;
    }

protected:
    void on_received_part(Part& part) override;
    void dispatch_output() override;

private:
    bool collect_parts_;
    double received_value_{0.0};
    std::vector<PartPtr> collected_;
};

} // namespace flowsim::plant
