#pragma once

#include <flowsim/core/types.hpp>
#include <flowsim/plant/part_handler.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace flowsim::plant {

/// @brief Device that creates parts from a template.
///
/// Every cycle the Source copies its template part (Part::make_copy),
/// holds the copy for the cycle time and offers it downstream. The next
/// cycle starts once the part is taken. Each passed part charges the
/// Source the part's value.
///
/// The remaining-parts budget is consumed when a cycle starts and may be
/// changed at any time without disturbing the cycle in progress.
///
/// @ingroup plant_devices
class Source : public PartHandler {
public:
    Source(Simulation& simulation, DeviceId id, std::string name, PartPtr part_template,
           core::Duration cycle_time, std::optional<uint64_t> max_parts = std::nullopt);

    bool give_part(PartPtr& /*part*/) override { return false; }
    [[nodiscard]] bool accepts_upstream() const noexcept override { return false; }

    [[nodiscard]] const Part& part_template() const noexcept { return *template_; }

    /// @brief Cycles that may still start; nullopt means unlimited.
    [[nodiscard]] std::optional<uint64_t> remaining_parts() const noexcept { return remaining_; }

    /// @brief Replace the budget. An idle Source with a fresh budget starts
    ///        a cycle immediately.
    void set_remaining_parts(std::optional<uint64_t> remaining);

    [[nodiscard]] uint64_t supplied_parts() const noexcept { return passed_parts(); }
    [[nodiscard]] double cost_of_supplied_parts() const noexcept { return supplied_cost_; }

protected:
    void on_initialize() override;
    void on_cycle_finished(Part& part) override;
    void on_part_passed() override;
    void on_restore() override;

private:
    void start_next_cycle();

    PartPtr template_;
    std::optional<uint64_t> remaining_;
    double pending_cost_{0.0};
    double supplied_cost_{0.0};
};

} // namespace flowsim::plant
