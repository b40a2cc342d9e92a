#pragma once

#include <flowsim/core/types.hpp>
#include <flowsim/plant/device.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace flowsim::plant {

/// @brief FIFO store with a capacity and an optional minimum dwell time.
///
/// Parts leave in arrival order. The head part is not offered downstream
/// before `minimum_delay` has elapsed since it entered; later parts wait
/// behind it. Parts are kept through shutdown and failure.
///
/// @ingroup plant_devices
class Buffer : public Device {
public:
    static constexpr std::size_t kUnlimited = std::numeric_limits<std::size_t>::max();

    Buffer(Simulation& simulation, DeviceId id, std::string name, std::size_t capacity = kUnlimited,
           core::Duration minimum_delay = core::Duration::zero());

    bool give_part(PartPtr& part) override;
    void space_available_downstream() override;

    [[nodiscard]] std::size_t level() const noexcept { return parts_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] core::Duration minimum_delay() const noexcept { return minimum_delay_; }

    /// @brief Parts currently stored, oldest first.
    [[nodiscard]] std::vector<const Part*> contents() const;

    [[nodiscard]] uint64_t passed_parts() const noexcept { return passed_; }

protected:
    void on_initialize() override;
    void on_shutdown(bool is_failure) override;
    void on_restore() override;

private:
    struct Entry {
        PartPtr part;
        core::TimePoint entered;
    };

    [[nodiscard]] bool delay_elapsed(core::TimePoint entered) const;
    void schedule_pass();
    void schedule_retry(core::TimePoint when);
    void pass_parts_downstream();

    std::size_t capacity_;
    core::Duration minimum_delay_;
    std::deque<Entry> parts_;
    bool pass_scheduled_{false};
    bool waiting_for_downstream_{false};
    std::optional<core::TimePoint> retry_at_;
    uint64_t passed_{0};
};

} // namespace flowsim::plant
