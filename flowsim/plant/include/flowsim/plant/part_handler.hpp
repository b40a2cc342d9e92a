#pragma once

#include <flowsim/core/types.hpp>
#include <flowsim/plant/device.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace flowsim::plant {

/// @brief Device that holds one part for a cycle, then passes it on.
///
/// A PartHandler has two slots, input and output, and at most one of them
/// is occupied. An accepted part sits in the input slot for the cycle
/// time (plus a one-shot offset), moves to the output slot when the
/// FINISH_PROCESSING event fires, and is offered downstream by a
/// PASS_PART event. A zero-length cycle finishes synchronously, so a chain
/// of zero-cycle devices drains within one simulated instant.
///
/// When no downstream device takes the part the handler waits until a
/// neighbour reports space, then schedules another PASS_PART. Once the
/// part is gone it notifies its upstream devices.
///
/// @ingroup plant_devices
class PartHandler : public Device {
public:
    /// @brief Called with the device and the part it received or finished.
    using PartCallback = std::function<void(PartHandler& handler, Part& part)>;

    PartHandler(Simulation& simulation, DeviceId id, std::string name, core::Duration cycle_time);

    bool give_part(PartPtr& part) override;
    void space_available_downstream() override;

    [[nodiscard]] core::Duration cycle_time() const noexcept { return cycle_time_; }

    /// @brief Change the cycle time. Applies to cycles that have not started,
    ///        including the current part when called from a receive callback.
    void set_cycle_time(core::Duration cycle_time) noexcept { cycle_time_ = cycle_time; }

    /// @brief Lengthen (or shorten) only the next cycle. Offsets add up
    ///        until that cycle starts; the resulting delay is clamped at 0.
    void offset_next_cycle_time(core::Duration offset) noexcept { next_cycle_offset_ += offset; }

    [[nodiscard]] const Part* input_part() const noexcept { return input_.get(); }
    [[nodiscard]] const Part* output_part() const noexcept { return output_.get(); }

    [[nodiscard]] bool is_waiting_for_downstream_space() const noexcept {
        return waiting_for_downstream_;
    }

    [[nodiscard]] uint64_t received_parts() const noexcept { return received_; }
    [[nodiscard]] uint64_t passed_parts() const noexcept { return passed_; }

    void add_receive_part_callback(PartCallback callback);
    void add_finish_processing_callback(PartCallback callback);

protected:
    /// @brief Last admission check, after slots and state were checked.
    virtual bool can_accept(const Part& /*part*/) { return true; }

    virtual void on_received_part(Part& /*part*/) {}
    virtual void on_cycle_finished(Part& /*part*/) {}
    virtual void on_part_passed() {}

    /// @brief Deal with a finished part in the output slot.
    ///
    /// The default schedules a PASS_PART event. Sinks absorb the part instead.
    virtual void dispatch_output();

    /// @brief Start the cycle of the input part if nothing blocks it.
    void try_start_cycle();

    void schedule_pass_part();

    void on_initialize() override;
    PartPtr release_input_part() override;
    void on_restore() override;

    PartPtr input_;
    PartPtr output_;

private:
    void schedule_finish_cycle();
    void finish_cycle();
    void pass_part_downstream();

    core::Duration cycle_time_;
    core::Duration next_cycle_offset_{};
    bool waiting_for_downstream_{false};
    uint64_t received_{0};
    uint64_t passed_{0};
    std::vector<PartCallback> receive_part_callbacks_;
    std::vector<PartCallback> finish_processing_callbacks_;
};

} // namespace flowsim::plant
