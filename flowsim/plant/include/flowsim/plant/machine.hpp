#pragma once

#include <flowsim/core/resource_manager.hpp>
#include <flowsim/core/types.hpp>
#include <flowsim/plant/maintainable.hpp>
#include <flowsim/plant/part_handler.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace flowsim::plant {

/// @brief Caller-supplied answers to a Maintainer's questions.
///
/// Unset functions answer zero.
/// @ingroup plant_maintenance
struct WorkOrderPolicy {
    std::function<core::Duration(const WorkTag&)> duration;
    std::function<double(const WorkTag&)> capacity;
    std::function<double(const WorkTag&)> cost;
};

/// @brief PartHandler that needs resources, can fail and can be maintained.
///
/// Before accepting a part the Machine reserves its processing resources
/// atomically. If they are not available it refuses the part and
/// registers a single waiter with the ResourceManager; when the waiter
/// fires it notifies its upstream devices. When a cycle finishes a
/// RELEASE_RESOURCES event returns the reservation unless a new part was
/// received in the same instant, so a blocked output never pins it.
///
/// As a Maintainable target, start_work() shuts the machine down and
/// end_work() restores it.
///
/// @ingroup plant_devices
class Machine : public PartHandler, public Maintainable {
public:
    Machine(Simulation& simulation, DeviceId id, std::string name, core::Duration cycle_time,
            core::ResourceRequest resources = {});

    [[nodiscard]] const core::ResourceRequest& resources_for_processing() const noexcept {
        return resources_for_processing_;
    }

    /// @brief Change the resources needed by parts accepted from now on.
    void set_resources_for_processing(core::ResourceRequest resources);

    /// @brief True while the machine holds a processing reservation.
    [[nodiscard]] bool holds_resources() const noexcept {
        return reservation_.has_value() && !reservation_->empty();
    }

    /// @brief Schedule a failure. It is paused while the machine is shut
    ///        down and cancelled if the machine fails earlier.
    void schedule_failure(core::TimePoint when, std::string label = "failure");

    /// @brief Total time spent operational.
    [[nodiscard]] core::Duration uptime() const;

    /// @brief Total time spent processing parts.
    [[nodiscard]] core::Duration utilization_time() const;

    void set_work_order_policy(WorkOrderPolicy policy) { policy_ = std::move(policy); }

    [[nodiscard]] std::string_view maintainable_name() const override { return name(); }
    [[nodiscard]] core::Duration get_work_order_duration(const WorkTag& tag) override;
    [[nodiscard]] double get_work_order_capacity(const WorkTag& tag) override;
    [[nodiscard]] double get_work_order_cost(const WorkTag& tag) override;
    void start_work(const WorkTag& tag) override;
    void end_work(const WorkTag& tag) override;

protected:
    bool can_accept(const Part& part) override;
    void on_received_part(Part& part) override;
    void on_cycle_finished(Part& part) override;
    void on_initialize() override;
    void on_shutdown(bool is_failure) override;
    void on_restore() override;

private:
    void release_resources();
    void release_if_idle();

    core::ResourceRequest resources_for_processing_;
    std::optional<core::Reservation> reservation_;
    bool waiting_for_resources_{false};
    WorkOrderPolicy policy_;

    core::Duration uptime_{};
    std::optional<core::TimePoint> operational_since_;
    core::Duration utilization_{};
    std::optional<core::TimePoint> busy_since_;
};

} // namespace flowsim::plant
