#pragma once

#include <flowsim/core/clock.hpp>
#include <flowsim/core/types.hpp>
#include <flowsim/plant/asset.hpp>
#include <flowsim/plant/maintainable.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace flowsim::plant {

/// @brief Capacity-bounded scheduler of maintenance work orders.
///
/// Work orders queue in arrival order. Whenever capacity frees up the
/// queue is scanned front to back and every request that fits is started;
/// requests that do not fit are skipped, so a small request may start
/// before a larger one queued ahead of it.
///
/// A started order charges its cost to the Maintainer, calls
/// Maintainable::start_work(), and finishes after the target's work
/// duration with Maintainable::end_work().
///
/// @see Maintainable
/// @ingroup plant_maintenance
class Maintainer : public Asset {
public:
    Maintainer(core::Clock& clock, std::string name,
               double capacity = std::numeric_limits<double>::infinity());

    /// @brief Queue work on @p target unless the same (target, tag) pair is
    ///        already queued or in progress.
    /// @return False for a duplicate request.
    bool create_work_order(Maintainable& target, WorkTag tag = std::nullopt);

    [[nodiscard]] double capacity() const noexcept { return capacity_; }
    [[nodiscard]] double capacity_in_use() const noexcept { return in_use_; }

    [[nodiscard]] std::size_t queued_requests() const noexcept { return queue_.size(); }
    [[nodiscard]] std::size_t active_requests() const noexcept { return active_.size(); }
    [[nodiscard]] uint64_t completed_requests() const noexcept { return completed_; }

    [[nodiscard]] bool is_queued(const Maintainable& target, const WorkTag& tag = std::nullopt) const;
    [[nodiscard]] bool is_active(const Maintainable& target, const WorkTag& tag = std::nullopt) const;

private:
    struct WorkOrder {
        Maintainable* target;
        WorkTag tag;
        double capacity;
        core::TimePoint queued_at;
    };

    void try_working_requests();
    void start_work_order(Maintainable& target, const WorkTag& tag);
    void finish_work_order(Maintainable& target, const WorkTag& tag);

    double capacity_;
    double in_use_{0.0};
    uint64_t completed_{0};
    std::vector<WorkOrder> queue_;
    std::vector<WorkOrder> active_;
};

} // namespace flowsim::plant
