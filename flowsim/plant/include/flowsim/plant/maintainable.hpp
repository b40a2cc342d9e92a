#pragma once

#include <flowsim/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace flowsim::plant {

/// @brief Optional token distinguishing kinds of work on the same target.
/// @ingroup plant_maintenance
using WorkTag = std::optional<std::string>;

/// @brief Something a Maintainer can work on.
///
/// The Maintainer only talks to its targets through this interface: it
/// asks how much capacity, time and money a work order takes, and tells
/// the target when work starts and ends.
///
/// @see Maintainer, Machine
/// @ingroup plant_maintenance
class Maintainable {
public:
    virtual ~Maintainable() = default;

    /// @brief Name used in maintenance records.
    [[nodiscard]] virtual std::string_view maintainable_name() const = 0;

    [[nodiscard]] virtual core::Duration get_work_order_duration(const WorkTag& tag) = 0;
    [[nodiscard]] virtual double get_work_order_capacity(const WorkTag& tag) = 0;
    [[nodiscard]] virtual double get_work_order_cost(const WorkTag& tag) = 0;

    virtual void start_work(const WorkTag& tag) = 0;
    virtual void end_work(const WorkTag& tag) = 0;

protected:
    Maintainable() = default;
    Maintainable(const Maintainable&) = default;
    Maintainable& operator=(const Maintainable&) = default;
};

} // namespace flowsim::plant
