#pragma once

#include <flowsim/plant/ids.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flowsim::plant {

/// @brief A unit of work flowing through the device graph.
///
/// A Part is owned by exactly one device at a time and moves between
/// devices as a `std::unique_ptr`. It carries a value accumulator, a
/// quality scalar, the ordered list of devices that accepted it, and a
/// stack of group-path return addresses used by routing groups.
///
/// Sources create parts by calling make_copy() on a template part.
/// Subclasses that carry extra state override make_copy() and call
/// init_copy() on the result.
///
/// @see Source, Group
/// @ingroup plant_parts
class Part {
public:
    explicit Part(std::string name = "part", double value = 0.0, double quality = 1.0);
    virtual ~Part() = default;

    Part(const Part&) = default;
    Part& operator=(const Part&) = default;

    /// @brief Simulation-wide identifier (0 until a Source assigns one).
    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    void assign_id(uint64_t id) noexcept { id_ = id; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] double value() const noexcept { return value_; }
    void set_value(double value) noexcept { value_ = value; }
    void add_value(double delta) noexcept { value_ += delta; }

    [[nodiscard]] double quality() const noexcept { return quality_; }
    void set_quality(double quality) noexcept { quality_ = quality; }

    /// @brief Devices that accepted this part, oldest first.
    [[nodiscard]] const std::vector<DeviceId>& routing_history() const noexcept {
        return routing_history_;
    }

    void add_routing_history(DeviceId device) { routing_history_.push_back(device); }

    /// @brief Undo the latest add_routing_history() (no-op when empty).
    void remove_last_routing_history() noexcept;

    /// @brief Push the group path the part entered a group through.
    void push_group_path(DeviceId path) { group_paths_.push_back(path); }

    /// @brief Pop the innermost group path, if any.
    std::optional<DeviceId> pop_group_path();

    [[nodiscard]] std::size_t group_depth() const noexcept { return group_paths_.size(); }

    /// @brief True once a Sink has absorbed the part.
    [[nodiscard]] bool is_collected() const noexcept { return collected_; }
    void mark_collected() noexcept { collected_ = true; }

    /// @brief Create a fresh logical copy.
    ///
    /// The copy keeps value and quality, is named `<name>_<n>` with an
    /// increasing n, and starts with no id, no routing history and no
    /// group stack.
    [[nodiscard]] virtual std::unique_ptr<Part> make_copy();

protected:
    /// @brief Reset the per-instance state of a freshly copied part.
    void init_copy(Part& copy);

private:
    uint64_t id_{0};
    std::string name_;
    double value_;
    double quality_;
    uint64_t copy_counter_{0};
    bool collected_{false};
    std::vector<DeviceId> routing_history_;
    std::vector<DeviceId> group_paths_;
};

/// @brief Exclusive ownership of a part.
/// @ingroup plant_parts
using PartPtr = std::unique_ptr<Part>;

} // namespace flowsim::plant
