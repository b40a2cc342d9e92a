#pragma once

#include <flowsim/core/clock.hpp>
#include <flowsim/core/trace_writer.hpp>
#include <flowsim/core/types.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowsim::plant {

/// @brief One entry of an asset's value history.
/// @ingroup plant_graph
struct ValueChange {
    std::string label;     ///< What caused the change.
    core::TimePoint time;  ///< When it happened.
    double delta;          ///< Signed change (costs are negative).
    double value;          ///< Value after the change.
};

/// @brief Named simulation participant with an actor id and a value ledger.
///
/// Devices and maintainers are assets. Each owns one actor id on the
/// Clock so its events can be cancelled or paused together, and keeps an
/// append-only history of value changes.
///
/// @ingroup plant_graph
class Asset {
public:
    Asset(core::Clock& clock, std::string name);
    virtual ~Asset() = default;

    Asset(const Asset&) = delete;
    Asset& operator=(const Asset&) = delete;
    Asset(Asset&&) = delete;
    Asset& operator=(Asset&&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] core::ActorId actor_id() const noexcept { return actor_id_; }

    [[nodiscard]] double value() const noexcept { return value_; }
    [[nodiscard]] const std::vector<ValueChange>& value_history() const noexcept {
        return value_history_;
    }

    /// @brief Add @p delta to the value and log it under @p label.
    void add_value(std::string label, double delta);

    /// @brief Same as add_value(label, -cost).
    void add_cost(std::string label, double cost) { add_value(std::move(label), -cost); }

protected:
    [[nodiscard]] core::Clock& clock() noexcept { return clock_; }
    [[nodiscard]] const core::Clock& clock() const noexcept { return clock_; }

    /// @brief Write a `(category, subject, payload)` datapoint.
    /// @tparam F Callable with signature void(core::TraceWriter&) adding payload fields.
    template<typename F>
    void record(std::string_view category, F&& payload);

    void record(std::string_view category) {
        record(category, [](core::TraceWriter&) {});
    }

private:
    core::Clock& clock_;
    std::string name_;
    core::ActorId actor_id_;
    double value_{0.0};
    std::vector<ValueChange> value_history_;
};

template<typename F>
void Asset::record(std::string_view category, F&& payload) {
    clock_.trace([&](core::TraceWriter& w) {
        w.type(category);
        w.field("subject", std::string_view{name_});
        payload(w);
    });
}

} // namespace flowsim::plant
