#include <flowsim/plant/asset.hpp>

#include <utility>

namespace flowsim::plant {

Asset::Asset(core::Clock& clock, std::string name)
    : clock_(clock)
    , name_(std::move(name))
    , actor_id_(clock.new_actor_id()) {}

void Asset::add_value(std::string label, double delta) {
    value_ += delta;
    record("value_change", [&](core::TraceWriter& w) {
        w.field("label", std::string_view{label});
        w.field("delta", delta);
        w.field("value", value_);
    });
    value_history_.push_back(ValueChange{std::move(label), clock_.now(), delta, value_});
}

} // namespace flowsim::plant
