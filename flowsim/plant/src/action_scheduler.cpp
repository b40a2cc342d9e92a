#include <flowsim/plant/action_scheduler.hpp>
#include <flowsim/plant/device.hpp>

#include <flowsim/core/error.hpp>
#include <flowsim/core/event.hpp>

#include <algorithm>
#include <utility>

namespace flowsim::plant {

ActionScheduler::ActionScheduler(core::Clock& clock, std::string name,
                                 std::vector<ScheduleStep> steps, bool cyclical)
    : Asset(clock, std::move(name))
    , steps_(std::move(steps))
    , cyclical_(cyclical) {
    if (steps_.empty()) {
        throw core::InvalidScheduleError("Schedule '" + this->name() + "' has no steps");
    }
    bool any_positive = false;
    for (const auto& step : steps_) {
        if (step.duration < core::Duration::zero()) {
            throw core::InvalidScheduleError("Schedule '" + this->name() +
                                             "' has a negative step duration");
        }
        any_positive = any_positive || step.duration > core::Duration::zero();
    }
    // A cycle of zero-length steps would never let time advance.
    if (cyclical_ && steps_.size() > 1 && !any_positive) {
        throw core::InvalidScheduleError("Cyclical schedule '" + this->name() +
                                         "' needs a positive step duration");
    }
}

bool ActionScheduler::register_action(std::string target, Action action) {
    if (is_registered(target)) {
        return false;
    }
    actions_.emplace_back(std::move(target), std::move(action));
    return true;
}

bool ActionScheduler::unregister_action(std::string_view target) {
    auto it = std::find_if(actions_.begin(), actions_.end(),
                           [&](const auto& entry) { return entry.first == target; });
    if (it == actions_.end()) {
        return false;
    }
    actions_.erase(it);
    return true;
}

bool ActionScheduler::is_registered(std::string_view target) const noexcept {
    return std::any_of(actions_.begin(), actions_.end(),
                       [&](const auto& entry) { return entry.first == target; });
}

void ActionScheduler::initialize() {
    if (initialized_) {
        throw core::InvalidStateError("Schedule '" + name() + "' initialized twice");
    }
    initialized_ = true;
    index_ = 0;
    enter_step();
}

void ActionScheduler::enter_step() {
    const double state = current_state();
    record("schedule_update", [&](core::TraceWriter& w) {
        w.field("step", static_cast<uint64_t>(index_));
        w.field("state", state);
    });

    // Copied: an action may register or unregister others.
    auto actions = actions_;
    for (auto& [target, action] : actions) {
        if (action) {
            action(*this, state);
        }
    }

    if (steps_.size() == 1 || (!cyclical_ && index_ + 1 == steps_.size())) {
        return;
    }
    clock().schedule(clock().now() + steps_[index_].duration, actor_id(), [this]() { advance(); },
                     core::EventPriority::OTHER_HIGH_PRIORITY, name() + ": schedule update");
}

void ActionScheduler::advance() {
    index_ = (index_ + 1) % steps_.size();
    enter_step();
}

bool gate_input_on_state(ActionScheduler& scheduler, Device& device) {
    return scheduler.register_action(device.name(), [&device](ActionScheduler&, double state) {
        device.set_block_input(state == 0.0);
    });
}

bool drive_resource_capacity(ActionScheduler& scheduler, core::ResourceManager& resources,
                             std::string resource) {
    std::string key = "resource:" + resource;
    return scheduler.register_action(
        std::move(key), [&resources, resource = std::move(resource)](ActionScheduler&, double state) {
            resources.add_resources(resource, state - resources.capacity(resource));
        });
}

} // namespace flowsim::plant
