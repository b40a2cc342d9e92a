#include <flowsim/plant/part.hpp>

#include <utility>

namespace flowsim::plant {

Part::Part(std::string name, double value, double quality)
    : name_(std::move(name))
    , value_(value)
    , quality_(quality) {}

void Part::remove_last_routing_history() noexcept {
    if (!routing_history_.empty()) {
        routing_history_.pop_back();
    }
}

std::optional<DeviceId> Part::pop_group_path() {
    if (group_paths_.empty()) {
        return std::nullopt;
    }
    DeviceId path = group_paths_.back();
    group_paths_.pop_back();
    return path;
}

std::unique_ptr<Part> Part::make_copy() {
    auto copy = std::make_unique<Part>(*this);
    init_copy(*copy);
    return copy;
}

void Part::init_copy(Part& copy) {
    copy.id_ = 0;
    copy.name_ = name_ + "_" + std::to_string(copy_counter_++);
    copy.copy_counter_ = 0;
    copy.collected_ = false;
    copy.routing_history_.clear();
    copy.group_paths_.clear();
}

} // namespace flowsim::plant
