#include <flowsim/plant/maintainer.hpp>

#include <flowsim/core/error.hpp>
#include <flowsim/core/event.hpp>

#include <algorithm>
#include <utility>

namespace flowsim::plant {

namespace {

constexpr double kCapacityTolerance = 1e-9;

std::string_view tag_text(const WorkTag& tag) {
    return tag ? std::string_view{*tag} : std::string_view{};
}

} // namespace

Maintainer::Maintainer(core::Clock& clock, std::string name, double capacity)
    : Asset(clock, std::move(name))
    , capacity_(capacity) {
    if (capacity < 0.0) {
        throw core::CapacityViolationError("Maintainer '" + this->name() +
                                           "' needs a non-negative capacity");
    }
}

bool Maintainer::create_work_order(Maintainable& target, WorkTag tag) {
    if (is_queued(target, tag) || is_active(target, tag)) {
        return false;
    }

    double needed = target.get_work_order_capacity(tag);
    if (needed < 0.0) {
        throw core::CapacityViolationError("Work order on '" +
                                           std::string(target.maintainable_name()) +
                                           "' requests negative capacity");
    }

    record("enter_queue", [&](core::TraceWriter& w) {
        w.field("target", target.maintainable_name());
        w.field("tag", tag_text(tag));
        w.field("capacity", needed);
    });
    queue_.push_back(WorkOrder{&target, std::move(tag), needed, clock().now()});
    try_working_requests();
    return true;
}

bool Maintainer::is_queued(const Maintainable& target, const WorkTag& tag) const {
    return std::any_of(queue_.begin(), queue_.end(), [&](const WorkOrder& order) {
        return order.target == &target && order.tag == tag;
    });
}

bool Maintainer::is_active(const Maintainable& target, const WorkTag& tag) const {
    return std::any_of(active_.begin(), active_.end(), [&](const WorkOrder& order) {
        return order.target == &target && order.tag == tag;
    });
}

void Maintainer::try_working_requests() {
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->capacity > capacity_ - in_use_ + kCapacityTolerance) {
            ++it;
            continue;
        }

        WorkOrder order = std::move(*it);
        it = queue_.erase(it);
        in_use_ += order.capacity;

        Maintainable* target = order.target;
        WorkTag tag = order.tag;
        active_.push_back(std::move(order));
        clock().schedule(clock().now(), actor_id(),
                         [this, target, tag]() { start_work_order(*target, tag); },
                         core::EventPriority::START_WORK, name() + ": start work order");
    }
}

void Maintainer::start_work_order(Maintainable& target, const WorkTag& tag) {
    // Asked before start_work(): shutting the target down may change its answer.
    core::Duration duration = target.get_work_order_duration(tag);
    double cost = target.get_work_order_cost(tag);
    add_cost("work_order", cost);
    record("start_work_order", [&](core::TraceWriter& w) {
        w.field("target", target.maintainable_name());
        w.field("tag", tag_text(tag));
        w.field("cost", cost);
    });
    target.start_work(tag);

    clock().schedule(clock().now() + std::max(duration, core::Duration::zero()), actor_id(),
                     [this, &target, tag]() { finish_work_order(target, tag); },
                     core::EventPriority::FINISH_WORK, name() + ": finish work order");
}

void Maintainer::finish_work_order(Maintainable& target, const WorkTag& tag) {
    target.end_work(tag);

    auto it = std::find_if(active_.begin(), active_.end(), [&](const WorkOrder& order) {
        return order.target == &target && order.tag == tag;
    });
    if (it != active_.end()) {
        in_use_ = std::max(0.0, in_use_ - it->capacity);
        active_.erase(it);
    }
    ++completed_;
    record("finish_work_order", [&](core::TraceWriter& w) {
        w.field("target", target.maintainable_name());
        w.field("tag", tag_text(tag));
    });

    try_working_requests();
}

} // namespace flowsim::plant
