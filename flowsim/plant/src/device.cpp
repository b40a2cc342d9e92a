#include <flowsim/plant/device.hpp>
#include <flowsim/plant/simulation.hpp>

#include <flowsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace flowsim::plant {

bool longest_waiting_first(const Device& lhs, const Device& rhs) {
    auto lhs_since = lhs.waiting_since();
    auto rhs_since = rhs.waiting_since();
    if (lhs_since && rhs_since) {
        return *lhs_since < *rhs_since;
    }
    return lhs_since.has_value() && !rhs_since.has_value();
}

Device::Device(Simulation& simulation, DeviceId id, std::string name)
    : Asset(simulation.clock(), std::move(name))
    , simulation_(simulation)
    , id_(id) {}

Device::~Device() = default;

void Device::set_upstream(std::vector<DeviceId> upstream) {
    simulation_.set_upstream(id_, std::move(upstream));
}

void Device::set_block_input(bool blocked) {
    if (block_input_ == blocked) {
        return;
    }
    block_input_ = blocked;
    record(blocked ? "input_blocked" : "input_unblocked");
    if (!blocked && is_operational()) {
        notify_upstream_of_available_space();
    }
}

void Device::notify_upstream_of_available_space() {
    if (!waiting_since_) {
        waiting_since_ = clock().now();
    }
    for (DeviceId up : upstream_) {
        simulation_.device(up).space_available_downstream();
    }
}

void Device::shutdown() {
    if (state_ != DeviceState::Operational) {
        return;
    }
    state_ = DeviceState::Shutdown;
    clock().pause_matching(actor_id());
    waiting_since_.reset();
    on_shutdown(false);
    record("device_shutdown");

    for (auto& callback : shutdown_callbacks_) {
        callback(*this, false, nullptr);
    }
}

void Device::fail() {
    if (state_ == DeviceState::Failed) {
        return;
    }
    state_ = DeviceState::Failed;
    clock().cancel_matching(actor_id());
    waiting_since_.reset();

    PartPtr lost = release_input_part();
    on_shutdown(true);
    record("device_failure", [&](core::TraceWriter& w) {
        if (lost) {
            w.field("lost_part_id", lost->id());
            w.field("lost_part", std::string_view{lost->name()});
        }
    });

    for (auto& callback : shutdown_callbacks_) {
        callback(*this, true, lost.get());
    }
}

void Device::restore() {
    if (state_ == DeviceState::Operational) {
        return;
    }
    state_ = DeviceState::Operational;
    clock().resume_matching(actor_id());
    record("device_restored");
    on_restore();

    for (auto& callback : restored_callbacks_) {
        callback(*this);
    }
}

void Device::add_shutdown_callback(ShutdownCallback callback) {
    shutdown_callbacks_.push_back(std::move(callback));
}

void Device::add_restored_callback(RestoredCallback callback) {
    restored_callbacks_.push_back(std::move(callback));
}

void Device::set_downstream_priority(DownstreamPriority priority) {
    downstream_priority_ = std::move(priority);
}

void Device::initialize() {
    if (initialized_) {
        throw core::StateViolationError("Device '" + name() + "' initialized twice");
    }
    initialized_ = true;
    on_initialize();
}

std::vector<Device*> Device::sorted_downstream() {
    std::vector<Device*> devices;
    devices.reserve(downstream_.size());
    for (DeviceId down : downstream_) {
        devices.push_back(&simulation_.device(down));
    }

    const DownstreamPriority& priority =
        downstream_priority_ ? *downstream_priority_ : simulation_.downstream_priority();
    std::stable_sort(devices.begin(), devices.end(),
                     [&priority](const Device* lhs, const Device* rhs) {
                         return priority(*lhs, *rhs);
                     });
    return devices;
}

bool Device::offer_downstream(PartPtr& part) {
    for (Device* down : sorted_downstream()) {
        if (down->give_part(part)) {
            return true;
        }
    }
    return false;
}

} // namespace flowsim::plant
