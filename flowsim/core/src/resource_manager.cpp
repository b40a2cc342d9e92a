#include <flowsim/core/resource_manager.hpp>
#include <flowsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace flowsim::core {

namespace {

// Absorbs rounding noise left by repeated fractional reserve/release.
constexpr double kAmountTolerance = 1e-9;

std::string describe(const ResourceRequest& amounts) {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, amount] : amounts) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += name + ": " + std::to_string(amount);
    }
    return out + "}";
}

} // namespace

// ============================================================================
// Reservation
// ============================================================================

Reservation::~Reservation() {
    if (manager_ && !reserved_.empty()) {
        manager_->report_leak(reserved_);
    }
}

Reservation::Reservation(Reservation&& other) noexcept
    : manager_(other.manager_)
    , reserved_(std::move(other.reserved_)) {
    other.manager_ = nullptr;
    other.reserved_.clear();
}

Reservation& Reservation::operator=(Reservation&& other) noexcept {
    if (this != &other) {
        if (manager_ && !reserved_.empty()) {
            manager_->report_leak(reserved_);
        }
        manager_ = other.manager_;
        reserved_ = std::move(other.reserved_);
        other.manager_ = nullptr;
        other.reserved_.clear();
    }
    return *this;
}

double Reservation::amount(std::string_view name) const {
    auto it = reserved_.find(name);
    return it == reserved_.end() ? 0.0 : it->second;
}

void Reservation::release() {
    if (reserved_.empty()) {
        return;
    }
    ResourceRequest returned = std::move(reserved_);
    reserved_.clear();
    manager_->return_amounts(returned);
}

void Reservation::release(const ResourceRequest& partial) {
    for (const auto& [name, amount] : partial) {
        auto it = reserved_.find(name);
        if (it == reserved_.end()) {
            if (amount == 0.0) {
                continue;
            }
            throw UnknownResourceError("Reservation holds no '" + name + "'");
        }
        if (amount < 0.0) {
            throw CapacityViolationError("Cannot release a negative amount of '" + name + "'");
        }
        if (amount > it->second + kAmountTolerance) {
            throw OverReleaseError("Releasing " + std::to_string(amount) + " of '" + name +
                                   "' but only " + std::to_string(it->second) + " is held");
        }
    }

    ResourceRequest returned;
    for (const auto& [name, amount] : partial) {
        auto it = reserved_.find(name);
        if (it == reserved_.end() || amount == 0.0) {
            continue;
        }
        double taken = std::min(amount, it->second);
        it->second -= taken;
        returned[name] = taken;
        if (it->second <= kAmountTolerance) {
            reserved_.erase(it);
        }
    }
    if (!returned.empty()) {
        manager_->return_amounts(returned);
    }
}

void Reservation::merge(Reservation&& other) {
    if (other.reserved_.empty()) {
        return;
    }
    if (manager_ == nullptr) {
        manager_ = other.manager_;
    } else if (manager_ != other.manager_) {
        throw CapacityViolationError("Cannot merge reservations of different resource managers");
    }
    for (const auto& [name, amount] : other.reserved_) {
        reserved_[name] += amount;
    }
    other.reserved_.clear();
    other.manager_ = nullptr;
}

// ============================================================================
// ResourceManager
// ============================================================================

ResourceManager::ResourceManager(Clock& clock)
    : clock_(clock)
    , actor_id_(clock.new_actor_id()) {}

void ResourceManager::add_resources(std::string_view name, double delta) {
    auto it = pools_.find(name);
    double current = it == pools_.end() ? 0.0 : it->second.capacity;
    if (current + delta < -kAmountTolerance) {
        throw CapacityViolationError("Capacity of '" + std::string(name) + "' would drop to " +
                                     std::to_string(current + delta));
    }
    if (it == pools_.end()) {
        it = pools_.emplace(std::string(name), Pool{}).first;
    }
    it->second.capacity = std::max(0.0, current + delta);
    trace_pool(it->first, it->second);
    schedule_waiter_check();
}

bool ResourceManager::fits(const ResourceRequest& request) const {
    for (const auto& [name, amount] : request) {
        if (amount < 0.0) {
            throw CapacityViolationError("Negative request for '" + name + "'");
        }
        if (amount == 0.0) {
            continue;
        }
        auto it = pools_.find(name);
        if (it == pools_.end()) {
            return false;
        }
        if (amount > it->second.capacity - it->second.in_use + kAmountTolerance) {
            return false;
        }
    }
    return true;
}

std::optional<Reservation> ResourceManager::reserve(const ResourceRequest& request) {
    if (!fits(request)) {
        return std::nullopt;
    }

    ResourceRequest taken;
    for (const auto& [name, amount] : request) {
        if (amount == 0.0) {
            continue;
        }
        auto& pool = pools_.find(name)->second;
        pool.in_use += amount;
        taken[name] = amount;
        trace_pool(name, pool);
    }
    return Reservation{*this, std::move(taken)};
}

void ResourceManager::reserve_with_callback(ResourceRequest request, WaiterCallback callback) {
    waiters_.push_back(Waiter{std::move(request), std::move(callback)});
    schedule_waiter_check();
}

double ResourceManager::capacity(std::string_view name) const {
    auto it = pools_.find(name);
    return it == pools_.end() ? 0.0 : it->second.capacity;
}

double ResourceManager::in_use(std::string_view name) const {
    auto it = pools_.find(name);
    return it == pools_.end() ? 0.0 : it->second.in_use;
}

double ResourceManager::available(std::string_view name) const {
    auto it = pools_.find(name);
    if (it == pools_.end()) {
        return 0.0;
    }
    return std::max(0.0, it->second.capacity - it->second.in_use);
}

void ResourceManager::return_amounts(const ResourceRequest& amounts) {
    for (const auto& [name, amount] : amounts) {
        auto it = pools_.find(name);
        if (it == pools_.end()) {
            throw UnknownResourceError("No resource pool named '" + name + "'");
        }
        it->second.in_use = std::max(0.0, it->second.in_use - amount);
        trace_pool(name, it->second);
    }
    schedule_waiter_check();
}

void ResourceManager::report_leak(const ResourceRequest& amounts) {
    if (leak_reports_suppressed_) {
        return;
    }
    ++leak_count_;
    clock_.trace([&](TraceWriter& w) {
        w.type("reservation_leak");
        w.field("amounts", describe(amounts));
    });
    if (leak_handler_) {
        leak_handler_(ReservationLeak{clock_.now(), amounts});
    }
}

void ResourceManager::schedule_waiter_check() {
    if (check_scheduled_ || waiters_.empty() || clock_.is_terminated()) {
        return;
    }
    check_scheduled_ = true;
    clock_.schedule(clock_.now(), actor_id_, [this]() { check_waiters(); },
                    EventPriority::OTHER_HIGH_PRIORITY, "resource waiter check");
}

void ResourceManager::check_waiters() {
    check_scheduled_ = false;

    // Callbacks may reserve (changing what fits for later waiters) and may
    // register new waiters, so the vector is re-read on every iteration.
    std::size_t i = 0;
    while (i < waiters_.size()) {
        if (!fits(waiters_[i].request)) {
            ++i;
            continue;
        }
        Waiter waiter = std::move(waiters_[i]);
        waiters_.erase(waiters_.begin() + static_cast<std::ptrdiff_t>(i));
        waiter.callback(waiter.request);
    }
}

void ResourceManager::trace_pool(std::string_view name, const Pool& pool) {
    clock_.trace([&](TraceWriter& w) {
        w.type("resource_update");
        w.field("resource", name);
        w.field("in_use", pool.in_use);
        w.field("capacity", pool.capacity);
    });
}

} // namespace flowsim::core
