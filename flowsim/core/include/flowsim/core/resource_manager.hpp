#pragma once

#include <flowsim/core/clock.hpp>
#include <flowsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowsim::core {

class ResourceManager;

/// @brief Resource amounts keyed by pool name.
///
/// An ordered map keeps every iteration over a request deterministic.
/// @ingroup core_resources
using ResourceRequest = std::map<std::string, double, std::less<>>;

/// @brief Report handed to the leak handler when a Reservation is destroyed
///        while still holding resources.
/// @ingroup core_resources
struct ReservationLeak {
    TimePoint time;            ///< Simulation time of the destruction.
    ResourceRequest amounts;   ///< What was still held.
};

/// @brief Exclusive handle on reserved resource amounts.
///
/// A Reservation is move-only. Releasing returns amounts to their pools and
/// removes emptied entries. Destroying a Reservation that still holds
/// resources does not return them: the ResourceManager reports a
/// ReservationLeak instead, because an owner that forgets to release is a
/// modelling bug.
///
/// @see ResourceManager::reserve
/// @ingroup core_resources
class Reservation {
public:
    /// @brief An empty reservation bound to no manager.
    Reservation() = default;
    ~Reservation();

    Reservation(const Reservation&) = delete;
    Reservation& operator=(const Reservation&) = delete;
    Reservation(Reservation&& other) noexcept;
    Reservation& operator=(Reservation&& other) noexcept;

    /// @brief Amounts currently held, zero entries excluded.
    [[nodiscard]] const ResourceRequest& amounts() const noexcept { return reserved_; }

    /// @brief Amount held of one resource (0 if none).
    [[nodiscard]] double amount(std::string_view name) const;

    [[nodiscard]] bool empty() const noexcept { return reserved_.empty(); }

    /// @brief Return everything to the pools.
    void release();

    /// @brief Return part of the holdings.
    ///
    /// The whole request is validated before anything is returned.
    ///
    /// @throws UnknownResourceError if a name is not held.
    /// @throws OverReleaseError if an amount exceeds what is held.
    void release(const ResourceRequest& partial);

    /// @brief Take over the holdings of @p other, leaving it empty.
    /// @throws CapacityViolationError if the two come from different managers.
    void merge(Reservation&& other);

private:
    friend class ResourceManager;

    Reservation(ResourceManager& manager, ResourceRequest reserved)
        : manager_(&manager), reserved_(std::move(reserved)) {}

    ResourceManager* manager_{nullptr};
    ResourceRequest reserved_;
};

/// @brief Named resource pools with atomic multi-resource reservation.
///
/// Each pool tracks `{in_use, capacity}`. A reservation either takes every
/// requested amount or nothing. Callers that cannot wait synchronously
/// register a callback; whenever pool usage changes a single re-check event
/// is scheduled on the Clock, and waiters are re-tested in registration
/// order. A waiter whose request fits is invoked and forgotten: nothing is
/// held on its behalf, so it has to call reserve() itself.
///
/// @code
/// core::ResourceManager resources{clock};
/// resources.add_resources("operator", 2);
/// auto r = resources.reserve({{"operator", 1}});
/// if (r) { ...; r->release(); }
/// @endcode
///
/// @ingroup core_resources
class ResourceManager {
public:
    /// @brief Callback invoked once the waiter's request fits.
    using WaiterCallback = std::function<void(const ResourceRequest&)>;

    /// @brief Called for each leaked Reservation.
    using LeakHandler = std::function<void(const ReservationLeak&)>;

    explicit ResourceManager(Clock& clock);

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;
    ResourceManager(ResourceManager&&) = delete;
    ResourceManager& operator=(ResourceManager&&) = delete;

    /// @brief Change the capacity of a pool, creating it if needed.
    ///
    /// Capacity may drop below current usage; users simply cannot reserve
    /// more until enough is released.
    ///
    /// @throws CapacityViolationError if the capacity would become negative.
    void add_resources(std::string_view name, double delta);

    /// @brief Reserve every amount in @p request, or nothing.
    ///
    /// Zero amounts are ignored. A pool that was never created cannot
    /// satisfy a positive amount.
    ///
    /// @return The reservation, or nullopt if any amount does not fit.
    /// @throws CapacityViolationError for a negative amount.
    [[nodiscard]] std::optional<Reservation> reserve(const ResourceRequest& request);

    /// @brief Register a FIFO waiter for @p request.
    void reserve_with_callback(ResourceRequest request, WaiterCallback callback);

    [[nodiscard]] double capacity(std::string_view name) const;
    [[nodiscard]] double in_use(std::string_view name) const;

    /// @brief capacity - in_use, clamped at 0.
    [[nodiscard]] double available(std::string_view name) const;

    [[nodiscard]] std::size_t pending_waiters() const noexcept { return waiters_.size(); }

    /// @brief Number of reservations destroyed while holding resources.
    [[nodiscard]] std::size_t leaked_reservations() const noexcept { return leak_count_; }

    void set_leak_handler(LeakHandler handler) { leak_handler_ = std::move(handler); }

    /// @brief Stop reporting leaks (used while a simulation is torn down).
    void suppress_leak_reports() noexcept { leak_reports_suppressed_ = true; }

    /// @brief Actor id of the manager's re-check events.
    [[nodiscard]] ActorId actor_id() const noexcept { return actor_id_; }

private:
    friend class Reservation;

    struct Pool {
        double in_use{0.0};
        double capacity{0.0};
    };

    struct Waiter {
        ResourceRequest request;
        WaiterCallback callback;
    };

    [[nodiscard]] bool fits(const ResourceRequest& request) const;
    void return_amounts(const ResourceRequest& amounts);
    void report_leak(const ResourceRequest& amounts);
    void schedule_waiter_check();
    void check_waiters();
    void trace_pool(std::string_view name, const Pool& pool);

    Clock& clock_;
    ActorId actor_id_;
    std::map<std::string, Pool, std::less<>> pools_;
    std::vector<Waiter> waiters_;
    bool check_scheduled_{false};
    bool leak_reports_suppressed_{false};
    std::size_t leak_count_{0};
    LeakHandler leak_handler_;
};

} // namespace flowsim::core
