#pragma once

#include <cmath>
#include <compare>
#include <cstdint>
#include <limits>

namespace flowsim::core {

/// @brief Time interval in abstract simulation units.
///
/// Duration wraps a `double` with a private constructor. All construction
/// goes through named factories or bridge functions so that raw numbers
/// never silently turn into simulation time. The unit is whatever the model
/// author chooses (seconds, minutes, shifts); the kernel never converts.
///
/// @see duration_from_units, duration_to_units, TimePoint
/// @ingroup core_types
class Duration {
    double units_;

    explicit constexpr Duration(double units) noexcept : units_(units) {}

    friend constexpr Duration duration_from_units(double units) noexcept;
    friend constexpr double duration_to_units(Duration d) noexcept;
    friend constexpr Duration scale_duration(Duration d, double factor) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : units_(0.0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0.0}; }

    /// @brief Named factory returning an unbounded duration.
    static constexpr Duration infinity() noexcept {
        return Duration{std::numeric_limits<double>::infinity()};
    }

    /// @brief Return the raw unit count.
    [[nodiscard]] constexpr double units() const noexcept { return units_; }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{units_ + rhs.units_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{units_ - rhs.units_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        units_ += rhs.units_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        units_ -= rhs.units_;
        return *this;
    }

    constexpr Duration operator-() const noexcept { return Duration{-units_}; }

    /// @brief Three-way comparison (defaulted).
    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;

    /// @brief Equality comparison (defaulted).
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute simulation time as a Duration offset from time zero.
///
/// TimePoint +/- Duration yields a TimePoint, TimePoint - TimePoint yields a
/// Duration. Two TimePoints cannot be added.
///
/// @see time_from_units, time_to_units, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_units(double units) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch (time zero).
    static constexpr TimePoint epoch() noexcept { return TimePoint{Duration::zero()}; }

    /// @brief Return the duration elapsed since epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr TimePoint& operator-=(Duration d) noexcept {
        since_epoch_ -= d;
        return *this;
    }

    /// @brief Compute the duration between two time points.
    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

/// @brief Identifier of an event-scheduling actor.
///
/// Every object that schedules events (devices, maintainers, the resource
/// manager) owns one. Id 0 belongs to the Clock itself.
/// @ingroup core_types
using ActorId = uint64_t;

// ============================================================================
// Bridge functions
// ============================================================================

/// @brief Create a Duration from a value in simulation units.
[[nodiscard]] constexpr Duration duration_from_units(double units) noexcept {
    return Duration{units};
}

/// @brief Convert a Duration to simulation units.
[[nodiscard]] constexpr double duration_to_units(Duration d) noexcept {
    return d.units();
}

/// @brief Create a TimePoint from a value in units since epoch.
[[nodiscard]] constexpr TimePoint time_from_units(double units) noexcept {
    return TimePoint{duration_from_units(units)};
}

/// @brief Convert a TimePoint to units since epoch.
[[nodiscard]] constexpr double time_to_units(TimePoint tp) noexcept {
    return tp.time_since_epoch().units();
}

/// @brief Scale a Duration by a floating-point factor.
[[nodiscard]] constexpr Duration scale_duration(Duration d, double factor) noexcept {
    return Duration{d.units_ * factor};
}

/// @brief Compute the ratio of two Durations as a double.
/// @param a Numerator duration.
/// @param b Denominator duration (must not be zero).
[[nodiscard]] constexpr double duration_ratio(Duration a, Duration b) noexcept {
    return a.units() / b.units();
}

/// @brief True when @p tp is a finite, non-NaN time.
[[nodiscard]] inline bool is_finite(TimePoint tp) noexcept {
    return std::isfinite(time_to_units(tp));
}

} // namespace flowsim::core
