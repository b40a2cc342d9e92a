#pragma once

/// @file metrics.hpp
/// @brief Post-run metrics derived from a trace.
/// @ingroup io_metrics

#include <flowsim/io/trace_writers.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace flowsim::io {

/// @brief Part flow and lifecycle counters of one device.
/// @ingroup io_metrics
struct DeviceMetrics {
    uint64_t received_parts{0};  ///< Parts accepted (handlers, machines, buffers).
    uint64_t produced_parts{0};  ///< Cycles finished.
    uint64_t created_parts{0};   ///< Parts created (sources only).
    uint64_t shutdowns{0};
    uint64_t failures{0};
    uint64_t lost_parts{0};      ///< Input parts dropped by failures.
};

/// @brief What reached one sink.
/// @ingroup io_metrics
struct SinkMetrics {
    uint64_t collected_parts{0};
    double collected_value{0.0};
};

/// @brief Aggregated metrics of one run.
///
/// Keys of the maps are asset names, so the output is sorted by name.
///
/// @ingroup io_metrics
/// @see compute_metrics
struct LineMetrics {
    double end_time{0.0};  ///< Time of the last record.

    uint64_t created_parts{0};
    uint64_t collected_parts{0};
    double collected_value{0.0};
    uint64_t lost_parts{0};
    uint64_t failures{0};

    uint64_t completed_work_orders{0};
    double maintenance_cost{0.0};

    uint64_t event_failures{0};      ///< Actions that threw.
    uint64_t reservation_leaks{0};

    std::map<std::string, DeviceMetrics> devices;
    std::map<std::string, SinkMetrics> sinks;
    /// @brief Latest ledger value of every asset that recorded a change.
    std::map<std::string, double> asset_values;

    /// @brief Collected parts per time unit, 0 for an empty run.
    [[nodiscard]] double throughput() const {
        return end_time > 0.0 ? static_cast<double>(collected_parts) / end_time : 0.0;
    }
};

/// @brief Compute metrics from in-memory trace records.
/// @see MemoryTraceWriter
LineMetrics compute_metrics(const std::vector<TraceRecord>& traces);

/// @brief Read a JSON trace file and compute the same metrics.
/// @throws LoaderError If the file cannot be read or parsed.
/// @see JsonTraceWriter
LineMetrics compute_metrics_from_file(const std::filesystem::path& path);

} // namespace flowsim::io
