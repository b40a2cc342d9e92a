#pragma once

/// @defgroup io I/O Library
/// @brief Line loading, trace output and metrics.
///
/// Builds a plant::Simulation from a JSON line description, writes the
/// trace stream produced by a run (JSON, textual, in-memory) and computes
/// post-run metrics from it. Depends on core and plant.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief JSON line loader.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, fan-out and null trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Post-run throughput, failure and maintenance metrics.

#include <flowsim/io/error.hpp>
#include <flowsim/io/trace_writers.hpp>
#include <flowsim/io/line_loader.hpp>
#include <flowsim/io/metrics.hpp>
