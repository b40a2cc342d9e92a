#pragma once

#include <flowsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace flowsim::core {

/// @brief Abstract interface for recording simulation datapoints.
/// @ingroup core
///
/// Implementations serialise simulation records to a specific format
/// (JSON, memory buffer, nothing at all). Each record is built
/// incrementally:
///   1. begin() -- opens a new record at a given simulation time
///   2. type()  -- sets the record category
///   3. field() -- (repeated) adds key/value payload fields
///   4. end()   -- closes and optionally flushes the record
///
/// Devices write records of the form `type = category`,
/// `subject = asset name`, followed by the payload.
///
/// The Clock holds an optional pointer to a TraceWriter. When no writer
/// is installed the overhead is a single null-pointer check.
///
/// @see Clock::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new record at the given simulation time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the category name for the current record.
    /// @param name A short identifier (e.g. `"received_part"`, `"device_failure"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace flowsim::core
