#pragma once

/// @file trace_writers.hpp
/// @brief Trace sinks: discard, JSON stream, memory buffer, text and fan-out.
/// @ingroup io_writers

#include <flowsim/core/trace_writer.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace flowsim::io {

/// @brief Value carried by a trace field.
using FieldValue = std::variant<double, uint64_t, std::string>;

/// @brief A trace record as kept in memory and fed to compute_metrics().
/// @ingroup io_writers
struct TraceRecord {
    double time{0.0};   ///< Simulation time in abstract units.
    std::string type;   ///< Category, e.g. "received_part".
    std::unordered_map<std::string, FieldValue> fields;
};

/// @brief Trace writer that discards every record.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint /*time*/) override {}
    void type(std::string_view /*name*/) override {}
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, uint64_t /*value*/) override {}
    void field(std::string_view /*key*/, std::string_view /*value*/) override {}
    void end() override {}
};

/// @brief Base for writers that need a whole record before writing it.
///
/// Collects the begin/type/field calls of one record, fields kept in the
/// order they were emitted, and hands the result to write_record() on end().
///
/// @ingroup io_writers
class RecordAssembler : public core::TraceWriter {
public:
    void begin(core::TimePoint time) final;
    void type(std::string_view name) final;
    void field(std::string_view key, double value) final;
    void field(std::string_view key, uint64_t value) final;
    void field(std::string_view key, std::string_view value) final;
    void end() final;

protected:
    struct Field {
        std::string key;
        FieldValue value;
    };

    virtual void write_record(double time, const std::string& type,
                              const std::vector<Field>& fields) = 0;

private:
    double time_{0.0};
    std::string type_;
    std::vector<Field> fields_;
};

/// @brief Streams the trace as a JSON array of flat objects.
///
/// Records are encoded with rapidjson, one object per line. The closing
/// bracket is written by finalize() or, failing that, by the destructor.
///
/// @ingroup io_writers
class JsonTraceWriter : public RecordAssembler {
public:
    /// @param output Must outlive the writer.
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;

    /// @brief Close the array. Later calls do nothing.
    void finalize();

protected:
    void write_record(double time, const std::string& type,
                      const std::vector<Field>& fields) override;

private:
    std::ostream& out_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::size_t written_{0};
    bool closed_{false};
};

/// @brief Keeps every record, for metrics and for tests.
/// @ingroup io_writers
class MemoryTraceWriter : public RecordAssembler {
public:
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }
    [[nodiscard]] std::vector<TraceRecord> records_of_type(std::string_view type) const;
    void clear() { records_.clear(); }

protected:
    void write_record(double time, const std::string& type,
                      const std::vector<Field>& fields) override;

private:
    std::vector<TraceRecord> records_;
};

/// @brief One aligned line per record:
///        `[      time] (+     delta)                type: key = value, ...`
///
/// The delta column is blank for the first record and for records at the
/// same instant as the previous one.
///
/// @ingroup io_writers
class TextualTraceWriter : public RecordAssembler {
public:
    explicit TextualTraceWriter(std::ostream& output)
        : out_(output) {}

protected:
    void write_record(double time, const std::string& type,
                      const std::vector<Field>& fields) override;

private:
    std::ostream& out_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool has_previous_{false};
    double previous_time_{0.0};
};

/// @brief Forwards every call to several writers it does not own.
/// @ingroup io_writers
class FanoutTraceWriter : public core::TraceWriter {
public:
    explicit FanoutTraceWriter(std::vector<core::TraceWriter*> writers)
        : writers_(std::move(writers)) {}

    void add(core::TraceWriter* writer) { writers_.push_back(writer); }

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    template <typename Call>
    void each(Call&& call) {
        for (auto* writer : writers_) {
            call(*writer);
        }
    }

    std::vector<core::TraceWriter*> writers_;
};

} // namespace flowsim::io
