#include <flowsim/io/trace_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <iomanip>
#include <sstream>
#include <utility>

namespace flowsim::io {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

void RecordAssembler::begin(core::TimePoint time) {
    time_ = core::time_to_units(time);
    type_.clear();
    fields_.clear();
}

void RecordAssembler::type(std::string_view name) {
    type_.assign(name);
}

void RecordAssembler::field(std::string_view key, double value) {
    fields_.push_back({std::string(key), value});
}

void RecordAssembler::field(std::string_view key, uint64_t value) {
    fields_.push_back({std::string(key), value});
}

void RecordAssembler::field(std::string_view key, std::string_view value) {
    fields_.push_back({std::string(key), std::string(value)});
}

void RecordAssembler::end() {
    write_record(time_, type_, fields_);
}

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : out_(output) {
    out_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::write_record(double time, const std::string& type,
                                   const std::vector<Field>& fields) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("time");
    writer.Double(time);
    writer.Key("type");
    writer.String(type.data(), static_cast<rapidjson::SizeType>(type.size()));
    for (const auto& [key, value] : fields) {
        writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
        std::visit(overloaded{
                       [&writer](double v) { writer.Double(v); },
                       [&writer](uint64_t v) { writer.Uint64(v); },
                       [&writer](const std::string& v) {
                           writer.String(v.data(), static_cast<rapidjson::SizeType>(v.size()));
                       },
                   },
                   value);
    }
    writer.EndObject();

    if (written_++ != 0) {
        out_ << ",\n";
    }
    out_ << "  " << buffer.GetString();
}

void JsonTraceWriter::finalize() {
    if (closed_) {
        return;
    }
    closed_ = true;
    out_ << (written_ != 0 ? "\n]\n" : "]\n");
    out_.flush();
}

void MemoryTraceWriter::write_record(double time, const std::string& type,
                                     const std::vector<Field>& fields) {
    TraceRecord record{time, type, {}};
    for (const auto& [key, value] : fields) {
        record.fields[key] = value;
    }
    records_.push_back(std::move(record));
}

std::vector<TraceRecord> MemoryTraceWriter::records_of_type(std::string_view type) const {
    std::vector<TraceRecord> matching;
    for (const auto& record : records_) {
        if (record.type == type) {
            matching.push_back(record);
        }
    }
    return matching;
}

void TextualTraceWriter::write_record(double time, const std::string& type,
                                      const std::vector<Field>& fields) {
    std::ostringstream line;
    line << std::fixed << std::setprecision(5) << '[' << std::setw(10) << time << "] ";
    if (has_previous_ && time != previous_time_) {
        line << "(+" << std::setw(10) << time - previous_time_ << ") ";
    } else {
        line << "(           ) ";
    }
    line << std::setw(22) << type << ':';

    line << std::defaultfloat << std::setprecision(10);
    const char* separator = " ";
    for (const auto& [key, value] : fields) {
        line << separator << key << " = ";
        std::visit([&line](const auto& v) { line << v; }, value);
        separator = ", ";
    }

    out_ << line.str() << '\n';
    has_previous_ = true;
    previous_time_ = time;
}

void FanoutTraceWriter::begin(core::TimePoint time) {
    each([&](core::TraceWriter& w) { w.begin(time); });
}

void FanoutTraceWriter::type(std::string_view name) {
    each([&](core::TraceWriter& w) { w.type(name); });
}

void FanoutTraceWriter::field(std::string_view key, double value) {
    each([&](core::TraceWriter& w) { w.field(key, value); });
}

void FanoutTraceWriter::field(std::string_view key, uint64_t value) {
    each([&](core::TraceWriter& w) { w.field(key, value); });
}

void FanoutTraceWriter::field(std::string_view key, std::string_view value) {
    each([&](core::TraceWriter& w) { w.field(key, value); });
}

void FanoutTraceWriter::end() {
    each([](core::TraceWriter& w) { w.end(); });
}

} // namespace flowsim::io
