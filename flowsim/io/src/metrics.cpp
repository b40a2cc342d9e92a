#include <flowsim/io/error.hpp>
#include <flowsim/io/metrics.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace flowsim::io {

namespace {

std::string get_string_field(const TraceRecord& record, const std::string& key) {
    auto it = record.fields.find(key);
    if (it != record.fields.end()) {
        if (const auto* val = std::get_if<std::string>(&it->second)) {
            return *val;
        }
    }
    return {};
}

double get_double_field(const TraceRecord& record, const std::string& key) {
    auto it = record.fields.find(key);
    if (it != record.fields.end()) {
        if (const auto* val = std::get_if<double>(&it->second)) {
            return *val;
        }
        if (const auto* val = std::get_if<uint64_t>(&it->second)) {
            return static_cast<double>(*val);
        }
    }
    return 0.0;
}

bool has_field(const TraceRecord& record, const std::string& key) {
    return record.fields.find(key) != record.fields.end();
}

} // namespace

LineMetrics compute_metrics(const std::vector<TraceRecord>& traces) {
    LineMetrics metrics;

    for (const auto& record : traces) {
        metrics.end_time = std::max(metrics.end_time, record.time);
        const std::string subject = get_string_field(record, "subject");

        if (record.type == "received_part") {
            ++metrics.devices[subject].received_parts;
        }
        else if (record.type == "produced_part") {
            ++metrics.devices[subject].produced_parts;
        }
        else if (record.type == "created_part") {
            ++metrics.devices[subject].created_parts;
            ++metrics.created_parts;
        }
        else if (record.type == "collected_part") {
            auto& sink = metrics.sinks[subject];
            double value = get_double_field(record, "part_value");
            ++sink.collected_parts;
            sink.collected_value += value;
            ++metrics.collected_parts;
            metrics.collected_value += value;
        }
        else if (record.type == "device_shutdown") {
            ++metrics.devices[subject].shutdowns;
        }
        else if (record.type == "device_failure") {
            auto& device = metrics.devices[subject];
            ++device.failures;
            ++metrics.failures;
            if (has_field(record, "lost_part_id")) {
                ++device.lost_parts;
                ++metrics.lost_parts;
            }
        }
        else if (record.type == "start_work_order") {
            metrics.maintenance_cost += get_double_field(record, "cost");
        }
        else if (record.type == "finish_work_order") {
            ++metrics.completed_work_orders;
        }
        else if (record.type == "value_change") {
            metrics.asset_values[subject] = get_double_field(record, "value");
        }
        else if (record.type == "event_failed") {
            ++metrics.event_failures;
        }
        else if (record.type == "reservation_leak") {
            ++metrics.reservation_leaks;
        }
    }

    return metrics;
}

LineMetrics compute_metrics_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    std::string json = oss.str();

    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsArray()) {
        throw LoaderError("trace file must be a JSON array", path.string());
    }

    std::vector<TraceRecord> traces;
    traces.reserve(doc.Size());

    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        if (!obj.IsObject()) {
            throw LoaderError("trace record must be an object",
                              path.string() + "[" + std::to_string(idx) + "]");
        }

        TraceRecord record;
        if (obj.HasMember("time") && obj["time"].IsNumber()) {
            record.time = obj["time"].GetDouble();
        }
        if (obj.HasMember("type") && obj["type"].IsString()) {
            record.type = obj["type"].GetString();
        }

        for (auto iter = obj.MemberBegin(); iter != obj.MemberEnd(); ++iter) {
            std::string key = iter->name.GetString();
            if (key == "time" || key == "type") {
                continue;
            }
            if (iter->value.IsDouble()) {
                record.fields[key] = iter->value.GetDouble();
            } else if (iter->value.IsUint64()) {
                record.fields[key] = iter->value.GetUint64();
            } else if (iter->value.IsNumber()) {
                record.fields[key] = iter->value.GetDouble();
            } else if (iter->value.IsString()) {
                record.fields[key] = std::string(iter->value.GetString());
            }
        }
        traces.push_back(std::move(record));
    }

    return compute_metrics(traces);
}

} // namespace flowsim::io
