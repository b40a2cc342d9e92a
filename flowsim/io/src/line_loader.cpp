#include <flowsim/io/error.hpp>
#include <flowsim/io/line_loader.hpp>

#include <flowsim/core/error.hpp>
#include <flowsim/core/event.hpp>
#include <flowsim/core/resource_manager.hpp>
#include <flowsim/plant/part.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace flowsim::io {

namespace {

using plant::DeviceId;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return member.GetString();
}

// Optional getters: absent means default, present with the wrong type is an error.
double get_double_or(const rapidjson::Value& val, const char* name, double default_val,
                     const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_double(val, name, context);
}

std::string get_string_or(const rapidjson::Value& val, const char* name, std::string default_val,
                          const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_string(val, name, context);
}

std::optional<uint64_t> get_optional_uint64(const rapidjson::Value& val, const char* name,
                                            const std::string& context) {
    if (!val.HasMember(name)) {
        return std::nullopt;
    }
    const auto& member = val[name];
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint64();
}

bool get_bool_or(const rapidjson::Value& val, const char* name, bool default_val,
                 const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

double non_negative(double value, const char* name, const std::string& context) {
    if (!(value >= 0.0)) {
        throw LoaderError(std::string("field '") + name + "' must not be negative", context);
    }
    return value;
}

/// Parsed timing: a constant, or a sampler drawing from the line's engine.
struct Timing {
    core::Duration fixed{};
    DurationSampler sampler;

    [[nodiscard]] bool is_random() const { return static_cast<bool>(sampler); }
    [[nodiscard]] core::Duration draw() const { return sampler ? sampler() : fixed; }
};

Timing parse_timing(const rapidjson::Value& val, const char* name, const std::string& context,
                    const std::shared_ptr<std::mt19937_64>& rng) {
    const auto& member = get_member(val, name, context);
    std::string ctx = context + "." + name;

    if (member.IsNumber()) {
        return Timing{core::duration_from_units(non_negative(member.GetDouble(), name, context)),
                      {}};
    }
    if (!member.IsObject()) {
        throw LoaderError("timing must be a number or an object", ctx);
    }

    if (member.HasMember("uniform")) {
        const auto& bounds = member["uniform"];
        if (!bounds.IsArray() || bounds.Size() != 2 || !bounds[0].IsNumber() ||
            !bounds[1].IsNumber()) {
            throw LoaderError("'uniform' must be an array of two numbers", ctx);
        }
        double low = bounds[0].GetDouble();
        double high = bounds[1].GetDouble();
        if (low < 0.0 || high < low) {
            throw LoaderError("'uniform' bounds must satisfy 0 <= a <= b", ctx);
        }
        return Timing{{}, [rng, low, high]() {
                          std::uniform_real_distribution<double> dist(low, high);
                          return core::duration_from_units(dist(*rng));
                      }};
    }
    if (member.HasMember("exponential")) {
        const auto& mean = member["exponential"];
        if (!mean.IsNumber() || mean.GetDouble() <= 0.0) {
            throw LoaderError("'exponential' mean must be a positive number", ctx);
        }
        double rate = 1.0 / mean.GetDouble();
        return Timing{{}, [rng, rate]() {
                          std::exponential_distribution<double> dist(rate);
                          return core::duration_from_units(dist(*rng));
                      }};
    }
    throw LoaderError("unknown timing kind (expected 'uniform' or 'exponential')", ctx);
}

core::ResourceRequest parse_request(const rapidjson::Value& val, const std::string& context) {
    if (!val.IsObject()) {
        throw LoaderError("resources must be an object of name: amount", context);
    }
    core::ResourceRequest request;
    for (auto iter = val.MemberBegin(); iter != val.MemberEnd(); ++iter) {
        if (!iter->value.IsNumber()) {
            throw LoaderError("resource amount must be a number", context);
        }
        request[iter->name.GetString()] =
            non_negative(iter->value.GetDouble(), iter->name.GetString(), context);
    }
    return request;
}

/// Random failures of one machine, with repair by a maintainer or by itself.
struct FailurePlan {
    Timing time_to_failure;
    Timing time_to_repair;
    plant::Maintainer* maintainer{nullptr};
    double capacity{0.0};
    double cost{0.0};
    bool failed{false};
};

void install_failures(plant::Simulation& sim, plant::Machine& machine,
                      std::shared_ptr<FailurePlan> plan) {
    auto& clock = sim.clock();

    if (plan->maintainer != nullptr) {
        machine.set_work_order_policy(plant::WorkOrderPolicy{
            [plan](const plant::WorkTag&) { return plan->time_to_repair.draw(); },
            [plan](const plant::WorkTag&) { return plan->capacity; },
            [plan](const plant::WorkTag&) { return plan->cost; },
        });
    }

    core::ActorId repair_actor = clock.new_actor_id();
    machine.add_shutdown_callback(
        [plan, &clock, repair_actor](plant::Device& device, bool is_failure, plant::Part*) {
            if (!is_failure) {
                return;
            }
            plan->failed = true;
            auto& failed_machine = static_cast<plant::Machine&>(device);
            if (plan->maintainer != nullptr) {
                (void)plan->maintainer->create_work_order(failed_machine, "repair");
                return;
            }
            clock.schedule(clock.now() + plan->time_to_repair.draw(), repair_actor,
                           [&failed_machine]() { failed_machine.restore(); },
                           core::EventPriority::RESTORE, failed_machine.name() + ": repaired");
        });

    machine.add_restored_callback([plan, &clock](plant::Device& device) {
        if (!plan->failed) {
            return;
        }
        plan->failed = false;
        auto& repaired = static_cast<plant::Machine&>(device);
        repaired.schedule_failure(clock.now() + plan->time_to_failure.draw(), "random failure");
    });

    machine.schedule_failure(clock.now() + plan->time_to_failure.draw(), "random failure");
}

plant::DecisionGate::Predicate parse_gate(const rapidjson::Value& obj, const std::string& ctx) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    double min_quality = get_double_or(obj, "min_quality", -inf, ctx);
    double max_quality = get_double_or(obj, "max_quality", inf, ctx);
    double min_value = get_double_or(obj, "min_value", -inf, ctx);
    double max_value = get_double_or(obj, "max_value", inf, ctx);
    return [=](const plant::Part& part) {
        return part.quality() >= min_quality && part.quality() <= max_quality &&
               part.value() >= min_value && part.value() <= max_value;
    };
}

/// Use a sampled timing: drawn once per part, when the part is received.
void install_cycle_sampler(plant::PartHandler& handler, const Timing& timing) {
    if (!timing.is_random()) {
        return;
    }
    DurationSampler sampler = timing.sampler;
    handler.add_receive_part_callback(
        [sampler](plant::PartHandler& h, plant::Part&) { h.set_cycle_time(sampler()); });
}

plant::Device& create_device(LoadedLine& line, const rapidjson::Value& obj,
                             const std::string& type, const std::string& name,
                             const std::string& ctx) {
    auto& sim = *line.simulation;

    if (type == "source") {
        std::string part_name = "part";
        double part_value = 0.0;
        double part_quality = 1.0;
        if (obj.HasMember("part")) {
            const auto& part = obj["part"];
            if (!part.IsObject()) {
                throw LoaderError("field 'part' must be an object", ctx);
            }
            part_name = get_string_or(part, "name", part_name, ctx + ".part");
            part_value = get_double_or(part, "value", part_value, ctx + ".part");
            part_quality = get_double_or(part, "quality", part_quality, ctx + ".part");
        }
        Timing cycle = parse_timing(obj, "cycle_time", ctx, line.rng);
        auto& source = sim.add_source(
            name, std::make_unique<plant::Part>(part_name, part_value, part_quality), cycle.draw(),
            get_optional_uint64(obj, "max_parts", ctx));
        if (cycle.is_random()) {
            // The next cycle starts once the finished part has left.
            DurationSampler sampler = cycle.sampler;
            source.add_finish_processing_callback(
                [sampler](plant::PartHandler& h, plant::Part&) { h.set_cycle_time(sampler()); });
        }
        return source;
    }
    if (type == "handler") {
        Timing cycle = parse_timing(obj, "cycle_time", ctx, line.rng);
        auto& handler = sim.add_part_handler(name, {}, cycle.fixed);
        install_cycle_sampler(handler, cycle);
        return handler;
    }
    if (type == "machine") {
        Timing cycle = parse_timing(obj, "cycle_time", ctx, line.rng);
        core::ResourceRequest request;
        if (obj.HasMember("resources")) {
            request = parse_request(obj["resources"], ctx + ".resources");
        }
        auto& machine = sim.add_machine(name, {}, cycle.fixed, std::move(request));
        install_cycle_sampler(machine, cycle);

        if (obj.HasMember("failure")) {
            const auto& failure = obj["failure"];
            std::string fctx = ctx + ".failure";
            if (!failure.IsObject()) {
                throw LoaderError("field 'failure' must be an object", ctx);
            }
            auto plan = std::make_shared<FailurePlan>();
            plan->time_to_failure = parse_timing(failure, "time_to_failure", fctx, line.rng);
            plan->time_to_repair = parse_timing(failure, "time_to_repair", fctx, line.rng);
            plan->capacity = non_negative(get_double_or(failure, "capacity", 0.0, fctx),
                                          "capacity", fctx);
            plan->cost = get_double_or(failure, "cost", 0.0, fctx);
            if (failure.HasMember("maintainer")) {
                std::string crew = get_string(failure, "maintainer", fctx);
                auto it = line.maintainers.find(crew);
                if (it == line.maintainers.end()) {
                    throw LoaderError("unknown maintainer '" + crew + "'", fctx);
                }
                plan->maintainer = it->second;
            }
            install_failures(sim, machine, std::move(plan));
        }
        return machine;
    }
    if (type == "buffer") {
        auto capacity = get_optional_uint64(obj, "capacity", ctx);
        double delay = non_negative(get_double_or(obj, "minimum_delay", 0.0, ctx),
                                    "minimum_delay", ctx);
        return sim.add_buffer(name, {},
                              capacity ? static_cast<std::size_t>(*capacity)
                                       : plant::Buffer::kUnlimited,
                              core::duration_from_units(delay));
    }
    if (type == "flow_controller") {
        return sim.add_flow_controller(name, {});
    }
    if (type == "gate") {
        return sim.add_decision_gate(name, {}, parse_gate(obj, ctx));
    }
    if (type == "sink") {
        Timing cycle;
        if (obj.HasMember("cycle_time")) {
            cycle = parse_timing(obj, "cycle_time", ctx, line.rng);
        }
        auto& sink = sim.add_sink(name, {}, get_bool_or(obj, "collect", false, ctx), cycle.fixed);
        install_cycle_sampler(sink, cycle);
        return sink;
    }
    throw LoaderError("unknown device type '" + type + "'", ctx);
}

void load_document(LoadedLine& line, const rapidjson::Document& doc) {
    auto& sim = *line.simulation;

    const std::string priority = get_string_or(doc, "downstream_priority", "longest_waiting", "line");
    if (priority == "wiring_order") {
        // Stable sort with an all-equal ordering keeps the wiring order.
        sim.set_downstream_priority([](const plant::Device&, const plant::Device&) { return false; });
    } else if (priority != "longest_waiting") {
        throw LoaderError("unknown downstream_priority '" + priority + "'", "line");
    }

    if (doc.HasMember("resources")) {
        auto pools = parse_request(doc["resources"], "resources");
        for (const auto& [name, capacity] : pools) {
            sim.resources().add_resources(name, capacity);
        }
    }

    if (doc.HasMember("maintainers")) {
        const auto& crews = doc["maintainers"];
        if (!crews.IsArray()) {
            throw LoaderError("field 'maintainers' must be an array", "line");
        }
        for (rapidjson::SizeType idx = 0; idx < crews.Size(); ++idx) {
            std::string ctx = "maintainers[" + std::to_string(idx) + "]";
            if (!crews[idx].IsObject()) {
                throw LoaderError("maintainer must be an object", ctx);
            }
            std::string name = get_string(crews[idx], "name", ctx);
            double capacity = non_negative(
                get_double_or(crews[idx], "capacity", std::numeric_limits<double>::infinity(), ctx),
                "capacity", ctx);
            if (line.maintainers.count(name) != 0U) {
                throw LoaderError("duplicate maintainer '" + name + "'", ctx);
            }
            line.maintainers.emplace(name, &sim.add_maintainer(name, capacity));
        }
    }

    const auto& devices = get_member(doc, "devices", "line");
    if (!devices.IsArray()) {
        throw LoaderError("field 'devices' must be an array", "line");
    }

    // Pass 1: create every device, so upstream names may point forward.
    for (rapidjson::SizeType idx = 0; idx < devices.Size(); ++idx) {
        const auto& obj = devices[idx];
        std::string ctx = "devices[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("device must be an object", ctx);
        }
        std::string name = get_string(obj, "name", ctx);
        std::string type = get_string(obj, "type", ctx);
        ctx += " '" + name + "'";
        if (line.devices.count(name) != 0U) {
            throw LoaderError("duplicate device name", ctx);
        }

        try {
            auto& device = create_device(line, obj, type, name, ctx);
            line.devices.emplace(name, device.id());
        } catch (const core::SimulationError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }

    // Pass 2: wire.
    for (rapidjson::SizeType idx = 0; idx < devices.Size(); ++idx) {
        const auto& obj = devices[idx];
        if (!obj.HasMember("upstream")) {
            continue;
        }
        std::string name = obj["name"].GetString();
        std::string ctx = "devices[" + std::to_string(idx) + "] '" + name + "'";
        const auto& names = obj["upstream"];
        if (!names.IsArray()) {
            throw LoaderError("field 'upstream' must be an array of names", ctx);
        }

        std::vector<DeviceId> upstream;
        for (rapidjson::SizeType u = 0; u < names.Size(); ++u) {
            if (!names[u].IsString()) {
                throw LoaderError("field 'upstream' must be an array of names", ctx);
            }
            auto it = line.devices.find(std::string_view{names[u].GetString()});
            if (it == line.devices.end()) {
                throw LoaderError("unknown upstream device '" + std::string(names[u].GetString()) +
                                      "'",
                                  ctx);
            }
            upstream.push_back(it->second);
        }

        try {
            sim.set_upstream(line.devices.at(name), std::move(upstream));
        } catch (const core::SimulationError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }

    if (doc.HasMember("schedules")) {
        load_schedules(line, doc["schedules"]);
    }
}

plant::ScheduleStep parse_step(const rapidjson::Value& v, const std::string& ctx) {
    if (!v.IsArray() || v.Size() != 2 || !v[0].IsNumber() || !(v[1].IsNumber() || v[1].IsBool())) {
        throw LoaderError("step must be [duration, state] with a numeric or boolean state", ctx);
    }
    double duration = non_negative(v[0].GetDouble(), "duration", ctx);
    double state = v[1].IsBool() ? (v[1].GetBool() ? 1.0 : 0.0) : v[1].GetDouble();
    return plant::ScheduleStep{core::duration_from_units(duration), state};
}

void load_schedules(LoadedLine& line, const rapidjson::Value& schedules) {
    if (!schedules.IsArray()) {
        throw LoaderError("field 'schedules' must be an array", "line");
    }
    auto& sim = *line.simulation;
    for (rapidjson::SizeType idx = 0; idx < schedules.Size(); ++idx) {
        const auto& obj = schedules[idx];
        std::string ctx = "schedules[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("schedule must be an object", ctx);
        }
        std::string name = get_string(obj, "name", ctx);
        ctx += " '" + name + "'";
        if (line.schedules.count(name) != 0U) {
            throw LoaderError("duplicate schedule", ctx);
        }

        const auto& list = get_member(obj, "steps", ctx);
        if (!list.IsArray()) {
            throw LoaderError("field 'steps' must be an array", ctx);
        }
        std::vector<plant::ScheduleStep> steps;
        for (rapidjson::SizeType s = 0; s < list.Size(); ++s) {
            steps.push_back(parse_step(list[s], ctx + ".steps[" + std::to_string(s) + "]"));
        }

        plant::ActionScheduler* scheduler = nullptr;
        try {
            scheduler = &sim.add_action_scheduler(name, std::move(steps),
                                                  get_bool_or(obj, "cyclical", true, ctx));
        } catch (const core::SimulationError& e) {
            throw LoaderError(e.what(), ctx);
        }
        line.schedules.emplace(name, scheduler);

        if (obj.HasMember("devices")) {
            const auto& names = obj["devices"];
            if (!names.IsArray()) {
                throw LoaderError("field 'devices' must be an array of names", ctx);
            }
            for (rapidjson::SizeType d = 0; d < names.Size(); ++d) {
                if (!names[d].IsString()) {
                    throw LoaderError("field 'devices' must be an array of names", ctx);
                }
                auto it = line.devices.find(std::string_view{names[d].GetString()});
                if (it == line.devices.end()) {
                    throw LoaderError("unknown device '" + std::string(names[d].GetString()) + "'",
                                      ctx);
                }
                if (!plant::gate_input_on_state(*scheduler, sim.device(it->second))) {
                    throw LoaderError("device '" + it->first + "' listed twice", ctx);
                }
            }
        }
        if (obj.HasMember("resource")) {
            (void)plant::drive_resource_capacity(*scheduler, sim.resources(),
                                                 get_string(obj, "resource", ctx));
        }
    }
}

uint64_t resolve_seed(const rapidjson::Document& doc, std::optional<uint64_t> seed) {
    if (seed) {
        return *seed;
    }
    if (!doc.HasMember("seed")) {
        return 0;
    }
    if (!doc["seed"].IsUint64()) {
        throw LoaderError("field 'seed' must be a non-negative integer", "line");
    }
    return doc["seed"].GetUint64();
}

} // anonymous namespace

plant::Device& LoadedLine::device(std::string_view name) const {
    auto it = devices.find(name);
    if (it == devices.end()) {
        throw LoaderError("no device named '" + std::string(name) + "'", "line");
    }
    return simulation->device(it->second);
}

LoadedLine load_line(const std::filesystem::path& path, std::optional<uint64_t> seed) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_line_from_string(oss.str(), seed);
}

LoadedLine load_line_from_string(std::string_view json, std::optional<uint64_t> seed) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "line");
    }

    uint64_t resolved = resolve_seed(doc, seed);
    LoadedLine line;
    line.simulation = std::make_unique<plant::Simulation>(resolved);
    // Separate stream from the clock's tie-breaks.
    line.rng = std::make_shared<std::mt19937_64>(resolved ^ 0x9E3779B97F4A7C15ULL);

    load_document(line, doc);
    return line;
}

} // namespace flowsim::io
