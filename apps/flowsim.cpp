#include <flowsim/core/error.hpp>
#include <flowsim/core/types.hpp>

#include <flowsim/plant/simulation.hpp>

#include <flowsim/io/error.hpp>
#include <flowsim/io/line_loader.hpp>
#include <flowsim/io/metrics.hpp>
#include <flowsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = flowsim::core;
namespace io = flowsim::io;

struct Config {
    std::string line_file;
    double duration{0.0};
    std::optional<uint64_t> seed;
    std::string output_file{"-"};
    std::string format{"json"};
    bool metrics{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("flowsim", "Discrete-event production line simulator");

    options.add_options()
        ("l,line", "Line description (JSON)", cxxopts::value<std::string>())
        ("d,duration", "Simulated time units to run", cxxopts::value<double>())
        ("s,seed", "Random seed (default: from the line file)", cxxopts::value<uint64_t>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("metrics", "Print metrics to stderr")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("line") == 0U) {
        std::cerr << "Error: --line is required" << std::endl;
        std::exit(64);
    }

    if (result.count("duration") == 0U) {
        std::cerr << "Error: --duration is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.line_file = result["line"].as<std::string>();
    config.duration = result["duration"].as<double>();
    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format: " << config.format << std::endl;
        std::exit(64);
    }
    if (!(config.duration >= 0.0)) {
        std::cerr << "Error: --duration must not be negative" << std::endl;
        std::exit(64);
    }

    return config;
}

void print_metrics(const io::LineMetrics& metrics) {
    std::cerr << std::fixed << std::setprecision(3);
    std::cerr << "end time:          " << metrics.end_time << "\n"
              << "created parts:     " << metrics.created_parts << "\n"
              << "collected parts:   " << metrics.collected_parts << "\n"
              << "collected value:   " << metrics.collected_value << "\n"
              << "throughput:        " << metrics.throughput() << "\n"
              << "failures:          " << metrics.failures << "\n"
              << "lost parts:        " << metrics.lost_parts << "\n"
              << "work orders:       " << metrics.completed_work_orders << "\n"
              << "maintenance cost:  " << metrics.maintenance_cost << "\n";

    for (const auto& [name, sink] : metrics.sinks) {
        std::cerr << "sink " << name << ": " << sink.collected_parts << " parts, value "
                  << sink.collected_value << "\n";
    }
    for (const auto& [name, device] : metrics.devices) {
        std::cerr << "device " << name << ": received " << device.received_parts
                  << ", produced " << device.produced_parts << ", failures "
                  << device.failures << "\n";
    }
    if (metrics.event_failures != 0U || metrics.reservation_leaks != 0U) {
        std::cerr << "event failures: " << metrics.event_failures
                  << ", reservation leaks: " << metrics.reservation_leaks << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading line from: " << config.line_file << std::endl;
        }

        // 1. Build the line
        auto line = io::load_line(config.line_file, config.seed);

        if (config.verbose) {
            std::cerr << "Loaded " << line.simulation->device_count() << " devices, "
                      << line.simulation->maintainer_count() << " maintainers" << std::endl;
        }

        // 2. Setup trace writer (the stream outlives the writer)
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        std::unique_ptr<core::TraceWriter> writer;

        if (config.format != "null" && config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*out);
        } else {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        }

        // 3. Keep a copy of the records when metrics are requested
        io::MemoryTraceWriter memory;
        io::FanoutTraceWriter fanout({writer.get()});
        if (config.metrics) {
            fanout.add(&memory);
        }
        line.simulation->set_trace_writer(&fanout);

        if (config.verbose) {
            std::cerr << "Starting simulation..." << std::endl;
        }

        // 4. Run, then close the trace whether or not the run succeeded
        auto close_trace = [&]() {
            line.simulation->set_trace_writer(nullptr);
            if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
                json->finalize();
            }
            out->flush();
        };
        try {
            line.simulation->run(core::duration_from_units(config.duration));
        } catch (const core::SimulationError&) {
            close_trace();
            throw;
        }
        close_trace();

        if (config.verbose) {
            std::cerr << "Simulation complete at time: "
                      << core::time_to_units(line.simulation->clock().now()) << std::endl;
        }

        if (config.metrics) {
            print_metrics(io::compute_metrics(memory.records()));
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation error: " << core::describe_exception_chain(e) << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << core::describe_exception_chain(e) << std::endl;
        return 1;
    }
}
