#include <flowsim/core/clock.hpp>
#include <flowsim/core/resource_manager.hpp>
#include <flowsim/core/types.hpp>

#include <flowsim/plant/simulation.hpp>

#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <vector>

using namespace flowsim::core;
using namespace flowsim::plant;

// ---------------------------------------------------------------------------
// BM_EventQueue: insert + pop N events
// ---------------------------------------------------------------------------

static void BM_EventQueue(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        Clock clock;
        auto actor = clock.new_actor_id();
        int fired = 0;
        for (int64_t i = 0; i < n; ++i) {
            double t = static_cast<double>(i + 1) * 0.001;
            clock.schedule(time_from_units(t), actor, [&fired]() { ++fired; });
        }
        state.ResumeTiming();

        clock.run(duration_from_units(static_cast<double>(n)));
        benchmark::DoNotOptimize(fired);
    }
}
BENCHMARK(BM_EventQueue)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_PauseResume: pause and resume one actor among many
// ---------------------------------------------------------------------------

static void BM_PauseResume(benchmark::State& state) {
    const int64_t n = state.range(0);
    Clock clock;
    std::vector<ActorId> actors;
    for (int64_t i = 0; i < n; ++i) {
        actors.push_back(clock.new_actor_id());
        clock.schedule(time_from_units(100.0 + static_cast<double>(i)), actors.back(), []() {});
    }

    for (auto _ : state) {
        clock.pause_matching(actors[0]);
        clock.resume_matching(actors[0]);
    }
}
BENCHMARK(BM_PauseResume)->Arg(100)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_Reservation: reserve + release a two-resource request
// ---------------------------------------------------------------------------

static void BM_Reservation(benchmark::State& state) {
    Clock clock;
    ResourceManager resources(clock);
    resources.add_resources("operator", 4);
    resources.add_resources("tool", 2);
    const ResourceRequest request{{"operator", 1.0}, {"tool", 1.0}};

    for (auto _ : state) {
        auto reservation = resources.reserve(request);
        benchmark::DoNotOptimize(reservation);
        reservation->release();
    }
}
BENCHMARK(BM_Reservation);

// ---------------------------------------------------------------------------
// BM_SerialLine: source -> N unit-cycle machines -> sink, no trace
// ---------------------------------------------------------------------------

static void BM_SerialLine(benchmark::State& state) {
    const int64_t stations = state.range(0);

    for (auto _ : state) {
        Simulation sim;
        DeviceId previous =
            sim.add_source("src", std::make_unique<Part>(), duration_from_units(1.0)).id();
        for (int64_t i = 0; i < stations; ++i) {
            previous = sim.add_machine("m" + std::to_string(i), {previous},
                                       duration_from_units(1.0))
                           .id();
        }
        auto& sink = sim.add_sink("sink", {previous});

        sim.run(duration_from_units(1000.0));
        benchmark::DoNotOptimize(sink.received_parts());
    }
}
BENCHMARK(BM_SerialLine)->Arg(5)->Arg(50);

BENCHMARK_MAIN();
