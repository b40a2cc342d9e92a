#include <flowsim/io/error.hpp>
#include <flowsim/io/metrics.hpp>
#include <flowsim/io/trace_writers.hpp>
#include <flowsim/plant/simulation.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

using namespace flowsim::io;
using namespace flowsim::core;
using namespace flowsim::plant;

class MetricsTest : public ::testing::Test {
protected:
    std::vector<TraceRecord> create_trace_records() {
        std::vector<TraceRecord> traces;

        traces.push_back(TraceRecord{
            .time = 0.0,
            .type = "created_part",
            .fields = {{"subject", std::string("src")}, {"part_id", uint64_t{1}}}
        });
        traces.push_back(TraceRecord{
            .time = 1.0,
            .type = "received_part",
            .fields = {{"subject", std::string("lathe")}, {"part_id", uint64_t{1}}}
        });
        traces.push_back(TraceRecord{
            .time = 3.0,
            .type = "device_failure",
            .fields = {{"subject", std::string("lathe")},
                       {"lost_part_id", uint64_t{1}},
                       {"lost_part", std::string("blank")}}
        });
        traces.push_back(TraceRecord{
            .time = 3.0,
            .type = "start_work_order",
            .fields = {{"subject", std::string("crew")}, {"cost", 12.5}}
        });
        traces.push_back(TraceRecord{
            .time = 5.0,
            .type = "finish_work_order",
            .fields = {{"subject", std::string("crew")}}
        });
        traces.push_back(TraceRecord{
            .time = 8.0,
            .type = "collected_part",
            .fields = {{"subject", std::string("out")}, {"part_value", 4.0}}
        });
        traces.push_back(TraceRecord{
            .time = 10.0,
            .type = "collected_part",
            .fields = {{"subject", std::string("out")}, {"part_value", 4.0}}
        });

        return traces;
    }
};

// =============================================================================
// Record Dispatch Tests
// =============================================================================

TEST_F(MetricsTest, EmptyTrace) {
    auto metrics = compute_metrics({});

    EXPECT_EQ(metrics.collected_parts, 0u);
    EXPECT_EQ(metrics.failures, 0u);
    EXPECT_DOUBLE_EQ(metrics.end_time, 0.0);
    EXPECT_DOUBLE_EQ(metrics.throughput(), 0.0);
    EXPECT_TRUE(metrics.devices.empty());
}

TEST_F(MetricsTest, CountsPartFlow) {
    auto metrics = compute_metrics(create_trace_records());

    EXPECT_EQ(metrics.created_parts, 1u);
    EXPECT_EQ(metrics.devices.at("src").created_parts, 1u);
    EXPECT_EQ(metrics.devices.at("lathe").received_parts, 1u);

    EXPECT_EQ(metrics.collected_parts, 2u);
    EXPECT_DOUBLE_EQ(metrics.collected_value, 8.0);
    EXPECT_EQ(metrics.sinks.at("out").collected_parts, 2u);
    EXPECT_DOUBLE_EQ(metrics.end_time, 10.0);
    EXPECT_DOUBLE_EQ(metrics.throughput(), 0.2);
}

TEST_F(MetricsTest, CountsFailuresAndLostParts) {
    auto traces = create_trace_records();
    traces.push_back(TraceRecord{
        .time = 11.0,
        .type = "device_failure",
        .fields = {{"subject", std::string("lathe")}}
    });

    auto metrics = compute_metrics(traces);

    EXPECT_EQ(metrics.failures, 2u);
    EXPECT_EQ(metrics.lost_parts, 1u);
    EXPECT_EQ(metrics.devices.at("lathe").failures, 2u);
    EXPECT_EQ(metrics.devices.at("lathe").lost_parts, 1u);
}

TEST_F(MetricsTest, MaintenanceCost) {
    auto metrics = compute_metrics(create_trace_records());

    EXPECT_EQ(metrics.completed_work_orders, 1u);
    EXPECT_DOUBLE_EQ(metrics.maintenance_cost, 12.5);
}

TEST_F(MetricsTest, KeepsLatestAssetValue) {
    std::vector<TraceRecord> traces{
        {.time = 1.0, .type = "value_change",
         .fields = {{"subject", std::string("out")}, {"value", 3.0}}},
        {.time = 2.0, .type = "value_change",
         .fields = {{"subject", std::string("out")}, {"value", 7.0}}},
        {.time = 2.0, .type = "value_change",
         .fields = {{"subject", std::string("src")}, {"value", -7.0}}},
    };

    auto metrics = compute_metrics(traces);

    EXPECT_DOUBLE_EQ(metrics.asset_values.at("out"), 7.0);
    EXPECT_DOUBLE_EQ(metrics.asset_values.at("src"), -7.0);
}

TEST_F(MetricsTest, CountsClockDiagnostics) {
    std::vector<TraceRecord> traces{
        {.time = 1.0, .type = "event_failed", .fields = {}},
        {.time = 1.0, .type = "reservation_leak", .fields = {}},
        {.time = 2.0, .type = "reservation_leak", .fields = {}},
    };

    auto metrics = compute_metrics(traces);

    EXPECT_EQ(metrics.event_failures, 1u);
    EXPECT_EQ(metrics.reservation_leaks, 2u);
}

// =============================================================================
// From a Simulation Run
// =============================================================================

TEST_F(MetricsTest, MetricsOfSimulatedLine) {
    MemoryTraceWriter writer;
    Simulation sim;
    sim.set_trace_writer(&writer);

    auto& src = sim.add_source("src", std::make_unique<Part>("blank", 2.0),
                               duration_from_units(1.0), 3);
    auto& lathe = sim.add_machine("lathe", {src.id()}, duration_from_units(1.0));
    sim.add_sink("out", {lathe.id()});

    sim.run(duration_from_units(20.0));
    auto metrics = compute_metrics(writer.records());

    EXPECT_EQ(metrics.created_parts, 3u);
    EXPECT_EQ(metrics.collected_parts, 3u);
    EXPECT_DOUBLE_EQ(metrics.collected_value, 6.0);
    EXPECT_EQ(metrics.devices.at("lathe").received_parts, 3u);
    EXPECT_EQ(metrics.devices.at("lathe").produced_parts, 3u);
    EXPECT_DOUBLE_EQ(metrics.asset_values.at("out"), 6.0);
    EXPECT_DOUBLE_EQ(metrics.asset_values.at("src"), -6.0);

    // Last part reaches the sink at t=4.
    EXPECT_DOUBLE_EQ(metrics.end_time, 4.0);
    EXPECT_DOUBLE_EQ(metrics.throughput(), 0.75);
}

// =============================================================================
// File Input
// =============================================================================

TEST_F(MetricsTest, ComputeMetricsFromFile) {
    auto tmp_path = std::filesystem::temp_directory_path() / "flowsim_test_trace.json";
    {
        std::ofstream ofs(tmp_path);
        ofs << R"([{"time": 0, "type": "created_part", "subject": "src", "part_id": 1},)"
            << R"({"time": 2.5, "type": "collected_part", "subject": "out", "part_value": 1.5}])";
    }

    auto metrics = compute_metrics_from_file(tmp_path);
    EXPECT_EQ(metrics.created_parts, 1u);
    EXPECT_EQ(metrics.collected_parts, 1u);
    EXPECT_DOUBLE_EQ(metrics.collected_value, 1.5);
    EXPECT_DOUBLE_EQ(metrics.end_time, 2.5);

    std::filesystem::remove(tmp_path);
}

TEST_F(MetricsTest, ComputeMetricsFromFileMissing) {
    EXPECT_THROW(compute_metrics_from_file("/nonexistent/trace.json"), LoaderError);
}

TEST_F(MetricsTest, ComputeMetricsFromFileRejectsObjects) {
    auto tmp_path = std::filesystem::temp_directory_path() / "flowsim_test_bad_trace.json";
    {
        std::ofstream ofs(tmp_path);
        ofs << R"({"time": 0})";
    }

    EXPECT_THROW(compute_metrics_from_file(tmp_path), LoaderError);
    std::filesystem::remove(tmp_path);
}
