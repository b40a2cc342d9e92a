#include <flowsim/plant/simulation.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace flowsim::core;
using namespace flowsim::plant;

class MachineTest : public ::testing::Test {
protected:
    TimePoint time(double u) { return time_from_units(u); }
    Duration units(double u) { return duration_from_units(u); }
    PartPtr part() { return std::make_unique<Part>(); }
};

TEST_F(MachineTest, SharedOperatorSerializesMachines) {
    Simulation sim;
    sim.resources().add_resources("operator", 1.0);
    auto& src = sim.add_source("src", part(), units(0.0), 2);
    auto& m1 = sim.add_machine("m1", {src.id()}, units(5.0), {{"operator", 1.0}});
    auto& m2 = sim.add_machine("m2", {src.id()}, units(5.0), {{"operator", 1.0}});
    auto& sink = sim.add_sink("sink", {m1.id(), m2.id()});
    std::vector<TimePoint> arrivals;
    sink.add_receive_part_callback(
        [&](PartHandler&, Part&) { arrivals.push_back(sim.clock().now()); });

    sim.run(units(20.0));

    ASSERT_EQ(arrivals.size(), 2u);
    EXPECT_EQ(arrivals[0], time(5.0));
    EXPECT_EQ(arrivals[1], time(10.0));
    // m1 is handed its second part while still holding the operator.
    EXPECT_EQ(m1.received_parts(), 2u);
    EXPECT_EQ(m2.received_parts(), 0u);
    EXPECT_DOUBLE_EQ(sim.resources().in_use("operator"), 0.0);
    EXPECT_FALSE(m1.holds_resources());
}

TEST_F(MachineTest, MachinesInSeriesShareOperatorWithoutDeadlock) {
    Simulation sim;
    sim.resources().add_resources("operator", 1.0);
    auto& src = sim.add_source("src", part(), units(0.0));
    auto& m1 = sim.add_machine("m1", {src.id()}, units(1.0), {{"operator", 1.0}});
    auto& m2 = sim.add_machine("m2", {m1.id()}, units(1.0), {{"operator", 1.0}});
    auto& sink = sim.add_sink("sink", {m2.id()});
    double peak = 0.0;
    m1.add_receive_part_callback([&](PartHandler&, Part&) {
        peak = std::max(peak, sim.resources().in_use("operator"));
    });
    m2.add_receive_part_callback([&](PartHandler&, Part&) {
        peak = std::max(peak, sim.resources().in_use("operator"));
        // m1 gave the operator back while its output waited for m2.
        EXPECT_FALSE(m1.holds_resources());
    });

    sim.run(units(20.0));

    EXPECT_GE(sink.received_parts(), 9u);
    EXPECT_GE(m2.received_parts(), sink.received_parts());
    EXPECT_LE(peak, 1.0);
    EXPECT_LE(sim.resources().in_use("operator"), 1.0);
}

TEST_F(MachineTest, WaitingMachineStartsWhenResourcesAppear) {
    Simulation sim;
    sim.resources().add_resources("tool", 0.0);
    auto& src = sim.add_source("src", part(), units(0.0), 1);
    auto& m = sim.add_machine("m", {src.id()}, units(2.0), {{"tool", 1.0}});
    auto& sink = sim.add_sink("sink", {m.id()});

    sim.run(units(5.0));
    EXPECT_EQ(m.received_parts(), 0u);

    sim.resources().add_resources("tool", 1.0);
    sim.run(units(5.0));

    EXPECT_EQ(m.received_parts(), 1u);
    EXPECT_EQ(sink.received_parts(), 1u);
    EXPECT_DOUBLE_EQ(sim.resources().in_use("tool"), 0.0);
}

TEST_F(MachineTest, FailureDropsInputPartAndReleasesResources) {
    Simulation sim;
    sim.resources().add_resources("operator", 1.0);
    auto& src = sim.add_source("src", part(), units(0.0), 1);
    auto& m = sim.add_machine("m", {src.id()}, units(10.0), {{"operator", 1.0}});
    auto& sink = sim.add_sink("sink", {m.id()});
    std::string lost_name;
    bool failure_seen = false;
    m.add_shutdown_callback([&](Device&, bool is_failure, Part* lost) {
        failure_seen = is_failure;
        if (lost != nullptr) {
            lost_name = lost->name();
        }
    });
    m.schedule_failure(time(4.0));

    sim.run(units(20.0));

    EXPECT_TRUE(failure_seen);
    EXPECT_EQ(lost_name, "part_0");
    EXPECT_EQ(m.state(), DeviceState::Failed);
    EXPECT_EQ(m.input_part(), nullptr);
    EXPECT_EQ(sink.received_parts(), 0u);
    EXPECT_DOUBLE_EQ(sim.resources().in_use("operator"), 0.0);
}

TEST_F(MachineTest, RestoreAfterFailureAcceptsNewParts) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(0.0), 2);
    auto& m = sim.add_machine("m", {src.id()}, units(10.0));
    auto& sink = sim.add_sink("sink", {m.id()});
    int restored = 0;
    m.add_restored_callback([&](Device&) { ++restored; });
    m.schedule_failure(time(4.0));

    sim.run(units(6.0));
    m.restore();
    sim.run(units(20.0));

    EXPECT_EQ(restored, 1);
    EXPECT_EQ(m.state(), DeviceState::Operational);
    EXPECT_EQ(sink.received_parts(), 1u);
    EXPECT_EQ(m.received_parts(), 2u);
}

TEST_F(MachineTest, UptimeAndUtilization) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(0.0), 1);
    auto& m = sim.add_machine("m", {src.id()}, units(10.0));
    (void)sim.add_sink("sink", {m.id()});
    m.schedule_failure(time(4.0));

    sim.run(units(20.0));
    m.restore();
    sim.run(units(5.0));

    EXPECT_EQ(m.uptime(), units(9.0));
    EXPECT_EQ(m.utilization_time(), units(4.0));
}

TEST_F(MachineTest, MaintenanceShutsMachineDown) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(0.0));
    auto& m = sim.add_machine("m", {src.id()}, units(1.0));
    auto& sink = sim.add_sink("sink", {m.id()});
    auto& crew = sim.add_maintainer("crew", 1.0);
    m.set_work_order_policy(WorkOrderPolicy{
        [this](const WorkTag&) { return units(3.0); },
        [](const WorkTag&) { return 1.0; },
        [](const WorkTag&) { return 7.0; },
    });

    EXPECT_TRUE(crew.create_work_order(m));
    sim.run(units(1.0));

    EXPECT_EQ(m.state(), DeviceState::Shutdown);
    EXPECT_EQ(crew.active_requests(), 1u);
    EXPECT_DOUBLE_EQ(crew.value(), -7.0);
    EXPECT_EQ(sink.received_parts(), 0u);

    sim.run(units(3.0));

    EXPECT_EQ(m.state(), DeviceState::Operational);
    EXPECT_EQ(crew.completed_requests(), 1u);
    EXPECT_DOUBLE_EQ(crew.capacity_in_use(), 0.0);

    sim.run(units(5.0));
    EXPECT_GT(sink.received_parts(), 0u);
}
