#include <flowsim/core/error.hpp>
#include <flowsim/plant/simulation.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace flowsim::core;
using namespace flowsim::plant;

class BufferTest : public ::testing::Test {
protected:
    TimePoint time(double u) { return time_from_units(u); }
    Duration units(double u) { return duration_from_units(u); }
    PartPtr part() { return std::make_unique<Part>(); }
};

TEST_F(BufferTest, PassesPartsInArrivalOrder) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(1.0), 3);
    auto& buf = sim.add_buffer("buf", {src.id()});
    auto& sink = sim.add_sink("sink", {buf.id()}, true);

    sim.run(units(10.0));

    ASSERT_EQ(sink.collected_parts().size(), 3u);
    EXPECT_EQ(sink.collected_parts()[0]->name(), "part_0");
    EXPECT_EQ(sink.collected_parts()[1]->name(), "part_1");
    EXPECT_EQ(sink.collected_parts()[2]->name(), "part_2");
    EXPECT_EQ(buf.passed_parts(), 3u);
    EXPECT_EQ(buf.level(), 0u);
}

TEST_F(BufferTest, CapacityBoundsTheQueue) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(0.0));
    auto& buf = sim.add_buffer("buf", {src.id()}, 2);
    auto& h = sim.add_part_handler("h", {buf.id()}, units(10.0));
    (void)sim.add_sink("sink", {h.id()});

    sim.run(units(1.0));

    EXPECT_EQ(buf.level(), 2u);
    EXPECT_EQ(buf.passed_parts(), 1u);
    ASSERT_NE(h.input_part(), nullptr);
    EXPECT_EQ(h.input_part()->name(), "part_0");

    auto contents = buf.contents();
    ASSERT_EQ(contents.size(), 2u);
    EXPECT_EQ(contents[0]->name(), "part_1");
    EXPECT_EQ(contents[1]->name(), "part_2");
}

TEST_F(BufferTest, MinimumDelayCountsFromEntry) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(3.0), 1);
    auto& buf = sim.add_buffer("buf", {src.id()}, Buffer::kUnlimited, units(5.0));
    auto& sink = sim.add_sink("sink", {buf.id()});
    std::vector<TimePoint> arrivals;
    sink.add_receive_part_callback(
        [&](PartHandler&, Part&) { arrivals.push_back(sim.clock().now()); });

    sim.run(units(20.0));

    ASSERT_EQ(arrivals.size(), 1u);
    EXPECT_GE(arrivals[0], time(8.0));
    EXPECT_LE(arrivals[0], time(8.0) + units(1e-6));
}

TEST_F(BufferTest, TinyDelayStillProgresses) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(1.0), 2);
    auto& buf = sim.add_buffer("buf", {src.id()}, Buffer::kUnlimited, units(1e-300));
    auto& sink = sim.add_sink("sink", {buf.id()});

    sim.run(units(5.0));

    EXPECT_EQ(sink.received_parts(), 2u);
}

TEST_F(BufferTest, ZeroCapacityIsRejected) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(1.0));
    EXPECT_THROW((void)sim.add_buffer("buf", {src.id()}, 0), TopologyError);
}

TEST_F(BufferTest, FailureKeepsStoredParts) {
    Simulation sim;
    auto& src = sim.add_source("src", part(), units(0.0), 2);
    auto& buf = sim.add_buffer("buf", {src.id()});
    auto& sink = sim.add_sink("sink", {buf.id()});
    sink.set_block_input(true);

    sim.run(units(1.0));
    ASSERT_EQ(buf.level(), 2u);

    bool lost_reported = false;
    buf.add_shutdown_callback([&](Device&, bool is_failure, Part* lost) {
        EXPECT_TRUE(is_failure);
        lost_reported = lost != nullptr;
    });
    buf.fail();
    EXPECT_EQ(buf.level(), 2u);
    EXPECT_FALSE(lost_reported);

    sink.set_block_input(false);
    sim.run(units(1.0));
    EXPECT_EQ(sink.received_parts(), 0u);

    buf.restore();
    sim.run(units(1.0));
    EXPECT_EQ(sink.received_parts(), 2u);
    EXPECT_EQ(buf.level(), 0u);
}
