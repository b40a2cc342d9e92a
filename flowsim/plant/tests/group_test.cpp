#include <flowsim/core/error.hpp>
#include <flowsim/plant/simulation.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace flowsim::core;
using namespace flowsim::plant;

class GroupTest : public ::testing::Test {
protected:
    Duration units(double u) { return duration_from_units(u); }
};

TEST_F(GroupTest, PartsLeaveThroughThePathTheyEntered) {
    Simulation sim;
    auto& s1 = sim.add_source("s1", std::make_unique<Part>("a"), units(1.0), 2);
    auto& s2 = sim.add_source("s2", std::make_unique<Part>("b"), units(1.0), 2);
    auto& m = sim.add_machine("m", {}, units(2.0));
    auto& cell = sim.add_group("cell", {m.id()});
    auto& from_s1 = cell.add_path("from_s1", {s1.id()});
    auto& from_s2 = cell.add_path("from_s2", {s2.id()});
    auto& k1 = sim.add_sink("k1", {from_s1.id()}, true);
    auto& k2 = sim.add_sink("k2", {from_s2.id()}, true);

    sim.run(units(50.0));

    ASSERT_EQ(k1.collected_parts().size(), 2u);
    ASSERT_EQ(k2.collected_parts().size(), 2u);
    for (const auto& p : k1.collected_parts()) {
        EXPECT_EQ(p->name().substr(0, 2), "a_");
        EXPECT_EQ(p->group_depth(), 0u);
    }
    for (const auto& p : k2.collected_parts()) {
        EXPECT_EQ(p->name().substr(0, 2), "b_");
    }
    EXPECT_EQ(m.received_parts(), 4u);

    std::vector<DeviceId> expected{s1.id(), from_s1.id(), m.id(), k1.id()};
    EXPECT_EQ(k1.collected_parts()[0]->routing_history(), expected);
}

TEST_F(GroupTest, DefaultInputsAndOutputs) {
    Simulation sim;
    auto& a = sim.add_part_handler("a", {}, units(1.0));
    auto& b = sim.add_part_handler("b", {a.id()}, units(1.0));

    auto& cell = sim.add_group("cell", {a.id(), b.id()});

    EXPECT_EQ(cell.inputs(), std::vector<DeviceId>{a.id()});
    EXPECT_EQ(cell.outputs(), std::vector<DeviceId>{b.id()});
    EXPECT_EQ(a.groups(), std::vector<GroupId>{cell.id()});
    EXPECT_EQ(a.upstream(), std::vector<DeviceId>{cell.input().id()});
    EXPECT_EQ(cell.output().upstream(), std::vector<DeviceId>{b.id()});
}

TEST_F(GroupTest, MembersCannotBeWiredOutside) {
    Simulation sim;
    auto& src = sim.add_source("src", std::make_unique<Part>(), units(1.0));
    auto& a = sim.add_part_handler("a", {src.id()}, units(1.0));

    EXPECT_THROW((void)sim.add_group("cell", {a.id()}), TopologyError);
}

TEST_F(GroupTest, OutsideDevicesCannotWireToMembers) {
    Simulation sim;
    auto& a = sim.add_part_handler("a", {}, units(1.0));
    (void)sim.add_group("cell", {a.id()});

    EXPECT_THROW((void)sim.add_part_handler("x", {a.id()}, units(1.0)), TopologyError);
}

TEST_F(GroupTest, GroupsDoNotNest) {
    Simulation sim;
    auto& a = sim.add_part_handler("a", {}, units(1.0));
    auto& inner = sim.add_group("inner", {a.id()});
    auto& path = inner.add_path("into_inner");

    EXPECT_THROW((void)sim.add_group("outer", {a.id()}), TopologyError);
    EXPECT_THROW((void)sim.add_group("outer", {path.id()}), TopologyError);
}

TEST_F(GroupTest, BlockedPathRefusesParts) {
    Simulation sim;
    auto& src = sim.add_source("src", std::make_unique<Part>(), units(0.0), 1);
    auto& m = sim.add_part_handler("m", {}, units(1.0));
    auto& cell = sim.add_group("cell", {m.id()});
    auto& path = cell.add_path("p", {src.id()});
    (void)sim.add_sink("k", {path.id()});
    path.set_block_input(true);

    sim.run(units(5.0));

    EXPECT_EQ(m.received_parts(), 0u);
    ASSERT_NE(src.output_part(), nullptr);
    EXPECT_EQ(src.output_part()->group_depth(), 0u);
    EXPECT_EQ(src.output_part()->routing_history(), std::vector<DeviceId>{src.id()});
}

TEST_F(GroupTest, RejectedPathLeavesGroupUsable) {
    Simulation sim;
    auto& src = sim.add_source("src", std::make_unique<Part>(), units(1.0), 2);
    auto& h = sim.add_part_handler("h", {}, units(1.0));
    auto& cell = sim.add_group("cell", {h.id()});
    const auto devices_before = sim.device_count();

    EXPECT_THROW((void)cell.add_path("bad", {999}), OutOfRangeError);
    EXPECT_EQ(sim.device_count(), devices_before);
    EXPECT_TRUE(cell.paths().empty());

    auto& path = cell.add_path("p", {src.id()});
    auto& k = sim.add_sink("k", {path.id()});

    sim.run(units(10.0));

    ASSERT_EQ(cell.paths().size(), 1u);
    EXPECT_EQ(cell.paths()[0], &path);
    EXPECT_EQ(k.received_parts(), 2u);
}
