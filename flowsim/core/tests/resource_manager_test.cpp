#include <flowsim/core/error.hpp>
#include <flowsim/core/resource_manager.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace flowsim::core;

class ResourceManagerTest : public ::testing::Test {
protected:
    Clock clock{7};
    ResourceManager resources{clock};

    void settle() {
        // Waiter re-checks run as events at the current time
        while (clock.step()) {
        }
    }
};

TEST_F(ResourceManagerTest, AddResourcesCreatesPool) {
    resources.add_resources("operator", 3);

    EXPECT_DOUBLE_EQ(resources.capacity("operator"), 3.0);
    EXPECT_DOUBLE_EQ(resources.in_use("operator"), 0.0);
    EXPECT_DOUBLE_EQ(resources.available("operator"), 3.0);
    EXPECT_DOUBLE_EQ(resources.capacity("unknown"), 0.0);
}

TEST_F(ResourceManagerTest, NegativeCapacityIsRejected) {
    resources.add_resources("crane", 1);

    EXPECT_THROW(resources.add_resources("crane", -2), CapacityViolationError);
    EXPECT_DOUBLE_EQ(resources.capacity("crane"), 1.0);
}

TEST_F(ResourceManagerTest, ReserveIsAllOrNothing) {
    resources.add_resources("a", 3);
    resources.add_resources("b", 1);

    auto r = resources.reserve({{"a", 2}, {"b", 2}});

    EXPECT_FALSE(r.has_value());
    EXPECT_DOUBLE_EQ(resources.in_use("a"), 0.0);
    EXPECT_DOUBLE_EQ(resources.in_use("b"), 0.0);
}

TEST_F(ResourceManagerTest, ReserveTakesEveryAmount) {
    resources.add_resources("a", 3);
    resources.add_resources("b", 1);

    auto r = resources.reserve({{"a", 2}, {"b", 1}});

    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(resources.in_use("a"), 2.0);
    EXPECT_DOUBLE_EQ(resources.in_use("b"), 1.0);
    EXPECT_DOUBLE_EQ(r->amount("a"), 2.0);

    r->release();
    EXPECT_DOUBLE_EQ(resources.in_use("a"), 0.0);
    EXPECT_TRUE(r->empty());
}

TEST_F(ResourceManagerTest, ZeroAmountsAreIgnored) {
    resources.add_resources("a", 1);

    auto r = resources.reserve({{"a", 1}, {"never_created", 0}});

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->amounts().size(), 1u);
    r->release();
}

TEST_F(ResourceManagerTest, UnknownPoolCannotBeReserved) {
    auto r = resources.reserve({{"ghost", 1}});
    EXPECT_FALSE(r.has_value());
}

TEST_F(ResourceManagerTest, NegativeRequestThrows) {
    resources.add_resources("a", 1);
    EXPECT_THROW((void)resources.reserve({{"a", -1}}), CapacityViolationError);
}

TEST_F(ResourceManagerTest, CapacityBelowUsageIsAllowed) {
    resources.add_resources("a", 2);
    auto r = resources.reserve({{"a", 2}});
    ASSERT_TRUE(r.has_value());

    resources.add_resources("a", -1);

    EXPECT_DOUBLE_EQ(resources.capacity("a"), 1.0);
    EXPECT_DOUBLE_EQ(resources.in_use("a"), 2.0);
    EXPECT_DOUBLE_EQ(resources.available("a"), 0.0);
    EXPECT_FALSE(resources.reserve({{"a", 1}}).has_value());

    r->release();
    auto again = resources.reserve({{"a", 1}});
    ASSERT_TRUE(again.has_value());
    again->release();
}

TEST_F(ResourceManagerTest, WaiterFiresWhenCapacityIsReleased) {
    resources.add_resources("a", 1);
    auto held = resources.reserve({{"a", 1}});
    ASSERT_TRUE(held.has_value());

    int called = 0;
    resources.reserve_with_callback({{"a", 1}}, [&](const ResourceRequest& request) {
        called++;
        EXPECT_DOUBLE_EQ(request.at("a"), 1.0);
    });
    settle();
    EXPECT_EQ(called, 0);
    EXPECT_EQ(resources.pending_waiters(), 1u);

    held->release();
    settle();

    EXPECT_EQ(called, 1);
    EXPECT_EQ(resources.pending_waiters(), 0u);
    // Nothing is held on the waiter's behalf
    EXPECT_DOUBLE_EQ(resources.in_use("a"), 0.0);
}

TEST_F(ResourceManagerTest, WaitersAreCheckedInRegistrationOrder) {
    resources.add_resources("a", 0);
    std::vector<std::string> order;
    std::vector<Reservation> kept;

    auto take = [&](std::string name, double amount) {
        return [&, name, amount](const ResourceRequest&) {
            auto r = resources.reserve({{"a", amount}});
            if (r) {
                order.push_back(name);
                kept.push_back(std::move(*r));
            }
        };
    };
    resources.reserve_with_callback({{"a", 2}}, take("big", 2));
    resources.reserve_with_callback({{"a", 1}}, take("small", 1));
    settle();

    resources.add_resources("a", 2);
    settle();

    // The first waiter fits and reserves; the second no longer fits.
    EXPECT_EQ(order, (std::vector<std::string>{"big"}));
    EXPECT_EQ(resources.pending_waiters(), 1u);

    for (auto& r : kept) {
        r.release();
    }
    settle();
    EXPECT_EQ(order, (std::vector<std::string>{"big", "small"}));
    for (auto& r : kept) {
        r.release();
    }
}

TEST_F(ResourceManagerTest, WaiterAlreadySatisfiedFiresAtCurrentTime) {
    resources.add_resources("a", 1);
    bool called = false;

    resources.reserve_with_callback({{"a", 1}}, [&](const ResourceRequest&) { called = true; });
    EXPECT_FALSE(called);

    settle();
    EXPECT_TRUE(called);
    EXPECT_EQ(clock.now(), TimePoint::epoch());
}
