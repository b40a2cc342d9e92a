#include <flowsim/core/clock.hpp>
#include <flowsim/core/error.hpp>
#include <flowsim/io/trace_writers.hpp>

#include <gtest/gtest.h>
#include <rapidjson/document.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace flowsim::io;
using namespace flowsim::core;

class TraceWritersTest : public ::testing::Test {
protected:
    TimePoint time(double units) { return time_from_units(units); }
};

// =============================================================================
// NullTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, NullWriterAcceptsAllCalls) {
    NullTraceWriter writer;

    writer.begin(time(0.0));
    writer.type("received_part");
    writer.field("part_id", uint64_t{42});
    writer.field("value", 3.5);
    writer.field("subject", "lathe");
    writer.end();
}

// =============================================================================
// JsonTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, JsonWriterEmptyArray) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
    }
    EXPECT_EQ(oss.str(), "[\n]\n");
}

TEST_F(TraceWritersTest, JsonWriterSingleRecord) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(1.5));
        writer.type("created_part");
        writer.field("part_id", uint64_t{10});
        writer.field("subject", "src");
        writer.end();
    }

    std::string output = oss.str();
    EXPECT_NE(output.find(R"({"time":1.5,"type":"created_part","part_id":10,"subject":"src"})"),
              std::string::npos);
    EXPECT_EQ(output.front(), '[');
    EXPECT_EQ(output.substr(output.size() - 2), "]\n");
}

TEST_F(TraceWritersTest, JsonWriterSeparatesRecords) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        for (int i = 0; i < 3; ++i) {
            writer.begin(time(i));
            writer.type("produced_part");
            writer.end();
        }
    }

    std::string output = oss.str();
    std::size_t commas = 0;
    for (std::size_t pos = 0; (pos = output.find("},\n", pos)) != std::string::npos; ++pos) {
        ++commas;
    }
    EXPECT_EQ(commas, 2u);
}

TEST_F(TraceWritersTest, JsonWriterFinalizeIsIdempotent) {
    std::ostringstream oss;
    JsonTraceWriter writer(oss);
    writer.begin(time(0.0));
    writer.type("device_shutdown");
    writer.end();

    writer.finalize();
    writer.finalize();

    std::string output = oss.str();
    EXPECT_EQ(std::count(output.begin(), output.end(), ']'), 1);
}

TEST_F(TraceWritersTest, JsonWriterEscapesStrings) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(0.0));
        writer.type("event_failed");
        writer.field("error", "bad \"part\" in\\line\n");
        writer.end();
    }

    std::string output = oss.str();
    EXPECT_NE(output.find("bad \\\"part\\\" in\\\\line\\n"), std::string::npos);
}

TEST_F(TraceWritersTest, JsonWriterOutputParsesBack) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(2.0));
        writer.type("event_failed");
        writer.field("error", std::string_view{"ctrl \x01 tab\t", 11});
        writer.field("value", -0.25);
        writer.end();
        writer.begin(time(3.0));
        writer.type("received_part");
        writer.end();
    }

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2u);
    EXPECT_DOUBLE_EQ(doc[0]["time"].GetDouble(), 2.0);
    EXPECT_EQ(std::string(doc[0]["error"].GetString(), doc[0]["error"].GetStringLength()),
              std::string("ctrl \x01 tab\t", 11));
    EXPECT_DOUBLE_EQ(doc[0]["value"].GetDouble(), -0.25);
    EXPECT_STREQ(doc[1]["type"].GetString(), "received_part");
}

TEST_F(TraceWritersTest, JsonTraceIsClosedAfterFailedRun) {
    std::ostringstream oss;
    JsonTraceWriter writer(oss);
    Clock clock;
    clock.set_trace_writer(&writer);
    auto actor = clock.new_actor_id();
    clock.schedule(time(1.0), actor, []() { throw std::logic_error("jammed"); },
                   EventPriority::PASS_PART, "pass part");

    EXPECT_THROW(clock.run(duration_from_units(5.0)), EventFailure);
    clock.set_trace_writer(nullptr);
    writer.finalize();

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_TRUE(doc.IsArray());
}

// =============================================================================
// MemoryTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, MemoryWriterStoresRecords) {
    MemoryTraceWriter writer;

    writer.begin(time(0.0));
    writer.type("created_part");
    writer.field("part_id", uint64_t{1});
    writer.end();

    writer.begin(time(2.0));
    writer.type("value_change");
    writer.field("value", -3.5);
    writer.field("label", "supplied_part");
    writer.end();

    const auto& records = writer.records();
    ASSERT_EQ(records.size(), 2u);

    EXPECT_DOUBLE_EQ(records[0].time, 0.0);
    EXPECT_EQ(records[0].type, "created_part");
    EXPECT_EQ(std::get<uint64_t>(records[0].fields.at("part_id")), 1u);

    EXPECT_DOUBLE_EQ(records[1].time, 2.0);
    EXPECT_DOUBLE_EQ(std::get<double>(records[1].fields.at("value")), -3.5);
    EXPECT_EQ(std::get<std::string>(records[1].fields.at("label")), "supplied_part");
}

TEST_F(TraceWritersTest, MemoryWriterFiltersByType) {
    MemoryTraceWriter writer;
    for (const char* type : {"received_part", "produced_part", "received_part"}) {
        writer.begin(time(0.0));
        writer.type(type);
        writer.end();
    }

    EXPECT_EQ(writer.records_of_type("received_part").size(), 2u);
    EXPECT_EQ(writer.records_of_type("produced_part").size(), 1u);
    EXPECT_TRUE(writer.records_of_type("device_failure").empty());
}

TEST_F(TraceWritersTest, MemoryWriterClear) {
    MemoryTraceWriter writer;
    writer.begin(time(0.0));
    writer.type("enter_queue");
    writer.end();
    ASSERT_EQ(writer.records().size(), 1u);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());

    writer.begin(time(1.0));
    writer.type("after_clear");
    writer.end();
    ASSERT_EQ(writer.records().size(), 1u);
    EXPECT_EQ(writer.records()[0].type, "after_clear");
}

// =============================================================================
// TextualTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, TextualWriterOneLinePerRecord) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss);

    writer.begin(time(1.0));
    writer.type("received_part");
    writer.field("subject", "lathe");
    writer.field("part_id", uint64_t{7});
    writer.end();

    writer.begin(time(3.5));
    writer.type("produced_part");
    writer.end();

    std::string output = oss.str();
    EXPECT_EQ(std::count(output.begin(), output.end(), '\n'), 2);
    EXPECT_NE(output.find("received_part: subject = lathe, part_id = 7"), std::string::npos);
    EXPECT_NE(output.find("(+   2.50000)"), std::string::npos);
}

// =============================================================================
// FanoutTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, FanoutForwardsToEveryWriter) {
    MemoryTraceWriter first;
    MemoryTraceWriter second;
    FanoutTraceWriter fanout({&first});
    fanout.add(&second);

    fanout.begin(time(4.0));
    fanout.type("device_failure");
    fanout.field("lost_part_id", uint64_t{3});
    fanout.end();

    ASSERT_EQ(first.records().size(), 1u);
    ASSERT_EQ(second.records().size(), 1u);
    EXPECT_EQ(first.records()[0].type, "device_failure");
    EXPECT_EQ(std::get<uint64_t>(second.records()[0].fields.at("lost_part_id")), 3u);
}
