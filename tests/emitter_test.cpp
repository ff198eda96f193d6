// JSON and DOT emitter tests

#include "protoplan/builder.hpp"
#include "protoplan/emitter.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>

using namespace protoplan;

class EmitterTest : public ::testing::Test {
protected:
    PlanBuilder builder_;

    void SetUp() override {
        TargetConfig config;
        config.name = "protos";
        config.directory = "//net";
        config.sources = {"foo.proto"};
        config.generate_python = false;
        ASSERT_TRUE(builder_.add_target(config));
    }
};

TEST_F(EmitterTest, JsonDescribesBothNodes) {
    std::ostringstream out;
    ASSERT_TRUE(emit_json(builder_, out));

    auto doc = nlohmann::json::parse(out.str());
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 1u);

    const auto &target = doc[0];
    EXPECT_EQ(target["label"], "//net:protos");
    EXPECT_EQ(target["generation"]["name"], "protos_gen");
    EXPECT_EQ(target["generation"]["invocations"].size(), 1u);
    EXPECT_EQ(target["generation"]["invocations"][0]["source"], "net/foo.proto");
    EXPECT_EQ(target["generation"]["outputs"][1], "out/Default/gen/net/foo.pb.h");
    EXPECT_EQ(target["compile"]["type"], "static_library");
    EXPECT_EQ(target["compile"]["public_deps"][0], "//third_party/protobuf:protobuf_lite");
    EXPECT_FALSE(target["compile"]["testonly"].get<bool>());
}

TEST_F(EmitterTest, EmptyPlanIsEmptyArray) {
    PlanBuilder empty;
    std::ostringstream out;
    ASSERT_TRUE(emit_json(empty, out));
    EXPECT_TRUE(nlohmann::json::parse(out.str()).empty());
}

TEST_F(EmitterTest, GraphListsNodesAndEdges) {
    std::ostringstream out;
    ASSERT_TRUE(emit_graph(builder_, out));

    const std::string dot = out.str();
    EXPECT_EQ(dot.rfind("digraph protoplan {", 0), 0u);
    EXPECT_NE(dot.find("label=\"net/foo.proto\""), std::string::npos);
    EXPECT_NE(dot.find("label=\"//net:protos\", fillcolor=\"lightblue\""), std::string::npos);
    EXPECT_NE(dot.find("fillcolor=\"green\""), std::string::npos);
    EXPECT_NE(dot.find(" -> "), std::string::npos);
}
