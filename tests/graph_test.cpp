// Build graph tests

#include "protoplan/graph.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>
#include <vector>

using namespace protoplan;

class BuildGraphTest : public ::testing::Test {
protected:
    BuildGraph graph_;

    size_t position(const std::vector<size_t> &order, std::string_view path) {
        auto id = graph_.find(path);
        EXPECT_TRUE(id.has_value()) << path;
        return std::find(order.begin(), order.end(), *id) - order.begin();
    }
};

TEST_F(BuildGraphTest, GetOrCreateNodeIsIdempotent) {
    size_t a = graph_.get_or_create_node("a.proto");
    size_t b = graph_.get_or_create_node("b.proto");
    EXPECT_NE(a, b);
    EXPECT_EQ(graph_.get_or_create_node("a.proto"), a);
    EXPECT_EQ(graph_.nodes().size(), 2u);
    EXPECT_FALSE(graph_.find("c.proto").has_value());
}

TEST_F(BuildGraphTest, MultiOutputStepCreatesEdges) {
    auto res = graph_.add_step({.tool = "protoc",
                                .target = "//:p",
                                .inputs = {"foo.proto", "//:protoc"},
                                .outputs = {"gen/foo.pb.cc", "gen/foo.pb.h"}});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, 0u);

    auto in = graph_.find("foo.proto");
    ASSERT_TRUE(in.has_value());
    EXPECT_EQ(graph_.nodes()[*in].out_edges.size(), 2u);
    EXPECT_FALSE(graph_.nodes()[*in].step_id.has_value());

    auto out = graph_.find("gen/foo.pb.h");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(graph_.nodes()[*out].step_id, 0u);
}

TEST_F(BuildGraphTest, DuplicateProducerRejected) {
    ASSERT_TRUE(graph_.add_step({.tool = "protoc", .target = "//:a", .inputs = {"x.proto"}, .outputs = {"x.pb.h"}}));

    auto res = graph_.add_step({.tool = "protoc", .target = "//:b", .inputs = {"y.proto"}, .outputs = {"x.pb.h"}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::DuplicateOutput);
    EXPECT_NE(res.error().message.find("//:a"), std::string::npos);
}

TEST_F(BuildGraphTest, FailedGroupLeavesGraphUnchanged) {
    ASSERT_TRUE(graph_.add_step({.tool = "protoc", .target = "//:a", .inputs = {"x.proto"}, .outputs = {"x.pb.h"}}));
    const size_t nodes_before = graph_.nodes().size();

    std::vector<BuildStep> group;
    group.push_back({.tool = "protoc", .target = "//:b", .inputs = {"y.proto"}, .outputs = {"y.pb.h"}});
    group.push_back({.tool = "protoc", .target = "//:b", .inputs = {"z.proto"}, .outputs = {"y.pb.h"}});
    auto res = graph_.add_steps(std::move(group));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::DuplicateOutput);

    EXPECT_EQ(graph_.steps().size(), 1u);
    EXPECT_EQ(graph_.nodes().size(), nodes_before);
}

TEST_F(BuildGraphTest, TopoSortPutsDependenciesFirst) {
    ASSERT_TRUE(graph_.add_step({.tool = "protoc",
                                 .target = "//:p",
                                 .inputs = {"foo.proto"},
                                 .outputs = {"gen/foo.pb.cc", "gen/foo.pb.h"}}));
    ASSERT_TRUE(graph_.add_step({.tool = "static_library",
                                 .target = "//:p",
                                 .inputs = {"gen/foo.pb.cc", "gen/foo.pb.h"},
                                 .outputs = {"//:p"}}));

    auto order = graph_.topo_sort();
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->size(), graph_.nodes().size());
    EXPECT_LT(position(*order, "foo.proto"), position(*order, "gen/foo.pb.cc"));
    EXPECT_LT(position(*order, "gen/foo.pb.h"), position(*order, "//:p"));
}

TEST_F(BuildGraphTest, CycleDetected) {
    ASSERT_TRUE(graph_.add_step({.tool = "protoc", .target = "//:a", .inputs = {"a"}, .outputs = {"b"}}));
    ASSERT_TRUE(graph_.add_step({.tool = "protoc", .target = "//:a", .inputs = {"b"}, .outputs = {"a"}}));

    auto order = graph_.topo_sort();
    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().kind, ErrorKind::Cycle);
}
