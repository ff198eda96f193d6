// Label and path helper tests

#include "protoplan/label.hpp"

#include <gtest/gtest.h>

using namespace protoplan;

TEST(LabelTest, ParsesAbsoluteLabel) {
    auto label = Label::parse("//third_party/protobuf:protoc");
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->dir(), "//third_party/protobuf");
    EXPECT_EQ(label->name(), "protoc");
    EXPECT_TRUE(label->toolchain().empty());
    EXPECT_EQ(label->str(), "//third_party/protobuf:protoc");
}

TEST(LabelTest, ImplicitNameFromDirectory) {
    auto label = Label::parse("//base/metrics");
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->name(), "metrics");
    EXPECT_EQ(label->str(), "//base/metrics:metrics");
}

TEST(LabelTest, RelativeLabelUsesCurrentDirectory) {
    auto label = Label::parse(":protos", "//chrome/browser/");
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->str(), "//chrome/browser:protos");

    auto root = Label::parse(":protos");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->str(), "//:protos");
}

TEST(LabelTest, ToolchainSuffix) {
    auto label = Label::parse("//tools:plugin(//build/toolchain/linux:host)");
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(label->name(), "plugin");
    EXPECT_EQ(label->toolchain(), "//build/toolchain/linux:host");
    EXPECT_EQ(label->str(), "//tools:plugin(//build/toolchain/linux:host)");

    auto rebound = label->with_toolchain("//build/toolchain/win:host");
    EXPECT_EQ(rebound.str(), "//tools:plugin(//build/toolchain/win:host)");
}

TEST(LabelTest, RejectsMalformedLabels) {
    for (const char *text : {"", "relative:name", "//dir:", ":", "//", "//a:b(//c:d", "//a:b()"}) {
        auto label = Label::parse(text);
        ASSERT_FALSE(label.has_value()) << text;
        EXPECT_EQ(label.error().kind, ErrorKind::MalformedLabel) << text;
    }
}

TEST(PathTest, SourceRelative) {
    EXPECT_EQ(source_relative("//a/b/"), "a/b");
    EXPECT_EQ(source_relative("a/./b/../c"), "a/c");
    EXPECT_EQ(source_relative("//"), ".");
    EXPECT_EQ(source_relative(""), ".");
}

TEST(PathTest, RebasePath) {
    EXPECT_EQ(rebase_path("dir/sub", "out/Default"), "../../dir/sub");
    EXPECT_EQ(rebase_path("out/Default/gen/a", "out/Default"), "gen/a");
    EXPECT_EQ(rebase_path("out/Default", "out/Default"), ".");
    EXPECT_EQ(rebase_path(".", "out/Default"), "../..");
    EXPECT_EQ(rebase_path("//a/b", "//"), "a/b");
}

TEST(PathTest, JoinPath) {
    EXPECT_EQ(join_path("out/gen", "dir"), "out/gen/dir");
    EXPECT_EQ(join_path("out/gen", "."), "out/gen");
    EXPECT_EQ(join_path("//", "dir/foo.proto"), "dir/foo.proto");
}

TEST(PathTest, SplitSource) {
    auto parts = split_source("sub/foo.proto", "//chrome");
    EXPECT_EQ(parts.path, "chrome/sub/foo.proto");
    EXPECT_EQ(parts.dir, "chrome/sub");
    EXPECT_EQ(parts.file_part, "foo.proto");
    EXPECT_EQ(parts.name_part, "foo");

    auto root = split_source("//top.proto", "//chrome");
    EXPECT_EQ(root.path, "top.proto");
    EXPECT_EQ(root.dir, ".");
    EXPECT_EQ(root.name_part, "top");
}
