#include <execd/core/workspace.hpp>
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

using namespace execd;

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = tmp_.file("root");
        workspace_.reset(new Workspace(root_));
        std::string error;
        ASSERT_TRUE(workspace_->init(error)) << error;
    }

    test::TempDir tmp_;
    std::string root_;
    std::unique_ptr<Workspace> workspace_;
};

TEST_F(WorkspaceTest, InitCreatesRoot) {
    EXPECT_TRUE(test::path_exists(root_));
    EXPECT_EQ(root_, workspace_->root());
}

TEST_F(WorkspaceTest, ResolvesRelativeAndRootedPaths) {
    OpResult<std::string> r = workspace_->resolve("/a/b.txt");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(root_ + "/a/b.txt", r.value);

    r = workspace_->resolve("a/./c/../b.txt");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(root_ + "/a/b.txt", r.value);

    r = workspace_->resolve("/");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(root_, r.value);
}

TEST_F(WorkspaceTest, AcceptsAbsolutePathsUnderRoot) {
    OpResult<std::string> r = workspace_->resolve(root_ + "/data/x");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(root_ + "/data/x", r.value);
}

TEST_F(WorkspaceTest, RejectsTraversal) {
    OpResult<std::string> r = workspace_->resolve("../outside");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::PermissionDenied, r.code);

    r = workspace_->resolve("/a/../../etc/passwd");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::PermissionDenied, r.code);
}

TEST_F(WorkspaceTest, RejectsEmptyAndNulPaths) {
    OpResult<std::string> r = workspace_->resolve("");
    EXPECT_EQ(ErrorCode::ValidationError, r.code);

    r = workspace_->resolve(std::string("/bad/\0name", 10));
    EXPECT_EQ(ErrorCode::ValidationError, r.code);
}

TEST_F(WorkspaceTest, RejectsSymlinkEscapes) {
    ASSERT_EQ(0, symlink(tmp_.path().c_str(), (root_ + "/link").c_str()));
    OpResult<std::string> r = workspace_->resolve("/link/secret");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(ErrorCode::PermissionDenied, r.code);

    ASSERT_EQ(0, symlink("/nonexistent/target", (root_ + "/dangling").c_str()));
    r = workspace_->resolve("/dangling");
    EXPECT_EQ(ErrorCode::PermissionDenied, r.code);
}

TEST_F(WorkspaceTest, AllowsSymlinksInsideRoot) {
    ASSERT_TRUE(test::write_text(root_ + "/real/file.txt", "x"));
    ASSERT_EQ(0, symlink((root_ + "/real").c_str(), (root_ + "/alias").c_str()));
    OpResult<std::string> r = workspace_->resolve("/alias/file.txt");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(root_ + "/alias/file.txt", r.value);
}

TEST_F(WorkspaceTest, MapsBackToSandboxPaths) {
    EXPECT_EQ("/", workspace_->to_sandbox_path(root_));
    EXPECT_EQ("/a/b", workspace_->to_sandbox_path(root_ + "/a/b"));
    EXPECT_TRUE(workspace_->contains(root_ + "/a"));
    EXPECT_FALSE(workspace_->contains(root_ + "x/a"));
}
