#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/workspace.hpp"
#include "test/fake_runtime.hpp"

using namespace std;
using namespace runbox;
namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = runtime.scratch() / "workspaces";
    }

    fake_runtime runtime;
    fs::path root;
};

TEST_F(WorkspaceTest, CreateAndDestroyTest) {
    language_registry registry;
    fs::path dir;
    {
        workspace ws(root, registry.resolve("python"), "print('hi')");
        dir = ws.directory();

        EXPECT_TRUE(fs::is_directory(dir));
        EXPECT_EQ(dir.parent_path().string(), fs::absolute(root).string());
        EXPECT_EQ(dir.filename().string().substr(0, 4), "run-");
        EXPECT_EQ(ws.source_file().string(), (dir / "code.py").string());
        EXPECT_EQ(read_file_content(ws.source_file()), "print('hi')");

        auto perms = fs::status(dir).permissions();
        EXPECT_NE(perms & fs::perms::others_read, fs::perms::none);
        EXPECT_NE(perms & fs::perms::others_exec, fs::perms::none);
    }
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(WorkspaceTest, ExplicitDestroyTest) {
    language_registry registry;
    workspace ws(root, registry.resolve("java"), "class Main {}");
    fs::path dir = ws.directory();
    EXPECT_EQ(ws.source_file().filename().string(), "Main.java");

    EXPECT_TRUE(ws.destroy());
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_TRUE(ws.directory().empty());
    // 重复删除不是错误
    EXPECT_TRUE(ws.destroy());
}

TEST_F(WorkspaceTest, DistinctDirectoriesTest) {
    language_registry registry;
    workspace a(root, registry.resolve("python"), "1");
    workspace b(root, registry.resolve("python"), "2");
    EXPECT_NE(a.directory().string(), b.directory().string());
    EXPECT_EQ(read_file_content(a.source_file()), "1");
    EXPECT_EQ(read_file_content(b.source_file()), "2");
}

TEST_F(WorkspaceTest, MoveTest) {
    language_registry registry;
    workspace a(root, registry.resolve("python"), "1");
    fs::path dir = a.directory();

    workspace b(move(a));
    EXPECT_TRUE(a.directory().empty());
    EXPECT_EQ(b.directory().string(), dir.string());
    EXPECT_TRUE(fs::exists(dir));
}

TEST_F(WorkspaceTest, RootIsFileTest) {
    fs::create_directories(root.parent_path());
    write_file_content(root, "not a directory");

    language_registry registry;
    EXPECT_THROW({ workspace ws(root, registry.resolve("python"), "print(1)"); }, workspace_error);
}
