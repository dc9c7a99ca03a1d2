#include <unistd.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/workspace.hpp"
#include "test/fixture.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    workspace_builder builder{WORK_DIR / "workspace-test", (int)getuid(), (int)getgid()};
    interpreted_strategy strategy;
    execution_environment env = test::python_environment();
    execution e;

    void SetUp() override {
        e.id = "workspace-test";
        e.source_code = "print(input())";
        e.stdin_input = "42\n";
    }
};

TEST_F(WorkspaceTest, WritesSourceInputAndEntryScript) {
    env.scaffold_files = {{"lib/helper.py", "X = 1\n"}};
    auto workspace = builder.prepare(e, env, strategy);
    fs::path dir = workspace.path();

    EXPECT_EQ("print(input())", read_file_content(dir / "main.py"));
    EXPECT_EQ("42\n", read_file_content(dir / ".stdin"));
    EXPECT_EQ("X = 1\n", read_file_content(dir / "lib" / "helper.py"));
    EXPECT_EQ(strategy.entry_script(env), read_file_content(dir / "run.sh"));
    EXPECT_NE(fs::perms::none, fs::status(dir / "run.sh").permissions() & fs::perms::owner_exec);
    EXPECT_EQ(fs::perms::none, fs::status(dir / "main.py").permissions() & fs::perms::others_write);
}

TEST_F(WorkspaceTest, RemovedOnRelease) {
    fs::path dir;
    {
        auto workspace = builder.prepare(e, env, strategy);
        dir = workspace.path();
        ASSERT_TRUE(fs::exists(dir));

        workspace_handle moved = move(workspace);
        EXPECT_TRUE(workspace.path().empty());
        EXPECT_EQ(dir, moved.path());
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(WorkspaceTest, EachExecutionHasItsOwnDirectory) {
    auto a = builder.prepare(e, env, strategy);
    auto b = builder.prepare(e, env, strategy);
    EXPECT_NE(a.path(), b.path());
}

TEST_F(WorkspaceTest, RejectsUnsafeScaffold) {
    env.scaffold_files = {{"../escape.py", ""}};
    EXPECT_THROW(builder.prepare(e, env, strategy), workspace_error);
    EXPECT_FALSE(fs::exists(WORK_DIR / "escape.py"));
}
