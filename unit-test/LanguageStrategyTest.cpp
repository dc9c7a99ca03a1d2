#include "environment/language_strategy.hpp"
#include "gtest/gtest.h"
#include "test/fixture.hpp"

using namespace std;
using namespace sandbox;

TEST(LanguageStrategyTest, InterpretedEntryScript) {
    interpreted_strategy strategy;
    auto env = test::python_environment();
    EXPECT_EQ(nullopt, strategy.build_step(env));
    EXPECT_EQ("#!/bin/sh\n"
              "cd /workspace || exit 126\n"
              "exec python3 -u main.py \"$@\" < .stdin\n",
              strategy.entry_script(env));
}

TEST(LanguageStrategyTest, CompiledEntryScript) {
    compiled_strategy strategy;
    auto env = test::c_environment();
    EXPECT_EQ("gcc -O2 -o main main.c -lm", strategy.build_step(env).value());
    EXPECT_EQ("#!/bin/sh\n"
              "cd /workspace || exit 126\n"
              "gcc -O2 -o main main.c -lm 1>&2 || exit $?\n"
              "exec ./main \"$@\" < .stdin\n",
              strategy.entry_script(env));
}

TEST(LanguageStrategyTest, CompiledWithoutCompileCommand) {
    compiled_strategy strategy;
    auto env = test::c_environment();
    env.compile_command = "";
    EXPECT_THROW(strategy.entry_script(env), invalid_argument);
}

TEST(LanguageStrategyTest, MalformedTemplate) {
    auto env = test::python_environment();
    EXPECT_THROW(render_command("python3 {source", env), invalid_argument);
    EXPECT_THROW(render_command("python3 {script}", env), invalid_argument);
    EXPECT_EQ("cd /workspace && python3 main.py", render_command("cd {workdir} && python3 {source}", env));
}

TEST(LanguageStrategyTest, RegistryCanBeExtended) {
    strategy_registry registry;
    EXPECT_EQ("compiled", registry.find("cpp")->name());
    EXPECT_EQ(nullptr, registry.find("cobol"));

    registry.register_strategy("cobol", make_shared<compiled_strategy>());
    EXPECT_EQ("compiled", registry.find("cobol")->name());
}
