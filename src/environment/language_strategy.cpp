#include "environment/language_strategy.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <mutex>
#include <stdexcept>
#include "config.hpp"

namespace sandbox {
using namespace std;

language_strategy::~language_strategy() = default;

string language_strategy::entry_script(const execution_environment &env) const {
    string script = "#!/bin/sh\n";
    script += "cd " + CONTAINER_WORKDIR + " || exit 126\n";
    if (auto build = build_step(env)) {
        // 编译信息输出到 stderr，编译失败时直接退出，退出码即编译器的退出码
        script += *build + " 1>&2 || exit $?\n";
    }
    script += "exec " + run_step(env) + " \"$@\" < .stdin\n";
    return script;
}

string interpreted_strategy::name() const {
    return "interpreted";
}

optional<string> interpreted_strategy::build_step(const execution_environment &) const {
    return nullopt;
}

string interpreted_strategy::run_step(const execution_environment &env) const {
    return render_command(env.run_command, env);
}

string compiled_strategy::name() const {
    return "compiled";
}

optional<string> compiled_strategy::build_step(const execution_environment &env) const {
    if (env.compile_command.empty())
        throw invalid_argument("Environment " + env.id + " of a compiled language has no compile command");
    return render_command(env.compile_command, env);
}

string compiled_strategy::run_step(const execution_environment &env) const {
    return render_command(env.run_command, env);
}

string render_command(const string &tmpl, const execution_environment &env) {
    try {
        return fmt::format(fmt::runtime(tmpl),
                           fmt::arg("source", env.source_file),
                           fmt::arg("binary", env.binary_file()),
                           fmt::arg("workdir", CONTAINER_WORKDIR));
    } catch (fmt::format_error &e) {
        throw invalid_argument("Malformed command template \"" + tmpl + "\" of environment " + env.id + ": " + e.what());
    }
}

strategy_registry::strategy_registry() {
    auto interpreted = make_shared<interpreted_strategy>();
    auto compiled = make_shared<compiled_strategy>();
    for (const char *language : {"python", "javascript", "typescript", "ruby", "php", "bash", "lua", "r"})
        strategies[language] = interpreted;
    for (const char *language : {"c", "cpp", "java", "go", "rust", "csharp", "kotlin"})
        strategies[language] = compiled;
}

void strategy_registry::register_strategy(const string &language, shared_ptr<const language_strategy> strategy) {
    unique_lock lock(mut);
    strategies[language] = move(strategy);
}

shared_ptr<const language_strategy> strategy_registry::find(const string &language) const {
    shared_lock lock(mut);
    auto it = strategies.find(language);
    if (it == strategies.end()) return nullptr;
    return it->second;
}

}  // namespace sandbox
