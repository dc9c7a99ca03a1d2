#include "service/code_filter.hpp"
#include <algorithm>

namespace sandbox {
using namespace std;

code_filter::code_filter(vector<string> patterns)
    : patterns(move(patterns)), cache(make_shared<matcher_cache>()) {}

vector<string> code_filter::default_patterns() {
    return {
        "rm -rf /",
        ":(){ :|:& };:",  // fork bomb
        "/dev/tcp/",
        "mkfs",
        "shutdown -h",
        "reboot",
        "dd if=/dev/zero of=/dev/",
    };
}

static string escape_regex(const string &text) {
    static const regex special(R"([.^$|()\[\]{}*+?\\])");
    return regex_replace(text, special, R"(\$&)");
}

shared_ptr<const regex> code_filter::import_matcher(const string &module) const {
    scoped_lock guard(cache->mut);
    auto &matcher = cache->imports[module];
    // import os / from os import / require('os') / #include <os>
    if (!matcher)
        matcher = make_shared<const regex>("(\\bimport\\s+|\\bfrom\\s+|\\brequire\\s*\\(\\s*['\"]|#include\\s*[<\"])" + escape_regex(module) + "\\b");
    return matcher;
}

shared_ptr<const regex> code_filter::call_matcher(const string &function) const {
    scoped_lock guard(cache->mut);
    auto &matcher = cache->calls[function];
    if (!matcher)
        matcher = make_shared<const regex>("\\b" + escape_regex(function) + "\\s*\\(");
    return matcher;
}

optional<string> code_filter::check(const string &source, const execution_environment &env) const {
    for (auto &pattern : patterns)
        if (source.find(pattern) != string::npos)
            return "Source code contains a forbidden pattern: " + pattern;

    for (auto &module : env.blocked_imports) {
        if (find(env.allowed_imports.begin(), env.allowed_imports.end(), module) != env.allowed_imports.end())
            continue;
        if (regex_search(source, *import_matcher(module)))
            return "Import of " + module + " is not allowed in " + env.id;
    }

    for (auto &function : env.blocked_functions) {
        if (regex_search(source, *call_matcher(function)))
            return "Call to " + function + " is not allowed in " + env.id;
    }
    return nullopt;
}

}  // namespace sandbox
