#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "environment/environment.hpp"

namespace sandbox {

/**
 * @brief 提交前的危险代码粗筛
 * 只是纵深防御的一层，真正的隔离由容器保证，因此这里宁可漏过也不误判：
 * 只匹配明显的破坏性字面量，以及运行环境配置的禁止导入和禁止调用。
 */
struct code_filter {
    /**
     * @param patterns 对所有语言生效的危险字面量
     */
    explicit code_filter(std::vector<std::string> patterns = default_patterns());

    /**
     * @brief 检查源代码
     * @return 命中时返回拒绝原因，否则返回 nullopt
     */
    std::optional<std::string> check(const std::string &source, const execution_environment &env) const;

    static std::vector<std::string> default_patterns();

private:
    std::vector<std::string> patterns;

    /**
     * @brief 按模块名和函数名缓存编译好的正则表达式，各运行环境共享
     */
    struct matcher_cache {
        std::mutex mut;
        std::map<std::string, std::shared_ptr<const std::regex>> imports;
        std::map<std::string, std::shared_ptr<const std::regex>> calls;
    };
    std::shared_ptr<matcher_cache> cache;

    std::shared_ptr<const std::regex> import_matcher(const std::string &module) const;
    std::shared_ptr<const std::regex> call_matcher(const std::string &function) const;
};

}  // namespace sandbox
