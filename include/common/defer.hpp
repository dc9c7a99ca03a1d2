#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * 作用域退出时执行清理代码，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     string id = runtime.create(spec);
 *     defer { runtime.remove(id); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = sandbox::scoped_guard() + [&]

namespace sandbox {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消清理动作
     */
    void dismiss();
};

}  // namespace sandbox
