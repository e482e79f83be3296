#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = ::grader::scoped_guard() + [&]

namespace grader {

/**
 * @brief 在离开作用域时执行 f
 * 配合 defer 宏使用：defer { fs::remove_all(dir); };
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other);
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 取消执行，比如调试模式下需要保留运行目录
     */
    void dismiss();
};

}  // namespace grader
