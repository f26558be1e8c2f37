#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace localjudge {

struct localjudge_exception : std::exception {
    explicit localjudge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const localjudge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测无法继续进行的准备错误
 * 比如待测程序无法启动、测试数据目录里没有任何 .in 文件。
 * 这类错误会中止整次评测，不会作为某个测试点的评测结果返回，
 * 以免把评测系统自身的问题当成选手程序的问题。
 */
struct setup_error : public localjudge_exception {
    explicit setup_error(const std::string &message);
};

/**
 * @brief worker 进程启动后发现没有绑定解答函数
 * 通常是入口函数调用 run_tests 时没有传入解答函数，或者把 localjudge
 * 自己当成了待测程序。
 */
struct missing_callback_error : public setup_error {
    explicit missing_callback_error(const std::string &message);
};

}  // namespace localjudge
