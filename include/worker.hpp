#pragma once

#include <functional>
#include "config.hpp"

/**
 * 自测程序相关函数
 * 自测程序是链接了 localjudge 库、在 main 函数中调用 run_tests 的选手程序。
 *
 * 同一个可执行文件有两种身份：
 * 1. 直接运行时是评测进程，读取测试点，对每个测试点启动一次自己（worker），比较输出；
 * 2. 被评测进程启动时是 worker，只调用一次解答函数然后退出。
 * 两种身份通过 env.hpp 中的 WORKER_ENV 和 WORKER_FLAG 区分，run_tests 在做任何事情
 * 之前都先检查是否处于 worker 模式，因此 worker 绝不会再次启动评测流程。
 */
namespace localjudge {

/**
 * @brief 解答函数，从 stdin 读入数据，向 stdout 输出答案
 */
using solution_fn = std::function<void()>;

/**
 * @brief 以 worker 身份运行：调用一次解答函数，刷新输出，然后退出进程
 * 解答函数为空时，向 stderr 输出 MISSING_CALLBACK_DIAGNOSTIC 并以 E_INTERNAL_ERROR 退出；
 * 解答函数抛出的异常不会被捕获，由 worker_terminate_handler 输出调用栈并以 E_RUNTIME_ERROR 退出。
 * @param solution 解答函数
 */
[[noreturn]] void run_worker(const solution_fn &solution);

/**
 * @brief worker 的 std::terminate 处理函数
 * 此时栈还没有展开，输出的调用栈包含抛出异常的位置。
 */
[[noreturn]] void worker_terminate_handler();

/**
 * @brief 自测程序的入口
 * 处于 worker 模式时调用 run_worker，不会返回；否则解析命令行参数，以自己为待测程序进行评测。
 * 测试数据文件夹默认为可执行文件所在目录下的 test_case 文件夹。
 * @param argc main 函数的 argc
 * @param argv main 函数的 argv
 * @param solution 解答函数
 * @param opt 默认配置，命令行参数、环境变量会覆盖其中的值
 * @return 进程的返回值，可以直接作为 main 函数的返回值
 */
int run_tests(int argc, char *argv[], const solution_fn &solution, options opt = options());

}  // namespace localjudge
