#pragma once

/**
 * 这个头文件包含评测进程与 worker 进程之间的约定
 *
 * 评测进程启动待测程序时，总是在子进程的环境变量中设置 WORKER_ENV=1；
 * 自测程序（调用 run_tests 的程序）启动自己时，还会额外传入 WORKER_FLAG 参数。
 * 待测程序的入口在做任何事情之前都要先检查这个标记，若处于 worker 模式，
 * 则只调用一次解答函数然后退出，绝不再进入评测流程，避免无限递归地启动子进程。
 */
namespace localjudge {

/**
 * @brief 标记 worker 模式的环境变量名，值为 "1" 时表示 worker 模式
 */
extern const char *const WORKER_ENV;

/**
 * @brief 标记 worker 模式的命令行参数
 */
extern const char *const WORKER_FLAG;

/**
 * @brief worker 没有绑定解答函数时输出到 stderr 的诊断信息前缀
 * 评测进程通过它把这种配置错误与选手程序的运行时错误区分开
 */
extern const char *const MISSING_CALLBACK_DIAGNOSTIC;

/**
 * @brief 当前进程是否处于 worker 模式（只检查环境变量）
 */
bool is_worker_process();

/**
 * @brief 当前进程是否处于 worker 模式（检查环境变量和命令行参数）
 */
bool is_worker_process(int argc, const char *const argv[]);

}  // namespace localjudge
