#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace localjudge {

/**
 * @brief 单次运行待测程序的请求
 * 每次运行都重新构造，不在测试点之间共享
 */
struct runguard_options {
    /**
     * @brief 待测程序的路径（command[0]）和参数
     * 路径中不含 '/' 时按 PATH 查找
     */
    std::vector<std::string> command;

    /**
     * @brief 喂给待测程序 stdin 的全部数据，写完后关闭 stdin
     */
    std::string input;

    /**
     * @brief 时钟时间限制，从子进程创建时开始计算
     * @note 单位为毫秒
     */
    int time_limit = 3000;

    /**
     * @brief 子进程的工作路径，为空时继承当前进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 需要额外设置的环境变量，其余环境变量从当前进程继承
     */
    std::map<std::string, std::string> env;
};

enum class run_outcome {
    /**
     * @brief 在时间限制内以返回值 0 退出
     */
    COMPLETED,

    /**
     * @brief 运行时间达到时间限制，进程（组）被强制杀死
     */
    TIMED_OUT,

    /**
     * @brief 在时间限制内以非零返回值退出，或者因为信号终止
     */
    CRASHED
};

struct runguard_result {
    run_outcome outcome = run_outcome::CRASHED;

    /**
     * @brief 子进程的 stdout 输出，超时或崩溃时为被终止前已经输出的部分
     */
    std::string output;

    /**
     * @brief 子进程的 stderr 输出
     */
    std::string error_output;

    /**
     * @brief 时钟时间
     * 单位为毫秒
     */
    double wall_time = -1;

    /**
     * @brief 子进程的返回值，因信号终止时为 128 + 信号编号
     */
    int exitcode = -1;

    /**
     * @brief 导致子进程终止的信号，没有时为 -1
     */
    int signal = -1;
};

/**
 * @brief 在新进程中运行程序，喂给输入数据，收集输出并限制时钟时间
 * 1. 创建连接子进程 stdin/stdout/stderr 的管道
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程
 *       1. 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       2. 重定向 stdin/stdout/stderr 到管道，切换工作路径，替换环境变量
 *       3. 调用 execvp 执行程序，失败时通过 close-on-exec 管道将 errno 告诉父进程
 *    2. 对于父进程
 *       1. 等待 exec 的结果，exec 失败时抛出异常
 *       2. 通过 select 同时写入 stdin、读取 stdout/stderr，超时时间不超过剩余的时间限制，
 *          因此即使子进程既不输出也不退出，也能在到达时间限制时被杀死
 * 3. 子进程退出或到达时间限制后，杀死整个进程组，读完管道中剩余的输出，回收子进程
 * 不论以何种方式离开本函数（包括抛出异常），子进程都会被杀死并回收。
 * 运行期间评测进程收到 SIGTERM、SIGINT 或 SIGHUP 时，先杀死子进程所在的进程组，再按原来的处理方式处理该信号。
 * @param opt 运行参数
 * @return 运行结果
 * @throw std::system_error 无法创建管道、fork 失败、程序无法执行等评测系统自身的错误
 */
runguard_result runit(const runguard_options &opt);

}  // namespace localjudge
