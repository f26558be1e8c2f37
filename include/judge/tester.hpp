#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/case_repository.hpp"
#include "judge/checker.hpp"

/**
 * 这个头文件包含评测流程
 * 包含：
 * 1. case_result 类（表示一个测试点所有重复运行的评测结果）
 * 2. tester 类（依次评测所有测试点）
 * 3. select_test_cases 函数（根据配置读取并筛选测试点）
 */
namespace localjudge {

/**
 * @brief 运行时间的统计信息，单位为毫秒
 */
struct time_statistics {
    double average = 0;
    double min = 0;
    double max = 0;
};

/**
 * @brief 计算运行时间的平均值、最小值、最大值
 * @param times 为空时返回全 0
 */
time_statistics summarize(const std::vector<double> &times);

/**
 * @brief 一个测试点的评测结果
 */
struct case_result {
    std::string name;

    /**
     * @brief 实际执行的每次运行的评测结果，按执行顺序排列
     * 遇到第一个不是 AC 的结果后不再重复运行，因此它只可能是最后一个
     */
    std::vector<check_result> runs;

    /**
     * @brief 测试点的最终评测结果，即最后一次运行的评测结果
     */
    status verdict() const;

    /**
     * @brief 每次运行的时钟时间
     */
    std::vector<double> times() const;

    time_statistics statistics() const;
};

/**
 * @brief 依次评测测试点
 * 每次运行都创建新的子进程，测试点之间不共享任何状态
 */
struct tester {
    /**
     * @param command 待测程序及其参数
     * @param work_dir 待测程序的工作路径
     * @param opt 时间限制、比较方式、重复次数等配置
     */
    tester(std::vector<std::string> command, std::filesystem::path work_dir, const options &opt);

    /**
     * @brief 注册测试点评测结束的事件回调函数
     * 每个测试点评测结束后立刻调用，以便在评测过程中实时输出结果
     */
    void on_case_finished(std::function<void(const case_result &)> callback);

    /**
     * @brief 按顺序评测所有测试点
     * @return 每个测试点的评测结果，顺序与 cases 一致
     * @throw setup_error 待测程序无法运行等评测系统自身的错误，此时中止整次评测
     * @throw missing_callback_error 待测程序处于 worker 模式却没有绑定解答函数
     */
    std::vector<case_result> run(const std::vector<test_case> &cases);

    /**
     * @brief 评测一个测试点，重复 repeat 次，遇到不是 AC 的结果时停止
     */
    case_result run_case(const test_case &tc);

private:
    std::vector<std::string> command;
    std::filesystem::path work_dir;
    options opt;
    std::vector<std::function<void(const case_result &)>> case_finished;

    runguard_result execute(const std::string &input);

    void fire_case_finished(const case_result &result);
};

/**
 * @brief 读取 opt.test_case_dir 中的测试点并按 opt.cases 筛选
 * @return 筛选后的测试点；给定了筛选条件但没有匹配的测试点时，记录警告并返回空列表
 * @throw setup_error 没有给定筛选条件，且文件夹中没有任何 .in 文件
 */
std::vector<test_case> select_test_cases(const options &opt);

}  // namespace localjudge
