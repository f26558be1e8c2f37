#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "config.hpp"
#include "runguard.hpp"

/**
 * 这个头文件包含评测结果的判定逻辑
 * 包含：
 * 1. diff_entry 类（表示输出中的一处差异）
 * 2. check_result 类（表示一次运行的评测结果）
 * 3. classify 函数（根据运行结果和标准输出判定评测结果）
 */
namespace localjudge {

/**
 * @brief 表示输出与标准输出的一行差异
 */
struct diff_entry {
    /**
     * @brief 差异所在的行号，从 1 开始
     * 宽松比较模式下是去掉空行之后的行号
     */
    std::size_t line;

    /**
     * @brief 标准输出的这一行，std::nullopt 表示标准输出已经结束（EOF）
     */
    std::optional<std::string> expected;

    /**
     * @brief 程序输出的这一行，std::nullopt 表示程序输出的行数不足
     * 这种差异只会出现一次，且一定是最后一个差异
     */
    std::optional<std::string> actual;
};

/**
 * @brief 一次运行的评测结果
 */
struct check_result {
    status verdict = status::ACCEPTED;

    /**
     * @brief 产生该评测结果的运行结果
     */
    runguard_result run;

    /**
     * @brief WA 时的差异，最多 max_diffs 个
     */
    std::vector<diff_entry> diffs;

    /**
     * @brief WA 时差异的总数，可能大于 diffs.size()
     */
    std::size_t total_diffs = 0;

    /**
     * @brief RE 时为过滤后的错误输出，MISSING 时为提示信息
     */
    std::string message;

    /**
     * @brief 开启 show_missing_output 时，MISSING 的测试点附带程序的原始输出
     */
    std::optional<std::string> raw_output;
};

/**
 * @brief 按比较方式将输出拆成行
 * 宽松比较：按 '\n' 拆分，去掉每行首尾的空白字符，丢弃空行；
 * 严格比较：按 '\n' 精确拆分，保留每行的全部字节，文末的换行会产生一个空行。
 */
std::vector<std::string> split_lines(const std::string &text, compare_mode mode);

/**
 * @brief 比较程序输出和标准输出是否一致
 * @return true 若在给定的比较方式下一致
 */
bool compare_output(const std::string &actual, const std::string &expected, compare_mode mode);

/**
 * @brief 逐行比较，找出不同的行
 * 程序输出的行数不足时，记录一个 actual 为空的差异并停止比较；
 * 标准输出的行数不足时，多出来的每一行都和 EOF 比较。
 * @param max_diffs 最多记录多少个差异，std::nullopt 表示不限制
 * @param total 输出参数，差异的总数
 */
std::vector<diff_entry> diff_lines(const std::vector<std::string> &actual, const std::vector<std::string> &expected,
                                   std::optional<std::size_t> max_diffs, std::size_t &total);

/**
 * @brief 过滤 worker 输出的调用栈
 * 去掉评测框架自身以及 C++ 运行时抛出异常、终止程序的栈帧，并重新编号，只保留选手代码相关的部分。
 * 不是栈帧的行原样保留。
 */
std::string filter_trace(const std::string &error_output);

/**
 * @brief 根据运行结果判定评测结果
 * 优先级：TLE > RE > MISSING > 比较输出（AC/WA）
 * @param run 待测程序的运行结果
 * @param expected 标准输出，std::nullopt 表示测试点没有标准输出
 * @param opt 比较方式、差异数量上限等配置
 */
check_result classify(const runguard_result &run, const std::optional<std::string> &expected, const options &opt);

}  // namespace localjudge
