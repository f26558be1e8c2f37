#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace localjudge {

/**
 * @brief 表示一个测试点
 * 加载之后不再修改
 */
struct test_case {
    /**
     * @brief 测试点名称，即 .in 文件去掉扩展名后的文件名，比如 "01"
     */
    std::string name;

    /**
     * @brief 喂给待测程序 stdin 的数据
     */
    std::string input;

    /**
     * @brief 标准输出，std::nullopt 表示没有对应的 .out 文件
     * 没有标准输出不是错误，评测结果为 MISSING
     */
    std::optional<std::string> expected;

    /**
     * @brief .in 文件的路径
     */
    std::filesystem::path input_path;
};

/**
 * @brief 读取测试数据文件夹中的所有测试点
 * 每个 *.in 文件是一个测试点，同名的 *.out 文件是它的标准输出。
 * 文件名中含有数字的测试点排在前面，按第一段数字的数值排序（数值相同时按文件名）；
 * 不含数字的测试点排在后面，按文件名排序。
 * @param dir 测试数据文件夹
 * @return 排好序的测试点，文件夹不存在时返回空列表
 * @throw std::system_error 测试数据文件无法读取
 */
std::vector<test_case> collect_test_cases(const std::filesystem::path &dir);

/**
 * @brief 测试点名称是否匹配筛选条件
 * 纯数字的筛选条件只按数值匹配纯数字的测试点名（"1" 匹配 "01"，不匹配 "test1"），
 * 其他筛选条件按子串匹配。
 */
bool match_case(const std::string &name, const std::string &token);

/**
 * @brief 筛选测试点，保持原有的顺序
 * @param tokens 筛选条件，匹配任意一个即保留；为空时保留全部测试点
 */
std::vector<test_case> filter_test_cases(const std::vector<test_case> &cases, const std::vector<std::string> &tokens);

}  // namespace localjudge
