#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/tester.hpp"

namespace localjudge {

/**
 * @brief 将字符串转义后加上引号，用于显示差异的行
 * 比如 "a\tb" 显示为 'a\tb'，行末的空白字符因此可以被看见
 */
std::string quote(const std::string &s);

/**
 * @brief 格式化一个测试点的运行时间
 * 只运行了一次时显示该次的时间，否则显示平均值、最小值与最大值
 */
std::string format_time(const case_result &result);

/**
 * @brief 输出评测开始前的信息：待测程序与测试点数量
 */
void print_header(std::ostream &os, const std::filesystem::path &target, std::size_t case_count);

/**
 * @brief 输出一个测试点的评测结果
 * WA 时显示差异，RE 时显示错误输出，MISSING 时显示提示信息，
 * opt.show_raw_output 为真时总是显示程序的原始输出
 */
void print_case_result(std::ostream &os, const case_result &result, const options &opt);

/**
 * @brief 输出所有测试点的评测结果统计
 */
void print_summary(std::ostream &os, const std::vector<case_result> &results);

nlohmann::json to_json(const case_result &result);

nlohmann::json to_json(const std::vector<case_result> &results);

/**
 * @brief 将评测结果以 JSON 格式写入文件
 * @throw std::system_error 文件无法写入
 */
void write_json_report(const std::filesystem::path &path, const std::vector<case_result> &results);

}  // namespace localjudge
