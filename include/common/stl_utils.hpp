#pragma once

#include <optional>
#include <string>

namespace localjudge {

/**
 * @brief 字符串是否只由十进制数字组成（空串不是）
 */
bool is_integer(const std::string &s);

/**
 * @brief 提取字符串中出现的第一段连续数字
 * 比如 "test_02a" 返回 2，没有数字时返回 std::nullopt
 */
std::optional<unsigned long long> first_number(const std::string &s);

/**
 * @brief 比较两个数字串表示的整数是否相等，忽略前导零
 * 比如 "01" 与 "1" 相等。调用方需保证两个参数都是 is_integer 的
 */
bool integer_equal(const std::string &a, const std::string &b);

}  // namespace localjudge
