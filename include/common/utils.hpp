#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return formatter<std::string>::format(p.string(), ctx);
    }
};
}  // namespace fmt

namespace localjudge {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成子进程使用的环境变量表
 * 以当前进程的环境变量为基础，用 overrides 覆盖或追加，返回 "KEY=VALUE" 形式的列表。
 * 在 fork 之前准备好，子进程中只需要替换 environ，避免在 fork 后分配内存。
 * @param overrides 需要覆盖的环境变量
 */
std::vector<std::string> make_environment(const std::map<std::string, std::string> &overrides);

/**
 * @brief 计时器，从构造时开始计时
 * 使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为毫秒
     */
    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace localjudge
