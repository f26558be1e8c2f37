#pragma once

#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace localjudge {

/**
 * @brief worker 进程的返回值
 * 选手程序自己的返回值不受限制，这里只约定 worker 入口自己使用的值
 */
enum error_codes {
    E_SUCCESS = 0,
    E_RUNTIME_ERROR = 1,
    E_INTERNAL_ERROR = 2
};

/**
 * @brief 输出比较方式
 */
enum class compare_mode {
    /**
     * @brief 宽松比较：逐行去掉首尾空白字符，丢弃空行后比较
     */
    LENIENT,

    /**
     * @brief 严格比较：逐字节比较
     */
    STRICT
};

/**
 * @brief 默认时间限制，单位为毫秒
 */
constexpr int DEFAULT_TIME_LIMIT = 3000;

/**
 * @brief 默认最多显示多少行差异
 */
constexpr std::size_t DEFAULT_MAX_DIFFS = 10;

/**
 * @brief 一次评测的全部配置
 */
struct options {
    /**
     * @brief 测试数据文件夹，为空时使用待测程序所在目录下的 test_case 文件夹
     */
    std::filesystem::path test_case_dir;

    /**
     * @brief 时间限制（时钟时间）
     * @note 单位为毫秒
     */
    int time_limit = DEFAULT_TIME_LIMIT;

    compare_mode mode = compare_mode::LENIENT;

    /**
     * @brief WA 时最多记录多少行差异，std::nullopt 表示不限制
     */
    std::optional<std::size_t> max_diffs = DEFAULT_MAX_DIFFS;

    /**
     * @brief 要执行的测试点，为空表示执行全部测试点
     * 纯数字按数值匹配纯数字的测试点名（"1" 匹配 "01"），其余按子串匹配
     */
    std::vector<std::string> cases;

    /**
     * @brief 每个测试点重复执行的次数，用于观察运行时间是否稳定
     */
    std::size_t repeat = 1;

    /**
     * @brief 找不到 .out 文件时是否显示程序输出
     */
    bool show_missing_output = false;

    /**
     * @brief 是否总是显示程序输出
     */
    bool show_raw_output = false;

    /**
     * @brief 若不为空，评测结束后将结果以 JSON 格式写入该文件
     */
    std::filesystem::path json_report;
};

/**
 * @brief 命令行选项表，localjudge 命令行工具和自测程序共用
 */
boost::program_options::options_description describe_options();

/**
 * @brief 读取 JSON 格式的配置文件
 * 文件中可以出现的键：time_limit, strict, max_diffs, repeat, cases,
 * show_missing_output, show_raw_output, test_case_dir, json_report
 * @param config_file 配置文件路径
 * @param opt 读取到的配置会覆盖 opt 中对应的值
 * @throw setup_error 配置文件不存在或格式错误
 */
void load_options(const std::filesystem::path &config_file, options &opt);

/**
 * @brief 将解析好的命令行选项写入 opt
 * 优先级：命令行 > 环境变量 > 配置文件（--config） > opt 原有的值
 * @throw boost::program_options::error 选项的值不合法
 * @throw setup_error 配置文件不存在或格式错误
 */
void apply_options(const boost::program_options::variables_map &vm, options &opt);

}  // namespace localjudge
