#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"

namespace localjudge {

/**
 * @brief 完成一次完整的评测：读取并筛选测试点、依次评测、实时输出结果、写入 JSON 报告
 * localjudge 命令行工具与自测程序的评测进程都通过这个函数评测
 * @param command 待测程序及其参数，command[0] 为待测程序的路径
 * @param work_dir 待测程序的工作路径
 * @param opt 评测配置，opt.test_case_dir 必须已经确定
 * @param os 评测结果输出到哪里
 * @return EXIT_SUCCESS 若所有测试点都是 AC 或 MISSING；
 *         EXIT_FAILURE 若有测试点未通过，或者发生了准备错误
 */
int run_session(const std::vector<std::string> &command, const std::filesystem::path &work_dir, const options &opt, std::ostream &os);

}  // namespace localjudge
