#pragma once

#include <sys/types.h>
#include <filesystem>
#include <string>
#include "runguard.hpp"

/**
 * 测试用的辅助函数
 * 用法：
 * 1. temp_dir dir;  // 析构时删除整个文件夹
 * 2. dir.write("1.in", "3\n");
 * 3. 以 dir.path() 作为测试数据文件夹进行评测
 */
namespace localjudge {

struct temp_dir {
    temp_dir();
    ~temp_dir();

    const std::filesystem::path &path() const;

    /**
     * @brief 在文件夹中创建文件，返回文件路径
     */
    std::filesystem::path write(const std::string &name, const std::string &content) const;

private:
    std::filesystem::path dir;
};

/**
 * @brief 构造一个运行结果，用于测试评测结果的判定
 */
runguard_result make_run(run_outcome outcome, const std::string &output, const std::string &error_output = "", int exitcode = 0, int signal = -1);

/**
 * @brief 进程是否仍在运行（僵尸进程视为已经结束）
 * 进程可能刚被杀死还没有被回收，最多等待 timeout_ms 毫秒
 */
bool process_alive(pid_t pid, int timeout_ms = 1000);

}  // namespace localjudge
