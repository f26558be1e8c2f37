#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace localjudge {

/**
 * @brief 读取文件的全部内容（按字节读取，不做编码转换）
 * @param path 文件路径
 * @return 文件内容
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 若文件不存在，返回 std::nullopt
 */
std::optional<std::string> read_file_content_if_exists(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，覆盖原有内容
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

}  // namespace localjudge
