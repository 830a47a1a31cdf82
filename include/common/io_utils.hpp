#pragma once

#include <filesystem>
#include <string>

namespace runbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 原样写入文件，文件已存在时将被覆盖
 * @param path 文件路径
 * @param content 要写入的字节
 * @throw std::system_error 打开、写入或关闭文件失败（比如磁盘已满）
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个单独的文件名，不包含目录分隔符，也不会返回上一层目录
 * 语言配置中的源文件名会被拼接到工作目录之后，如果文件名包含 "../"
 * 或者 "/"，那么源代码可能被写到工作目录之外。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 */
std::string assert_safe_path(const std::string &subpath);

}  // namespace runbox
