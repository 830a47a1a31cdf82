#pragma once

#include <filesystem>
#include <string>
#include "sandbox/language.hpp"

namespace runbox {

/**
 * @brief 一次执行独占的临时工作目录
 * 工作目录中只有用户提交的源文件，它会被以只读方式挂载进容器。
 *
 * WORKSPACE_ROOT
 * ├── run-ABCDEFG // 随机生成的 uuid，每次执行一个
 * │   └── code.py // 源文件，文件名由 language_profile 决定
 * └── ...
 *
 * 工作目录在对象析构时删除，因此无论执行成功、失败、超时还是抛出异常，
 * 目录都不会残留。对象只能移动，不能复制，保证同一个目录只有一个所有者。
 */
struct workspace {
    /**
     * @brief 创建工作目录并写入源代码
     * @param root 存放所有工作目录的根目录，不存在时自动创建
     * @param profile 决定源文件的文件名
     * @param code 源代码，按字节原样写入
     * @throw workspace_error 无法创建目录或写入文件，此时不会残留任何文件
     */
    workspace(const std::filesystem::path &root, const language_profile &profile, const std::string &code);

    workspace(workspace &&other) noexcept;
    workspace(const workspace &) = delete;
    ~workspace();

    workspace &operator=(const workspace &) = delete;
    workspace &operator=(workspace &&) = delete;

    /**
     * @brief 工作目录的路径
     */
    const std::filesystem::path &directory() const;

    /**
     * @brief 源文件的路径
     */
    const std::filesystem::path &source_file() const;

    /**
     * @brief 立即删除工作目录，可以重复调用
     * @return 目录是否已经不存在
     */
    bool destroy() noexcept;

private:
    std::filesystem::path dir, source;
};

}  // namespace runbox
