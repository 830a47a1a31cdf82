#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * 这个头文件包含语言表的定义。
 * 每种语言用一个 language_profile 描述：源文件名、容器镜像、以及容器内的执行命令。
 * 解释型语言（python、javascript）直接调用解释器执行挂载进容器的源文件；
 * 编译型语言（cpp、java、go）使用一条 shell 命令先编译、编译成功后再运行，
 * 这样整个过程只需要启动一次容器，而且编译错误会表现为非零返回码。
 */
namespace runbox {

/**
 * @brief 描述如何在容器中构建并运行一种语言的程序
 * 对象创建后不再修改
 */
struct language_profile {
    /**
     * @brief 语言标识，比如 python、cpp，总是小写
     */
    std::string id;

    /**
     * @brief 源代码在工作目录中的文件名
     * @note 对于 Java，文件名必须与主类名一致，因此为 Main.java
     */
    std::string filename;

    /**
     * @brief 容器镜像，比如 python:3.9-slim
     */
    std::string image;

    /**
     * @brief 容器内执行的命令模板，按顺序作为参数传给容器运行时
     * 可以使用以下占位符：
     * {workdir}: 工作目录在容器内的挂载路径
     * {source}: 源文件在容器内的路径，即 {workdir}/{filename}
     * @code{.json}
     * ["bash", "-c", "g++ -o /tmp/code.out {source} && /tmp/code.out"]
     * @endcode
     */
    std::vector<std::string> command;

    /**
     * @brief 将命令模板中的占位符替换为实际路径
     * @param mount_path 工作目录在容器内的挂载路径
     * @return 容器内执行的命令
     */
    std::vector<std::string> expand_command(const std::string &mount_path) const;
};

void from_json(const nlohmann::json &j, language_profile &profile);
void to_json(nlohmann::json &j, const language_profile &profile);

/**
 * @brief 语言表，根据语言标识查找 language_profile
 * 语言表在构造完成后不再修改，因此可以被多个线程同时访问而不需要加锁。
 * 新增一种语言只需要新增一个 language_profile。
 */
struct language_registry {
    /**
     * @brief 使用内置的语言配置构造语言表
     */
    language_registry();

    /**
     * @brief 使用给定的语言配置构造语言表
     * @param profiles 语言配置，后出现的配置会覆盖标识相同的先出现的配置
     * @throw std::invalid_argument 语言配置不完整，或者源文件名不安全
     */
    explicit language_registry(const std::vector<language_profile> &profiles);

    /**
     * @brief 内置的语言配置：python、javascript、cpp、java、go
     */
    static std::vector<language_profile> builtin_profiles();

    /**
     * @brief 根据语言标识查找语言配置，标识不区分大小写
     * @throw unsupported_language 语言没有注册
     */
    const language_profile &resolve(const std::string &language) const;

    /**
     * @brief 语言是否已经注册
     */
    bool supports(const std::string &language) const;

    /**
     * @brief 所有已注册的语言标识，按字典序排列
     */
    std::vector<std::string> languages() const;

private:
    std::map<std::string, language_profile> profiles;
};

}  // namespace runbox
