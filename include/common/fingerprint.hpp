#pragma once

#include <string>

namespace runbox {

/**
 * @brief 计算源代码的指纹，用于在日志中关联同一份代码的多次执行
 * 指纹为代码 MD5 摘要的前 8 位十六进制字符（小写）。
 * @note 指纹很短且 MD5 不是安全的哈希算法，不能用来做安全校验或者去重
 * @param code 用户提交的源代码
 * @return 8 个字符的十六进制字符串
 */
std::string fingerprint(const std::string &code);

}  // namespace runbox
