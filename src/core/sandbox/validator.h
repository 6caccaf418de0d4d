#ifndef CODE_SANDBOX_VALIDATOR_H
#define CODE_SANDBOX_VALIDATOR_H

#include <cstddef>
#include <string>

#include "policy.h"

namespace code_sandbox
{
    /**
     * @brief 触发拒绝的规则
     */
    enum class ValidationRule {
        NONE = 0,
        SOURCE_TOO_LONG,
        FORBIDDEN_IMPORT,
        FORBIDDEN_FUNCTION
    };

    /**
     * @brief 静态校验结果
     */
    struct ValidationResult
    {
        bool ok = true;
        ValidationRule rule = ValidationRule::NONE;
        std::string subject;   // 被拒绝的模块名 / 函数名
        std::string reason;    // 直接展示给提交者的原因
    };

    /**
     * @brief 纯文本层面的静态校验 (无副作用)
     *
     * 1. 字符长度超过 policy.max_source_length -> 拒绝
     * 2. import 行中出现禁止模块且该模块不在本上下文白名单 -> 拒绝
     * 3. 源码中出现 "禁止函数名(" 且未被本上下文豁免 -> 拒绝
     *
     * 注意: 这是文本扫描而非语义分析，无法发现别名、字符串拼接、反射等绕过方式。
     * 真正的隔离边界在子进程 (rlimit + seccomp)。
     */
    ValidationResult Validate(const std::string& source, const AllowListPolicy& policy);

    /**
     * @brief UTF-8 字符数 (code points)，非法序列按解释器 errors='replace' 的替换字符计
     */
    std::size_t CountCharacters(const std::string& text);

    const char* ValidationRuleName(ValidationRule rule);
}

#endif // CODE_SANDBOX_VALIDATOR_H
