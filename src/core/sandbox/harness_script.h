#ifndef CODE_SANDBOX_HARNESS_SCRIPT_H
#define CODE_SANDBOX_HARNESS_SCRIPT_H

#include <string>

#include "policy.h"

namespace code_sandbox
{
    /**
     * @brief 故障报告种类 (harness 写入 REPORT_FD 的第一行)
     */
    struct FaultReport
    {
        std::string kind;     // "fault" | "eof" | "setup" | "" (无报告)
        std::string type;     // Python 异常类型名
        std::string message;  // str(exc)
    };

    /**
     * @brief 生成解释器内的 harness 脚本
     *
     * harness 在执行用户代码前:
     *  - 导入策略允许的模块，并按引用绑定到用户命名空间;
     *  - 只暴露 policy.allowed_builtins 中的内建函数;
     *  - 以受限 __import__ 替换导入机制，仅能取回已绑定的模块;
     *  - 把用户代码抛出的异常写入 REPORT_FD，而不是打印到 stderr。
     * 非法名字 (非标识符) 会被忽略。
     */
    std::string BuildHarnessScript(const AllowListPolicy& policy);

    /**
     * @brief 解析 REPORT_FD 内容: "kind\ntype\nmessage..."
     */
    FaultReport ParseFaultReport(const std::string& raw);
}

#endif // CODE_SANDBOX_HARNESS_SCRIPT_H
