#ifndef CODE_SANDBOX_GOVERNOR_H
#define CODE_SANDBOX_GOVERNOR_H

#include <string>

#include "execution_environment.h"
#include "outcome.h"
#include "policy.h"

namespace code_sandbox
{
    // input() 没有输入源时追加在输出后面的说明
    extern const char* const kNoInputNote;

    /**
     * @brief 执行计时与结果分类
     *
     * 包装一次 ExecutionEnvironment::Run，记录墙钟时间，
     * 并把 RunReport 映射为 ExecutionOutcome:
     *  - 截止时间 / SIGXCPU / 事后耗时超限 -> timeout
     *  - EOFError (没有输入) -> Success (输出 + kNoInputNote)
     *  - 其他故障、输出超限、内存超限、stderr 非空 -> runtime_error
     *  - 沙箱自身失败 -> sandbox_error
     */
    class ExecutionGovernor
    {
    public:
        explicit ExecutionGovernor(ExecutionEnvironment& environment);

        ExecutionOutcome Run(const std::string& source, const AllowListPolicy& policy);

        // 最近一次 Run 的墙钟耗时 (毫秒)
        long long last_elapsed_ms() const { return last_elapsed_ms_; }

        /**
         * @brief 纯映射函数，不触碰执行环境
         * @param elapsed_seconds 调用方测得的墙钟时间
         */
        static ExecutionOutcome Classify(const RunReport& report,
                                         const AllowListPolicy& policy,
                                         double elapsed_seconds);

    private:
        ExecutionEnvironment& environment_;
        long long last_elapsed_ms_ = 0;
    };

    /**
     * @brief 秒数的显示格式: 5 -> "5"，0.5 -> "0.5"
     */
    std::string FormatSeconds(double seconds);
}

#endif // CODE_SANDBOX_GOVERNOR_H
