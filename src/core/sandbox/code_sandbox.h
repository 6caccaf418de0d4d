#ifndef CODE_SANDBOX_CODE_SANDBOX_H
#define CODE_SANDBOX_CODE_SANDBOX_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "execution_environment.h"
#include "governor.h"
#include "outcome.h"
#include "policy.h"
#include "validator.h"

namespace code_sandbox
{
    /**
     * @brief 沙箱门面: 唯一的对外入口
     *
     * Execute 流程: 解析上下文策略 -> 静态校验 (拒绝则直接返回，
     * 不触碰执行环境) -> 获取进程级执行锁 -> Governor 执行并分类。
     * Execute 从不抛出，所有失败都以 ExecutionOutcome 返回。
     */
    class CodeSandbox
    {
    public:
        CodeSandbox(PolicyRegistry registry, std::unique_ptr<ExecutionEnvironment> environment);

        // 使用外部持有的执行环境 (测试用，调用方保证生命周期)
        CodeSandbox(PolicyRegistry registry, ExecutionEnvironment& environment);

        CodeSandbox(const CodeSandbox&) = delete;
        CodeSandbox& operator=(const CodeSandbox&) = delete;

        ExecutionOutcome Execute(const std::string& source, const std::string& context);
        ExecutionOutcome Execute(const SourceSubmission& submission);

        /**
         * @brief 只做静态校验 (CLI --validate_only)
         */
        ValidationResult Validate(const std::string& source, const std::string& context) const;

        const PolicyRegistry& registry() const { return registry_; }

        // 最近一次执行的墙钟耗时 (毫秒)，校验拒绝时为 0
        // 多线程共享同一实例时只保证读到某一次完整的值
        long long last_elapsed_ms() const { return last_elapsed_ms_.load(); }

    private:
        // 同一进程内同时最多只有一个沙箱执行
        static std::mutex& ExecutionMutex();

        PolicyRegistry registry_;
        std::unique_ptr<ExecutionEnvironment> owned_environment_;
        ExecutionGovernor governor_;
        std::atomic<long long> last_elapsed_ms_{0};
    };
}

#endif // CODE_SANDBOX_CODE_SANDBOX_H
