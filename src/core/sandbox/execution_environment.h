#ifndef CODE_SANDBOX_EXECUTION_ENVIRONMENT_H
#define CODE_SANDBOX_EXECUTION_ENVIRONMENT_H

#include <atomic>
#include <string>

#include "policy.h"

namespace code_sandbox
{
    /**
     * @brief 受限执行的原始状态 (尚未映射为对外的结果类别)
     */
    enum class RunStatus {
        OK = 0,                 // 正常结束
        FAULT,                  // 用户代码抛出异常 / 解释器崩溃
        INPUT_EXHAUSTED,        // input() 没有可读输入 (EOFError)
        TIME_LIMIT_EXCEEDED,    // 截止时间被强杀 / SIGXCPU
        OUTPUT_LIMIT_EXCEEDED,  // 输出超过 max_output_bytes
        MEMORY_LIMIT_EXCEEDED,  // MemoryError / cgroup OOM
        SYSTEM_ERROR            // 沙箱自身失败
    };

    struct RunReport
    {
        RunStatus status = RunStatus::OK;
        std::string stdout_text;     // 捕获的标准输出 (最多 max_output_bytes)
        std::string stderr_text;     // 捕获的标准错误
        std::string fault_type;      // 例如 "ZeroDivisionError"
        std::string fault_message;   // 例如 "division by zero"
        int time_used_ms = 0;        // 墙钟时间
        int cpu_time_ms = 0;         // user + sys
        long memory_used_kb = 0;     // 峰值内存
        int exit_code = 0;           // 只有正常退出时有效
        std::string error_message;   // SYSTEM_ERROR 详情
    };

    const char* RunStatusName(RunStatus status);

    /**
     * @brief 子进程设置阶段退出码 (SandboxExitCode 120-200) 的描述
     * @return 其他退出码 (包括解释器自己的退出码) 返回空字符串
     */
    std::string GetExitCodeDescription(int code);

    /**
     * @brief 受限执行环境接口
     * 实现必须把所有失败写进 RunReport，而不是抛出。
     */
    class ExecutionEnvironment
    {
    public:
        virtual ~ExecutionEnvironment() = default;

        /**
         * @brief 在受限命名空间中执行 source
         * @param source 已通过静态校验的用户代码
         * @param policy 本次执行的上下文策略 (内建函数、模块、限制)
         */
        virtual RunReport Run(const std::string& source, const AllowListPolicy& policy) = 0;
    };

    /**
     * @brief 基于子进程的执行环境
     *
     * 每次调用:
     *  1. 在 workspace_root 下创建 run_<pid>_<seq> 工作目录 (DirectoryGuard 负责删除)
     *  2. 写入 harness.py 与 submission.py
     *  3. clone 子进程 (RunChildFn)，可选 namespaces + cgroup
     *  4. 父进程轮询 wait4，到达截止时间后 SIGKILL
     *  5. 读取捕获文件并分类
     */
    class ProcessEnvironment : public ExecutionEnvironment
    {
    public:
        /**
         * @param workspace_root 工作目录根 (例如 /tmp/code_sandbox)
         * 如果进程配置尚未加载，构造时会先调用 ApplyDefaultConfig()
         * @throw std::runtime_error 如果无法创建根目录
         */
        explicit ProcessEnvironment(const std::string& workspace_root);

        RunReport Run(const std::string& source, const AllowListPolicy& policy) override;

    private:
        std::string workspace_root_;
        std::atomic<unsigned long> sequence_;
    };
}

#endif // CODE_SANDBOX_EXECUTION_ENVIRONMENT_H
