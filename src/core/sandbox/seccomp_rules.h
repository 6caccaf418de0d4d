#ifndef CODE_SANDBOX_SECCOMP_RULES_H
#define CODE_SANDBOX_SECCOMP_RULES_H

namespace code_sandbox {

    /**
     * @brief 加载解释器阶段 Seccomp 规则
     * 解释器启动需要大量系统调用，因此使用默认允许 + 危险系统调用黑名单策略:
     * 网络、进程创建、写文件/改文件系统、mount/ptrace/模块加载等一律拒绝，
     * kill/tkill/tgkill 只能指向自身，
     * execve 只允许目标为 interpreter_path 指针本身 (即本次 exec)。
     * 调用失败会直接 _exit(ERR_SECCOMP)。
     */
    void LoadInterpreterSeccompRules(const char* interpreter_path);

} // namespace code_sandbox

#endif // CODE_SANDBOX_SECCOMP_RULES_H
