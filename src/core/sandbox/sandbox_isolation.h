#ifndef CODE_SANDBOX_SANDBOX_ISOLATION_H
#define CODE_SANDBOX_SANDBOX_ISOLATION_H

namespace code_sandbox {

    /**
     * @brief 解释器子进程的入口点 (隔离层)
     * 兼容 clone() 函数签名。
     * 依次完成: IO 重定向 -> (可选) Rootfs 隔离 -> 资源限制 -> (可选) 降权
     * -> NO_NEW_PRIVS + Seccomp -> execve 解释器。
     * @param arg 指向 RunChildArgs 结构体的指针
     * @return int 退出码 (只在 exec 失败时返回)
     */
    int RunChildFn(void* arg);

} // namespace code_sandbox

#endif // CODE_SANDBOX_SANDBOX_ISOLATION_H
