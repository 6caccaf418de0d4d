// src/core/sandbox/seccomp_rules.cpp
#include "seccomp_rules.h"
#include "sandbox_internal.h"
#include <seccomp.h>
#include <fcntl.h>
#include <cerrno>

namespace code_sandbox {

    void LoadInterpreterSeccompRules(const char* interpreter_path) {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) _exit(ERR_SECCOMP);

        // 辅助宏：以 errno 拒绝系统调用 (解释器会得到 PermissionError 而不是被杀)
        #define DENY_SYSCALL(name, err) \
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(err), SCMP_SYS(name), 0) != 0) { \
                seccomp_release(ctx); _exit(ERR_SECCOMP); \
            }

        // 参数 idx 中包含 flag 位时拒绝
        #define DENY_SYS_FLAG(name, idx, flag, err) \
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(err), SCMP_SYS(name), 1, \
                SCMP_CMP(idx, SCMP_CMP_MASKED_EQ, (scmp_datum_t)(flag), (scmp_datum_t)(flag))) != 0) { \
                seccomp_release(ctx); _exit(ERR_SECCOMP); \
            }

        // 核心防御：execve 只允许本次 exec 解释器
        // exec 之后新地址空间里不会再有同一个指针值，因此后续 execve 全部失败
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(execve), 1,
                SCMP_A0(SCMP_CMP_NE, (scmp_datum_t)interpreter_path)) != 0) {
            seccomp_release(ctx); _exit(ERR_SECCOMP);
        }
        DENY_SYSCALL(execveat, EPERM);

        // 核心防御：open/openat 禁止写权限 (只读)
        DENY_SYS_FLAG(open, 1, O_WRONLY, EACCES);
        DENY_SYS_FLAG(open, 1, O_RDWR, EACCES);
        DENY_SYS_FLAG(open, 1, O_CREAT, EACCES);
        DENY_SYS_FLAG(open, 1, O_TRUNC, EACCES);
        DENY_SYS_FLAG(openat, 2, O_WRONLY, EACCES);
        DENY_SYS_FLAG(openat, 2, O_RDWR, EACCES);
        DENY_SYS_FLAG(openat, 2, O_CREAT, EACCES);
        DENY_SYS_FLAG(openat, 2, O_TRUNC, EACCES);
        DENY_SYSCALL(openat2, ENOSYS); // glibc 回退到 openat
        DENY_SYSCALL(creat, EACCES);

        // 文件系统修改
        DENY_SYSCALL(unlink, EPERM);
        DENY_SYSCALL(unlinkat, EPERM);
        DENY_SYSCALL(rename, EPERM);
        DENY_SYSCALL(renameat, EPERM);
        DENY_SYSCALL(renameat2, EPERM);
        DENY_SYSCALL(mkdir, EPERM);
        DENY_SYSCALL(mkdirat, EPERM);
        DENY_SYSCALL(rmdir, EPERM);
        DENY_SYSCALL(link, EPERM);
        DENY_SYSCALL(linkat, EPERM);
        DENY_SYSCALL(symlink, EPERM);
        DENY_SYSCALL(symlinkat, EPERM);
        DENY_SYSCALL(chmod, EPERM);
        DENY_SYSCALL(fchmod, EPERM);
        DENY_SYSCALL(fchmodat, EPERM);
        DENY_SYSCALL(chown, EPERM);
        DENY_SYSCALL(fchown, EPERM);
        DENY_SYSCALL(lchown, EPERM);
        DENY_SYSCALL(fchownat, EPERM);
        DENY_SYSCALL(truncate, EPERM);
        DENY_SYSCALL(mknod, EPERM);
        DENY_SYSCALL(mknodat, EPERM);

        // 网络
        DENY_SYSCALL(socket, EPERM);
        DENY_SYSCALL(socketpair, EPERM);
        DENY_SYSCALL(connect, EPERM);
        DENY_SYSCALL(bind, EPERM);
        DENY_SYSCALL(listen, EPERM);
        DENY_SYSCALL(accept, EPERM);
        DENY_SYSCALL(accept4, EPERM);

        // 进程创建 (clone3 返回 ENOSYS 让 glibc 回退到 clone)
        DENY_SYSCALL(fork, EPERM);
        DENY_SYSCALL(vfork, EPERM);
        DENY_SYSCALL(clone, EPERM);
        DENY_SYSCALL(clone3, ENOSYS);

        // 信号只能发给自己 (kill(0)/kill(-1)/父进程全部拒绝)
        scmp_datum_t self = (scmp_datum_t)getpid();
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(kill), 1, SCMP_A0(SCMP_CMP_NE, self)) != 0 ||
            seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(tkill), 1, SCMP_A0(SCMP_CMP_NE, self)) != 0 ||
            seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(tgkill), 1, SCMP_A0(SCMP_CMP_NE, self)) != 0) {
            seccomp_release(ctx); _exit(ERR_SECCOMP);
        }

        // 调试 / 跨进程内存访问
        DENY_SYSCALL(ptrace, EPERM);
        DENY_SYSCALL(process_vm_readv, EPERM);
        DENY_SYSCALL(process_vm_writev, EPERM);

        // 命名空间 / 挂载 / 特权操作
        DENY_SYSCALL(mount, EPERM);
        DENY_SYSCALL(umount2, EPERM);
        DENY_SYSCALL(pivot_root, EPERM);
        DENY_SYSCALL(chroot, EPERM);
        DENY_SYSCALL(setns, EPERM);
        DENY_SYSCALL(unshare, EPERM);
        DENY_SYSCALL(reboot, EPERM);
        DENY_SYSCALL(kexec_load, EPERM);
        DENY_SYSCALL(init_module, EPERM);
        DENY_SYSCALL(finit_module, EPERM);
        DENY_SYSCALL(delete_module, EPERM);
        DENY_SYSCALL(bpf, EPERM);
        DENY_SYSCALL(perf_event_open, EPERM);
        DENY_SYSCALL(keyctl, EPERM);
        DENY_SYSCALL(add_key, EPERM);
        DENY_SYSCALL(request_key, EPERM);
        DENY_SYSCALL(swapon, EPERM);
        DENY_SYSCALL(swapoff, EPERM);
        DENY_SYSCALL(settimeofday, EPERM);
        DENY_SYSCALL(setrlimit, EPERM);

        // prlimit64 仅允许查询 (new_limit == NULL)，禁止修改限制
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(prlimit64), 1,
                SCMP_A2(SCMP_CMP_NE, 0)) != 0) {
            seccomp_release(ctx); _exit(ERR_SECCOMP);
        }

        #undef DENY_SYSCALL
        #undef DENY_SYS_FLAG

        if (seccomp_load(ctx) != 0) {
            seccomp_release(ctx);
            _exit(ERR_SECCOMP);
        }
        seccomp_release(ctx);
    }
}
