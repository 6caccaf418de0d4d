#ifndef CODE_SANDBOX_SANDBOX_INTERNAL_H
#define CODE_SANDBOX_SANDBOX_INTERNAL_H

#include <sys/types.h>
#include <sys/resource.h>
#include <unistd.h>

namespace code_sandbox {

    // 定义子进程栈大小: 8MB (clone 使用独立栈)
    const int STACK_SIZE = 8 * 1024 * 1024;

    // 子进程内 harness 使用的故障报告描述符
    const int REPORT_FD = 3;

    // 退出状态码定义
    enum SandboxExitCode {
        EXIT_OK = 0, // 正常退出

        // harness 约定 (1-9): 由解释器内的 harness 返回
        EXIT_FAULT           = 1,   // 用户代码抛出异常 (故障描述写入 REPORT_FD)
        EXIT_INPUT_EXHAUSTED = 3,   // input() 读到 EOF (沙箱没有交互输入源)

        // 第一阶段: 基础设置与执行 (121-139)
        ERR_DUP2             = 121, // 重定向标准输出/输入失败
        ERR_EXEC_FAILED      = 127, // execve 执行解释器失败
        ERR_CHDIR_FAILED     = 128, // 切换工作目录失败
        ERR_SETGID_FAILED    = 129, // 设置组 ID 失败
        ERR_SETUID_FAILED    = 130, // 设置用户 ID 失败

        // 第二阶段: 资源限制 (140-159)
        ERR_RLIMIT_CPU       = 141, // 设置 CPU 时间限制失败
        ERR_RLIMIT_MEMORY    = 142, // 设置内存限制失败
        ERR_RLIMIT_STACK     = 143, // 设置栈限制失败
        ERR_RLIMIT_NPROC     = 144, // 设置进程数限制失败
        ERR_RLIMIT_FSIZE     = 145, // 设置文件大小限制失败
        ERR_RLIMIT_CORE      = 146, // 关闭 core dump 失败
        ERR_SECCOMP          = 150, // 加载 seccomp 过滤器失败

        // 第三阶段: 隔离与文件系统 (190-200)
        ERR_MOUNT_PRIVATE    = 190, // mount --make-private 失败
        ERR_MOUNT_BIND_SELF  = 191, // bind mount 工作目录失败
        ERR_MOUNT_BIND_LIB   = 192, // 挂载系统库 (/lib, /usr...) 失败
        ERR_REMOUNT_RO       = 193, // 重新挂载为只读失败
        ERR_PIVOT_ROOT       = 194, // pivot_root 系统调用失败
        ERR_CHDIR_NEW_ROOT   = 195, // 切换到新根目录失败
        ERR_UMOUNT_OLD       = 196, // 卸载旧根目录 (/old_root) 失败
        ERR_MOUNT_PROC       = 197, // 挂载 /proc 失败
        ERR_MKDIR_FAILED     = 198, // 创建目录失败
        ERR_SANDBOX_EXCEPTION = 199, // 沙箱内部异常
        ERR_MOUNT_TMP        = 200  // 挂载 /tmp 失败
    };

    /**
     * @brief 进程级配置 (C 风格结构体)
     * 子进程在 clone 之后只能读取这里的定长字段，不能触碰 STL 对象。
     */
    struct GlobalConfig {
        // 工作区与解释器
        char workspace_root[256];
        char interpreter_path[256];

        // 挂载目录 (仅在启用 namespaces 时使用)
        char mount_dirs[16][256];
        int mount_count;

        // 输出超限缓冲大小 (Soft->Hard)
        long long output_buffer_size;

        // 运行时 /tmp tmpfs 大小 (MB)
        long long run_tmpfs_size_mb;

        // 隔离开关
        bool use_namespaces;
        bool use_cgroup;

        // 降权 (仅在以 root 运行时生效)
        bool drop_privileges;
        uid_t run_uid;
        gid_t run_gid;

        // cgroup 限制
        int cgroup_pids_limit;
    };
    extern GlobalConfig g_sandbox_config;

    /**
     * @brief 运行子进程所需的参数 (C 风格结构体)
     */
    struct RunChildArgs {
        char interpreter_path[256]; // 解释器路径 (execve 的唯一白名单目标)
        char work_dir[256];         // 请求工作目录
        char harness_path[256];     // harness 脚本 (相对于子进程根目录)
        char submission_path[256];  // 用户代码文件

        int time_limit_ms;          // 时间限制 (毫秒)
        long long memory_limit_kb;  // 地址空间限制 (KB)
        rlim_t output_limit_bytes;  // 输出文件大小硬限制

        int input_fd;  // 对应 stdin
        int output_fd; // 对应 stdout
        int error_fd;  // 对应 stderr
        int report_fd; // 对应 REPORT_FD
    };

} // namespace code_sandbox

#endif // CODE_SANDBOX_SANDBOX_INTERNAL_H
