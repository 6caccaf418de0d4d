#include "sandbox_isolation.h"
#include "sandbox_internal.h"
#include "seccomp_rules.h"

#include <unistd.h>
#include <fcntl.h>
#include <grp.h>
#include <sys/stat.h>
#include <sys/mount.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <cstring>
#include <cstdio>
#include <cerrno>

// 严重警告: 必须严格遵守 Async-Signal-Safe C 风格
// 禁止使用: malloc/new, exceptions, STL, iostream
// 只能使用: glibc 系统调用, stack memory, snprintf 等。

namespace code_sandbox {

    namespace {

        // 记录 Rootfs 初始化失败上下文，stderr 已重定向到捕获文件，父进程会把它带进诊断信息。
        [[noreturn]] void ExitSetupError(
            int code,
            const char* step,
            const char* work_dir,
            const char* src_path = nullptr,
            const char* target_path = nullptr)
        {
            int err = errno;
            char msg[1024];
            int n = snprintf(
                msg,
                sizeof(msg),
                "[sandbox][setup_rootfs] step=%s code=%d errno=%d(%s) uid=%d euid=%d work_dir=%s",
                step ? step : "-",
                code,
                err,
                strerror(err),
                (int)getuid(),
                (int)geteuid(),
                work_dir ? work_dir : "-");
            if (n < 0) n = 0;
            if (src_path && *src_path && n < (int)sizeof(msg)) {
                n += snprintf(msg + n, sizeof(msg) - (size_t)n, " src=%s", src_path);
            }
            if (target_path && *target_path && n < (int)sizeof(msg)) {
                n += snprintf(msg + n, sizeof(msg) - (size_t)n, " target=%s", target_path);
            }
            size_t len = (size_t)n;
            if (len >= sizeof(msg)) len = sizeof(msg) - 1;
            msg[len++] = '\n';
            ssize_t wrote = write(STDERR_FILENO, msg, len);
            (void)wrote;
            _exit(code);
        }

        // 确保父目录存在 (只在 base 之下创建)
        void EnsureParentDir(const char* path, const char* base)
        {
            char tmp[512];
            strncpy(tmp, path, sizeof(tmp) - 1);
            tmp[sizeof(tmp)-1] = '\0';
            char* p = strrchr(tmp, '/');
            if (!p) return;
            *p = '\0';

            size_t base_len = strlen(base);
            if (base_len == 0) return;
            if (strncmp(tmp, base, base_len) != 0) return;

            size_t len = strlen(tmp);
            for (size_t i = base_len + 1; i <= len; ++i) {
                if (tmp[i] == '\0' || tmp[i] == '/') {
                    char dirbuf[512];
                    memcpy(dirbuf, tmp, i);
                    dirbuf[i] = '\0';
                    if (mkdir(dirbuf, 0755) == -1 && errno != EEXIST) {
                        ExitSetupError(ERR_MKDIR_FAILED, "mkdir_parent", base, nullptr, dirbuf);
                    }
                }
            }
        }

        // 以 work_dir 为新根目录: 只读挂载解释器所需的系统目录，然后 pivot_root
        void SetupRootfs(const char* work_dir)
        {
            // 1. 设置挂载传播为 Private (防止污染宿主机)
            if (mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr) == -1)
            {
                ExitSetupError(ERR_MOUNT_PRIVATE, "mount_private_root", work_dir, "/", "/");
            }

            // 2. 将工作目录 Bind Mount 到自身 (pivot_root 的要求: 不能是 rootfs)
            if (mount(work_dir, work_dir, nullptr, MS_BIND | MS_REC, nullptr) == -1)
            {
                ExitSetupError(ERR_MOUNT_BIND_SELF, "mount_bind_self", work_dir, work_dir, work_dir);
            }

            // 3. 挂载目录配置 (mount_dirs)，不存在的目录跳过 (例如某些发行版没有 /lib64)
            char target[512];
            for (int i = 0; i < g_sandbox_config.mount_count; ++i)
            {
                const char* src = g_sandbox_config.mount_dirs[i];
                if (access(src, F_OK) != 0) continue;

                int n = snprintf(target, sizeof(target), "%s%s", work_dir, src);
                if (n >= (int)sizeof(target)) {
                    errno = ENAMETOOLONG;
                    ExitSetupError(ERR_MKDIR_FAILED, "mount_dir_target_too_long", work_dir, src, target);
                }

                EnsureParentDir(target, work_dir);

                if (mkdir(target, 0755) == -1 && errno != EEXIST) {
                    ExitSetupError(ERR_MKDIR_FAILED, "mkdir_mount_dir", work_dir, src, target);
                }
                if (mount(src, target, nullptr, MS_BIND | MS_REC, nullptr) == -1) {
                    ExitSetupError(ERR_MOUNT_BIND_LIB, "mount_bind_dir", work_dir, src, target);
                }
                if (mount(src, target, nullptr, MS_BIND | MS_REC | MS_RDONLY | MS_REMOUNT, nullptr) == -1) {
                    ExitSetupError(ERR_REMOUNT_RO, "mount_remount_dir_ro", work_dir, src, target);
                }
            }

            // 4. Pivot Root
            char old_root[512];
            snprintf(old_root, sizeof(old_root), "%s/old_root", work_dir);
            if (mkdir(old_root, 0755) == -1 && errno != EEXIST) {
                ExitSetupError(ERR_MKDIR_FAILED, "mkdir_old_root", work_dir, nullptr, old_root);
            }

            if (syscall(SYS_pivot_root, work_dir, old_root) == -1) {
                ExitSetupError(ERR_PIVOT_ROOT, "pivot_root", work_dir, work_dir, old_root);
            }
            if (chdir("/") == -1) ExitSetupError(ERR_CHDIR_NEW_ROOT, "chdir_new_root", work_dir, "/", "/");
            if (umount2("/old_root", MNT_DETACH) == -1) ExitSetupError(ERR_UMOUNT_OLD, "umount_old_root", work_dir, "/old_root", nullptr);
            if (rmdir("/old_root") == -1 && errno != ENOENT && errno != EBUSY) {}
        }

        void CloseInheritedFds()
        {
            bool close_range_success = false;

            #ifdef __NR_close_range
                if (syscall(__NR_close_range, REPORT_FD + 1, ~0U, 0) == 0) {
                    close_range_success = true;
                }
            #endif

            if (!close_range_success) {
                int max_fd = (int)sysconf(_SC_OPEN_MAX);
                if (max_fd < 0) max_fd = 4096;
                if (max_fd > 65536) max_fd = 65536;

                for (int fd = REPORT_FD + 1; fd < max_fd; ++fd) {
                    close(fd);
                }
            }
        }

        // 不能超过继承来的硬限制 (非 root 无法抬高)
        void SetLimit(int resource, rlim_t soft, rlim_t hard, int err_code)
        {
            rlimit current;
            if (getrlimit(resource, &current) == 0 && current.rlim_max != RLIM_INFINITY) {
                if (hard > current.rlim_max) hard = current.rlim_max;
                if (soft > hard) soft = hard;
            }
            rlimit limit;
            limit.rlim_cur = soft;
            limit.rlim_max = hard;
            if (setrlimit(resource, &limit) == -1) _exit(err_code);
        }

    } // anonymous namespace

    int RunChildFn(void* arg)
    {
        auto* args = (RunChildArgs*)(arg);

        // 调试说明：此处若需要输出，只能使用 write，不能使用 cout。
        // -----------------------------------------------------
        // 1. IO 重定向 (最先执行)
        // -----------------------------------------------------
        if (dup2(args->input_fd, STDIN_FILENO) == -1) _exit(ERR_DUP2);
        if (dup2(args->output_fd, STDOUT_FILENO) == -1) _exit(ERR_DUP2);
        if (dup2(args->error_fd, STDERR_FILENO) == -1) _exit(ERR_DUP2);
        if (args->report_fd != REPORT_FD) {
            if (dup2(args->report_fd, REPORT_FD) == -1) _exit(ERR_DUP2);
        } else {
            // 同号描述符: 清除 O_CLOEXEC，保证 exec 后仍然可用
            int flags = fcntl(REPORT_FD, F_GETFD);
            if (flags == -1 || fcntl(REPORT_FD, F_SETFD, flags & ~FD_CLOEXEC) == -1) _exit(ERR_DUP2);
        }

        // [安全]: 关闭除 0,1,2,REPORT_FD 以外的所有文件描述符
        CloseInheritedFds();

        // -----------------------------------------------------
        // 2. 构建隔离环境 (Rootfs，可选)
        // -----------------------------------------------------
        if (g_sandbox_config.use_namespaces)
        {
            SetupRootfs(args->work_dir);

            if (mkdir("/tmp", 01777) == -1 && errno != EEXIST) _exit(ERR_MOUNT_TMP);
            if (mkdir("/proc", 0755) == -1 && errno != EEXIST) _exit(ERR_MOUNT_PROC);

            // 锁定根目录权限并立即改为只读
            if (chmod("/", 0555) == -1) _exit(ERR_CHDIR_FAILED);
            if (mount(nullptr, "/", nullptr, MS_REMOUNT | MS_BIND | MS_RDONLY, nullptr) == -1) {
                _exit(ERR_REMOUNT_RO);
            }

            char tmpfs_opts[64];
            long long run_tmpfs_mb = g_sandbox_config.run_tmpfs_size_mb > 0 ? g_sandbox_config.run_tmpfs_size_mb : 16;
            snprintf(tmpfs_opts, sizeof(tmpfs_opts), "size=%lldm,mode=1777", run_tmpfs_mb);
            if (mount("tmpfs", "/tmp", "tmpfs", 0, tmpfs_opts) == -1) _exit(ERR_MOUNT_TMP);

            if (mount("proc", "/proc", "proc", 0, nullptr) == -1) _exit(ERR_MOUNT_PROC);
            if (mount("proc", "/proc", "proc", MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NOEXEC | MS_NODEV, nullptr) == -1)
                _exit(ERR_MOUNT_PROC);
        }
        else
        {
            if (chdir(args->work_dir) != 0) _exit(ERR_CHDIR_FAILED);
        }

        // -----------------------------------------------------
        // 3. 资源限制 (setrlimit)
        // -----------------------------------------------------
        rlim_t cpu_soft = (args->time_limit_ms + 999) / 1000;
        if (cpu_soft < 1) cpu_soft = 1;
        SetLimit(RLIMIT_CPU, cpu_soft, cpu_soft + 1, ERR_RLIMIT_CPU);

        if (args->memory_limit_kb > 0) {
            rlim_t mem_bytes = (rlim_t)args->memory_limit_kb * 1024;
            SetLimit(RLIMIT_AS, mem_bytes, mem_bytes, ERR_RLIMIT_MEMORY);
        }

        SetLimit(RLIMIT_STACK, 8 * 1024 * 1024, 8 * 1024 * 1024, ERR_RLIMIT_STACK);
        SetLimit(RLIMIT_NPROC, 5, 5, ERR_RLIMIT_NPROC);
        SetLimit(RLIMIT_FSIZE, args->output_limit_bytes, args->output_limit_bytes, ERR_RLIMIT_FSIZE);
        SetLimit(RLIMIT_CORE, 0, 0, ERR_RLIMIT_CORE);

        // -----------------------------------------------------
        // 4. 清理附加组 + 降权 (仅 root 且配置开启)
        // -----------------------------------------------------
        if (g_sandbox_config.drop_privileges && geteuid() == 0)
        {
            if (setgroups(0, nullptr) != 0) _exit(ERR_SETGID_FAILED);
            if (setgid(g_sandbox_config.run_gid) != 0) _exit(ERR_SETGID_FAILED);
            if (setuid(g_sandbox_config.run_uid) != 0) _exit(ERR_SETUID_FAILED);
        }

        // -----------------------------------------------------
        // 5. 安全增强：禁止提升特权 + 加载 Seccomp (exec 前最后一步)
        // -----------------------------------------------------
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) _exit(ERR_SANDBOX_EXCEPTION);
        LoadInterpreterSeccompRules(args->interpreter_path);

        // 6. 执行解释器: -I 隔离模式, -S 不加载 site, -B 不写 .pyc
        char* const argv[] = {
            args->interpreter_path,
            (char*)"-I",
            (char*)"-S",
            (char*)"-B",
            args->harness_path,
            args->submission_path,
            nullptr
        };
        char* const envp[] = {
            (char*)"PATH=/usr/bin:/bin",
            (char*)"LANG=C.UTF-8",
            nullptr
        };

        execve(args->interpreter_path, argv, envp);

        _exit(ERR_EXEC_FAILED); // 如果 exec 失败
        return 0;
    }

} // namespace code_sandbox
