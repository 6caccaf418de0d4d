#include "execution_environment.h"
#include "sandbox_internal.h"
#include "sandbox_isolation.h"
#include "cgroup_manager.h"
#include "config.h"
#include "harness_script.h"
#include "stream_capture.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <thread>
#include <chrono>
#include <cstring>
#include <cmath>
#include <memory>
#include <stdexcept>

// 父进程使用的系统调用
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <sched.h>
#include <signal.h>

namespace code_sandbox
{

    namespace fs = std::filesystem;

    namespace {

        const char* const kCgroupRoot = "/sys/fs/cgroup/code_sandbox";
        const std::uint64_t kStderrLimit = 64 * 1024;

        std::string FormatSystemError(const std::string& prefix)
        {
            return prefix + ": " + std::strerror(errno);
        }

        // 只保留第一行附近的诊断，避免把整段 traceback 放进错误信息
        std::string FirstLines(const std::string& text, std::size_t max_len = 512)
        {
            std::string out = TruncateUtf8(text, max_len);
            while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
            return out;
        }

        // RAII helpers for parent process management (只在父进程使用，允许 C++ 特性)
        class ProcessGuard
        {
        public:
            explicit ProcessGuard(pid_t pid) : pid_(pid), released_(false) {}

            ProcessGuard(const ProcessGuard&) = delete;
            ProcessGuard& operator=(const ProcessGuard&) = delete;

            ~ProcessGuard()
            {
                if (released_ || pid_ <= 0) return;

                int status;
                // 仍在运行 -> 强杀并阻塞收尸
                if (waitpid(pid_, &status, WNOHANG) == 0) {
                    ::kill(pid_, SIGKILL);
                    wait_rusage(status, nullptr);
                }
            }

            pid_t wait_nonblock_rusage(int& status, struct rusage* usage)
            {
                if (pid_ <= 0) return -1;
                for (;;) {
                    pid_t w = wait4(pid_, &status, WNOHANG, usage);
                    if (w == -1 && errno == EINTR) continue;
                    return w;
                }
            }

            pid_t wait_rusage(int& status, struct rusage* usage)
            {
                if (pid_ <= 0) return -1;
                for (;;) {
                    pid_t w = wait4(pid_, &status, 0, usage);
                    if (w == -1 && errno == EINTR) continue;
                    return w;
                }
            }

            bool kill() { if (pid_ <= 0) return false; return ::kill(pid_, SIGKILL) == 0; }
            void release() { released_ = true; pid_ = -1; }

        private:
            pid_t pid_;
            bool released_;
        };

        class DirectoryGuard
        {
        public:
            explicit DirectoryGuard(fs::path p) : path_(std::move(p)) {}

            DirectoryGuard(const DirectoryGuard&) = delete;
            DirectoryGuard& operator=(const DirectoryGuard&) = delete;

            ~DirectoryGuard()
            {
                std::error_code ec;
                fs::remove_all(path_, ec);
                if (ec) {
                    std::cerr << "[沙箱] 清理工作目录失败 " << path_ << ": " << ec.message() << std::endl;
                }
            }

        private:
            fs::path path_;
        };

        bool WriteFile(const fs::path& path, const std::string& content)
        {
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            if (!ofs) return false;
            ofs << content;
            return ofs.good();
        }

        bool CopyPath(char* dst, std::size_t size, const std::string& value)
        {
            if (value.size() >= size) return false;
            std::memset(dst, 0, size);
            std::memcpy(dst, value.c_str(), value.size());
            return true;
        }

        RunReport SystemError(const std::string& message)
        {
            RunReport report;
            report.status = RunStatus::SYSTEM_ERROR;
            report.error_message = message;
            std::cerr << "[沙箱] " << message << std::endl;
            return report;
        }

    } // anonymous namespace

    std::string GetExitCodeDescription(int code)
    {
        switch (code)
        {
            // Stage 1: Basic Setup / Exec
            case ERR_DUP2:          return "dup2 调用失败 (IO Redirect)";
            case ERR_EXEC_FAILED:   return "execve 调用失败 (解释器启动失败)";
            case ERR_CHDIR_FAILED:  return "chdir 切换工作目录失败";
            case ERR_SETGID_FAILED: return "setgid 失败 (降权失败)";
            case ERR_SETUID_FAILED: return "setuid 失败 (降权失败)";

            // Stage 2: Resource Limits
            case ERR_RLIMIT_CPU:    return "setrlimit(CPU) 失败";
            case ERR_RLIMIT_MEMORY: return "setrlimit(AS) 失败";
            case ERR_RLIMIT_STACK:  return "setrlimit(STACK) 失败";
            case ERR_RLIMIT_NPROC:  return "setrlimit(NPROC) 失败";
            case ERR_RLIMIT_FSIZE:  return "setrlimit(FSIZE) 失败";
            case ERR_RLIMIT_CORE:   return "setrlimit(CORE) 失败";
            case ERR_SECCOMP:       return "加载 seccomp 过滤器失败";

            // Stage 3: Isolation / Rootfs
            case ERR_MOUNT_PRIVATE:     return "mount --make-rprivate 失败";
            case ERR_MOUNT_BIND_SELF:   return "bind mount 工作目录失败";
            case ERR_MOUNT_BIND_LIB:    return "bind mount 系统目录失败";
            case ERR_REMOUNT_RO:        return "remount (RO) 失败";
            case ERR_PIVOT_ROOT:        return "pivot_root 系统调用失败";
            case ERR_CHDIR_NEW_ROOT:    return "切换到新根目录失败";
            case ERR_UMOUNT_OLD:        return "umount /old_root 失败";
            case ERR_MOUNT_PROC:        return "mount /proc 失败";
            case ERR_MOUNT_TMP:         return "mount /tmp (tmpfs) 失败";
            case ERR_MKDIR_FAILED:      return "mkdir (构建 Rootfs) 失败";
            case ERR_SANDBOX_EXCEPTION: return "prctl(NO_NEW_PRIVS) 失败";

            // 不是子进程设置阶段的退出码 (例如解释器自己的退出码)
            default: return "";
        }
    }

    const char* RunStatusName(RunStatus status)
    {
        switch (status) {
            case RunStatus::OK:                    return "OK";
            case RunStatus::FAULT:                 return "FAULT";
            case RunStatus::INPUT_EXHAUSTED:       return "INPUT_EXHAUSTED";
            case RunStatus::TIME_LIMIT_EXCEEDED:   return "TIME_LIMIT_EXCEEDED";
            case RunStatus::OUTPUT_LIMIT_EXCEEDED: return "OUTPUT_LIMIT_EXCEEDED";
            case RunStatus::MEMORY_LIMIT_EXCEEDED: return "MEMORY_LIMIT_EXCEEDED";
            case RunStatus::SYSTEM_ERROR:          return "SYSTEM_ERROR";
        }
        return "UNKNOWN";
    }

    ProcessEnvironment::ProcessEnvironment(const std::string& workspace_root)
        : workspace_root_(workspace_root), sequence_(0)
    {
        // 调用方没有加载过配置 (LoadConfig / ApplyDefaultConfig) 时使用内置默认值
        if (g_sandbox_config.interpreter_path[0] == '\0')
        {
            std::cerr << "[沙箱] 未加载配置，使用默认配置" << std::endl;
            ApplyDefaultConfig();
        }

        std::error_code ec;
        fs::create_directories(fs::path(workspace_root_), ec);
        if (ec)
        {
            throw std::runtime_error("沙箱初始化失败: 无法创建工作区 '" + workspace_root_ + "': " + ec.message());
        }
    }

    RunReport ProcessEnvironment::Run(const std::string& source, const AllowListPolicy& policy)
    {
        std::error_code ec;

        // 1. 准备工作区: {workspace_root}/run_{pid}_{seq}/
        std::string run_id = "run_" + std::to_string(getpid()) + "_" + std::to_string(++sequence_);
        fs::path request_dir = fs::path(workspace_root_) / run_id;

        fs::create_directories(request_dir, ec);
        if (ec)
        {
            return SystemError("无法创建请求目录 '" + request_dir.string() + "': " + ec.message());
        }
        // RAII guard: 任何退出路径都删除工作目录
        DirectoryGuard dir_guard(request_dir);

        // 2. 写入 harness 与用户代码
        fs::path harness_file = request_dir / "harness.py";
        fs::path submission_file = request_dir / "submission.py";
        if (!WriteFile(harness_file, BuildHarnessScript(policy)) || !WriteFile(submission_file, source))
        {
            return SystemError("写入代码文件时发生 I/O 错误: " + request_dir.string());
        }

        // [安全]: 降权运行时，目录所有者改为 run_uid，权限限制为 700
        if (g_sandbox_config.drop_privileges && geteuid() == 0)
        {
            bool owned = chown(request_dir.c_str(), g_sandbox_config.run_uid, g_sandbox_config.run_gid) == 0
                      && chown(harness_file.c_str(), g_sandbox_config.run_uid, g_sandbox_config.run_gid) == 0
                      && chown(submission_file.c_str(), g_sandbox_config.run_uid, g_sandbox_config.run_gid) == 0;
            if (!owned)
            {
                return SystemError(FormatSystemError("无法修改目录所有者"));
            }
            fs::permissions(request_dir, fs::perms::owner_all, ec);
            if (ec)
            {
                return SystemError("无法设置目录权限: " + ec.message());
            }
        }

        // 3. 捕获文件 (调用方自身的 1/2 不会被触碰)
        std::unique_ptr<CapturedStreams> streams;
        try {
            streams = std::make_unique<CapturedStreams>(request_dir.string());
        } catch (const std::exception& e) {
            return SystemError(e.what());
        }

        // 4. 准备参数与栈
        const std::uint64_t output_limit = static_cast<std::uint64_t>(policy.max_output_bytes);
        const int time_limit_ms = static_cast<int>(std::ceil(policy.max_seconds * 1000.0));
        const long long memory_limit_kb = policy.memory_limit_mb > 0 ? policy.memory_limit_mb * 1024LL : 0;

        RunChildArgs args;
        std::memset(&args, 0, sizeof(args));

        // pivot_root 之后工作目录就是 "/"
        std::string child_dir = g_sandbox_config.use_namespaces ? "" : request_dir.string();
        bool paths_ok = CopyPath(args.interpreter_path, sizeof(args.interpreter_path), g_sandbox_config.interpreter_path)
                     && CopyPath(args.work_dir, sizeof(args.work_dir), request_dir.string())
                     && CopyPath(args.harness_path, sizeof(args.harness_path), child_dir + "/harness.py")
                     && CopyPath(args.submission_path, sizeof(args.submission_path), child_dir + "/submission.py");
        if (!paths_ok)
        {
            return SystemError("工作目录路径过长: " + request_dir.string());
        }
        if (access(args.interpreter_path, X_OK) != 0)
        {
            return SystemError(FormatSystemError(std::string("解释器不可执行 '") + args.interpreter_path + "'"));
        }

        args.time_limit_ms = time_limit_ms;
        args.memory_limit_kb = memory_limit_kb;
        // [OLE] Hard Limit = 输出上限 + 缓冲；父进程在结束后按文件大小判定
        args.output_limit_bytes = (rlim_t)(output_limit + (std::uint64_t)g_sandbox_config.output_buffer_size);

        args.input_fd = streams->input_fd();
        args.output_fd = streams->output_fd();
        args.error_fd = streams->error_fd();
        args.report_fd = streams->report_fd();

        auto stack_mem = std::make_unique<char[]>(STACK_SIZE);
        char* stack_top = stack_mem.get() + STACK_SIZE;

        int clone_flags = SIGCHLD;
        if (g_sandbox_config.use_namespaces) {
            clone_flags |= CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
        }

        // 5. Clone 子进程 (隔离层)
        auto start_time = std::chrono::steady_clock::now();
        pid_t pid = clone(RunChildFn, stack_top, clone_flags, &args);
        if (pid == -1)
        {
            return SystemError(FormatSystemError("系统调用 clone 失败"));
        }

        // ================= 父进程 =================
        ProcessGuard proc(pid);

        // 6. [Cgroups v2] 可选的硬限制层，不支持时降级到仅 setrlimit
        std::unique_ptr<CgroupManager> cgroup;
        bool cgroup_enabled = false;
        if (g_sandbox_config.use_cgroup && CgroupManager::IsSupported()) {
            cgroup = std::make_unique<CgroupManager>(kCgroupRoot, run_id);
            if (cgroup->Create()) {
                int pids_limit = g_sandbox_config.cgroup_pids_limit > 0 ? g_sandbox_config.cgroup_pids_limit : 20;
                cgroup->SetPidsLimit(pids_limit);
                if (memory_limit_kb > 0) {
                    cgroup->SetMemoryLimit(static_cast<std::uint64_t>(memory_limit_kb) * 1024ULL, true);
                }
                cgroup_enabled = cgroup->AddProcess(pid);
                if (cgroup_enabled) {
                    std::cerr << "[沙箱] Cgroups v2 已启用 (PID=" << pid << ")" << std::endl;
                }
            }
        }

        // 7. 轮询等待，超过截止时间立即强杀
        RunReport report;
        int status = 0;
        struct rusage usage{};
        bool killed_at_deadline = false;

        while (true)
        {
            pid_t w = proc.wait_nonblock_rusage(status, &usage);

            if (w == -1)
            {
                return SystemError(FormatSystemError("系统调用 wait4 失败"));
            }

            if (w != 0)
            {
                proc.release();
                break;
            }

            auto elapsed = std::chrono::steady_clock::now() - start_time;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= time_limit_ms)
            {
                proc.kill();
                proc.wait_rusage(status, &usage);
                proc.release();
                killed_at_deadline = true;
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        report.time_used_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());

        double cpu_time_ms = (usage.ru_utime.tv_sec * 1000 + usage.ru_utime.tv_usec / 1000.0) +
                             (usage.ru_stime.tv_sec * 1000 + usage.ru_stime.tv_usec / 1000.0);
        report.cpu_time_ms = static_cast<int>(std::ceil(cpu_time_ms));

        // 优先使用 cgroup 的 memory.peak (更准确)，回退到 rusage
        report.memory_used_kb = usage.ru_maxrss;
        bool oom_killed = false;
        if (cgroup_enabled) {
            std::uint64_t cg_peak = cgroup->GetMemoryPeak();
            if (cg_peak > 0) report.memory_used_kb = static_cast<long>(cg_peak / 1024);
            oom_killed = cgroup->WasOomKilled();
        }

        // 8. 读取捕获内容
        report.stdout_text = streams->ReadOutput(output_limit);
        report.stderr_text = streams->ReadError(kStderrLimit);
        FaultReport fault = ParseFaultReport(streams->ReadReport());
        report.fault_type = fault.type;
        report.fault_message = fault.message;

        // 9. 判定 (优先级: 超时 > 输出超限 > 内存 > 退出状态)
        if (killed_at_deadline || (WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU))
        {
            report.status = RunStatus::TIME_LIMIT_EXCEEDED;
            return report;
        }

        if (streams->OutputSize() > output_limit || (WIFSIGNALED(status) && WTERMSIG(status) == SIGXFSZ))
        {
            report.status = RunStatus::OUTPUT_LIMIT_EXCEEDED;
            return report;
        }

        if (oom_killed || fault.type == "MemoryError")
        {
            report.status = RunStatus::MEMORY_LIMIT_EXCEEDED;
            if (report.fault_type.empty()) {
                report.fault_type = "MemoryError";
                report.fault_message = "memory limit of " + std::to_string(policy.memory_limit_mb) + " MB exceeded";
            }
            return report;
        }

        if (WIFEXITED(status))
        {
            report.exit_code = WEXITSTATUS(status);
            if (report.exit_code == EXIT_OK)
            {
                report.status = RunStatus::OK;
            }
            else if (report.exit_code == EXIT_INPUT_EXHAUSTED && fault.kind == "eof")
            {
                report.status = RunStatus::INPUT_EXHAUSTED;
            }
            else if (report.exit_code == EXIT_FAULT && fault.kind == "fault")
            {
                report.status = RunStatus::FAULT;
            }
            else if (!GetExitCodeDescription(report.exit_code).empty())
            {
                report.status = RunStatus::SYSTEM_ERROR;
                report.error_message = "沙箱恐慌 (退出码 " + std::to_string(report.exit_code) + "): "
                                     + GetExitCodeDescription(report.exit_code);
                if (!report.stderr_text.empty()) {
                    report.error_message += " | " + FirstLines(report.stderr_text);
                }
                std::cerr << "[沙箱] " << report.error_message << std::endl;
            }
            else
            {
                // harness 自身没有写报告: 解释器启动失败或允许模块导入失败
                report.status = RunStatus::SYSTEM_ERROR;
                report.error_message = "解释器异常退出 (退出码 " + std::to_string(report.exit_code) + ")";
                if (fault.kind == "setup") {
                    report.error_message += ": " + fault.type + ": " + fault.message;
                } else if (!report.stderr_text.empty()) {
                    report.error_message += ": " + FirstLines(report.stderr_text);
                }
                std::cerr << "[沙箱] " << report.error_message << std::endl;
            }
        }
        else if (WIFSIGNALED(status))
        {
            // 解释器被信号终止 (SIGSEGV 等) 视为用户代码的运行期故障
            int signal = WTERMSIG(status);
            report.status = RunStatus::FAULT;
            report.fault_type = "Crash";
            report.fault_message = "terminated by signal " + std::to_string(signal) + " (" + strsignal(signal) + ")";
        }
        else
        {
            report.status = RunStatus::SYSTEM_ERROR;
            report.error_message = "子进程因未知原因结束";
        }

        return report;
    }

} // namespace code_sandbox
