#ifndef CODE_SANDBOX_CGROUP_MANAGER_H
#define CODE_SANDBOX_CGROUP_MANAGER_H

#include <string>
#include <cstdint>
#include <sys/types.h>

namespace code_sandbox {

/**
 * @brief Cgroups v2 资源限制管理器 (可选的硬限制层)
 *
 * 在 setrlimit 之上为解释器子进程叠加:
 * - memory.max + memory.swap.max = 0: 真实内存上限，禁止用 Swap 绕过
 * - pids.max: 进程数上限
 *
 * 只能在叶子节点添加进程 ("No Internal Process Constraint")，
 * 因此每次执行创建 {root}/{run_id} 子目录，析构时杀掉残留进程并删除。
 */
class CgroupManager {
public:
    CgroupManager(const std::string& cgroup_root, const std::string& run_id);
    ~CgroupManager();

    // 管理文件系统资源，禁止拷贝
    CgroupManager(const CgroupManager&) = delete;
    CgroupManager& operator=(const CgroupManager&) = delete;

    /**
     * @brief /sys/fs/cgroup 是否为 cgroup2 文件系统
     */
    static bool IsSupported();

    /**
     * @brief 创建 cgroup 目录并启用 memory/pids 控制器
     * @return true 如果创建成功
     */
    bool Create();

    bool SetMemoryLimit(uint64_t bytes, bool disable_swap = true);
    bool SetPidsLimit(int max_pids);
    bool AddProcess(pid_t pid);

    /**
     * @brief 峰值内存 (字节)，不支持 memory.peak 时回退到 memory.current
     */
    uint64_t GetMemoryPeak() const;

    /**
     * @brief memory.events 中 oom_kill 计数是否大于 0
     */
    bool WasOomKilled() const;

    void Destroy();

    const std::string& path() const { return cgroup_path_; }

private:
    bool EnsureParentReady();
    void KillAllProcesses();
    bool WriteToFile(const std::string& path, const std::string& value);
    std::string ReadFromFile(const std::string& path) const;

    std::string cgroup_root_;
    std::string cgroup_path_;
    bool created_;
};

} // namespace code_sandbox

#endif // CODE_SANDBOX_CGROUP_MANAGER_H
