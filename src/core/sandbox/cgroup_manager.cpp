/**
 * @file cgroup_manager.cpp
 * @brief Cgroups v2 资源限制管理器实现
 *
 * 重要文件:
 *    - cgroup.procs: 属于此 cgroup 的进程 PID
 *    - cgroup.subtree_control: 控制子目录可用的控制器
 *    - memory.max / memory.swap.max: 内存硬限制 / Swap 限制
 *    - memory.peak / memory.current: 峰值 / 当前内存
 *    - memory.events: oom_kill 计数
 *    - pids.max: 进程数限制
 */

#include "cgroup_manager.h"

#include <fstream>
#include <sstream>
#include <filesystem>
#include <csignal>
#include <unistd.h>
#include <sys/vfs.h>
#include <iostream>

// Cgroups v2 文件系统魔数
#ifndef CGROUP2_SUPER_MAGIC
#define CGROUP2_SUPER_MAGIC 0x63677270
#endif

namespace fs = std::filesystem;

namespace code_sandbox {

namespace {

uint64_t ParseUnsigned(const std::string& text) {
    if (text.empty() || text == "max") return 0;
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        return 0;
    }
}

} // anonymous namespace

CgroupManager::CgroupManager(const std::string& root, const std::string& run_id)
    : cgroup_root_(root)
    , cgroup_path_(root + "/" + run_id)
    , created_(false)
{
}

CgroupManager::~CgroupManager() {
    // RAII: 任何退出路径都会清理 cgroup
    if (created_) {
        Destroy();
    }
}

bool CgroupManager::IsSupported() {
    struct statfs buf;
    if (statfs("/sys/fs/cgroup", &buf) != 0) {
        return false;
    }
    return buf.f_type == CGROUP2_SUPER_MAGIC;
}

bool CgroupManager::EnsureParentReady() {
    std::error_code ec;

    if (!fs::exists(cgroup_root_, ec)) {
        if (!fs::create_directories(cgroup_root_, ec)) {
            std::cerr << "[CgroupManager] Failed to create root dir: " << cgroup_root_ << std::endl;
            return false;
        }
    }

    // 父目录启用控制器失败可以接受 (运维可能已经开启)
    fs::path parent_path = fs::path(cgroup_root_).parent_path();
    if (!WriteToFile(parent_path.string() + "/cgroup.subtree_control", "+memory +pids")) {
        std::cerr << "[CgroupManager] Warning: Failed to enable controllers in " << parent_path
                  << " (Assuming admin already enabled them)" << std::endl;
    }

    // 我们自己的根目录必须成功，否则子目录拿不到控制器
    if (!WriteToFile(cgroup_root_ + "/cgroup.subtree_control", "+memory +pids")) {
        std::cerr << "[CgroupManager] Error: Failed to enable controllers in " << cgroup_root_
                  << ". Please check ownership or delegation." << std::endl;
        return false;
    }
    return true;
}

bool CgroupManager::Create() {
    if (created_) return true;

    if (!EnsureParentReady()) {
        return false;
    }

    std::error_code ec;
    if (!fs::create_directories(cgroup_path_, ec) && ec) {
        std::cerr << "[CgroupManager] Failed to create cgroup: " << cgroup_path_
                  << " - " << ec.message() << std::endl;
        return false;
    }

    created_ = true;
    return true;
}

bool CgroupManager::SetMemoryLimit(uint64_t bytes, bool disable_swap) {
    if (!created_) return false;

    if (!WriteToFile(cgroup_path_ + "/memory.max", std::to_string(bytes))) {
        std::cerr << "[CgroupManager] Failed to set memory.max" << std::endl;
        return false;
    }
    if (disable_swap) {
        // 某些内核没有 memory.swap.max，忽略错误
        WriteToFile(cgroup_path_ + "/memory.swap.max", "0");
    }
    return true;
}

bool CgroupManager::SetPidsLimit(int max_pids) {
    if (!created_) return false;

    if (!WriteToFile(cgroup_path_ + "/pids.max", std::to_string(max_pids))) {
        std::cerr << "[CgroupManager] Failed to set pids.max" << std::endl;
        return false;
    }
    return true;
}

bool CgroupManager::AddProcess(pid_t pid) {
    if (!created_) return false;

    if (!WriteToFile(cgroup_path_ + "/cgroup.procs", std::to_string(pid))) {
        std::cerr << "[CgroupManager] Failed to add process " << pid << std::endl;
        return false;
    }
    return true;
}

uint64_t CgroupManager::GetMemoryPeak() const {
    if (!created_) return 0;

    uint64_t peak = ParseUnsigned(ReadFromFile(cgroup_path_ + "/memory.peak"));
    if (peak > 0) return peak;
    return ParseUnsigned(ReadFromFile(cgroup_path_ + "/memory.current"));
}

bool CgroupManager::WasOomKilled() const {
    if (!created_) return false;

    std::ifstream ifs(cgroup_path_ + "/memory.events");
    std::string key;
    uint64_t value = 0;
    while (ifs >> key >> value) {
        if (key == "oom_kill") return value > 0;
    }
    return false;
}

void CgroupManager::KillAllProcesses() {
    std::ifstream ifs(cgroup_path_ + "/cgroup.procs");
    pid_t pid;
    while (ifs >> pid) {
        if (pid > 0) kill(pid, SIGKILL);
    }
}

void CgroupManager::Destroy() {
    if (!created_) return;

    // rmdir 只对空 cgroup 有效，先杀残留进程再重试
    std::error_code ec;
    for (int attempt = 0; attempt < 3; ++attempt) {
        KillAllProcesses();
        usleep(20000);
        if (fs::remove(cgroup_path_, ec)) break;
    }
    if (ec) {
        std::cerr << "[CgroupManager] Warning: Failed to remove " << cgroup_path_
                  << ": " << ec.message() << std::endl;
    }

    created_ = false;
}

bool CgroupManager::WriteToFile(const std::string& path, const std::string& value) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << value;
    ofs.flush();
    return ofs.good();
}

std::string CgroupManager::ReadFromFile(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs) return "";
    std::string content;
    std::getline(ifs, content);
    return content;
}

} // namespace code_sandbox
