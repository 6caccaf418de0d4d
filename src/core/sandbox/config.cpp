// src/core/sandbox/config.cpp

#include <sys/types.h>
#include <unistd.h>
#include <iostream>
#include <cstring>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "config.h"
#include "sandbox_internal.h"

namespace code_sandbox {
    // 定义全局变量实例
    GlobalConfig g_sandbox_config;

    // 辅助宏：检查节点是否存在，不存在则抛出 ConfigError
    #define CHECK_NODE(node, name) \
        if (!node) { \
            std::cerr << "[配置] 致命错误: 配置文件缺少关键节点 '" << name << "'" << std::endl; \
            throw ConfigError(std::string("missing config node '") + name + "'"); \
        }

    namespace {

        const char* const kInterpreterCandidates[] = {
            "/usr/bin/python3",
            "/usr/local/bin/python3",
            "/bin/python3",
        };

        void CopyField(char* dst, std::size_t size, const std::string& value, const char* name)
        {
            if (value.size() >= size) {
                throw ConfigError(std::string("config value too long: ") + name);
            }
            std::strncpy(dst, value.c_str(), size - 1);
            dst[size - 1] = '\0';
        }

        // 读取名字列表，每一项都必须是合法标识符
        std::set<std::string> ReadNameList(const YAML::Node& node, const std::string& name)
        {
            if (!node.IsSequence()) {
                std::cerr << "[配置] 错误: '" << name << "' 必须是一个列表" << std::endl;
                throw ConfigError("'" + name + "' must be a list");
            }
            std::set<std::string> names;
            for (std::size_t i = 0; i < node.size(); ++i) {
                std::string item = node[i].as<std::string>();
                if (!IsValidName(item)) {
                    std::cerr << "[配置] 错误: '" << name << "' 中的名字不合法: " << item << std::endl;
                    throw ConfigError("invalid name '" + item + "' in '" + name + "'");
                }
                names.insert(item);
            }
            return names;
        }

        // limits 节点: 全局和上下文共用
        void ReadLimits(const YAML::Node& node, AllowListPolicy& policy)
        {
            if (!node) return;
            if (node["max_source_length"]) {
                long long n = node["max_source_length"].as<long long>();
                if (n <= 0) throw ConfigError("limits.max_source_length must be positive");
                policy.max_source_length = static_cast<std::size_t>(n);
            }
            if (node["max_seconds"]) {
                double s = node["max_seconds"].as<double>();
                if (s <= 0) throw ConfigError("limits.max_seconds must be positive");
                policy.max_seconds = s;
            }
            if (node["memory_limit_mb"]) {
                policy.memory_limit_mb = node["memory_limit_mb"].as<long long>();
            }
            if (node["max_output_kb"]) {
                long long kb = node["max_output_kb"].as<long long>();
                if (kb <= 0) throw ConfigError("limits.max_output_kb must be positive");
                policy.max_output_bytes = kb * 1024LL;
            }
        }

        // 上下文: 继承全局策略，allowed_* / waived 追加，forbidden_* 可整体覆盖
        AllowListPolicy ReadContext(const std::string& id, const YAML::Node& node,
                                    const AllowListPolicy& base)
        {
            if (!IsValidName(id)) {
                throw ConfigError("invalid context name '" + id + "'");
            }

            AllowListPolicy policy = base;
            policy.context = id;

            if (!node || node.IsNull()) return policy;
            if (!node.IsMap()) {
                throw ConfigError("context '" + id + "' must be a map");
            }

            const std::string prefix = "contexts." + id + ".";
            if (node["allowed_modules"]) {
                for (const auto& m : ReadNameList(node["allowed_modules"], prefix + "allowed_modules")) {
                    policy.allowed_modules.insert(m);
                }
            }
            if (node["allowed_builtins"]) {
                for (const auto& b : ReadNameList(node["allowed_builtins"], prefix + "allowed_builtins")) {
                    policy.allowed_builtins.insert(b);
                }
            }
            if (node["waived_functions"]) {
                for (const auto& f : ReadNameList(node["waived_functions"], prefix + "waived_functions")) {
                    policy.waived_functions.insert(f);
                }
            }
            if (node["forbidden_modules"]) {
                policy.forbidden_modules = ReadNameList(node["forbidden_modules"], prefix + "forbidden_modules");
            }
            if (node["forbidden_functions"]) {
                policy.forbidden_functions = ReadNameList(node["forbidden_functions"], prefix + "forbidden_functions");
            }
            ReadLimits(node["limits"], policy);
            return policy;
        }

        std::string FindInterpreter()
        {
            for (const char* candidate : kInterpreterCandidates) {
                if (access(candidate, X_OK) == 0) return candidate;
            }
            return kInterpreterCandidates[0];
        }

        // 课程上下文: control_flow 允许 random，final_project 允许 re/time 并豁免 input
        void RegisterLessonContexts(PolicyRegistry& registry)
        {
            AllowListPolicy control_flow = registry.Default();
            control_flow.context = "control_flow";
            control_flow.allowed_modules.insert("random");
            registry.Register(control_flow);

            AllowListPolicy final_project = registry.Default();
            final_project.context = "final_project";
            final_project.allowed_modules.insert("re");
            final_project.allowed_modules.insert("time");
            final_project.allowed_builtins.insert("input");
            final_project.waived_functions.insert("input");
            registry.Register(final_project);
        }

        PolicyRegistry ParseRoot(const YAML::Node& config)
        {
            ApplyDefaultConfig();
            AllowListPolicy base = MakeDefaultPolicy();

            if (config["policy_version"]) {
                base.version = config["policy_version"].as<int>();
            }

            // Path 配置 (必须存在)
            CHECK_NODE(config["path"], "path");
            YAML::Node pathNode = config["path"];
            CHECK_NODE(pathNode["workspace_root"], "path.workspace_root");

            CopyField(g_sandbox_config.workspace_root, sizeof(g_sandbox_config.workspace_root),
                      pathNode["workspace_root"].as<std::string>(), "path.workspace_root");

            if (pathNode["interpreter"]) {
                CopyField(g_sandbox_config.interpreter_path, sizeof(g_sandbox_config.interpreter_path),
                          pathNode["interpreter"].as<std::string>(), "path.interpreter");
            }

            if (pathNode["mount_dirs"]) {
                YAML::Node mdirs = pathNode["mount_dirs"];
                if (!mdirs.IsSequence()) {
                    std::cerr << "[配置] 错误: 'path.mount_dirs' 必须是一个列表" << std::endl;
                    throw ConfigError("'path.mount_dirs' must be a list");
                }
                g_sandbox_config.mount_count = 0;
                for (std::size_t i = 0; i < mdirs.size(); ++i) {
                    if (g_sandbox_config.mount_count >= 16) break;
                    CopyField(g_sandbox_config.mount_dirs[g_sandbox_config.mount_count],
                              sizeof(g_sandbox_config.mount_dirs[0]),
                              mdirs[i].as<std::string>(), "path.mount_dirs");
                    g_sandbox_config.mount_count++;
                }
            }

            // Limits 配置
            ReadLimits(config["limits"], base);
            if (config["limits"] && config["limits"]["output_buffer_kb"]) {
                g_sandbox_config.output_buffer_size = config["limits"]["output_buffer_kb"].as<long long>() * 1024LL;
            }

            // Policy 配置: 给出的列表整体替换默认值
            if (config["policy"]) {
                YAML::Node policyNode = config["policy"];
                if (policyNode["allowed_builtins"]) {
                    base.allowed_builtins = ReadNameList(policyNode["allowed_builtins"], "policy.allowed_builtins");
                }
                if (policyNode["allowed_modules"]) {
                    base.allowed_modules = ReadNameList(policyNode["allowed_modules"], "policy.allowed_modules");
                }
                if (policyNode["forbidden_modules"]) {
                    base.forbidden_modules = ReadNameList(policyNode["forbidden_modules"], "policy.forbidden_modules");
                }
                if (policyNode["forbidden_functions"]) {
                    base.forbidden_functions = ReadNameList(policyNode["forbidden_functions"], "policy.forbidden_functions");
                }
            }

            PolicyRegistry registry(base);

            // Contexts 配置
            if (config["contexts"]) {
                YAML::Node contexts = config["contexts"];
                if (!contexts.IsMap()) {
                    throw ConfigError("'contexts' must be a map");
                }
                for (const auto& entry : contexts) {
                    std::string id = entry.first.as<std::string>();
                    registry.Register(ReadContext(id, entry.second, registry.Default()));
                }
            }

            // Isolation 配置
            if (config["isolation"]) {
                YAML::Node iso = config["isolation"];
                if (iso["namespaces"]) g_sandbox_config.use_namespaces = iso["namespaces"].as<bool>();
                if (iso["cgroup"]) g_sandbox_config.use_cgroup = iso["cgroup"].as<bool>();
                if (iso["cgroup_pids_limit"]) g_sandbox_config.cgroup_pids_limit = iso["cgroup_pids_limit"].as<int>();
                if (iso["tmpfs_size_mb"]) g_sandbox_config.run_tmpfs_size_mb = iso["tmpfs_size_mb"].as<long long>();
            }

            // Security 配置 (可选，只有 root 运行时才会真正降权)
            if (config["security"]) {
                YAML::Node secNode = config["security"];
                CHECK_NODE(secNode["run_as_uid"], "security.run_as_uid");
                CHECK_NODE(secNode["run_as_gid"], "security.run_as_gid");

                g_sandbox_config.run_uid = static_cast<uid_t>(secNode["run_as_uid"].as<unsigned long>());
                g_sandbox_config.run_gid = static_cast<gid_t>(secNode["run_as_gid"].as<unsigned long>());
                g_sandbox_config.drop_privileges = true;
            }

            std::cerr << "[配置] 加载完成。WorkRoot: " << g_sandbox_config.workspace_root
                      << ", Interpreter: " << g_sandbox_config.interpreter_path
                      << ", Contexts: " << registry.Contexts().size()
                      << ", PolicyVersion: " << base.version << std::endl;
            return registry;
        }

    } // anonymous namespace

    void ApplyDefaultConfig()
    {
        std::memset(&g_sandbox_config, 0, sizeof(g_sandbox_config));

        std::strncpy(g_sandbox_config.workspace_root, "/tmp/code_sandbox",
                     sizeof(g_sandbox_config.workspace_root) - 1);
        std::string interpreter = FindInterpreter();
        std::strncpy(g_sandbox_config.interpreter_path, interpreter.c_str(),
                     sizeof(g_sandbox_config.interpreter_path) - 1);

        const char* default_mounts[] = { "/usr", "/lib", "/lib64", "/bin" };
        for (const char* dir : default_mounts) {
            std::strncpy(g_sandbox_config.mount_dirs[g_sandbox_config.mount_count], dir,
                         sizeof(g_sandbox_config.mount_dirs[0]) - 1);
            g_sandbox_config.mount_count++;
        }

        g_sandbox_config.output_buffer_size = 64 * 1024;
        g_sandbox_config.run_tmpfs_size_mb = 16;
        g_sandbox_config.use_namespaces = false;
        g_sandbox_config.use_cgroup = false;
        g_sandbox_config.drop_privileges = false;
        g_sandbox_config.run_uid = 65534;
        g_sandbox_config.run_gid = 65534;
        g_sandbox_config.cgroup_pids_limit = 20;
    }

    PolicyRegistry LoadConfig(const std::string& path)
    {
        try {
            std::cerr << "[配置] 正在读取: " << path << " ..." << std::endl;
            return ParseRoot(YAML::LoadFile(path));
        } catch (const YAML::Exception& ex) {
            std::cerr << "[配置] YAML 解析失败: " << ex.what() << std::endl;
            throw ConfigError(std::string("failed to parse ") + path + ": " + ex.what());
        }
    }

    PolicyRegistry LoadConfigFromString(const std::string& yaml_text)
    {
        try {
            return ParseRoot(YAML::Load(yaml_text));
        } catch (const YAML::Exception& ex) {
            std::cerr << "[配置] YAML 解析失败: " << ex.what() << std::endl;
            throw ConfigError(std::string("failed to parse config: ") + ex.what());
        }
    }

    PolicyRegistry MakeDefaultRegistry()
    {
        ApplyDefaultConfig();
        PolicyRegistry registry;
        RegisterLessonContexts(registry);
        return registry;
    }

} // namespace code_sandbox
