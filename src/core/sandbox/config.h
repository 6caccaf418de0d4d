#ifndef CODE_SANDBOX_CONFIG_H
#define CODE_SANDBOX_CONFIG_H

#include <stdexcept>
#include <string>

#include "policy.h"

namespace code_sandbox
{
    /**
     * @brief 配置文件缺失节点、类型错误或名字非法
     */
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief 把 g_sandbox_config 重置为内建默认值
     * workspace_root=/tmp/code_sandbox，解释器自动探测，隔离全部关闭。
     */
    void ApplyDefaultConfig();

    /**
     * @brief 读取 YAML 配置文件，填充 g_sandbox_config 并返回策略注册表
     * @throw ConfigError
     */
    PolicyRegistry LoadConfig(const std::string& path);

    /**
     * @brief 同 LoadConfig，但直接解析 YAML 文本 (测试用)
     * @throw ConfigError
     */
    PolicyRegistry LoadConfigFromString(const std::string& yaml_text);

    /**
     * @brief 无配置文件时使用的注册表
     * 默认策略 + control_flow / final_project 两个课程上下文。
     */
    PolicyRegistry MakeDefaultRegistry();
}

#endif // CODE_SANDBOX_CONFIG_H
