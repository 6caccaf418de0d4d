#ifndef CODE_SANDBOX_POLICY_H
#define CODE_SANDBOX_POLICY_H

#include <map>
#include <set>
#include <string>
#include <vector>

namespace code_sandbox
{
    /**
     * @brief 单个上下文 (课程章节) 的允许/禁止名单
     * 构造后只读，可以在多个调用者之间自由共享。
     */
    struct AllowListPolicy
    {
        std::string context;                      // 所属上下文 ID ("" 为默认策略)
        int version = 1;                          // 策略版本，随配置文件递增

        std::set<std::string> allowed_modules;    // 预先绑定到命名空间的模块
        std::set<std::string> allowed_builtins;   // 命名空间中可见的内建函数
        std::set<std::string> forbidden_modules;  // import 行中禁止出现的模块名
        std::set<std::string> forbidden_functions;// 禁止出现的 "name(" 调用
        std::set<std::string> waived_functions;   // 本上下文豁免的禁止函数

        std::size_t max_source_length = 1000;     // 字符数 (Unicode code points)
        double max_seconds = 5.0;                 // 墙钟时间限制
        long long memory_limit_mb = 256;          // 子进程地址空间限制
        long long max_output_bytes = 1024 * 1024; // 捕获输出上限

        bool IsModuleAllowed(const std::string& name) const;
        bool IsFunctionWaived(const std::string& name) const;
    };

    /**
     * @brief 原课程平台的默认策略
     * 1000 字符 / 5 秒，以及原始的禁止模块、禁止函数与内建函数集合。
     */
    AllowListPolicy MakeDefaultPolicy();

    /**
     * @brief 名字必须是合法标识符，才允许写入 harness 脚本
     */
    bool IsValidName(const std::string& name);

    /**
     * @brief 上下文 -> 策略 的只读注册表
     */
    class PolicyRegistry
    {
    public:
        PolicyRegistry();
        explicit PolicyRegistry(AllowListPolicy default_policy);

        /**
         * @brief 注册或覆盖一个上下文策略 (context 字段作为键)
         */
        void Register(AllowListPolicy policy);

        /**
         * @brief 解析上下文对应的策略
         * 未知上下文回退到默认策略。
         */
        const AllowListPolicy& Resolve(const std::string& context) const;

        bool HasContext(const std::string& context) const;
        std::vector<std::string> Contexts() const;

        const AllowListPolicy& Default() const { return default_policy_; }
        AllowListPolicy& MutableDefault() { return default_policy_; }

    private:
        AllowListPolicy default_policy_;
        std::map<std::string, AllowListPolicy> policies_;
    };
}

#endif // CODE_SANDBOX_POLICY_H
