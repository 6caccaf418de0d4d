#include "policy.h"

#include <cctype>
#include <utility>

namespace code_sandbox
{

    bool AllowListPolicy::IsModuleAllowed(const std::string& name) const
    {
        return allowed_modules.find(name) != allowed_modules.end();
    }

    bool AllowListPolicy::IsFunctionWaived(const std::string& name) const
    {
        return waived_functions.find(name) != waived_functions.end();
    }

    AllowListPolicy MakeDefaultPolicy()
    {
        AllowListPolicy policy;

        policy.forbidden_modules = {
            "os", "sys", "subprocess", "shutil", "socket", "urllib", "requests",
            "pickle", "marshal", "shelve", "__import__", "eval", "exec"
        };

        policy.forbidden_functions = {
            "open", "input", "raw_input", "__import__", "reload", "compile",
            "eval", "exec", "globals", "locals", "vars", "dir"
        };

        policy.allowed_builtins = {
            "print", "len", "str", "int", "float", "bool", "list", "dict",
            "tuple", "set", "range", "enumerate", "zip", "sorted", "reversed",
            "sum", "min", "max", "abs", "round", "type"
        };

        return policy;
    }

    bool IsValidName(const std::string& name)
    {
        if (name.empty() || name.length() > 64) return false;
        if (std::isdigit(static_cast<unsigned char>(name[0]))) return false;
        for (char c : name) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
        }
        return true;
    }

    PolicyRegistry::PolicyRegistry() : default_policy_(MakeDefaultPolicy()) {}

    PolicyRegistry::PolicyRegistry(AllowListPolicy default_policy)
        : default_policy_(std::move(default_policy))
    {
        default_policy_.context.clear();
    }

    void PolicyRegistry::Register(AllowListPolicy policy)
    {
        std::string key = policy.context;
        policies_[key] = std::move(policy);
    }

    const AllowListPolicy& PolicyRegistry::Resolve(const std::string& context) const
    {
        auto it = policies_.find(context);
        if (it == policies_.end()) return default_policy_;
        return it->second;
    }

    bool PolicyRegistry::HasContext(const std::string& context) const
    {
        return policies_.find(context) != policies_.end();
    }

    std::vector<std::string> PolicyRegistry::Contexts() const
    {
        std::vector<std::string> names;
        names.reserve(policies_.size());
        for (const auto& entry : policies_) names.push_back(entry.first);
        return names;
    }

} // namespace code_sandbox
