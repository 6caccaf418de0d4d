/**
 * @file main.cpp (code_sandbox)
 * @brief 受限代码执行沙箱 (CLI)
 *
 * 约束:
 * 1. stdout 只输出单行 JSON (末尾 \n)
 * 2. debug/log 仅输出到 stderr
 */
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "code_sandbox.h"
#include "config.h"
#include "sandbox_internal.h"

using json = nlohmann::json;

namespace {

struct CliOptions {
    std::string source_path;   // 为空时从 stdin 读取
    std::string config_path;
    std::string context;
    bool validate_only = false;
    bool print_policy = false;
};

// 用户代码产生的文本不保证是合法 UTF-8，非法字节替换为 U+FFFD 而不是抛出
void EmitJSONLine(const json& out) {
    std::cout << out.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
}

json BuildOutcomeJSON(const code_sandbox::ExecutionOutcome& outcome,
                      const std::string& context,
                      long long time_ms) {
    json out;
    out["schema_version"] = 1;
    out["success"] = outcome.success();
    out["category"] = code_sandbox::OutcomeCategoryName(outcome.category());
    if (outcome.success()) {
        out["output"] = outcome.text();
    } else {
        out["error"] = outcome.text();
    }
    out["context"] = context;
    out["time_ms"] = time_ms;
    return out;
}

json BuildPolicyJSON(const code_sandbox::AllowListPolicy& policy) {
    json out;
    out["schema_version"] = 1;
    out["context"] = policy.context;
    out["policy_version"] = policy.version;
    out["allowed_modules"] = policy.allowed_modules;
    out["allowed_builtins"] = policy.allowed_builtins;
    out["forbidden_modules"] = policy.forbidden_modules;
    out["forbidden_functions"] = policy.forbidden_functions;
    out["waived_functions"] = policy.waived_functions;
    out["max_source_length"] = policy.max_source_length;
    out["max_seconds"] = policy.max_seconds;
    out["memory_limit_mb"] = policy.memory_limit_mb;
    out["max_output_bytes"] = policy.max_output_bytes;
    return out;
}

void EmitUsageError(const std::string& message) {
    json out;
    out["schema_version"] = 1;
    out["success"] = false;
    out["category"] = "usage_error";
    out["error"] = message;
    EmitJSONLine(out);
}

bool ReadSource(const std::string& path, std::string& source, std::string& err) {
    if (path.empty() || path == "-") {
        source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        err = "failed to open source file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    source = buffer.str();
    return true;
}

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -f <path>         Script to run (default: read stdin)\n"
              << "  -C <path>         Config file path (default: built-in policy)\n"
              << "  -x <context>      Lesson context, e.g. control_flow, final_project\n"
              << "  --validate_only   Run the static validator only\n"
              << "  --print_policy    Print the resolved policy for the context and exit\n";
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    int opt;
    static struct option long_opts[] = {
        {"validate_only", no_argument, nullptr, 1},
        {"print_policy", no_argument, nullptr, 2},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    while ((opt = getopt_long(argc, argv, "f:C:x:h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'f':
                options.source_path = optarg;
                break;
            case 'C':
                options.config_path = optarg;
                break;
            case 'x':
                options.context = optarg;
                break;
            case 1:
                options.validate_only = true;
                break;
            case 2:
                options.print_policy = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    code_sandbox::PolicyRegistry registry;
    try {
        registry = options.config_path.empty() ? code_sandbox::MakeDefaultRegistry()
                                               : code_sandbox::LoadConfig(options.config_path);
    } catch (const code_sandbox::ConfigError& e) {
        EmitUsageError(std::string("config_invalid: ") + e.what());
        return 1;
    }

    if (!options.context.empty() && !registry.HasContext(options.context)) {
        std::cerr << "[配置] 未知上下文 '" << options.context << "'，使用默认策略" << std::endl;
    }

    if (options.print_policy) {
        EmitJSONLine(BuildPolicyJSON(registry.Resolve(options.context)));
        return 0;
    }

    std::string source;
    std::string err;
    if (!ReadSource(options.source_path, source, err)) {
        EmitUsageError(err);
        return 1;
    }

    if (options.validate_only) {
        code_sandbox::ValidationResult result =
            code_sandbox::Validate(source, registry.Resolve(options.context));
        code_sandbox::ExecutionOutcome outcome = result.ok
            ? code_sandbox::ExecutionOutcome::Success("Code validation passed")
            : code_sandbox::ExecutionOutcome::Failure(code_sandbox::OutcomeCategory::VALIDATION_REJECTED, result.reason);
        EmitJSONLine(BuildOutcomeJSON(outcome, options.context, 0));
        return 0;
    }

    std::unique_ptr<code_sandbox::ExecutionEnvironment> environment;
    try {
        environment = std::make_unique<code_sandbox::ProcessEnvironment>(
            code_sandbox::g_sandbox_config.workspace_root);
    } catch (const std::exception& e) {
        EmitJSONLine(BuildOutcomeJSON(
            code_sandbox::ExecutionOutcome::Failure(code_sandbox::OutcomeCategory::SANDBOX_ERROR,
                                                    std::string("Sandbox error: ") + e.what()),
            options.context, 0));
        return 0;
    }

    code_sandbox::CodeSandbox sandbox(std::move(registry), std::move(environment));
    code_sandbox::ExecutionOutcome outcome = sandbox.Execute(source, options.context);
    EmitJSONLine(BuildOutcomeJSON(outcome, options.context, sandbox.last_elapsed_ms()));
    return 0;
}
