#include "governor.h"

#include <chrono>
#include <cstdio>
#include <iostream>

namespace code_sandbox
{

    const char* const kNoInputNote =
        "Code executed successfully (input() is not available in the sandbox, no input was provided)";

    namespace {

        std::string DescribeFault(const RunReport& report)
        {
            if (report.fault_type.empty()) return report.fault_message;
            if (report.fault_message.empty()) return report.fault_type;
            return report.fault_type + ": " + report.fault_message;
        }

    } // anonymous namespace

    std::string FormatSeconds(double seconds)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%g", seconds);
        return buf;
    }

    ExecutionGovernor::ExecutionGovernor(ExecutionEnvironment& environment)
        : environment_(environment)
    {
    }

    ExecutionOutcome ExecutionGovernor::Run(const std::string& source, const AllowListPolicy& policy)
    {
        auto start = std::chrono::steady_clock::now();
        RunReport report = environment_.Run(source, policy);
        auto elapsed = std::chrono::steady_clock::now() - start;

        last_elapsed_ms_ = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        double elapsed_seconds = std::chrono::duration<double>(elapsed).count();

        ExecutionOutcome outcome = Classify(report, policy, elapsed_seconds);
        if (!outcome.success()) {
            std::cerr << "[沙箱] " << RunStatusName(report.status) << " -> "
                      << OutcomeCategoryName(outcome.category())
                      << " (" << last_elapsed_ms_ << "ms)" << std::endl;
        }
        return outcome;
    }

    ExecutionOutcome ExecutionGovernor::Classify(const RunReport& report,
                                                 const AllowListPolicy& policy,
                                                 double elapsed_seconds)
    {
        // 沙箱自身失败不是用户代码的问题
        if (report.status == RunStatus::SYSTEM_ERROR) {
            std::string message = report.error_message.empty() ? "sandbox failure" : report.error_message;
            return ExecutionOutcome::Failure(OutcomeCategory::SANDBOX_ERROR, "Sandbox error: " + message);
        }

        // 超时优先: 强杀、SIGXCPU 或事后耗时检查
        if (report.status == RunStatus::TIME_LIMIT_EXCEEDED || elapsed_seconds > policy.max_seconds) {
            return ExecutionOutcome::Failure(OutcomeCategory::TIMEOUT,
                "Code execution timed out (limit " + FormatSeconds(policy.max_seconds) + "s)");
        }

        switch (report.status) {
            case RunStatus::INPUT_EXHAUSTED: {
                std::string output = report.stdout_text;
                if (!output.empty() && output.back() != '\n') output += '\n';
                output += kNoInputNote;
                return ExecutionOutcome::Success(output);
            }
            case RunStatus::OUTPUT_LIMIT_EXCEEDED:
                return ExecutionOutcome::Failure(OutcomeCategory::RUNTIME_ERROR,
                    "Output limit exceeded (max " + std::to_string(policy.max_output_bytes) + " bytes)");
            case RunStatus::MEMORY_LIMIT_EXCEEDED:
            case RunStatus::FAULT:
                return ExecutionOutcome::Failure(OutcomeCategory::RUNTIME_ERROR,
                    "Execution error: " + DescribeFault(report));
            default:
                break;
        }

        if (!report.stderr_text.empty()) {
            return ExecutionOutcome::Failure(OutcomeCategory::RUNTIME_ERROR, "Error: " + report.stderr_text);
        }

        if (report.stdout_text.empty()) {
            return ExecutionOutcome::Success("Code executed successfully (no output)");
        }
        return ExecutionOutcome::Success(report.stdout_text);
    }

} // namespace code_sandbox
