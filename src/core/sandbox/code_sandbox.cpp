#include "code_sandbox.h"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace code_sandbox
{

    namespace {

        ExecutionEnvironment& RequireEnvironment(const std::unique_ptr<ExecutionEnvironment>& environment)
        {
            if (!environment) {
                throw std::invalid_argument("CodeSandbox requires an execution environment");
            }
            return *environment;
        }

    } // anonymous namespace

    CodeSandbox::CodeSandbox(PolicyRegistry registry, std::unique_ptr<ExecutionEnvironment> environment)
        : registry_(std::move(registry))
        , owned_environment_(std::move(environment))
        , governor_(RequireEnvironment(owned_environment_))
    {
    }

    CodeSandbox::CodeSandbox(PolicyRegistry registry, ExecutionEnvironment& environment)
        : registry_(std::move(registry))
        , governor_(environment)
    {
    }

    std::mutex& CodeSandbox::ExecutionMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    ValidationResult CodeSandbox::Validate(const std::string& source, const std::string& context) const
    {
        return code_sandbox::Validate(source, registry_.Resolve(context));
    }

    ExecutionOutcome CodeSandbox::Execute(const SourceSubmission& submission)
    {
        return Execute(submission.text(), submission.context());
    }

    ExecutionOutcome CodeSandbox::Execute(const std::string& source, const std::string& context)
    {
        last_elapsed_ms_.store(0);
        try {
            const AllowListPolicy& policy = registry_.Resolve(context);

            ValidationResult validation = code_sandbox::Validate(source, policy);
            if (!validation.ok) {
                std::cerr << "[Validator] 拒绝 (" << ValidationRuleName(validation.rule) << "): "
                          << validation.reason << std::endl;
                return ExecutionOutcome::Failure(OutcomeCategory::VALIDATION_REJECTED, validation.reason);
            }

            std::lock_guard<std::mutex> lock(ExecutionMutex());
            ExecutionOutcome outcome = governor_.Run(source, policy);
            last_elapsed_ms_.store(governor_.last_elapsed_ms());
            return outcome;
        } catch (const std::exception& e) {
            std::cerr << "[沙箱] 执行异常: " << e.what() << std::endl;
            return ExecutionOutcome::Failure(OutcomeCategory::SANDBOX_ERROR,
                                             std::string("Sandbox error: ") + e.what());
        }
    }

} // namespace code_sandbox
