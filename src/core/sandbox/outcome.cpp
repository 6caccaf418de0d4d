#include "outcome.h"
#include "validator.h"

#include <utility>

namespace code_sandbox
{

    SourceSubmission::SourceSubmission(std::string text, std::string context)
        : text_(std::move(text)), context_(std::move(context)), length_(CountCharacters(text_))
    {
    }

    ExecutionOutcome::ExecutionOutcome(OutcomeCategory category, std::string text)
        : category_(category), text_(std::move(text))
    {
    }

    ExecutionOutcome ExecutionOutcome::Success(std::string output)
    {
        return ExecutionOutcome(OutcomeCategory::OK, std::move(output));
    }

    ExecutionOutcome ExecutionOutcome::Failure(OutcomeCategory category, std::string message)
    {
        // Failure 不允许携带 OK 类别
        if (category == OutcomeCategory::OK) category = OutcomeCategory::SANDBOX_ERROR;
        return ExecutionOutcome(category, std::move(message));
    }

    std::string ExecutionOutcome::ToString() const
    {
        return std::string(OutcomeCategoryName(category_)) + ": " + text_;
    }

    const char* OutcomeCategoryName(OutcomeCategory category)
    {
        switch (category) {
            case OutcomeCategory::OK:                  return "ok";
            case OutcomeCategory::VALIDATION_REJECTED: return "validation_rejected";
            case OutcomeCategory::RUNTIME_ERROR:       return "runtime_error";
            case OutcomeCategory::TIMEOUT:             return "timeout";
            case OutcomeCategory::SANDBOX_ERROR:       return "sandbox_error";
        }
        return "sandbox_error";
    }

} // namespace code_sandbox
