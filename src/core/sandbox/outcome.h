#ifndef CODE_SANDBOX_OUTCOME_H
#define CODE_SANDBOX_OUTCOME_H

#include <cstddef>
#include <string>

namespace code_sandbox
{
    /**
     * @brief 一次提交 (构造后不可变)
     */
    class SourceSubmission
    {
    public:
        SourceSubmission(std::string text, std::string context);

        const std::string& text() const { return text_; }
        const std::string& context() const { return context_; }
        std::size_t length() const { return length_; } // 字符数

    private:
        std::string text_;
        std::string context_;
        std::size_t length_;
    };

    /**
     * @brief 结果类别
     */
    enum class OutcomeCategory {
        OK = 0,               // Success
        VALIDATION_REJECTED,  // 静态校验拒绝
        RUNTIME_ERROR,        // 用户代码运行期错误
        TIMEOUT,              // 超过墙钟时间
        SANDBOX_ERROR         // 沙箱自身无法完成执行
    };

    /**
     * @brief 统一的执行结果: Success{output} 或 Failure{category, message}
     */
    class ExecutionOutcome
    {
    public:
        static ExecutionOutcome Success(std::string output);
        static ExecutionOutcome Failure(OutcomeCategory category, std::string message);

        bool success() const { return category_ == OutcomeCategory::OK; }
        OutcomeCategory category() const { return category_; }

        // Success 时为输出文本，Failure 时为诊断信息
        const std::string& text() const { return text_; }

        std::string ToString() const;

    private:
        ExecutionOutcome(OutcomeCategory category, std::string text);

        OutcomeCategory category_;
        std::string text_;
    };

    const char* OutcomeCategoryName(OutcomeCategory category);
}

#endif // CODE_SANDBOX_OUTCOME_H
