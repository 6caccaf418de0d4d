#include "validator.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace code_sandbox
{

    namespace {

        std::string ToLower(const std::string& text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string Trim(const std::string& line)
        {
            std::size_t begin = 0;
            std::size_t end = line.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
            return line.substr(begin, end - begin);
        }

        bool IsImportLine(const std::string& line)
        {
            return line.rfind("import ", 0) == 0 || line.find("from ") != std::string::npos;
        }

        ValidationResult Reject(ValidationRule rule, const std::string& subject, const std::string& reason)
        {
            ValidationResult result;
            result.ok = false;
            result.rule = rule;
            result.subject = subject;
            result.reason = reason;
            return result;
        }

    } // anonymous namespace

    std::size_t CountCharacters(const std::string& text)
    {
        // 与解释器以 errors='replace' 解码的结果一致:
        // 每个合法序列计 1，每个非法序列的最长合法前缀 (或单个非法字节) 也计 1
        std::size_t count = 0;
        std::size_t i = 0;
        const std::size_t n = text.size();
        while (i < n) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            ++count;
            ++i;
            if (c < 0x80) continue;

            std::size_t need = 0;
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                need = 1;
            } else if (c == 0xE0) {
                need = 2; lo = 0xA0;
            } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
                need = 2;
            } else if (c == 0xED) {
                need = 2; hi = 0x9F;   // 排除代理区
            } else if (c == 0xF0) {
                need = 3; lo = 0x90;
            } else if (c >= 0xF1 && c <= 0xF3) {
                need = 3;
            } else if (c == 0xF4) {
                need = 3; hi = 0x8F;
            } else {
                continue; // 续字节或 C0/C1/F5-FF: 单独计 1
            }

            // 只消费仍然合法的续字节，遇到非法字节从它重新开始
            for (std::size_t k = 0; k < need && i < n; ++k) {
                unsigned char next = static_cast<unsigned char>(text[i]);
                if (next < lo || next > hi) break;
                ++i;
                lo = 0x80;
                hi = 0xBF;
            }
        }
        return count;
    }

    ValidationResult Validate(const std::string& source, const AllowListPolicy& policy)
    {
        // 1. 长度检查
        if (CountCharacters(source) > policy.max_source_length) {
            return Reject(ValidationRule::SOURCE_TOO_LONG, "",
                          "Code too long (max " + std::to_string(policy.max_source_length) + " characters)");
        }

        const std::string lowered = ToLower(source);

        // 2. import 行检查 (逐行, 已小写)
        std::istringstream lines(lowered);
        std::string raw;
        while (std::getline(lines, raw)) {
            std::string line = Trim(raw);
            if (!IsImportLine(line)) continue;

            for (const auto& module : policy.forbidden_modules) {
                if (line.find(module) == std::string::npos) continue;
                if (policy.IsModuleAllowed(module)) continue;
                return Reject(ValidationRule::FORBIDDEN_IMPORT, module,
                              "Import '" + module + "' not allowed for security");
            }
        }

        // 3. 禁止函数检查: 报告源码中最早出现的那一个
        std::size_t first_pos = std::string::npos;
        std::string first_name;
        for (const auto& function : policy.forbidden_functions) {
            if (policy.IsFunctionWaived(function)) continue;
            std::size_t pos = lowered.find(function + "(");
            if (pos != std::string::npos && pos < first_pos) {
                first_pos = pos;
                first_name = function;
            }
        }
        if (!first_name.empty()) {
            return Reject(ValidationRule::FORBIDDEN_FUNCTION, first_name,
                          "Function '" + first_name + "' not allowed for security");
        }

        return ValidationResult{};
    }

    const char* ValidationRuleName(ValidationRule rule)
    {
        switch (rule) {
            case ValidationRule::SOURCE_TOO_LONG:    return "source_too_long";
            case ValidationRule::FORBIDDEN_IMPORT:   return "forbidden_import";
            case ValidationRule::FORBIDDEN_FUNCTION: return "forbidden_function";
            default:                                 return "none";
        }
    }

} // namespace code_sandbox
