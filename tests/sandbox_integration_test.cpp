#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "test_harness.h"
#include "code_sandbox.h"
#include "config.h"
#include "execution_environment.h"
#include "sandbox_internal.h"

using namespace code_sandbox;
namespace fs = std::filesystem;

namespace {

const char* kWorkspace = "/tmp/code_sandbox_integration_test";

// 默认注册表 + 一个限制更紧的 "quick" 上下文，让超时/输出用例跑得快
std::unique_ptr<CodeSandbox> MakeSandbox() {
    PolicyRegistry registry = MakeDefaultRegistry();
    std::strncpy(g_sandbox_config.workspace_root, kWorkspace, sizeof(g_sandbox_config.workspace_root) - 1);

    AllowListPolicy quick = registry.Default();
    quick.context = "quick";
    quick.max_seconds = 1.0;
    quick.max_output_bytes = 4096;
    registry.Register(quick);

    // 仅测试使用: 允许 socket 模块，验证系统调用过滤
    AllowListPolicy permissive = registry.Default();
    permissive.context = "permissive";
    permissive.allowed_modules.insert("socket");
    registry.Register(permissive);

    return std::make_unique<CodeSandbox>(std::move(registry),
                                         std::make_unique<ProcessEnvironment>(kWorkspace));
}

CodeSandbox& Sandbox() {
    static std::unique_ptr<CodeSandbox> sandbox = MakeSandbox();
    return *sandbox;
}

// 必须最先运行: 此时进程配置仍是零值
void TestComposedWithoutLoadingConfig() {
    CHECK(g_sandbox_config.interpreter_path[0] == '\0');
    CodeSandbox sandbox(PolicyRegistry(), std::make_unique<ProcessEnvironment>(kWorkspace));
    ExecutionOutcome outcome = sandbox.Execute("print(17 % 5)", "");
    CHECK(outcome.success());
    CHECK_EQ(outcome.text(), std::string("2\n"));
}

void TestModuloPrintsTwo() {
    ExecutionOutcome outcome = Sandbox().Execute("print(17 % 5)", "");
    CHECK(outcome.success());
    CHECK_EQ(outcome.text(), std::string("2\n"));
}

void TestDivisionByZeroIsRuntimeError() {
    ExecutionOutcome outcome = Sandbox().Execute("print(1/0)", "");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_CONTAINS(outcome.text(), "division by zero");
    CHECK_CONTAINS(outcome.text(), "ZeroDivisionError");
}

void TestSameSourceTwiceIsIdentical() {
    const std::string source = "total = 0\nfor i in range(5):\n    total += i\nprint(total)";
    ExecutionOutcome first = Sandbox().Execute(source, "");
    ExecutionOutcome second = Sandbox().Execute(source, "");
    CHECK(first.success());
    CHECK(second.success());
    CHECK_EQ(first.text(), std::string("10\n"));
    CHECK_EQ(first.text(), second.text());
}

void TestNoOutputMessage() {
    ExecutionOutcome outcome = Sandbox().Execute("x = 1 + 1", "");
    CHECK(outcome.success());
    CHECK_EQ(outcome.text(), std::string("Code executed successfully (no output)"));
}

void TestCallerStreamsUntouched() {
    struct stat before_out, before_err, after_out, after_err;
    CHECK(fstat(STDOUT_FILENO, &before_out) == 0);
    CHECK(fstat(STDERR_FILENO, &before_err) == 0);

    Sandbox().Execute("print('inside')", "");
    Sandbox().Execute("print(undefined_name)", "");

    CHECK(fstat(STDOUT_FILENO, &after_out) == 0);
    CHECK(fstat(STDERR_FILENO, &after_err) == 0);
    CHECK(before_out.st_ino == after_out.st_ino && before_out.st_dev == after_out.st_dev);
    CHECK(before_err.st_ino == after_err.st_ino && before_err.st_dev == after_err.st_dev);
    CHECK(std::cout.good());
    CHECK(std::cerr.good());
}

void TestInfiniteLoopTimesOut() {
    auto start = std::chrono::steady_clock::now();
    ExecutionOutcome outcome = Sandbox().Execute("while True: pass", "quick");
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(outcome.category() == OutcomeCategory::TIMEOUT);
    CHECK_EQ(outcome.text(), std::string("Code execution timed out (limit 1s)"));
    CHECK(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() < 3000);
}

void TestOutputLimit() {
    ExecutionOutcome outcome = Sandbox().Execute("while True:\n    print('x' * 100)", "quick");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_EQ(outcome.text(), std::string("Output limit exceeded (max 4096 bytes)"));
}

void TestInputInFinalProjectSucceeds() {
    ExecutionOutcome outcome = Sandbox().Execute("name = input('Name? ')\nprint('Hello', name)", "final_project");
    CHECK(outcome.success());
    CHECK_CONTAINS(outcome.text(), "Name? ");
    CHECK_CONTAINS(outcome.text(), kNoInputNote);
    CHECK(outcome.text().find("Hello") == std::string::npos);
}

void TestInputRejectedOutsideFinalProject() {
    ExecutionOutcome outcome = Sandbox().Execute("name = input()", "control_flow");
    CHECK(outcome.category() == OutcomeCategory::VALIDATION_REJECTED);
    CHECK_EQ(outcome.text(), std::string("Function 'input' not allowed for security"));
}

void TestAllowListedImportResolves() {
    ExecutionOutcome outcome = Sandbox().Execute("import random\nprint(random.randint(3, 3))", "control_flow");
    CHECK(outcome.success());
    CHECK_EQ(outcome.text(), std::string("3\n"));

    ExecutionOutcome re_outcome = Sandbox().Execute(
        "from re import sub\nprint(sub('a', 'b', 'banana'))", "final_project");
    CHECK(re_outcome.success());
    CHECK_EQ(re_outcome.text(), std::string("bbnbnb\n"));
}

void TestNonAllowListedImportRaises() {
    // math 不在禁止名单里，能通过静态校验，但运行期导入会失败
    ExecutionOutcome outcome = Sandbox().Execute("import math\nprint(math.pi)", "");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_CONTAINS(outcome.text(), "ImportError");
    CHECK_CONTAINS(outcome.text(), "math");

    ExecutionOutcome random_outside = Sandbox().Execute("import random", "");
    CHECK(random_outside.category() == OutcomeCategory::RUNTIME_ERROR);
}

void TestOnlyAllowedBuiltinsVisible() {
    ExecutionOutcome outcome = Sandbox().Execute("print(hex(255))", "");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_CONTAINS(outcome.text(), "NameError");
}

void TestSyntaxErrorIsRuntimeError() {
    ExecutionOutcome outcome = Sandbox().Execute("print(", "");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_CONTAINS(outcome.text(), "SyntaxError");
}

void TestMemoryCeiling() {
    ExecutionOutcome outcome = Sandbox().Execute("x = [0] * (10 ** 10)", "");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_CONTAINS(outcome.text(), "MemoryError");
}

void TestSocketRefusedBySyscallFilter() {
    ExecutionOutcome outcome = Sandbox().Execute(
        "import socket\ns = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\nprint('opened')",
        "permissive");
    CHECK(outcome.category() == OutcomeCategory::RUNTIME_ERROR);
    CHECK_CONTAINS(outcome.text(), "Operation not permitted");
}

void TestWorkDirectoriesAreRemoved() {
    Sandbox().Execute("print('cleanup')", "");
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(kWorkspace, ec)) {
        CHECK(entry.path().filename().string().rfind("run_", 0) != 0);
    }
    CHECK(!ec);
}

} // namespace

int main() {
    std::cout << "=== Sandbox Integration Test ===" << std::endl;

    RUN_TEST(TestComposedWithoutLoadingConfig);
    RUN_TEST(TestModuloPrintsTwo);
    RUN_TEST(TestDivisionByZeroIsRuntimeError);
    RUN_TEST(TestSameSourceTwiceIsIdentical);
    RUN_TEST(TestNoOutputMessage);
    RUN_TEST(TestCallerStreamsUntouched);
    RUN_TEST(TestInfiniteLoopTimesOut);
    RUN_TEST(TestOutputLimit);
    RUN_TEST(TestInputInFinalProjectSucceeds);
    RUN_TEST(TestInputRejectedOutsideFinalProject);
    RUN_TEST(TestAllowListedImportResolves);
    RUN_TEST(TestNonAllowListedImportRaises);
    RUN_TEST(TestOnlyAllowedBuiltinsVisible);
    RUN_TEST(TestSyntaxErrorIsRuntimeError);
    RUN_TEST(TestMemoryCeiling);
    RUN_TEST(TestSocketRefusedBySyscallFilter);
    RUN_TEST(TestWorkDirectoriesAreRemoved);

    return test_harness::Summary("Sandbox Integration Test");
}
