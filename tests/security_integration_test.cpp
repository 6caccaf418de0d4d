#include <iostream>
#include <string>
#include <fstream>
#include <cstring>
#include <sstream>
#include <filesystem>

#include "test_harness.h"
#include "config.h"
#include "execution_environment.h"
#include "policy.h"
#include "sandbox_internal.h"

using namespace code_sandbox;
namespace fs = std::filesystem;

namespace {

const std::string kCodesDir = std::string(CODE_SANDBOX_TEST_DIR) + "/security/test_codes/";

// 红队策略: 直接把 os / socket 交给攻击脚本，验证子进程层 (rlimit + seccomp) 才是真正的边界
AllowListPolicy RedTeamPolicy() {
    AllowListPolicy policy = MakeDefaultPolicy();
    policy.context = "red_team";
    policy.allowed_modules = {"os", "socket"};
    policy.max_seconds = 2.0;
    policy.memory_limit_mb = 256;
    policy.max_output_bytes = 16 * 1024;
    return policy;
}

std::string ReadScript(const std::string& name) {
    std::ifstream t(kCodesDir + name);
    if (!t.is_open()) {
        throw test_harness::CheckFailure("Cannot open source: " + kCodesDir + name);
    }
    std::stringstream buffer;
    buffer << t.rdbuf();
    return buffer.str();
}

RunReport RunScript(const std::string& name) {
    ProcessEnvironment env(g_sandbox_config.workspace_root);
    RunReport report = env.Run(ReadScript(name), RedTeamPolicy());
    if (report.status == RunStatus::SYSTEM_ERROR) {
        throw test_harness::CheckFailure("sandbox failure: " + report.error_message);
    }
    return report;
}

void CheckDenied(const RunReport& report, const std::string& errno_text) {
    CHECK(report.status == RunStatus::FAULT);
    CHECK_CONTAINS(report.fault_message, errno_text);
}

void TestForkBomb() {
    RunReport report = RunScript("fork_bomb.py");
    CheckDenied(report, "Operation not permitted");
    CHECK_EQ(report.fault_type, std::string("PermissionError"));
}

void TestExecShell() {
    RunReport report = RunScript("exec_shell.py");
    CheckDenied(report, "Operation not permitted");
    CHECK(report.stdout_text.find("pwned") == std::string::npos);
}

void TestFileWrite() {
    fs::remove("/tmp/code_sandbox_pwned.txt");
    RunReport report = RunScript("file_write.py");
    CheckDenied(report, "Permission denied");
    CHECK(!fs::exists("/tmp/code_sandbox_pwned.txt"));
}

void TestMkdir() {
    std::error_code ec;
    fs::remove("/tmp/code_sandbox_pwned_dir", ec);
    RunReport report = RunScript("mkdir_attack.py");
    CheckDenied(report, "Operation not permitted");
    CHECK(!fs::exists("/tmp/code_sandbox_pwned_dir"));
}

void TestNetwork() {
    RunReport report = RunScript("network_test.py");
    CheckDenied(report, "Operation not permitted");
    CHECK(report.stdout_text.find("connected") == std::string::npos);
}

void TestSignalParent() {
    RunReport report = RunScript("signal_attack.py");
    CheckDenied(report, "Operation not permitted");
    CHECK(report.stdout_text.find("parent killed") == std::string::npos);
}

void TestIntrospectionEscape() {
    // 命名空间可以被反射绕过，但 system() 仍然无法创建子进程
    RunReport report = RunScript("introspection_escape.py");
    CHECK(report.stdout_text.find("pwned") == std::string::npos);
}

void TestOutputBomb() {
    RunReport report = RunScript("output_bomb.py");
    CHECK(report.status == RunStatus::OUTPUT_LIMIT_EXCEEDED);
    CHECK(report.stdout_text.size() <= 16 * 1024);
}

void TestMemoryBomb() {
    RunReport report = RunScript("memory_bomb.py");
    CHECK(report.status == RunStatus::MEMORY_LIMIT_EXCEEDED);
}

void TestCpuSpin() {
    RunReport report = RunScript("cpu_spin.py");
    CHECK(report.status == RunStatus::TIME_LIMIT_EXCEEDED);
    // 截止时间 2s，允许调度抖动
    CHECK(report.time_used_ms < 4000);
}

void TestRawExitIsNotMistakenForSetupFailure() {
    // 120 是解释器自己的退出码，不是子进程设置阶段的错误码
    ProcessEnvironment env(g_sandbox_config.workspace_root);
    RunReport report = env.Run(ReadScript("raw_exit.py"), RedTeamPolicy());
    CHECK(report.status == RunStatus::SYSTEM_ERROR);
    CHECK_EQ(report.exit_code, 120);
    CHECK_CONTAINS(report.error_message, "解释器异常退出 (退出码 120)");
    CHECK(report.error_message.find("沙箱恐慌") == std::string::npos);
}

} // namespace

int main() {
    std::cout << "=== Security Integration Test ===" << std::endl;

    ApplyDefaultConfig();
    std::strncpy(g_sandbox_config.workspace_root, "/tmp/code_sandbox_security_test",
                 sizeof(g_sandbox_config.workspace_root) - 1);

    RUN_TEST(TestForkBomb);
    RUN_TEST(TestExecShell);
    RUN_TEST(TestFileWrite);
    RUN_TEST(TestMkdir);
    RUN_TEST(TestNetwork);
    RUN_TEST(TestSignalParent);
    RUN_TEST(TestIntrospectionEscape);
    RUN_TEST(TestOutputBomb);
    RUN_TEST(TestMemoryBomb);
    RUN_TEST(TestCpuSpin);
    RUN_TEST(TestRawExitIsNotMistakenForSetupFailure);

    return test_harness::Summary("Security Integration Test");
}
