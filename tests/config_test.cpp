#include <string>

#include "test_harness.h"
#include "config.h"
#include "outcome.h"
#include "policy.h"
#include "sandbox_internal.h"
#include "validator.h"

using namespace code_sandbox;

namespace {

const char* kConfig = R"(
policy_version: 3
path:
  workspace_root: /tmp/code_sandbox_config_test
  interpreter: /usr/bin/python3
  mount_dirs: [/usr, /lib]
limits:
  max_source_length: 500
  max_seconds: 2
  memory_limit_mb: 128
  max_output_kb: 16
policy:
  forbidden_functions: [open, input, eval]
contexts:
  control_flow:
    allowed_modules: [random]
  final_project:
    allowed_modules: [re, time]
    allowed_builtins: [input]
    waived_functions: [input]
    limits:
      max_seconds: 10
isolation:
  namespaces: false
  cgroup: false
  cgroup_pids_limit: 7
)";

void TestDefaultPolicyMatchesLessonPlatform() {
    AllowListPolicy policy = MakeDefaultPolicy();
    CHECK_EQ(policy.max_source_length, static_cast<std::size_t>(1000));
    CHECK(policy.max_seconds == 5.0);
    CHECK(policy.forbidden_modules.count("os") == 1);
    CHECK(policy.forbidden_modules.count("pickle") == 1);
    CHECK(policy.forbidden_functions.count("open") == 1);
    CHECK(policy.forbidden_functions.count("dir") == 1);
    CHECK(policy.allowed_builtins.count("print") == 1);
    CHECK(policy.allowed_builtins.count("open") == 0);
    CHECK(policy.allowed_builtins.size() == 21);
    CHECK(policy.waived_functions.empty());
}

void TestUnknownContextFallsBackToDefault() {
    PolicyRegistry registry = MakeDefaultRegistry();
    const AllowListPolicy& unknown = registry.Resolve("no_such_lesson");
    CHECK(&unknown == &registry.Default());
    CHECK(!registry.HasContext("no_such_lesson"));
    CHECK(registry.HasContext("control_flow"));
    CHECK(registry.HasContext("final_project"));
}

void TestDefaultRegistryWaivesInputOnlyForFinalProject() {
    PolicyRegistry registry = MakeDefaultRegistry();
    const std::string source = "x = input()";
    CHECK(!Validate(source, registry.Resolve("")).ok);
    CHECK(!Validate(source, registry.Resolve("control_flow")).ok);
    CHECK(Validate(source, registry.Resolve("final_project")).ok);
    CHECK(registry.Resolve("final_project").allowed_builtins.count("input") == 1);
    CHECK(registry.Resolve("control_flow").IsModuleAllowed("random"));
}

void TestLoadConfigFromString() {
    PolicyRegistry registry = LoadConfigFromString(kConfig);

    CHECK_EQ(std::string(g_sandbox_config.workspace_root), std::string("/tmp/code_sandbox_config_test"));
    CHECK_EQ(std::string(g_sandbox_config.interpreter_path), std::string("/usr/bin/python3"));
    CHECK_EQ(g_sandbox_config.mount_count, 2);
    CHECK_EQ(g_sandbox_config.cgroup_pids_limit, 7);
    CHECK(!g_sandbox_config.use_namespaces);
    CHECK(!g_sandbox_config.drop_privileges);

    const AllowListPolicy& base = registry.Default();
    CHECK_EQ(base.version, 3);
    CHECK_EQ(base.max_source_length, static_cast<std::size_t>(500));
    CHECK(base.max_seconds == 2.0);
    CHECK_EQ(base.memory_limit_mb, 128LL);
    CHECK_EQ(base.max_output_bytes, 16LL * 1024LL);
    CHECK_EQ(base.forbidden_functions.size(), static_cast<std::size_t>(3));
    // 未给出的列表保持默认值
    CHECK(base.forbidden_modules.count("socket") == 1);

    const AllowListPolicy& final_project = registry.Resolve("final_project");
    CHECK_EQ(final_project.context, std::string("final_project"));
    CHECK(final_project.max_seconds == 10.0);
    CHECK_EQ(final_project.max_source_length, static_cast<std::size_t>(500));
    CHECK(final_project.IsFunctionWaived("input"));
    CHECK(final_project.IsModuleAllowed("re"));
    CHECK(final_project.allowed_builtins.count("print") == 1);
    CHECK(final_project.allowed_builtins.count("input") == 1);

    const AllowListPolicy& control_flow = registry.Resolve("control_flow");
    CHECK(control_flow.max_seconds == 2.0);
    CHECK(!control_flow.IsFunctionWaived("input"));
}

void TestMissingPathNodeThrows() {
    bool thrown = false;
    try {
        LoadConfigFromString("limits:\n  max_seconds: 1\n");
    } catch (const ConfigError& e) {
        thrown = true;
        CHECK_CONTAINS(e.what(), "path");
    }
    CHECK(thrown);
}

void TestMountDirsMustBeList() {
    bool thrown = false;
    try {
        LoadConfigFromString("path: { workspace_root: /tmp/x, mount_dirs: /usr }\n");
    } catch (const ConfigError& e) {
        thrown = true;
        CHECK_CONTAINS(e.what(), "mount_dirs");
    }
    CHECK(thrown);
}

void TestInvalidNameThrows() {
    bool thrown = false;
    try {
        LoadConfigFromString(
            "path: { workspace_root: /tmp/x }\n"
            "policy: { allowed_builtins: [print, \"__import__('os')\"] }\n");
    } catch (const ConfigError&) {
        thrown = true;
    }
    CHECK(thrown);
}

void TestMalformedYamlThrowsConfigError() {
    bool thrown = false;
    try {
        LoadConfigFromString("path: [unclosed\n");
    } catch (const ConfigError&) {
        thrown = true;
    }
    CHECK(thrown);
}

void TestMissingConfigFileThrows() {
    bool thrown = false;
    try {
        LoadConfig("/nonexistent/code_sandbox.yaml");
    } catch (const ConfigError&) {
        thrown = true;
    }
    CHECK(thrown);
}

void TestShippedConfigLoads() {
    PolicyRegistry registry = LoadConfig(std::string(CODE_SANDBOX_TEST_DIR) + "/../config.yaml");
    CHECK(registry.HasContext("final_project"));
    CHECK(Validate("print(input())", registry.Resolve("final_project")).ok);
    CHECK(!Validate("print(input())", registry.Resolve("control_flow")).ok);
}

void TestIsValidName() {
    CHECK(IsValidName("math"));
    CHECK(IsValidName("_private1"));
    CHECK(!IsValidName(""));
    CHECK(!IsValidName("1abc"));
    CHECK(!IsValidName("os.path"));
    CHECK(!IsValidName("a'b"));
}

void TestOutcomeFailureNeverCarriesOk() {
    ExecutionOutcome outcome = ExecutionOutcome::Failure(OutcomeCategory::OK, "boom");
    CHECK(!outcome.success());
    CHECK(outcome.category() == OutcomeCategory::SANDBOX_ERROR);
    CHECK_EQ(outcome.ToString(), std::string("sandbox_error: boom"));

    SourceSubmission submission("print(1)", "control_flow");
    CHECK_EQ(submission.length(), static_cast<std::size_t>(8));
}

} // namespace

int main() {
    std::cout << "=== Config & Policy Test ===" << std::endl;

    RUN_TEST(TestDefaultPolicyMatchesLessonPlatform);
    RUN_TEST(TestUnknownContextFallsBackToDefault);
    RUN_TEST(TestDefaultRegistryWaivesInputOnlyForFinalProject);
    RUN_TEST(TestLoadConfigFromString);
    RUN_TEST(TestMissingPathNodeThrows);
    RUN_TEST(TestMountDirsMustBeList);
    RUN_TEST(TestInvalidNameThrows);
    RUN_TEST(TestMalformedYamlThrowsConfigError);
    RUN_TEST(TestMissingConfigFileThrows);
    RUN_TEST(TestShippedConfigLoads);
    RUN_TEST(TestIsValidName);
    RUN_TEST(TestOutcomeFailureNeverCarriesOk);

    return test_harness::Summary("Config & Policy Test");
}
