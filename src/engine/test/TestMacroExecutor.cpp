#include "MacroExecutor.hpp"
#include "MacroLoader.hpp"
#include "DummyBackend.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("automacro_exec_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static ExecutorConfig fast_config() {
    ExecutorConfig config;
    config.step_timeout_sec = 1;
    config.retry_interval_ms = 50;
    return config;
}

void test_all_steps_succeed() {
    fs::path dir = make_temp_dir("success");
    write_file(dir / "save_doc.yaml",
        "name: Save Document\n"
        "steps:\n"
        "  - action: focus\n"
        "  - action: find\n"
        "    automation_id: SaveButton\n"
        "    save_as: save\n"
        "  - action: click\n"
        "    ref: save\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    backend.add_element({"SaveButton", "Save", "Button", "button"});
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("save_doc", {});
    assert(result.success);
    assert(result.steps_executed == 3);
    assert(result.total_steps == 3);
    assert(result.message == "Macro 'Save Document' completed (3 steps)");
    assert(!result.failed_step);
    assert(backend.count_calls("click:e1") == 1);
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_all_steps_succeed passed" << std::endl;
}

void test_failing_step_reports_index() {
    fs::path dir = make_temp_dir("failure");
    write_file(dir / "broken.yaml",
        "name: Broken\n"
        "steps:\n"
        "  - action: focus\n"
        "  - action: find\n"
        "    name: Missing\n"
        "    timeout: 1\n"
        "    retry_interval: 0.1\n"
        "  - action: click\n"
        "    ref: e1\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("BROKEN", {});
    assert(!result.success);
    assert(result.steps_executed == 1);
    assert(result.total_steps == 3);
    assert(result.failed_step && *result.failed_step == 2);
    assert(result.failed_action == "find");
    assert(result.message == "Element not found after 1s");
    assert(backend.count_calls("find") >= 2);
    assert(backend.count_calls("click") == 0);
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_failing_step_reports_index passed" << std::endl;
}

void test_missing_required_parameters() {
    fs::path dir = make_temp_dir("params");
    write_file(dir / "login.yaml",
        "name: Login\n"
        "parameters:\n"
        "  - name: user\n"
        "    required: true\n"
        "  - name: password\n"
        "    required: true\n"
        "  - name: domain\n"
        "    required: true\n"
        "    default: CORP\n"
        "steps:\n"
        "  - action: type\n"
        "    text: \"{{user}}\"\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("login", {});
    assert(!result.success);
    assert(result.steps_executed == 0);
    assert(result.message == "Missing required parameters: user, password");
    assert(backend.recorded_calls().empty());

    result = executor.execute("login", {{"user", "alice"}, {"password", "secret"}});
    assert(result.success);
    assert(backend.count_calls("type:alice") == 1);
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_missing_required_parameters passed" << std::endl;
}

void test_default_parameter_substitution() {
    fs::path dir = make_temp_dir("defaults");
    write_file(dir / "mode.yaml",
        "name: Mode\n"
        "parameters:\n"
        "  - name: mode\n"
        "    required: true\n"
        "    default: fast\n"
        "steps:\n"
        "  - action: type\n"
        "    text: \"run {{mode}} {{other}}\"\n"
        "  - action: send_keys\n"
        "    keys: \"{{mode}}\"\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("mode", {});
    assert(result.success);
    assert(backend.count_calls("type:run fast {{other}}") == 1);
    assert(backend.count_calls("send_keys:fast") == 1);

    result = executor.execute("mode", {{"mode", "slow"}, {"unused", "x"}});
    assert(result.success);
    assert(backend.count_calls("send_keys:slow") == 1);
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_default_parameter_substitution passed" << std::endl;
}

static std::string verify_macro(const std::string& expected, const std::string& extra) {
    return "name: Verify\n"
           "parameters:\n"
           "  - name: wanted\n"
           "    default: Bye\n"
           "steps:\n"
           "  - action: find\n"
           "    automation_id: Status\n"
           "    save_as: status\n"
           "  - action: verify\n"
           "    ref: status\n"
           "    property: value\n"
           "    expected: \"" + expected + "\"\n" + extra;
}

void test_verify_modes() {
    fs::path dir = make_temp_dir("verify");
    write_file(dir / "eq.yaml", verify_macro("hello world", ""));
    write_file(dir / "contains.yaml", verify_macro("World", "    match_mode: contains\n"));
    write_file(dir / "ne.yaml", verify_macro("Hello World", "    match_mode: not_equals\n"));
    write_file(dir / "unknown.yaml", verify_macro("Hello World", "    match_mode: fuzzy\n"));
    write_file(dir / "custom.yaml", verify_macro("{{wanted}}", "    message: \"Status is not {{wanted}}\"\n"));

    MacroRegistry registry(dir);
    assert(registry.snapshot()->errors.empty());
    DummyBackend backend;
    DummyElement status;
    status.automation_id = "Status";
    status.value = "Hello World";
    backend.add_element(status);
    MacroExecutor executor(registry, backend, fast_config());

    assert(executor.execute("eq", {}).success);
    assert(executor.execute("contains", {}).success);

    ExecutionResult ne = executor.execute("ne", {});
    assert(!ne.success);
    assert(ne.failed_step && *ne.failed_step == 2);
    assert(contains(ne.message, "Verify failed (not_equals): expected value != \"Hello World\""));

    ExecutionResult unknown = executor.execute("unknown", {});
    assert(!unknown.success);
    assert(contains(unknown.message, "Unknown match_mode 'fuzzy'"));
    assert(!contains(unknown.message, "Verify failed"));

    ExecutionResult custom = executor.execute("custom", {});
    assert(!custom.success);
    assert(custom.message == "Status is not Bye");
    (void)ne;
    (void)unknown;
    (void)custom;
    fs::remove_all(dir);
    std::cout << "test_verify_modes passed" << std::endl;
}

void test_nested_macro_scope() {
    fs::path dir = make_temp_dir("nested");
    write_file(dir / "child.yaml",
        "name: Child\n"
        "parameters:\n"
        "  - name: text\n"
        "    required: true\n"
        "steps:\n"
        "  - action: type\n"
        "    text: \"{{text}}\"\n");
    write_file(dir / "parent.yaml",
        "name: Parent\n"
        "parameters:\n"
        "  - name: greeting\n"
        "    default: hi\n"
        "steps:\n"
        "  - action: find\n"
        "    automation_id: Box\n"
        "    save_as: box\n"
        "  - action: macro\n"
        "    macro_name: child\n"
        "    params:\n"
        "      text: \"{{greeting}} there\"\n"
        "  - action: click\n"
        "    ref: box\n");
    write_file(dir / "child_click.yaml",
        "name: Child Click\n"
        "steps:\n"
        "  - action: click\n"
        "    ref: box\n");
    write_file(dir / "parent_alias.yaml",
        "name: Parent Alias\n"
        "steps:\n"
        "  - action: find\n"
        "    automation_id: Box\n"
        "    save_as: box\n"
        "  - action: macro\n"
        "    macro_name: child_click\n");
    write_file(dir / "parent_missing.yaml",
        "name: Parent Missing\n"
        "steps:\n"
        "  - action: macro\n"
        "    macro_name: nope\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    DummyElement box;
    box.automation_id = "Box";
    backend.add_element(box);
    MacroExecutor executor(registry, backend, fast_config());

    std::vector<std::string> lines;
    ExecutionResult result = executor.execute("parent", {}, {},
        [&lines](const std::string& line) { lines.push_back(line); });
    assert(result.success);
    assert(result.steps_executed == 3);
    assert(backend.count_calls("type:hi there") == 1);
    assert(backend.count_calls("click:e1") == 1);

    bool tagged = false;
    for (const auto& line : lines) {
        if (contains(line, "[Macro] Step 2 > Step 1/1: type text=hi there")) tagged = true;
    }
    assert(tagged);
    (void)tagged;

    // The nested macro gets a fresh alias table, so "box" is not bound there
    result = executor.execute("parent_alias", {});
    assert(!result.success);
    assert(result.failed_step && *result.failed_step == 2);
    assert(result.failed_action == "macro");
    assert(contains(result.message, "Nested macro 'child_click' failed:"));
    assert(backend.count_calls("click:box") == 1);

    result = executor.execute("parent_missing", {});
    assert(!result.success);
    assert(result.message == "Macro 'nope' not found");
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_nested_macro_scope passed" << std::endl;
}

void test_unattached_target() {
    fs::path dir = make_temp_dir("unattached");
    write_file(dir / "focus.yaml", "name: Focus\nsteps:\n  - action: focus\n");
    write_file(dir / "attach_first.yaml",
        "name: Attach First\n"
        "steps:\n"
        "  - action: attach\n"
        "    process_name: editor\n"
        "  - action: focus\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    backend.attached = false;
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("focus", {});
    assert(!result.success);
    assert(result.steps_executed == 0);
    assert(contains(result.message, "Target process exited during macro execution at step 1 (focus)"));
    assert(result.error == "Process is no longer attached");
    assert(backend.count_calls("focus") == 0);

    result = executor.execute("attach_first", {});
    assert(result.success);
    assert(backend.count_calls("attach:editor") == 1);
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_unattached_target passed" << std::endl;
}

void test_macro_timeout() {
    fs::path dir = make_temp_dir("timeout");
    write_file(dir / "slow.yaml",
        "name: Slow\n"
        "timeout: 1\n"
        "steps:\n"
        "  - action: wait\n"
        "    seconds: 5\n"
        "  - action: focus\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    auto start = std::chrono::steady_clock::now();
    ExecutionResult result = executor.execute("slow", {});
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!result.success);
    assert(result.steps_executed == 0);
    assert(result.message == "Macro 'Slow' timed out after 1s at step 1 (wait)");
    assert(result.error == "Macro timeout exceeded");
    assert(elapsed < std::chrono::seconds(3));
    assert(backend.count_calls("focus") == 0);
    (void)result;
    (void)elapsed;
    fs::remove_all(dir);
    std::cout << "test_macro_timeout passed" << std::endl;
}

void test_caller_cancellation() {
    fs::path dir = make_temp_dir("cancel");
    write_file(dir / "long_wait.yaml",
        "name: Long Wait\n"
        "steps:\n"
        "  - action: focus\n"
        "  - action: wait\n"
        "    seconds: 5\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    CancellationSource cancel;
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });
    ExecutionResult result = executor.execute("long_wait", {}, cancel.token());
    canceller.join();

    assert(!result.success);
    assert(result.steps_executed == 1);
    assert(result.message == "Macro 'Long Wait' cancelled at step 2 (wait)");
    assert(result.error == "Cancelled");
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_caller_cancellation passed" << std::endl;
}

void test_wait_for_enabled() {
    fs::path dir = make_temp_dir("enabled");
    write_file(dir / "ok.yaml",
        "name: Ok\n"
        "steps:\n"
        "  - action: wait_for_enabled\n"
        "    automation_id: OkButton\n"
        "    save_as: ok\n"
        "    retry_interval: 0.05\n"
        "  - action: click\n"
        "    ref: ok\n");
    write_file(dir / "cancel_ref.yaml",
        "name: Cancel Ref\n"
        "steps:\n"
        "  - action: find\n"
        "    automation_id: CancelButton\n"
        "    save_as: c\n"
        "  - action: wait_for_enabled\n"
        "    ref: c\n"
        "    timeout: 1\n"
        "    retry_interval: 0.1\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    DummyElement ok;
    ok.automation_id = "OkButton";
    ok.enabled_after_checks = 2;
    backend.add_element(ok);
    DummyElement cancel;
    cancel.automation_id = "CancelButton";
    cancel.enabled = false;
    backend.add_element(cancel);
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("ok", {});
    assert(result.success);
    assert(backend.count_calls("is_enabled") == 3);
    assert(backend.count_calls("click:") == 1);

    result = executor.execute("cancel_ref", {});
    assert(!result.success);
    assert(result.failed_step && *result.failed_step == 2);
    assert(contains(result.message, "IsEnabled=false after 1s (target=true)"));
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_wait_for_enabled passed" << std::endl;
}

void test_log_sink_lines() {
    fs::path dir = make_temp_dir("log");
    write_file(dir / "described.yaml",
        "name: Described\n"
        "steps:\n"
        "  - action: focus\n"
        "    description: Bring editor forward\n"
        "  - action: keys\n"
        "    keys: ctrl+s\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    std::vector<std::string> lines;
    ExecutionResult result = executor.execute("described", {}, {},
        [&lines](const std::string& line) { lines.push_back(line); });
    assert(result.success);
    assert(lines.size() == 5);
    assert(lines[0] == "[Macro] Step 1/2: focus — Bring editor forward");
    assert(contains(lines[1], "[Macro] Step 1/2: OK — "));
    assert(lines[2] == "[Macro] Step 2/2: send_keys keys=ctrl+s");
    assert(lines[4] == "[Macro] 'Described' completed (2 steps)");
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_log_sink_lines passed" << std::endl;
}

struct ThrowingBackend : public DummyBackend {
    BackendResult focus() override {
        throw std::runtime_error("session lost");
    }
};

void test_backend_exception_is_contained() {
    fs::path dir = make_temp_dir("throw");
    write_file(dir / "focus.yaml", "name: Focus\nsteps:\n  - action: focus\n");

    MacroRegistry registry(dir);
    ThrowingBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("focus", {});
    assert(!result.success);
    assert(result.message == "Step 1 (focus) failed: session lost");
    assert(result.error == "session lost");
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_backend_exception_is_contained passed" << std::endl;
}

void test_execute_definition_with_include() {
    fs::path dir = make_temp_dir("inline");
    write_file(dir / "common" / "open.yaml",
        "name: Open\n"
        "parameters:\n"
        "  - name: combo\n"
        "steps:\n"
        "  - action: send_keys\n"
        "    keys: \"{{combo}}\"\n");

    MacroRegistry registry(dir);
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    MacroDefinition inline_macro = MacroLoader::parse_document(
        "name: Inline\n"
        "steps:\n"
        "  - action: include\n"
        "    macro_name: common/open\n"
        "    params:\n"
        "      combo: ctrl+o\n"
        "  - action: focus\n",
        "inline");

    ExecutionResult result = executor.execute_definition(inline_macro, {});
    assert(result.success);
    assert(result.total_steps == 2);
    assert(backend.count_calls("send_keys:ctrl+o") == 1);
    assert(backend.count_calls("focus") == 1);

    result = executor.execute("ghost", {});
    assert(!result.success);
    assert(result.message == "Macro 'ghost' not found");
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_execute_definition_with_include passed" << std::endl;
}

void test_recursive_macro_calls_fail() {
    fs::path dir = make_temp_dir("recursion");
    write_file(dir / "loop.yaml",
        "name: Loop\n"
        "steps:\n"
        "  - action: macro\n"
        "    macro_name: loop\n");
    write_file(dir / "ping.yaml",
        "name: Ping\n"
        "steps:\n"
        "  - action: focus\n"
        "  - action: macro\n"
        "    macro_name: pong\n");
    write_file(dir / "pong.yaml",
        "name: Pong\n"
        "steps:\n"
        "  - action: macro\n"
        "    macro_name: PING\n");
    write_file(dir / "twice.yaml",
        "name: Twice\n"
        "steps:\n"
        "  - action: macro\n"
        "    macro_name: leaf\n"
        "  - action: macro\n"
        "    macro_name: leaf\n");
    write_file(dir / "leaf.yaml", "name: Leaf\nsteps:\n  - action: focus\n");

    MacroRegistry registry(dir);
    assert(registry.load_errors().empty());
    DummyBackend backend;
    MacroExecutor executor(registry, backend, fast_config());

    ExecutionResult result = executor.execute("loop", {});
    assert(!result.success);
    assert(result.steps_executed == 0);
    assert(result.failed_step && *result.failed_step == 1);
    assert(result.failed_action == "macro");
    assert(result.message == "Recursive macro call detected: loop -> loop");

    result = executor.execute("ping", {});
    assert(!result.success);
    assert(result.steps_executed == 1);
    assert(result.failed_step && *result.failed_step == 2);
    assert(result.message == "Nested macro 'pong' failed: Recursive macro call detected: ping -> pong -> PING");
    assert(backend.count_calls("focus") == 1);

    // Calling the same macro twice in sequence is not recursion
    result = executor.execute("twice", {});
    assert(result.success);
    assert(backend.count_calls("focus") == 3);
    (void)result;
    fs::remove_all(dir);
    std::cout << "test_recursive_macro_calls_fail passed" << std::endl;
}

int main() {
    test_all_steps_succeed();
    test_failing_step_reports_index();
    test_missing_required_parameters();
    test_default_parameter_substitution();
    test_verify_modes();
    test_nested_macro_scope();
    test_unattached_target();
    test_macro_timeout();
    test_caller_cancellation();
    test_wait_for_enabled();
    test_log_sink_lines();
    test_backend_exception_is_contained();
    test_execute_definition_with_include();
    test_recursive_macro_calls_fail();
    std::cout << "All MacroExecutor tests passed!" << std::endl;
    return 0;
}
