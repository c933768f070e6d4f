#include "CodeAssist.h"
#include <cassert>
#include <thread>

using namespace Sandbox;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASS\n"; \
        passed++; \
    } catch (const std::exception& e) { \
        std::cout << "FAIL: " << e.what() << "\n"; \
        failed++; \
    } \
    total++; \
} while(0)

static int total = 0;
static int passed = 0;
static int failed = 0;

// ============================================================================
// Output relay
// ============================================================================

TEST(print_is_relayed_verbatim) {
    auto r = execute("print('hi')");
    assert(r.kind == ExecutionResult::Kind::Output);
    assert(r.text == "hi\n");
    assert(r.ok());
}

TEST(silent_source_yields_sentinel) {
    auto r = execute("x = 1");
    assert(r.kind == ExecutionResult::Kind::Empty);
    assert(r.text == "Code executed successfully (no output)");
    assert(r.text == kEmptyOutputSentinel);
    assert(r.ok());
}

TEST(empty_source_yields_sentinel) {
    auto r = execute("");
    assert(r.kind == ExecutionResult::Kind::Empty);
    assert(r.text == kEmptyOutputSentinel);
}

TEST(undefined_name_is_reported) {
    auto r = execute("print(undefined_name)");
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text == "Error: NameError: name 'undefined_name' is not defined");
    assert(!r.ok());
}

TEST(division_by_zero_is_reported) {
    auto r = execute("1/0");
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text == "Error: ZeroDivisionError: division by zero");
}

TEST(import_is_refused) {
    auto r = execute("import os");
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text.rfind(kErrorPrefix, 0) == 0);
    assert(r.text.find("ImportError") != std::string::npos);

    auto r2 = execute("from os import path");
    assert(r2.kind == ExecutionResult::Kind::Error);
    assert(r2.text.find("ImportError") != std::string::npos);
}

TEST(output_before_fault_is_discarded) {
    auto r = execute("print('partial')\nprint(1/0)");
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text == "Error: ZeroDivisionError: division by zero");
    assert(r.text.find("partial") == std::string::npos);
}

TEST(print_without_newline) {
    auto r = execute("print('a', 'b', sep='-', end='')");
    assert(r.kind == ExecutionResult::Kind::Output);
    assert(r.text == "a-b");
}

TEST(syntax_error_names_the_line) {
    auto r = execute("x = 1\nif x\n    print(x)\n");
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text.rfind("Error: SyntaxError: ", 0) == 0);
    assert(r.text.find("line 2") != std::string::npos);
}

// ============================================================================
// Stream restoration
// ============================================================================

TEST(cout_buffer_is_restored) {
    std::streambuf* before = std::cout.rdbuf();
    execute("print('x')");
    assert(std::cout.rdbuf() == before);
    execute("1/0");
    assert(std::cout.rdbuf() == before);
    execute("def f(:\n  pass");
    assert(std::cout.rdbuf() == before);
    execute("def f(n):\n    return f(n + 1)\nf(0)");
    assert(std::cout.rdbuf() == before);
}

TEST(outer_capture_sees_nothing_from_sandbox) {
    std::ostringstream outer;
    std::streambuf* prev = std::cout.rdbuf(outer.rdbuf());
    auto r = execute("print('inside')");
    std::cout << "outside";
    std::cout.rdbuf(prev);
    assert(r.text == "inside\n");
    assert(outer.str() == "outside");
}

TEST(scoped_capture_restores_on_exception) {
    std::streambuf* before = std::cout.rdbuf();
    try {
        ScopedCoutCapture capture;
        std::cout << "lost";
        assert(capture.str() == "lost");
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    assert(std::cout.rdbuf() == before);
}

// ============================================================================
// Isolation
// ============================================================================

TEST(executions_do_not_share_state) {
    auto r1 = execute("secret = 42\nprint(secret)");
    assert(r1.text == "42\n");
    auto r2 = execute("print(secret)");
    assert(r2.kind == ExecutionResult::Kind::Error);
    assert(r2.text == "Error: NameError: name 'secret' is not defined");
}

TEST(second_capture_is_fresh) {
    auto r1 = execute("print('first')");
    auto r2 = execute("print('second')");
    assert(r1.text == "first\n");
    assert(r2.text == "second\n");
}

TEST(pure_source_is_idempotent) {
    const std::string src =
        "xs = [3, 1, 2]\n"
        "for i, x in enumerate(sorted(xs)):\n"
        "    print(i, x)\n";
    auto a = execute(src);
    auto b = execute(src);
    assert(a.kind == b.kind);
    assert(a.text == b.text);
    assert(a.text == "0 1\n1 2\n2 3\n");
}

TEST(concurrent_callers_are_serialized) {
    std::vector<std::string> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([i, &results]{
            std::string src = "for k in range(50):\n    pass\nprint(" + std::to_string(i) + ")";
            results[i] = execute(src).text;
        });
    }
    for (auto& t : threads) t.join();
    for (size_t i = 0; i < results.size(); ++i)
        assert(results[i] == std::to_string(i) + "\n");
}

// ============================================================================
// Limits
// ============================================================================

TEST(runaway_recursion_is_contained) {
    auto r = execute("def f(n):\n    return f(n + 1)\nf(0)");
    assert(r.text == "Error: RecursionError: maximum recursion depth exceeded");
}

TEST(step_budget_stops_infinite_loop) {
    SandboxOptions opts;
    opts.max_steps = 1000;
    auto r = execute("while True:\n    pass", opts);
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text == "Error: TimeoutError: step budget of 1000 exceeded");
}

TEST(step_budget_cannot_be_caught) {
    SandboxOptions opts;
    opts.max_steps = 500;
    auto r = execute("try:\n    while True:\n        pass\nexcept:\n    print('caught')", opts);
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text.find("TimeoutError") != std::string::npos);
}

TEST(custom_call_depth) {
    SandboxOptions opts;
    opts.max_call_depth = 5;
    auto ok = execute("def f(n):\n    return 0 if n == 0 else f(n - 1)\nprint(f(4))", opts);
    assert(ok.text == "0\n");
    auto deep = execute("def f(n):\n    return 0 if n == 0 else f(n - 1)\nprint(f(10))", opts);
    assert(deep.text == "Error: RecursionError: maximum recursion depth exceeded");
}

TEST(deeply_nested_list_released_after_run) {
    auto r = execute("a = []\nfor i in range(1000000):\n    a = [a]\nprint('built')\n");
    assert(r.kind == ExecutionResult::Kind::Output);
    assert(r.text == "built\n");
}

TEST(deeply_nested_values_dropped_mid_run) {
    auto lists = execute("a = []\nfor i in range(1000000):\n    a = [a]\na = None\nprint('ok')\n");
    assert(lists.kind == ExecutionResult::Kind::Output);
    assert(lists.text == "ok\n");

    auto mixed = execute(
        "d = {}\nt = ()\nfor i in range(200000):\n    d = {'k': d}\n    t = (t, [t])\n"
        "d = 0\nt = 0\nprint('mixed')\n");
    assert(mixed.text == "mixed\n");

    auto closures = execute(
        "def wrap(g):\n    def inner():\n        return g\n    return inner\n"
        "f = None\nfor i in range(200000):\n    f = wrap(f)\nf = None\nprint('closures')\n");
    assert(closures.text == "closures\n");
}

TEST(self_referencing_containers_released) {
    auto r = execute("a = []\na.append(a)\nd = {}\nd['self'] = d\nd['a'] = a\nprint(len(a), len(d))");
    assert(r.text == "1 2\n");
    auto failing = execute("a = []\na.append(a)\nprint(a)\n1/0");
    assert(failing.kind == ExecutionResult::Kind::Error);
    assert(failing.text == "Error: ZeroDivisionError: division by zero");
    auto deep_then_fault = execute("a = []\nfor i in range(200000):\n    a = [a]\nundefined_name");
    assert(deep_then_fault.text == "Error: NameError: name 'undefined_name' is not defined");
}

TEST(result_kind_names) {
    assert(std::string(result_kind_name(ExecutionResult::Kind::Output)) == "output");
    assert(std::string(result_kind_name(ExecutionResult::Kind::Empty)) == "empty");
    assert(std::string(result_kind_name(ExecutionResult::Kind::Error)) == "error");
}

int main() {
    std::cout << "=== Sandbox Boundary Tests ===\n\n";

    RUN_TEST(print_is_relayed_verbatim);
    RUN_TEST(silent_source_yields_sentinel);
    RUN_TEST(empty_source_yields_sentinel);
    RUN_TEST(undefined_name_is_reported);
    RUN_TEST(division_by_zero_is_reported);
    RUN_TEST(import_is_refused);
    RUN_TEST(output_before_fault_is_discarded);
    RUN_TEST(print_without_newline);
    RUN_TEST(syntax_error_names_the_line);

    RUN_TEST(cout_buffer_is_restored);
    RUN_TEST(outer_capture_sees_nothing_from_sandbox);
    RUN_TEST(scoped_capture_restores_on_exception);

    RUN_TEST(executions_do_not_share_state);
    RUN_TEST(second_capture_is_fresh);
    RUN_TEST(pure_source_is_idempotent);
    RUN_TEST(concurrent_callers_are_serialized);

    RUN_TEST(runaway_recursion_is_contained);
    RUN_TEST(step_budget_stops_infinite_loop);
    RUN_TEST(step_budget_cannot_be_caught);
    RUN_TEST(custom_call_depth);
    RUN_TEST(deeply_nested_list_released_after_run);
    RUN_TEST(deeply_nested_values_dropped_mid_run);
    RUN_TEST(self_referencing_containers_released);
    RUN_TEST(result_kind_names);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Total:  " << total << "\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
