#include "CodeAssist.h"
#include <cassert>

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

static const char* const kAllowed[] = {
    "print", "len", "str", "int", "float", "bool", "list", "tuple", "dict",
    "range", "enumerate", "zip", "sum", "min", "max", "round", "abs", "sorted"
};

static std::string out_of(const std::string& src) {
    auto r = execute(src);
    return r.text;
}

// ============================================================================
// Allowlist contents
// ============================================================================

TEST(standard_allowlist_is_exact) {
    const auto& std_caps = CapabilityAllowlist::standard();
    assert(std_caps.entries().size() == sizeof(kAllowed) / sizeof(kAllowed[0]));
    for (const char* name : kAllowed) {
        assert(std_caps.contains(name));
        auto c = capability_from_name(name);
        assert(c.has_value());
        assert(std::string(capability_name(*c)) == name);
    }
    assert(!std_caps.contains("open"));
    assert(!capability_from_name("eval").has_value());
}

TEST(every_capability_is_bound) {
    for (const char* name : kAllowed) {
        auto r = execute(std::string("print(") + name + ")");
        assert(r.kind == ExecutionResult::Kind::Output);
        assert(r.text == std::string("<built-in function ") + name + ">\n");
    }
}

TEST(names_outside_allowlist_are_undefined) {
    static const char* const blocked[] = {
        "open", "eval", "exec", "compile", "__import__", "getattr", "setattr",
        "globals", "locals", "vars", "type", "input", "help", "exit", "object",
        "isinstance", "map", "filter", "any", "all", "chr", "ord", "repr",
        "Exception", "__builtins__", "__name__"
    };
    for (const char* name : blocked) {
        auto r = execute(std::string("x = ") + name);
        assert(r.kind == ExecutionResult::Kind::Error);
        assert(r.text == std::string("Error: NameError: name '") + name + "' is not defined");
    }
}

TEST(dunder_attributes_are_refused) {
    assert(out_of("().__class__") == "Error: AttributeError: 'tuple' object has no attribute '__class__'");
    assert(out_of("print.__self__") == "Error: AttributeError: 'builtin_function_or_method' object has no attribute '__self__'");
    assert(out_of("''.__class__.__mro__") == "Error: AttributeError: 'str' object has no attribute '__class__'");
    assert(out_of("def f():\n    pass\nf.__globals__")
           == "Error: AttributeError: 'function' object has no attribute '__globals__'");
    assert(out_of("(lambda: 0).__code__") == "Error: AttributeError: 'function' object has no attribute '__code__'");
}

TEST(attributes_cannot_be_assigned) {
    auto r = execute("xs = []\nxs.append = 1");
    assert(r.kind == ExecutionResult::Kind::Error);
    assert(r.text.find("AttributeError") != std::string::npos);
}

TEST(imports_are_refused) {
    static const char* const sources[] = {
        "import os",
        "import sys as s",
        "from subprocess import run",
        "def f():\n    import os\nf()",
        "try:\n    import os\nexcept:\n    print('caught')",
    };
    for (size_t i = 0; i < 4; ++i) {
        auto r = execute(sources[i]);
        assert(r.kind == ExecutionResult::Kind::Error);
        assert(r.text == "Error: ImportError: __import__ not found");
    }
    // a bare except may swallow the refusal, but nothing gets imported
    assert(out_of(sources[4]) == "caught\n");
    assert(out_of("try:\n    import os\nexcept:\n    pass\nprint(os)") == "Error: NameError: name 'os' is not defined");
}

// ============================================================================
// Binding behaviour
// ============================================================================

TEST(capabilities_can_be_shadowed_per_execution) {
    assert(out_of("len = 5\nprint(len)") == "5\n");
    assert(out_of("print(len('abc'))") == "3\n");
}

TEST(capabilities_cannot_be_deleted) {
    assert(out_of("del print") == "Error: NameError: name 'print' is not defined");
    assert(out_of("print('still here')") == "still here\n");
}

TEST(reduced_allowlist) {
    CapabilityAllowlist only_print({Capability::Print, Capability::Str});
    assert(only_print.contains(Capability::Print));
    assert(!only_print.contains(Capability::Len));

    std::ostringstream out;
    Interpreter in(out, SandboxOptions(), only_print);
    in.run(*parse("print(str(7))"));
    assert(out.str() == "7\n");
    bool raised = false;
    try {
        in.run(*parse("print(len('a'))"));
    } catch (const ResolutionFault& e) {
        raised = true;
        assert(e.describe() == "NameError: name 'len' is not defined");
    }
    assert(raised);
}

TEST(empty_allowlist) {
    std::ostringstream out;
    Interpreter in(out, SandboxOptions(), CapabilityAllowlist({}));
    in.run(*parse("x = [1, 2]\ny = x[0] + 1"));
    assert(out.str().empty());
    bool raised = false;
    try {
        in.run(*parse("print(x)"));
    } catch (const Fault& e) {
        raised = true;
        assert(e.type == "NameError");
    }
    assert(raised);
}

// ============================================================================
// Capability behaviour
// ============================================================================

TEST(conversions) {
    assert(out_of("print(int('42'), int(' -7 '), int(3.9), int('ff', 16), int('0b101', 0))") == "42 -7 3 255 5\n");
    assert(out_of("print(float('1.5'), float(2), float('inf'), bool(0), bool([1]))") == "1.5 2.0 inf False True\n");
    assert(out_of("int('x')") == "Error: ValueError: invalid literal for int() with base 10: 'x'");
    assert(out_of("float('abc')") == "Error: ValueError: could not convert string to float: 'abc'");
    assert(out_of("print(str(None), str(1.0), str([1]))") == "None 1.0 [1]\n");
}

TEST(containers) {
    assert(out_of("print(list('ab'), tuple([1, 2]), dict(a=1), dict([('k', 2)]))")
           == "['a', 'b'] (1, 2) {'a': 1} {'k': 2}\n");
    assert(out_of("print(list(range(2, 10, 3)), len(range(5)), list(range(3, 0, -1)))") == "[2, 5, 8] 5 [3, 2, 1]\n");
    assert(out_of("range(1, 2, 0)") == "Error: ValueError: range() arg 3 must not be zero");
    assert(out_of("len(5)") == "Error: TypeError: object of type 'int' has no len()");
}

TEST(iteration_helpers) {
    assert(out_of("print(list(enumerate('ab', 1)))") == "[(1, 'a'), (2, 'b')]\n");
    assert(out_of("print(list(zip([1, 2, 3], 'ab')))") == "[(1, 'a'), (2, 'b')]\n");
    assert(out_of("zip([1], [1, 2], strict=True)") == "Error: ValueError: zip() argument 2 is longer than argument 1");
}

TEST(aggregates) {
    assert(out_of("print(sum([1, 2, 3]), sum([0.5, 0.5]), sum([[1], [2]], []))") == "6 1.0 [1, 2]\n");
    assert(out_of("print(min(3, 1, 2), max([1, 5, 2]), max('abc'), min([4, -9], key=abs))") == "1 5 c 4\n");
    assert(out_of("print(min([], default='none'), max(['aa', 'b'], key=len))") == "none aa\n");
    assert(out_of("min([])") == "Error: ValueError: min() iterable argument is empty");
    assert(out_of("sum(['a'], '')") == "Error: TypeError: sum() can't sum strings [use ''.join(seq) instead]");
}

TEST(numeric_helpers) {
    assert(out_of("print(abs(-3), abs(-2.5), round(2.5), round(3.5), round(-0.5))") == "3 2.5 2 4 0\n");
    assert(out_of("print(round(3.14159, 2), round(1234, -2), round(1250, -2))") == "3.14 1200 1200\n");
}

TEST(sorting) {
    assert(out_of("print(sorted([3, 1, 2]), sorted('cba'), sorted([1, 3, 2], reverse=True))")
           == "[1, 2, 3] ['a', 'b', 'c'] [3, 2, 1]\n");
    assert(out_of("print(sorted(['bb', 'a', 'ccc'], key=len))") == "['a', 'bb', 'ccc']\n");
    assert(out_of("print(sorted([(2, 'b'), (1, 'z'), (2, 'a')]))") == "[(1, 'z'), (2, 'a'), (2, 'b')]\n");
    std::string mixed = out_of("sorted([1, 'a'])");
    assert(mixed.rfind("Error: TypeError: '<' not supported between instances of ", 0) == 0);
}

TEST(keyword_checks) {
    assert(out_of("print('x', colour=1)") == "Error: TypeError: print() got an unexpected keyword argument 'colour'");
    assert(out_of("print(1, sep=2)") == "Error: TypeError: sep must be None or a string, not int");
}

int main() {
    std::cout << "=== Capability Allowlist Tests ===\n\n";

    RUN_TEST(standard_allowlist_is_exact);
    RUN_TEST(every_capability_is_bound);
    RUN_TEST(names_outside_allowlist_are_undefined);
    RUN_TEST(dunder_attributes_are_refused);
    RUN_TEST(attributes_cannot_be_assigned);
    RUN_TEST(imports_are_refused);

    RUN_TEST(capabilities_can_be_shadowed_per_execution);
    RUN_TEST(capabilities_cannot_be_deleted);
    RUN_TEST(reduced_allowlist);
    RUN_TEST(empty_allowlist);

    RUN_TEST(conversions);
    RUN_TEST(containers);
    RUN_TEST(iteration_helpers);
    RUN_TEST(aggregates);
    RUN_TEST(numeric_helpers);
    RUN_TEST(sorting);
    RUN_TEST(keyword_checks);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Total:  " << total << "\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
