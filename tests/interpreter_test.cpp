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

// Runs `src` on a private stream without going through the boundary.
static std::string run(const std::string& src) {
    std::ostringstream out;
    auto prog = parse(src);
    Interpreter in(out, SandboxOptions());
    in.run(*prog);
    return out.str();
}

// Relayed text of a failing run, "Error: " prefix stripped.
static std::string fault_of(const std::string& src) {
    auto r = execute(src);
    assert(r.kind == ExecutionResult::Kind::Error);
    return r.text.substr(std::strlen(kErrorPrefix));
}

// ============================================================================
// Arithmetic and values
// ============================================================================

TEST(arithmetic) {
    assert(run("print(7 // 2, -7 // 2, 7 % 3, -7 % 3)") == "3 -4 1 2\n");
    assert(run("print(1 / 2, 2 ** 10, 2 ** -1)") == "0.5 1024 0.5\n");
    assert(run("print(0.1 + 0.2)") == "0.30000000000000004\n");
    assert(run("print(3.0, 1e16, -0.0)") == "3.0 1e+16 -0.0\n");
    assert(run("print(1 << 4, 255 & 15, 1 | 2, 6 ^ 3, ~5)") == "16 15 3 5 -6\n");
    assert(run("print(True + True, 10 - 2 * 3)") == "2 4\n");
}

TEST(integer_overflow_is_reported) {
    assert(fault_of("print(9223372036854775807 + 1)").rfind("OverflowError", 0) == 0);
}

TEST(mixed_type_operands) {
    assert(fault_of("1 + 'a'") == "TypeError: unsupported operand type(s) for +: 'int' and 'str'");
    assert(run("print('ab' * 3, [0] * 2)") == "ababab [0, 0]\n");
    assert(fault_of("1 % 0") == "ZeroDivisionError: integer modulo by zero");
}

TEST(rendering) {
    assert(run("print([1, 'a', None, True])") == "[1, 'a', None, True]\n");
    assert(run("print((1,), (), {'k': [2.5]})") == "(1,) () {'k': [2.5]}\n");
    assert(run("print(\"it's\", str(\"it's\"), [\"it's\"])") == "it's it's [\"it's\"]\n");
    assert(run("xs = [1]\nxs.append(xs)\nprint(xs)") == "[1, [...]]\n");
    assert(run("print(range(3), range(1, 9, 2))") == "range(0, 3) range(1, 9, 2)\n");
}

TEST(comparisons) {
    assert(run("print(1 < 2 < 3, 1 < 2 > 5, 1 == 1.0, 'a' < 'b')") == "True False True True\n");
    assert(run("print([1, 2] < [1, 3], (1, 2) == (1, 2), 2 in [1, 2], 'x' not in 'abc')")
           == "True True True True\n");
    assert(fault_of("print(1 < 'a')") == "TypeError: '<' not supported between instances of 'int' and 'str'");
}

TEST(dict_keys_unify_numbers) {
    assert(run("d = {1: 'a'}\nd[1.0] = 'b'\nd[True] = 'c'\nprint(d, len(d))") == "{1: 'c'} 1\n");
    assert(fault_of("d = {}\nd[[1]] = 2") == "TypeError: unhashable type: 'list'");
    assert(fault_of("d = {}\nprint(d['missing'])") == "KeyError: 'missing'");
}

// ============================================================================
// Control flow
// ============================================================================

TEST(loops_and_else) {
    const char* src =
        "for i in range(5):\n"
        "    if i == 1:\n"
        "        continue\n"
        "    if i == 3:\n"
        "        break\n"
        "    print(i)\n"
        "else:\n"
        "    print('no break')\n"
        "n = 0\n"
        "while n < 2:\n"
        "    n += 1\n"
        "else:\n"
        "    print('done', n)\n";
    assert(run(src) == "0\n2\ndone 2\n");
}

TEST(tuple_unpacking) {
    assert(run("a, b = 1, 2\na, b = b, a\nprint(a, b)") == "2 1\n");
    assert(run("for k, v in {'x': 1, 'y': 2}.items():\n    print(k, v)") == "x 1\ny 2\n");
    assert(fault_of("a, b = [1, 2, 3]") == "ValueError: too many values to unpack (expected 2)");
    assert(fault_of("a, b = [1]") == "ValueError: not enough values to unpack (expected 2, got 1)");
}

TEST(augmented_assignment_shares_lists) {
    assert(run("a = [1]\nb = a\nb += [2]\nprint(a)") == "[1, 2]\n");
    assert(run("t = (1,)\nu = t\nu += (2,)\nprint(t, u)") == "(1,) (1, 2)\n");
    assert(run("d = {'n': 1}\nd['n'] += 5\nprint(d['n'])") == "6\n");
}

// ============================================================================
// Functions
// ============================================================================

TEST(functions_and_defaults) {
    const char* src =
        "def greet(name, greeting='hello'):\n"
        "    return greeting + ', ' + name\n"
        "print(greet('ann'))\n"
        "print(greet('bob', greeting='hi'))\n";
    assert(run(src) == "hello, ann\nhi, bob\n");
}

TEST(closures_capture_scope) {
    const char* src =
        "def make_adder(n):\n"
        "    def add(x):\n"
        "        return x + n\n"
        "    return add\n"
        "add3 = make_adder(3)\n"
        "print(add3(4), (lambda y: y * 2)(5))\n";
    assert(run(src) == "7 10\n");
}

TEST(global_declaration) {
    const char* src =
        "count = 0\n"
        "def bump():\n"
        "    global count\n"
        "    count += 1\n"
        "bump()\n"
        "bump()\n"
        "print(count)\n";
    assert(run(src) == "2\n");
}

TEST(locals_do_not_leak) {
    assert(fault_of("def f():\n    inner = 1\nf()\nprint(inner)") == "NameError: name 'inner' is not defined");
}

TEST(argument_binding_errors) {
    assert(fault_of("def f(a):\n    pass\nf(1, 2)") == "TypeError: f() takes 1 positional argument but 2 were given");
    assert(fault_of("def f(a, b=1):\n    pass\nf(1, 2, 3)")
           == "TypeError: f() takes from 1 to 2 positional arguments but 3 were given");
    assert(fault_of("def f(a, b):\n    pass\nf()")
           == "TypeError: f() missing 2 required positional arguments: 'a' and 'b'");
    assert(fault_of("def f(a):\n    pass\nf(1, a=2)") == "TypeError: f() got multiple values for argument 'a'");
    assert(fault_of("def f(a):\n    pass\nf(b=2)") == "TypeError: f() got an unexpected keyword argument 'b'");
    assert(fault_of("x = 5\nx()") == "TypeError: 'int' object is not callable");
}

TEST(recursion_within_limit) {
    const char* src =
        "def fib(n):\n"
        "    return n if n < 2 else fib(n - 1) + fib(n - 2)\n"
        "print(fib(15))\n";
    assert(run(src) == "610\n");
}

// ============================================================================
// Exceptions
// ============================================================================

TEST(bare_except_catches_runtime_faults) {
    const char* src =
        "try:\n"
        "    1 / 0\n"
        "except:\n"
        "    print('caught')\n"
        "else:\n"
        "    print('no')\n"
        "finally:\n"
        "    print('finally')\n";
    assert(run(src) == "caught\nfinally\n");
}

TEST(except_catches_resolution_faults) {
    const char* src =
        "try:\n"
        "    missing\n"
        "except:\n"
        "    print('name')\n"
        "try:\n"
        "    [].__class__\n"
        "except:\n"
        "    print('dunder')\n";
    assert(run(src) == "name\ndunder\n");
}

TEST(typed_except_cannot_resolve) {
    assert(fault_of("try:\n    1/0\nexcept ZeroDivisionError:\n    pass")
           == "NameError: name 'ZeroDivisionError' is not defined");
}

TEST(finally_runs_before_propagation) {
    auto r = execute("try:\n    print('body')\n    1/0\nfinally:\n    pass");
    assert(r.text == "Error: ZeroDivisionError: division by zero");
    assert(run("def f():\n    try:\n        return 1\n    finally:\n        print('cleanup')\nprint(f())")
           == "cleanup\n1\n");
}

TEST(bare_raise_reraises) {
    assert(fault_of("try:\n    1/0\nexcept:\n    raise") == "ZeroDivisionError: division by zero");
    assert(fault_of("raise") == "RuntimeError: No active exception to reraise");
}

TEST(assert_statement) {
    assert(fault_of("assert 1 == 2, 'mismatch'") == "AssertionError: mismatch");
    assert(fault_of("assert False") == "AssertionError");
    assert(run("assert True\nprint('ok')") == "ok\n");
}

// ============================================================================
// Comprehensions, strings, methods
// ============================================================================

TEST(list_comprehensions) {
    assert(run("print([x * x for x in range(6) if x % 2 == 0])") == "[0, 4, 16]\n");
    assert(run("print([(i, j) for i in range(2) for j in 'ab'])")
           == "[(0, 'a'), (0, 'b'), (1, 'a'), (1, 'b')]\n");
    assert(fault_of("[x for x in range(3)]\nprint(x)") == "NameError: name 'x' is not defined");
    assert(run("print(sum(x for x in range(4)))") == "6\n");
}

TEST(f_strings) {
    assert(run("n = 3\nprint(f'{n} items, {n * 2!r}, {{literal}}')") == "3 items, 6, {literal}\n");
    assert(run("pi = 3.14159\nprint(f'{pi:.2f}|{42:>5}|{\"x\":<3}|')") == "3.14|   42|x  |\n");
    assert(run("s = 'q'\nprint(f'{s!r}')") == "'q'\n");
}

TEST(string_methods) {
    assert(run("print('a,b,,c'.split(','), ' x '.strip(), '-'.join(['a', 'b']))")
           == "['a', 'b', '', 'c'] x a-b\n");
    assert(run("print('Hello'.upper(), 'Hello'.lower(), 'hello'.find('l'), 'hello'.count('l'))")
           == "HELLO hello 2 2\n");
    assert(run("print('abc'.replace('b', 'B'), 'abc'.startswith('a'), '123'.isdigit())")
           == "aBc True True\n");
}

TEST(list_and_dict_methods) {
    const char* src =
        "xs = [3, 1, 2]\n"
        "xs.sort()\n"
        "xs.append(4)\n"
        "xs.insert(0, 0)\n"
        "print(xs, xs.pop(), xs.index(2))\n"
        "d = {'a': 1}\n"
        "d.update({'b': 2})\n"
        "print(d.get('z', 'none'), list(d.keys()), d.pop('a'), d)\n";
    assert(run(src) == "[0, 1, 2, 3] 4 2\nnone ['a', 'b'] 1 {'b': 2}\n");
}

TEST(slicing) {
    assert(run("xs = list(range(10))\nprint(xs[2:5], xs[::-3], xs[-2:])") == "[2, 3, 4] [9, 6, 3, 0] [8, 9]\n");
    assert(run("s = 'hello'\nprint(s[1:3], s[::-1], s[-1])") == "el olleh o\n");
    assert(run("xs = [1, 2, 3, 4]\ndel xs[1:3]\nxs[0] = 9\nprint(xs)") == "[9, 4]\n");
    assert(fault_of("[1][5]") == "IndexError: list index out of range");
}

TEST(unknown_attribute) {
    assert(fault_of("[].nope") == "AttributeError: 'list' object has no attribute 'nope'");
}

TEST(direct_call_api) {
    std::ostringstream out;
    Interpreter in(out, SandboxOptions());
    auto prog = parse("def twice(x, k=2):\n    return x * k\n");
    in.run(*prog);
    auto fn = in.module->get("twice");
    assert(fn && fn->isFunction());
    Value r = in.call(*fn, {Value::I(21)});
    assert(r.isInt() && r.asInt() == 42);
    Value r2 = in.call(*fn, {Value::S("ab")}, {{"k", Value::I(3)}});
    assert(r2.isStr() && r2.str() == "ababab");
}

TEST(builtins_are_bound_by_name) {
    std::ostringstream out;
    Interpreter in(out, SandboxOptions());
    auto p = in.builtins->get("print");
    assert(p && p->isBuiltin());
    assert(p->repr() == "<built-in function print>");
    assert(!in.module->tbl.count("print"));
}

TEST(cycles_are_broken_when_interpreter_ends) {
    std::weak_ptr<ListData> list;
    std::weak_ptr<DictData> dict;
    {
        std::ostringstream out;
        Interpreter in(out, SandboxOptions());
        in.run(*parse("a = []\na.append(a)\nd = {'a': a}\nd['d'] = d"));
        auto a = in.module->get("a");
        auto d = in.module->get("d");
        assert(a && a->isList() && d && d->isDict());
        list = std::get<Value::ListPtr>(a->v);
        dict = std::get<Value::DictPtr>(d->v);
    }
    assert(list.expired());
    assert(dict.expired());
}

TEST(deep_nesting_dropped_mid_run) {
    assert(run("a = []\nfor i in range(300000):\n    a = [a]\na = 1\nprint(a)") == "1\n");
    assert(run("xs = []\nfor i in range(200000):\n    xs = [xs, (xs,)]\nxs = []\nprint(len(xs))") == "0\n");
}

TEST(deep_value_outlives_interpreter) {
    Value kept;
    {
        std::ostringstream out;
        Interpreter in(out, SandboxOptions());
        in.run(*parse("a = []\nfor i in range(200000):\n    a = [a]"));
        auto a = in.module->get("a");
        assert(a && a->isList());
        kept = *a;
    }
    // the run's heap emptied every container it created
    assert(kept.isList() && kept.list().items.empty());
}

int main() {
    std::cout << "=== Interpreter Tests ===\n\n";

    RUN_TEST(arithmetic);
    RUN_TEST(integer_overflow_is_reported);
    RUN_TEST(mixed_type_operands);
    RUN_TEST(rendering);
    RUN_TEST(comparisons);
    RUN_TEST(dict_keys_unify_numbers);

    RUN_TEST(loops_and_else);
    RUN_TEST(tuple_unpacking);
    RUN_TEST(augmented_assignment_shares_lists);

    RUN_TEST(functions_and_defaults);
    RUN_TEST(closures_capture_scope);
    RUN_TEST(global_declaration);
    RUN_TEST(locals_do_not_leak);
    RUN_TEST(argument_binding_errors);
    RUN_TEST(recursion_within_limit);
    RUN_TEST(builtins_are_bound_by_name);
    RUN_TEST(cycles_are_broken_when_interpreter_ends);
    RUN_TEST(deep_nesting_dropped_mid_run);
    RUN_TEST(deep_value_outlives_interpreter);

    RUN_TEST(bare_except_catches_runtime_faults);
    RUN_TEST(except_catches_resolution_faults);
    RUN_TEST(typed_except_cannot_resolve);
    RUN_TEST(finally_runs_before_propagation);
    RUN_TEST(bare_raise_reraises);
    RUN_TEST(assert_statement);

    RUN_TEST(list_comprehensions);
    RUN_TEST(f_strings);
    RUN_TEST(string_methods);
    RUN_TEST(list_and_dict_methods);
    RUN_TEST(slicing);
    RUN_TEST(unknown_attribute);
    RUN_TEST(direct_call_api);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Total:  " << total << "\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
