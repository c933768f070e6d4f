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

using TT = Token::Type;

// describe() of the fault parse() raises, or "" when it parses.
static std::string syntax_error(const std::string& src) {
    try {
        parse(src);
    } catch (const SyntaxFault& e) {
        assert(!e.catchable);
        return e.describe();
    }
    return "";
}

static bool starts_with_text(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// ============================================================================
// Lexer
// ============================================================================

TEST(lex_simple_assignment) {
    auto toks = lex("x = 0x1F + 1_000\n");
    assert(toks.size() == 7);
    assert(toks[0].is(TT::Name) && toks[0].s == "x");
    assert(toks[1].isOp("="));
    assert(toks[2].is(TT::Int) && toks[2].ival == 31);
    assert(toks[3].isOp("+"));
    assert(toks[4].is(TT::Int) && toks[4].ival == 1000);
    assert(toks[5].is(TT::Newline));
    assert(toks[6].is(TT::End));
}

TEST(lex_indentation) {
    auto toks = lex("if x:\n    y\n# comment\n\nz\n");
    std::vector<TT> want = {
        TT::Name, TT::Name, TT::Op, TT::Newline,
        TT::Indent, TT::Name, TT::Newline,
        TT::Dedent, TT::Name, TT::Newline, TT::End
    };
    assert(toks.size() == want.size());
    for (size_t i = 0; i < want.size(); ++i) assert(toks[i].type == want[i]);
    assert(toks[8].s == "z" && toks[8].line == 5);
}

TEST(lex_brackets_join_lines) {
    auto toks = lex("xs = [1,\n      2]\n");
    size_t newlines = 0;
    for (const auto& t : toks) if (t.is(TT::Newline)) ++newlines;
    assert(newlines == 1);
}

TEST(lex_strings_and_escapes) {
    auto toks = lex("'a\\tb' r'a\\tb' \"\"\"x\ny\"\"\" '\\x41\\u00e9'");
    assert(toks[0].is(TT::Str) && toks[0].s == "a\tb");
    assert(toks[1].is(TT::Str) && toks[1].s == "a\\tb");
    assert(toks[2].is(TT::Str) && toks[2].s == "x\ny");
    assert(toks[3].is(TT::Str) && toks[3].s == "A\xc3\xa9");
    auto f = lex("f'{x}'");
    assert(f[0].is(TT::FStr));
}

TEST(lex_floats) {
    auto toks = lex("1.5 2e3 .25");
    assert(toks[0].is(TT::Float) && toks[0].fval == 1.5);
    assert(toks[1].is(TT::Float) && toks[1].fval == 2000.0);
    assert(toks[2].is(TT::Float) && toks[2].fval == 0.25);
}

TEST(lex_errors) {
    assert(syntax_error("x = 007") == "SyntaxError: leading zeros in decimal integer literals are not permitted (line 1)");
    assert(syntax_error("x = b'raw'") == "SyntaxError: bytes literals are not supported (line 1)");
    assert(syntax_error("x = 'open") == "SyntaxError: unterminated string literal (line 1)");
    assert(syntax_error("print(1))") == "SyntaxError: unmatched ')' (line 1)");
    assert(syntax_error("x = (1,\n2") == "SyntaxError: '(' was never closed (line 1)");
    assert(syntax_error("x = 99999999999999999999") == "SyntaxError: integer literal too large (line 1)");
}

TEST(keywords) {
    assert(is_keyword("lambda"));
    assert(is_keyword("import"));
    assert(!is_keyword("print"));
    assert(!is_keyword("len"));
}

// ============================================================================
// Parser
// ============================================================================

TEST(parse_program_shape) {
    auto prog = parse("x = 1\nif x:\n    print(x)\nelse:\n    pass\n");
    assert(prog->body.size() == 2);
    assert(std::dynamic_pointer_cast<AstAssign>(prog->body[0]) != nullptr);
    auto branch = std::dynamic_pointer_cast<AstIf>(prog->body[1]);
    assert(branch != nullptr);
    assert(branch->branches.size() == 1);
    assert(branch->orelse.size() == 1);
}

TEST(parse_semicolons_and_single_line_suites) {
    auto prog = parse("a = 1; b = 2\nif a: print(a); print(b)\n");
    assert(prog->body.size() == 3);
    auto branch = std::dynamic_pointer_cast<AstIf>(prog->body[2]);
    assert(branch && branch->branches[0].second.size() == 2);
}

TEST(parse_function_declaration) {
    auto prog = parse("def f(a, b=2, c=3):\n    global g\n    return a\n");
    auto def = std::dynamic_pointer_cast<AstFunctionDef>(prog->body[0]);
    assert(def != nullptr);
    assert(def->decl->name == "f");
    assert(def->decl->params.size() == 3);
    assert(def->decl->defaults.size() == 2);
    assert(def->decl->globals.count("g") == 1);
}

TEST(parse_expression_entry) {
    auto e = parse_expression("a + 1", 1);
    assert(std::dynamic_pointer_cast<AstBinChain>(e) != nullptr);
    auto c = parse_expression("x if y else z", 1);
    assert(std::dynamic_pointer_cast<AstIfExp>(c) != nullptr);
}

TEST(statement_placement) {
    assert(syntax_error("break") == "SyntaxError: 'break' outside loop (line 1)");
    assert(syntax_error("x = 1\ncontinue") == "SyntaxError: 'continue' not properly in loop (line 2)");
    assert(syntax_error("return 5") == "SyntaxError: 'return' outside function (line 1)");
    assert(syntax_error("while True:\n    def f():\n        break\n") == "SyntaxError: 'break' outside loop (line 3)");
    assert(syntax_error("for i in range(3):\n    break\n") == "");
}

TEST(parameter_rules) {
    assert(syntax_error("def f(a, a):\n    pass") == "SyntaxError: duplicate argument 'a' in function definition (line 1)");
    assert(syntax_error("def f(a=1, b):\n    pass")
           == "SyntaxError: parameter without a default follows parameter with a default (line 1)");
    assert(syntax_error("def f(*args):\n    pass") == "SyntaxError: variadic parameters are not supported (line 1)");
}

TEST(call_argument_rules) {
    assert(syntax_error("f(a=1, a=2)") == "SyntaxError: keyword argument repeated: a (line 1)");
    assert(syntax_error("f(a=1, 2)") == "SyntaxError: positional argument follows keyword argument (line 1)");
    assert(syntax_error("f(*xs)") == "SyntaxError: argument unpacking is not supported (line 1)");
}

TEST(unsupported_constructs) {
    assert(syntax_error("class A:\n    pass") == "SyntaxError: 'class' is not supported (line 1)");
    assert(syntax_error("with x:\n    pass") == "SyntaxError: 'with' is not supported (line 1)");
    assert(syntax_error("s = {1, 2}") == "SyntaxError: set literals are not supported (line 1)");
    assert(syntax_error("d = {k: 1 for k in 'ab'}") == "SyntaxError: dict comprehensions are not supported (line 1)");
}

TEST(invalid_targets) {
    assert(starts_with_text(syntax_error("1 = x"), "SyntaxError: cannot assign to "));
    assert(starts_with_text(syntax_error("f() += 1"), "SyntaxError: "));
    assert(starts_with_text(syntax_error("del 1"), "SyntaxError: cannot delete "));
}

TEST(indentation_errors) {
    assert(starts_with_text(syntax_error("if True:\nprint(1)"), "IndentationError: expected an indented block after "));
    assert(syntax_error("if True:\n    x = 1\n  y = 2")
           == "IndentationError: unindent does not match any outer indentation level (line 3)");
    assert(syntax_error("x = 1\n    y = 2") == "IndentationError: unexpected indent (line 2)");
}

TEST(nesting_is_bounded) {
    std::string deep = std::string(150, '(') + "1" + std::string(150, ')');
    assert(syntax_error("x = " + deep) == "SyntaxError: too many nested parentheses (line 1)");
    std::string shallow = std::string(10, '(') + "1" + std::string(10, ')');
    assert(syntax_error("x = " + shallow) == "");

    std::string nested_lists = std::string(400, '[') + std::string(400, ']');
    assert(starts_with_text(syntax_error(nested_lists), "SyntaxError: too many nested parentheses"));
}

TEST(f_string_errors) {
    assert(syntax_error("f'{}'") == "SyntaxError: f-string: empty expression not allowed (line 1)");
    assert(syntax_error("f'{x'") == "SyntaxError: f-string: expecting '}' (line 1)");
    assert(syntax_error("f'}'") == "SyntaxError: f-string: single '}' is not allowed (line 1)");
    assert(syntax_error("f'{x!z}'")
           == "SyntaxError: f-string: invalid conversion character: expected 's', 'r', or 'a' (line 1)");
}

TEST(imports_parse_then_fail_at_runtime) {
    assert(syntax_error("import os, sys as s") == "");
    assert(syntax_error("from . import x") == "");
    assert(syntax_error("from os.path import (join, split)") == "");
    auto r = execute("x = 1\nimport os");
    assert(r.text == "Error: ImportError: __import__ not found");
}

int main() {
    std::cout << "=== Parser Tests ===\n\n";

    RUN_TEST(lex_simple_assignment);
    RUN_TEST(lex_indentation);
    RUN_TEST(lex_brackets_join_lines);
    RUN_TEST(lex_strings_and_escapes);
    RUN_TEST(lex_floats);
    RUN_TEST(lex_errors);
    RUN_TEST(keywords);

    RUN_TEST(parse_program_shape);
    RUN_TEST(parse_semicolons_and_single_line_suites);
    RUN_TEST(parse_function_declaration);
    RUN_TEST(parse_expression_entry);
    RUN_TEST(statement_placement);
    RUN_TEST(parameter_rules);
    RUN_TEST(call_argument_rules);
    RUN_TEST(unsupported_constructs);
    RUN_TEST(invalid_targets);
    RUN_TEST(indentation_errors);
    RUN_TEST(nesting_is_bounded);
    RUN_TEST(f_string_errors);
    RUN_TEST(imports_parse_then_fail_at_runtime);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Total:  " << total << "\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
