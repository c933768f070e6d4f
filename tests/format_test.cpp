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

static bool raises_value_error(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const RuntimeFault& e) {
        return e.type == "ValueError";
    }
    return false;
}

// ============================================================================
// repr / str rendering
// ============================================================================

TEST(float_rendering) {
    assert(format_float(0.1) == "0.1");
    assert(format_float(3.0) == "3.0");
    assert(format_float(-2.5) == "-2.5");
    assert(format_float(1e16) == "1e+16");
    assert(format_float(1.5e-7) == "1.5e-07");
    assert(format_float(0.0001) == "0.0001");
    assert(format_float(123456789.0) == "123456789.0");
    assert(format_float(1.0 / 3.0) == "0.3333333333333333");
    assert(format_float(std::numeric_limits<double>::infinity()) == "inf");
    assert(format_float(-std::numeric_limits<double>::infinity()) == "-inf");
    assert(format_float(std::nan("")) == "nan");
}

TEST(string_quoting) {
    assert(quote_string("abc") == "'abc'");
    assert(quote_string("it's") == "\"it's\"");
    assert(quote_string("both ' and \"") == "'both \\' and \"'");
    assert(quote_string("tab\there\n") == "'tab\\there\\n'");
    assert(quote_string(std::string("\x01", 1)) == "'\\x01'");
    assert(quote_string("back\\slash") == "'back\\\\slash'");
}

TEST(value_rendering) {
    assert(Value::None().repr() == "None");
    assert(Value::B(true).toStr() == "True");
    assert(Value::S("x").toStr() == "x");
    assert(Value::S("x").repr() == "'x'");
    assert(Value::L({Value::I(1), Value::S("a")}).repr() == "[1, 'a']");
    assert(Value::T({Value::F(2.0)}).repr() == "(2.0,)");
    assert(Value::R(0, 5, 1).repr() == "range(0, 5)");
    Value d = Value::D();
    d.dict().set(Value::S("k"), Value::L({}));
    assert(d.repr() == "{'k': []}");
}

// ============================================================================
// Format specs
// ============================================================================

TEST(format_spec_parsing) {
    FormatSpec fs = FormatSpec::parse("*^+#010,.3f");
    assert(fs.fill == '*');
    assert(fs.align == '^');
    assert(fs.sign == '+');
    assert(fs.alt);
    assert(fs.zero);
    assert(fs.width == 10);
    assert(fs.grouping == ',');
    assert(fs.precision == 3);
    assert(fs.type == 'f');

    FormatSpec plain = FormatSpec::parse("5");
    assert(plain.width == 5 && plain.align == 0 && plain.type == 0);

    assert(raises_value_error([]{ FormatSpec::parse(".f"); }));
    assert(raises_value_error([]{ FormatSpec::parse("5dd"); }));
}

TEST(integer_format_specs) {
    assert(format_value(Value::I(42), "") == "42");
    assert(format_value(Value::I(42), "5") == "   42");
    assert(format_value(Value::I(42), "<5") == "42   ");
    assert(format_value(Value::I(42), "^6") == "  42  ");
    assert(format_value(Value::I(-42), "05") == "-0042");
    assert(format_value(Value::I(1234567), ",") == "1,234,567");
    assert(format_value(Value::I(255), "x") == "ff");
    assert(format_value(Value::I(255), "#X") == "0XFF");
    assert(format_value(Value::I(5), "b") == "101");
    assert(format_value(Value::I(7), "+d") == "+7");
    assert(format_value(Value::I(3), ".2f") == "3.00");
}

TEST(float_format_specs) {
    assert(format_value(Value::F(3.14159), ".2f") == "3.14");
    assert(format_value(Value::F(2.5), "8.3f") == "   2.500");
    assert(format_value(Value::F(1234.5), ",.1f") == "1,234.5");
    assert(format_value(Value::F(0.25), ".0%") == "25%");
    assert(format_value(Value::F(12345.678), ".2e") == "1.23e+04");
    assert(format_value(Value::F(-1.5), "") == "-1.5");
    assert(format_value(Value::F(2.0), "g") == "2");
}

TEST(string_format_specs) {
    assert(format_value(Value::S("ab"), "5") == "ab   ");
    assert(format_value(Value::S("ab"), ">5") == "   ab");
    assert(format_value(Value::S("ab"), "-^6") == "--ab--");
    assert(format_value(Value::S("abcdef"), ".3") == "abc");
    assert(raises_value_error([]{ format_value(Value::S("x"), "d"); }));
}

TEST(unsupported_format_targets) {
    bool raised = false;
    try {
        format_value(Value::L({}), "5");
    } catch (const RuntimeFault& e) {
        raised = e.type == "TypeError";
    }
    assert(raised);
}

// ============================================================================
// printf-style formatting
// ============================================================================

TEST(percent_formatting) {
    assert(percent_format("%s=%d", Value::T({Value::S("n"), Value::I(5)})) == "n=5");
    assert(percent_format("%5s|%-5s|", Value::T({Value::S("a"), Value::S("b")})) == "    a|b    |");
    assert(percent_format("%.2f", Value::F(2.0 / 3.0)) == "0.67");
    assert(percent_format("%05d", Value::I(42)) == "00042");
    assert(percent_format("%x %o", Value::T({Value::I(255), Value::I(8)})) == "ff 10");
    assert(percent_format("%r", Value::S("q")) == "'q'");
    assert(percent_format("100%%", Value::T({})) == "100%");
}

TEST(percent_formatting_errors) {
    auto type_error_of = [](const std::string& fmt, const Value& args) {
        try {
            percent_format(fmt, args);
        } catch (const RuntimeFault& e) {
            return e.type + ": " + e.what();
        }
        return std::string();
    };
    assert(type_error_of("%s %s", Value::S("one")) == "TypeError: not enough arguments for format string");
    assert(type_error_of("%s", Value::T({Value::I(1), Value::I(2)}))
           == "TypeError: not all arguments converted during string formatting");
    assert(type_error_of("%d", Value::S("x")) == "TypeError: %d format: a real number is required, not str");
}

TEST(formatting_through_the_sandbox) {
    auto r = execute("name = 'ada'\nprint('%s has %d items' % (name, 3))\nprint(f'{name!r:>7}|{3.5:.1f}')");
    assert(r.text == "ada has 3 items\n  'ada'|3.5\n");
}

// ============================================================================
// UTF-8 helpers
// ============================================================================

TEST(utf8_helpers) {
    const std::string s = "h\xc3\xa9llo";
    assert(utf8_length(s) == 5);
    auto chars = utf8_chars(s);
    assert(chars.size() == 5);
    assert(chars[1] == "\xc3\xa9");
    assert(utf8_encode(0x41) == "A");
    assert(utf8_encode(0xe9) == "\xc3\xa9");
    assert(is_ascii("plain"));
    assert(!is_ascii(s));
    assert(trim_copy("  x y \n") == "x y");
    auto r = execute("s = 'h\xc3\xa9llo'\nprint(len(s), s[1], s[::-1])");
    assert(r.text == "5 \xc3\xa9 oll\xc3\xa9h\n");
}

int main() {
    std::cout << "=== Format Tests ===\n\n";

    RUN_TEST(float_rendering);
    RUN_TEST(string_quoting);
    RUN_TEST(value_rendering);

    RUN_TEST(format_spec_parsing);
    RUN_TEST(integer_format_specs);
    RUN_TEST(float_format_specs);
    RUN_TEST(string_format_specs);
    RUN_TEST(unsupported_format_targets);

    RUN_TEST(percent_formatting);
    RUN_TEST(percent_formatting_errors);
    RUN_TEST(formatting_through_the_sandbox);

    RUN_TEST(utf8_helpers);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Total:  " << total << "\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
