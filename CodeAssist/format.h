#ifndef _CodeAssist_format_h_
#define _CodeAssist_format_h_

namespace Sandbox {

// Shortest text that reads back as `d` ("0.1", "3.0", "1e+16").
std::string format_float(double d);

// Quoted, escaped string literal as repr() renders it.
std::string quote_string(const std::string& s);

// [[fill]align][sign][#][0][width][,|_][.precision][type]
struct FormatSpec {
    char fill = ' ';
    char align = 0;
    char sign = '-';
    bool alt = false;
    bool zero = false;
    size_t width = 0;
    char grouping = 0;
    int precision = -1;
    char type = 0;

    static FormatSpec parse(const std::string& spec);
};

// f-string replacement field formatting.
std::string format_value(const Value& v, const std::string& spec);

// printf-style `fmt % args`.
std::string percent_format(const std::string& fmt, const Value& args);

} // namespace Sandbox

#endif
