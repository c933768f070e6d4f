#include "CodeAssist.h"

namespace Sandbox {

std::string format_float(double d){
    if(std::isnan(d)) return "nan";
    if(std::isinf(d)) return d > 0 ? "inf" : "-inf";
    if(d == 0.0) return std::signbit(d) ? "-0.0" : "0.0";

    // shortest scientific form that round-trips
    char buf[48];
    for(int prec = 0; prec <= 16; ++prec){
        std::snprintf(buf, sizeof buf, "%.*e", prec, d);
        if(std::strtod(buf, nullptr) == d) break;
    }
    std::string s = buf;
    bool neg = s[0] == '-';
    if(neg) s.erase(0, 1);
    size_t epos = s.find('e');
    int exp = std::atoi(s.c_str() + epos + 1);
    std::string digits = s.substr(0, epos);
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    while(digits.size() > 1 && digits.back() == '0') digits.pop_back();

    std::string out;
    if(exp >= -4 && exp < 16){
        if(exp >= 0){
            size_t ilen = static_cast<size_t>(exp) + 1;
            if(digits.size() > ilen) out = digits.substr(0, ilen) + "." + digits.substr(ilen);
            else out = digits + std::string(ilen - digits.size(), '0') + ".0";
        } else {
            out = "0." + std::string(static_cast<size_t>(-exp - 1), '0') + digits;
        }
    } else {
        out = digits.substr(0, 1);
        if(digits.size() > 1) out += "." + digits.substr(1);
        char eb[16];
        std::snprintf(eb, sizeof eb, "e%c%02d", exp < 0 ? '-' : '+', std::abs(exp));
        out += eb;
    }
    return neg ? "-" + out : out;
}

std::string quote_string(const std::string& s){
    char q = '\'';
    if(s.find('\'') != std::string::npos && s.find('"') == std::string::npos) q = '"';
    std::string out(1, q);
    for(unsigned char c : s){
        switch(c){
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c == static_cast<unsigned char>(q)){
                    out.push_back('\\');
                    out.push_back(static_cast<char>(c));
                } else if(c < 0x20 || c == 0x7f){
                    char hex[8];
                    std::snprintf(hex, sizeof hex, "\\x%02x", c);
                    out += hex;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back(q);
    return out;
}

// ====== Format spec ======
static bool is_align(char c){ return c == '<' || c == '>' || c == '=' || c == '^'; }

FormatSpec FormatSpec::parse(const std::string& spec){
    FormatSpec fs;
    size_t i = 0;
    if(spec.size() >= 2 && is_align(spec[1])){
        fs.fill = spec[0];
        fs.align = spec[1];
        i = 2;
    } else if(!spec.empty() && is_align(spec[0])){
        fs.align = spec[0];
        i = 1;
    }
    if(i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) fs.sign = spec[i++];
    if(i < spec.size() && spec[i] == '#'){ fs.alt = true; ++i; }
    if(i < spec.size() && spec[i] == '0'){ fs.zero = true; ++i; }
    size_t wstart = i;
    while(i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) ++i;
    if(i > wstart) fs.width = parse_size_arg(spec.substr(wstart, i - wstart), "format width");
    if(i < spec.size() && (spec[i] == ',' || spec[i] == '_')) fs.grouping = spec[i++];
    if(i < spec.size() && spec[i] == '.'){
        ++i;
        size_t pstart = i;
        while(i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) ++i;
        if(i == pstart) throw value_error("Format specifier missing precision");
        fs.precision = static_cast<int>(std::min<size_t>(parse_size_arg(spec.substr(pstart, i - pstart), "format precision"), 100));
    }
    if(i < spec.size()) fs.type = spec[i++];
    if(i < spec.size()) throw value_error("Invalid format specifier '" + spec + "'");
    return fs;
}

namespace {

std::string group_digits(const std::string& digits, char sep, size_t every){
    std::string out;
    size_t n = digits.size();
    for(size_t i = 0; i < n; ++i){
        out.push_back(digits[i]);
        size_t left = n - i - 1;
        if(left > 0 && left % every == 0) out.push_back(sep);
    }
    return out;
}

std::string pad(const FormatSpec& fs, const std::string& sign, const std::string& body, char default_align){
    size_t len = sign.size() + utf8_length(body);
    char align = fs.align;
    char fill = fs.fill;
    if(!align){
        if(fs.zero && default_align == '>'){ align = '='; fill = '0'; }
        else align = default_align;
    }
    if(fs.width <= len) return sign + body;
    std::string padding(fs.width - len, fill);
    switch(align){
        case '<': return sign + body + padding;
        case '=': return sign + padding + body;
        case '^': {
            size_t left = padding.size() / 2;
            return padding.substr(0, left) + sign + body + padding.substr(left);
        }
        default: return padding + sign + body;
    }
}

std::string sign_of(bool negative, char mode){
    if(negative) return "-";
    if(mode == '+') return "+";
    if(mode == ' ') return " ";
    return "";
}

std::string format_integer(int64_t x, const FormatSpec& fs){
    bool neg = x < 0;
    uint64_t mag = neg ? (0 - static_cast<uint64_t>(x)) : static_cast<uint64_t>(x);
    std::string digits, prefix;
    unsigned base = 10;
    switch(fs.type){
        case 'x': case 'X': base = 16; prefix = fs.alt ? (fs.type == 'x' ? "0x" : "0X") : ""; break;
        case 'o': base = 8; prefix = fs.alt ? "0o" : ""; break;
        case 'b': base = 2; prefix = fs.alt ? "0b" : ""; break;
        case 'c':
            if(x < 0 || x > 0x10FFFF) throw RuntimeFault("OverflowError", "%c arg not in range(0x110000)");
            return pad(fs, "", utf8_encode(static_cast<uint32_t>(x)), '<');
        default: break;
    }
    const char* alphabet = fs.type == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
    do { digits.insert(digits.begin(), alphabet[mag % base]); mag /= base; } while(mag);
    if(fs.grouping) digits = group_digits(digits, fs.grouping, base == 10 ? 3 : 4);
    return pad(fs, sign_of(neg, fs.sign) + prefix, digits, '>');
}

std::string format_floating(double d, const FormatSpec& fs){
    bool neg = std::signbit(d) && !std::isnan(d);
    double mag = std::fabs(d);
    int prec = fs.precision < 0 ? 6 : fs.precision;
    char buf[512];
    std::string body;
    char type = fs.type;
    bool percent = false;
    if(type == '%'){ mag *= 100.0; type = 'f'; percent = true; }
    switch(type){
        case 'f': case 'F':
            std::snprintf(buf, sizeof buf, fs.alt ? "%#.*f" : "%.*f", prec, mag);
            body = buf;
            break;
        case 'e': case 'E':
            std::snprintf(buf, sizeof buf, fs.alt ? "%#.*e" : "%.*e", prec, mag);
            body = buf;
            break;
        case 'g': case 'G':
            std::snprintf(buf, sizeof buf, fs.alt ? "%#.*g" : "%.*g", prec == 0 ? 1 : prec, mag);
            body = buf;
            break;
        default:
            if(fs.precision < 0){
                body = format_float(mag);
            } else {
                std::snprintf(buf, sizeof buf, "%.*g", prec == 0 ? 1 : prec, mag);
                body = buf;
                if(body.find_first_of(".en") == std::string::npos) body += ".0";
            }
            break;
    }
    if(type == 'F' || type == 'E' || type == 'G')
        std::transform(body.begin(), body.end(), body.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if(fs.grouping && std::isfinite(mag)){
        size_t end = body.find_first_of(".eE");
        if(end == std::string::npos) end = body.size();
        body = group_digits(body.substr(0, end), fs.grouping, 3) + body.substr(end);
    }
    if(percent) body += "%";
    return pad(fs, sign_of(neg, fs.sign), body, '>');
}

std::string format_text(const std::string& s, const FormatSpec& fs){
    std::string body = s;
    if(fs.precision >= 0 && utf8_length(body) > static_cast<size_t>(fs.precision)){
        auto chars = utf8_chars(body);
        body.clear();
        for(int i = 0; i < fs.precision; ++i) body += chars[static_cast<size_t>(i)];
    }
    return pad(fs, "", body, '<');
}

} // namespace

std::string format_value(const Value& v, const std::string& spec){
    if(spec.empty()) return v.toStr();
    FormatSpec fs = FormatSpec::parse(spec);
    if(v.isStr()){
        if(fs.type && fs.type != 's')
            throw value_error(std::string("Unknown format code '") + fs.type + "' for object of type 'str'");
        if(fs.sign != '-') throw value_error("Sign not allowed in string format specifier");
        return format_text(v.str(), fs);
    }
    if(v.isIntLike()){
        switch(fs.type){
            case 0: case 'd': case 'n': case 'x': case 'X': case 'o': case 'b': case 'c':
                return format_integer(v.asInt(), fs);
            case 'f': case 'F': case 'e': case 'E': case 'g': case 'G': case '%':
                return format_floating(v.asFloat(), fs);
            default:
                throw value_error(std::string("Unknown format code '") + fs.type + "' for object of type 'int'");
        }
    }
    if(v.isFloat()){
        switch(fs.type){
            case 0: case 'f': case 'F': case 'e': case 'E': case 'g': case 'G': case '%':
                return format_floating(v.asFloat(), fs);
            default:
                throw value_error(std::string("Unknown format code '") + fs.type + "' for object of type 'float'");
        }
    }
    throw type_error(std::string("unsupported format string passed to ") + v.typeName() + ".__format__");
}

// ====== printf-style ======
std::string percent_format(const std::string& fmt, const Value& args){
    Value::Items items;
    if(args.isTuple()) items = args.tuple().items;
    else items.push_back(args);
    size_t next = 0;
    auto take = [&]() -> const Value& {
        if(next >= items.size()) throw type_error("not enough arguments for format string");
        return items[next++];
    };

    std::string out;
    for(size_t i = 0; i < fmt.size(); ++i){
        char c = fmt[i];
        if(c != '%'){ out.push_back(c); continue; }
        if(++i >= fmt.size()) throw value_error("incomplete format");
        if(fmt[i] == '%'){ out.push_back('%'); continue; }

        FormatSpec fs;
        bool left = false;
        for(; i < fmt.size(); ++i){
            char f = fmt[i];
            if(f == '-') left = true;
            else if(f == '+') fs.sign = '+';
            else if(f == ' '){ if(fs.sign != '+') fs.sign = ' '; }
            else if(f == '#') fs.alt = true;
            else if(f == '0') fs.zero = true;
            else break;
        }
        size_t wstart = i;
        while(i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) ++i;
        if(i > wstart) fs.width = parse_size_arg(fmt.substr(wstart, i - wstart), "format width");
        if(i < fmt.size() && fmt[i] == '.'){
            size_t pstart = ++i;
            while(i < fmt.size() && std::isdigit(static_cast<unsigned char>(fmt[i]))) ++i;
            fs.precision = i > pstart ? static_cast<int>(std::min<size_t>(parse_size_arg(fmt.substr(pstart, i - pstart), "format precision"), 100)) : 0;
        }
        if(i >= fmt.size()) throw value_error("incomplete format");
        if(left){ fs.align = '<'; fs.zero = false; }
        char conv = fmt[i];
        // printf-style text is right-aligned unless '-' is given
        if(!left && (conv == 's' || conv == 'r' || conv == 'c')) fs.align = '>';
        const Value& arg = take();
        switch(conv){
            case 's': fs.type = 0; out += format_text(arg.toStr(), fs); break;
            case 'r': fs.type = 0; out += format_text(arg.repr(), fs); break;
            case 'd': case 'i': case 'u':
                if(!arg.isNumber()) throw type_error(std::string("%") + conv + " format: a real number is required, not " + arg.typeName());
                fs.type = 'd';
                if(fs.precision >= 0) fs.precision = -1;
                if(arg.isFloat()){
                    double d = arg.asFloat();
                    if(!std::isfinite(d) || std::fabs(d) >= 9.2e18) throw RuntimeFault("OverflowError", "cannot convert float to integer");
                    out += format_integer(static_cast<int64_t>(d), fs);
                } else {
                    out += format_integer(arg.asInt(), fs);
                }
                break;
            case 'x': case 'X': case 'o':
                if(!arg.isIntLike()) throw type_error(std::string("%") + conv + " format: an integer is required, not " + arg.typeName());
                fs.type = conv;
                out += format_integer(arg.asInt(), fs);
                break;
            case 'f': case 'F': case 'e': case 'E': case 'g': case 'G':
                if(!arg.isNumber()) throw type_error(std::string("must be real number, not ") + arg.typeName());
                fs.type = conv;
                out += format_floating(arg.asFloat(), fs);
                break;
            case 'c':
                if(arg.isStr() && utf8_length(arg.str()) == 1){ out += format_text(arg.str(), fs); break; }
                if(!arg.isIntLike()) throw type_error("%c requires an int or a unicode character, not " + std::string(arg.typeName()));
                fs.type = 'c';
                out += format_integer(arg.asInt(), fs);
                break;
            default:
                throw value_error(std::string("unsupported format character '") + conv + "'");
        }
    }
    if(next < items.size()) throw type_error("not all arguments converted during string formatting");
    return out;
}

} // namespace Sandbox
