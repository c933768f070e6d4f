#include "CodeAssist.h"

namespace Sandbox {

const char* token_type_name(Token::Type t){
    switch(t){
        case Token::Type::Name: return "name";
        case Token::Type::Int: return "integer";
        case Token::Type::Float: return "float";
        case Token::Type::Str: return "string";
        case Token::Type::FStr: return "f-string";
        case Token::Type::Op: return "operator";
        case Token::Type::Newline: return "newline";
        case Token::Type::Indent: return "indent";
        case Token::Type::Dedent: return "dedent";
        case Token::Type::End: return "end of input";
    }
    return "?";
}

bool is_keyword(const std::string& s){
    static const std::set<std::string> kws = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break",
        "class", "continue", "def", "del", "elif", "else", "except", "finally",
        "for", "from", "global", "if", "import", "in", "is", "lambda", "nonlocal",
        "not", "or", "pass", "raise", "return", "try", "while", "with", "yield"
    };
    return kws.count(s) > 0;
}

namespace {

const char* const kOperators[] = {
    "**=", "//=", ">>=", "<<=", "...",
    "**", "//", "==", "!=", "<=", ">=", "<<", ">>", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+", "-", "*", "/", "%", "&", "|", "^", "~", "<", ">",
    "(", ")", "[", "]", "{", "}", ",", ":", ".", ";", "=", "@"
};

bool ident_start(unsigned char c){ return std::isalpha(c) || c == '_' || c >= 0x80; }
bool ident_char(unsigned char c){ return std::isalnum(c) || c == '_' || c >= 0x80; }

class Lexer {
public:
    explicit Lexer(const std::string& s) : src(s) {}

    std::vector<Token> run(){
        TRACE_FN("bytes=", src.size());
        indents.push_back(0);
        while(pos < src.size()){
            if(at_line_start && brackets.empty()){
                if(!scanIndent()) continue;
            }
            scanToken();
        }
        if(!brackets.empty()){
            const auto& open = brackets.back();
            throw SyntaxFault(std::string("'") + open.first + "' was never closed", open.second);
        }
        if(!out.empty() && !out.back().is(Token::Type::Newline)) emit(Token::Type::Newline, "");
        while(indents.size() > 1){
            indents.pop_back();
            emit(Token::Type::Dedent, "");
        }
        emit(Token::Type::End, "");
        return std::move(out);
    }

private:
    const std::string& src;
    size_t pos = 0;
    int line = 1;
    bool at_line_start = true;
    std::vector<size_t> indents;
    std::vector<std::pair<char, int>> brackets;
    std::vector<Token> out;

    Token& emit(Token::Type t, std::string s){
        Token tk;
        tk.type = t;
        tk.s = std::move(s);
        tk.line = line;
        out.push_back(std::move(tk));
        return out.back();
    }

    // Measures the indentation of a new logical line. Returns false when
    // the line is blank or a comment, which produces no tokens.
    bool scanIndent(){
        size_t col = 0;
        while(pos < src.size() && (src[pos] == ' ' || src[pos] == '\t' || src[pos] == '\f')){
            if(src[pos] == '\t') col = (col / 8 + 1) * 8;
            else if(src[pos] == ' ') ++col;
            ++pos;
        }
        if(pos >= src.size()) return false;
        char c = src[pos];
        if(c == '#'){
            while(pos < src.size() && src[pos] != '\n') ++pos;
            return false;
        }
        if(c == '\r' || c == '\n'){
            if(c == '\r' && pos + 1 < src.size() && src[pos + 1] == '\n') ++pos;
            ++pos;
            ++line;
            return false;
        }
        at_line_start = false;
        if(col > indents.back()){
            indents.push_back(col);
            emit(Token::Type::Indent, "");
        } else if(col < indents.back()){
            while(col < indents.back()){
                indents.pop_back();
                emit(Token::Type::Dedent, "");
            }
            if(col != indents.back())
                throw SyntaxFault("unindent does not match any outer indentation level", line, "IndentationError");
        }
        return true;
    }

    void newline(){
        if(brackets.empty()){
            if(!out.empty() && !out.back().is(Token::Type::Newline)
               && !out.back().is(Token::Type::Indent) && !out.back().is(Token::Type::Dedent))
                emit(Token::Type::Newline, "");
            at_line_start = true;
        }
        ++line;
    }

    void scanToken(){
        char c = src[pos];
        if(c == ' ' || c == '\t' || c == '\f'){ ++pos; return; }
        if(c == '#'){
            while(pos < src.size() && src[pos] != '\n') ++pos;
            return;
        }
        if(c == '\r'){
            ++pos;
            if(pos < src.size() && src[pos] == '\n') ++pos;
            newline();
            return;
        }
        if(c == '\n'){ ++pos; newline(); return; }
        if(c == '\\'){
            size_t n = pos + 1;
            if(n < src.size() && src[n] == '\r') ++n;
            if(n < src.size() && src[n] == '\n'){
                pos = n + 1;
                ++line;
                return;
            }
            throw SyntaxFault("unexpected character after line continuation character", line);
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if(std::isdigit(uc) || (c == '.' && pos + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[pos + 1])))){
            scanNumber();
            return;
        }
        if(ident_start(uc)){
            size_t start = pos;
            while(pos < src.size() && ident_char(static_cast<unsigned char>(src[pos]))) ++pos;
            std::string word = src.substr(start, pos - start);
            if(pos < src.size() && (src[pos] == '\'' || src[pos] == '"') && isStringPrefix(word)){
                scanString(word);
                return;
            }
            emit(Token::Type::Name, std::move(word));
            return;
        }
        if(c == '\'' || c == '"'){
            scanString("");
            return;
        }
        for(const char* op : kOperators){
            size_t n = std::strlen(op);
            if(src.compare(pos, n, op) == 0){
                trackBracket(op[0]);
                emit(Token::Type::Op, op);
                pos += n;
                return;
            }
        }
        throw SyntaxFault("invalid syntax", line);
    }

    void trackBracket(char c){
        if(c == '(' || c == '[' || c == '{'){
            brackets.emplace_back(c, line);
            return;
        }
        if(c != ')' && c != ']' && c != '}') return;
        if(brackets.empty())
            throw SyntaxFault(std::string("unmatched '") + c + "'", line);
        char open = brackets.back().first;
        char want = open == '(' ? ')' : open == '[' ? ']' : '}';
        if(c != want)
            throw SyntaxFault(std::string("closing parenthesis '") + c
                              + "' does not match opening parenthesis '" + open + "'", line);
        brackets.pop_back();
    }

    static bool isStringPrefix(const std::string& w){
        std::string p;
        for(char ch : w) p.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        return p == "r" || p == "f" || p == "rf" || p == "fr" || p == "b" || p == "rb" || p == "br" || p == "u";
    }

    void scanNumber(){
        size_t start = pos;
        auto digits = [&](int base){
            size_t begin = pos;
            while(pos < src.size()){
                char d = src[pos];
                bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(d)) != 0
                        : base == 8 ? (d >= '0' && d <= '7')
                        : base == 2 ? (d == '0' || d == '1')
                        : std::isdigit(static_cast<unsigned char>(d)) != 0;
                if(ok){ ++pos; continue; }
                if(d == '_' && pos > begin && pos + 1 < src.size()){ ++pos; continue; }
                break;
            }
            return pos > begin;
        };
        auto strip = [](std::string s){
            s.erase(std::remove(s.begin(), s.end(), '_'), s.end());
            return s;
        };
        if(src[pos] == '0' && pos + 1 < src.size() && std::strchr("xXoObB", src[pos + 1])){
            char kind = static_cast<char>(std::tolower(static_cast<unsigned char>(src[pos + 1])));
            int base = kind == 'x' ? 16 : kind == 'o' ? 8 : 2;
            pos += 2;
            size_t body = pos;
            if(!digits(base)) throw SyntaxFault("invalid " + std::string(kind == 'x' ? "hexadecimal" : kind == 'o' ? "octal" : "binary") + " literal", line);
            finishInt(strip(src.substr(body, pos - body)), base);
            checkSuffix();
            return;
        }
        bool is_float = false;
        digits(10);
        if(pos < src.size() && src[pos] == '.'){
            is_float = true;
            ++pos;
            digits(10);
        }
        if(pos < src.size() && (src[pos] == 'e' || src[pos] == 'E')){
            size_t save = pos;
            ++pos;
            if(pos < src.size() && (src[pos] == '+' || src[pos] == '-')) ++pos;
            if(digits(10)) is_float = true;
            else pos = save;
        }
        std::string text = strip(src.substr(start, pos - start));
        if(is_float){
            Token& t = emit(Token::Type::Float, text);
            t.fval = std::strtod(text.c_str(), nullptr);
        } else {
            if(text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos)
                throw SyntaxFault("leading zeros in decimal integer literals are not permitted", line);
            finishInt(text, 10);
        }
        checkSuffix();
    }

    void finishInt(const std::string& digits, int base){
        errno = 0;
        unsigned long long v = std::strtoull(digits.c_str(), nullptr, base);
        if(errno == ERANGE || v > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max()))
            throw SyntaxFault("integer literal too large", line);
        Token& t = emit(Token::Type::Int, digits);
        t.ival = static_cast<int64_t>(v);
    }

    void checkSuffix(){
        if(pos < src.size()){
            unsigned char c = static_cast<unsigned char>(src[pos]);
            if(c == 'j' || c == 'J') throw SyntaxFault("complex literals are not supported", line);
            if(ident_char(c)) throw SyntaxFault("invalid decimal literal", line);
        }
    }

    void scanString(const std::string& prefix){
        bool raw = false, fmt = false;
        for(char ch : prefix){
            char l = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            if(l == 'r') raw = true;
            if(l == 'f') fmt = true;
            if(l == 'b') throw SyntaxFault("bytes literals are not supported", line);
        }
        char q = src[pos];
        bool triple = src.compare(pos, 3, std::string(3, q)) == 0;
        int start_line = line;
        pos += triple ? 3 : 1;
        std::string body;
        for(;;){
            if(pos >= src.size()){
                throw SyntaxFault(triple ? "unterminated triple-quoted string literal"
                                         : "unterminated string literal", start_line);
            }
            char c = src[pos];
            if(c == q){
                if(!triple){ ++pos; break; }
                if(src.compare(pos, 3, std::string(3, q)) == 0){ pos += 3; break; }
                body.push_back(c);
                ++pos;
                continue;
            }
            if(c == '\n'){
                if(!triple) throw SyntaxFault("unterminated string literal", start_line);
                ++line;
                body.push_back(c);
                ++pos;
                continue;
            }
            if(c == '\\' && pos + 1 < src.size()){
                if(raw){
                    body.push_back(c);
                    body.push_back(src[pos + 1]);
                    if(src[pos + 1] == '\n') ++line;
                    pos += 2;
                    continue;
                }
                pos = decodeEscape(pos + 1, body);
                continue;
            }
            body.push_back(c);
            ++pos;
        }
        Token& t = emit(fmt ? Token::Type::FStr : Token::Type::Str, std::move(body));
        t.line = start_line;
    }

    // `i` points past the backslash; returns the position after the escape.
    size_t decodeEscape(size_t i, std::string& body){
        char e = src[i];
        auto hex = [&](size_t n) -> uint32_t {
            uint32_t v = 0;
            for(size_t k = 1; k <= n; ++k){
                char h = i + k < src.size() ? src[i + k] : '\0';
                if(!std::isxdigit(static_cast<unsigned char>(h)))
                    throw SyntaxFault(std::string("truncated \\") + e + " escape", line);
                v = v * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(h)) ? h - '0' : (std::tolower(static_cast<unsigned char>(h)) - 'a' + 10));
            }
            return v;
        };
        switch(e){
            case 'n': body.push_back('\n'); return i + 1;
            case 't': body.push_back('\t'); return i + 1;
            case 'r': body.push_back('\r'); return i + 1;
            case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
                uint32_t v = 0;
                size_t k = i;
                while(k < src.size() && k < i + 3 && src[k] >= '0' && src[k] <= '7'){
                    v = v * 8 + static_cast<uint32_t>(src[k] - '0');
                    ++k;
                }
                body += utf8_encode(v);
                return k;
            }
            case 'a': body.push_back('\a'); return i + 1;
            case 'b': body.push_back('\b'); return i + 1;
            case 'f': body.push_back('\f'); return i + 1;
            case 'v': body.push_back('\v'); return i + 1;
            case '\\': body.push_back('\\'); return i + 1;
            case '\'': body.push_back('\''); return i + 1;
            case '"': body.push_back('"'); return i + 1;
            case '\n': ++line; return i + 1;
            case 'x': body += utf8_encode(hex(2)); return i + 3;
            case 'u': body += utf8_encode(hex(4)); return i + 5;
            case 'U': {
                uint32_t v = hex(8);
                if(v > 0x10FFFF) throw SyntaxFault("illegal Unicode character", line);
                body += utf8_encode(v);
                return i + 9;
            }
            default:
                body.push_back('\\');
                return i;
        }
    }
};

} // namespace

std::vector<Token> lex(const std::string& src){
    Lexer lx(src);
    return lx.run();
}

} // namespace Sandbox
