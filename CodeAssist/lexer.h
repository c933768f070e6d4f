#ifndef _CodeAssist_lexer_h_
#define _CodeAssist_lexer_h_

namespace Sandbox {

//
// Tokens of the dialect
//
struct Token {
    enum class Type { Name, Int, Float, Str, FStr, Op, Newline, Indent, Dedent, End };
    Type type = Type::End;
    std::string s;       // identifier, operator, or decoded string body
    int64_t ival = 0;
    double fval = 0.0;
    int line = 0;

    bool is(Type t) const { return type == t; }
    bool isOp(const char* op) const { return type == Type::Op && s == op; }
    bool isName(const char* kw) const { return type == Type::Name && s == kw; }
};

const char* token_type_name(Token::Type t);

// Splits source into logical lines with INDENT/DEDENT markers.
// Throws SyntaxFault (or IndentationError) on malformed input.
std::vector<Token> lex(const std::string& src);

// Names that cannot be bound or called.
bool is_keyword(const std::string& s);

} // namespace Sandbox

#endif
