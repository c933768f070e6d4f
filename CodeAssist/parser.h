#ifndef _CodeAssist_parser_h_
#define _CodeAssist_parser_h_

namespace Sandbox {

// Parses a whole module. Throws SyntaxFault with the offending line.
// `max_nesting` bounds bracket and block nesting.
std::shared_ptr<Program> parse(const std::string& src, size_t max_nesting = 100);

// Parses the expression inside an f-string replacement field.
ExprPtr parse_expression(const std::string& src, int line, size_t max_nesting = 100);

} // namespace Sandbox

#endif
