#ifndef _CodeAssist_utils_h_
#define _CodeAssist_utils_h_

// String utilities
std::string trim_copy(const std::string& s);

// Argument utilities
size_t parse_size_arg(const std::string& s, const char* ctx);

// UTF-8 utilities; invalid lead bytes count as single characters
bool is_ascii(const std::string& s);
size_t utf8_length(const std::string& s);
std::vector<std::string> utf8_chars(const std::string& s);
// Character index of the byte offset `byte_pos`.
size_t utf8_index_of(const std::string& s, size_t byte_pos);
std::string utf8_encode(uint32_t cp);

// File utilities
std::string read_text_file(const std::string& path);

#endif
