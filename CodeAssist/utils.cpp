#include "CodeAssist.h"

std::string trim_copy(const std::string& s){
    auto b = s.find_first_not_of(" \t\r\n");
    if(b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

size_t parse_size_arg(const std::string& s, const char* ctx){
    if(s.empty()) throw std::runtime_error(std::string(ctx) + " must be non-negative integer");
    size_t idx = 0;
    while(idx < s.size()){
        if(!std::isdigit(static_cast<unsigned char>(s[idx])))
            throw std::runtime_error(std::string(ctx) + " must be non-negative integer");
        ++idx;
    }
    try{
        return static_cast<size_t>(std::stoull(s));
    } catch(const std::exception&){
        throw std::runtime_error(std::string(ctx) + " out of range");
    }
}

static size_t utf8_seq_len(unsigned char c){
    if(c < 0x80) return 1;
    if((c & 0xE0) == 0xC0) return 2;
    if((c & 0xF0) == 0xE0) return 3;
    if((c & 0xF8) == 0xF0) return 4;
    return 1;
}

bool is_ascii(const std::string& s){
    for(unsigned char c : s) if(c >= 0x80) return false;
    return true;
}

size_t utf8_length(const std::string& s){
    if(is_ascii(s)) return s.size();
    size_t n = 0;
    for(size_t i = 0; i < s.size(); ++n)
        i += std::min(utf8_seq_len(static_cast<unsigned char>(s[i])), s.size() - i);
    return n;
}

std::vector<std::string> utf8_chars(const std::string& s){
    std::vector<std::string> out;
    out.reserve(s.size());
    for(size_t i = 0; i < s.size();){
        size_t len = std::min(utf8_seq_len(static_cast<unsigned char>(s[i])), s.size() - i);
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

size_t utf8_index_of(const std::string& s, size_t byte_pos){
    size_t n = 0;
    for(size_t i = 0; i < s.size() && i < byte_pos; ++n)
        i += std::min(utf8_seq_len(static_cast<unsigned char>(s[i])), s.size() - i);
    return n;
}

std::string utf8_encode(uint32_t cp){
    std::string out;
    if(cp < 0x80){
        out.push_back(static_cast<char>(cp));
    } else if(cp < 0x800){
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if(cp < 0x10000){
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string read_text_file(const std::string& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("failed to open '" + path + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
