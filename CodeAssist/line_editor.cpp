#include "CodeAssist.h"

// ====== History ======
InputHistory::InputHistory(std::optional<std::filesystem::path> file) : path(std::move(file)) {
    if(!path) return;
    std::ifstream in(*path);
    std::string line;
    while(in && std::getline(in, line)){
        if(trim_copy(line).empty()) continue;
        if(!lines.empty() && lines.back() == line) continue;
        lines.push_back(line);
    }
    if(lines.size() > kLimit) lines.erase(lines.begin(), lines.end() - kLimit);
}

std::optional<std::filesystem::path> InputHistory::default_path(){
    if(const char* env = std::getenv("CODEASSIST_HISTORY_FILE"); env && *env)
        return std::filesystem::path(env);
    if(const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".codeassist_history";
    return std::nullopt;
}

void InputHistory::record(const std::string& line){
    if(trim_copy(line).empty()) return;
    if(!lines.empty() && lines.back() == line) return;
    lines.push_back(line);
    if(lines.size() > kLimit) lines.erase(lines.begin());
    dirty = true;
}

// Written to a sibling file first so an interrupted write keeps the old history.
bool InputHistory::flush(){
    if(!dirty || !path) return true;
    std::error_code ec;
    if(auto parent = path->parent_path(); !parent.empty())
        std::filesystem::create_directories(parent, ec);
    auto tmp = *path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if(!out) return false;
        for(const auto& l : lines) out << l << '\n';
        if(!out.flush()) return false;
    }
    std::filesystem::rename(tmp, *path, ec);
    if(ec){
        std::filesystem::remove(tmp, ec);
        return false;
    }
    dirty = false;
    return true;
}

// ====== Terminal ======
namespace {

bool interactive_terminal(){
    return ::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1;
}

// Byte-at-a-time input without echo or signal keys while alive; Ctrl-C
// and Ctrl-D arrive as plain bytes.
class RawInput {
public:
    RawInput(){
        if(tcgetattr(STDIN_FILENO, &saved) != 0) return;
        termios raw = saved;
        raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG | IEXTEN));
        raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
        raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active = tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0;
    }
    ~RawInput(){
        if(active) tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
    }
    RawInput(const RawInput&) = delete;
    RawInput& operator=(const RawInput&) = delete;

    explicit operator bool() const { return active; }

private:
    termios saved{};
    bool active = false;
};

} // namespace

static void redraw_prompt_line(const std::string& prompt, const std::string& buffer, size_t cursor){
    std::cout << '\r' << prompt << buffer << "\x1b[K";
    if(cursor < buffer.size()){
        size_t tail = buffer.size() - cursor;
        std::cout << "\x1b[" << tail << 'D';
    }
    std::cout.flush();
}

bool read_line_with_history(const std::string& prompt, std::string& out,
                            const InputHistory& recalled){
    std::cout << prompt;
    std::cout.flush();

    if(!interactive_terminal()){
        return static_cast<bool>(std::getline(std::cin, out));
    }

    RawInput raw;
    if(!raw){
        return static_cast<bool>(std::getline(std::cin, out));
    }

    const auto& history = recalled.entries();

    std::string buffer;
    size_t cursor = 0;
    size_t history_pos = history.size();
    std::string saved_new_entry;
    bool saved_valid = false;

    auto redraw_current = [&](){
        redraw_prompt_line(prompt, buffer, cursor);
    };
    // any edit detaches the buffer from the recalled history entry
    auto edited = [&](){
        redraw_current();
        if(history_pos != history.size()){
            history_pos = history.size();
            saved_valid = false;
        }
    };

    while(true){
        unsigned char ch = 0;
        ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if(n <= 0){
            std::cout << "\r\n";
            return false;
        }

        if(ch == '\r' || ch == '\n'){
            std::cout << "\r\n";
            out = buffer;
            return true;
        }

        if(ch == 3){ // Ctrl-C
            std::cout << "^C\r\n";
            buffer.clear();
            cursor = 0;
            history_pos = history.size();
            saved_valid = false;
            std::cout << prompt;
            std::cout.flush();
            continue;
        }

        if(ch == 4){ // Ctrl-D
            if(buffer.empty()){
                std::cout << "\r\n";
                return false;
            }
            if(cursor < buffer.size()){
                buffer.erase(cursor, 1);
                edited();
            }
            continue;
        }

        if(ch == 9){ // Tab
            buffer.insert(cursor, 4, ' ');
            cursor += 4;
            edited();
            continue;
        }

        if(ch == 127 || ch == 8){ // backspace
            if(cursor > 0){
                buffer.erase(cursor - 1, 1);
                --cursor;
                edited();
            }
            continue;
        }

        if(ch == 1){ // Ctrl-A
            if(cursor != 0){
                cursor = 0;
                redraw_current();
            }
            continue;
        }

        if(ch == 5){ // Ctrl-E
            if(cursor != buffer.size()){
                cursor = buffer.size();
                redraw_current();
            }
            continue;
        }

        if(ch == 21){ // Ctrl-U
            if(cursor > 0){
                buffer.erase(0, cursor);
                cursor = 0;
                edited();
            }
            continue;
        }

        if(ch == 11){ // Ctrl-K
            if(cursor < buffer.size()){
                buffer.erase(cursor);
                edited();
            }
            continue;
        }

        if(ch == 27){ // escape sequences
            unsigned char seq1 = 0;
            if(::read(STDIN_FILENO, &seq1, 1) <= 0) continue;
            if(seq1 != '[') continue;
            unsigned char seq2 = 0;
            if(::read(STDIN_FILENO, &seq2, 1) <= 0) continue;

            if(seq2 >= '0' && seq2 <= '9'){
                unsigned char seq3 = 0;
                if(::read(STDIN_FILENO, &seq3, 1) <= 0) continue;
                if(seq2 == '3' && seq3 == '~' && cursor < buffer.size()){ // delete key
                    buffer.erase(cursor, 1);
                    edited();
                }
                continue;
            }

            if(seq2 == 'A'){ // up
                if(history_pos == history.size() && !history.empty()){
                    if(!saved_valid){
                        saved_new_entry = buffer;
                        saved_valid = true;
                    }
                    history_pos = history.size() - 1;
                } else if(history_pos > 0 && history_pos < history.size()){
                    --history_pos;
                } else {
                    std::cout << '\a' << std::flush;
                    continue;
                }
                buffer = history[history_pos];
                cursor = buffer.size();
                redraw_current();
                continue;
            }

            if(seq2 == 'B'){ // down
                if(history_pos == history.size()){
                    std::cout << '\a' << std::flush;
                    continue;
                }
                ++history_pos;
                if(history_pos == history.size()){
                    buffer = saved_valid ? saved_new_entry : std::string{};
                    saved_valid = false;
                } else {
                    buffer = history[history_pos];
                }
                cursor = buffer.size();
                redraw_current();
                continue;
            }

            if(seq2 == 'C' && cursor < buffer.size()){ // right
                ++cursor;
                redraw_current();
            } else if(seq2 == 'D' && cursor > 0){ // left
                --cursor;
                redraw_current();
            }
            continue;
        }

        if(ch >= 32 && ch <= 126){
            buffer.insert(cursor, 1, static_cast<char>(ch));
            ++cursor;
            edited();
            continue;
        }
    }
}
