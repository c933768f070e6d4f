#ifndef _CodeAssist_line_editor_h_
#define _CodeAssist_line_editor_h_

//
// Interactive input for the codeassist runner
//

// Lines entered at the prompt, most recent last, loaded from and saved
// to one file. Blank lines and immediate repeats are not kept.
class InputHistory {
public:
    static constexpr size_t kLimit = 1000;

    explicit InputHistory(std::optional<std::filesystem::path> file = default_path());

    // $CODEASSIST_HISTORY_FILE, else ~/.codeassist_history.
    static std::optional<std::filesystem::path> default_path();

    void record(const std::string& line);
    // Saves the newest kLimit entries if anything was recorded. Returns
    // false when the file cannot be written.
    bool flush();

    const std::vector<std::string>& entries() const { return lines; }
    const std::optional<std::filesystem::path>& file() const { return path; }

private:
    std::optional<std::filesystem::path> path;
    std::vector<std::string> lines;
    bool dirty = false;
};

// Reads one line with cursor movement, history recall (up/down) and
// Tab inserting four spaces. Falls back to std::getline when stdin or
// stdout is not a terminal. Returns false on end of input.
bool read_line_with_history(const std::string& prompt, std::string& out,
                            const InputHistory& recalled);

#endif
