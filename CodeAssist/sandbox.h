#ifndef _CodeAssist_sandbox_h_
#define _CodeAssist_sandbox_h_

namespace Sandbox {

extern const char* const kEmptyOutputSentinel;
extern const char* const kErrorPrefix;

struct ExecutionResult {
    enum class Kind { Output, Empty, Error };
    Kind kind = Kind::Empty;
    std::string text;

    bool ok() const { return kind != Kind::Error; }
};

// RAII redirection of std::cout into a buffer; the previous stream buffer
// comes back on every exit path.
class ScopedCoutCapture {
public:
    ScopedCoutCapture();
    ~ScopedCoutCapture();
    ScopedCoutCapture(const ScopedCoutCapture&) = delete;
    ScopedCoutCapture& operator=(const ScopedCoutCapture&) = delete;

    std::string str() const { return buffer.str(); }
    void discard(){ buffer.str(std::string()); }

private:
    std::ostringstream buffer;
    std::streambuf* old = nullptr;
};

// Runs untrusted source against the capability allowlist and relays the
// captured output, the empty-output sentinel, or "Error: <fault>". Never
// throws.
ExecutionResult execute(const std::string& source);
ExecutionResult execute(const std::string& source, const SandboxOptions& opts);

const char* result_kind_name(ExecutionResult::Kind k);

} // namespace Sandbox

#endif
