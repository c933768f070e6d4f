#ifndef _CodeAssist_fault_h_
#define _CodeAssist_fault_h_

namespace Sandbox {

enum class FaultKind { Syntax, Resolution, Runtime };

// Base of every failure raised while parsing or evaluating sandboxed source.
// `type` is the dialect-level error name shown to the user (NameError, ...).
struct Fault : std::runtime_error {
    FaultKind kind;
    std::string type;
    int line = 0;
    // false for faults sandboxed try/except must not intercept
    bool catchable = true;

    Fault(FaultKind k, std::string t, const std::string& msg);

    // "<type>: <message>", with the line appended for syntax faults.
    std::string describe() const;
};

struct SyntaxFault : Fault {
    SyntaxFault(const std::string& msg, int line, std::string type = "SyntaxError");
};

struct ResolutionFault : Fault {
    explicit ResolutionFault(const std::string& msg, std::string type = "NameError");
};

struct RuntimeFault : Fault {
    RuntimeFault(std::string type, const std::string& msg);
};

ResolutionFault name_not_defined(const std::string& id);
RuntimeFault type_error(const std::string& msg);
RuntimeFault value_error(const std::string& msg);

} // namespace Sandbox

#endif
