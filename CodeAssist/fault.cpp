#include "CodeAssist.h"

namespace Sandbox {

Fault::Fault(FaultKind k, std::string t, const std::string& msg)
    : std::runtime_error(msg), kind(k), type(std::move(t)) {}

std::string Fault::describe() const {
    std::string out = type;
    if(*what()) out += std::string(": ") + what();
    if(kind == FaultKind::Syntax && line > 0)
        out += " (line " + std::to_string(line) + ")";
    return out;
}

SyntaxFault::SyntaxFault(const std::string& msg, int l, std::string t)
    : Fault(FaultKind::Syntax, std::move(t), msg) {
    line = l;
    catchable = false;
}

ResolutionFault::ResolutionFault(const std::string& msg, std::string t)
    : Fault(FaultKind::Resolution, std::move(t), msg) {}

RuntimeFault::RuntimeFault(std::string t, const std::string& msg)
    : Fault(FaultKind::Runtime, std::move(t), msg) {}

ResolutionFault name_not_defined(const std::string& id){
    return ResolutionFault("name '" + id + "' is not defined");
}

RuntimeFault type_error(const std::string& msg){
    return RuntimeFault("TypeError", msg);
}

RuntimeFault value_error(const std::string& msg){
    return RuntimeFault("ValueError", msg);
}

} // namespace Sandbox
