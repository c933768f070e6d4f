#ifndef _CodeAssist_builtins_h_
#define _CodeAssist_builtins_h_

namespace Sandbox {

// The closed set of primitives sandboxed code may name.
enum class Capability {
    Print,
    Len,
    Str, Int, Float, Bool,
    List, Tuple, Dict, Range, Enumerate, Zip,
    Sum, Min, Max, Round, Abs,
    Sorted
};

const char* capability_name(Capability c);
std::optional<Capability> capability_from_name(const std::string& name);

class CapabilityAllowlist {
public:
    explicit CapabilityAllowlist(std::vector<Capability> caps);

    // Every capability, the set the sandbox installs by default.
    static const CapabilityAllowlist& standard();

    bool contains(Capability c) const;
    bool contains(const std::string& name) const;
    const std::vector<Capability>& entries() const { return caps; }

private:
    std::vector<Capability> caps;
};

// Binds each allowlisted name in `g`. Nothing else is installed.
void install_builtins(std::shared_ptr<Env> g, const CapabilityAllowlist& caps);

} // namespace Sandbox

#endif
