#ifndef _CodeAssist_config_h_
#define _CodeAssist_config_h_

namespace Sandbox {

// Limits applied to one execution. By default there is no step budget,
// only the call-depth guard between sandboxed recursion and the native stack.
struct SandboxOptions {
    size_t max_call_depth = 200;
    size_t max_nesting = 100;
    uint64_t max_steps = 0; // 0 = unlimited

    // Defaults overridden by CODEASSIST_MAX_CALL_DEPTH / CODEASSIST_MAX_STEPS.
    // Malformed values are reported on std::cerr and ignored.
    static SandboxOptions from_env();
};

// Applies "max-call-depth" / "max-steps" / "max-nesting"; throws
// std::runtime_error on unknown keys or malformed values.
void apply_option(SandboxOptions& opts, const std::string& key, const std::string& value);

} // namespace Sandbox

#endif
