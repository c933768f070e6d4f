#include "CodeAssist.h"

namespace Sandbox {

void apply_option(SandboxOptions& opts, const std::string& key, const std::string& value){
    if(key == "max-call-depth"){
        size_t n = parse_size_arg(value, "max-call-depth");
        if(n == 0) throw std::runtime_error("max-call-depth must be positive");
        opts.max_call_depth = n;
    } else if(key == "max-steps"){
        opts.max_steps = parse_size_arg(value, "max-steps");
    } else if(key == "max-nesting"){
        size_t n = parse_size_arg(value, "max-nesting");
        if(n == 0) throw std::runtime_error("max-nesting must be positive");
        opts.max_nesting = n;
    } else {
        throw std::runtime_error("unknown option '" + key + "'");
    }
}

SandboxOptions SandboxOptions::from_env(){
    SandboxOptions opts;
    static const std::pair<const char*, const char*> vars[] = {
        {"CODEASSIST_MAX_CALL_DEPTH", "max-call-depth"},
        {"CODEASSIST_MAX_STEPS", "max-steps"},
    };
    for(const auto& [env_name, key] : vars){
        const char* env = std::getenv(env_name);
        if(!env || !*env) continue;
        try{
            apply_option(opts, key, trim_copy(env));
        } catch(const std::exception& e){
            std::cerr << "note: ignoring " << env_name << ": " << e.what() << "\n";
        }
    }
    TRACE_MSG("options depth=", opts.max_call_depth, " steps=", opts.max_steps);
    return opts;
}

} // namespace Sandbox
