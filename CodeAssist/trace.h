#ifndef _CodeAssist_trace_h_
#define _CodeAssist_trace_h_

//
// Tracing. Compiled in only with CODEASSIST_TRACE; lines go to
// codeassist_trace.log or $CODEASSIST_TRACE_FILE, never to std::cout.
//
#ifdef CODEASSIST_TRACE
namespace assist_trace {
    void log_line(const std::string& line);

    inline std::string concat(){ return {}; }

    template<typename... Args>
    std::string concat(Args&&... args){
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    struct Scope {
        std::string name;
        Scope(const char* fn, const std::string& details);
        ~Scope();
    };

    void log_loop(const char* tag, const std::string& details);
}

#define ASSIST_TRACE_CAT(a,b) ASSIST_TRACE_CAT_1(a,b)
#define ASSIST_TRACE_CAT_1(a,b) a##b

#define TRACE_FN(...) auto ASSIST_TRACE_CAT(_assist_trace_scope_, __LINE__) = ::assist_trace::Scope(__func__, ::assist_trace::concat(__VA_ARGS__))
#define TRACE_MSG(...) ::assist_trace::log_line(::assist_trace::concat(__VA_ARGS__))
#define TRACE_LOOP(tag, ...) ::assist_trace::log_loop(tag, ::assist_trace::concat(__VA_ARGS__))
#else
#define TRACE_FN(...) (void)0
#define TRACE_MSG(...) (void)0
#define TRACE_LOOP(...) (void)0
#endif

#endif
