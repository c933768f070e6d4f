#include "CodeAssist.h"

namespace Sandbox {

const char* const kEmptyOutputSentinel = "Code executed successfully (no output)";
const char* const kErrorPrefix = "Error: ";

ScopedCoutCapture::ScopedCoutCapture(){
    old = std::cout.rdbuf(buffer.rdbuf());
}

ScopedCoutCapture::~ScopedCoutCapture(){
    std::cout.rdbuf(old);
}

namespace {

// std::cout is process-wide; executions take turns redirecting it.
std::mutex g_execute_mutex;

} // namespace

ExecutionResult execute(const std::string& source){
    return execute(source, SandboxOptions());
}

ExecutionResult execute(const std::string& source, const SandboxOptions& opts){
    TRACE_FN("bytes=", source.size());
    std::lock_guard<std::mutex> lock(g_execute_mutex);

    std::string output;
    std::string error;
    {
        ScopedCoutCapture capture;
        try {
            auto prog = parse(source, opts.max_nesting);
            Interpreter in(std::cout, opts);
            in.run(*prog);
            std::cout.flush();
        } catch(const Fault& e){
            error = e.describe();
        } catch(const std::bad_alloc&){
            error = "MemoryError: out of memory";
        } catch(const std::length_error&){
            error = "MemoryError: out of memory";
        } catch(const std::exception& e){
            error = std::string("InternalError: ") + e.what();
        }
        if(error.empty()) output = capture.str();
        else capture.discard();
    }

    ExecutionResult r;
    if(!error.empty()){
        TRACE_MSG("execution failed: ", error);
        r.kind = ExecutionResult::Kind::Error;
        r.text = kErrorPrefix + error;
    } else if(output.empty()){
        r.kind = ExecutionResult::Kind::Empty;
        r.text = kEmptyOutputSentinel;
    } else {
        r.kind = ExecutionResult::Kind::Output;
        r.text = std::move(output);
    }
    return r;
}

const char* result_kind_name(ExecutionResult::Kind k){
    switch(k){
        case ExecutionResult::Kind::Output: return "output";
        case ExecutionResult::Kind::Empty: return "empty";
        case ExecutionResult::Kind::Error: return "error";
    }
    return "unknown";
}

} // namespace Sandbox
