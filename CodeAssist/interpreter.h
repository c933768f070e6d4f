#ifndef _CodeAssist_interpreter_h_
#define _CodeAssist_interpreter_h_

namespace Sandbox {

//
// Evaluator for one execution. Owns the heap every container of the run
// lives on, the allowlist scope and the module scope beneath it.
//
struct Interpreter {
    Interpreter(std::ostream& out, const SandboxOptions& opts,
                const CapabilityAllowlist& caps = CapabilityAllowlist::standard());
    ~Interpreter();
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void run(const Program& prog);

    Value call(const Value& fn, Value::Items args,
               std::vector<std::pair<std::string, Value>> kwargs = {});

    // One unit of work against the step budget.
    void tick();

    std::ostream& out;
    SandboxOptions opts;
    // exceptions being handled by enclosing except blocks, innermost last
    std::vector<std::exception_ptr> handling;

private:
    Heap heap;
    HeapScope heap_scope;

public:
    std::shared_ptr<Env> builtins;
    std::shared_ptr<Env> module;

private:
    size_t depth = 0;
    uint64_t steps = 0;

    Value callFunction(const Function& fn, Value::Items& args,
                       std::vector<std::pair<std::string, Value>>& kwargs);
};

} // namespace Sandbox

#endif
