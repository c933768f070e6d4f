#include "CodeAssist.h"

namespace Sandbox {

namespace {

std::string plural(size_t n, const char* word){
    std::string s = std::to_string(n) + " " + word;
    if(n != 1) s += "s";
    return s;
}

// 'a', 'b' and 'c'
std::string join_names(const std::vector<std::string>& names){
    std::string out;
    for(size_t i = 0; i < names.size(); ++i){
        if(i){
            out += (i + 1 == names.size()) ? (names.size() > 2 ? ", and " : " and ") : ", ";
        }
        out += "'" + names[i] + "'";
    }
    return out;
}

struct DepthGuard {
    size_t& depth;
    explicit DepthGuard(size_t& d) : depth(d) { ++depth; }
    ~DepthGuard(){ --depth; }
};

} // namespace

Interpreter::Interpreter(std::ostream& out_, const SandboxOptions& opts_, const CapabilityAllowlist& caps)
    : out(out_), opts(opts_), heap_scope(heap) {
    builtins = Env::make(nullptr);
    install_builtins(builtins, caps);
    module = Env::make(builtins);
}

Interpreter::~Interpreter(){
    handling.clear();
    heap.release();
    module.reset();
    builtins.reset();
}

void Interpreter::run(const Program& prog){
    TRACE_FN("statements=", prog.body.size());
    Frame f{*this, module, nullptr, Value()};
    exec_block(prog.body, f);
}

void Interpreter::tick(){
    ++steps;
    if(opts.max_steps && steps > opts.max_steps){
        RuntimeFault e("TimeoutError", "step budget of " + std::to_string(opts.max_steps) + " exceeded");
        e.catchable = false;
        throw e;
    }
}

Value Interpreter::call(const Value& fn, Value::Items args,
                        std::vector<std::pair<std::string, Value>> kwargs){
    if(fn.isBuiltin()){
        CallArgs a{*this, std::move(args), std::move(kwargs)};
        return std::get<Value::BuiltinPtr>(fn.v)->fn(a);
    }
    if(fn.isMethod()){
        const auto& m = std::get<Value::MethodPtr>(fn.v);
        CallArgs a{*this, std::move(args), std::move(kwargs)};
        return m->fn(m->self, a);
    }
    if(fn.isFunction()){
        return callFunction(*std::get<Value::FuncPtr>(fn.v), args, kwargs);
    }
    throw type_error(std::string("'") + fn.typeName() + "' object is not callable");
}

Value Interpreter::callFunction(const Function& fn, Value::Items& args,
                                std::vector<std::pair<std::string, Value>>& kwargs){
    const FunctionDecl& d = *fn.decl;
    const std::string name = d.name + "()";
    const size_t nparams = d.params.size();
    const size_t nreq = nparams - fn.defaults.size();

    if(args.size() > nparams){
        std::string takes = nreq == nparams
            ? plural(nparams, "positional argument")
            : "from " + std::to_string(nreq) + " to " + plural(nparams, "positional argument");
        throw type_error(name + " takes " + takes + " but " + std::to_string(args.size()) +
                         (args.size() == 1 ? " was" : " were") + " given");
    }

    std::vector<std::optional<Value>> slots(nparams);
    for(size_t i = 0; i < args.size(); ++i) slots[i] = std::move(args[i]);
    for(auto& kv : kwargs){
        auto it = std::find(d.params.begin(), d.params.end(), kv.first);
        if(it == d.params.end())
            throw type_error(name + " got an unexpected keyword argument '" + kv.first + "'");
        size_t idx = static_cast<size_t>(it - d.params.begin());
        if(slots[idx])
            throw type_error(name + " got multiple values for argument '" + kv.first + "'");
        slots[idx] = std::move(kv.second);
    }

    std::vector<std::string> missing;
    for(size_t i = 0; i < nparams; ++i){
        if(slots[i]) continue;
        if(i >= nreq) slots[i] = fn.defaults[i - nreq];
        else missing.push_back(d.params[i]);
    }
    if(!missing.empty()){
        throw type_error(name + " missing " + plural(missing.size(), "required positional argument") +
                         ": " + join_names(missing));
    }

    if(depth >= opts.max_call_depth)
        throw RuntimeFault("RecursionError", "maximum recursion depth exceeded");
    DepthGuard guard(depth);

    auto env = Env::make(fn.closure);
    for(size_t i = 0; i < nparams; ++i) env->set(d.params[i], *slots[i]);

    Frame f{*this, env, d.globals.empty() ? nullptr : &d.globals, Value()};
    exec_block(d.body, f);
    return f.ret;
}

} // namespace Sandbox
