#ifndef _CodeAssist_value_h_
#define _CodeAssist_value_h_

namespace Sandbox {

struct Env;
struct Interpreter;
struct FunctionDecl;
struct ListData;
struct TupleData;
struct DictData;
struct Function;
struct BuiltinFn;
struct BoundMethod;

struct RangeData {
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
    int64_t length() const;
    int64_t at(int64_t i) const { return start + i * step; }
};

//
// Values of the sandboxed dialect
//
struct Value {
    using ListPtr = std::shared_ptr<ListData>;
    using TuplePtr = std::shared_ptr<TupleData>;
    using DictPtr = std::shared_ptr<DictData>;
    using FuncPtr = std::shared_ptr<Function>;
    using BuiltinPtr = std::shared_ptr<BuiltinFn>;
    using MethodPtr = std::shared_ptr<BoundMethod>;
    using Items = std::vector<Value>;

    std::variant<std::monostate, bool, int64_t, double, std::string,
                 ListPtr, TuplePtr, DictPtr, RangeData,
                 FuncPtr, BuiltinPtr, MethodPtr> v;

    Value() = default;
    static Value None()           { return Value(); }
    static Value B(bool b)        { Value r; r.v = b; return r; }
    static Value I(int64_t x)     { Value r; r.v = x; return r; }
    static Value F(double x)      { Value r; r.v = x; return r; }
    static Value S(std::string s) { Value r; r.v = std::move(s); return r; }
    static Value L(Items xs);
    static Value T(Items xs);
    static Value D();
    static Value R(int64_t start, int64_t stop, int64_t step);
    static Value Fn(FuncPtr f)    { Value r; r.v = std::move(f); return r; }
    static Value Built(BuiltinPtr b){ Value r; r.v = std::move(b); return r; }
    static Value Method(MethodPtr m){ Value r; r.v = std::move(m); return r; }

    bool isNone() const     { return std::holds_alternative<std::monostate>(v); }
    bool isBool() const     { return std::holds_alternative<bool>(v); }
    bool isInt() const      { return std::holds_alternative<int64_t>(v); }
    bool isIntLike() const  { return isInt() || isBool(); }
    bool isFloat() const    { return std::holds_alternative<double>(v); }
    bool isNumber() const   { return isIntLike() || isFloat(); }
    bool isStr() const      { return std::holds_alternative<std::string>(v); }
    bool isList() const     { return std::holds_alternative<ListPtr>(v); }
    bool isTuple() const    { return std::holds_alternative<TuplePtr>(v); }
    bool isDict() const     { return std::holds_alternative<DictPtr>(v); }
    bool isRange() const    { return std::holds_alternative<RangeData>(v); }
    bool isFunction() const { return std::holds_alternative<FuncPtr>(v); }
    bool isBuiltin() const  { return std::holds_alternative<BuiltinPtr>(v); }
    bool isMethod() const   { return std::holds_alternative<MethodPtr>(v); }
    bool isCallable() const { return isFunction() || isBuiltin() || isMethod(); }

    int64_t asInt() const;
    double asFloat() const;
    const std::string& str() const { return std::get<std::string>(v); }
    ListData& list() const         { return *std::get<ListPtr>(v); }
    TupleData& tuple() const       { return *std::get<TuplePtr>(v); }
    DictData& dict() const         { return *std::get<DictPtr>(v); }
    const RangeData& range() const { return std::get<RangeData>(v); }

    const char* typeName() const;
    bool truthy() const;
    std::string repr() const;
    std::string toStr() const;
};

// Containers and scopes hand their children to a per-thread release queue
// on destruction, so dropping a deeply nested value never recurses.
struct ListData {
    Value::Items items;
    ~ListData();
};

struct TupleData {
    Value::Items items;
    ~TupleData();
};

// Insertion-ordered mapping. Keys are indexed by hash_key(), so equal
// numbers of different types (1, 1.0, True) share one slot.
struct DictData {
    std::vector<std::pair<Value, Value>> items;
    std::unordered_map<std::string, size_t> index;

    ~DictData();
    const Value* find(const Value& key) const;
    void set(const Value& key, const Value& val);
    bool erase(const Value& key);
    void clear();
    size_t size() const { return items.size(); }
};

//
// Scopes
//
struct Env {
    std::unordered_map<std::string, Value> tbl;
    std::shared_ptr<Env> up;
    explicit Env(std::shared_ptr<Env> p = nullptr) : up(std::move(p)) {}
    ~Env();
    Env(const Env&) = delete;
    Env& operator=(const Env&) = delete;
    void set(const std::string& k, const Value& v) { tbl[k] = v; }
    bool erase(const std::string& k) { return tbl.erase(k) > 0; }
    std::optional<Value> get(const std::string& k) const {
        for(const Env* e = this; e; e = e->up.get()){
            auto it = e->tbl.find(k);
            if(it != e->tbl.end()) return it->second;
        }
        return std::nullopt;
    }

    // Scope registered with the active Heap.
    static std::shared_ptr<Env> make(std::shared_ptr<Env> up);
};

//
// Callables
//
struct Function {
    std::shared_ptr<const FunctionDecl> decl;
    std::shared_ptr<Env> closure;
    Value::Items defaults;
};

struct CallArgs {
    Interpreter& in;
    Value::Items args;
    std::vector<std::pair<std::string, Value>> kwargs;

    const Value* kwarg(const std::string& name) const;
    // Rejects keywords outside `allowed` with the dialect's TypeError.
    void expectKeywords(const char* fn, std::initializer_list<const char*> allowed) const;
    void expectCount(const char* fn, size_t min, size_t max) const;
};

struct BuiltinFn {
    using Impl = std::function<Value(CallArgs&)>;
    std::string name;
    Impl fn;
};

struct BoundMethod {
    using Impl = std::function<Value(const Value& self, CallArgs&)>;
    Value self;
    std::string name;
    Impl fn;
};

//
// Heap: every mutable container and scope created during one execution,
// in creation order. release() clears them so reference cycles built by
// the sandboxed source do not outlive the call.
//
class Heap {
public:
    Heap() = default;
    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;
    ~Heap();

    void track(const std::shared_ptr<ListData>& p);
    void track(const std::shared_ptr<TupleData>& p);
    void track(const std::shared_ptr<DictData>& p);
    void track(const std::shared_ptr<Env>& p);
    void release();

    static Heap* active();

private:
    friend struct HeapScope;
    using Tracked = std::variant<std::weak_ptr<ListData>, std::weak_ptr<TupleData>, std::weak_ptr<DictData>>;
    std::vector<Tracked> containers;
    std::vector<std::weak_ptr<Env>> scopes;
    size_t prune_at = 1024;

    void maybePrune();
};

// Makes `heap` the active heap of the calling thread for its lifetime.
struct HeapScope {
    Heap* prev;
    explicit HeapScope(Heap& heap);
    ~HeapScope();
    HeapScope(const HeapScope&) = delete;
    HeapScope& operator=(const HeapScope&) = delete;
};

} // namespace Sandbox

#endif
