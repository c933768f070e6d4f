#include "CodeAssist.h"

namespace Sandbox {

// ====== Value factories ======
Value Value::L(Items xs){
    auto p = std::make_shared<ListData>();
    p->items = std::move(xs);
    if(Heap* h = Heap::active()) h->track(p);
    Value r; r.v = std::move(p); return r;
}

Value Value::T(Items xs){
    auto p = std::make_shared<TupleData>();
    p->items = std::move(xs);
    if(Heap* h = Heap::active()) h->track(p);
    Value r; r.v = std::move(p); return r;
}

Value Value::D(){
    auto p = std::make_shared<DictData>();
    if(Heap* h = Heap::active()) h->track(p);
    Value r; r.v = std::move(p); return r;
}

Value Value::R(int64_t start, int64_t stop, int64_t step){
    Value r; r.v = RangeData{start, stop, step}; return r;
}

int64_t RangeData::length() const {
    if(step > 0 && start < stop) return (stop - start - 1) / step + 1;
    if(step < 0 && start > stop) return (start - stop - 1) / (-step) + 1;
    return 0;
}

// ====== Conversions ======
int64_t Value::asInt() const {
    if(isBool()) return std::get<bool>(v) ? 1 : 0;
    return std::get<int64_t>(v);
}

double Value::asFloat() const {
    if(isFloat()) return std::get<double>(v);
    return static_cast<double>(asInt());
}

const char* Value::typeName() const {
    switch(v.index()){
        case 0: return "NoneType";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "str";
        case 5: return "list";
        case 6: return "tuple";
        case 7: return "dict";
        case 8: return "range";
        case 9: return "function";
        case 10: return "builtin_function_or_method";
        default: return "builtin_function_or_method";
    }
}

bool Value::truthy() const {
    return std::visit([](auto&& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return false;
        else if constexpr (std::is_same_v<T, bool>)        return x;
        else if constexpr (std::is_same_v<T, int64_t>)     return x != 0;
        else if constexpr (std::is_same_v<T, double>)      return x != 0.0;
        else if constexpr (std::is_same_v<T, std::string>) return !x.empty();
        else if constexpr (std::is_same_v<T, ListPtr>)     return !x->items.empty();
        else if constexpr (std::is_same_v<T, TuplePtr>)    return !x->items.empty();
        else if constexpr (std::is_same_v<T, DictPtr>)     return x->size() != 0;
        else if constexpr (std::is_same_v<T, RangeData>)   return x.length() != 0;
        else return true;
    }, v);
}

// ====== repr / str ======
namespace {

const size_t kMaxReprDepth = 500;

// Containers currently being rendered on this thread, for [...] cycles.
std::vector<const void*>& repr_stack(){
    thread_local std::vector<const void*> stack;
    return stack;
}

struct ReprGuard {
    bool cycle = false;
    bool pushed = false;
    explicit ReprGuard(const void* p){
        auto& st = repr_stack();
        if(std::find(st.begin(), st.end(), p) != st.end()){ cycle = true; return; }
        if(st.size() >= kMaxReprDepth)
            throw RuntimeFault("RecursionError", "maximum recursion depth exceeded while getting the repr of an object");
        st.push_back(p);
        pushed = true;
    }
    ~ReprGuard(){ if(pushed) repr_stack().pop_back(); }
};

std::string join_repr(const Value::Items& xs){
    std::string s;
    for(size_t i = 0; i < xs.size(); ++i){
        if(i) s += ", ";
        s += xs[i].repr();
    }
    return s;
}

} // namespace

std::string Value::repr() const {
    if(isStr()) return quote_string(str());
    if(isList()){
        ReprGuard g(std::get<ListPtr>(v).get());
        if(g.cycle) return "[...]";
        return "[" + join_repr(list().items) + "]";
    }
    if(isTuple()){
        ReprGuard g(std::get<TuplePtr>(v).get());
        if(g.cycle) return "(...)";
        const auto& xs = tuple().items;
        if(xs.size() == 1) return "(" + xs[0].repr() + ",)";
        return "(" + join_repr(xs) + ")";
    }
    if(isDict()){
        ReprGuard g(std::get<DictPtr>(v).get());
        if(g.cycle) return "{...}";
        std::string s = "{";
        bool first = true;
        for(const auto& kv : dict().items){
            if(!first) s += ", ";
            first = false;
            s += kv.first.repr() + ": " + kv.second.repr();
        }
        return s + "}";
    }
    return toStr();
}

std::string Value::toStr() const {
    return std::visit([this](auto&& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "None";
        else if constexpr (std::is_same_v<T, bool>)        return x ? "True" : "False";
        else if constexpr (std::is_same_v<T, int64_t>)     return std::to_string(x);
        else if constexpr (std::is_same_v<T, double>)      return format_float(x);
        else if constexpr (std::is_same_v<T, std::string>) return x;
        else if constexpr (std::is_same_v<T, RangeData>){
            std::string s = "range(" + std::to_string(x.start) + ", " + std::to_string(x.stop);
            if(x.step != 1) s += ", " + std::to_string(x.step);
            return s + ")";
        }
        else if constexpr (std::is_same_v<T, FuncPtr>)    return "<function " + x->decl->name + ">";
        else if constexpr (std::is_same_v<T, BuiltinPtr>) return "<built-in function " + x->name + ">";
        else if constexpr (std::is_same_v<T, MethodPtr>)
            return "<built-in method " + x->name + " of " + x->self.typeName() + " object>";
        else return repr();
    }, v);
}

// ====== Dict ======
const Value* DictData::find(const Value& key) const {
    auto it = index.find(hash_key(key));
    if(it == index.end()) return nullptr;
    return &items[it->second].second;
}

void DictData::set(const Value& key, const Value& val){
    std::string hk = hash_key(key);
    auto it = index.find(hk);
    if(it != index.end()){
        items[it->second].second = val;
        return;
    }
    index.emplace(std::move(hk), items.size());
    items.emplace_back(key, val);
}

bool DictData::erase(const Value& key){
    auto it = index.find(hash_key(key));
    if(it == index.end()) return false;
    size_t pos = it->second;
    index.erase(it);
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(pos));
    for(auto& kv : index)
        if(kv.second > pos) --kv.second;
    return true;
}

void DictData::clear(){
    items.clear();
    index.clear();
}

// ====== Deferred release ======
namespace {

thread_local std::vector<std::shared_ptr<void>> g_doomed;
thread_local bool g_draining = false;

void defer(Value& x){
    std::visit([](auto& a){
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, Value::ListPtr> || std::is_same_v<T, Value::TuplePtr> ||
                      std::is_same_v<T, Value::DictPtr> || std::is_same_v<T, Value::FuncPtr> ||
                      std::is_same_v<T, Value::MethodPtr>){
            if(a) g_doomed.push_back(std::move(a));
        }
    }, x.v);
}

void defer_items(Value::Items& xs){
    for(auto& x : xs) defer(x);
    xs.clear();
}

// Only the outermost destructor frees the queue; nested ones just enqueue.
void drain(){
    if(g_draining) return;
    g_draining = true;
    while(!g_doomed.empty()){
        std::shared_ptr<void> p = std::move(g_doomed.back());
        g_doomed.pop_back();
        p.reset();
    }
    g_draining = false;
}

} // namespace

ListData::~ListData(){
    defer_items(items);
    drain();
}

TupleData::~TupleData(){
    defer_items(items);
    drain();
}

DictData::~DictData(){
    for(auto& kv : items){
        defer(kv.first);
        defer(kv.second);
    }
    items.clear();
    drain();
}

Env::~Env(){
    for(auto& kv : tbl) defer(kv.second);
    tbl.clear();
    if(up) g_doomed.push_back(std::move(up));
    drain();
}

// ====== Env ======
std::shared_ptr<Env> Env::make(std::shared_ptr<Env> up){
    auto e = std::make_shared<Env>(std::move(up));
    if(Heap* h = Heap::active()) h->track(e);
    return e;
}

// ====== Call arguments ======
const Value* CallArgs::kwarg(const std::string& name) const {
    for(const auto& kv : kwargs)
        if(kv.first == name) return &kv.second;
    return nullptr;
}

void CallArgs::expectKeywords(const char* fn, std::initializer_list<const char*> allowed) const {
    for(const auto& kv : kwargs){
        bool ok = false;
        for(const char* a : allowed) if(kv.first == a){ ok = true; break; }
        if(!ok) throw type_error(std::string(fn) + "() got an unexpected keyword argument '" + kv.first + "'");
    }
}

void CallArgs::expectCount(const char* fn, size_t min, size_t max) const {
    size_t n = args.size();
    if(n >= min && n <= max) return;
    std::string msg = std::string(fn) + "() ";
    if(min == max)
        msg += "takes exactly " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    else if(n < min)
        msg += "takes at least " + std::to_string(min) + " argument" + (min == 1 ? "" : "s");
    else
        msg += "takes at most " + std::to_string(max) + " argument" + (max == 1 ? "" : "s");
    msg += " (" + std::to_string(n) + " given)";
    throw type_error(msg);
}

// ====== Heap ======
namespace {
thread_local Heap* g_active_heap = nullptr;
}

Heap* Heap::active(){ return g_active_heap; }

HeapScope::HeapScope(Heap& heap) : prev(g_active_heap){ g_active_heap = &heap; }
HeapScope::~HeapScope(){ g_active_heap = prev; }

Heap::~Heap(){ release(); }

void Heap::maybePrune(){
    if(containers.size() < prune_at && scopes.size() < prune_at) return;
    containers.erase(std::remove_if(containers.begin(), containers.end(), [](const Tracked& t){
        return std::visit([](const auto& w){ return w.expired(); }, t);
    }), containers.end());
    scopes.erase(std::remove_if(scopes.begin(), scopes.end(), [](const std::weak_ptr<Env>& w){
        return w.expired();
    }), scopes.end());
    prune_at = std::max<size_t>(1024, 2 * std::max(containers.size(), scopes.size()));
}

void Heap::track(const std::shared_ptr<ListData>& p){ maybePrune(); containers.emplace_back(std::weak_ptr<ListData>(p)); }
void Heap::track(const std::shared_ptr<TupleData>& p){ maybePrune(); containers.emplace_back(std::weak_ptr<TupleData>(p)); }
void Heap::track(const std::shared_ptr<DictData>& p){ maybePrune(); containers.emplace_back(std::weak_ptr<DictData>(p)); }
void Heap::track(const std::shared_ptr<Env>& p){ maybePrune(); scopes.emplace_back(p); }

// Every tracked container and scope is emptied into `pending` before any
// element is destroyed, so destroying `pending` only ever frees empty
// containers and nested structures never unwind recursively.
void Heap::release(){
    if(g_active_heap == this) g_active_heap = nullptr;
    std::vector<Value> pending;
    std::vector<Tracked> cs;
    cs.swap(containers);
    for(auto& t : cs){
        std::visit([&pending](auto& w){
            auto p = w.lock();
            if(!p) return;
            using T = typename std::decay_t<decltype(p)>::element_type;
            if constexpr (std::is_same_v<T, DictData>){
                for(auto& kv : p->items){
                    pending.push_back(std::move(kv.first));
                    pending.push_back(std::move(kv.second));
                }
                p->clear();
            } else {
                for(auto& x : p->items) pending.push_back(std::move(x));
                p->items.clear();
            }
        }, t);
    }
    std::vector<std::weak_ptr<Env>> ss;
    ss.swap(scopes);
    for(auto& w : ss){
        auto e = w.lock();
        if(!e) continue;
        for(auto& kv : e->tbl) pending.push_back(std::move(kv.second));
        e->tbl.clear();
        e->up.reset();
    }
    pending.clear();
}

} // namespace Sandbox
