#include "CodeAssist.h"

namespace Sandbox {

const char* binop_symbol(BinOp op){
    switch(op){
        case BinOp::Add: return "+";
        case BinOp::Sub: return "-";
        case BinOp::Mul: return "*";
        case BinOp::Div: return "/";
        case BinOp::FloorDiv: return "//";
        case BinOp::Mod: return "%";
        case BinOp::Pow: return "**";
        case BinOp::BitAnd: return "&";
        case BinOp::BitOr: return "|";
        case BinOp::BitXor: return "^";
        case BinOp::LShift: return "<<";
        case BinOp::RShift: return ">>";
    }
    return "?";
}

const char* cmpop_symbol(CmpOp op){
    switch(op){
        case CmpOp::Lt: return "<";
        case CmpOp::Le: return "<=";
        case CmpOp::Gt: return ">";
        case CmpOp::Ge: return ">=";
        case CmpOp::Eq: return "==";
        case CmpOp::Ne: return "!=";
        case CmpOp::In: return "in";
        case CmpOp::NotIn: return "not in";
        case CmpOp::Is: return "is";
        case CmpOp::IsNot: return "is not";
    }
    return "?";
}

static RuntimeFault overflow(){
    return RuntimeFault("OverflowError", "integer overflow (values are limited to 64 bits)");
}

int64_t checked_add(int64_t a, int64_t b){
    int64_t r;
    if(__builtin_add_overflow(a, b, &r)) throw overflow();
    return r;
}

int64_t checked_mul(int64_t a, int64_t b){
    int64_t r;
    if(__builtin_mul_overflow(a, b, &r)) throw overflow();
    return r;
}

static int64_t checked_sub(int64_t a, int64_t b){
    int64_t r;
    if(__builtin_sub_overflow(a, b, &r)) throw overflow();
    return r;
}

static RuntimeFault unsupported(BinOp op, const Value& a, const Value& b){
    return type_error(std::string("unsupported operand type(s) for ") + binop_symbol(op) + ": '"
                      + a.typeName() + "' and '" + b.typeName() + "'");
}

static Value::Items repeat_items(const Value::Items& xs, int64_t n){
    Value::Items out;
    if(n <= 0 || xs.empty()) return out;
    size_t total = 0;
    if(__builtin_mul_overflow(xs.size(), static_cast<uint64_t>(n), &total))
        throw RuntimeFault("MemoryError", "repeated sequence is too large");
    out.reserve(total);
    for(int64_t i = 0; i < n; ++i) out.insert(out.end(), xs.begin(), xs.end());
    return out;
}

static std::string repeat_string(const std::string& s, int64_t n){
    std::string out;
    if(n <= 0 || s.empty()) return out;
    size_t total = 0;
    if(__builtin_mul_overflow(s.size(), static_cast<uint64_t>(n), &total))
        throw RuntimeFault("MemoryError", "repeated string is too large");
    out.reserve(total);
    for(int64_t i = 0; i < n; ++i) out += s;
    return out;
}

static Value repeat(const Value& seq, int64_t n){
    if(seq.isStr())  return Value::S(repeat_string(seq.str(), n));
    if(seq.isList()) return Value::L(repeat_items(seq.list().items, n));
    return Value::T(repeat_items(seq.tuple().items, n));
}

static bool is_sequence(const Value& v){ return v.isStr() || v.isList() || v.isTuple(); }

static int64_t int_pow(int64_t base, int64_t exp){
    int64_t result = 1;
    while(exp > 0){
        if(exp & 1) result = checked_mul(result, base);
        exp >>= 1;
        if(exp) base = checked_mul(base, base);
    }
    return result;
}

static Value float_pow(double a, double b){
    if(a == 0.0 && b < 0.0)
        throw RuntimeFault("ZeroDivisionError", "0.0 cannot be raised to a negative power");
    if(a < 0.0 && std::floor(b) != b)
        throw value_error("negative number cannot be raised to a fractional power");
    double r = std::pow(a, b);
    if(std::isinf(r) && std::isfinite(a) && std::isfinite(b))
        throw RuntimeFault("OverflowError", "numerical result out of range");
    return Value::F(r);
}

Value binary_op(BinOp op, const Value& a, const Value& b){
    bool ints = a.isIntLike() && b.isIntLike();
    bool nums = a.isNumber() && b.isNumber();
    switch(op){
        case BinOp::Add:
            if(ints) return Value::I(checked_add(a.asInt(), b.asInt()));
            if(nums) return Value::F(a.asFloat() + b.asFloat());
            if(a.isStr() && b.isStr()) return Value::S(a.str() + b.str());
            if(a.isList() && b.isList()){
                Value::Items xs = a.list().items;
                const auto& ys = b.list().items;
                xs.insert(xs.end(), ys.begin(), ys.end());
                return Value::L(std::move(xs));
            }
            if(a.isTuple() && b.isTuple()){
                Value::Items xs = a.tuple().items;
                const auto& ys = b.tuple().items;
                xs.insert(xs.end(), ys.begin(), ys.end());
                return Value::T(std::move(xs));
            }
            if(is_sequence(a))
                throw type_error(std::string("can only concatenate ") + a.typeName() + " (not \"" + b.typeName() + "\") to " + a.typeName());
            throw unsupported(op, a, b);

        case BinOp::Sub:
            if(ints) return Value::I(checked_sub(a.asInt(), b.asInt()));
            if(nums) return Value::F(a.asFloat() - b.asFloat());
            throw unsupported(op, a, b);

        case BinOp::Mul:
            if(ints) return Value::I(checked_mul(a.asInt(), b.asInt()));
            if(nums) return Value::F(a.asFloat() * b.asFloat());
            if(is_sequence(a) && b.isIntLike()) return repeat(a, b.asInt());
            if(a.isIntLike() && is_sequence(b)) return repeat(b, a.asInt());
            if(is_sequence(a) || is_sequence(b))
                throw type_error(std::string("can't multiply sequence by non-int of type '")
                                 + (is_sequence(a) ? b.typeName() : a.typeName()) + "'");
            throw unsupported(op, a, b);

        case BinOp::Div:
            if(nums){
                if(b.asFloat() == 0.0) throw RuntimeFault("ZeroDivisionError", "division by zero");
                return Value::F(a.asFloat() / b.asFloat());
            }
            throw unsupported(op, a, b);

        case BinOp::FloorDiv:
            if(ints){
                int64_t x = a.asInt(), y = b.asInt();
                if(y == 0) throw RuntimeFault("ZeroDivisionError", "integer division or modulo by zero");
                if(x == std::numeric_limits<int64_t>::min() && y == -1) throw overflow();
                int64_t q = x / y;
                if((x % y != 0) && ((x < 0) != (y < 0))) --q;
                return Value::I(q);
            }
            if(nums){
                double y = b.asFloat();
                if(y == 0.0) throw RuntimeFault("ZeroDivisionError", "float floor division by zero");
                return Value::F(std::floor(a.asFloat() / y));
            }
            throw unsupported(op, a, b);

        case BinOp::Mod:
            if(a.isStr()) return Value::S(percent_format(a.str(), b));
            if(ints){
                int64_t x = a.asInt(), y = b.asInt();
                if(y == 0) throw RuntimeFault("ZeroDivisionError", "integer modulo by zero");
                if(y == -1) return Value::I(0);
                int64_t r = x % y;
                if(r != 0 && ((r < 0) != (y < 0))) r += y;
                return Value::I(r);
            }
            if(nums){
                double x = a.asFloat(), y = b.asFloat();
                if(y == 0.0) throw RuntimeFault("ZeroDivisionError", "float modulo");
                double r = std::fmod(x, y);
                if(r != 0.0 && ((r < 0) != (y < 0))) r += y;
                return Value::F(r);
            }
            throw unsupported(op, a, b);

        case BinOp::Pow:
            if(ints){
                int64_t e = b.asInt();
                if(e < 0) return float_pow(a.asFloat(), static_cast<double>(e));
                return Value::I(int_pow(a.asInt(), e));
            }
            if(nums) return float_pow(a.asFloat(), b.asFloat());
            throw unsupported(op, a, b);

        case BinOp::BitAnd:
        case BinOp::BitOr:
        case BinOp::BitXor: {
            if(!ints) throw unsupported(op, a, b);
            int64_t x = a.asInt(), y = b.asInt();
            int64_t r = op == BinOp::BitAnd ? (x & y) : op == BinOp::BitOr ? (x | y) : (x ^ y);
            if(a.isBool() && b.isBool()) return Value::B(r != 0);
            return Value::I(r);
        }

        case BinOp::LShift:
        case BinOp::RShift: {
            if(!ints) throw unsupported(op, a, b);
            int64_t x = a.asInt(), n = b.asInt();
            if(n < 0) throw value_error("negative shift count");
            if(op == BinOp::RShift){
                if(n >= 63) return Value::I(x < 0 ? -1 : 0);
                return Value::I(x >> n);
            }
            if(x == 0) return Value::I(0);
            if(n >= 63) throw overflow();
            int64_t r = static_cast<int64_t>(static_cast<uint64_t>(x) << n);
            if((r >> n) != x) throw overflow();
            return Value::I(r);
        }
    }
    throw unsupported(op, a, b);
}

Value unary_op(char op, const Value& v){
    switch(op){
        case '-':
            if(v.isIntLike()){
                int64_t x = v.asInt();
                if(x == std::numeric_limits<int64_t>::min()) throw overflow();
                return Value::I(-x);
            }
            if(v.isFloat()) return Value::F(-v.asFloat());
            break;
        case '+':
            if(v.isIntLike()) return Value::I(v.asInt());
            if(v.isFloat()) return v;
            break;
        case '~':
            if(v.isIntLike()) return Value::I(~v.asInt());
            break;
        default:
            break;
    }
    throw type_error(std::string("bad operand type for unary ") + op + ": '" + v.typeName() + "'");
}

// ====== Comparison ======
bool identical(const Value& a, const Value& b){
    if(a.v.index() != b.v.index()) return false;
    return std::visit([&b](auto&& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return true;
        else if constexpr (std::is_same_v<T, RangeData>){
            const auto& y = std::get<RangeData>(b.v);
            return x.start == y.start && x.stop == y.stop && x.step == y.step;
        }
        else return x == std::get<T>(b.v);
    }, a.v);
}

namespace {

const size_t kMaxCompareDepth = 500;

// Nested containers being compared or hashed on this thread.
struct CompareDepth {
    static size_t& level(){
        thread_local size_t n = 0;
        return n;
    }
    CompareDepth(){
        if(level() >= kMaxCompareDepth)
            throw RuntimeFault("RecursionError", "maximum recursion depth exceeded in comparison");
        ++level();
    }
    ~CompareDepth(){ --level(); }
};

} // namespace

static bool items_equal(const Value::Items& xs, const Value::Items& ys){
    if(xs.size() != ys.size()) return false;
    CompareDepth depth;
    for(size_t i = 0; i < xs.size(); ++i)
        if(!identical(xs[i], ys[i]) && !values_equal(xs[i], ys[i])) return false;
    return true;
}

bool values_equal(const Value& a, const Value& b){
    if(a.isNumber() && b.isNumber()){
        if(a.isIntLike() && b.isIntLike()) return a.asInt() == b.asInt();
        return a.asFloat() == b.asFloat();
    }
    if(a.v.index() != b.v.index()) return false;
    if(a.isStr()) return a.str() == b.str();
    if(a.isNone()) return true;
    if(a.isList()) return identical(a, b) || items_equal(a.list().items, b.list().items);
    if(a.isTuple()) return identical(a, b) || items_equal(a.tuple().items, b.tuple().items);
    if(a.isDict()){
        if(identical(a, b)) return true;
        const auto& x = a.dict();
        const auto& y = b.dict();
        if(x.size() != y.size()) return false;
        CompareDepth depth;
        for(const auto& kv : x.items){
            const Value* other = y.find(kv.first);
            if(!other || !values_equal(kv.second, *other)) return false;
        }
        return true;
    }
    if(a.isRange()){
        const auto& x = a.range();
        const auto& y = b.range();
        int64_t n = x.length();
        if(n != y.length()) return false;
        if(n == 0) return true;
        if(x.start != y.start) return false;
        return n == 1 || x.step == y.step;
    }
    return identical(a, b);
}

static bool ordered(CmpOp op, int c){
    switch(op){
        case CmpOp::Lt: return c < 0;
        case CmpOp::Le: return c <= 0;
        case CmpOp::Gt: return c > 0;
        case CmpOp::Ge: return c >= 0;
        default: return false;
    }
}

static bool sequence_order(CmpOp op, const Value::Items& xs, const Value::Items& ys){
    CompareDepth depth;
    size_t n = std::min(xs.size(), ys.size());
    for(size_t i = 0; i < n; ++i){
        if(identical(xs[i], ys[i]) || values_equal(xs[i], ys[i])) continue;
        return compare_order(op, xs[i], ys[i]);
    }
    int c = xs.size() < ys.size() ? -1 : (xs.size() > ys.size() ? 1 : 0);
    return ordered(op, c);
}

bool compare_order(CmpOp op, const Value& a, const Value& b){
    if(a.isNumber() && b.isNumber()){
        if(a.isIntLike() && b.isIntLike()){
            int64_t x = a.asInt(), y = b.asInt();
            return ordered(op, x < y ? -1 : (x > y ? 1 : 0));
        }
        double x = a.asFloat(), y = b.asFloat();
        if(std::isnan(x) || std::isnan(y)) return false;
        return ordered(op, x < y ? -1 : (x > y ? 1 : 0));
    }
    if(a.isStr() && b.isStr()){
        int c = a.str().compare(b.str());
        return ordered(op, c);
    }
    if(a.isList() && b.isList()) return sequence_order(op, a.list().items, b.list().items);
    if(a.isTuple() && b.isTuple()) return sequence_order(op, a.tuple().items, b.tuple().items);
    throw type_error(std::string("'") + cmpop_symbol(op) + "' not supported between instances of '"
                     + a.typeName() + "' and '" + b.typeName() + "'");
}

bool contains(const Value& container, const Value& item){
    if(container.isStr()){
        if(!item.isStr())
            throw type_error(std::string("'in <string>' requires string as left operand, not ") + item.typeName());
        return container.str().find(item.str()) != std::string::npos;
    }
    if(container.isList() || container.isTuple()){
        const auto& xs = container.isList() ? container.list().items : container.tuple().items;
        for(size_t i = 0; i < xs.size(); ++i)
            if(identical(xs[i], item) || values_equal(xs[i], item)) return true;
        return false;
    }
    if(container.isDict()) return container.dict().find(item) != nullptr;
    if(container.isRange()){
        int64_t x;
        if(item.isIntLike()) x = item.asInt();
        else if(item.isFloat() && std::floor(item.asFloat()) == item.asFloat() && std::fabs(item.asFloat()) < 9.2e18)
            x = static_cast<int64_t>(item.asFloat());
        else return false;
        const auto& r = container.range();
        if(r.step > 0 ? (x < r.start || x >= r.stop) : (x > r.start || x <= r.stop)) return false;
        return (x - r.start) % r.step == 0;
    }
    throw type_error(std::string("argument of type '") + container.typeName() + "' is not iterable");
}

bool compare(CmpOp op, const Value& a, const Value& b){
    switch(op){
        case CmpOp::Eq: return values_equal(a, b);
        case CmpOp::Ne: return !values_equal(a, b);
        case CmpOp::In: return contains(b, a);
        case CmpOp::NotIn: return !contains(b, a);
        case CmpOp::Is: return identical(a, b);
        case CmpOp::IsNot: return !identical(a, b);
        default: return compare_order(op, a, b);
    }
}

// ====== Hashing ======
static std::string tagged(char tag, const std::string& payload){
    return std::string(1, tag) + std::to_string(payload.size()) + ":" + payload;
}

std::string hash_key(const Value& key){
    if(key.isNone()) return "N";
    if(key.isIntLike()) return tagged('i', std::to_string(key.asInt()));
    if(key.isFloat()){
        double d = key.asFloat();
        if(std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.2e18)
            return tagged('i', std::to_string(static_cast<int64_t>(d)));
        return tagged('f', format_float(d));
    }
    if(key.isStr()) return tagged('s', key.str());
    if(key.isTuple()){
        CompareDepth depth;
        std::string inner;
        for(const auto& x : key.tuple().items) inner += hash_key(x);
        return tagged('t', inner);
    }
    if(key.isRange()){
        const auto& r = key.range();
        return tagged('r', std::to_string(r.start) + "," + std::to_string(r.stop) + "," + std::to_string(r.step));
    }
    throw type_error(std::string("unhashable type: '") + key.typeName() + "'");
}

// ====== Iteration ======
void for_each_item(const Value& iterable, const std::function<bool(const Value&)>& f){
    if(iterable.isList()){
        auto keep = std::get<Value::ListPtr>(iterable.v);
        for(size_t i = 0; i < keep->items.size(); ++i){
            Value x = keep->items[i];
            if(!f(x)) return;
        }
        return;
    }
    if(iterable.isTuple()){
        auto keep = std::get<Value::TuplePtr>(iterable.v);
        for(const auto& x : keep->items) if(!f(x)) return;
        return;
    }
    if(iterable.isStr()){
        std::string s = iterable.str();
        if(is_ascii(s)){
            for(char c : s) if(!f(Value::S(std::string(1, c)))) return;
        } else {
            for(auto& ch : utf8_chars(s)) if(!f(Value::S(ch))) return;
        }
        return;
    }
    if(iterable.isDict()){
        auto keep = std::get<Value::DictPtr>(iterable.v);
        size_t n = keep->size();
        for(size_t i = 0; i < n; ++i){
            Value k = keep->items[i].first;
            if(!f(k)) return;
            if(keep->size() != n)
                throw RuntimeFault("RuntimeError", "dictionary changed size during iteration");
        }
        return;
    }
    if(iterable.isRange()){
        RangeData r = iterable.range();
        int64_t n = r.length();
        for(int64_t i = 0; i < n; ++i) if(!f(Value::I(r.at(i)))) return;
        return;
    }
    throw type_error(std::string("'") + iterable.typeName() + "' object is not iterable");
}

Value::Items collect_items(const Value& iterable){
    if(iterable.isList()) return iterable.list().items;
    if(iterable.isTuple()) return iterable.tuple().items;
    Value::Items out;
    for_each_item(iterable, [&out](const Value& x){ out.push_back(x); return true; });
    return out;
}

int64_t length_of(const Value& v){
    if(v.isStr()) return static_cast<int64_t>(utf8_length(v.str()));
    if(v.isList()) return static_cast<int64_t>(v.list().items.size());
    if(v.isTuple()) return static_cast<int64_t>(v.tuple().items.size());
    if(v.isDict()) return static_cast<int64_t>(v.dict().size());
    if(v.isRange()) return v.range().length();
    throw type_error(std::string("object of type '") + v.typeName() + "' has no len()");
}

// ====== Subscripts ======
int64_t adjust_slice(int64_t len, const SliceSpec& spec, int64_t& start, int64_t& stop, int64_t& step){
    step = spec.step.value_or(1);
    if(step == 0) throw value_error("slice step cannot be zero");
    auto clamp = [&](int64_t i, int64_t lo_default_neg) -> int64_t {
        if(i < 0){
            i += len;
            if(i < 0) i = step < 0 ? lo_default_neg : 0;
        } else if(i >= len){
            i = step < 0 ? len - 1 : len;
        }
        return i;
    };
    start = spec.lo ? clamp(*spec.lo, -1) : (step < 0 ? len - 1 : 0);
    stop  = spec.hi ? clamp(*spec.hi, -1) : (step < 0 ? -1 : len);
    if(step < 0) return stop < start ? (start - stop - 1) / (-step) + 1 : 0;
    return start < stop ? (stop - start - 1) / step + 1 : 0;
}

static int64_t normalize_index(const Value& index, int64_t len, const char* what){
    int64_t i = index.asInt();
    if(i < 0) i += len;
    if(i < 0 || i >= len) throw RuntimeFault("IndexError", std::string(what) + " index out of range");
    return i;
}

static RuntimeFault bad_index(const Value& obj, const Value& index){
    if(obj.isStr())
        return type_error(std::string("string indices must be integers, not '") + index.typeName() + "'");
    return type_error(std::string(obj.typeName()) + " indices must be integers or slices, not " + index.typeName());
}

Value get_item(const Value& obj, const Value& index){
    if(obj.isDict()){
        const Value* v = obj.dict().find(index);
        if(!v) throw RuntimeFault("KeyError", index.repr());
        return *v;
    }
    if(obj.isList() || obj.isTuple() || obj.isStr() || obj.isRange()){
        if(!index.isIntLike()) throw bad_index(obj, index);
        if(obj.isList()){
            const auto& xs = obj.list().items;
            return xs[static_cast<size_t>(normalize_index(index, static_cast<int64_t>(xs.size()), "list"))];
        }
        if(obj.isTuple()){
            const auto& xs = obj.tuple().items;
            return xs[static_cast<size_t>(normalize_index(index, static_cast<int64_t>(xs.size()), "tuple"))];
        }
        if(obj.isRange()){
            const auto& r = obj.range();
            return Value::I(r.at(normalize_index(index, r.length(), "range object")));
        }
        const std::string& s = obj.str();
        if(is_ascii(s))
            return Value::S(std::string(1, s[static_cast<size_t>(normalize_index(index, static_cast<int64_t>(s.size()), "string"))]));
        auto chars = utf8_chars(s);
        return Value::S(chars[static_cast<size_t>(normalize_index(index, static_cast<int64_t>(chars.size()), "string"))]);
    }
    throw type_error(std::string("'") + obj.typeName() + "' object is not subscriptable");
}

template<typename Seq>
static Seq take_slice(const Seq& xs, const SliceSpec& spec){
    int64_t start, stop, step;
    int64_t n = adjust_slice(static_cast<int64_t>(xs.size()), spec, start, stop, step);
    Seq out;
    out.reserve(static_cast<size_t>(n));
    for(int64_t i = 0, k = start; i < n; ++i, k += step) out.push_back(xs[static_cast<size_t>(k)]);
    return out;
}

Value get_slice(const Value& obj, const SliceSpec& spec){
    if(obj.isList()) return Value::L(take_slice(obj.list().items, spec));
    if(obj.isTuple()) return Value::T(take_slice(obj.tuple().items, spec));
    if(obj.isStr()){
        if(is_ascii(obj.str())) return Value::S(take_slice(obj.str(), spec));
        std::string out;
        for(auto& ch : take_slice(utf8_chars(obj.str()), spec)) out += ch;
        return Value::S(out);
    }
    if(obj.isRange()){
        const auto& r = obj.range();
        int64_t start, stop, step;
        int64_t n = adjust_slice(r.length(), spec, start, stop, step);
        int64_t nstep = checked_mul(r.step, step);
        int64_t nstart = r.at(start);
        return Value::R(nstart, checked_add(nstart, checked_mul(n, nstep)), nstep);
    }
    if(obj.isDict()) throw type_error("unhashable type: 'slice'");
    throw type_error(std::string("'") + obj.typeName() + "' object is not subscriptable");
}

void set_item(const Value& obj, const Value& index, const Value& val){
    if(obj.isDict()){
        obj.dict().set(index, val);
        return;
    }
    if(obj.isList()){
        if(!index.isIntLike()) throw bad_index(obj, index);
        auto& xs = obj.list().items;
        int64_t i = index.asInt();
        int64_t len = static_cast<int64_t>(xs.size());
        if(i < 0) i += len;
        if(i < 0 || i >= len) throw RuntimeFault("IndexError", "list assignment index out of range");
        xs[static_cast<size_t>(i)] = val;
        return;
    }
    throw type_error(std::string("'") + obj.typeName() + "' object does not support item assignment");
}

void set_slice(const Value& obj, const SliceSpec& spec, const Value& val){
    if(!obj.isList())
        throw type_error(std::string("'") + obj.typeName() + "' object does not support item assignment");
    Value::Items repl = collect_items(val);
    auto& xs = obj.list().items;
    int64_t start, stop, step;
    int64_t n = adjust_slice(static_cast<int64_t>(xs.size()), spec, start, stop, step);
    if(step == 1){
        if(stop < start) stop = start;
        xs.erase(xs.begin() + start, xs.begin() + stop);
        xs.insert(xs.begin() + start, repl.begin(), repl.end());
        return;
    }
    if(static_cast<int64_t>(repl.size()) != n)
        throw value_error("attempt to assign sequence of size " + std::to_string(repl.size())
                          + " to extended slice of size " + std::to_string(n));
    for(int64_t i = 0, k = start; i < n; ++i, k += step) xs[static_cast<size_t>(k)] = repl[static_cast<size_t>(i)];
}

void del_item(const Value& obj, const Value& index){
    if(obj.isDict()){
        if(!obj.dict().erase(index)) throw RuntimeFault("KeyError", index.repr());
        return;
    }
    if(obj.isList()){
        if(!index.isIntLike()) throw bad_index(obj, index);
        auto& xs = obj.list().items;
        int64_t i = index.asInt();
        int64_t len = static_cast<int64_t>(xs.size());
        if(i < 0) i += len;
        if(i < 0 || i >= len) throw RuntimeFault("IndexError", "list assignment index out of range");
        xs.erase(xs.begin() + i);
        return;
    }
    throw type_error(std::string("'") + obj.typeName() + "' object doesn't support item deletion");
}

void del_slice(const Value& obj, const SliceSpec& spec){
    if(!obj.isList())
        throw type_error(std::string("'") + obj.typeName() + "' object doesn't support item deletion");
    auto& xs = obj.list().items;
    int64_t start, stop, step;
    int64_t n = adjust_slice(static_cast<int64_t>(xs.size()), spec, start, stop, step);
    if(n == 0) return;
    if(step < 0){
        start = start + (n - 1) * step;
        step = -step;
    }
    Value::Items kept;
    kept.reserve(xs.size() - static_cast<size_t>(n));
    int64_t next = start, removed = 0;
    for(int64_t i = 0; i < static_cast<int64_t>(xs.size()); ++i){
        if(removed < n && i == next){
            ++removed;
            next += step;
            continue;
        }
        kept.push_back(xs[static_cast<size_t>(i)]);
    }
    xs.swap(kept);
}

} // namespace Sandbox
