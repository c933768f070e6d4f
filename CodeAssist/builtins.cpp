#include "CodeAssist.h"

namespace Sandbox {

namespace {

const std::pair<Capability, const char*> kCapabilityNames[] = {
    {Capability::Print, "print"},
    {Capability::Len, "len"},
    {Capability::Str, "str"},
    {Capability::Int, "int"},
    {Capability::Float, "float"},
    {Capability::Bool, "bool"},
    {Capability::List, "list"},
    {Capability::Tuple, "tuple"},
    {Capability::Dict, "dict"},
    {Capability::Range, "range"},
    {Capability::Enumerate, "enumerate"},
    {Capability::Zip, "zip"},
    {Capability::Sum, "sum"},
    {Capability::Min, "min"},
    {Capability::Max, "max"},
    {Capability::Round, "round"},
    {Capability::Abs, "abs"},
    {Capability::Sorted, "sorted"},
};

} // namespace

const char* capability_name(Capability c){
    for(const auto& kv : kCapabilityNames) if(kv.first == c) return kv.second;
    return "?";
}

std::optional<Capability> capability_from_name(const std::string& name){
    for(const auto& kv : kCapabilityNames) if(name == kv.second) return kv.first;
    return std::nullopt;
}

CapabilityAllowlist::CapabilityAllowlist(std::vector<Capability> c) : caps(std::move(c)) {}

const CapabilityAllowlist& CapabilityAllowlist::standard(){
    static const CapabilityAllowlist all([]{
        std::vector<Capability> v;
        for(const auto& kv : kCapabilityNames) v.push_back(kv.first);
        return v;
    }());
    return all;
}

bool CapabilityAllowlist::contains(Capability c) const {
    return std::find(caps.begin(), caps.end(), c) != caps.end();
}

bool CapabilityAllowlist::contains(const std::string& name) const {
    auto c = capability_from_name(name);
    return c && contains(*c);
}

// ====== Primitives ======
namespace {

RuntimeFault not_an_integer(const Value& v){
    return type_error(std::string("'") + v.typeName() + "' object cannot be interpreted as an integer");
}

int64_t int_arg(const Value& v){
    if(!v.isIntLike()) throw not_an_integer(v);
    return v.asInt();
}

int64_t float_to_int(double d){
    if(std::isnan(d)) throw value_error("cannot convert float NaN to integer");
    if(std::isinf(d)) throw RuntimeFault("OverflowError", "cannot convert float infinity to integer");
    double t = std::trunc(d);
    if(t >= 9223372036854775808.0 || t < -9223372036854775808.0)
        throw RuntimeFault("OverflowError", "integer out of range (values are limited to 64 bits)");
    return static_cast<int64_t>(t);
}

int64_t parse_int_literal(const std::string& text, int64_t base){
    auto invalid = [&]{
        return value_error("invalid literal for int() with base " + std::to_string(base) + ": " + Value::S(text).repr());
    };
    std::string s = trim_copy(text);
    size_t i = 0;
    bool neg = false;
    if(i < s.size() && (s[i] == '+' || s[i] == '-')){ neg = s[i] == '-'; ++i; }
    int b = static_cast<int>(base);
    if(i + 1 < s.size() && s[i] == '0'){
        char p = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i + 1])));
        int prefixed = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
        if(prefixed && (b == 0 || b == prefixed)){
            b = prefixed;
            i += 2;
            if(i < s.size() && s[i] == '_') ++i;
        }
    }
    if(b == 0){
        b = 10;
        if(s.size() - i > 1 && s[i] == '0' && s.find_first_not_of("0_", i) != std::string::npos) throw invalid();
    }
    if(i >= s.size()) throw invalid();
    uint64_t acc = 0;
    bool last_digit = false;
    const uint64_t limit = neg ? 9223372036854775808ULL : 9223372036854775807ULL;
    for(; i < s.size(); ++i){
        char c = s[i];
        if(c == '_'){
            if(!last_digit) throw invalid();
            last_digit = false;
            continue;
        }
        int d;
        if(std::isdigit(static_cast<unsigned char>(c))) d = c - '0';
        else if(std::isalpha(static_cast<unsigned char>(c))) d = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        else throw invalid();
        if(d >= b) throw invalid();
        if(acc > (limit - static_cast<uint64_t>(d)) / static_cast<uint64_t>(b))
            throw RuntimeFault("OverflowError", "int too large (values are limited to 64 bits)");
        acc = acc * static_cast<uint64_t>(b) + static_cast<uint64_t>(d);
        last_digit = true;
    }
    if(!last_digit) throw invalid();
    if(neg) return acc == 9223372036854775808ULL ? std::numeric_limits<int64_t>::min() : -static_cast<int64_t>(acc);
    return static_cast<int64_t>(acc);
}

double parse_float_literal(const std::string& text){
    std::string s = trim_copy(text);
    std::string lower;
    for(char c : s) if(c != '_') lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    std::string body = lower;
    double sign = 1.0;
    if(!body.empty() && (body[0] == '+' || body[0] == '-')){
        if(body[0] == '-') sign = -1.0;
        body.erase(0, 1);
    }
    if(body == "inf" || body == "infinity") return sign * std::numeric_limits<double>::infinity();
    if(body == "nan") return std::numeric_limits<double>::quiet_NaN();
    bool ok = !body.empty() && body.find_first_not_of("0123456789.e+-") == std::string::npos;
    if(ok){
        char* end = nullptr;
        double d = std::strtod(lower.c_str(), &end);
        if(end && *end == '\0') return d;
    }
    throw value_error("could not convert string to float: " + Value::S(text).repr());
}

Value round_value(const Value& x, const Value* nd){
    if(!x.isNumber())
        throw type_error(std::string("type ") + x.typeName() + " doesn't define __round__ method");
    if(!nd || nd->isNone()){
        if(x.isIntLike()) return Value::I(x.asInt());
        double d = x.asFloat();
        return Value::I(float_to_int(std::nearbyint(d)));
    }
    int64_t n = int_arg(*nd);
    if(x.isIntLike()){
        int64_t v = x.asInt();
        if(n >= 0) return Value::I(v);
        if(n < -18) return Value::I(0);
        int64_t p = 1;
        for(int64_t i = 0; i < -n; ++i) p *= 10;
        int64_t q = v / p, r = v % p;
        if(r < 0){ r += p; --q; }
        if(2 * r > p || (2 * r == p && (q & 1))) ++q;
        return Value::I(checked_mul(q, p));
    }
    double d = x.asFloat();
    if(!std::isfinite(d)) return Value::F(d);
    if(n > 300) return Value::F(d);
    if(n >= 0){
        char buf[768];
        std::snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(n), d);
        return Value::F(std::strtod(buf, nullptr));
    }
    if(n < -308) return Value::F(0.0 * d);
    double p = std::pow(10.0, static_cast<double>(-n));
    return Value::F(std::nearbyint(d / p) * p);
}

// Shared by min() and max().
Value extremum(CallArgs& a, const char* fn, bool want_max){
    a.expectKeywords(fn, {"key", "default"});
    if(a.args.empty()) throw type_error(std::string(fn) + " expected at least 1 argument, got 0");
    const Value* key = a.kwarg("key");
    const Value* dflt = a.kwarg("default");
    Value::Items xs;
    if(a.args.size() == 1){
        xs = collect_items(a.args[0]);
        if(xs.empty()){
            if(dflt) return *dflt;
            throw value_error(std::string(fn) + "() iterable argument is empty");
        }
    } else {
        if(dflt) throw type_error(std::string("Cannot specify a default for ") + fn + "() with multiple positional arguments");
        xs = a.args;
    }
    bool keyed = key && !key->isNone();
    Value best = xs[0];
    Value best_key = keyed ? a.in.call(*key, {best}) : best;
    for(size_t i = 1; i < xs.size(); ++i){
        Value k = keyed ? a.in.call(*key, {xs[i]}) : xs[i];
        bool better = want_max ? compare_order(CmpOp::Gt, k, best_key) : compare_order(CmpOp::Lt, k, best_key);
        if(better){
            best = xs[i];
            best_key = k;
        }
    }
    return best;
}

using Impl = BuiltinFn::Impl;

Impl capability_impl(Capability c){
    switch(c){
        case Capability::Print:
            return [](CallArgs& a){
                a.expectKeywords("print", {"sep", "end", "flush"});
                std::string sep = " ", end = "\n";
                if(const Value* v = a.kwarg("sep")){
                    if(!v->isNone() && !v->isStr())
                        throw type_error(std::string("sep must be None or a string, not ") + v->typeName());
                    if(v->isStr()) sep = v->str();
                }
                if(const Value* v = a.kwarg("end")){
                    if(!v->isNone() && !v->isStr())
                        throw type_error(std::string("end must be None or a string, not ") + v->typeName());
                    if(v->isStr()) end = v->str();
                }
                std::string line;
                for(size_t i = 0; i < a.args.size(); ++i){
                    if(i) line += sep;
                    line += a.args[i].toStr();
                }
                line += end;
                a.in.out << line;
                return Value::None();
            };
        case Capability::Len:
            return [](CallArgs& a){
                a.expectKeywords("len", {});
                a.expectCount("len", 1, 1);
                return Value::I(length_of(a.args[0]));
            };
        case Capability::Str:
            return [](CallArgs& a){
                a.expectKeywords("str", {});
                a.expectCount("str", 0, 1);
                return Value::S(a.args.empty() ? std::string() : a.args[0].toStr());
            };
        case Capability::Int:
            return [](CallArgs& a){
                a.expectKeywords("int", {"base"});
                a.expectCount("int", 0, 2);
                const Value* base = a.args.size() > 1 ? &a.args[1] : a.kwarg("base");
                if(a.args.empty()){
                    if(base) throw type_error("int() missing string argument");
                    return Value::I(0);
                }
                const Value& x = a.args[0];
                if(base){
                    int64_t b = int_arg(*base);
                    if(b != 0 && (b < 2 || b > 36)) throw value_error("int() base must be >= 2 and <= 36, or 0");
                    if(!x.isStr()) throw type_error("int() can't convert non-string with explicit base");
                    return Value::I(parse_int_literal(x.str(), b));
                }
                if(x.isIntLike()) return Value::I(x.asInt());
                if(x.isFloat()) return Value::I(float_to_int(x.asFloat()));
                if(x.isStr()) return Value::I(parse_int_literal(x.str(), 10));
                throw type_error(std::string("int() argument must be a string, a bytes-like object or a real number, not '")
                                 + x.typeName() + "'");
            };
        case Capability::Float:
            return [](CallArgs& a){
                a.expectKeywords("float", {});
                a.expectCount("float", 0, 1);
                if(a.args.empty()) return Value::F(0.0);
                const Value& x = a.args[0];
                if(x.isNumber()) return Value::F(x.asFloat());
                if(x.isStr()) return Value::F(parse_float_literal(x.str()));
                throw type_error(std::string("float() argument must be a string or a real number, not '")
                                 + x.typeName() + "'");
            };
        case Capability::Bool:
            return [](CallArgs& a){
                a.expectKeywords("bool", {});
                a.expectCount("bool", 0, 1);
                return Value::B(!a.args.empty() && a.args[0].truthy());
            };
        case Capability::List:
            return [](CallArgs& a){
                a.expectKeywords("list", {});
                a.expectCount("list", 0, 1);
                return Value::L(a.args.empty() ? Value::Items() : collect_items(a.args[0]));
            };
        case Capability::Tuple:
            return [](CallArgs& a){
                a.expectKeywords("tuple", {});
                a.expectCount("tuple", 0, 1);
                if(!a.args.empty() && a.args[0].isTuple()) return a.args[0];
                return Value::T(a.args.empty() ? Value::Items() : collect_items(a.args[0]));
            };
        case Capability::Dict:
            return [](CallArgs& a){
                a.expectCount("dict", 0, 1);
                Value d = Value::D();
                if(!a.args.empty()) dict_update(d.dict(), a.args[0]);
                for(const auto& kv : a.kwargs) d.dict().set(Value::S(kv.first), kv.second);
                return d;
            };
        case Capability::Range:
            return [](CallArgs& a){
                a.expectKeywords("range", {});
                if(a.args.empty()) throw type_error("range expected at least 1 argument, got 0");
                if(a.args.size() > 3)
                    throw type_error("range expected at most 3 arguments, got " + std::to_string(a.args.size()));
                int64_t start = 0, stop, step = 1;
                if(a.args.size() == 1){
                    stop = int_arg(a.args[0]);
                } else {
                    start = int_arg(a.args[0]);
                    stop = int_arg(a.args[1]);
                    if(a.args.size() == 3) step = int_arg(a.args[2]);
                }
                if(step == 0) throw value_error("range() arg 3 must not be zero");
                return Value::R(start, stop, step);
            };
        case Capability::Enumerate:
            return [](CallArgs& a){
                a.expectKeywords("enumerate", {"start"});
                a.expectCount("enumerate", 1, 2);
                const Value* sv = a.args.size() > 1 ? &a.args[1] : a.kwarg("start");
                int64_t i = sv ? int_arg(*sv) : 0;
                Value::Items out;
                for_each_item(a.args[0], [&](const Value& x){
                    out.push_back(Value::T({Value::I(i), x}));
                    i = checked_add(i, 1);
                    return true;
                });
                return Value::L(std::move(out));
            };
        case Capability::Zip:
            return [](CallArgs& a){
                a.expectKeywords("zip", {"strict"});
                std::vector<Value::Items> cols;
                size_t n = std::numeric_limits<size_t>::max();
                for(size_t i = 0; i < a.args.size(); ++i){
                    const Value& it = a.args[i];
                    if(!(it.isStr() || it.isList() || it.isTuple() || it.isDict() || it.isRange()))
                        throw type_error("zip argument #" + std::to_string(i + 1) + " must support iteration");
                    cols.push_back(collect_items(it));
                    n = std::min(n, cols.back().size());
                }
                const Value* strict = a.kwarg("strict");
                if(strict && strict->truthy()){
                    for(size_t i = 0; i < cols.size(); ++i)
                        if(cols[i].size() != n)
                            throw value_error("zip() argument " + std::to_string(i + 1) + " is "
                                              + (cols[i].size() > n ? "longer" : "shorter") + " than argument 1");
                }
                Value::Items out;
                if(cols.empty()) return Value::L(std::move(out));
                for(size_t r = 0; r < n; ++r){
                    Value::Items row;
                    row.reserve(cols.size());
                    for(const auto& c : cols) row.push_back(c[r]);
                    out.push_back(Value::T(std::move(row)));
                }
                return Value::L(std::move(out));
            };
        case Capability::Sum:
            return [](CallArgs& a){
                a.expectKeywords("sum", {"start"});
                a.expectCount("sum", 1, 2);
                Value acc = a.args.size() > 1 ? a.args[1] : (a.kwarg("start") ? *a.kwarg("start") : Value::I(0));
                if(acc.isStr()) throw type_error("sum() can't sum strings [use ''.join(seq) instead]");
                for_each_item(a.args[0], [&](const Value& x){
                    acc = binary_op(BinOp::Add, acc, x);
                    return true;
                });
                return acc;
            };
        case Capability::Min:
            return [](CallArgs& a){ return extremum(a, "min", false); };
        case Capability::Max:
            return [](CallArgs& a){ return extremum(a, "max", true); };
        case Capability::Round:
            return [](CallArgs& a){
                a.expectKeywords("round", {"ndigits"});
                a.expectCount("round", 1, 2);
                const Value* nd = a.args.size() > 1 ? &a.args[1] : a.kwarg("ndigits");
                return round_value(a.args[0], nd);
            };
        case Capability::Abs:
            return [](CallArgs& a){
                a.expectKeywords("abs", {});
                a.expectCount("abs", 1, 1);
                const Value& x = a.args[0];
                if(x.isIntLike()){
                    int64_t v = x.asInt();
                    if(v == std::numeric_limits<int64_t>::min())
                        throw RuntimeFault("OverflowError", "integer overflow (values are limited to 64 bits)");
                    return Value::I(v < 0 ? -v : v);
                }
                if(x.isFloat()) return Value::F(std::fabs(x.asFloat()));
                throw type_error(std::string("bad operand type for abs(): '") + x.typeName() + "'");
            };
        case Capability::Sorted:
            return [](CallArgs& a){
                a.expectKeywords("sorted", {"key", "reverse"});
                if(a.args.size() != 1)
                    throw type_error("sorted expected 1 argument, got " + std::to_string(a.args.size()));
                Value::Items xs = collect_items(a.args[0]);
                const Value* rev = a.kwarg("reverse");
                sort_items(a.in, xs, a.kwarg("key"), rev && rev->truthy());
                return Value::L(std::move(xs));
            };
    }
    return nullptr;
}

} // namespace

void install_builtins(std::shared_ptr<Env> g, const CapabilityAllowlist& caps){
    TRACE_FN("capabilities=", caps.entries().size());
    for(Capability c : caps.entries()){
        std::string name = capability_name(c);
        auto b = std::make_shared<BuiltinFn>();
        b->name = name;
        b->fn = capability_impl(c);
        g->set(name, Value::Built(std::move(b)));
    }
}

} // namespace Sandbox
