#include "CodeAssist.h"

namespace Sandbox {

bool is_dunder(const std::string& name){
    return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

namespace {

using Impl = BoundMethod::Impl;
using Table = std::unordered_map<std::string, Impl>;

const char* const kWhitespace = " \t\n\r\f\v";

void arity(const CallArgs& a, const std::string& fn, size_t min, size_t max){
    a.expectKeywords(fn.c_str(), {});
    a.expectCount(fn.c_str(), min, max);
}

const std::string& str_arg(const Value& v, const std::string& fn, const char* what = "argument"){
    if(!v.isStr())
        throw type_error(fn + "() " + what + " must be str, not " + v.typeName());
    return v.str();
}

std::optional<int64_t> opt_index(const CallArgs& a, size_t i){
    if(i >= a.args.size() || a.args[i].isNone()) return std::nullopt;
    if(!a.args[i].isIntLike())
        throw type_error("slice indices must be integers or None or have an __index__ method");
    return a.args[i].asInt();
}

// Byte offset of code point `ci` in `s`.
size_t byte_at(const std::string& s, int64_t ci){
    if(is_ascii(s)) return static_cast<size_t>(ci);
    size_t i = 0;
    for(int64_t n = 0; n < ci && i < s.size(); ++n){
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = c < 0x80 ? 1 : (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 1;
        i += std::min(len, s.size() - i);
    }
    return i;
}

// Byte window [b0, b1) selected by optional start/end arguments at `first`.
// Returns false when start lies past the end of the string.
bool window(const std::string& s, const CallArgs& a, size_t first, size_t& b0, size_t& b1, int64_t& c0){
    int64_t n = static_cast<int64_t>(utf8_length(s));
    SliceSpec spec;
    spec.lo = opt_index(a, first);
    spec.hi = opt_index(a, first + 1);
    int64_t lo = spec.lo.value_or(0);
    if(lo < 0) lo = std::max<int64_t>(0, lo + n);
    if(lo > n) return false;
    int64_t start, stop, step;
    adjust_slice(n, spec, start, stop, step);
    if(stop < start) stop = start;
    c0 = start;
    b0 = byte_at(s, start);
    b1 = byte_at(s, stop);
    return true;
}

std::string ascii_map(const std::string& s, int (*fn)(int)){
    std::string out = s;
    for(auto& c : out){
        unsigned char u = static_cast<unsigned char>(c);
        if(u < 0x80) c = static_cast<char>(fn(u));
    }
    return out;
}

std::string strip_chars(const std::string& s, const Value* chars, bool left, bool right){
    std::vector<std::string> cs = utf8_chars(s);
    std::set<std::string> set;
    if(chars && !chars->isNone()){
        for(auto& c : utf8_chars(chars->str())) set.insert(c);
    } else {
        for(const char* w = kWhitespace; *w; ++w) set.insert(std::string(1, *w));
    }
    size_t b = 0, e = cs.size();
    if(left) while(b < e && set.count(cs[b])) ++b;
    if(right) while(e > b && set.count(cs[e - 1])) --e;
    std::string out;
    for(size_t i = b; i < e; ++i) out += cs[i];
    return out;
}

Value split_string(const std::string& s, const Value* sep, int64_t maxsplit){
    Value::Items parts;
    if(!sep || sep->isNone()){
        size_t i = 0, n = s.size();
        auto ws = [&](size_t k){ return std::strchr(kWhitespace, s[k]) != nullptr && s[k] != '\0'; };
        while(maxsplit != 0){
            while(i < n && ws(i)) ++i;
            if(i >= n) break;
            size_t j = i;
            while(j < n && !ws(j)) ++j;
            parts.push_back(Value::S(s.substr(i, j - i)));
            i = j;
            if(maxsplit > 0) --maxsplit;
        }
        while(i < n && ws(i)) ++i;
        if(i < n) parts.push_back(Value::S(s.substr(i)));
        return Value::L(std::move(parts));
    }
    const std::string& d = sep->str();
    if(d.empty()) throw value_error("empty separator");
    size_t start = 0;
    while(maxsplit != 0){
        size_t p = s.find(d, start);
        if(p == std::string::npos) break;
        parts.push_back(Value::S(s.substr(start, p - start)));
        start = p + d.size();
        if(maxsplit > 0) --maxsplit;
    }
    parts.push_back(Value::S(s.substr(start)));
    return Value::L(std::move(parts));
}

std::string replace_string(const std::string& s, const std::string& from, const std::string& to, int64_t count){
    std::string out;
    if(from.empty()){
        auto cs = utf8_chars(s);
        for(size_t i = 0; i <= cs.size(); ++i){
            if(count != 0){
                out += to;
                if(count > 0) --count;
            }
            if(i < cs.size()) out += cs[i];
        }
        return out;
    }
    size_t start = 0;
    while(count != 0){
        size_t p = s.find(from, start);
        if(p == std::string::npos) break;
        out.append(s, start, p - start);
        out += to;
        start = p + from.size();
        if(count > 0) --count;
    }
    out.append(s, start, std::string::npos);
    return out;
}

Value affix_check(const std::string& fn, const Value& self, CallArgs& a, bool prefix){
    arity(a, "str." + fn, 1, 3);
    const std::string& s = self.str();
    size_t b0, b1;
    int64_t c0;
    if(!window(s, a, 1, b0, b1, c0)) return Value::B(false);
    std::string sub = s.substr(b0, b1 - b0);
    auto test = [&](const Value& v){
        if(!v.isStr())
            throw type_error(fn + " first arg must be str or a tuple of str, not " + v.typeName());
        const std::string& x = v.str();
        if(x.size() > sub.size()) return false;
        return prefix ? sub.compare(0, x.size(), x) == 0
                      : sub.compare(sub.size() - x.size(), x.size(), x) == 0;
    };
    const Value& arg = a.args[0];
    if(arg.isTuple()){
        for(const auto& v : arg.tuple().items) if(test(v)) return Value::B(true);
        return Value::B(false);
    }
    if(!arg.isStr())
        throw type_error(fn + " first arg must be str or a tuple of str, not " + arg.typeName());
    return Value::B(test(arg));
}

const Table& str_methods(){
    static const Table t = {
        {"upper", [](const Value& self, CallArgs& a){
            arity(a, "str.upper", 0, 0);
            return Value::S(ascii_map(self.str(), ::toupper));
        }},
        {"lower", [](const Value& self, CallArgs& a){
            arity(a, "str.lower", 0, 0);
            return Value::S(ascii_map(self.str(), ::tolower));
        }},
        {"strip", [](const Value& self, CallArgs& a){
            arity(a, "str.strip", 0, 1);
            const Value* chars = a.args.empty() ? nullptr : &a.args[0];
            if(chars && !chars->isNone()) str_arg(*chars, "strip", "arg");
            return Value::S(strip_chars(self.str(), chars, true, true));
        }},
        {"lstrip", [](const Value& self, CallArgs& a){
            arity(a, "str.lstrip", 0, 1);
            const Value* chars = a.args.empty() ? nullptr : &a.args[0];
            if(chars && !chars->isNone()) str_arg(*chars, "lstrip", "arg");
            return Value::S(strip_chars(self.str(), chars, true, false));
        }},
        {"rstrip", [](const Value& self, CallArgs& a){
            arity(a, "str.rstrip", 0, 1);
            const Value* chars = a.args.empty() ? nullptr : &a.args[0];
            if(chars && !chars->isNone()) str_arg(*chars, "rstrip", "arg");
            return Value::S(strip_chars(self.str(), chars, false, true));
        }},
        {"split", [](const Value& self, CallArgs& a){
            a.expectKeywords("str.split", {"sep", "maxsplit"});
            a.expectCount("str.split", 0, 2);
            const Value* sep = a.args.size() > 0 ? &a.args[0] : a.kwarg("sep");
            const Value* maxv = a.args.size() > 1 ? &a.args[1] : a.kwarg("maxsplit");
            if(sep && !sep->isNone()) str_arg(*sep, "split", "sep");
            int64_t maxsplit = -1;
            if(maxv){
                if(!maxv->isIntLike())
                    throw type_error(std::string("'") + maxv->typeName() + "' object cannot be interpreted as an integer");
                maxsplit = maxv->asInt();
            }
            return split_string(self.str(), sep, maxsplit);
        }},
        {"join", [](const Value& self, CallArgs& a){
            arity(a, "str.join", 1, 1);
            std::string out;
            size_t i = 0;
            for_each_item(a.args[0], [&](const Value& x){
                if(!x.isStr())
                    throw type_error("sequence item " + std::to_string(i) + ": expected str instance, "
                                     + x.typeName() + " found");
                if(i) out += self.str();
                out += x.str();
                ++i;
                return true;
            });
            return Value::S(std::move(out));
        }},
        {"replace", [](const Value& self, CallArgs& a){
            arity(a, "str.replace", 2, 3);
            const std::string& from = str_arg(a.args[0], "replace", "argument 1");
            const std::string& to = str_arg(a.args[1], "replace", "argument 2");
            int64_t count = -1;
            if(a.args.size() > 2){
                if(!a.args[2].isIntLike())
                    throw type_error(std::string("'") + a.args[2].typeName() + "' object cannot be interpreted as an integer");
                count = a.args[2].asInt();
            }
            return Value::S(replace_string(self.str(), from, to, count));
        }},
        {"startswith", [](const Value& self, CallArgs& a){ return affix_check("startswith", self, a, true); }},
        {"endswith", [](const Value& self, CallArgs& a){ return affix_check("endswith", self, a, false); }},
        {"find", [](const Value& self, CallArgs& a){
            arity(a, "str.find", 1, 3);
            const std::string& s = self.str();
            const std::string& sub = str_arg(a.args[0], "find");
            size_t b0, b1;
            int64_t c0;
            if(!window(s, a, 1, b0, b1, c0)) return Value::I(-1);
            size_t p = s.find(sub, b0);
            if(p == std::string::npos || p + sub.size() > b1) return Value::I(-1);
            return Value::I(static_cast<int64_t>(utf8_index_of(s, p)));
        }},
        {"count", [](const Value& self, CallArgs& a){
            arity(a, "str.count", 1, 3);
            const std::string& s = self.str();
            const std::string& sub = str_arg(a.args[0], "count");
            size_t b0, b1;
            int64_t c0;
            if(!window(s, a, 1, b0, b1, c0)) return Value::I(0);
            if(sub.empty())
                return Value::I(static_cast<int64_t>(utf8_length(s.substr(b0, b1 - b0))) + 1);
            int64_t n = 0;
            for(size_t p = s.find(sub, b0); p != std::string::npos && p + sub.size() <= b1; p = s.find(sub, p + sub.size()))
                ++n;
            return Value::I(n);
        }},
        {"isdigit", [](const Value& self, CallArgs& a){
            arity(a, "str.isdigit", 0, 0);
            const std::string& s = self.str();
            if(s.empty()) return Value::B(false);
            for(unsigned char c : s) if(!std::isdigit(c)) return Value::B(false);
            return Value::B(true);
        }},
        {"isalpha", [](const Value& self, CallArgs& a){
            arity(a, "str.isalpha", 0, 0);
            const std::string& s = self.str();
            if(s.empty()) return Value::B(false);
            for(unsigned char c : s) if(c >= 0x80 || !std::isalpha(c)) return Value::B(false);
            return Value::B(true);
        }},
    };
    return t;
}

const Table& list_methods(){
    static const Table t = {
        {"append", [](const Value& self, CallArgs& a){
            arity(a, "list.append", 1, 1);
            self.list().items.push_back(a.args[0]);
            return Value::None();
        }},
        {"extend", [](const Value& self, CallArgs& a){
            arity(a, "list.extend", 1, 1);
            Value::Items extra = collect_items(a.args[0]);
            auto& xs = self.list().items;
            xs.insert(xs.end(), extra.begin(), extra.end());
            return Value::None();
        }},
        {"insert", [](const Value& self, CallArgs& a){
            arity(a, "list.insert", 2, 2);
            if(!a.args[0].isIntLike())
                throw type_error(std::string("'") + a.args[0].typeName() + "' object cannot be interpreted as an integer");
            auto& xs = self.list().items;
            int64_t n = static_cast<int64_t>(xs.size());
            int64_t i = a.args[0].asInt();
            if(i < 0) i = std::max<int64_t>(0, i + n);
            if(i > n) i = n;
            xs.insert(xs.begin() + i, a.args[1]);
            return Value::None();
        }},
        {"pop", [](const Value& self, CallArgs& a){
            arity(a, "list.pop", 0, 1);
            auto& xs = self.list().items;
            if(xs.empty()) throw RuntimeFault("IndexError", "pop from empty list");
            int64_t n = static_cast<int64_t>(xs.size());
            int64_t i = n - 1;
            if(!a.args.empty()){
                if(!a.args[0].isIntLike())
                    throw type_error(std::string("'") + a.args[0].typeName() + "' object cannot be interpreted as an integer");
                i = a.args[0].asInt();
                if(i < 0) i += n;
                if(i < 0 || i >= n) throw RuntimeFault("IndexError", "pop index out of range");
            }
            Value v = xs[static_cast<size_t>(i)];
            xs.erase(xs.begin() + i);
            return v;
        }},
        {"remove", [](const Value& self, CallArgs& a){
            arity(a, "list.remove", 1, 1);
            auto& xs = self.list().items;
            for(size_t i = 0; i < xs.size(); ++i){
                if(identical(xs[i], a.args[0]) || values_equal(xs[i], a.args[0])){
                    xs.erase(xs.begin() + static_cast<std::ptrdiff_t>(i));
                    return Value::None();
                }
            }
            throw value_error("list.remove(x): x not in list");
        }},
        {"index", [](const Value& self, CallArgs& a){
            arity(a, "list.index", 1, 3);
            const auto& xs = self.list().items;
            SliceSpec spec;
            spec.lo = opt_index(a, 1);
            spec.hi = opt_index(a, 2);
            int64_t start, stop, step;
            adjust_slice(static_cast<int64_t>(xs.size()), spec, start, stop, step);
            for(int64_t i = start; i < stop && i < static_cast<int64_t>(xs.size()); ++i){
                const Value& x = xs[static_cast<size_t>(i)];
                if(identical(x, a.args[0]) || values_equal(x, a.args[0])) return Value::I(i);
            }
            throw value_error(a.args[0].repr() + " is not in list");
        }},
        {"count", [](const Value& self, CallArgs& a){
            arity(a, "list.count", 1, 1);
            int64_t n = 0;
            for(const auto& x : self.list().items)
                if(identical(x, a.args[0]) || values_equal(x, a.args[0])) ++n;
            return Value::I(n);
        }},
        {"reverse", [](const Value& self, CallArgs& a){
            arity(a, "list.reverse", 0, 0);
            auto& xs = self.list().items;
            std::reverse(xs.begin(), xs.end());
            return Value::None();
        }},
        {"sort", [](const Value& self, CallArgs& a){
            a.expectKeywords("sort", {"key", "reverse"});
            if(!a.args.empty()) throw type_error("sort() takes no positional arguments");
            const Value* rev = a.kwarg("reverse");
            Value::Items xs = self.list().items;
            sort_items(a.in, xs, a.kwarg("key"), rev && rev->truthy());
            self.list().items = std::move(xs);
            return Value::None();
        }},
        {"copy", [](const Value& self, CallArgs& a){
            arity(a, "list.copy", 0, 0);
            return Value::L(self.list().items);
        }},
        {"clear", [](const Value& self, CallArgs& a){
            arity(a, "list.clear", 0, 0);
            Value::Items old;
            old.swap(self.list().items);
            return Value::None();
        }},
    };
    return t;
}

const Table& dict_methods(){
    static const Table t = {
        {"keys", [](const Value& self, CallArgs& a){
            arity(a, "dict.keys", 0, 0);
            Value::Items out;
            for(const auto& kv : self.dict().items) out.push_back(kv.first);
            return Value::L(std::move(out));
        }},
        {"values", [](const Value& self, CallArgs& a){
            arity(a, "dict.values", 0, 0);
            Value::Items out;
            for(const auto& kv : self.dict().items) out.push_back(kv.second);
            return Value::L(std::move(out));
        }},
        {"items", [](const Value& self, CallArgs& a){
            arity(a, "dict.items", 0, 0);
            Value::Items out;
            for(const auto& kv : self.dict().items) out.push_back(Value::T({kv.first, kv.second}));
            return Value::L(std::move(out));
        }},
        {"get", [](const Value& self, CallArgs& a){
            arity(a, "get", 1, 2);
            const Value* v = self.dict().find(a.args[0]);
            if(v) return *v;
            return a.args.size() > 1 ? a.args[1] : Value::None();
        }},
        {"pop", [](const Value& self, CallArgs& a){
            arity(a, "pop", 1, 2);
            auto& d = self.dict();
            const Value* v = d.find(a.args[0]);
            if(!v){
                if(a.args.size() > 1) return a.args[1];
                throw RuntimeFault("KeyError", a.args[0].repr());
            }
            Value out = *v;
            d.erase(a.args[0]);
            return out;
        }},
        {"update", [](const Value& self, CallArgs& a){
            a.expectCount("update", 0, 1);
            if(!a.args.empty()) dict_update(self.dict(), a.args[0]);
            for(const auto& kv : a.kwargs) self.dict().set(Value::S(kv.first), kv.second);
            return Value::None();
        }},
        {"copy", [](const Value& self, CallArgs& a){
            arity(a, "dict.copy", 0, 0);
            Value d = Value::D();
            for(const auto& kv : self.dict().items) d.dict().set(kv.first, kv.second);
            return d;
        }},
        {"clear", [](const Value& self, CallArgs& a){
            arity(a, "dict.clear", 0, 0);
            auto& d = self.dict();
            std::vector<std::pair<Value, Value>> old;
            old.swap(d.items);
            d.clear();
            return Value::None();
        }},
    };
    return t;
}

} // namespace

Value get_attribute(const Value& obj, const std::string& name){
    std::string type = obj.typeName();
    if(is_dunder(name)){
        TRACE_MSG("blocked dunder attribute ", type, ".", name);
        throw ResolutionFault("'" + type + "' object has no attribute '" + name + "'", "AttributeError");
    }
    const Table* table = nullptr;
    if(obj.isStr()) table = &str_methods();
    else if(obj.isList()) table = &list_methods();
    else if(obj.isDict()) table = &dict_methods();
    if(table){
        auto it = table->find(name);
        if(it != table->end()){
            auto m = std::make_shared<BoundMethod>();
            m->self = obj;
            m->name = name;
            m->fn = it->second;
            return Value::Method(std::move(m));
        }
    }
    throw RuntimeFault("AttributeError", "'" + type + "' object has no attribute '" + name + "'");
}

void sort_items(Interpreter& in, Value::Items& xs, const Value* key, bool reverse){
    Value::Items keys;
    bool keyed = key && !key->isNone();
    if(keyed){
        keys.reserve(xs.size());
        for(const auto& x : xs) keys.push_back(in.call(*key, {x}));
    }
    const Value::Items& k = keyed ? keys : xs;
    std::vector<size_t> order(xs.size());
    for(size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b){
        return reverse ? compare_order(CmpOp::Lt, k[b], k[a]) : compare_order(CmpOp::Lt, k[a], k[b]);
    });
    Value::Items out;
    out.reserve(xs.size());
    for(size_t i : order) out.push_back(xs[i]);
    xs.swap(out);
}

void dict_update(DictData& d, const Value& src){
    if(src.isDict()){
        auto items = src.dict().items;
        for(const auto& kv : items) d.set(kv.first, kv.second);
        return;
    }
    size_t i = 0;
    for_each_item(src, [&](const Value& el){
        if(!(el.isList() || el.isTuple() || el.isStr() || el.isRange() || el.isDict()))
            throw type_error("cannot convert dictionary update sequence element #" + std::to_string(i) + " to a sequence");
        Value::Items pair = collect_items(el);
        if(pair.size() != 2)
            throw value_error("dictionary update sequence element #" + std::to_string(i) + " has length "
                              + std::to_string(pair.size()) + "; 2 is required");
        d.set(pair[0], pair[1]);
        ++i;
        return true;
    });
}

} // namespace Sandbox
