#include "CodeAssist.h"

namespace Sandbox {

// ====== Name binding ======
namespace {

Env& binding_scope(Frame& f, const std::string& id){
    if(f.globals && f.globals->count(id)) return *f.in.module;
    return *f.env;
}

void bind_name(Frame& f, const std::string& id, const Value& v){
    binding_scope(f, id).set(id, v);
}

void unpack_into(Frame& f, const std::vector<ExprPtr>& targets, const Value& v){
    if(!(v.isStr() || v.isList() || v.isTuple() || v.isDict() || v.isRange()))
        throw type_error(std::string("cannot unpack non-iterable ") + v.typeName() + " object");
    Value::Items xs = collect_items(v);
    if(xs.size() < targets.size())
        throw value_error("not enough values to unpack (expected " + std::to_string(targets.size())
                          + ", got " + std::to_string(xs.size()) + ")");
    if(xs.size() > targets.size())
        throw value_error("too many values to unpack (expected " + std::to_string(targets.size()) + ")");
    for(size_t i = 0; i < targets.size(); ++i) targets[i]->assign(f, xs[i]);
}

Value::Items eval_all(Frame& f, const std::vector<ExprPtr>& xs){
    Value::Items out;
    out.reserve(xs.size());
    for(const auto& x : xs) out.push_back(x->eval(f));
    return out;
}

Value make_function(Frame& f, const std::shared_ptr<const FunctionDecl>& decl){
    auto fn = std::make_shared<Function>();
    fn->decl = decl;
    fn->closure = f.env;
    fn->defaults = eval_all(f, decl->defaults);
    return Value::Fn(std::move(fn));
}

std::optional<int64_t> slice_bound(Frame& f, const ExprPtr& e){
    if(!e) return std::nullopt;
    Value v = e->eval(f);
    if(v.isNone()) return std::nullopt;
    if(!v.isIntLike())
        throw type_error("slice indices must be integers or None or have an __index__ method");
    return v.asInt();
}

} // namespace

// ====== Targets ======
void AstExpr::assign(Frame&, const Value&){
    throw SyntaxFault("cannot assign to expression", line);
}

void AstExpr::erase(Frame&){
    throw SyntaxFault("cannot delete expression", line);
}

Value AstName::eval(Frame& f){
    if(f.globals && f.globals->count(id)){
        if(auto v = f.in.module->get(id)) return *v;
        throw name_not_defined(id);
    }
    if(auto v = f.env->get(id)) return *v;
    throw name_not_defined(id);
}

void AstName::assign(Frame& f, const Value& v){ bind_name(f, id, v); }

void AstName::erase(Frame& f){
    if(!binding_scope(f, id).erase(id)) throw name_not_defined(id);
}

bool AstList::assignable() const {
    for(const auto& e : elts) if(!e->assignable()) return false;
    return true;
}
void AstList::assign(Frame& f, const Value& v){ unpack_into(f, elts, v); }
void AstList::erase(Frame& f){ for(auto& e : elts) e->erase(f); }

bool AstTuple::assignable() const {
    for(const auto& e : elts) if(!e->assignable()) return false;
    return true;
}
void AstTuple::assign(Frame& f, const Value& v){ unpack_into(f, elts, v); }
void AstTuple::erase(Frame& f){ for(auto& e : elts) e->erase(f); }

SliceSpec AstSubscript::slice(Frame& f){
    SliceSpec s;
    s.lo = slice_bound(f, lo);
    s.hi = slice_bound(f, hi);
    s.step = slice_bound(f, step);
    return s;
}

Value AstSubscript::eval(Frame& f){
    Value o = obj->eval(f);
    if(is_slice) return get_slice(o, slice(f));
    return get_item(o, index->eval(f));
}

void AstSubscript::assign(Frame& f, const Value& v){
    Value o = obj->eval(f);
    if(is_slice) set_slice(o, slice(f), v);
    else set_item(o, index->eval(f), v);
}

void AstSubscript::erase(Frame& f){
    Value o = obj->eval(f);
    if(is_slice) del_slice(o, slice(f));
    else del_item(o, index->eval(f));
}

Value AstAttribute::eval(Frame& f){
    return get_attribute(obj->eval(f), attr);
}

void AstAttribute::assign(Frame& f, const Value&){
    Value o = obj->eval(f);
    get_attribute(o, attr);
    throw RuntimeFault("AttributeError", std::string("'") + o.typeName() + "' object attribute '"
                       + attr + "' is read-only");
}

// ====== Expressions ======
Value AstJoinedStr::eval(Frame& f){
    std::string out;
    for(const auto& p : parts){
        if(!p.expr){
            out += p.text;
            continue;
        }
        Value v = p.expr->eval(f);
        if(p.conversion == 'r') v = Value::S(v.repr());
        else if(p.conversion == 's') v = Value::S(v.toStr());
        std::string spec = p.spec ? p.spec->eval(f).toStr() : std::string();
        out += format_value(v, spec);
    }
    return Value::S(std::move(out));
}

Value AstList::eval(Frame& f){ return Value::L(eval_all(f, elts)); }
Value AstTuple::eval(Frame& f){ return Value::T(eval_all(f, elts)); }

Value AstDict::eval(Frame& f){
    Value d = Value::D();
    for(const auto& kv : entries){
        Value k = kv.first->eval(f);
        Value v = kv.second->eval(f);
        d.dict().set(k, v);
    }
    return d;
}

// Comprehension targets bind in a scope of their own.
Value AstListComp::eval(Frame& f){
    Frame inner{f.in, Env::make(f.env), nullptr, Value()};
    Value::Items out;
    std::function<void(size_t)> walk = [&](size_t level){
        const Clause& c = clauses[level];
        Value seq = level == 0 ? c.iter->eval(f) : c.iter->eval(inner);
        for_each_item(seq, [&](const Value& x){
            f.in.tick();
            c.target->assign(inner, x);
            for(const auto& cond : c.conds)
                if(!cond->eval(inner).truthy()) return true;
            if(level + 1 < clauses.size()) walk(level + 1);
            else out.push_back(elt->eval(inner));
            return true;
        });
    };
    walk(0);
    return Value::L(std::move(out));
}

Value AstBinChain::eval(Frame& f){
    Value v = first->eval(f);
    for(const auto& r : rest) v = binary_op(r.first, v, r.second->eval(f));
    return v;
}

Value AstUnary::eval(Frame& f){
    Value v = operand->eval(f);
    if(op == '!') return Value::B(!v.truthy());
    return unary_op(op, v);
}

Value AstBoolOp::eval(Frame& f){
    Value v;
    for(const auto& e : values){
        v = e->eval(f);
        if(v.truthy() != is_and) return v;
    }
    return v;
}

Value AstCompare::eval(Frame& f){
    Value l = left->eval(f);
    for(const auto& r : rest){
        Value rv = r.second->eval(f);
        if(!compare(r.first, l, rv)) return Value::B(false);
        l = std::move(rv);
    }
    return Value::B(true);
}

Value AstIfExp::eval(Frame& f){
    return cond->eval(f).truthy() ? a->eval(f) : b->eval(f);
}

Value AstLambda::eval(Frame& f){ return make_function(f, decl); }

Value AstCall::eval(Frame& f){
    Value callee = fn->eval(f);
    Value::Items av = eval_all(f, args);
    std::vector<std::pair<std::string, Value>> kw;
    kw.reserve(kwargs.size());
    for(const auto& k : kwargs) kw.emplace_back(k.first, k.second->eval(f));
    return f.in.call(callee, std::move(av), std::move(kw));
}

// ====== Statements ======
Flow exec_block(const Block& body, Frame& f){
    for(const auto& s : body){
        f.in.tick();
        Flow fl = s->exec(f);
        if(fl != Flow::Normal) return fl;
    }
    return Flow::Normal;
}

Flow AstExprStmt::exec(Frame& f){
    expr->eval(f);
    return Flow::Normal;
}

Flow AstAssign::exec(Frame& f){
    Value v = value->eval(f);
    for(const auto& t : targets) t->assign(f, v);
    return Flow::Normal;
}

// Lists grow in place under += and *=, so aliases see the change.
static Value augmented(BinOp op, const Value& cur, const Value& rhs){
    if(cur.isList() && op == BinOp::Add){
        Value::Items extra = collect_items(rhs);
        auto& xs = cur.list().items;
        xs.insert(xs.end(), extra.begin(), extra.end());
        return cur;
    }
    if(cur.isList() && op == BinOp::Mul && rhs.isIntLike()){
        Value rep = binary_op(op, cur, rhs);
        cur.list().items = rep.list().items;
        return cur;
    }
    return binary_op(op, cur, rhs);
}

Flow AstAugAssign::exec(Frame& f){
    if(auto sub = std::dynamic_pointer_cast<AstSubscript>(target)){
        Value o = sub->obj->eval(f);
        if(sub->is_slice){
            SliceSpec s;
            s.lo = slice_bound(f, sub->lo);
            s.hi = slice_bound(f, sub->hi);
            s.step = slice_bound(f, sub->step);
            Value nv = augmented(op, get_slice(o, s), value->eval(f));
            set_slice(o, s, nv);
        } else {
            Value idx = sub->index->eval(f);
            Value nv = augmented(op, get_item(o, idx), value->eval(f));
            set_item(o, idx, nv);
        }
        return Flow::Normal;
    }
    Value cur = target->eval(f);
    target->assign(f, augmented(op, cur, value->eval(f)));
    return Flow::Normal;
}

Flow AstIf::exec(Frame& f){
    for(const auto& br : branches)
        if(br.first->eval(f).truthy()) return exec_block(br.second, f);
    return exec_block(orelse, f);
}

Flow AstWhile::exec(Frame& f){
    for(;;){
        f.in.tick();
        if(!cond->eval(f).truthy()) break;
        Flow fl = exec_block(body, f);
        if(fl == Flow::Break) return Flow::Normal;
        if(fl == Flow::Return) return fl;
    }
    return exec_block(orelse, f);
}

Flow AstFor::exec(Frame& f){
    Value seq = iter->eval(f);
    bool broke = false, returned = false;
    for_each_item(seq, [&](const Value& x){
        f.in.tick();
        target->assign(f, x);
        Flow fl = exec_block(body, f);
        if(fl == Flow::Break){ broke = true; return false; }
        if(fl == Flow::Return){ returned = true; return false; }
        return true;
    });
    if(returned) return Flow::Return;
    if(broke) return Flow::Normal;
    return exec_block(orelse, f);
}

Flow AstReturn::exec(Frame& f){
    f.ret = value ? value->eval(f) : Value::None();
    return Flow::Return;
}

Flow AstFunctionDef::exec(Frame& f){
    bind_name(f, decl->name, make_function(f, decl));
    return Flow::Normal;
}

Flow AstDelete::exec(Frame& f){
    for(const auto& t : targets) t->erase(f);
    return Flow::Normal;
}

Flow AstAssert::exec(Frame& f){
    if(test->eval(f).truthy()) return Flow::Normal;
    throw RuntimeFault("AssertionError", msg ? msg->eval(f).toStr() : std::string());
}

Flow AstRaise::exec(Frame& f){
    if(!exc){
        if(f.in.handling.empty())
            throw RuntimeFault("RuntimeError", "No active exception to reraise");
        std::rethrow_exception(f.in.handling.back());
    }
    exc->eval(f);
    throw type_error("exceptions must derive from BaseException");
}

namespace {

struct HandlingGuard {
    std::vector<std::exception_ptr>& stack;
    HandlingGuard(std::vector<std::exception_ptr>& s, std::exception_ptr e) : stack(s){ stack.push_back(std::move(e)); }
    ~HandlingGuard(){ stack.pop_back(); }
};

// Body, handlers and else clause; finally is left to the caller.
Flow run_try(AstTry& node, Frame& f){
    Flow flow = Flow::Normal;
    try {
        flow = exec_block(node.body, f);
    } catch(const Fault& e){
        if(!e.catchable) throw;
        std::exception_ptr current = std::current_exception();
        if(!node.handlers.empty()){
            const auto& h = node.handlers.front();
            HandlingGuard guard(f.in.handling, current);
            if(h.type){
                // No exception classes are reachable from sandboxed code, so a
                // typed clause either fails to resolve or names a non-class.
                h.type->eval(f);
                throw type_error("catching classes that do not inherit from BaseException is not allowed");
            }
            TRACE_MSG("except at line ", h.line, ": ", e.describe());
            if(!h.name.empty()) bind_name(f, h.name, Value::S(e.what()));
            Flow hf = exec_block(h.body, f);
            if(!h.name.empty()) binding_scope(f, h.name).erase(h.name);
            return hf;
        }
        throw;
    }
    if(flow != Flow::Normal) return flow;
    return exec_block(node.orelse, f);
}

} // namespace

Flow AstTry::exec(Frame& f){
    Flow flow = Flow::Normal;
    std::exception_ptr pending;
    try {
        flow = run_try(*this, f);
    } catch(const Fault& e){
        if(!e.catchable || finalbody.empty()) throw;
        pending = std::current_exception();
    }
    if(!finalbody.empty()){
        Value saved = f.ret;
        Flow fin = exec_block(finalbody, f);
        if(fin != Flow::Normal) return fin;
        f.ret = saved;
    }
    if(pending) std::rethrow_exception(pending);
    return flow;
}

Flow AstImport::exec(Frame&){
    TRACE_MSG("import of '", module, "' refused");
    throw ResolutionFault("__import__ not found", "ImportError");
}

} // namespace Sandbox
