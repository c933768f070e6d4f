#include "CodeAssist.h"

namespace Sandbox {

namespace {

using TT = Token::Type;

class Parser {
public:
    Parser(std::vector<Token> toks, size_t nesting) : T(std::move(toks)), max_nesting(nesting) {}

    std::shared_ptr<Program> parseModule(){
        auto prog = std::make_shared<Program>();
        while(!cur().is(TT::End)){
            if(cur().is(TT::Newline)){ ++pos; continue; }
            parseStatement(prog->body);
        }
        return prog;
    }

    ExprPtr parseStandalone(){
        ExprPtr e = parseTestList();
        while(cur().is(TT::Newline)) ++pos;
        if(!cur().is(TT::End)) fail("f-string: invalid syntax");
        return e;
    }

    size_t remainingNesting() const { return max_nesting > depth ? max_nesting - depth : 0; }

private:
    std::vector<Token> T;
    size_t pos = 0;
    size_t depth = 0;
    size_t max_nesting;
    int loop_depth = 0;
    std::vector<FunctionDecl*> functions;

    struct DepthGuard {
        Parser& p;
        DepthGuard(Parser& parser, int line) : p(parser){
            if(++p.depth > p.max_nesting){
                --p.depth;
                throw SyntaxFault("too many nested parentheses", line);
            }
        }
        ~DepthGuard(){ --p.depth; }
    };

    // ---- token helpers ----
    const Token& cur() const { return T[pos]; }
    const Token& peek(size_t n = 1) const { return T[std::min(pos + n, T.size() - 1)]; }
    bool isOp(const char* op) const { return cur().isOp(op); }
    bool isKw(const char* kw) const { return cur().isName(kw); }
    bool accept(const char* op){
        if(!isOp(op)) return false;
        ++pos;
        return true;
    }
    bool acceptKw(const char* kw){
        if(!isKw(kw)) return false;
        ++pos;
        return true;
    }
    [[noreturn]] void fail(const std::string& msg) const {
        throw SyntaxFault(msg, cur().line);
    }
    void expect(const char* op){
        if(!accept(op)) fail(std::string("expected '") + op + "'");
    }
    void expectKw(const char* kw){
        if(!acceptKw(kw)) fail("invalid syntax");
    }
    std::string expectIdent(){
        const Token& t = cur();
        if(!t.is(TT::Name) || is_keyword(t.s)) fail("invalid syntax");
        ++pos;
        return t.s;
    }

    template<typename N, typename... Args>
    std::shared_ptr<N> node(int line, Args&&... args){
        auto n = std::make_shared<N>(std::forward<Args>(args)...);
        n->line = line;
        return n;
    }

    bool startsExpr() const {
        const Token& t = cur();
        switch(t.type){
            case TT::Int: case TT::Float: case TT::Str: case TT::FStr: return true;
            case TT::Name:
                return !is_keyword(t.s) || t.s == "True" || t.s == "False" || t.s == "None"
                    || t.s == "not" || t.s == "lambda";
            case TT::Op:
                return t.s == "(" || t.s == "[" || t.s == "{" || t.s == "-" || t.s == "+" || t.s == "~";
            default:
                return false;
        }
    }

    bool atSimpleEnd() const { return cur().is(TT::Newline) || cur().is(TT::End) || isOp(";"); }

    // ---- statements ----
    void parseStatement(Block& out){
        const Token& t = cur();
        if(t.is(TT::Indent)) throw SyntaxFault("unexpected indent", t.line, "IndentationError");
        if(t.is(TT::Dedent)) fail("invalid syntax");
        if(t.is(TT::Name)){
            if(t.s == "if"){ out.push_back(parseIf()); return; }
            if(t.s == "while"){ out.push_back(parseWhile()); return; }
            if(t.s == "for"){ out.push_back(parseFor()); return; }
            if(t.s == "def"){ out.push_back(parseDef()); return; }
            if(t.s == "try"){ out.push_back(parseTry()); return; }
            if(t.s == "class" || t.s == "with" || t.s == "async" || t.s == "await"
               || t.s == "yield" || t.s == "nonlocal")
                fail("'" + t.s + "' is not supported");
        }
        parseSimpleStatements(out);
    }

    void parseSimpleStatements(Block& out){
        for(;;){
            out.push_back(parseSmall());
            if(accept(";")){
                if(cur().is(TT::Newline) || cur().is(TT::End)) break;
                continue;
            }
            break;
        }
        if(cur().is(TT::End)) return;
        if(!cur().is(TT::Newline)) fail("invalid syntax");
        ++pos;
    }

    // Indented block (or the rest of the line) after a compound header.
    Block parseSuite(const std::string& what, int header_line){
        expect(":");
        Block body;
        if(!cur().is(TT::Newline)){
            parseSimpleStatements(body);
            return body;
        }
        ++pos;
        if(!cur().is(TT::Indent))
            throw SyntaxFault("expected an indented block after " + what + " on line "
                              + std::to_string(header_line), cur().line, "IndentationError");
        DepthGuard guard(*this, cur().line);
        ++pos;
        while(!cur().is(TT::Dedent) && !cur().is(TT::End)) parseStatement(body);
        if(cur().is(TT::Dedent)) ++pos;
        return body;
    }

    StmtPtr parseSmall(){
        const Token& t = cur();
        int line = t.line;
        if(t.is(TT::Name)){
            if(t.s == "pass"){ ++pos; return node<AstPass>(line); }
            if(t.s == "break"){
                if(loop_depth == 0) fail("'break' outside loop");
                ++pos;
                return node<AstBreak>(line);
            }
            if(t.s == "continue"){
                if(loop_depth == 0) fail("'continue' not properly in loop");
                ++pos;
                return node<AstContinue>(line);
            }
            if(t.s == "return"){
                if(functions.empty()) fail("'return' outside function");
                ++pos;
                auto r = node<AstReturn>(line);
                if(!atSimpleEnd()) r->value = parseTestList();
                return r;
            }
            if(t.s == "global") return parseGlobal();
            if(t.s == "del") return parseDel();
            if(t.s == "assert"){
                ++pos;
                auto a = node<AstAssert>(line);
                a->test = parseTest();
                if(accept(",")) a->msg = parseTest();
                return a;
            }
            if(t.s == "raise"){
                ++pos;
                auto r = node<AstRaise>(line);
                if(!atSimpleEnd()){
                    r->exc = parseTest();
                    if(acceptKw("from")) parseTest();
                }
                return r;
            }
            if(t.s == "import" || t.s == "from") return parseImport();
        }
        return parseExprStatement();
    }

    StmtPtr parseExprStatement(){
        int line = cur().line;
        ExprPtr first = parseTestList();
        static const std::pair<const char*, BinOp> aug_ops[] = {
            {"+=", BinOp::Add}, {"-=", BinOp::Sub}, {"*=", BinOp::Mul}, {"/=", BinOp::Div},
            {"//=", BinOp::FloorDiv}, {"%=", BinOp::Mod}, {"**=", BinOp::Pow},
            {"&=", BinOp::BitAnd}, {"|=", BinOp::BitOr}, {"^=", BinOp::BitXor},
            {"<<=", BinOp::LShift}, {">>=", BinOp::RShift}
        };
        for(const auto& ao : aug_ops){
            if(!isOp(ao.first)) continue;
            if(!std::dynamic_pointer_cast<AstName>(first) && !std::dynamic_pointer_cast<AstSubscript>(first)
               && !std::dynamic_pointer_cast<AstAttribute>(first))
                throw SyntaxFault("'" + describe(first) + "' is an illegal expression for augmented assignment", line);
            ++pos;
            auto s = node<AstAugAssign>(line);
            s->target = first;
            s->op = ao.second;
            s->value = parseTestList();
            return s;
        }
        if(isOp(":") && std::dynamic_pointer_cast<AstName>(first)){
            // annotated assignment; the annotation is parsed and dropped
            ++pos;
            parseTest();
            if(!accept("=")) return node<AstPass>(line);
            auto s = node<AstAssign>(line);
            s->targets.push_back(first);
            s->value = parseTestList();
            return s;
        }
        if(isOp("=")){
            std::vector<ExprPtr> chain{first};
            while(accept("=")) chain.push_back(parseTestList());
            auto s = node<AstAssign>(line);
            s->value = chain.back();
            chain.pop_back();
            for(auto& target : chain) checkTarget(target, false);
            s->targets = std::move(chain);
            return s;
        }
        auto s = node<AstExprStmt>(line);
        s->expr = first;
        return s;
    }

    static std::string describe(const ExprPtr& e){
        if(std::dynamic_pointer_cast<AstConst>(e)) return "literal";
        if(std::dynamic_pointer_cast<AstCall>(e)) return "function call";
        if(std::dynamic_pointer_cast<AstCompare>(e)) return "comparison";
        if(std::dynamic_pointer_cast<AstLambda>(e)) return "lambda";
        if(std::dynamic_pointer_cast<AstJoinedStr>(e)) return "f-string expression";
        if(std::dynamic_pointer_cast<AstListComp>(e)) return "list comprehension";
        if(std::dynamic_pointer_cast<AstDict>(e)) return "dict literal";
        if(std::dynamic_pointer_cast<AstIfExp>(e)) return "conditional expression";
        if(std::dynamic_pointer_cast<AstTuple>(e)) return "tuple";
        if(std::dynamic_pointer_cast<AstList>(e)) return "list";
        return "expression";
    }

    void checkTarget(const ExprPtr& e, bool for_del){
        const std::vector<ExprPtr>* elts = nullptr;
        if(auto t = std::dynamic_pointer_cast<AstTuple>(e)) elts = &t->elts;
        else if(auto l = std::dynamic_pointer_cast<AstList>(e)) elts = &l->elts;
        if(elts){
            for(const auto& x : *elts) checkTarget(x, for_del);
            return;
        }
        if(for_del && std::dynamic_pointer_cast<AstAttribute>(e))
            throw SyntaxFault("cannot delete attribute", e->line);
        if(!e->assignable())
            throw SyntaxFault(std::string(for_del ? "cannot delete " : "cannot assign to ") + describe(e), e->line);
    }

    StmtPtr parseGlobal(){
        int line = cur().line;
        ++pos;
        auto g = node<AstGlobal>(line);
        do {
            std::string name = expectIdent();
            if(!functions.empty()){
                FunctionDecl* fn = functions.back();
                if(std::find(fn->params.begin(), fn->params.end(), name) != fn->params.end())
                    throw SyntaxFault("name '" + name + "' is parameter and global", line);
                fn->globals.insert(name);
            }
            g->names.push_back(name);
        } while(accept(","));
        return g;
    }

    StmtPtr parseDel(){
        int line = cur().line;
        ++pos;
        auto d = node<AstDelete>(line);
        do {
            if(atSimpleEnd()) break;
            ExprPtr t = parseBitOr();
            checkTarget(t, true);
            d->targets.push_back(t);
        } while(accept(","));
        if(d->targets.empty()) fail("invalid syntax");
        return d;
    }

    std::string parseDotted(){
        std::string name;
        while(isOp(".") || isOp("...")){
            name += cur().s;
            ++pos;
        }
        if(cur().is(TT::Name) && !isKw("import")){
            name += expectIdent();
            while(accept(".")) name += "." + expectIdent();
        }
        if(name.empty()) fail("invalid syntax");
        return name;
    }

    StmtPtr parseImport(){
        int line = cur().line;
        auto imp = node<AstImport>(line);
        if(acceptKw("import")){
            imp->module = parseDotted();
            if(acceptKw("as")) expectIdent();
            while(accept(",")){
                parseDotted();
                if(acceptKw("as")) expectIdent();
            }
            return imp;
        }
        expectKw("from");
        imp->module = parseDotted();
        expectKw("import");
        if(accept("*")) return imp;
        bool paren = accept("(");
        do {
            if(paren && isOp(")")) break;
            expectIdent();
            if(acceptKw("as")) expectIdent();
        } while(accept(","));
        if(paren) expect(")");
        return imp;
    }

    StmtPtr parseIf(){
        int line = cur().line;
        ++pos;
        auto s = node<AstIf>(line);
        ExprPtr cond = parseTest();
        s->branches.emplace_back(cond, parseSuite("'if' statement", line));
        while(isKw("elif")){
            int el = cur().line;
            ++pos;
            ExprPtr c = parseTest();
            s->branches.emplace_back(c, parseSuite("'elif' statement", el));
        }
        if(isKw("else")){
            int el = cur().line;
            ++pos;
            s->orelse = parseSuite("'else' statement", el);
        }
        return s;
    }

    Block parseLoopBody(const std::string& what, int line){
        ++loop_depth;
        Block body;
        try {
            body = parseSuite(what, line);
        } catch(const SyntaxFault&){
            --loop_depth;
            throw;
        }
        --loop_depth;
        return body;
    }

    StmtPtr parseWhile(){
        int line = cur().line;
        ++pos;
        auto s = node<AstWhile>(line);
        s->cond = parseTest();
        s->body = parseLoopBody("'while' statement", line);
        if(isKw("else")){
            int el = cur().line;
            ++pos;
            s->orelse = parseSuite("'else' statement", el);
        }
        return s;
    }

    StmtPtr parseFor(){
        int line = cur().line;
        ++pos;
        auto s = node<AstFor>(line);
        s->target = parseTargetList();
        expectKw("in");
        s->iter = parseTestList();
        s->body = parseLoopBody("'for' statement", line);
        if(isKw("else")){
            int el = cur().line;
            ++pos;
            s->orelse = parseSuite("'else' statement", el);
        }
        return s;
    }

    // Parameter list up to `close`; annotations are parsed and dropped.
    void parseParams(FunctionDecl& decl, const char* close, bool annotations){
        while(!isOp(close)){
            if(isOp("*") || isOp("**") || isOp("/")) fail("variadic parameters are not supported");
            std::string name = expectIdent();
            if(std::find(decl.params.begin(), decl.params.end(), name) != decl.params.end())
                fail("duplicate argument '" + name + "' in function definition");
            if(annotations && accept(":")) parseTest();
            if(accept("=")){
                decl.defaults.push_back(parseTest());
            } else if(!decl.defaults.empty()){
                fail("parameter without a default follows parameter with a default");
            }
            decl.params.push_back(name);
            if(!accept(",")) break;
        }
    }

    Block parseFunctionBody(FunctionDecl& decl, const std::string& what, int line){
        functions.push_back(&decl);
        int saved_loops = loop_depth;
        loop_depth = 0;
        Block body;
        try {
            body = parseSuite(what, line);
        } catch(const SyntaxFault&){
            functions.pop_back();
            loop_depth = saved_loops;
            throw;
        }
        functions.pop_back();
        loop_depth = saved_loops;
        return body;
    }

    StmtPtr parseDef(){
        int line = cur().line;
        ++pos;
        auto decl = std::make_shared<FunctionDecl>();
        decl->line = line;
        decl->name = expectIdent();
        expect("(");
        parseParams(*decl, ")", true);
        expect(")");
        if(accept("->")) parseTest();
        decl->body = parseFunctionBody(*decl, "function definition", line);
        auto s = node<AstFunctionDef>(line);
        s->decl = decl;
        return s;
    }

    StmtPtr parseTry(){
        int line = cur().line;
        ++pos;
        auto s = node<AstTry>(line);
        s->body = parseSuite("'try' statement", line);
        bool saw_bare = false;
        while(isKw("except")){
            AstTry::Handler h;
            h.line = cur().line;
            if(saw_bare) fail("default 'except:' must be last");
            ++pos;
            if(!isOp(":")){
                h.type = parseTest();
                if(acceptKw("as")) h.name = expectIdent();
            } else {
                saw_bare = true;
            }
            h.body = parseSuite("'except' statement", h.line);
            s->handlers.push_back(std::move(h));
        }
        if(isKw("else")){
            if(s->handlers.empty()) fail("invalid syntax");
            int el = cur().line;
            ++pos;
            s->orelse = parseSuite("'else' statement", el);
        }
        if(isKw("finally")){
            int fl = cur().line;
            ++pos;
            s->finalbody = parseSuite("'finally' statement", fl);
        }
        if(s->handlers.empty() && s->finalbody.empty())
            fail("expected 'except' or 'finally' block");
        return s;
    }

    // ---- expressions ----
    ExprPtr parseTestList(){
        int line = cur().line;
        ExprPtr first = parseTest();
        if(!isOp(",")) return first;
        auto tup = node<AstTuple>(line);
        tup->elts.push_back(first);
        while(accept(",")){
            if(!startsExpr()) break;
            tup->elts.push_back(parseTest());
        }
        return tup;
    }

    ExprPtr parseTargetList(){
        int line = cur().line;
        ExprPtr first = parseBitOr();
        if(isOp(",")){
            auto tup = node<AstTuple>(line);
            tup->elts.push_back(first);
            while(accept(",")){
                if(isKw("in") || !startsExpr()) break;
                tup->elts.push_back(parseBitOr());
            }
            first = tup;
        }
        checkTarget(first, false);
        return first;
    }

    ExprPtr parseTest(){
        DepthGuard guard(*this, cur().line);
        if(isKw("lambda")) return parseLambda();
        int line = cur().line;
        ExprPtr e = parseOr();
        if(isKw("if")){
            ++pos;
            auto c = node<AstIfExp>(line);
            c->a = e;
            c->cond = parseOr();
            expectKw("else");
            c->b = parseTest();
            return c;
        }
        return e;
    }

    ExprPtr parseLambda(){
        int line = cur().line;
        ++pos;
        auto decl = std::make_shared<FunctionDecl>();
        decl->name = "<lambda>";
        decl->line = line;
        parseParams(*decl, ":", false);
        expect(":");
        auto ret = node<AstReturn>(line);
        functions.push_back(decl.get());
        int saved_loops = loop_depth;
        loop_depth = 0;
        try {
            ret->value = parseTest();
        } catch(const SyntaxFault&){
            functions.pop_back();
            loop_depth = saved_loops;
            throw;
        }
        functions.pop_back();
        loop_depth = saved_loops;
        decl->body.push_back(ret);
        auto l = node<AstLambda>(line);
        l->decl = decl;
        return l;
    }

    ExprPtr parseOr(){
        int line = cur().line;
        ExprPtr first = parseAnd();
        if(!isKw("or")) return first;
        auto b = node<AstBoolOp>(line, false);
        b->values.push_back(first);
        while(acceptKw("or")) b->values.push_back(parseAnd());
        return b;
    }

    ExprPtr parseAnd(){
        int line = cur().line;
        ExprPtr first = parseNot();
        if(!isKw("and")) return first;
        auto b = node<AstBoolOp>(line, true);
        b->values.push_back(first);
        while(acceptKw("and")) b->values.push_back(parseNot());
        return b;
    }

    ExprPtr parseNot(){
        int line = cur().line;
        if(acceptKw("not")){
            DepthGuard guard(*this, line);
            return node<AstUnary>(line, '!', parseNot());
        }
        return parseComparison();
    }

    bool comparisonOp(CmpOp& op){
        static const std::pair<const char*, CmpOp> ops[] = {
            {"<", CmpOp::Lt}, {"<=", CmpOp::Le}, {">", CmpOp::Gt}, {">=", CmpOp::Ge},
            {"==", CmpOp::Eq}, {"!=", CmpOp::Ne}
        };
        for(const auto& o : ops){
            if(accept(o.first)){ op = o.second; return true; }
        }
        if(acceptKw("in")){ op = CmpOp::In; return true; }
        if(isKw("not") && peek().isName("in")){
            pos += 2;
            op = CmpOp::NotIn;
            return true;
        }
        if(acceptKw("is")){
            op = acceptKw("not") ? CmpOp::IsNot : CmpOp::Is;
            return true;
        }
        return false;
    }

    ExprPtr parseComparison(){
        int line = cur().line;
        ExprPtr left = parseBitOr();
        CmpOp op;
        if(!comparisonOp(op)) return left;
        auto c = node<AstCompare>(line);
        c->left = left;
        do {
            c->rest.emplace_back(op, parseBitOr());
        } while(comparisonOp(op));
        return c;
    }

    using Level = ExprPtr (Parser::*)();

    ExprPtr parseChain(Level next, std::initializer_list<std::pair<const char*, BinOp>> ops){
        int line = cur().line;
        ExprPtr first = (this->*next)();
        std::shared_ptr<AstBinChain> chain;
        for(;;){
            const std::pair<const char*, BinOp>* hit = nullptr;
            for(const auto& o : ops) if(isOp(o.first)){ hit = &o; break; }
            if(!hit) break;
            ++pos;
            if(!chain){
                chain = node<AstBinChain>(line);
                chain->first = first;
            }
            chain->rest.emplace_back(hit->second, (this->*next)());
        }
        if(chain) return chain;
        return first;
    }

    ExprPtr parseBitOr(){ return parseChain(&Parser::parseBitXor, {{"|", BinOp::BitOr}}); }
    ExprPtr parseBitXor(){ return parseChain(&Parser::parseBitAnd, {{"^", BinOp::BitXor}}); }
    ExprPtr parseBitAnd(){ return parseChain(&Parser::parseShift, {{"&", BinOp::BitAnd}}); }
    ExprPtr parseShift(){
        return parseChain(&Parser::parseArith, {{"<<", BinOp::LShift}, {">>", BinOp::RShift}});
    }
    ExprPtr parseArith(){
        return parseChain(&Parser::parseTerm, {{"+", BinOp::Add}, {"-", BinOp::Sub}});
    }
    ExprPtr parseTerm(){
        ExprPtr e = parseChain(&Parser::parseFactor, {{"*", BinOp::Mul}, {"/", BinOp::Div},
                                                      {"//", BinOp::FloorDiv}, {"%", BinOp::Mod}});
        if(isOp("@")) fail("matrix multiplication is not supported");
        return e;
    }

    ExprPtr parseFactor(){
        int line = cur().line;
        if(isOp("-") || isOp("+") || isOp("~")){
            char op = cur().s[0];
            ++pos;
            DepthGuard guard(*this, line);
            return node<AstUnary>(line, op, parseFactor());
        }
        return parsePower();
    }

    ExprPtr parsePower(){
        int line = cur().line;
        ExprPtr base = parsePostfix();
        if(!accept("**")) return base;
        DepthGuard guard(*this, line);
        auto chain = node<AstBinChain>(line);
        chain->first = base;
        chain->rest.emplace_back(BinOp::Pow, parseFactor());
        return chain;
    }

    ExprPtr parsePostfix(){
        ExprPtr e = parseAtom();
        for(;;){
            int line = cur().line;
            if(isOp("(")){
                e = parseCall(e);
            } else if(accept("[")){
                auto sub = node<AstSubscript>(line);
                sub->obj = e;
                parseSubscriptBody(*sub);
                expect("]");
                e = sub;
            } else if(accept(".")){
                auto a = node<AstAttribute>(line);
                a->obj = e;
                a->attr = expectIdent();
                e = a;
            } else {
                break;
            }
        }
        return e;
    }

    ExprPtr parseCall(const ExprPtr& fn){
        int line = cur().line;
        expect("(");
        auto call = node<AstCall>(line);
        call->fn = fn;
        while(!isOp(")")){
            if(isOp("*") || isOp("**")) fail("argument unpacking is not supported");
            if(cur().is(TT::Name) && peek().isOp("=") && !is_keyword(cur().s)){
                std::string name = cur().s;
                pos += 2;
                for(const auto& kw : call->kwargs)
                    if(kw.first == name) fail("keyword argument repeated: " + name);
                call->kwargs.emplace_back(name, parseTest());
            } else {
                if(!call->kwargs.empty()) fail("positional argument follows keyword argument");
                int al = cur().line;
                ExprPtr a = parseTest();
                if(isKw("for")){
                    a = parseComprehension(a, al);
                    if(!call->args.empty() || !isOp(")"))
                        fail("Generator expression must be parenthesized");
                }
                call->args.push_back(a);
            }
            if(!accept(",")) break;
        }
        expect(")");
        return call;
    }

    void parseSubscriptBody(AstSubscript& sub){
        int line = cur().line;
        ExprPtr lo;
        if(!isOp(":")) lo = parseTest();
        if(accept(":")){
            sub.is_slice = true;
            sub.lo = lo;
            if(!isOp(":") && !isOp("]")) sub.hi = parseTest();
            if(accept(":") && !isOp("]")) sub.step = parseTest();
            return;
        }
        if(isOp(",")){
            auto tup = node<AstTuple>(line);
            tup->elts.push_back(lo);
            while(accept(",")){
                if(isOp("]")) break;
                tup->elts.push_back(parseTest());
            }
            sub.index = tup;
            return;
        }
        sub.index = lo;
    }

    ExprPtr parseComprehension(const ExprPtr& elt, int line){
        auto lc = node<AstListComp>(line);
        lc->elt = elt;
        while(acceptKw("for")){
            AstListComp::Clause c;
            c.target = parseTargetList();
            expectKw("in");
            c.iter = parseOr();
            while(acceptKw("if")) c.conds.push_back(parseOr());
            lc->clauses.push_back(std::move(c));
        }
        return lc;
    }

    ExprPtr parseAtom(){
        const Token& t = cur();
        int line = t.line;
        switch(t.type){
            case TT::Int:
                ++pos;
                return node<AstConst>(line, Value::I(t.ival));
            case TT::Float:
                ++pos;
                return node<AstConst>(line, Value::F(t.fval));
            case TT::Str:
            case TT::FStr:
                return parseStrings();
            case TT::Name:
                if(t.s == "True"){ ++pos; return node<AstConst>(line, Value::B(true)); }
                if(t.s == "False"){ ++pos; return node<AstConst>(line, Value::B(false)); }
                if(t.s == "None"){ ++pos; return node<AstConst>(line, Value::None()); }
                if(t.s == "yield" || t.s == "await") fail("'" + t.s + "' is not supported");
                if(is_keyword(t.s)) fail("invalid syntax");
                ++pos;
                return node<AstName>(line, t.s);
            case TT::Op:
                if(t.s == "(") return parseParen();
                if(t.s == "[") return parseListDisplay();
                if(t.s == "{") return parseBraceDisplay();
                break;
            case TT::Indent:
                throw SyntaxFault("unexpected indent", line, "IndentationError");
            default:
                break;
        }
        fail("invalid syntax");
    }

    ExprPtr parseParen(){
        int line = cur().line;
        expect("(");
        if(accept(")")) return node<AstTuple>(line);
        ExprPtr first = parseTest();
        if(isKw("for")){
            ExprPtr comp = parseComprehension(first, line);
            expect(")");
            return comp;
        }
        if(accept(")")) return first;
        auto tup = node<AstTuple>(line);
        tup->elts.push_back(first);
        while(accept(",")){
            if(isOp(")")) break;
            tup->elts.push_back(parseTest());
        }
        expect(")");
        return tup;
    }

    ExprPtr parseListDisplay(){
        int line = cur().line;
        expect("[");
        auto lst = node<AstList>(line);
        if(accept("]")) return lst;
        ExprPtr first = parseTest();
        if(isKw("for")){
            ExprPtr comp = parseComprehension(first, line);
            expect("]");
            return comp;
        }
        lst->elts.push_back(first);
        while(accept(",")){
            if(isOp("]")) break;
            lst->elts.push_back(parseTest());
        }
        expect("]");
        return lst;
    }

    ExprPtr parseBraceDisplay(){
        int line = cur().line;
        expect("{");
        auto d = node<AstDict>(line);
        if(accept("}")) return d;
        if(isOp("**")) fail("dict unpacking is not supported");
        ExprPtr k = parseTest();
        if(!accept(":")) fail("set literals are not supported");
        ExprPtr v = parseTest();
        if(isKw("for")) fail("dict comprehensions are not supported");
        d->entries.emplace_back(k, v);
        while(accept(",")){
            if(isOp("}")) break;
            ExprPtr key = parseTest();
            expect(":");
            d->entries.emplace_back(key, parseTest());
        }
        expect("}");
        return d;
    }

    // Adjacent literals concatenate; any f-string makes the whole run one.
    ExprPtr parseStrings(){
        int line = cur().line;
        bool any_f = false;
        size_t start = pos;
        while(cur().is(TT::Str) || cur().is(TT::FStr)){
            if(cur().is(TT::FStr)) any_f = true;
            ++pos;
        }
        if(!any_f){
            std::string s;
            for(size_t i = start; i < pos; ++i) s += T[i].s;
            return node<AstConst>(line, Value::S(std::move(s)));
        }
        auto js = node<AstJoinedStr>(line);
        for(size_t i = start; i < pos; ++i){
            if(T[i].is(TT::Str)){
                AstJoinedStr::Part p;
                p.text = T[i].s;
                js->parts.push_back(std::move(p));
            } else {
                parseFString(T[i].s, T[i].line, *js);
            }
        }
        return js;
    }

    void parseFString(const std::string& body, int line, AstJoinedStr& out){
        size_t i = 0;
        parseFStringParts(body, i, line, out, false);
    }

    // Reads literal text and fields until the end of `s` (or, inside a
    // format spec, until the closing brace of the enclosing field).
    void parseFStringParts(const std::string& s, size_t& i, int line, AstJoinedStr& out, bool in_spec){
        std::string text;
        auto flush = [&]{
            if(text.empty()) return;
            AstJoinedStr::Part p;
            p.text = std::move(text);
            text.clear();
            out.parts.push_back(std::move(p));
        };
        while(i < s.size()){
            char c = s[i];
            if(c == '{'){
                if(!in_spec && i + 1 < s.size() && s[i + 1] == '{'){
                    text.push_back('{');
                    i += 2;
                    continue;
                }
                flush();
                ++i;
                parseFStringField(s, i, line, out);
                continue;
            }
            if(c == '}'){
                if(in_spec) break;
                if(i + 1 < s.size() && s[i + 1] == '}'){
                    text.push_back('}');
                    i += 2;
                    continue;
                }
                throw SyntaxFault("f-string: single '}' is not allowed", line);
            }
            text.push_back(c);
            ++i;
        }
        flush();
    }

    // `i` points just past '{'; on return it points past the matching '}'.
    void parseFStringField(const std::string& s, size_t& i, int line, AstJoinedStr& out){
        size_t start = i;
        int nest = 0;
        char quote = 0;
        for(; i < s.size(); ++i){
            char c = s[i];
            if(quote){
                if(c == quote) quote = 0;
                continue;
            }
            if(c == '\'' || c == '"'){ quote = c; continue; }
            if(c == '(' || c == '[' || c == '{'){ ++nest; continue; }
            if((c == ')' || c == ']' || c == '}') && nest > 0){ --nest; continue; }
            if(nest > 0) continue;
            if(c == '}' || c == ':') break;
            if(c == '!' && !(i + 1 < s.size() && s[i + 1] == '=')) break;
        }
        if(i >= s.size()) throw SyntaxFault("f-string: expecting '}'", line);
        std::string expr_text = s.substr(start, i - start);
        AstJoinedStr::Part field;
        bool echo = false;
        // {expr=} echoes the expression text before its value
        std::string trimmed = trim_copy(expr_text);
        if(trimmed.size() > 1 && trimmed.back() == '='
           && std::string("=!<>").find(trimmed[trimmed.size() - 2]) == std::string::npos){
            AstJoinedStr::Part label;
            label.text = expr_text;
            out.parts.push_back(std::move(label));
            trimmed.pop_back();
            field.conversion = 'r';
            echo = true;
        }
        if(trim_copy(trimmed).empty()) throw SyntaxFault("f-string: empty expression not allowed", line);
        if(remainingNesting() == 0) throw SyntaxFault("too many nested parentheses", line);
        field.expr = parse_expression(trimmed, line, remainingNesting());
        if(s[i] == '!'){
            ++i;
            if(i >= s.size() || (s[i] != 'r' && s[i] != 's' && s[i] != 'a'))
                throw SyntaxFault("f-string: invalid conversion character: expected 's', 'r', or 'a'", line);
            field.conversion = s[i] == 's' ? 's' : 'r';
            echo = false;
            ++i;
            if(i >= s.size() || (s[i] != ':' && s[i] != '}'))
                throw SyntaxFault("f-string: expecting '}'", line);
        }
        if(s[i] == ':'){
            ++i;
            auto spec = std::make_shared<AstJoinedStr>();
            spec->line = line;
            parseFStringParts(s, i, line, *spec, true);
            if(i >= s.size()) throw SyntaxFault("f-string: expecting '}'", line);
            if(echo) field.conversion = 0;
            field.spec = spec;
        }
        // s[i] == '}'
        ++i;
        out.parts.push_back(std::move(field));
    }
};

} // namespace

std::shared_ptr<Program> parse(const std::string& src, size_t max_nesting){
    TRACE_FN("bytes=", src.size());
    Parser p(lex(src), max_nesting);
    return p.parseModule();
}

ExprPtr parse_expression(const std::string& src, int line, size_t max_nesting){
    std::vector<Token> toks = lex(src);
    for(auto& t : toks) t.line = line;
    Parser p(std::move(toks), max_nesting);
    return p.parseStandalone();
}

} // namespace Sandbox
