#ifndef _CodeAssist_ast_h_
#define _CodeAssist_ast_h_

namespace Sandbox {

struct AstStmt;
using StmtPtr = std::shared_ptr<AstStmt>;
using Block = std::vector<StmtPtr>;

// Evaluation context of one function activation (or the module body).
struct Frame {
    Interpreter& in;
    std::shared_ptr<Env> env;
    // names declared `global` in the running function; null at module level
    const std::set<std::string>* globals = nullptr;
    Value ret;
};

enum class Flow { Normal, Break, Continue, Return };

//
// Expressions
//
struct AstExpr {
    int line = 0;
    virtual ~AstExpr() = default;
    virtual Value eval(Frame& f) = 0;
    // Assignment / deletion targets override these.
    virtual bool assignable() const { return false; }
    virtual void assign(Frame& f, const Value& v);
    virtual void erase(Frame& f);
};
using ExprPtr = std::shared_ptr<AstExpr>;

struct AstConst : AstExpr {
    Value val;
    explicit AstConst(Value v) : val(std::move(v)) {}
    Value eval(Frame&) override { return val; }
};

struct AstName : AstExpr {
    std::string id;
    explicit AstName(std::string s) : id(std::move(s)) {}
    Value eval(Frame& f) override;
    bool assignable() const override { return true; }
    void assign(Frame& f, const Value& v) override;
    void erase(Frame& f) override;
};

// f-string: literal pieces interleaved with formatted fields.
struct AstJoinedStr : AstExpr {
    struct Part {
        std::string text;
        ExprPtr expr;       // null for literal text
        char conversion = 0; // 'r', 's' or 0
        ExprPtr spec;       // nested format spec, may be null
    };
    std::vector<Part> parts;
    Value eval(Frame& f) override;
};

struct AstList : AstExpr {
    std::vector<ExprPtr> elts;
    Value eval(Frame& f) override;
    bool assignable() const override;
    void assign(Frame& f, const Value& v) override;
    void erase(Frame& f) override;
};

struct AstTuple : AstExpr {
    std::vector<ExprPtr> elts;
    Value eval(Frame& f) override;
    bool assignable() const override;
    void assign(Frame& f, const Value& v) override;
    void erase(Frame& f) override;
};

struct AstDict : AstExpr {
    std::vector<std::pair<ExprPtr, ExprPtr>> entries;
    Value eval(Frame& f) override;
};

struct AstListComp : AstExpr {
    struct Clause {
        ExprPtr target;
        ExprPtr iter;
        std::vector<ExprPtr> conds;
    };
    ExprPtr elt;
    std::vector<Clause> clauses;
    Value eval(Frame& f) override;
};

// Left-associative run of one precedence level: a + b - c ...
struct AstBinChain : AstExpr {
    ExprPtr first;
    std::vector<std::pair<BinOp, ExprPtr>> rest;
    Value eval(Frame& f) override;
};

struct AstUnary : AstExpr {
    char op; // '-', '+', '~' or '!' for `not`
    ExprPtr operand;
    AstUnary(char o, ExprPtr e) : op(o), operand(std::move(e)) {}
    Value eval(Frame& f) override;
};

struct AstBoolOp : AstExpr {
    bool is_and;
    std::vector<ExprPtr> values;
    explicit AstBoolOp(bool a) : is_and(a) {}
    Value eval(Frame& f) override;
};

struct AstCompare : AstExpr {
    ExprPtr left;
    std::vector<std::pair<CmpOp, ExprPtr>> rest;
    Value eval(Frame& f) override;
};

struct AstIfExp : AstExpr {
    ExprPtr cond, a, b;
    Value eval(Frame& f) override;
};

struct FunctionDecl;

struct AstLambda : AstExpr {
    std::shared_ptr<const FunctionDecl> decl;
    Value eval(Frame& f) override;
};

struct AstCall : AstExpr {
    ExprPtr fn;
    std::vector<ExprPtr> args;
    std::vector<std::pair<std::string, ExprPtr>> kwargs;
    Value eval(Frame& f) override;
};

struct AstSubscript : AstExpr {
    ExprPtr obj;
    ExprPtr index;            // plain subscript
    bool is_slice = false;
    ExprPtr lo, hi, step;     // slice bounds, each may be null
    Value eval(Frame& f) override;
    bool assignable() const override { return true; }
    void assign(Frame& f, const Value& v) override;
    void erase(Frame& f) override;
private:
    SliceSpec slice(Frame& f);
};

struct AstAttribute : AstExpr {
    ExprPtr obj;
    std::string attr;
    Value eval(Frame& f) override;
    bool assignable() const override { return true; }
    void assign(Frame& f, const Value& v) override;
};

//
// Statements
//
struct AstStmt {
    int line = 0;
    virtual ~AstStmt() = default;
    virtual Flow exec(Frame& f) = 0;
};

Flow exec_block(const Block& body, Frame& f);

struct AstExprStmt : AstStmt {
    ExprPtr expr;
    Flow exec(Frame& f) override;
};

// a = b = value
struct AstAssign : AstStmt {
    std::vector<ExprPtr> targets;
    ExprPtr value;
    Flow exec(Frame& f) override;
};

struct AstAugAssign : AstStmt {
    ExprPtr target;
    BinOp op;
    ExprPtr value;
    Flow exec(Frame& f) override;
};

struct AstIf : AstStmt {
    std::vector<std::pair<ExprPtr, Block>> branches; // if + elifs
    Block orelse;
    Flow exec(Frame& f) override;
};

struct AstWhile : AstStmt {
    ExprPtr cond;
    Block body, orelse;
    Flow exec(Frame& f) override;
};

struct AstFor : AstStmt {
    ExprPtr target, iter;
    Block body, orelse;
    Flow exec(Frame& f) override;
};

struct AstBreak : AstStmt { Flow exec(Frame&) override { return Flow::Break; } };
struct AstContinue : AstStmt { Flow exec(Frame&) override { return Flow::Continue; } };
struct AstPass : AstStmt { Flow exec(Frame&) override { return Flow::Normal; } };

struct AstReturn : AstStmt {
    ExprPtr value; // may be null
    Flow exec(Frame& f) override;
};

struct FunctionDecl {
    std::string name;
    std::vector<std::string> params;
    std::vector<ExprPtr> defaults; // for the trailing params
    Block body;
    std::set<std::string> globals;
    int line = 0;
};

struct AstFunctionDef : AstStmt {
    std::shared_ptr<const FunctionDecl> decl;
    Flow exec(Frame& f) override;
};

struct AstGlobal : AstStmt {
    std::vector<std::string> names;
    Flow exec(Frame&) override { return Flow::Normal; }
};

struct AstDelete : AstStmt {
    std::vector<ExprPtr> targets;
    Flow exec(Frame& f) override;
};

struct AstAssert : AstStmt {
    ExprPtr test, msg;
    Flow exec(Frame& f) override;
};

struct AstRaise : AstStmt {
    ExprPtr exc; // null re-raises the active exception
    Flow exec(Frame& f) override;
};

struct AstTry : AstStmt {
    struct Handler {
        ExprPtr type; // null for bare except
        std::string name;
        Block body;
        int line = 0;
    };
    Block body;
    std::vector<Handler> handlers;
    Block orelse, finalbody;
    Flow exec(Frame& f) override;
};

struct AstImport : AstStmt {
    std::string module;
    Flow exec(Frame& f) override;
};

// Parsed module: top-level block.
struct Program {
    Block body;
};

} // namespace Sandbox

#endif
