#ifndef _CodeAssist_ops_h_
#define _CodeAssist_ops_h_

namespace Sandbox {

enum class BinOp { Add, Sub, Mul, Div, FloorDiv, Mod, Pow, BitAnd, BitOr, BitXor, LShift, RShift };
enum class CmpOp { Lt, Le, Gt, Ge, Eq, Ne, In, NotIn, Is, IsNot };

const char* binop_symbol(BinOp op);
const char* cmpop_symbol(CmpOp op);

Value binary_op(BinOp op, const Value& a, const Value& b);
Value unary_op(char op, const Value& v);

bool values_equal(const Value& a, const Value& b);
bool identical(const Value& a, const Value& b);
// Ordering for < <= > >=; TypeError when the types are unordered.
bool compare_order(CmpOp op, const Value& a, const Value& b);
bool compare(CmpOp op, const Value& a, const Value& b);
bool contains(const Value& container, const Value& item);

// Dictionary key; TypeError for unhashable values.
std::string hash_key(const Value& key);

// Iteration. `f` returns false to stop early. Lists are walked by index
// against their live length, the way the dialect iterates them.
void for_each_item(const Value& iterable, const std::function<bool(const Value&)>& f);
Value::Items collect_items(const Value& iterable);
int64_t length_of(const Value& v);

struct SliceSpec {
    std::optional<int64_t> lo, hi, step;
};

// Clamps `spec` against a sequence of length `len`; returns the element count.
int64_t adjust_slice(int64_t len, const SliceSpec& spec, int64_t& start, int64_t& stop, int64_t& step);

Value get_item(const Value& obj, const Value& index);
Value get_slice(const Value& obj, const SliceSpec& spec);
void set_item(const Value& obj, const Value& index, const Value& val);
void set_slice(const Value& obj, const SliceSpec& spec, const Value& val);
void del_item(const Value& obj, const Value& index);
void del_slice(const Value& obj, const SliceSpec& spec);

// Checked 64-bit arithmetic; OverflowError on wrap.
int64_t checked_add(int64_t a, int64_t b);
int64_t checked_mul(int64_t a, int64_t b);

} // namespace Sandbox

#endif
