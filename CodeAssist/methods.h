#ifndef _CodeAssist_methods_h_
#define _CodeAssist_methods_h_

namespace Sandbox {

// Resolves `obj.name` against the closed str/list/dict method table.
// Dunder names raise a resolution fault, anything else unknown an
// AttributeError.
Value get_attribute(const Value& obj, const std::string& name);

bool is_dunder(const std::string& name);

// list.sort / sorted(): stable, optional key function, optional reverse.
void sort_items(Interpreter& in, Value::Items& xs, const Value* key, bool reverse);

// dict(x) / d.update(x): merges a dict or an iterable of key/value pairs.
void dict_update(DictData& d, const Value& src);

} // namespace Sandbox

#endif
