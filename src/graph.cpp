// Node classification, runtime type names and compact rendering.
#include "equiv/graph.hpp"
#include <cmath>
#include <sstream>

namespace equiv {

node_kind kind_of(const node& n) {
	struct Visitor {
		node_kind operator()(std::monostate) const { return node_kind::Null; }
		node_kind operator()(bool) const { return node_kind::Value; }
		node_kind operator()(int64_t) const { return node_kind::Value; }
		node_kind operator()(uint64_t) const { return node_kind::Value; }
		node_kind operator()(double) const { return node_kind::Value; }
		node_kind operator()(const std::string&) const { return node_kind::Text; }
		node_kind operator()(const enumerator&) const { return node_kind::Value; }
		node_kind operator()(const sequence&) const { return node_kind::Sequence; }
		node_kind operator()(const record&) const { return node_kind::Composite; }
		node_kind operator()(const opaque_ptr&) const { return node_kind::Value; }
	};
	return std::visit(Visitor{}, n.data);
}

const char* kind_name(node_kind k) {
	switch (k) {
	case node_kind::Null: return "null";
	case node_kind::Value: return "value";
	case node_kind::Text: return "text";
	case node_kind::Sequence: return "sequence";
	case node_kind::Composite: return "composite";
	}
	return "<bad-kind>";
}

std::string type_name(const node& n) {
	struct Visitor {
		std::string operator()(std::monostate) const { return "nil"; }
		std::string operator()(bool) const { return "bool"; }
		std::string operator()(int64_t) const { return "i64"; }
		std::string operator()(uint64_t) const { return "u64"; }
		std::string operator()(double) const { return "f64"; }
		std::string operator()(const std::string&) const { return "string"; }
		std::string operator()(const enumerator& e) const { return e.type.empty() ? std::string("keyword") : e.type; }
		std::string operator()(const sequence& s) const { return s.type.empty() ? std::string("vector") : s.type; }
		std::string operator()(const record& r) const { return r.type.empty() ? std::string("record") : r.type; }
		std::string operator()(const opaque_ptr& o) const { return o ? o->type() : std::string("opaque"); }
	};
	return std::visit(Visitor{}, n.data);
}

const field* find_field(const node& n, std::string_view name) {
	auto* r = std::get_if<record>(&n.data);
	if (!r) return nullptr;
	for (const auto& f : r->fields)
		if (f.name == name) return &f;
	return nullptr;
}

static std::string quote(const std::string& s) {
	std::string out = "\"";
	for (char c : s) {
		switch (c) {
		case '"': out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		default: out += c; break;
		}
	}
	out += '"';
	return out;
}

static std::string join_elems(const std::vector<node_ptr>& elems) {
	std::string out;
	bool first = true;
	for (auto& e : elems) {
		if (!first) out += ' ';
		first = false;
		out += to_string(e);
	}
	return out;
}

std::string to_string(const node& n) {
	struct V {
		std::string operator()(std::monostate) const { return "nil"; }
		std::string operator()(bool b) const { return b ? "true" : "false"; }
		std::string operator()(int64_t i) const { return std::to_string(i); }
		std::string operator()(uint64_t u) const { return std::to_string(u) + 'u'; }
		std::string operator()(double d) const {
			if (std::isnan(d)) return "##NaN";
			if (std::isinf(d)) return d > 0 ? "##Inf" : "##-Inf";
			std::ostringstream oss;
			oss << d;
			auto s = oss.str();
			// keep floats distinguishable from integers when read back
			if (s.find_first_of(".eE") == std::string::npos) s += ".0";
			return s;
		}
		std::string operator()(const std::string& s) const { return quote(s); }
		std::string operator()(const enumerator& e) const { return e.type.empty() ? ':' + e.name : ':' + e.type + '/' + e.name; }
		std::string operator()(const sequence& s) const {
			if (s.type == "list") return '(' + join_elems(s.elems) + ')';
			if (s.type == "set") return "#{" + join_elems(s.elems) + '}';
			return '[' + join_elems(s.elems) + ']';
		}
		std::string operator()(const record& r) const {
			std::string out;
			if (!r.type.empty() && r.type != "record") {
				out += '#' + r.type;
				if (!r.bases.empty()) {
					out += '<';
					for (size_t i = 0; i < r.bases.size(); ++i) {
						if (i) out += ' ';
						out += r.bases[i];
					}
					out += '>';
				}
				out += ' ';
			}
			out += '{';
			bool first = true;
			for (auto& f : r.fields) {
				if (!first) out += ' ';
				first = false;
				out += ':' + f.name + ' ' + to_string(f.value);
			}
			out += '}';
			return out;
		}
		std::string operator()(const opaque_ptr& o) const {
			if (!o) return "nil";
			return '#' + o->type() + ' ' + quote(o->render());
		}
	};
	return std::visit(V{}, n.data);
}

} // namespace equiv
