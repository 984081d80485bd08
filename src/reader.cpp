// PEGTL grammar and actions for the fixture notation.
#include "equiv/reader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <tao/pegtl.hpp>

namespace equiv {
namespace reader_detail {

namespace grammar {
using namespace tao::pegtl;

struct comment : if_must< one<';'>, until< eolf > > {};
struct sep : sor< space, one<','>, comment > {};
struct skip : star< sep > {};

struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct ident : seq< ident_first, star< ident_rest > > {};
// shop::Order
struct type_ident : seq< ident, star< two<':'>, ident > > {};
struct sym_char : sor< ident_rest, one<'-','.','/',':','?','!','*','+'> > {};

struct nil_lit : seq< TAO_PEGTL_STRING("nil"), not_at< sym_char > > {};
struct true_lit : seq< TAO_PEGTL_STRING("true"), not_at< sym_char > > {};
struct false_lit : seq< TAO_PEGTL_STRING("false"), not_at< sym_char > > {};

struct nan_lit : TAO_PEGTL_STRING("##NaN") {};
struct inf_lit : TAO_PEGTL_STRING("##Inf") {};
struct neg_inf_lit : TAO_PEGTL_STRING("##-Inf") {};
struct special_float : sor< nan_lit, inf_lit, neg_inf_lit > {};

struct sign : one<'-','+'> {};
struct fraction : seq< one<'.'>, star< digit > > {};
struct exponent : seq< one<'e','E'>, opt< sign >, plus< digit > > {};
struct number : seq< opt< sign >, plus< digit >, opt< fraction >, opt< exponent >, opt< one<'u'> >, not_at< sym_char > > {};

struct escaped : seq< one<'\\'>, one<'n','t','r','"','\\'> > {};
struct str_content : star< sor< escaped, not_one<'"','\\'> > > {};
struct str_body : seq< one<'"'>, must< str_content, one<'"'> > > {};
struct string_lit : str_body {};
struct opaque_text : str_body {};

struct keyword_lit : seq< one<':'>, plus< sym_char > > {};

struct value;
template<typename Close>
struct elements : seq< skip, star< value, skip >, Close > {};

struct vec_open : one<'['> {};
struct vec_close : one<']'> {};
struct vector_lit : if_must< vec_open, elements< vec_close > > {};

struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct list_lit : if_must< list_open, elements< list_close > > {};

struct set_open : seq< one<'#'>, one<'{'> > {};
struct set_close : one<'}'> {};
struct set_lit : if_must< set_open, elements< set_close > > {};

struct field_key : seq< one<':'>, plus< sym_char > > {};
struct field_entry : if_must< field_key, skip, value > {};
struct rec_close : one<'}'> {};
struct rec_fields : seq< skip, star< field_entry, skip >, rec_close > {};

struct map_open : one<'{'> {};
struct map_lit : if_must< map_open, rec_fields > {};

struct tag_head : seq< one<'#'>, type_ident > {};
struct base_name : type_ident {};
struct bases : if_must< one<'<'>, skip, base_name, skip, star< base_name, skip >, one<'>'> > {};
struct rec_open : one<'{'> {};
struct tagged_body : sor< if_must< rec_open, rec_fields >, opaque_text > {};
struct tagged_lit : if_must< tag_head, opt< bases >, skip, tagged_body > {};

struct value : sor< nil_lit, true_lit, false_lit, special_float, number, string_lit, keyword_lit,
                    vector_lit, list_lit, set_lit, map_lit, tagged_lit > {};

struct document : must< skip, value, skip, eof > {};
} // namespace grammar

struct frame {
	enum Kind { Sequence, Record } kind;
	std::string type;
	std::vector<std::string> bases;
	std::vector<node_ptr> elems;
	std::vector<field> fields;
	std::string key;
	source_pos pos;
};

struct build_state {
	std::string source;
	node_ptr result;
	std::vector<frame> stack;
	std::string text;        // last unescaped string body
	std::string tag;         // pending #Tag
	std::vector<std::string> tag_bases;
	source_pos tag_pos;

	void emit(node_ptr n){
		if(stack.empty()){ result = std::move(n); return; }
		frame& f = stack.back();
		if(f.kind == frame::Sequence){ f.elems.push_back(std::move(n)); return; }
		f.fields.push_back(field{std::move(f.key), std::move(n)});
		f.key.clear();
	}
};

template<typename Input>
static source_pos pos_of(const Input& in){
	auto p = in.position();
	return source_pos{static_cast<int>(p.line), static_cast<int>(p.column)};
}

template<typename Input>
[[noreturn]] static void fail_at(const Input& in, const std::string& msg){
	auto p = in.position();
	throw parse_error(p.source + ":" + std::to_string(p.line) + ":" + std::to_string(p.column) + ": " + msg,
	                  static_cast<int>(p.line), static_cast<int>(p.column));
}

static node_ptr at(node_ptr n, source_pos p){ n->pos = p; return n; }

template<typename Rule> struct action : tao::pegtl::nothing<Rule> {};

template<> struct action<grammar::nil_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_null(), pos_of(in))); }
};
template<> struct action<grammar::true_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_bool(true), pos_of(in))); }
};
template<> struct action<grammar::false_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_bool(false), pos_of(in))); }
};
template<> struct action<grammar::nan_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_f64(std::numeric_limits<double>::quiet_NaN()), pos_of(in))); }
};
template<> struct action<grammar::inf_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_f64(std::numeric_limits<double>::infinity()), pos_of(in))); }
};
template<> struct action<grammar::neg_inf_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_f64(-std::numeric_limits<double>::infinity()), pos_of(in))); }
};

template<> struct action<grammar::number> {
	template<typename Input> static void apply(const Input& in, build_state& st){
		std::string s = in.string();
		errno = 0;
		char* end = nullptr;
		if(s.back() == 'u'){
			s.pop_back();
			if(s.find_first_of("-.eE") != std::string::npos) fail_at(in, "invalid unsigned literal '" + in.string() + "'");
			unsigned long long v = std::strtoull(s.c_str(), &end, 10);
			if(errno == ERANGE) fail_at(in, "unsigned literal out of range '" + in.string() + "'");
			st.emit(at(n_u64(static_cast<uint64_t>(v)), pos_of(in)));
		} else if(s.find_first_of(".eE") != std::string::npos){
			double v = std::strtod(s.c_str(), &end);
			st.emit(at(n_f64(v), pos_of(in)));
		} else {
			long long v = std::strtoll(s.c_str(), &end, 10);
			if(errno == ERANGE) fail_at(in, "integer literal out of range '" + s + "'");
			st.emit(at(n_i64(static_cast<int64_t>(v)), pos_of(in)));
		}
	}
};

template<> struct action<grammar::str_content> {
	template<typename Input> static void apply(const Input& in, build_state& st){
		const std::string raw = in.string();
		st.text.clear();
		for(size_t i=0;i<raw.size(); ++i){
			char c = raw[i];
			if(c != '\\'){ st.text += c; continue; }
			switch(raw[++i]){
				case 'n': st.text += '\n'; break;
				case 't': st.text += '\t'; break;
				case 'r': st.text += '\r'; break;
				default: st.text += raw[i]; break;
			}
		}
	}
};
template<> struct action<grammar::string_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.emit(at(n_str(std::move(st.text)), pos_of(in))); }
};
template<> struct action<grammar::opaque_text> {
	template<typename Input> static void apply(const Input&, build_state& st){
		if(!st.tag_bases.empty()) fail_at_tag(st);
		st.emit(at(n_literal(std::move(st.tag), std::move(st.text)), st.tag_pos));
	}
	[[noreturn]] static void fail_at_tag(const build_state& st){
		throw parse_error(st.source + ":" + std::to_string(st.tag_pos.line) + ":" + std::to_string(st.tag_pos.col) +
		                  ": ancestor list is only allowed on records", st.tag_pos.line, st.tag_pos.col);
	}
};

template<> struct action<grammar::keyword_lit> {
	template<typename Input> static void apply(const Input& in, build_state& st){
		std::string body = in.string().substr(1);
		auto slash = body.rfind('/');
		if(slash == std::string::npos){ st.emit(at(n_enum("", body), pos_of(in))); return; }
		if(slash == 0 || slash + 1 == body.size()) fail_at(in, "malformed enumerator '" + in.string() + "'");
		st.emit(at(n_enum(body.substr(0, slash), body.substr(slash + 1)), pos_of(in)));
	}
};

template<typename Input>
static void open_sequence(const Input& in, build_state& st, const char* type){
	frame f{frame::Sequence, type, {}, {}, {}, {}, pos_of(in)};
	st.stack.push_back(std::move(f));
}
static void close_sequence(build_state& st){
	frame f = std::move(st.stack.back());
	st.stack.pop_back();
	st.emit(at(n_seq(std::move(f.type), std::move(f.elems)), f.pos));
}

template<> struct action<grammar::vec_open> {
	template<typename Input> static void apply(const Input& in, build_state& st){ open_sequence(in, st, "vector"); }
};
template<> struct action<grammar::list_open> {
	template<typename Input> static void apply(const Input& in, build_state& st){ open_sequence(in, st, "list"); }
};
template<> struct action<grammar::set_open> {
	template<typename Input> static void apply(const Input& in, build_state& st){ open_sequence(in, st, "set"); }
};
template<> struct action<grammar::vec_close> {
	template<typename Input> static void apply(const Input&, build_state& st){ close_sequence(st); }
};
template<> struct action<grammar::list_close> {
	template<typename Input> static void apply(const Input&, build_state& st){ close_sequence(st); }
};
template<> struct action<grammar::set_close> {
	template<typename Input> static void apply(const Input&, build_state& st){ close_sequence(st); }
};

template<> struct action<grammar::map_open> {
	template<typename Input> static void apply(const Input& in, build_state& st){
		st.stack.push_back(frame{frame::Record, "record", {}, {}, {}, {}, pos_of(in)});
	}
};
template<> struct action<grammar::tag_head> {
	template<typename Input> static void apply(const Input& in, build_state& st){
		st.tag = in.string().substr(1);
		st.tag_bases.clear();
		st.tag_pos = pos_of(in);
	}
};
template<> struct action<grammar::base_name> {
	template<typename Input> static void apply(const Input& in, build_state& st){ st.tag_bases.push_back(in.string()); }
};
template<> struct action<grammar::rec_open> {
	template<typename Input> static void apply(const Input&, build_state& st){
		frame f{frame::Record, std::move(st.tag), std::move(st.tag_bases), {}, {}, {}, st.tag_pos};
		st.tag_bases.clear();
		st.stack.push_back(std::move(f));
	}
};
template<> struct action<grammar::field_key> {
	template<typename Input> static void apply(const Input& in, build_state& st){
		std::string key = in.string().substr(1);
		frame& f = st.stack.back();
		for(const auto& existing : f.fields)
			if(existing.name == key) fail_at(in, "duplicate field ':" + key + "'");
		f.key = std::move(key);
	}
};
template<> struct action<grammar::rec_close> {
	template<typename Input> static void apply(const Input&, build_state& st){
		frame f = std::move(st.stack.back());
		st.stack.pop_back();
		record r;
		r.type = std::move(f.type);
		r.bases = std::move(f.bases);
		r.fields = std::move(f.fields);
		st.emit(at(detail::make_node(std::move(r)), f.pos));
	}
};

} // namespace reader_detail

node_ptr parse(std::string_view src, std::string_view source_name){
	using namespace reader_detail;
	tao::pegtl::memory_input in(src.data(), src.size(), std::string(source_name));
	build_state st;
	st.source = std::string(source_name);
	try {
		tao::pegtl::parse< grammar::document, action >(in, st);
	} catch (const tao::pegtl::parse_error& e) {
		const auto& p = e.positions().front();
		throw parse_error(e.what(), static_cast<int>(p.line), static_cast<int>(p.column));
	}
	return st.result;
}

} // namespace equiv
