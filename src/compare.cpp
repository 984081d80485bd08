// Structural equivalence: null / value / text / sequence / composite dispatch.
#include "equiv/compare.hpp"
#include <cmath>
#include <numeric>
#include <llvm/Support/raw_ostream.h>

namespace equiv {

const char* mismatch_code(MismatchKind k){
	switch(k){
	case MismatchKind::NullMismatch: return "EQ100";
	case MismatchKind::TypeMismatch: return "EQ101";
	case MismatchKind::CountMismatch: return "EQ102";
	case MismatchKind::ValueMismatch: return "EQ103";
	case MismatchKind::MissingMember: return "EQ104";
	}
	return "EQ000";
}

const char* mismatch_name(MismatchKind k){
	switch(k){
	case MismatchKind::NullMismatch: return "null mismatch";
	case MismatchKind::TypeMismatch: return "type mismatch";
	case MismatchKind::CountMismatch: return "count mismatch";
	case MismatchKind::ValueMismatch: return "value mismatch";
	case MismatchKind::MissingMember: return "missing member";
	}
	return "<bad-mismatch>";
}

std::string render_path(const ComparisonPath& path){
	std::string out;
	for(size_t i=0;i<path.size(); ++i){
		if(i) out += '.';
		out += path[i];
	}
	return out;
}

static void annotate(ComparisonPath& path, const std::string& type){
	if(path.empty()) path.push_back(kRootSegment);
	path.back() += " [" + type + "]";
}

static ComparisonPath extend(const ComparisonPath& path, std::string segment){
	ComparisonPath out = path;
	out.push_back(std::move(segment));
	return out;
}

static bool values_equal(const node& a, const node& e){
	if(a.data.index() != e.data.index()) return false;
	struct Visitor {
		const node& a;
		bool operator()(bool v) const { return std::get<bool>(a.data) == v; }
		bool operator()(int64_t v) const { return std::get<int64_t>(a.data) == v; }
		bool operator()(uint64_t v) const { return std::get<uint64_t>(a.data) == v; }
		bool operator()(double v) const {
			double x = std::get<double>(a.data);
			return x == v || (std::isnan(x) && std::isnan(v));
		}
		bool operator()(const enumerator& v) const {
			const auto& x = std::get<enumerator>(a.data);
			return x.type == v.type && x.name == v.name;
		}
		bool operator()(const opaque_ptr& v) const {
			const auto& x = std::get<opaque_ptr>(a.data);
			if(x == v) return true;
			if(!x || !v) return false;
			return x->equals(*v);
		}
		// nil, text, sequences and records never reach a value comparison
		bool operator()(std::monostate) const { return false; }
		bool operator()(const std::string&) const { return false; }
		bool operator()(const sequence&) const { return false; }
		bool operator()(const record&) const { return false; }
	};
	return std::visit(Visitor{a}, e.data);
}

CompareResult EquivalenceComparer::fail(MismatchKind kind, node_ptr actual, node_ptr expected, ComparisonPath path){
	return CompareResult::fail(Mismatch{kind, std::move(actual), std::move(expected), std::move(path), {}, {}});
}

CompareResult EquivalenceComparer::compare(const node_ptr& actual, const node_ptr& expected) const {
	auto r = compare_objects(actual, expected, ComparisonPath{});
	if(opts_.trace && !r.success)
		llvm::errs() << "[equiv][trace] mismatch " << mismatch_code(r.mismatch->kind) << " at " << render_path(r.mismatch->path) << "\n";
	return r;
}

CompareResult EquivalenceComparer::compare_objects(const node_ptr& actual, const node_ptr& expected, ComparisonPath path) const {
	bool actualNull = is_null(actual), expectedNull = is_null(expected);
	if(expectedNull || actualNull){
		if(expectedNull && actualNull) return CompareResult::ok();
		return fail(MismatchKind::NullMismatch, actual, expected, std::move(path));
	}

	if(!types_compatible(*actual, *expected, opts_.policy)){
		return CompareResult::fail(Mismatch{MismatchKind::TypeMismatch, actual, expected, std::move(path),
		                                    type_name(*actual), type_name(*expected)});
	}
	annotate(path, type_name(*expected));

	node_kind kind = kind_of(*expected);
	if(opts_.trace) llvm::errs() << "[equiv][trace] visit " << render_path(path) << " kind=" << kind_name(kind) << "\n";
	if(kind == node_kind::Value) return compare_values(actual, expected, path);
	return compare_references(actual, expected, path);
}

CompareResult EquivalenceComparer::compare_values(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const {
	if(!values_equal(*actual, *expected))
		return fail(MismatchKind::ValueMismatch, actual, expected, path);
	return CompareResult::ok();
}

CompareResult EquivalenceComparer::compare_references(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const {
	if(actual.get() == expected.get()) return CompareResult::ok();

	switch(kind_of(*expected)){
	case node_kind::Text: return compare_strings(actual, expected, path);
	case node_kind::Sequence: return compare_sequences(actual, expected, path);
	default: return compare_members(actual, expected, path);
	}
}

CompareResult EquivalenceComparer::compare_strings(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const {
	auto* a = std::get_if<std::string>(&actual->data);
	auto* e = std::get_if<std::string>(&expected->data);
	if(!a || !e || *a != *e)
		return fail(MismatchKind::ValueMismatch, actual, expected, path);
	return CompareResult::ok();
}

CompareResult EquivalenceComparer::compare_sequences(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const {
	const auto& expectedItems = std::get<sequence>(expected->data).elems;
	const auto& actualItems = std::get<sequence>(actual->data).elems;

	if(actualItems.size() != expectedItems.size())
		return fail(MismatchKind::CountMismatch, n_i64((int64_t)actualItems.size()), n_i64((int64_t)expectedItems.size()), extend(path, "Count"));

	std::vector<size_t> unmatched(actualItems.size());
	std::iota(unmatched.begin(), unmatched.end(), size_t{0});

	for(size_t i=0;i<expectedItems.size(); ++i){
		auto r = loose_match(unmatched, actualItems, expectedItems[i], extend(path, "Element [" + std::to_string(i) + "]"));
		if(!r.success) return r;
	}
	return CompareResult::ok();
}

CompareResult EquivalenceComparer::loose_match(std::vector<size_t>& unmatched, const std::vector<node_ptr>& actual_items,
                                               const node_ptr& expected_item, const ComparisonPath& path) const {
	for(size_t i=0;i<unmatched.size(); ++i){
		size_t index = unmatched[i];
		if(opts_.trace) llvm::errs() << "[equiv][trace] loose-match " << render_path(path) << " candidate=" << index << "\n";
		auto r = compare_objects(actual_items[index], expected_item, path);
		if(r.success){
			unmatched.erase(unmatched.begin() + (std::ptrdiff_t)i);
			return r;
		}
		// the last candidate's failure is the one reported
		if(i + 1 == unmatched.size()) return r;
		if(opts_.trace) llvm::errs() << "[equiv][trace] discard candidate=" << index << " " << mismatch_code(r.mismatch->kind) << " at " << render_path(r.mismatch->path) << "\n";
	}
	return CompareResult::ok();
}

CompareResult EquivalenceComparer::compare_members(const node_ptr& actual, const node_ptr& expected, const ComparisonPath& path) const {
	const auto& members = std::get<record>(expected->data).fields;
	for(const auto& m : members){
		ComparisonPath memberPath = extend(path, m.name);
		const field* af = find_field(*actual, m.name);
		if(!af) return fail(MismatchKind::MissingMember, nullptr, m.value, std::move(memberPath));
		auto r = compare_objects(af->value, m.value, std::move(memberPath));
		if(!r.success) return r;
	}
	return CompareResult::ok();
}

} // namespace equiv
