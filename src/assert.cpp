#include "equiv/assert.hpp"
#include "equiv/env.hpp"
#include "equiv/report_json.hpp"

namespace equiv {

CompareResult check_equivalent(const node_ptr& actual, const node_ptr& expected, const CompareOptions& opts){
	return EquivalenceComparer(opts).compare(actual, expected);
}

CompareResult check_equivalent(const node_ptr& actual, const node_ptr& expected){
	return check_equivalent(actual, expected, options_from_env());
}

MismatchReport make_report(const Mismatch& m, MessageFn message, std::string_view caller){
	MismatchReport r;
	r.kind = m.kind;
	r.actual = m.actual;
	r.expected = m.expected;
	r.path = m.path;
	r.actual_type = m.actual_type;
	r.expected_type = m.expected_type;
	if(message) r.custom_message = message();
	r.caller = std::string(caller);
	return r;
}

static void assert_with(const node_ptr& actual, const node_ptr& expected, const CompareOptions& opts,
                        const CompareEnv& env, MessageFn message, std::string_view caller){
	auto res = check_equivalent(actual, expected, opts);
	if(res.success) return;
	MismatchReport report = make_report(*res.mismatch, message, caller);
	maybe_print_json(report, env.reportJson);
	std::string text = format_report(report, env.maxValueWidth);
	throw equivalence_failure(std::move(report), text);
}

void assert_equivalent(const node_ptr& actual, const node_ptr& expected){
	CompareEnv env = detect_env();
	assert_with(actual, expected, options_from_env(env), env, nullptr, "assert_equivalent");
}

void assert_equivalent(const node_ptr& actual, const node_ptr& expected, const std::string& message){
	CompareEnv env = detect_env();
	auto fn = [&]{ return message; };
	assert_with(actual, expected, options_from_env(env), env, fn, "assert_equivalent");
}

void assert_equivalent(const node_ptr& actual, const node_ptr& expected, MessageFn message, std::string_view caller){
	CompareEnv env = detect_env();
	assert_with(actual, expected, options_from_env(env), env, message, caller);
}

void assert_equivalent(const node_ptr& actual, const node_ptr& expected, const CompareOptions& opts,
                       MessageFn message, std::string_view caller){
	assert_with(actual, expected, opts, detect_env(), message, caller);
}

} // namespace equiv
