// Public assertion entry points over object graphs.
#pragma once
#include "equiv/compare.hpp"
#include "equiv/report.hpp"
#include <string>
#include <string_view>
#include <llvm/ADT/STLFunctionalExtras.h>

namespace equiv {

// Lazily produced custom message; only invoked for the surfaced failure.
using MessageFn = llvm::function_ref<std::string()>;

// Run the comparison without throwing.
CompareResult check_equivalent(const node_ptr& actual, const node_ptr& expected, const CompareOptions& opts);
CompareResult check_equivalent(const node_ptr& actual, const node_ptr& expected);

// Build the outward report for a mismatch, invoking `message` if present.
MismatchReport make_report(const Mismatch& m, MessageFn message, std::string_view caller);

// Throw equivalence_failure when actual and expected are not structurally equivalent.
// Options default to options_from_env(); the report width comes from EQUIV_MAX_VALUE_WIDTH.
void assert_equivalent(const node_ptr& actual, const node_ptr& expected);
void assert_equivalent(const node_ptr& actual, const node_ptr& expected, const std::string& message);
void assert_equivalent(const node_ptr& actual, const node_ptr& expected, MessageFn message,
                       std::string_view caller = "assert_equivalent");
void assert_equivalent(const node_ptr& actual, const node_ptr& expected, const CompareOptions& opts,
                       MessageFn message = nullptr, std::string_view caller = "assert_equivalent");

} // namespace equiv
