// GoogleTest integration: predicate-format helper and EXPECT/ASSERT macros.
#pragma once
#include "equiv/assert.hpp"
#include "equiv/env.hpp"
#include "equiv/reflect.hpp"
#include <gtest/gtest.h>

namespace equiv::testing {

// Success when equivalent; otherwise the formatted report as the failure message.
inline ::testing::AssertionResult is_equivalent(const node_ptr& actual, const node_ptr& expected,
                                                const CompareOptions& opts = options_from_env()){
    auto res = check_equivalent(actual, expected, opts);
    if(res.success) return ::testing::AssertionSuccess();
    MismatchReport report = make_report(*res.mismatch, nullptr, "EQUIV_EXPECT_EQUIVALENT");
    return ::testing::AssertionFailure() << format_report(report, detect_env().maxValueWidth);
}

template<class A, class E>
::testing::AssertionResult is_equivalent_objects(const A& actual, const E& expected){
    return is_equivalent(capture(actual), capture(expected));
}

} // namespace equiv::testing

#define EQUIV_EXPECT_EQUIVALENT(actual, expected) \
    EXPECT_TRUE(::equiv::testing::is_equivalent_objects((actual), (expected)))
#define EQUIV_ASSERT_EQUIVALENT(actual, expected) \
    ASSERT_TRUE(::equiv::testing::is_equivalent_objects((actual), (expected)))
