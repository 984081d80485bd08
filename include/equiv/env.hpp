#pragma once
#include "equiv/compare.hpp"
#include <cstddef>

namespace equiv {

struct CompareEnv {
    TypePolicy policy = TypePolicy::Permissive;
    bool trace = false;
    bool reportJson = false;
    size_t maxValueWidth = 120; // 0 = unlimited
};

// Detect comparison settings from process env vars:
//   EQUIV_TYPE_POLICY      strict | permissive
//   EQUIV_TRACE            1 enables [equiv][trace] lines on stderr
//   EQUIV_REPORT_JSON      1 prints each surfaced report as JSON on stderr
//   EQUIV_MAX_VALUE_WIDTH  truncation width for rendered values
// Unset or unrecognized values keep the defaults.
CompareEnv detect_env();

CompareOptions options_from_env(const CompareEnv& env);
inline CompareOptions options_from_env(){ return options_from_env(detect_env()); }

} // namespace equiv
