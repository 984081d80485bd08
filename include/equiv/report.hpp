// Structured assertion failure and its human-readable rendering.
#pragma once
#include "equiv/compare.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace equiv {

struct MismatchReport {
    MismatchKind kind = MismatchKind::ValueMismatch;
    node_ptr actual;
    node_ptr expected;
    ComparisonPath path;
    std::string actual_type;
    std::string expected_type;
    std::string custom_message; // empty when none was supplied
    std::string caller;         // originating assertion call
};

// Render a value for a report, cut to `max_width` characters (0 = unlimited).
std::string render_value(const node_ptr& v, size_t max_width);

// Multi-line report text, e.g.
//   assert_equivalent [EQ103 value mismatch]
//       comparing object equivalence, at path:
//   root [Order].Id [i64]
//
//       expected value to be
//   2
//       but was
//   1
std::string format_report(const MismatchReport& r, size_t max_width = 120);

// Raised by the assertion entry points; what() is the formatted report.
class equivalence_failure : public std::runtime_error {
public:
    equivalence_failure(MismatchReport report, const std::string& text)
        : std::runtime_error(text), report_(std::move(report)) {}
    const MismatchReport& report() const { return report_; }
private:
    MismatchReport report_;
};

} // namespace equiv
