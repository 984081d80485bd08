// report_json.hpp - JSON serialization for MismatchReport
#pragma once
#include "equiv/report.hpp"
#include <string>

namespace equiv {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a report to a compact JSON string.
std::string report_to_json(const MismatchReport& r);

// Print the report JSON to stderr when `enabled` (CompareEnv::reportJson).
void maybe_print_json(const MismatchReport& r, bool enabled);
// Same, reading EQUIV_REPORT_JSON from the environment.
void maybe_print_json(const MismatchReport& r);

} // namespace equiv
