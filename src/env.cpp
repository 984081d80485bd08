#include "equiv/env.hpp"
#include <cstdlib>
#include <string>

namespace equiv {

CompareEnv detect_env(){
    CompareEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("EQUIV_TYPE_POLICY")) {
        if (auto p = parse_policy(v)) e.policy = *p;
    }

    if (const char* v = get("EQUIV_TRACE")) e.trace = (std::string(v) == "1");

    if (const char* v = get("EQUIV_REPORT_JSON")) e.reportJson = (std::string(v) == "1");

    if (const char* v = get("EQUIV_MAX_VALUE_WIDTH")) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(v, &end, 10);
        if (end && *end == '\0') e.maxValueWidth = static_cast<size_t>(n);
    }

    return e;
}

CompareOptions options_from_env(const CompareEnv& env){
    CompareOptions o;
    o.policy = env.policy;
    o.trace = env.trace;
    return o;
}

} // namespace equiv
