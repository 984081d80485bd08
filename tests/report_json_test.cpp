#include <cassert>
#include <iostream>
#include <string>
#include "equiv/reader.hpp"
#include "equiv/report_json.hpp"

using namespace equiv;

static void test_escape(){
    assert(json_escape("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
}

static void test_report_json(){
    auto res = EquivalenceComparer().compare(parse("[1 2]"), parse("[1 2 3]"));
    assert(!res.success);
    const Mismatch& m = *res.mismatch;
    MismatchReport r{m.kind, m.actual, m.expected, m.path, m.actual_type, m.expected_type, "msg", "assert_equivalent"};
    auto js = report_to_json(r);
    assert(js.find("\"code\":\"EQ102\"") != std::string::npos);
    assert(js.find("\"path\":\"root [vector].Count\"") != std::string::npos);
    assert(js.find("\"segments\":[\"root [vector]\",\"Count\"]") != std::string::npos);
    assert(js.find("\"expected\":\"3\"") != std::string::npos);
    assert(js.find("\"actual\":\"2\"") != std::string::npos);
    assert(js.find("\"message\":\"msg\"") != std::string::npos);
    assert(js.find("expected_type") == std::string::npos);

    auto missing = EquivalenceComparer().compare(parse("{}"), parse("{:a \"q\"}"));
    const Mismatch& mm = *missing.mismatch;
    MismatchReport r2{mm.kind, mm.actual, mm.expected, mm.path, {}, {}, "", "x"};
    auto js2 = report_to_json(r2);
    assert(js2.find("\"actual\":null") != std::string::npos);
    assert(js2.find("\"expected\":\"\\\"q\\\"\"") != std::string::npos);
}

void run_report_json_tests(){
    test_escape();
    test_report_json();
    std::cout << "[report_json] tests passed\n";
}
