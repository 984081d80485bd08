#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include "equiv/compare.hpp"
#include "equiv/reader.hpp"

using namespace equiv;

static CompareResult cmp(const node_ptr& a, const node_ptr& e, TypePolicy p = TypePolicy::Permissive){
    CompareOptions o; o.policy = p;
    return EquivalenceComparer(o).compare(a, e);
}

static CompareResult cmp_text(const char* a, const char* e, TypePolicy p = TypePolicy::Permissive){
    return cmp(parse(a, "<actual>"), parse(e, "<expected>"), p);
}

static std::string last_segment(const CompareResult& r){
    return r.mismatch->path.empty() ? std::string() : r.mismatch->path.back();
}

static void test_reflexivity(){
    const char* src = "#Order {:Id 1 :Lines [#Line {:Sku \"A\" :Qty 2}] :Tags #{:x :y} :Ratio 0.5}";
    auto g = parse(src);
    assert(cmp(g, g).success);
    assert(cmp_text(src, src).success);
}

static void test_nulls(){
    assert(cmp(nullptr, nullptr).success);
    assert(cmp(n_null(), nullptr).success);
    auto r = cmp(nullptr, n_i64(1));
    assert(!r.success && r.mismatch->kind == MismatchKind::NullMismatch);
    assert(r.mismatch->path.empty());
    auto r2 = cmp(n_i64(1), nullptr);
    assert(!r2.success && r2.mismatch->kind == MismatchKind::NullMismatch);
    auto r3 = cmp_text("{:a nil}", "{:a 1}");
    assert(!r3.success && r3.mismatch->kind == MismatchKind::NullMismatch);
    assert(render_path(r3.mismatch->path) == "root [record].a");
}

static void test_values(){
    assert(cmp_text("42", "42").success);
    auto r = cmp_text("41", "42");
    assert(!r.success && r.mismatch->kind == MismatchKind::ValueMismatch);
    assert(render_path(r.mismatch->path) == "root [i64]");
    assert(cmp_text("##NaN", "##NaN").success);
    assert(!cmp_text("1.0", "##NaN").success);
    assert(cmp_text(":Color/Red", ":Color/Red").success);
    assert(!cmp_text(":Color/Red", ":Color/Blue").success);
    assert(cmp_text("#Date \"2024-01-01\"", "#Date \"2024-01-01\"").success);
    assert(!cmp_text("#Date \"2024-01-02\"", "#Date \"2024-01-01\"").success);
}

static void test_value_alternatives(){
    assert(cmp(n_bool(true), n_bool(true)).success);
    assert(!cmp(n_bool(true), n_bool(false)).success);
    assert(cmp(n_u64(7), n_u64(7)).success);
    assert(!cmp(n_u64(7), n_u64(8)).success);
    assert(cmp(n_enum("", "ok"), n_enum("", "ok")).success);
    assert(!cmp(n_enum("", "ok"), n_enum("", "err")).success);
    auto lit = cmp(n_literal("Date", "x"), n_literal("Date", "y"));
    assert(!lit.success && lit.mismatch->kind == MismatchKind::ValueMismatch);
    assert(render_path(lit.mismatch->path) == "root [Date]");
}

static void test_text_exactness(){
    assert(cmp_text("\"abc\"", "\"abc\"").success);
    auto r = cmp_text("\"abc\"", "\"Abc\"");
    assert(!r.success && r.mismatch->kind == MismatchKind::ValueMismatch);
    assert(!cmp_text("\"abc \"", "\"abc\"").success);
}

static void test_sequence_order_independence(){
    assert(cmp_text("[1 2 3]", "[3 1 2]").success);
    assert(cmp_text("[{:a 1} {:a 2}]", "[{:a 2} {:a 1}]").success);
    assert(cmp_text("[1 1 2]", "[1 2 1]").success);

    auto r = cmp_text("[1 2 2]", "[1 2 3]");
    assert(!r.success);
    assert(r.mismatch->kind == MismatchKind::ValueMismatch);
    assert(last_segment(r).rfind("Element [2]", 0) == 0);
    assert(render_path(r.mismatch->path) == "root [vector].Element [2] [i64]");
    // the last remaining candidate is the second 2
    assert(std::get<int64_t>(r.mismatch->actual->data) == 2);
    assert(std::get<int64_t>(r.mismatch->expected->data) == 3);
}

static void test_count_mismatch(){
    auto r = cmp_text("[1 2]", "[1 2 3]");
    assert(!r.success && r.mismatch->kind == MismatchKind::CountMismatch);
    assert(last_segment(r) == "Count");
    assert(std::get<int64_t>(r.mismatch->actual->data) == 2);
    assert(std::get<int64_t>(r.mismatch->expected->data) == 3);
}

static void test_drill_down(){
    auto r = cmp_text("#Order {:Customer #Customer {:Address #Address {:City \"Oslo\"}}}",
                      "#Order {:Customer #Customer {:Address #Address {:City \"Bergen\"}}}");
    assert(!r.success);
    assert(render_path(r.mismatch->path) ==
           "root [Order].Customer [Customer].Address [Address].City [string]");

    auto nested = cmp_text("#Order {:Lines [#Line {:Sku \"A\"} #Line {:Sku \"B\"}]}",
                           "#Order {:Lines [#Line {:Sku \"A\"} #Line {:Sku \"C\"}]}");
    assert(!nested.success);
    assert(render_path(nested.mismatch->path) ==
           "root [Order].Lines [vector].Element [1] [Line].Sku [string]");
}

static void test_first_failure(){
    auto r = cmp_text("{:a 1 :b 2 :c 3}", "{:a 1 :b 20 :c 30}");
    assert(!r.success);
    assert(last_segment(r) == "b [i64]");
    // expected's declaration order decides, not actual's
    auto r2 = cmp_text("{:c 3 :b 2 :a 1}", "{:a 1 :b 20 :c 30}");
    assert(last_segment(r2) == "b [i64]");
}

static void test_missing_member(){
    auto r = cmp_text("#Order {:Id 1}", "#Order {:Id 1 :Note \"x\"}");
    assert(!r.success && r.mismatch->kind == MismatchKind::MissingMember);
    assert(render_path(r.mismatch->path) == "root [Order].Note");
    assert(!r.mismatch->actual);
    // extra actual members are ignored
    assert(cmp_text("#Order {:Id 1 :Extra 2}", "#Order {:Id 1}").success);
}

static void test_idempotence(){
    auto a = parse("[#P {:x 1} #P {:x 2} #P {:x 2}]");
    auto e = parse("[#P {:x 2} #P {:x 3} #P {:x 1}]");
    EquivalenceComparer c;
    auto r1 = c.compare(a, e);
    auto r2 = c.compare(a, e);
    assert(!r1.success && !r2.success);
    assert(r1.mismatch->kind == r2.mismatch->kind);
    assert(render_path(r1.mismatch->path) == render_path(r2.mismatch->path));
    assert(to_string(r1.mismatch->actual) == to_string(r2.mismatch->actual));
}

static void test_type_policies(){
    const char* actual = "#Manager<Employee Person> {:Name \"Ada\" :Reports 3}";
    const char* expected = "#Person {:Name \"Ada\"}";
    assert(cmp_text(actual, expected, TypePolicy::Permissive).success);
    auto strict = cmp_text(actual, expected, TypePolicy::Strict);
    assert(!strict.success && strict.mismatch->kind == MismatchKind::TypeMismatch);
    assert(strict.mismatch->actual_type == "Manager");
    assert(strict.mismatch->expected_type == "Person");
    assert(strict.mismatch->path.empty());

    assert(cmp_text("(1 2)", "[2 1]", TypePolicy::Permissive).success);
    assert(!cmp_text("(1 2)", "[2 1]", TypePolicy::Strict).success);

    auto scalar = cmp_text("{:v 1}", "{:v \"1\"}");
    assert(!scalar.success && scalar.mismatch->kind == MismatchKind::TypeMismatch);
    assert(render_path(scalar.mismatch->path) == "root [record].v");
    assert(scalar.mismatch->actual_type == "i64" && scalar.mismatch->expected_type == "string");
}

static void test_identity_short_circuit(){
    auto shared = parse("[1 2 3]");
    auto a = n_record("Pair", {fld("L", shared), fld("R", shared)});
    auto e = n_record("Pair", {fld("L", shared), fld("R", parse("[3 2 1]"))});
    assert(cmp(a, e).success);
}

void run_compare_tests(){
    test_reflexivity();
    test_nulls();
    test_values();
    test_value_alternatives();
    test_text_exactness();
    test_sequence_order_independence();
    test_count_mismatch();
    test_drill_down();
    test_first_failure();
    test_missing_member();
    test_idempotence();
    test_type_policies();
    test_identity_short_circuit();
    std::cout << "[compare] tests passed\n";
}
