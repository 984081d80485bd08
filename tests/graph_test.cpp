#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include "equiv/graph.hpp"

using namespace equiv;

static void test_kinds(){
    assert(kind_of(*n_null()) == node_kind::Null);
    assert(kind_of(*n_i64(1)) == node_kind::Value);
    assert(kind_of(*n_enum("Color", "Red")) == node_kind::Value);
    assert(kind_of(*n_literal("Date", "2024-01-01")) == node_kind::Value);
    assert(kind_of(*n_str("x")) == node_kind::Text);
    assert(kind_of(*n_set({})) == node_kind::Sequence);
    assert(kind_of(*n_record("Order")) == node_kind::Composite);
    assert(std::string(kind_name(node_kind::Composite)) == "composite");
}

static void test_type_names(){
    assert(type_name(*n_null()) == "nil");
    assert(type_name(*n_u64(3)) == "u64");
    assert(type_name(*n_f64(1.5)) == "f64");
    assert(type_name(*n_enum("", "ok")) == "keyword");
    assert(type_name(*n_enum("Color", "Red")) == "Color");
    assert(type_name(*n_list({})) == "list");
    assert(type_name(*n_seq("")) == "vector");
    assert(type_name(*n_record("")) == "record");
    assert(type_name(*n_literal("Date", "x")) == "Date");
}

static void test_rendering(){
    assert(to_string(n_i64(-4)) == "-4");
    assert(to_string(n_u64(4)) == "4u");
    assert(to_string(n_f64(2.0)) == "2.0");
    assert(to_string(n_str("a\"b\n")) == "\"a\\\"b\\n\"");
    assert(to_string(n_enum("Color", "Red")) == ":Color/Red");
    assert(to_string(n_vec({n_i64(1), n_bool(true)})) == "[1 true]");
    assert(to_string(n_set({n_null()})) == "#{nil}");
    auto r = n_record("Manager", {fld("Name", n_str("Ada"))}, {"Employee", "Person"});
    assert(to_string(r) == "#Manager<Employee Person> {:Name \"Ada\"}");
    assert(to_string(n_record("record", {fld("a", n_i64(1))})) == "{:a 1}");
    assert(to_string(n_literal("Date", "2024-01-01")) == "#Date \"2024-01-01\"");
    node_ptr none;
    assert(to_string(none) == "nil");
}

static void test_fields_and_builders(){
    auto r = n_record("Order", {fld("Id", n_i64(1)), fld("Note", n_str("x"))});
    const field* f = find_field(*r, "Note");
    assert(f && std::get<std::string>(f->value->data) == "x");
    assert(find_field(*r, "Missing") == nullptr);
    assert(find_field(*n_i64(1), "Id") == nullptr);

    auto v = n_vec();
    v << n_i64(1) << n_i64(2);
    assert(std::get<sequence>(v->data).elems.size() == 2);
    bool threw = false;
    auto scalar = n_i64(1);
    try { scalar << n_i64(2); } catch(const std::invalid_argument&){ threw = true; }
    assert(threw);

    node_ptr empty;
    assert(is_null(empty));
    assert(is_null(n_null()));
    assert(!is_null(n_bool(false)));
}

void run_graph_tests(){
    test_kinds();
    test_type_names();
    test_rendering();
    test_fields_and_builders();
    std::cout << "[graph] tests passed\n";
}
