#include <cassert>
#include <iostream>
#include "equiv/types.hpp"

using namespace equiv;

static void test_policy_names(){
    assert(parse_policy("STRICT") == TypePolicy::Strict);
    assert(parse_policy("permissive") == TypePolicy::Permissive);
    assert(!parse_policy("lenient"));
    assert(std::string(policy_name(TypePolicy::Strict)) == "strict");
}

static void test_compatibility(){
    auto manager = n_record("Manager", {}, {"Employee", "Person"});
    auto person = n_record("Person");
    assert(is_ancestor(*manager, "Person"));
    assert(!is_ancestor(*person, "Manager"));

    assert(types_compatible(*manager, *person, TypePolicy::Permissive));
    assert(!types_compatible(*manager, *person, TypePolicy::Strict));
    assert(!types_compatible(*person, *manager, TypePolicy::Permissive));

    assert(types_compatible(*n_list({}), *n_vec({}), TypePolicy::Permissive));
    assert(!types_compatible(*n_list({}), *n_vec({}), TypePolicy::Strict));

    assert(types_compatible(*n_i64(1), *n_i64(2), TypePolicy::Strict));
    assert(!types_compatible(*n_i64(1), *n_u64(1), TypePolicy::Permissive));
    assert(!types_compatible(*n_str("1"), *n_i64(1), TypePolicy::Permissive));
    assert(!types_compatible(*n_enum("A", "x"), *n_enum("B", "x"), TypePolicy::Permissive));
}

void run_types_tests(){
    test_policy_names();
    test_compatibility();
    std::cout << "[types] tests passed\n";
}
