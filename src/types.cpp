#include "equiv/types.hpp"
#include <algorithm>
#include <cctype>

namespace equiv {

const char* policy_name(TypePolicy p){
    switch(p){
        case TypePolicy::Strict: return "strict";
        case TypePolicy::Permissive: return "permissive";
    }
    return "<bad-policy>";
}

std::optional<TypePolicy> parse_policy(std::string_view s){
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if(v=="strict") return TypePolicy::Strict;
    if(v=="permissive") return TypePolicy::Permissive;
    return std::nullopt;
}

bool is_ancestor(const node& actual, const std::string& type){
    auto* r = std::get_if<record>(&actual.data);
    if(!r) return false;
    return std::find(r->bases.begin(), r->bases.end(), type) != r->bases.end();
}

bool types_compatible(const node& actual, const node& expected, TypePolicy policy){
    node_kind ak = kind_of(actual), ek = kind_of(expected);
    if(ak==ek && type_name(actual)==type_name(expected)) return true;
    if(policy==TypePolicy::Strict) return false;
    if(ak==node_kind::Composite && ek==node_kind::Composite) return is_ancestor(actual, type_name(expected));
    return ak==node_kind::Sequence && ek==node_kind::Sequence;
}

} // namespace equiv
