// Runtime type compatibility between actual and expected nodes.
#pragma once
#include "equiv/graph.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace equiv {

// Strict: actual's runtime type must equal expected's.
// Permissive: also accepts a composite whose ancestors include expected's type, and
// any two sequences regardless of container type.
enum class TypePolicy { Strict, Permissive };

const char* policy_name(TypePolicy p);
std::optional<TypePolicy> parse_policy(std::string_view s);

// True when `type` names one of the ancestors recorded on a composite node.
bool is_ancestor(const node& actual, const std::string& type);

bool types_compatible(const node& actual, const node& expected, TypePolicy policy);

} // namespace equiv
