// Fixture notation reader: EDN-style text -> object graph.
#pragma once
#include "equiv/graph.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace equiv
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg), line(line), col(col) {}
        int line;
        int col;
    };

    // Parse exactly one form. Throws parse_error on malformed input or trailing content.
    //   nil true false 12 -3 7u 1.5 2e3 ##NaN ##Inf ##-Inf "text" :kw :Color/Red
    //   [..] (..) #{..} {:a 1} #shop::Order {:id 1} #Manager<Employee Person> {..} #Date "2024-01-01"
    node_ptr parse(std::string_view src, std::string_view source_name = "<fixture>");

} // namespace equiv
