// Order example: capture C++ objects, compare against a fixture, print a report.
#include <iostream>
#include <string>
#include <vector>
#include "equiv/reader.hpp"
#include "equiv/reflect.hpp"

namespace shop {

enum class Status { Open, Shipped };
inline const char* to_string(Status s){ return s == Status::Open ? "Open" : "Shipped"; }

struct Line { std::string sku; int qty; };
struct Order { int id; Status status; std::vector<Line> lines; };

template<class In> void introspect(In&& inspect, Line const& l){
    inspect(l.sku, "Sku");
    inspect(l.qty, "Qty");
}
template<class In> void introspect(In&& inspect, Order const& o){
    inspect(o.id, "Id");
    inspect(o.status, "Status");
    inspect(o.lines, "Lines");
}

} // namespace shop

EQUIV_TYPE_NAME(shop::Line, "Line")
EQUIV_TYPE_NAME(shop::Order, "Order")
EQUIV_TYPE_NAME(shop::Status, "Status")

using namespace equiv;

int main(){
    shop::Order order{7, shop::Status::Open, {{"A-1", 2}, {"B-2", 1}, {"C-3", 5}}};

    const char* fixture = R"EDN(
        #Order {:Id 7 :Status :Status/Open
                :Lines [#Line {:Sku "C-3" :Qty 5}
                        #Line {:Sku "A-1" :Qty 2}
                        #Line {:Sku "B-2" :Qty 1}]}
    )EDN";

    try {
        node_ptr expected = parse(fixture, "order.edn");
        should_be_equivalent_to(order, expected);
        std::cout << "order matches fixture (element order ignored)\n";

        order.lines[1].qty = 3;
        should_be_equivalent_to(order, expected, "order #7 after edit");
        std::cerr << "expected a mismatch\n";
        return 1;
    } catch(const equivalence_failure& e){
        std::cout << e.what();
    } catch(const parse_error& e){
        std::cerr << "order_example: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
