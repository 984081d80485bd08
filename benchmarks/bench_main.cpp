#include "equiv/compare.hpp"
#include "equiv/reader.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using namespace equiv;

struct RunResult { double ms_parse; double ms_compare; bool equivalent; };

// Fixture text for a vector of `n` order lines, in order or shuffled.
static std::string lines_fixture(size_t n, bool shuffled){
    std::vector<size_t> ids(n);
    for(size_t i=0;i<n; ++i) ids[i] = i;
    if(shuffled){ std::mt19937 rng(42); std::shuffle(ids.begin(), ids.end(), rng); }
    std::string s = "[";
    for(size_t id : ids){
        s += "#Line {:sku \"SKU-" + std::to_string(id) + "\" :qty " + std::to_string(id % 7 + 1) + " :price " + std::to_string(id) + ".5}\n";
    }
    s += "]";
    return s;
}

static std::string ints_fixture(size_t n, bool shuffled){
    std::vector<size_t> ids(n);
    for(size_t i=0;i<n; ++i) ids[i] = i;
    if(shuffled){ std::mt19937 rng(7); std::shuffle(ids.begin(), ids.end(), rng); }
    std::string s = "[";
    for(size_t id : ids) s += std::to_string(id) + " ";
    s += "]";
    return s;
}

static RunResult bench_case(const std::string& actualSrc, const std::string& expectedSrc){
    auto t0 = Clock::now();
    node_ptr actual = parse(actualSrc, "<actual>");
    node_ptr expected = parse(expectedSrc, "<expected>");
    auto t1 = Clock::now();
    EquivalenceComparer cmp;
    auto res = cmp.compare(actual, expected);
    auto t2 = Clock::now();
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(),
             std::chrono::duration<double, std::milli>(t2 - t1).count(),
             res.success };
}

int main(){
    struct Case { std::string name; std::string actual; std::string expected; };
    std::vector<Case> cases;
    for(size_t n : {100u, 500u, 2000u}){
        cases.push_back({"ints_sorted_" + std::to_string(n), ints_fixture(n, false), ints_fixture(n, false)});
        cases.push_back({"ints_shuffled_" + std::to_string(n), ints_fixture(n, true), ints_fixture(n, false)});
        cases.push_back({"lines_shuffled_" + std::to_string(n), lines_fixture(n, true), lines_fixture(n, false)});
    }

    std::cout << "name,ms_parse,ms_compare,equivalent\n";
    for(const auto& c : cases){
        try {
            auto r = bench_case(c.actual, c.expected);
            std::cout << c.name << "," << r.ms_parse << "," << r.ms_compare << "," << (r.equivalent ? 1 : 0) << "\n";
        } catch(const parse_error& e){
            std::cerr << "[bench] case '" << c.name << "' failed to parse: " << e.what() << "\n";
            return 1;
        }
    }
    return 0;
}
