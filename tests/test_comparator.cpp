#include "test_common.h"
#include "gradebench/comparator.h"

#include <cmath>
#include <limits>

using namespace gradebench;

int main() {
    Comparator cmp;

    // Exact kinds
    expect_true(cmp.matches(Value(3), Value(3)), "3 == 3");
    expect_true(!cmp.matches(Value(3), Value(4)), "3 != 4");
    expect_true(cmp.matches(Value("abc"), Value("abc")), "text equal");
    expect_true(!cmp.matches(Value("abc"), Value("abd")), "text differs");
    expect_true(cmp.matches(Value(true), Value(true)), "bool equal");
    expect_true(cmp.matches(Value(), Value()), "null equal");

    // Tolerance
    expect_true(cmp.matches(Value(0.3), Value(0.1 + 0.2)), "0.1 + 0.2 matches 0.3");
    expect_true(cmp.matches(Value(1e6), Value(1e6 + 0.5)), "relative tolerance scales");
    expect_true(!cmp.matches(Value(1.0), Value(1.001)), "outside tolerance");
    expect_true(cmp.matches(Value(2), Value(2.0)), "int vs float compares numerically");
    expect_true(cmp.matches(Value(2.0), Value(2)), "float vs int compares numerically");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    expect_true(cmp.matches(Value(nan), Value(nan)), "nan matches nan");
    expect_true(!cmp.matches(Value(nan), Value(1.0)), "nan does not match a number");
    expect_true(cmp.matches(Value(inf), Value(inf)), "inf matches inf");
    expect_true(!cmp.matches(Value(inf), Value(-inf)), "inf does not match -inf");

    // Booleans never equal numbers
    expect_true(!cmp.matches(Value(true), Value(1)), "true != 1");
    expect_true(!cmp.matches(Value(0), Value(false)), "0 != false");

    // Sequences
    expect_true(cmp.matches(Value(ValueList{1, 2, 3}), Value(ValueList{1, 2, 3})), "[1,2,3] matches");
    expect_true(!cmp.matches(Value(ValueList{1, 2, 3}), Value(ValueList{1, 2})), "length differs");
    expect_true(!cmp.matches(Value(ValueList{1, 2}), Value(ValueList{2, 1})), "order matters");
    expect_true(cmp.matches(Value(ValueList{1.0, Value("x")}), Value(ValueList{1, Value("x")})), "mixed list");

    // Mappings
    ValueMap a{{"x", Value(1)}, {"y", Value(ValueList{0.5})}};
    ValueMap b{{"y", Value(ValueList{0.5 + 1e-12})}, {"x", Value(1)}};
    expect_true(cmp.matches(Value(a), Value(b)), "maps match regardless of order");
    b.erase("x");
    expect_true(!cmp.matches(Value(a), Value(b)), "key sets differ");

    // Shape mismatch is a plain non-match
    expect_true(!cmp.matches(Value(ValueList{1}), Value(1)), "list vs scalar");
    expect_true(!cmp.matches(Value(ValueMap{}), Value(ValueList{})), "map vs list");
    expect_true(!cmp.matches(Value("3"), Value(3)), "text vs int");

    // Configured tolerance
    Comparator loose(Tolerance{1e-2, 0.0});
    expect_true(loose.matches(Value(100.0), Value(100.9)), "loose rtol accepts");
    Comparator tight(Tolerance{0.0, 0.0});
    expect_true(!tight.matches(Value(0.3), Value(0.1 + 0.2)), "zero tolerance is exact");

    std::cerr << "test_comparator: ALL PASSED" << std::endl;
    return 0;
}
