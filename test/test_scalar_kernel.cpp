#include <complex>
#include <iostream>
#include <vector>
#include "test_common.hpp"

namespace vec = yb::kernel::scalar;
using cd = std::complex<double>;

static void testDot() {
    test::section("dot");
    std::vector<double> x = {1, 2, 3, 4, 5};
    std::vector<double> y = {6, 7, 8, 9, 10};
    test::expect(vec::dotUnitary(5, x.data(), y.data()) == 130.0, "dotUnitary");
    // x[0], x[2], x[4] . y[0], y[1], y[2]
    test::expect(vec::dotInc(3, x.data(), 2, 0, y.data(), 1, 0) == 1 * 6 + 3 * 7 + 5 * 8, "dotInc");
    test::expect(vec::dotUnitary(0, x.data(), y.data()) == 0.0, "empty dot");

    test::expect(yb::dot<double>(5, x, 1, y, 1) == 130.0, "yb::dot unit");
    // negative increment walks x from its far end: x[4], x[2], x[0]
    test::expect(yb::dot<double>(3, x, -2, y, 1) == 5 * 6 + 3 * 7 + 1 * 8, "yb::dot incX < 0");
    test::expect(yb::dot<double>(3, x, 2, y, -1) == 1 * 8 + 3 * 7 + 5 * 6, "yb::dot incY < 0");
    test::expect(yb::dot<double>(0, x, 1, y, -1) == 0.0, "n = 0");
    std::vector<double> empty;
    test::expect(yb::dot<double>(0, empty, 1, empty, 1) == 0.0, "n = 0 with empty vectors");

    std::vector<int> xi = {1, -2, 3};
    std::vector<int> yi = {4, 5, -6};
    test::expect(yb::dot<int>(3, xi, 1, yi, 1) == 4 - 10 - 18, "integer dot");
    test::pass("unit, strided and negative-increment dot");
}

static void testDotc() {
    test::section("dotc");
    std::vector<cd> x = {{1, 2}, {3, -1}};
    std::vector<cd> y = {{2, 1}, {0, 1}};
    // conj(1+2i)(2+i) + conj(3-i)(i) = (4-3i) + (-1+3i) = 3
    cd expected = std::conj(x[0]) * y[0] + std::conj(x[1]) * y[1];
    test::expect(vec::dotcUnitary(2, x.data(), y.data()) == expected, "dotcUnitary");
    test::expect(expected == cd(3, 0), "hand value");
    test::expect(vec::dotUnitary(2, x.data(), y.data()) == x[0] * y[0] + x[1] * y[1], "dot does not conjugate");
    test::expect(yb::dotc<cd>(2, x, -1, y, 1) == std::conj(x[1]) * y[0] + std::conj(x[0]) * y[1], "yb::dotc incX < 0");

    std::vector<double> xr = {1, 2, 3};
    std::vector<double> yr = {4, 5, 6};
    test::expect(vec::dotcInc(3, xr.data(), 1, 0, yr.data(), 1, 0) == vec::dotInc(3, xr.data(), 1, 0, yr.data(), 1, 0),
                 "dotc equals dot for real types");
    test::pass("conjugated dot");
}

static void testAxpy() {
    test::section("axpy");
    std::vector<double> x = {1, 2, 3};
    std::vector<double> y = {10, 20, 30};
    vec::axpyUnitary(3, 2.0, x.data(), y.data());
    test::expect(y == std::vector<double>({12, 24, 36}), "axpyUnitary");

    std::vector<double> ys = {0, -1, 0, -1, 0, -1};
    vec::axpyInc(3, 1.0, x.data(), 1, 0, ys.data(), 2, 0);
    test::expect(ys == std::vector<double>({1, -1, 2, -1, 3, -1}), "axpyInc leaves gaps alone");

    std::vector<double> yn = {0, 0, 0};
    yb::axpy<double>(3, 1.0, x, 1, yn, -1);
    test::expect(yn == std::vector<double>({3, 2, 1}), "yb::axpy incY < 0");

    std::vector<double> untouched = {7, 7, 7};
    yb::axpy<double>(3, 0.0, x, 1, untouched, 1);
    test::expect(untouched == std::vector<double>({7, 7, 7}), "alpha = 0 is a no-op");

    std::vector<cd> xc = {{1, 1}, {0, 2}};
    std::vector<cd> yc2 = {{0, 0}, {5, 5}, {0, 0}};
    vec::axpycInc(2, cd(0, 1), xc.data(), 1, 0, yc2.data(), 2, 0);
    test::expect(yc2[0] == cd(1, 1) && yc2[1] == cd(5, 5) && yc2[2] == cd(2, 0), "axpycInc conjugates x");
    test::pass("scaled accumulation");
}

static void testScal() {
    test::section("scal");
    std::vector<double> x = {1, 2, 3, 4};
    vec::scal(4, 0.5, x.data());
    test::expect(x == std::vector<double>({0.5, 1, 1.5, 2}), "scal");
    vec::scalInc(2, 2.0, x.data(), 2, 1);
    test::expect(x == std::vector<double>({0.5, 2, 1.5, 4}), "scalInc");

    std::vector<double> poisoned = {std::nan(""), INFINITY, -INFINITY, 1};
    vec::zero(4, poisoned.data());
    for (double v : poisoned) test::expect(v == 0.0, "zero overwrites NaN and Inf");

    std::vector<double> y = {std::nan(""), 1, INFINITY, 2};
    yb::scal<double>(2, 0.0, y, 2);
    test::expect(y[0] == 0.0 && y[1] == 1.0 && y[2] == 0.0 && y[3] == 2.0, "yb::scal beta = 0 hard zero");
    yb::scal<double>(2, 3.0, y, 1);
    test::expect(y[0] == 0.0 && y[1] == 3.0, "yb::scal");
    test::pass("scaling and zero fill");
}

static void testInvalidArguments() {
    test::section("invalid arguments");
    std::vector<double> x = {1, 2, 3};
    std::vector<double> y = {1, 2, 3};
    test::expectThrow<std::invalid_argument>([&] { (void)yb::dot<double>(3, x, 0, y, 1); },
        "[yb::dot] bad increment", "incX = 0");
    test::expectThrow<std::invalid_argument>([&] { (void)yb::dotc<double>(3, x, 1, y, 0); },
        "[yb::dotc] bad increment", "incY = 0");
    test::expectThrow<std::invalid_argument>([&] { (void)yb::dot<double>(2, x, 3, y, 1); },
        "insufficient length of x", "x too short for stride");
    test::expectThrow<std::invalid_argument>([&] { yb::axpy<double>(4, 1.0, x, 1, y, 1); },
        "insufficient length of x", "n larger than x");
    test::expect(y == std::vector<double>({1, 2, 3}), "y untouched after failures");

    // n < 0
    test::expectThrow<std::invalid_argument>([&] { (void)yb::dot<double>(-5, x, 1, y, 1); },
        "[yb::dot] n < 0", "dot n < 0");
    test::expectThrow<std::invalid_argument>([&] { (void)yb::dotc<double>(-1, x, 1, y, 1); },
        "[yb::dotc] n < 0", "dotc n < 0");
    test::expectThrow<std::invalid_argument>([&] { yb::axpy<double>(-2, 1.0, x, 1, y, 1); },
        "[yb::axpy] n < 0", "axpy n < 0");

    // a zero increment is rejected even for empty vectors
    std::vector<double> empty;
    test::expectThrow<std::invalid_argument>([&] { (void)yb::dot<double>(0, empty, 0, empty, 1); },
        "[yb::dot] bad increment", "dot n = 0, incX = 0");
    test::expectThrow<std::invalid_argument>([&] { yb::axpy<double>(0, 1.0, empty, 1, empty, 0); },
        "[yb::axpy] bad increment", "axpy n = 0, incY = 0");
    test::pass("bad increments, negative n and short buffers rejected");
}

// x = {-6, 5, 4, -2, -6}, alpha = -2: each case either scales x or must throw and leave x unchanged
static void testScalFixtures() {
    test::section("scal fixtures");
    const std::vector<double> x0 = {-6, 5, 4, -2, -6};
    struct Case { const char* name; int n; int incX; bool throws; std::vector<double> ans; };
    std::vector<Case> cases = {
        {"Unit", 5, 1, false, {12, -10, -8, 4, 12}},
        {"Stride2", 3, 2, false, {12, 5, -8, -2, 12}},
        {"NegativeInc", 3, -2, false, {-6, 5, 4, -2, -6}},
        {"NegativeN", -5, 2, true, {-6, 5, 4, -2, -6}},
        {"ZeroInc", 5, 0, true, {-6, 5, 4, -2, -6}},
        {"OutOfBounds", 6, 2, true, {-6, 5, 4, -2, -6}},
    };
    for (const auto& tc : cases) {
        std::vector<double> x = x0;
        bool threw = false;
        try {
            yb::scal<double>(tc.n, -2.0, x, tc.incX);
        } catch (const std::invalid_argument& e) {
            threw = true;
            std::cout << "  " << tc.name << ": " << e.what() << std::endl;
        }
        test::expect(threw == tc.throws, std::string(tc.name) + ": throws");
        test::expect(x == tc.ans, std::string(tc.name) + ": answer");
    }

    std::vector<double> empty;
    test::expectThrow<std::invalid_argument>([&] { yb::scal<double>(0, -2.0, empty, 0); },
        "[yb::scal] bad increment", "EmptyZeroInc");
    yb::scal<double>(0, -2.0, empty, 1);
    test::pass("negative increment is a no-op, n < 0 and zero increment throw");
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  向量核函数测试" << std::endl;
    std::cout << "========================================" << std::endl;
    try {
        testDot();
        testDotc();
        testAxpy();
        testScal();
        testInvalidArguments();
        testScalFixtures();
    } catch (const std::exception& e) {
        std::cerr << "✗ 错误: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "\n✓ 所有测试通过！" << std::endl;
    return 0;
}
