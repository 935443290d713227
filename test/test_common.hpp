#pragma once
// 测试公共工具：断言、随机矩阵、朴素参考实现

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "../yblas.hpp"

namespace test {

/// @brief 断言失败时抛出 std::runtime_error，由 main 统一捕获并返回 1
inline void expect(bool cond, const std::string& what) {
    if (!cond) {
        throw std::runtime_error("check failed: " + what);
    }
}

/// @brief 断言 func 抛出类型为 E 的异常，并且消息中包含 needle
template<typename E, typename Func>
void expectThrow(Func&& func, const std::string& needle, const std::string& what) {
    try {
        func();
    } catch (const E& e) {
        std::string msg = e.what();
        expect(msg.find(needle) != std::string::npos,
               what + ": message \"" + msg + "\" does not contain \"" + needle + "\"");
        return;
    }
    throw std::runtime_error("check failed: " + what + ": no exception thrown");
}

inline void section(const std::string& name) {
    std::cout << "\n--- " << name << " ---" << std::endl;
}

inline void pass(const std::string& name) {
    std::cout << "  ✓ " << name << std::endl;
}

template<typename T>
std::vector<T> randomVector(size_t len, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    std::vector<T> out(len);
    for (auto& v : out) {
        if constexpr (yb::traits::is_complex_v<T>) {
            using R = typename T::value_type;
            v = T(static_cast<R>(dist(rng)), static_cast<R>(dist(rng)));
        } else {
            v = static_cast<T>(dist(rng));
        }
    }
    return out;
}

/// @brief op(X)[r, c]，X 为行主序，跨度 ld
template<typename T>
T opAt(yb::Transpose t, const std::vector<T>& x, int ld, int r, int c) {
    switch (t) {
        case yb::Transpose::NoTrans: return x[static_cast<size_t>(r) * ld + c];
        case yb::Transpose::Trans: return x[static_cast<size_t>(c) * ld + r];
        case yb::Transpose::ConjTrans: return yb::types::conj(x[static_cast<size_t>(c) * ld + r]);
    }
    throw std::invalid_argument("bad transpose");
}

/// @brief 三重循环参考实现 C = alpha * op(A) * op(B) + beta * C
template<typename T>
void naiveGemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, T alpha,
               const std::vector<T>& a, int lda, const std::vector<T>& b, int ldb,
               T beta, std::vector<T>& c, int ldc) {
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            T acc(0);
            for (int l = 0; l < k; ++l) {
                acc += opAt(tA, a, lda, i, l) * opAt(tB, b, ldb, l, j);
            }
            T& out = c[static_cast<size_t>(i) * ldc + j];
            out = (beta == T(0)) ? alpha * acc : alpha * acc + beta * out;
        }
    }
}

/// @brief 最大绝对误差（只比较 m x n 区域）
template<typename T>
double maxDiff(int m, int n, const std::vector<T>& x, const std::vector<T>& y, int ld) {
    double d = 0.0;
    for (int i = 0; i < m; ++i) {
        for (int j = 0; j < n; ++j) {
            d = std::max(d, static_cast<double>(std::abs(x[static_cast<size_t>(i) * ld + j] - y[static_cast<size_t>(i) * ld + j])));
        }
    }
    return d;
}

inline constexpr yb::Transpose allTransposes[] = {
    yb::Transpose::NoTrans, yb::Transpose::Trans, yb::Transpose::ConjTrans
};

} // namespace test
