/***************
* @file: yblas_gemm.inl
* @brief: GEMM 参数校验、快速返回与执行分发的实现
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include "../include/yblas_gemm.hpp"
#include "../include/kernel/gemm.hpp"

namespace yb {

namespace detail {
    [[noreturn]] inline void throwGemmArgument(const std::string& reason) {
        throw std::invalid_argument("[yb::gemm] " + reason);
    }

    /// @brief 行主序矩阵所需的最小存储长度，空矩阵为 0
    inline int64_t requiredLength(int rows, int cols, int ld) {
        if (rows == 0 || cols == 0) return 0;
        return static_cast<int64_t>(rows - 1) * ld + cols;
    }
} // namespace detail

inline void setNumThreads(int n) {
    yb::kernel::gemm::set_num_threads(n);
}

inline int getNumThreads() {
    return yb::kernel::gemm::get_num_threads();
}

template<yb::concepts::BlasScalar T>
void gemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k,
          std::type_identity_t<T> alpha,
          std::type_identity_t<std::span<const T>> a, int lda,
          std::type_identity_t<std::span<const T>> b, int ldb,
          std::type_identity_t<T> beta,
          std::type_identity_t<std::span<T>> c, int ldc,
          const GemmOptions& opts) {
    using detail::throwGemmArgument;

    if (!yb::types::isValidTranspose(tA)) {
        throwGemmArgument("illegal transpose for A: " + yb::types::transposeName(tA));
    }
    if (!yb::types::isValidTranspose(tB)) {
        throwGemmArgument("illegal transpose for B: " + yb::types::transposeName(tB));
    }
    if (m < 0) throwGemmArgument("m < 0 (m = " + std::to_string(m) + ")");
    if (n < 0) throwGemmArgument("n < 0 (n = " + std::to_string(n) + ")");
    if (k < 0) throwGemmArgument("k < 0 (k = " + std::to_string(k) + ")");

    // physical shape of A and B in storage
    int rowA = m, colA = k;
    if (tA != yb::Transpose::NoTrans) std::swap(rowA, colA);
    int rowB = k, colB = n;
    if (tB != yb::Transpose::NoTrans) std::swap(rowB, colB);

    if (lda < std::max(1, colA)) {
        throwGemmArgument("bad leading dimension of A: lda = " + std::to_string(lda) + ", need >= " + std::to_string(std::max(1, colA)));
    }
    if (ldb < std::max(1, colB)) {
        throwGemmArgument("bad leading dimension of B: ldb = " + std::to_string(ldb) + ", need >= " + std::to_string(std::max(1, colB)));
    }
    if (ldc < std::max(1, n)) {
        throwGemmArgument("bad leading dimension of C: ldc = " + std::to_string(ldc) + ", need >= " + std::to_string(std::max(1, n)));
    }

    // nothing to write
    if (m == 0 || n == 0) return;

    const int64_t needA = detail::requiredLength(rowA, colA, lda);
    const int64_t needB = detail::requiredLength(rowB, colB, ldb);
    const int64_t needC = detail::requiredLength(m, n, ldc);
    if (static_cast<int64_t>(a.size()) < needA) {
        throwGemmArgument("insufficient length of a: " + std::to_string(a.size()) + " < " + std::to_string(needA));
    }
    if (static_cast<int64_t>(b.size()) < needB) {
        throwGemmArgument("insufficient length of b: " + std::to_string(b.size()) + " < " + std::to_string(needB));
    }
    if (static_cast<int64_t>(c.size()) < needC) {
        throwGemmArgument("insufficient length of c: " + std::to_string(c.size()) + " < " + std::to_string(needC));
    }

    // C already holds the result
    if ((alpha == T(0) || k == 0) && beta == T(1)) return;

    // A and B are never read when alpha == 0
    if (alpha == T(0) || k == 0) {
        yb::kernel::gemm::scale_c(m, n, beta, c.data(), ldc);
        return;
    }

    int nThreads = opts.numThreads;
    if (nThreads < 0) {
        std::cerr << "Warning: GemmOptions::numThreads = " << nThreads << " is negative. Using the global thread setting." << std::endl;
        nThreads = 0;
    }
    if (nThreads == 0) nThreads = yb::kernel::gemm::get_num_threads();

    // must complete before any block accumulates
    yb::kernel::gemm::scale_c(m, n, beta, c.data(), ldc);

    yb::kernel::gemm::accumulate<T>(tA, tB, m, n, k, alpha,
                                 a.data(), lda, b.data(), ldb, c.data(), ldc,
                                 nThreads, opts.forceSerial);
}

inline void sgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, float alpha,
                  std::span<const float> a, int lda, std::span<const float> b, int ldb,
                  float beta, std::span<float> c, int ldc, const GemmOptions& opts) {
    gemm<float>(tA, tB, m, n, k, alpha, a, lda, b, ldb, beta, c, ldc, opts);
}

inline void dgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, double alpha,
                  std::span<const double> a, int lda, std::span<const double> b, int ldb,
                  double beta, std::span<double> c, int ldc, const GemmOptions& opts) {
    gemm<double>(tA, tB, m, n, k, alpha, a, lda, b, ldb, beta, c, ldc, opts);
}

inline void cgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, std::complex<float> alpha,
                  std::span<const std::complex<float>> a, int lda, std::span<const std::complex<float>> b, int ldb,
                  std::complex<float> beta, std::span<std::complex<float>> c, int ldc, const GemmOptions& opts) {
    gemm<std::complex<float>>(tA, tB, m, n, k, alpha, a, lda, b, ldb, beta, c, ldc, opts);
}

inline void zgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, std::complex<double> alpha,
                  std::span<const std::complex<double>> a, int lda, std::span<const std::complex<double>> b, int ldb,
                  std::complex<double> beta, std::span<std::complex<double>> c, int ldc, const GemmOptions& opts) {
    gemm<std::complex<double>>(tA, tB, m, n, k, alpha, a, lda, b, ldb, beta, c, ldc, opts);
}

} // namespace yb
