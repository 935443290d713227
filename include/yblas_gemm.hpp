#pragma once
/***************
* @file: yblas_gemm.hpp
* @brief: 通用矩阵乘法 GEMM：C = alpha * op(A) * op(B) + beta * C
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <complex>
#include <span>
#include <type_traits>
#include "./yblas_concepts.hpp"
#include "./yblas_types.hpp"

namespace yb {
    /// @brief 单次 GEMM 调用的执行选项
    struct GemmOptions {
        /// @brief 工作线程数上限，0 表示使用全局设置 yb::setNumThreads
        int numThreads = 0;
        /// @brief 为 true 时强制串行执行
        bool forceSerial = false;
    };

    /// @brief 设置 GEMM 的全局线程数，0 表示由 OpenMP 决定
    inline void setNumThreads(int n);

    /// @brief 获取 GEMM 实际使用的线程数上限
    inline int getNumThreads();

    /// @brief 通用矩阵乘法，所有矩阵均为行主序。C 原地修改，不做任何拷贝。
    /// op(A) 为 m x k，op(B) 为 k x n，C 为 m x n。
    /// @param tA: A 的转置方式
    /// @param tB: B 的转置方式
    /// @param m: op(A) 与 C 的行数
    /// @param n: op(B) 与 C 的列数
    /// @param k: op(A) 的列数，op(B) 的行数
    /// @param alpha: op(A) * op(B) 的系数
    /// @param a: A 的存储，长度至少为 (rowA-1)*lda + colA
    /// @param lda: A 的行跨度，至少为 max(1, colA)
    /// @param b: B 的存储
    /// @param ldb: B 的行跨度
    /// @param beta: C 的系数。beta 为 0 时 C 被直接置零（原有的 NaN/Inf 不会保留）
    /// @param c: C 的存储
    /// @param ldc: C 的行跨度，至少为 max(1, n)
    /// @param opts: 执行选项
    /// @throw std::invalid_argument 参数非法时抛出，此时 C 未被修改
    template<yb::concepts::BlasScalar T>
    void gemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k,
              std::type_identity_t<T> alpha,
              std::type_identity_t<std::span<const T>> a, int lda,
              std::type_identity_t<std::span<const T>> b, int ldb,
              std::type_identity_t<T> beta,
              std::type_identity_t<std::span<T>> c, int ldc,
              const GemmOptions& opts = {});

    /// @brief 单精度实数 GEMM
    inline void sgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, float alpha,
               std::span<const float> a, int lda, std::span<const float> b, int ldb,
               float beta, std::span<float> c, int ldc, const GemmOptions& opts = {});

    /// @brief 双精度实数 GEMM
    inline void dgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, double alpha,
               std::span<const double> a, int lda, std::span<const double> b, int ldb,
               double beta, std::span<double> c, int ldc, const GemmOptions& opts = {});

    /// @brief 单精度复数 GEMM
    inline void cgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, std::complex<float> alpha,
               std::span<const std::complex<float>> a, int lda, std::span<const std::complex<float>> b, int ldb,
               std::complex<float> beta, std::span<std::complex<float>> c, int ldc, const GemmOptions& opts = {});

    /// @brief 双精度复数 GEMM
    inline void zgemm(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, std::complex<double> alpha,
               std::span<const std::complex<double>> a, int lda, std::span<const std::complex<double>> b, int ldb,
               std::complex<double> beta, std::span<std::complex<double>> c, int ldc, const GemmOptions& opts = {});
} // namespace yb
