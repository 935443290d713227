#pragma once
/***************
 * @file block_kernel.hpp
 * @brief Scalar blocked multiply: C[i:i+bi, j:j+bj] += alpha * op(A) * op(B)
 * @author SnifferCaptain
 * @date 2026-10-19
 *
 * All matrices are row-major with leading dimensions lda/ldb/ldc.
 *   op(A)[r, l] = A[r*lda + l]            (NoTrans)
 *               = A[l*lda + r]            (Trans)
 *               = conj(A[l*lda + r])      (ConjTrans)
 *   op(B)[l, c] = B[l*ldb + c]            (NoTrans)
 *               = B[c*ldb + l]            (Trans)
 *               = conj(B[c*ldb + l])      (ConjTrans)
 *
 * The kernel only adds into C; beta has already been applied by the
 * driver. Each output element is reduced over l = 0..k-1 in increasing
 * order whatever the branch, so the result of a block does not depend on
 * which worker computes it or when.
 *
 * No term is skipped when op(A)[r, l] is zero: 0 * Inf and 0 * NaN in op(B)
 * must still reach C, whichever way B is stored.
 *
 * Transpose pairs are template parameters: the 3x3 dispatch happens once
 * per call in dispatchTranspose(), the inner loops stay monomorphic.
 ***************/

#include <algorithm>
#include <stdexcept>
#include "scalar_kernel.hpp"
#include "../yblas_types.hpp"
#include "../yblas_infos.hpp"

namespace yb::kernel::gemm {

// ============================================================================
// Transpose dispatch
// ============================================================================

/// @brief 把运行时的转置标记对分发到模板 lambda，形如 [&]<Transpose TA, Transpose TB>() { ... }
template<typename Func>
void dispatchTranspose(yb::Transpose tA, yb::Transpose tB, Func&& func) {
    using enum yb::Transpose;
    auto withB = [&]<yb::Transpose TA>() {
        switch (tB) {
            case NoTrans: func.template operator()<TA, NoTrans>(); return;
            case Trans: func.template operator()<TA, Trans>(); return;
            case ConjTrans: func.template operator()<TA, ConjTrans>(); return;
        }
        throw std::invalid_argument("[yb::gemm] illegal transpose for B: " + yb::types::transposeName(tB));
    };
    switch (tA) {
        case NoTrans: withB.template operator()<NoTrans>(); return;
        case Trans: withB.template operator()<Trans>(); return;
        case ConjTrans: withB.template operator()<ConjTrans>(); return;
    }
    throw std::invalid_argument("[yb::gemm] illegal transpose for A: " + yb::types::transposeName(tA));
}

// ============================================================================
// Block kernel
// ============================================================================

// A element op(A)[r, l], conjugated for ConjTrans
template<yb::Transpose TA, typename T>
inline T loadA(const T* A, int64_t lda, int r, int l) {
    if constexpr (TA == yb::Transpose::NoTrans) return A[r * lda + l];
    else if constexpr (TA == yb::Transpose::Trans) return A[l * lda + r];
    else return yb::types::conj(A[l * lda + r]);
}

/// @brief 计算一个输出块对 C 的贡献
/// @param i 块的起始行（blockSize 的整数倍）
/// @param j 块的起始列
/// @param m, n C 的总行数、总列数（用于计算边缘块的实际大小）
/// @param k 归约维度
/// @param blockSize 分块边长
template<yb::Transpose TA, yb::Transpose TB, typename T>
void multiplyBlock(int i, int j, int m, int n, int k, T alpha,
                   const T* A, int lda, const T* B, int ldb,
                   T* C, int ldc, int blockSize = yb::infos::blockSize) {
    using enum yb::Transpose;
    namespace vec = yb::kernel::scalar;

    const int iEnd = std::min(i + blockSize, m);
    const int bj = std::min(blockSize, n - j);
    const int64_t rsa = lda;
    const int64_t rsb = ldb;
    const int64_t rsc = ldc;

    if constexpr (TB == NoTrans) {
        // C[r, j:j+bj] += (alpha * op(A)[r, l]) * B[l, j:j+bj]
        // rank-1 updates along l; rows of B and C are contiguous
        // l is tiled so a band of B stays in cache across the rows of the block
        for (int l0 = 0; l0 < k; l0 += blockSize) {
            const int lEnd = std::min(l0 + blockSize, k);
            for (int r = i; r < iEnd; ++r) {
                T* cRow = C + r * rsc + j;
                for (int l = l0; l < lEnd; ++l) {
                    T tmp = alpha * loadA<TA>(A, rsa, r, l);
                    vec::axpyUnitary(bj, tmp, B + l * rsb + j, cRow);
                }
            }
        }
    } else if constexpr (TA == NoTrans) {
        // op(B)[l, c] = B[c, l]: row r of A and row c of B are both contiguous
        for (int r = i; r < iEnd; ++r) {
            const T* aRow = A + r * rsa;
            T* cRow = C + r * rsc;
            for (int c = j; c < j + bj; ++c) {
                const T* bRow = B + c * rsb;
                T tmp = [&] {
                    if constexpr (TB == Trans) return vec::dotUnitary(k, aRow, bRow);
                    else return vec::dotcUnitary(k, bRow, aRow);
                }();
                cRow[c] += alpha * tmp;
            }
        }
    } else {
        // op(A) = A^T or A^H and op(B) = B^T or B^H:
        // C[r, c] += (alpha * op(A)[r, l]) * op(B)[l, c], op(B)[l, j:j+bj] walks column l of B
        for (int l0 = 0; l0 < k; l0 += blockSize) {
            const int lEnd = std::min(l0 + blockSize, k);
            for (int r = i; r < iEnd; ++r) {
                T* cRow = C + r * rsc;
                for (int l = l0; l < lEnd; ++l) {
                    T tmp = alpha * loadA<TA>(A, rsa, r, l);
                    if constexpr (TB == Trans) vec::axpyInc(bj, tmp, B, rsb, j * rsb + l, cRow, 1, j);
                    else vec::axpycInc(bj, tmp, B, rsb, j * rsb + l, cRow, 1, j);
                }
            }
        }
    }
}

} // namespace yb::kernel::gemm
