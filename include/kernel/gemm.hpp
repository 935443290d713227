#pragma once
/***************
 * @file gemm.hpp
 * @brief Blocked, parallel GEMM engine: C = alpha * op(A) @ op(B) + beta * C (inplace)
 * @author SnifferCaptain
 * @date 2026-10-19
 *
 * Arguments are assumed validated (see yb::gemm in yblas_gemm.hpp).
 *
 * Features:
 * - beta pre-pass over C, completed before any block accumulates
 * - serial path: every block in row-major order on the calling thread
 * - parallel path: OpenMP worker team draining a per-call WorkQueue
 * - worker count bounded by the thread setting and by the block count
 *   (define YB_GEMM_NTHREADS or use set_num_threads())
 ***************/

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <omp.h>

#include "block_kernel.hpp"
#include "parallel_for.hpp"
#include "scalar_kernel.hpp"
#include "work_queue.hpp"
#include "../yblas_infos.hpp"

// GEMM 默认线程数，0 表示使用 omp_get_max_threads()
#ifndef YB_GEMM_NTHREADS
#define YB_GEMM_NTHREADS 0
#endif

namespace yb::kernel::gemm {

// ============================================================================
// Thread configuration
// ============================================================================

// 0 means "ask OpenMP"
inline std::atomic<int> g_num_threads{YB_GEMM_NTHREADS};

inline void set_num_threads(int n) {
    if (n < 0) {
        std::cerr << "Warning: set_num_threads(" << n << ") is negative. Falling back to automatic thread count." << std::endl;
        n = 0;
    }
    g_num_threads.store(n, std::memory_order_relaxed);
}

inline int get_num_threads() {
    int n = g_num_threads.load(std::memory_order_relaxed);
    return n > 0 ? n : std::max(1, omp_get_max_threads());
}

// ============================================================================
// beta pre-pass
// ============================================================================

// C = beta * C over the m x n region; beta == 0 overwrites with zero
template<typename T>
inline void scale_c(int m, int n, T beta, T* C, int ldc) {
    if (beta == T(1)) return;
    const int64_t rsc = ldc;
    if (beta == T(0)) {
        yb::kernel::parallelFor(0, m, [&](int i) {
            yb::kernel::scalar::zero(n, C + i * rsc);
        }, n * yb::infos::flopScale);
    } else {
        yb::kernel::parallelFor(0, m, [&](int i) {
            yb::kernel::scalar::scal(n, beta, C + i * rsc);
        }, n * yb::infos::flopScale);
    }
}

// ============================================================================
// Block drivers
// ============================================================================

inline int64_t count_blocks(int m, int n, int blockSize = yb::infos::blockSize) {
    return static_cast<int64_t>(WorkQueue::ceilDiv(m, blockSize)) * WorkQueue::ceilDiv(n, blockSize);
}

// every block, row-major, on the calling thread
template<yb::Transpose TA, yb::Transpose TB, typename T>
inline void gemm_serial(int m, int n, int k, T alpha,
                        const T* A, int lda, const T* B, int ldb, T* C, int ldc) {
    for (int i = 0; i < m; i += yb::infos::blockSize) {
        for (int j = 0; j < n; j += yb::infos::blockSize) {
            multiplyBlock<TA, TB>(i, j, m, n, k, alpha, A, lda, B, ldb, C, ldc);
        }
    }
}

// nWorkers threads claim blocks from one queue until it runs dry
template<yb::Transpose TA, yb::Transpose TB, typename T>
inline void gemm_parallel(int m, int n, int k, T alpha,
                          const T* A, int lda, const T* B, int ldb, T* C, int ldc, int nWorkers) {
    WorkQueue queue(yb::infos::blockSize);
    queue.reset(m, n);
    yb::kernel::runWorkers(nWorkers, [&](int) {
        while (auto block = queue.next()) {
            multiplyBlock<TA, TB>(block->i, block->j, m, n, k, alpha, A, lda, B, ldb, C, ldc);
        }
    });
}

/**
 * @brief Accumulate alpha * op(A) @ op(B) into C, choosing serial or parallel execution
 *
 * @param nThreads Upper bound on workers; <= 1 forces the serial path
 * @param forceSerial Skip the parallel path regardless of size
 */
template<typename T>
inline void accumulate(yb::Transpose tA, yb::Transpose tB, int m, int n, int k, T alpha,
                       const T* A, int lda, const T* B, int ldb, T* C, int ldc,
                       int nThreads, bool forceSerial) {
    const int64_t blocks = count_blocks(m, n);
    const bool serial = forceSerial || nThreads <= 1 || blocks < yb::infos::minParBlock;
    const int nWorkers = static_cast<int>(std::min<int64_t>(nThreads, blocks));

    dispatchTranspose(tA, tB, [&]<yb::Transpose TA, yb::Transpose TB>() {
        if (serial) {
            gemm_serial<TA, TB>(m, n, k, alpha, A, lda, B, ldb, C, ldc);
        } else {
            gemm_parallel<TA, TB>(m, n, k, alpha, A, lda, B, ldb, C, ldc, nWorkers);
        }
    });
}

} // namespace yb::kernel::gemm
