#pragma once
/***************
 * @file scalar_kernel.hpp
 * @brief Strided vector primitives used by the blocked GEMM kernel
 * @author SnifferCaptain
 * @date 2026-10-19
 *
 * Level-1 style building blocks: dot products and scaled accumulation
 * (axpy) over unit-stride or strided sequences.
 *
 * Strided variants take a start offset alongside the increment so that
 * negative increments (walk from the far end) follow BLAS semantics.
 * All functions are pure: no allocation, no shared state.
 ***************/

#include <cstdint>
#include "../yblas_types.hpp"

namespace yb::kernel::scalar {

// ============================================================================
// Dot products
// ============================================================================

// sum x[i] * y[i], i in [0, n)
template<typename T>
inline T dotUnitary(int n, const T* x, const T* y) {
    T sum(0);
    for (int i = 0; i < n; ++i) {
        sum += x[i] * y[i];
    }
    return sum;
}

// sum x[ix + i*incX] * y[iy + i*incY]
template<typename T>
inline T dotInc(int n, const T* x, int64_t incX, int64_t ix, const T* y, int64_t incY, int64_t iy) {
    T sum(0);
    for (int i = 0; i < n; ++i) {
        sum += x[ix] * y[iy];
        ix += incX;
        iy += incY;
    }
    return sum;
}

// sum conj(x[i]) * y[i]; same as dotUnitary for real types
template<typename T>
inline T dotcUnitary(int n, const T* x, const T* y) {
    if constexpr (!yb::traits::is_complex_v<T>) {
        return dotUnitary(n, x, y);
    } else {
        T sum(0);
        for (int i = 0; i < n; ++i) {
            sum += yb::types::conj(x[i]) * y[i];
        }
        return sum;
    }
}

template<typename T>
inline T dotcInc(int n, const T* x, int64_t incX, int64_t ix, const T* y, int64_t incY, int64_t iy) {
    if constexpr (!yb::traits::is_complex_v<T>) {
        return dotInc(n, x, incX, ix, y, incY, iy);
    } else {
        T sum(0);
        for (int i = 0; i < n; ++i) {
            sum += yb::types::conj(x[ix]) * y[iy];
            ix += incX;
            iy += incY;
        }
        return sum;
    }
}

// ============================================================================
// Scaled accumulation
// ============================================================================

// y[i] += alpha * x[i]
template<typename T>
inline void axpyUnitary(int n, T alpha, const T* x, T* y) {
    for (int i = 0; i < n; ++i) {
        y[i] += alpha * x[i];
    }
}

template<typename T>
inline void axpyInc(int n, T alpha, const T* x, int64_t incX, int64_t ix, T* y, int64_t incY, int64_t iy) {
    for (int i = 0; i < n; ++i) {
        y[iy] += alpha * x[ix];
        ix += incX;
        iy += incY;
    }
}

// y[i] += alpha * conj(x[i])
template<typename T>
inline void axpycInc(int n, T alpha, const T* x, int64_t incX, int64_t ix, T* y, int64_t incY, int64_t iy) {
    if constexpr (!yb::traits::is_complex_v<T>) {
        axpyInc(n, alpha, x, incX, ix, y, incY, iy);
    } else {
        for (int i = 0; i < n; ++i) {
            y[iy] += alpha * yb::types::conj(x[ix]);
            ix += incX;
            iy += incY;
        }
    }
}

// ============================================================================
// Scaling
// ============================================================================

// x[i] *= beta
template<typename T>
inline void scal(int n, T beta, T* x) {
    for (int i = 0; i < n; ++i) {
        x[i] *= beta;
    }
}

template<typename T>
inline void scalInc(int n, T beta, T* x, int64_t incX, int64_t ix) {
    for (int i = 0; i < n; ++i) {
        x[ix] *= beta;
        ix += incX;
    }
}

// x[i] = 0, a hard overwrite: NaN and Inf do not survive
template<typename T>
inline void zero(int n, T* x) {
    for (int i = 0; i < n; ++i) {
        x[i] = T(0);
    }
}

} // namespace yb::kernel::scalar
