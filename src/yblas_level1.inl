/***************
* @file: yblas_level1.inl
* @brief: 向量运算的参数校验与实现，计算部分转发到 yb::kernel::scalar
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <cstdint>
#include <stdexcept>
#include <string>
#include "../include/yblas_level1.hpp"
#include "../include/kernel/scalar_kernel.hpp"

namespace yb {

namespace detail {
    inline void checkN(const std::string& opName, int n) {
        if (n < 0) {
            throw std::invalid_argument("[yb::" + opName + "] n < 0 (n = " + std::to_string(n) + ")");
        }
    }

    inline void checkIncrement(const std::string& opName, char name, int inc) {
        if (inc == 0) {
            throw std::invalid_argument("[yb::" + opName + "] bad increment: increment of " + std::string(1, name) + " is 0");
        }
    }

    /// @brief 校验一个带步长的非空向量的存储长度，返回起始下标（负步长从末尾开始）
    inline int64_t checkVector(const std::string& opName, char name, int n, size_t len, int inc) {
        const int64_t absInc = inc < 0 ? -static_cast<int64_t>(inc) : inc;
        const int64_t need = 1 + static_cast<int64_t>(n - 1) * absInc;
        if (static_cast<int64_t>(len) < need) {
            throw std::invalid_argument("[yb::" + opName + "] insufficient length of " + std::string(1, name) + ": "
                + std::to_string(len) + " < " + std::to_string(need));
        }
        return inc < 0 ? static_cast<int64_t>(n - 1) * absInc : 0;
    }
} // namespace detail

template<yb::concepts::BlasScalar T>
T dot(int n, std::type_identity_t<std::span<const T>> x, int incX,
      std::type_identity_t<std::span<const T>> y, int incY) {
    detail::checkN("dot", n);
    detail::checkIncrement("dot", 'x', incX);
    detail::checkIncrement("dot", 'y', incY);
    if (n == 0) return T(0);
    int64_t ix = detail::checkVector("dot", 'x', n, x.size(), incX);
    int64_t iy = detail::checkVector("dot", 'y', n, y.size(), incY);
    if (incX == 1 && incY == 1) {
        return yb::kernel::scalar::dotUnitary(n, x.data(), y.data());
    }
    return yb::kernel::scalar::dotInc(n, x.data(), incX, ix, y.data(), incY, iy);
}

template<yb::concepts::BlasScalar T>
T dotc(int n, std::type_identity_t<std::span<const T>> x, int incX,
       std::type_identity_t<std::span<const T>> y, int incY) {
    detail::checkN("dotc", n);
    detail::checkIncrement("dotc", 'x', incX);
    detail::checkIncrement("dotc", 'y', incY);
    if (n == 0) return T(0);
    int64_t ix = detail::checkVector("dotc", 'x', n, x.size(), incX);
    int64_t iy = detail::checkVector("dotc", 'y', n, y.size(), incY);
    if (incX == 1 && incY == 1) {
        return yb::kernel::scalar::dotcUnitary(n, x.data(), y.data());
    }
    return yb::kernel::scalar::dotcInc(n, x.data(), incX, ix, y.data(), incY, iy);
}

template<yb::concepts::BlasScalar T>
void axpy(int n, std::type_identity_t<T> alpha, std::type_identity_t<std::span<const T>> x, int incX,
          std::type_identity_t<std::span<T>> y, int incY) {
    detail::checkN("axpy", n);
    detail::checkIncrement("axpy", 'x', incX);
    detail::checkIncrement("axpy", 'y', incY);
    if (n == 0) return;
    int64_t ix = detail::checkVector("axpy", 'x', n, x.size(), incX);
    int64_t iy = detail::checkVector("axpy", 'y', n, y.size(), incY);
    if (alpha == T(0)) return;
    if (incX == 1 && incY == 1) {
        yb::kernel::scalar::axpyUnitary(n, alpha, x.data(), y.data());
        return;
    }
    yb::kernel::scalar::axpyInc(n, alpha, x.data(), incX, ix, y.data(), incY, iy);
}

template<yb::concepts::BlasScalar T>
void scal(int n, std::type_identity_t<T> beta, std::type_identity_t<std::span<T>> x, int incX) {
    detail::checkIncrement("scal", 'x', incX);
    // negative increment: no effect
    if (incX < 0) return;
    detail::checkN("scal", n);
    if (n == 0) return;
    detail::checkVector("scal", 'x', n, x.size(), incX);
    if (beta == T(0)) {
        for (int64_t i = 0, ix = 0; i < n; ++i, ix += incX) {
            x[static_cast<size_t>(ix)] = T(0);
        }
        return;
    }
    if (incX == 1) {
        yb::kernel::scalar::scal(n, beta, x.data());
        return;
    }
    yb::kernel::scalar::scalInc(n, beta, x.data(), incX, 0);
}

} // namespace yb
