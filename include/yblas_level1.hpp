#pragma once
/***************
* @file: yblas_level1.hpp
* @brief: 向量运算（BLAS Level 1）：点积、共轭点积、axpy、缩放
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <span>
#include <type_traits>
#include "./yblas_concepts.hpp"

namespace yb {
    /// @brief 点积 sum x[i] * y[i]
    /// @param n: 元素个数，n 为 0 时返回 0
    /// @param x: 向量 x 的存储
    /// @param incX: x 的步长，不能为 0。负步长表示从末尾向前遍历
    /// @param y: 向量 y 的存储
    /// @param incY: y 的步长
    /// @throw std::invalid_argument n < 0、步长为 0（n 为 0 时同样检查）或存储长度不足
    template<yb::concepts::BlasScalar T>
    T dot(int n, std::type_identity_t<std::span<const T>> x, int incX,
          std::type_identity_t<std::span<const T>> y, int incY);

    /// @brief 共轭点积 sum conj(x[i]) * y[i]，实数类型与 dot 相同
    template<yb::concepts::BlasScalar T>
    T dotc(int n, std::type_identity_t<std::span<const T>> x, int incX,
           std::type_identity_t<std::span<const T>> y, int incY);

    /// @brief y += alpha * x
    template<yb::concepts::BlasScalar T>
    void axpy(int n, std::type_identity_t<T> alpha, std::type_identity_t<std::span<const T>> x, int incX,
              std::type_identity_t<std::span<T>> y, int incY);

    /// @brief x *= beta。beta 为 0 时直接置零
    /// @param incX: 步长，不能为 0。负步长时不做任何操作
    template<yb::concepts::BlasScalar T>
    void scal(int n, std::type_identity_t<T> beta, std::type_identity_t<std::span<T>> x, int incX);
} // namespace yb
