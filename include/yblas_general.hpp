#pragma once
/***************
* @file: yblas_general.hpp
* @brief: 行主序稠密矩阵视图 General，以及基于视图的 GEMM 接口和 Eigen 互操作
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <span>
#include <string>
#include <type_traits>
#include <Eigen/Core>
#include "./yblas_concepts.hpp"
#include "./yblas_gemm.hpp"
#include "./yblas_types.hpp"

namespace yb {
    /// @brief 行主序矩阵视图，不拥有数据。元素 (i, j) 位于 data[i * stride + j]。
    /// @tparam T 元素类型，可以是 const 类型（只读视图）
    template<typename T>
    struct General {
        int rows = 0;
        int cols = 0;
        int stride = 0;
        std::span<T> data;

        General() = default;
        General(int rows_, int cols_, int stride_, std::span<T> data_)
            : rows(rows_), cols(cols_), stride(stride_), data(data_) {}

        /// @brief 非 const 视图可隐式转换为只读视图
        template<typename U>
            requires std::is_same_v<const U, T> && (!std::is_same_v<U, T>)
        General(const General<U>& other)
            : rows(other.rows), cols(other.cols), stride(other.stride), data(other.data) {}

        /// @brief 校验形状、跨度与存储长度
        /// @param name: 矩阵名称，用于报错
        /// @throw std::invalid_argument
        void check(const std::string& name = "matrix") const;

        /// @brief 访问元素，不做边界检查
        T& at(int i, int j) const;

        /// @brief 取子矩阵视图 [i, i+r) x [j, j+c)，与原矩阵共享存储
        /// @throw std::out_of_range 子矩阵越界时抛出
        General<T> view(int i, int j, int r, int c) const;
    };

    /// @brief 基于视图的 GEMM：根据 tA、tB 从 A、B、C 的形状推出 m、n、k
    /// @throw std::invalid_argument 形状不匹配（dimension mismatch）或视图非法
    template<yb::concepts::BlasScalar T>
    void gemm(yb::Transpose tA, yb::Transpose tB, std::type_identity_t<T> alpha,
              const General<const T>& A, const General<const T>& B,
              std::type_identity_t<T> beta, const General<T>& C,
              const GemmOptions& opts = {});

    /// @brief Eigen 行主序动态矩阵
    template<typename T>
    using EigenRowMajor = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    /// @brief 带行跨度的 Eigen Map
    template<typename T>
    using EigenStridedMap = Eigen::Map<EigenRowMajor<T>, 0, Eigen::OuterStride<>>;

    template<typename T>
    using EigenConstStridedMap = Eigen::Map<const EigenRowMajor<T>, 0, Eigen::OuterStride<>>;

    /// @brief 把 Eigen 行主序矩阵包装为 General 视图
    template<typename T>
    General<T> fromEigen(EigenRowMajor<T>& mat);

    template<typename T>
    General<const T> fromEigen(const EigenRowMajor<T>& mat);

    /// @brief 从 General 视图创建 Eigen Map
    template<typename T>
    EigenStridedMap<T> toEigenMap(const General<T>& mat);

    template<typename T>
    EigenConstStridedMap<T> toEigenConstMap(const General<const T>& mat);
} // namespace yb
