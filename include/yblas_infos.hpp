#pragma once
/***************
* @file: yblas_infos.hpp
* @brief: 存储一些全局静态信息的命名空间
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

namespace yb::infos {
    /// @brief 输出矩阵分块的边长，每个块为 blockSize x blockSize（边缘块可能更小）
    static constexpr int blockSize = 50;

    /// @brief 开启多核并行所需的最少输出块数，少于该值时串行计算
    static constexpr int minParBlock = 4;

    /// @brief 逐元素运算开启多核并行的阈值（以单次浮点运算为单位1）
    static constexpr double minParOps = 29609.;

    /// @brief 矩阵缩放（beta * C）每个元素的运算量估计
    static constexpr double flopScale = 1.;
}// namespace yb::infos
