#pragma once
/***************
* @file: yblas_types.hpp
* @brief: yblas 基础类型定义：转置标记、共轭、类型名称
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <complex>
#include <cstdint>
#include <string>
#include <type_traits>
#include <typeinfo>
#include "./yblas_concepts.hpp"

namespace yb {
    /// @brief 操作数的转置方式，取值与 CBLAS 保持一致
    enum class Transpose : int32_t {
        NoTrans = 111,
        Trans = 112,
        ConjTrans = 113
    };
}

namespace yb::types {
    /// @brief 判断转置标记是否合法（防止任意整数强转为枚举）
    constexpr bool isValidTranspose(yb::Transpose t) {
        switch (t) {
            case yb::Transpose::NoTrans:
            case yb::Transpose::Trans:
            case yb::Transpose::ConjTrans:
                return true;
        }
        return false;
    }

    /// @brief 转置标记的名称
    inline std::string transposeName(yb::Transpose t) {
        switch (t) {
            case yb::Transpose::NoTrans: return "NoTrans";
            case yb::Transpose::Trans: return "Trans";
            case yb::Transpose::ConjTrans: return "ConjTrans";
        }
        return "Transpose(" + std::to_string(static_cast<int32_t>(t)) + ")";
    }

    /// @brief 共轭，实数类型为恒等映射
    template<typename T>
    constexpr T conj(const T& x) {
        if constexpr (yb::traits::is_complex_v<T>) return std::conj(x);
        else return x;
    }

    /// @brief 获取数据类型名称
    /// @tparam T 数据类型
    /// @return 数据类型名称字符串
    template<typename T>
    std::string getTypeName() {
        if constexpr (std::is_same_v<T, float>) return "float32";
        else if constexpr (std::is_same_v<T, double>) return "float64";
        else if constexpr (std::is_same_v<T, std::complex<float>>) return "complex64";
        else if constexpr (std::is_same_v<T, std::complex<double>>) return "complex128";
        else if constexpr (std::is_same_v<T, int32_t>) return "int32";
        else if constexpr (std::is_same_v<T, int64_t>) return "int64";
        else return typeid(T).name();
    }
} // namespace yb::types
