#pragma once
#include <complex>
#include <concepts>
#include <type_traits>

namespace yb::concepts {
    // binary operation concepts
    template<typename T> concept HAVE_ADD = requires(T a, T b) { { a + b } -> std::same_as<T>; };
    template<typename T> concept HAVE_MUL = requires(T a, T b) { { a * b } -> std::same_as<T>; };

    // inplace binary operation concepts
    template<typename T> concept HAVE_ADD_INPLACE = requires(T a, T b) { { a += b } -> std::same_as<T&>; };
    template<typename T> concept HAVE_MUL_INPLACE = requires(T a, T b) { { a *= b } -> std::same_as<T&>; };

    template<typename T> concept HAVE_EQ = requires(T a, T b) { { a == b } -> std::same_as<bool>; };
    template<typename T> concept HAVE_NEQ = requires(T a, T b) { { a != b } -> std::same_as<bool>; };

    /// @brief 可参与 BLAS 运算的标量类型：加、乘、比较，且能由整数 0/1 构造
    template<typename T>
    concept BlasScalar = HAVE_ADD<T> && HAVE_MUL<T> && HAVE_ADD_INPLACE<T> && HAVE_MUL_INPLACE<T>
        && HAVE_EQ<T> && HAVE_NEQ<T> && std::constructible_from<T, int>;
};

namespace yb::traits {
    /// @brief 判断类型是否为 std::complex
    template<typename U>
    struct is_complex : std::false_type {};

    template<typename U>
    struct is_complex<std::complex<U>> : std::true_type {};

    template<typename U>
    inline constexpr bool is_complex_v = is_complex<std::remove_cv_t<U>>::value;
}
