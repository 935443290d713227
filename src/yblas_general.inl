/***************
* @file: yblas_general.inl
* @brief: General 视图与基于视图的 GEMM 的实现
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include "../include/yblas_general.hpp"

namespace yb {

template<typename T>
void General<T>::check(const std::string& name) const {
    if (rows < 0 || cols < 0) {
        throw std::invalid_argument("[yb::General::check] " + name + " has negative shape: "
            + std::to_string(rows) + " x " + std::to_string(cols));
    }
    if (stride < std::max(1, cols)) {
        throw std::invalid_argument("[yb::General::check] bad stride of " + name + ": "
            + std::to_string(stride) + " < " + std::to_string(std::max(1, cols)));
    }
    if (rows == 0 || cols == 0) return;
    const int64_t need = static_cast<int64_t>(rows - 1) * stride + cols;
    if (static_cast<int64_t>(data.size()) < need) {
        throw std::invalid_argument("[yb::General::check] insufficient length of " + name + ": "
            + std::to_string(data.size()) + " < " + std::to_string(need));
    }
}

template<typename T>
T& General<T>::at(int i, int j) const {
    return data[static_cast<size_t>(static_cast<int64_t>(i) * stride + j)];
}

template<typename T>
General<T> General<T>::view(int i, int j, int r, int c) const {
    if (i < 0 || j < 0 || r < 0 || c < 0 || r > rows - i || c > cols - j) {
        throw std::out_of_range("[yb::General::view] sub-matrix [" + std::to_string(i) + ", " + std::to_string(static_cast<int64_t>(i) + r)
            + ") x [" + std::to_string(j) + ", " + std::to_string(static_cast<int64_t>(j) + c) + ") out of "
            + std::to_string(rows) + " x " + std::to_string(cols));
    }
    if (r == 0 || c == 0) {
        return General<T>(r, c, stride, std::span<T>{});
    }
    const size_t offset = static_cast<size_t>(static_cast<int64_t>(i) * stride + j);
    const size_t len = static_cast<size_t>(static_cast<int64_t>(r - 1) * stride + c);
    return General<T>(r, c, stride, data.subspan(offset, len));
}

template<yb::concepts::BlasScalar T>
void gemm(yb::Transpose tA, yb::Transpose tB, std::type_identity_t<T> alpha,
          const General<const T>& A, const General<const T>& B,
          std::type_identity_t<T> beta, const General<T>& C,
          const GemmOptions& opts) {
    if (!yb::types::isValidTranspose(tA) || !yb::types::isValidTranspose(tB)) {
        throw std::invalid_argument("[yb::gemm] illegal transpose: " + yb::types::transposeName(tA)
            + ", " + yb::types::transposeName(tB));
    }
    A.check("A");
    B.check("B");
    C.check("C");

    int m = A.rows, k = A.cols;
    if (tA != yb::Transpose::NoTrans) std::swap(m, k);
    int kb = B.rows, n = B.cols;
    if (tB != yb::Transpose::NoTrans) std::swap(kb, n);
    if (k != kb || m != C.rows || n != C.cols) {
        throw std::invalid_argument("[yb::gemm] dimension mismatch: op(A) is " + std::to_string(m) + " x " + std::to_string(k)
            + ", op(B) is " + std::to_string(kb) + " x " + std::to_string(n)
            + ", C is " + std::to_string(C.rows) + " x " + std::to_string(C.cols));
    }

    yb::gemm<T>(tA, tB, m, n, k, alpha, A.data, A.stride, B.data, B.stride, beta, C.data, C.stride, opts);
}

template<typename T>
General<T> fromEigen(EigenRowMajor<T>& mat) {
    const int rows = static_cast<int>(mat.rows());
    const int cols = static_cast<int>(mat.cols());
    return General<T>(rows, cols, std::max(1, cols), std::span<T>(mat.data(), static_cast<size_t>(mat.size())));
}

template<typename T>
General<const T> fromEigen(const EigenRowMajor<T>& mat) {
    const int rows = static_cast<int>(mat.rows());
    const int cols = static_cast<int>(mat.cols());
    return General<const T>(rows, cols, std::max(1, cols), std::span<const T>(mat.data(), static_cast<size_t>(mat.size())));
}

template<typename T>
EigenStridedMap<T> toEigenMap(const General<T>& mat) {
    return EigenStridedMap<T>(mat.data.data(), mat.rows, mat.cols, Eigen::OuterStride<>(mat.stride));
}

template<typename T>
EigenConstStridedMap<T> toEigenConstMap(const General<const T>& mat) {
    return EigenConstStridedMap<T>(mat.data.data(), mat.rows, mat.cols, Eigen::OuterStride<>(mat.stride));
}

} // namespace yb
