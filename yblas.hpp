#pragma once
/***************
* @file: yblas.hpp
* @brief: 所有include文件的总入口。
* @author: SnifferCaptain
* @date: 2026-10-19
* @version 1.0
* @email: 3586554865@qq.com
***************/

#include "include/yblas_concepts.hpp"
#include "include/yblas_infos.hpp"
#include "include/yblas_types.hpp"

/////////// blas interface ////////////
#include "include/yblas_level1.hpp"
#include "include/yblas_gemm.hpp"

//////////// external /////////////
#include "include/yblas_general.hpp"

//////////// implementation /////////////
#include "src/yblas_level1.inl"
#include "src/yblas_gemm.inl"

#include "src/yblas_general.inl"
