#pragma once

#include <exception>
#include <vector>
#include <omp.h>
#include "../yblas_infos.hpp"

namespace yb::kernel{
/// @brief 并行for循环，根据任务量自动选择并行或串行执行。循环结束时所有线程已汇合。
/// @param from 起始索引（包含）
/// @param to 结束索引（不包含）
/// @param func 可调用对象，接受一个int参数，表示当前索引
/// @param flop 每次迭代的浮点运算量估计。当问题规模大于minParOps时，开启多核并行执行。以单次浮点运算为单位1。
template<typename Func>
void parallelFor(int from, int to, Func&& func, double flop = 1.){
    if((to - from) * flop >= yb::infos::minParOps) {
        std::exception_ptr error;
        #pragma omp parallel for proc_bind(close)
        for (int i = from; i < to; i++) {
            try {
                func(i);
            } catch (...) {
                #pragma omp critical(yb_parallel_for_error)
                if (!error) error = std::current_exception();
            }
        }
        if (error) std::rethrow_exception(error);
    } else {
        for (int i = from; i < to; i++) {
            func(i);
        }
    }
}

/// @brief 启动固定数量的工作线程，每个线程调用一次 func(workerId)，返回前等待全部线程结束。
/// 工作线程抛出的异常在汇合之后重新抛出（只抛出编号最小的那个）。
/// @param nWorkers 线程数上限，实际线程数可能因 OpenMP 嵌套限制而更少
/// @param func 可调用对象，签名为 void func(int workerId)
template<typename Func>
void runWorkers(int nWorkers, Func&& func){
    if (nWorkers <= 1) {
        func(0);
        return;
    }
    std::vector<std::exception_ptr> errors(static_cast<size_t>(nWorkers));
    #pragma omp parallel num_threads(nWorkers)
    {
        int id = omp_get_thread_num();
        try {
            func(id);
        } catch (...) {
            errors[static_cast<size_t>(id)] = std::current_exception();
        }
    }
    for (auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
}

}// namespace yb::kernel
