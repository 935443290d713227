#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>
#include "../../yblas.hpp"

using yb::Transpose;

// 用法: gemm_demo [n] [threads]
int main(int argc, char** argv) {
    int n = argc > 1 ? std::atoi(argv[1]) : 1000;
    int threads = argc > 2 ? std::atoi(argv[2]) : 0;
    if (n <= 0) {
        std::cerr << "n must be positive" << std::endl;
        return 1;
    }
    std::cout << "=== yblas GEMM Demo ===" << std::endl;
    std::cout << "C = A * B^T, " << n << " x " << n << ", block " << yb::infos::blockSize << std::endl;

    try {
        std::mt19937 rng(2026);
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        std::vector<double> a(static_cast<size_t>(n) * n), b(a.size());
        for (auto& v : a) v = dist(rng);
        for (auto& v : b) v = dist(rng);
        std::vector<double> cSerial(a.size(), 0.0), cParallel(a.size(), 0.0);

        auto t0 = std::chrono::system_clock::now();
        yb::dgemm(Transpose::NoTrans, Transpose::Trans, n, n, n, 1.0, a, n, b, n, 0.0, cSerial, n, {.forceSerial = true});
        auto t1 = std::chrono::system_clock::now();
        yb::dgemm(Transpose::NoTrans, Transpose::Trans, n, n, n, 1.0, a, n, b, n, 0.0, cParallel, n, {.numThreads = threads});
        auto t2 = std::chrono::system_clock::now();

        float serialSec = std::chrono::duration<float>(t1 - t0).count();
        float parallelSec = std::chrono::duration<float>(t2 - t1).count();
        double gflop = 2.0 * n * n * static_cast<double>(n) * 1e-9;
        double maxDiff = 0.0;
        for (size_t i = 0; i < cSerial.size(); ++i) {
            maxDiff = std::max(maxDiff, std::abs(cSerial[i] - cParallel[i]));
        }

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "serial:   " << serialSec << " s, " << gflop / serialSec << " GFLOPS" << std::endl;
        std::cout << "parallel: " << parallelSec << " s, " << gflop / parallelSec << " GFLOPS ("
                  << (threads > 0 ? threads : yb::getNumThreads()) << " threads)" << std::endl;
        std::cout << "speedup:  " << serialSec / parallelSec << "x" << std::endl;
        std::cout << std::scientific << "max |serial - parallel| = " << maxDiff << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
