#pragma once
/***************
 * @file work_queue.hpp
 * @brief Lock-free hand-out of output blocks to GEMM workers
 * @author SnifferCaptain
 * @date 2026-10-19
 *
 * The m x n output is split into blockSize x blockSize blocks, enumerated
 * row-major (row-blocks outer, column-blocks inner). Every call to next()
 * claims one block with a single atomic fetch-add; a block is handed out
 * exactly once, and once the counter passes the total the queue stays
 * exhausted.
 ***************/

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "../yblas_infos.hpp"

namespace yb::kernel {

/// @brief 输出块左上角坐标，均为 blockSize 的整数倍
struct Block {
    int i = 0;
    int j = 0;

    bool operator==(const Block&) const = default;
};

class WorkQueue {
public:
    /// @brief 构造工作队列
    /// @param blockSize 分块边长，必须为正
    explicit WorkQueue(int blockSize = yb::infos::blockSize) : _blockSize(blockSize) {
        if (blockSize <= 0) {
            throw std::invalid_argument("[yb::WorkQueue] block size must be positive, got " + std::to_string(blockSize));
        }
    }

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// @brief 按 m x n 的输出重新划分并把计数器归零。不能与 next() 并发调用。
    void reset(int m, int n) {
        _blocksPerRow = ceilDiv(std::max(n, 0), _blockSize);
        _blocksPerCol = ceilDiv(std::max(m, 0), _blockSize);
        _total = static_cast<int64_t>(_blocksPerRow) * _blocksPerCol;
        _head.store(0, std::memory_order_relaxed);
    }

    /// @brief 领取下一个块。可在任意多个线程中并发调用，不阻塞。
    /// @return 块坐标；队列耗尽时返回 std::nullopt
    std::optional<Block> next() {
        int64_t w = _head.fetch_add(1, std::memory_order_relaxed);
        if (w >= _total) {
            return std::nullopt;
        }
        return Block{
            static_cast<int>(w / _blocksPerRow) * _blockSize,
            static_cast<int>(w % _blocksPerRow) * _blockSize
        };
    }

    int blockSize() const { return _blockSize; }
    int blocksPerRow() const { return _blocksPerRow; }
    int blocksPerCol() const { return _blocksPerCol; }
    int64_t total() const { return _total; }

    static constexpr int ceilDiv(int a, int b) { return a / b + (a % b != 0 ? 1 : 0); }

private:
    int _blockSize;
    int _blocksPerRow = 0;
    int _blocksPerCol = 0;
    int64_t _total = 0;
    std::atomic<int64_t> _head{0};
};

} // namespace yb::kernel
