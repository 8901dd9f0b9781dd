/**
 * @file sequence_generator.h
 * @brief 单调递增的编号生成器
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <string>

/**
 * @class SequenceGenerator
 * @brief 线程安全的编号生成器，生成形如 "<prefix><n>" 的编号
 *
 * 编号只增不减，不会复用（即使对应的停车票已结算）。
 * 每个停车场注入自己的生成器，不同停车场实例之间互不干扰。
 */
class SequenceGenerator {
private:
    std::string prefix;
    std::atomic<uint64_t> counter;

public:
    explicit SequenceGenerator(const std::string& idPrefix, uint64_t start = 0)
        : prefix(idPrefix)
        , counter(start) {
    }

    SequenceGenerator(const SequenceGenerator&) = delete;
    SequenceGenerator& operator=(const SequenceGenerator&) = delete;

    std::string next() {
        return prefix + std::to_string(counter.fetch_add(1));
    }

    // 下一个将要发出的序号
    uint64_t peek() const {
        return counter.load();
    }
};
