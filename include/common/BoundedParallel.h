#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace riskguard {
namespace common {

// items 각각에 fn 을 최대 max_workers 개 스레드로 실행하고 모두 끝날 때까지 대기.
// fn 은 예외를 밖으로 던지지 않아야 한다 (종목 단위 실패 격리는 호출자 책임).
template<typename Item, typename Fn>
void forEachBounded(const std::vector<Item>& items, std::size_t max_workers, Fn fn) {
    if (items.empty()) {
        return;
    }

    const std::size_t workers = std::max<std::size_t>(1, std::min(max_workers, items.size()));
    if (workers == 1) {
        for (const auto& item : items) {
            fn(item);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&items, &next, &fn]() {
            while (true) {
                const std::size_t idx = next.fetch_add(1);
                if (idx >= items.size()) {
                    break;
                }
                fn(items[idx]);
            }
        });
    }

    for (auto& t : pool) {
        t.join();
    }
}

} // namespace common
} // namespace riskguard
