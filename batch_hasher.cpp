#include "batch_hasher.hpp"
#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace shaforge {

std::vector<Digest> hashBatch(const std::vector<std::vector<uint8_t>>& messages, unsigned threads) {
    std::vector<Digest> results(messages.size());
    if (messages.empty()) return results;

    unsigned workers = std::max(1u, std::min<unsigned>(threads, static_cast<unsigned>(messages.size())));
    std::atomic<size_t> nextIndex{0};
    std::exception_ptr failure;
    std::mutex failureMutex;

    auto work = [&]() {
        while (true) {
            size_t i = nextIndex.fetch_add(1);
            if (i >= messages.size()) return;
            try {
                results[i] = hash(messages[i]);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failureMutex);
                if (!failure) failure = std::current_exception();
                nextIndex.store(messages.size());
                return;
            }
        }
    };

    debugLog("hashBatch: " + std::to_string(messages.size()) + " messages on " +
             std::to_string(workers) + " threads");

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned t = 0; t < workers; ++t)
        pool.emplace_back(work);
    for (auto& th : pool)
        th.join();

    if (failure) std::rethrow_exception(failure);
    return results;
}

} // namespace shaforge
