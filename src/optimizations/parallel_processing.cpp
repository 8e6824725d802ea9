#include "parallel_processing.hpp"

#include <future>
#include <thread>
#include <vector>

namespace parallel_ops {

void parallel_for(size_t count, const std::function<void(size_t, size_t)>& task, size_t num_threads) {
    if (count == 0) {
        return;
    }

    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
    }
    if (num_threads == 0) num_threads = 1; // hardware_concurrency may report 0
    size_t batch_size = count / num_threads;
    if (batch_size == 0) { // more threads than items
        batch_size = 1;
        num_threads = count;
    }

    if (num_threads == 1) {
        task(0, count);
        return;
    }

    std::vector<std::future<void>> futures;
    for (size_t i = 0; i < num_threads; ++i) {
        size_t start = i * batch_size;
        size_t end = (i == num_threads - 1) ? count : start + batch_size;
        if (start < end) {
            futures.push_back(std::async(std::launch::async, task, start, end));
        }
    }

    for (auto& future : futures) {
        future.get();
    }
}

} // namespace parallel_ops
