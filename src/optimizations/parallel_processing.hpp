#pragma once

#include <cstddef>
#include <functional>

namespace parallel_ops {
    // Splits [0, count) into contiguous chunks and runs task(start, end) for
    // each chunk on its own std::async task. Blocks until every chunk is done;
    // an exception thrown by any chunk is rethrown here.
    // num_threads == 0 means std::thread::hardware_concurrency().
    void parallel_for(size_t count, const std::function<void(size_t, size_t)>& task, size_t num_threads = 0);
}
