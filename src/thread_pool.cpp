#include "scicalc/thread_pool.hpp"

namespace scicalc {

ThreadPool::ThreadPool(std::size_t threadCount) {
    std::size_t count = threadCount == 0 ? 1 : threadCount;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// Поток выходит только когда очередь пуста и пул останавливается,
// поэтому все поставленные задачи будут выполнены.
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            condition.wait(lock, [this]() { return stopping || !tasks.empty(); });
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

} // namespace scicalc
