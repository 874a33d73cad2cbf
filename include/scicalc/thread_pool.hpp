#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace scicalc {

// Пул потоков фиксированного размера для пакетного вычисления выражений.
// Задачи выполняются в порядке постановки в очередь; результат каждой
// возвращается через std::future, исключения задачи попадают туда же.
class ThreadPool {
public:
    // 0 потоков трактуется как 1
    explicit ThreadPool(std::size_t threadCount);

    // Дожидается выполнения всех поставленных задач и останавливает потоки
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавляет новую задачу в очередь.
    // Выбрасывает std::runtime_error, если пул уже останавливается.
    template <class Func, class... Args>
    auto enqueue(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>>;

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex mutex;                  // Защищает очередь и флаг остановки
    std::condition_variable condition; // Сигнал о новой задаче или остановке
    bool stopping = false;

    void workerLoop();
};

template <class Func, class... Args>
auto ThreadPool::enqueue(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
    using Result = std::invoke_result_t<Func, Args...>;

    // Аргументы копируются (или перемещаются) в задачу
    auto task = std::make_shared<std::packaged_task<Result()>>(
        [func = std::forward<Func>(func), arguments = std::make_tuple(std::forward<Args>(args)...)]() mutable {
            return std::apply(func, std::move(arguments));
        });
    std::future<Result> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }
    condition.notify_one();
    return result;
}

} // namespace scicalc
