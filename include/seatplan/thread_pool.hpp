/**
 * @file thread_pool.hpp
 * @brief 固定サイズのスレッドプール
 */
#ifndef SEATPLAN_THREAD_POOL_HPP
#define SEATPLAN_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace seatplan {

/**
 * @brief 固定サイズのスレッドプール
 *
 * ワーカーは条件変数で待機し、共有キューからタスクを取り出して実行する。
 * デストラクタでキューを消化した後に全ワーカーを join する。
 * タスク内の例外は future::get() で呼び出し側に再送出される。
 */
class ThreadPool {
public:
    /**
     * @brief プールを作成
     * @param threads ワーカー数（0 なら 1）
     * @throws std::system_error スレッドを起動できない場合（起動済みのワーカーは join 済み）
     */
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief タスクを投入
     * @return 結果を受け取る future
     */
    template<class F, class R = std::invoke_result_t<std::decay_t<F>>>
    std::future<R> enqueue(F&& f);

    /**
     * @brief ワーカー数を取得
     */
    size_t thread_count() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
};

inline ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0) threads = 1;
    try {
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mtx_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                }
            });
        }
    } catch (...) {
        // デストラクタは呼ばれないので、起動済みのワーカーをここで止める
        {
            std::unique_lock<std::mutex> lock(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) w.join();
        throw;
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) w.join();
}

template<class F, class R>
std::future<R> ThreadPool::enqueue(F&& f) {
    // std::function はコピー可能な callable を要求するので shared_ptr で包む
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> future = task->get_future();
    {
        std::unique_lock<std::mutex> lock(mtx_);
        tasks_.emplace([task = std::move(task)]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

} // namespace seatplan

#endif // SEATPLAN_THREAD_POOL_HPP
