#pragma once

#include <memory>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <stdexcept>
#include <condition_variable>
#include <functional>
#include <future>
#include <type_traits>

namespace rmbench {

class ThreadPool : public std::enable_shared_from_this<ThreadPool>
{
    public:
        typedef std::shared_ptr <ThreadPool> Ptr;

        ThreadPool(size_t threadNum);

        ~ThreadPool();

        // 添加任务到任务队列，返回与之关联的 future
        template<class F, class... Args>
        auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
            using return_type = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...)
            );

            std::future<return_type> future = task->get_future();
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                // 如果收到停止信号，就抛出异常
                if(stop) throw std::runtime_error("enqueue on stopped ThreadPool");
                tasks.push([task]() { (*task)(); });
            }
            // 唤醒一个等待的线程
            condition.notify_one();
            return future;
        }

        size_t getThreadNum() const;

        void shutdown();

    private:
        void workerFunc(size_t worker_id);

        std::vector<std::thread> workers;
        std::queue<std::function<void()>> tasks;

        std::mutex queue_mutex;
        std::condition_variable condition;
        bool stop;
        size_t threadNum;
};

}
