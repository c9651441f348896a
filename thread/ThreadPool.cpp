#include <rmbench/thread/ThreadPool.h>
#include <glog/logging.h>

namespace rmbench {

/* 构造函数，创建指定数量的线程并让它们等待任务 */
ThreadPool::ThreadPool(size_t threadNum) : stop(false), threadNum(threadNum) {
    for(size_t i = 0; i < threadNum; ++i) {
        workers.emplace_back([this, i] { workerFunc(i); });
    }
    DLOG(INFO) << "thread pool started with " << threadNum << " threads";
}

// 析构函数，停止所有线程并等待它们完成任务
ThreadPool::~ThreadPool() {
    shutdown();
}

/// @brief worker function for each thread
/// @param worker_id the id of the worker
void ThreadPool::workerFunc(size_t worker_id) {
    while(true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(this->queue_mutex);
            condition.wait(lock, [this] { return stop || !tasks.empty(); });
            // 收到停止信号且队列为空时退出
            if(this->stop && tasks.empty()) return;
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

/// @brief shutdown the thread pool, queued tasks still run
void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop) return;
        stop = true;
    }
    condition.notify_all();
    for(std::thread &worker: workers) {
        if(worker.joinable()) { worker.join(); }
    }
}

size_t ThreadPool::getThreadNum() const {
    return threadNum;
}

}
