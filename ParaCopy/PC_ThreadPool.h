#ifndef PARACOPY_THREAD_POOL_H_H
#define PARACOPY_THREAD_POOL_H_H

#include "ParaCopyPort.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)

/*
    PC_ThreadPool：固定线程数的线程池。
    一次拷贝开 N 个线程，每个 PC_CopyWorker 占满一个线程直到结束，因此线程数必须等于 worker 数。

    任务抛出的 std::exception 会被记录到日志，线程继续取下一个任务。
    析构时先跑完已排队的任务再退出。
*/
class PARACOPY_PORT PC_ThreadPool
{
public:
    explicit PC_ThreadPool(size_t threadCount);
    ~PC_ThreadPool();

    PC_ThreadPool(const PC_ThreadPool&) = delete;
    PC_ThreadPool& operator=(const PC_ThreadPool&) = delete;

    // 析构开始后抛 std::runtime_error
    void Post(std::function<void()> job);

    // 阻塞到队列为空且没有任务在执行
    void WaitIdle();

private:
    void RunJob(std::function<void()>& job);
    void ThreadMain();
    void StopAndJoin();

    std::vector<std::thread> threads;

    std::mutex mtx;
    std::condition_variable jobCond;
    std::condition_variable idleCond;

    std::deque<std::function<void()>> jobs;
    size_t runningJobs;
    bool stopping;
};

#pragma warning(pop)

#endif
