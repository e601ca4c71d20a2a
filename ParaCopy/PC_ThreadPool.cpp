#include "PC_ThreadPool.h"
#include "PC_Logger.h"

#include <exception>
#include <stdexcept>
#include <system_error>

using namespace std;

// 构造中途建线程失败时析构函数不会执行，必须自己收尾后再抛出
PC_ThreadPool::PC_ThreadPool(size_t threadCount) : runningJobs(0), stopping(false)
{
    if (threadCount == 0)
    {
        throw invalid_argument("threadCount must be > 0");
    }

    threads.reserve(threadCount);
    try
    {
        while (threads.size() < threadCount)
        {
            threads.emplace_back(&PC_ThreadPool::ThreadMain, this);
        }
    }
    catch (const system_error&)
    {
        StopAndJoin();
        throw;
    }
}

PC_ThreadPool::~PC_ThreadPool()
{
    StopAndJoin();
}

void PC_ThreadPool::Post(function<void()> job)
{
    {
        lock_guard<mutex> lock(mtx);
        if (stopping)
        {
            throw runtime_error("Post on stopped PC_ThreadPool");
        }
        jobs.push_back(move(job));
    }
    jobCond.notify_one();
}

void PC_ThreadPool::WaitIdle()
{
    unique_lock<mutex> lock(mtx);
    idleCond.wait(lock, [this]() {
        return jobs.empty() && runningJobs == 0;
    });
}

void PC_ThreadPool::RunJob(function<void()>& job)
{
    try
    {
        job();
    }
    catch (const exception& e)
    {
        PC_LOG_ERROR(string("Pool task threw: ") + e.what());
    }

    bool idle = false;
    {
        lock_guard<mutex> lock(mtx);
        runningJobs--;
        idle = jobs.empty() && runningJobs == 0;
    }
    if (idle)
    {
        idleCond.notify_all();
    }
}

void PC_ThreadPool::ThreadMain()
{
    while (true)
    {
        function<void()> job;
        {
            unique_lock<mutex> lock(mtx);
            jobCond.wait(lock, [this]() {
                return stopping || !jobs.empty();
            });
            if (jobs.empty())
            {
                return;
            }

            job = move(jobs.front());
            jobs.pop_front();
            runningJobs++;
        }
        RunJob(job);
    }
}

// 不能在池内线程上调用：join 不了自己
void PC_ThreadPool::StopAndJoin()
{
    {
        lock_guard<mutex> lock(mtx);
        stopping = true;
    }
    jobCond.notify_all();

    for (thread& t : threads)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}
