#ifndef PARACOPY_TASK_QUEUE_H_H
#define PARACOPY_TASK_QUEUE_H_H

#include "ParaCopyPort.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)

// 目录模式下的一个拷贝任务：一个常规文件
struct PARACOPY_PORT PC_FileTask
{
    std::string sourcePath;
    std::string destinationPath;
    std::string relativePath;   // 相对源根目录，正斜杠分隔
    uint64_t fileSize = 0;
};

/*
    多个 worker 共享的 FIFO。判空与出队在同一个临界区内完成，
    因此每个任务至多被一个 worker 取走。队列为空即终态，不会再有新任务加入。
*/
class PARACOPY_PORT PC_TaskQueue
{
public:
    PC_TaskQueue();
    explicit PC_TaskQueue(std::vector<PC_FileTask> taskList);

    PC_TaskQueue(const PC_TaskQueue&) = delete;
    PC_TaskQueue& operator=(const PC_TaskQueue&) = delete;

    // 队列为空时返回 false，task 不变
    bool TryPopFront(PC_FileTask& task);

    bool IsEmpty() const;
    size_t GetPendingCount() const;

private:
    mutable std::mutex queueMutex;
    std::deque<PC_FileTask> tasks;
};

#pragma warning(pop)

#endif
