#include "PC_TaskQueue.h"

#include <iterator>
#include <utility>

using namespace std;

PC_TaskQueue::PC_TaskQueue()
{
}

PC_TaskQueue::PC_TaskQueue(vector<PC_FileTask> taskList) : tasks(make_move_iterator(taskList.begin()), make_move_iterator(taskList.end()))
{
}

bool PC_TaskQueue::TryPopFront(PC_FileTask& task)
{
    lock_guard<mutex> lock(queueMutex);
    if (tasks.empty())
    {
        return false;
    }
    task = std::move(tasks.front());
    tasks.pop_front();
    return true;
}

bool PC_TaskQueue::IsEmpty() const
{
    lock_guard<mutex> lock(queueMutex);
    return tasks.empty();
}

size_t PC_TaskQueue::GetPendingCount() const
{
    lock_guard<mutex> lock(queueMutex);
    return tasks.size();
}
