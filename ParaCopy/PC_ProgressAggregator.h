#ifndef PARACOPY_PROGRESS_AGGREGATOR_H_H
#define PARACOPY_PROGRESS_AGGREGATOR_H_H

#include "ParaCopyPort.h"
#include "PC_CopyTypes.h"
#include "PC_Timer.h"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)

/*
    PC_ProgressAggregator：worker 事件的唯一消费者。

    - 每个 worker 一个原子字节计数器，状态快照时求和；worker 之间没有共享锁。
    - 每个事件都在 listenerMutex 下转发给 listener，listener 一次只收到一个回调。
    - 轮询线程按固定间隔发出 OnStatusTick，与事件到达无关。
    - 所有 worker 都上报终态后，轮询线程发出最后一次状态、核对已拷贝与应拷贝字节数，
      然后恰好一次调用 OnCopyFinished。
*/
class PARACOPY_PORT PC_ProgressAggregator : public PC_ProgressSink
{
public:
    /**
     * @param bytesAssigned 每个 worker 预先分配的字节数（文件模式为区间长度，目录模式全为 0），
     *                      其长度即 worker 数量，必须大于 0。
     */
    PC_ProgressAggregator(PC_CopyMode mode, uint64_t totalExpectedBytes, const std::vector<uint64_t>& bytesAssigned,
        int statusIntervalMs, PC_CopyListener* listener, const PC_CancellationToken& token,
        const std::string& destinationPath);
    ~PC_ProgressAggregator() override;

    PC_ProgressAggregator(const PC_ProgressAggregator&) = delete;
    PC_ProgressAggregator& operator=(const PC_ProgressAggregator&) = delete;

    // 计时清零，发出 OnCopyStarted 并启动轮询线程；只能调用一次
    void Start();

    void OnRangeProgress(size_t workerIndex, uint64_t bytesDelta) override;
    void OnFileProgress(size_t workerIndex, int percent, uint64_t bytesDelta) override;
    void OnWorkerFinished(const PC_WorkerOutcome& outcome) override;

    PC_CopyStatus GetStatus() const;

    bool IsFinished() const;

    // 阻塞直到 OnCopyFinished 已发出；可重复调用
    PC_CopyResult Wait();

    size_t GetWorkerCount() const;

private:
    struct WorkerSlot
    {
        std::atomic<uint64_t> bytesCopied{ 0 };
        std::atomic<int> percent{ 0 };
        std::atomic<bool> finished{ false };
        uint64_t bytesAssigned = 0;
    };

    void PollerLoop();
    PC_CopyStatus BuildStatus() const;
    PC_CopyResult BuildResult(const PC_CopyStatus& finalStatus);
    void EmitStatusTick(const PC_CopyStatus& status);

    // 在 listenerMutex 下调用回调；回调抛出的 std::exception 只记日志，不打断拷贝
    void NotifyListener(const char* callbackName, const std::function<void(PC_CopyListener&)>& callback);
    void InvokeGuarded(const char* callbackName, const std::function<void(PC_CopyListener&)>& callback);

    const PC_CopyMode mode;
    const uint64_t totalExpectedBytes;
    const size_t workerCount;
    const int statusIntervalMs;
    PC_CopyListener* const listener;
    const PC_CancellationToken& token;
    const std::string destinationPath;

    std::unique_ptr<WorkerSlot[]> slots;
    PC_Stopwatch stopwatch;

    std::mutex listenerMutex;

    // 保证多次快照之间 totalCopiedBytes 单调不减
    mutable std::mutex statusMutex;
    mutable uint64_t reportedCopiedBytes;

    mutable std::mutex stateMutex;
    std::condition_variable stateCond;
    std::vector<PC_WorkerOutcome> outcomes;
    size_t finishedCount;
    bool isFinished;
    bool isStopping;
    PC_CopyResult result;

    std::thread pollerThread;
};

#pragma warning(pop)

#endif
