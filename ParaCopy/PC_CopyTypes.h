#ifndef PARACOPY_COPY_TYPES_H_H
#define PARACOPY_COPY_TYPES_H_H

#include "ParaCopyPort.h"
#include "PC_Error.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)

enum class PC_CopyMode : int
{
    None = 0,
    File = 1,    // 单个大文件按区间切分给各 worker
    Folder = 2   // 目录树中的文件经由共享队列分发给各 worker
};

/*
    一次拷贝请求。Start 时被复制进 orchestrator，之后不再改变。
    数值字段为 0 表示使用配置中的默认值（见 LoadCopySettings）。
*/
struct PARACOPY_PORT PC_CopyRequest
{
    std::string sourcePath;             // UTF-8
    std::string destinationDirectory;   // UTF-8，必须是已存在的目录
    size_t workerCount = 0;             // 钳制到 [1, 64]
    uint64_t blockSize = 0;             // 钳制到 [4 KiB, 64 MiB]
    int statusIntervalMs = 0;           // 钳制到 [10, 60000]
};

enum class PC_WorkerStatus : int
{
    Success = 0,
    Failed = 1,
    Cancelled = 2
};

PARACOPY_PORT const char* PC_WorkerStatusToString(PC_WorkerStatus status);

// 单个 worker 的终态
struct PARACOPY_PORT PC_WorkerOutcome
{
    size_t workerIndex = 0;
    PC_WorkerStatus status = PC_WorkerStatus::Success;
    uint64_t bytesCopied = 0;
    size_t filesCopied = 0;     // 仅目录模式
    size_t filesFailed = 0;     // 仅目录模式
    PC_ErrorCode errorCode = PC_ErrorCode::None;   // 第一个错误
    std::string errorMessage;
};

struct PARACOPY_PORT PC_WorkerProgress
{
    uint64_t bytesCopied = 0;
    uint64_t bytesAssigned = 0;     // 文件模式为区间长度；目录模式为 0（事先未知）
    int percent = 0;                // 文件模式为区间完成度；目录模式为当前文件完成度
    bool finished = false;
};

// 状态快照，由轮询线程按固定间隔发出
struct PARACOPY_PORT PC_CopyStatus
{
    uint64_t totalExpectedBytes = 0;
    uint64_t totalCopiedBytes = 0;      // 单调不减，且不超过 totalExpectedBytes
    double bytesPerSecond = 0.0;
    double etaSeconds = 0.0;
    double elapsedSeconds = 0.0;
    size_t finishedWorkers = 0;
    std::vector<PC_WorkerProgress> workers;
};

enum class PC_CopyResultKind : int
{
    Completed = 0,
    CompletedWithErrors = 1,
    Cancelled = 2
};

PARACOPY_PORT const char* PC_CopyResultKindToString(PC_CopyResultKind kind);

struct PARACOPY_PORT PC_CopyResult
{
    PC_CopyResultKind kind = PC_CopyResultKind::Completed;
    PC_CopyMode mode = PC_CopyMode::None;
    uint64_t totalExpectedBytes = 0;
    uint64_t totalCopiedBytes = 0;
    double elapsedSeconds = 0.0;
    std::vector<PC_WorkerOutcome> outcomes;     // 按 workerIndex 排序
    std::string destinationPath;                // 目标文件或目标根目录
    std::string message;
};

// 协作式取消标志，worker 在每次块读写前检查
class PARACOPY_PORT PC_CancellationToken
{
public:
    PC_CancellationToken() : cancelled(false)
    {
    }

    void Cancel()
    {
        cancelled.store(true, std::memory_order_release);
    }

    bool IsCancelled() const
    {
        return cancelled.load(std::memory_order_acquire);
    }

    void Reset()
    {
        cancelled.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> cancelled;
};

/*
    worker -> 聚合器 的事件通道。worker 只通过该接口上报进度，不直接修改共享状态。
    实现必须是线程安全的：所有 worker 线程会并发调用。
*/
class PARACOPY_PORT PC_ProgressSink
{
public:
    virtual ~PC_ProgressSink() {}

    // 文件模式：workerIndex 刚写入 bytesDelta 字节
    virtual void OnRangeProgress(size_t workerIndex, uint64_t bytesDelta) = 0;

    // 目录模式：当前文件完成百分比（0-100）以及本次写入的字节数（可为 0）
    virtual void OnFileProgress(size_t workerIndex, int percent, uint64_t bytesDelta) = 0;

    // worker 终止，每个 worker 恰好调用一次
    virtual void OnWorkerFinished(const PC_WorkerOutcome& outcome) = 0;
};

/*
    面向调用方的进度监听接口，默认实现均为空。
    所有回调都被串行化（同一时刻最多一个回调在执行）；
    进度类回调运行在 worker 线程上，OnStatusTick / OnCopyFinished 运行在轮询线程上。
    回调中不要调用 orchestrator 的 Wait()。
    回调抛出的 std::exception 会被记录到日志后丢弃，拷贝继续进行。
*/
class PARACOPY_PORT PC_CopyListener
{
public:
    virtual ~PC_CopyListener() {}

    virtual void OnCopyStarted(PC_CopyMode mode, uint64_t totalBytes, size_t workerCount)
    {
        (void)mode;
        (void)totalBytes;
        (void)workerCount;
    }

    virtual void OnWorkerProgress(size_t workerIndex, uint64_t bytesDelta)
    {
        (void)workerIndex;
        (void)bytesDelta;
    }

    virtual void OnWorkerFilePercent(size_t workerIndex, int percent)
    {
        (void)workerIndex;
        (void)percent;
    }

    virtual void OnGlobalBytesDelta(uint64_t bytesDelta)
    {
        (void)bytesDelta;
    }

    virtual void OnWorkerFinished(const PC_WorkerOutcome& outcome)
    {
        (void)outcome;
    }

    virtual void OnStatusTick(const PC_CopyStatus& status)
    {
        (void)status;
    }

    virtual void OnCopyFinished(const PC_CopyResult& result)
    {
        (void)result;
    }
};

#pragma warning(pop)

#endif
