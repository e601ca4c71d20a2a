#ifndef PARACOPY_COPY_WORKER_H_H
#define PARACOPY_COPY_WORKER_H_H

#include "ParaCopyPort.h"
#include "PC_BaseTypes.h"
#include "PC_CopyTypes.h"
#include "PC_RangePartitioner.h"
#include "PC_TaskQueue.h"
#include <cstddef>
#include <cstdint>
#include <string>

#pragma warning(push)
#pragma warning(disable : 4251)

/*
    PC_CopyWorker：一个拷贝单元的执行体，运行在线程池的某个线程上。

    Run() 负责把子类 DoRun() 的结果（包括抛出的异常）统一转为 PC_WorkerOutcome，
    并在返回前恰好调用一次 sink.OnWorkerFinished。Run() 不抛异常。
    sink 与 token 的生命周期必须长于 worker。
*/
class PARACOPY_PORT PC_CopyWorker
{
public:
    PC_CopyWorker(size_t workerIndex, uint64_t blockSize, PC_ProgressSink& sink, const PC_CancellationToken& token);
    virtual ~PC_CopyWorker();

    PC_CopyWorker(const PC_CopyWorker&) = delete;
    PC_CopyWorker& operator=(const PC_CopyWorker&) = delete;

    PC_WorkerOutcome Run();

    size_t GetWorkerIndex() const;

protected:
    // 子类在 outcome 中填写终态；抛出的 PC_IOError 会被 Run() 记为 Failed
    virtual void DoRun(PC_WorkerOutcome& outcome) = 0;

    // 按需分配一次，之后在该 worker 的所有读写中复用
    unsigned char* GetBuffer(size_t size);

    const size_t workerIndex;
    const uint64_t blockSize;
    PC_ProgressSink& sink;
    const PC_CancellationToken& token;

private:
    PC_ByteBuffer buffer;
};

/*
    文件模式：把源文件的 [startOffset, endOffset) 写到目标文件的相同偏移处。
    目标文件必须已由调用方创建并设为源文件大小，这里以读写方式打开，不截断。
    源文件在区间读完前到达 EOF 时记为 Failed / UnexpectedEndOfFile。
*/
class PARACOPY_PORT PC_RangeCopyWorker : public PC_CopyWorker
{
public:
    PC_RangeCopyWorker(const std::string& sourcePath, const std::string& destinationPath, const PC_FileRange& range,
        uint64_t blockSize, PC_ProgressSink& sink, const PC_CancellationToken& token);

    const PC_FileRange& GetRange() const;

protected:
    void DoRun(PC_WorkerOutcome& outcome) override;

private:
    std::string sourcePath;
    std::string destinationPath;
    PC_FileRange range;
};

/*
    目录模式：反复从共享队列取任务，逐个完整拷贝文件，直到队列为空或收到取消。
    单个文件失败只记录（filesFailed 与首个错误），然后继续下一个任务。
*/
class PARACOPY_PORT PC_QueueCopyWorker : public PC_CopyWorker
{
public:
    PC_QueueCopyWorker(size_t workerIndex, PC_TaskQueue& queue, uint64_t blockSize, PC_ProgressSink& sink,
        const PC_CancellationToken& token);

protected:
    void DoRun(PC_WorkerOutcome& outcome) override;

private:
    // 返回 false 表示中途被取消（目标文件保留已写入的部分）
    bool CopyOneFile(const PC_FileTask& task, PC_WorkerOutcome& outcome);

    PC_TaskQueue& queue;
};

#pragma warning(pop)

#endif
