#include "PC_CopyWorker.h"
#include "PC_File.h"
#include "PC_FileSystem.h"
#include "PC_Logger.h"
#include <algorithm>

using namespace std;

namespace internal
{
    static string WorkerTag(size_t workerIndex)
    {
        return "[worker " + to_string(workerIndex) + "] ";
    }

    static void RecordFirstError(PC_WorkerOutcome& outcome, PC_ErrorCode code, const string& message)
    {
        if (outcome.errorCode != PC_ErrorCode::None)
        {
            return;
        }
        outcome.errorCode = code;
        outcome.errorMessage = message;
    }

    static int ToPercent(uint64_t done, uint64_t total)
    {
        if (total == 0)
        {
            return 100;
        }
        return static_cast<int>((done * 100) / total);
    }
}

PC_CopyWorker::PC_CopyWorker(size_t workerIndex, uint64_t blockSize, PC_ProgressSink& sink, const PC_CancellationToken& token)
    : workerIndex(workerIndex), blockSize(blockSize == 0 ? PC_DefaultBlockSize : blockSize), sink(sink), token(token)
{
}

PC_CopyWorker::~PC_CopyWorker()
{
}

PC_WorkerOutcome PC_CopyWorker::Run()
{
    PC_WorkerOutcome outcome;
    outcome.workerIndex = workerIndex;
    outcome.status = PC_WorkerStatus::Success;

    try
    {
        DoRun(outcome);
    }
    catch (const PC_IOError& e)
    {
        outcome.status = PC_WorkerStatus::Failed;
        internal::RecordFirstError(outcome, e.GetCode(), e.what());
        PC_LOG_ERROR(internal::WorkerTag(workerIndex) + e.what());
    }
    catch (const std::exception& e)
    {
        // 例如缓冲区分配失败
        outcome.status = PC_WorkerStatus::Failed;
        internal::RecordFirstError(outcome, PC_ErrorCode::IOFailure, e.what());
        PC_LOG_ERROR(internal::WorkerTag(workerIndex) + e.what());
    }

    PC_LOG_DEBUG(internal::WorkerTag(workerIndex) + "finished: " + PC_WorkerStatusToString(outcome.status) +
        ", " + to_string(outcome.bytesCopied) + " bytes");
    sink.OnWorkerFinished(outcome);
    return outcome;
}

size_t PC_CopyWorker::GetWorkerIndex() const
{
    return workerIndex;
}

unsigned char* PC_CopyWorker::GetBuffer(size_t size)
{
    if (buffer.size() < size)
    {
        buffer.resize(size);
    }
    return buffer.data();
}

PC_RangeCopyWorker::PC_RangeCopyWorker(const string& sourcePath, const string& destinationPath, const PC_FileRange& range,
    uint64_t blockSize, PC_ProgressSink& sink, const PC_CancellationToken& token)
    : PC_CopyWorker(range.workerIndex, blockSize, sink, token), sourcePath(sourcePath), destinationPath(destinationPath),
    range(range)
{
}

const PC_FileRange& PC_RangeCopyWorker::GetRange() const
{
    return range;
}

void PC_RangeCopyWorker::DoRun(PC_WorkerOutcome& outcome)
{
    uint64_t remaining = range.Length();
    if (remaining == 0)
    {
        return;
    }

    PC_File source(sourcePath, PC_File::OpenMode::Read);
    PC_File destination(destinationPath, PC_File::OpenMode::ReadWriteExisting);

    const size_t chunkSize = static_cast<size_t>(min(blockSize, remaining));
    unsigned char* data = GetBuffer(chunkSize);

    uint64_t offset = range.startOffset;
    while (remaining > 0)
    {
        if (token.IsCancelled())
        {
            outcome.status = PC_WorkerStatus::Cancelled;
            internal::RecordFirstError(outcome, PC_ErrorCode::Cancelled, "cancelled at offset " + to_string(offset));
            return;
        }

        const size_t want = static_cast<size_t>(min<uint64_t>(chunkSize, remaining));
        const size_t got = source.ReadAt(offset, data, want);
        if (got == 0)
        {
            outcome.status = PC_WorkerStatus::Failed;
            const string message = "unexpected end of file: " + sourcePath + " at offset " + to_string(offset) +
                ", " + to_string(remaining) + " bytes of range missing";
            internal::RecordFirstError(outcome, PC_ErrorCode::UnexpectedEndOfFile, message);
            PC_LOG_ERROR(internal::WorkerTag(workerIndex) + message);
            return;
        }

        destination.WriteAt(offset, data, got);
        offset += got;
        remaining -= got;
        outcome.bytesCopied += got;
        sink.OnRangeProgress(workerIndex, got);
    }

    destination.Close();
}

PC_QueueCopyWorker::PC_QueueCopyWorker(size_t workerIndex, PC_TaskQueue& queue, uint64_t blockSize, PC_ProgressSink& sink,
    const PC_CancellationToken& token) : PC_CopyWorker(workerIndex, blockSize, sink, token), queue(queue)
{
}

void PC_QueueCopyWorker::DoRun(PC_WorkerOutcome& outcome)
{
    bool cancelled = false;
    PC_FileTask task;
    while (queue.TryPopFront(task))
    {
        if (token.IsCancelled())
        {
            cancelled = true;
            break;
        }

        try
        {
            if (!CopyOneFile(task, outcome))
            {
                cancelled = true;
                break;
            }
            outcome.filesCopied++;
        }
        catch (const PC_IOError& e)
        {
            outcome.filesFailed++;
            internal::RecordFirstError(outcome, e.GetCode(), e.what());
            PC_LOG_ERROR(internal::WorkerTag(workerIndex) + "copy failed for " + task.relativePath + ": " + e.what());
        }
    }

    if (cancelled)
    {
        outcome.status = PC_WorkerStatus::Cancelled;
        internal::RecordFirstError(outcome, PC_ErrorCode::Cancelled, "cancelled while copying " + task.relativePath);
    }
    else if (outcome.filesFailed > 0)
    {
        outcome.status = PC_WorkerStatus::Failed;
    }
}

bool PC_QueueCopyWorker::CopyOneFile(const PC_FileTask& task, PC_WorkerOutcome& outcome)
{
    const string parentDir = PC_GetDirectoryPath(task.destinationPath);
    if (!parentDir.empty() && !PC_CreateDirectory(parentDir))
    {
        throw PC_IOError(PC_ErrorCode::IOFailure, parentDir, "create directory", 0);
    }

    PC_File source(task.sourcePath, PC_File::OpenMode::Read);
    PC_File destination(task.destinationPath, PC_File::OpenMode::WriteTruncate);

    if (task.fileSize == 0)
    {
        destination.Close();
        sink.OnFileProgress(workerIndex, 100, 0);
        return true;
    }

    const size_t chunkSize = static_cast<size_t>(min(blockSize, task.fileSize));
    unsigned char* data = GetBuffer(chunkSize);

    uint64_t offset = 0;
    while (offset < task.fileSize)
    {
        if (token.IsCancelled())
        {
            return false;
        }

        const size_t want = static_cast<size_t>(min<uint64_t>(chunkSize, task.fileSize - offset));
        const size_t got = source.ReadAt(offset, data, want);
        if (got == 0)
        {
            throw PC_IOError(PC_ErrorCode::UnexpectedEndOfFile, task.sourcePath,
                "read (unexpected end of file at offset " + to_string(offset) + ")", 0);
        }

        destination.WriteAt(offset, data, got);
        offset += got;
        outcome.bytesCopied += got;
        sink.OnFileProgress(workerIndex, internal::ToPercent(offset, task.fileSize), got);
    }

    destination.Close();
    return true;
}
