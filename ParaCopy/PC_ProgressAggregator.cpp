#include "PC_ProgressAggregator.h"
#include "PC_BaseTypes.h"
#include "PC_Logger.h"
#include "PC_Utility.h"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

using namespace std;

PC_ProgressAggregator::PC_ProgressAggregator(PC_CopyMode mode, uint64_t totalExpectedBytes, const vector<uint64_t>& bytesAssigned,
    int statusIntervalMs, PC_CopyListener* listener, const PC_CancellationToken& token, const string& destinationPath)
    : mode(mode), totalExpectedBytes(totalExpectedBytes), workerCount(bytesAssigned.size()),
    statusIntervalMs(statusIntervalMs > 0 ? statusIntervalMs : PC_DefaultStatusIntervalMs), listener(listener), token(token),
    destinationPath(destinationPath), reportedCopiedBytes(0), finishedCount(0), isFinished(false), isStopping(false)
{
    if (workerCount == 0)
    {
        throw invalid_argument("PC_ProgressAggregator needs at least one worker");
    }

    slots.reset(new WorkerSlot[workerCount]);
    for (size_t i = 0; i < workerCount; i++)
    {
        slots[i].bytesAssigned = bytesAssigned[i];
    }
    outcomes.reserve(workerCount);
}

PC_ProgressAggregator::~PC_ProgressAggregator()
{
    {
        lock_guard<mutex> lock(stateMutex);
        isStopping = true;
    }
    stateCond.notify_all();

    if (pollerThread.joinable())
    {
        pollerThread.join();
    }
}

void PC_ProgressAggregator::Start()
{
    if (pollerThread.joinable())
    {
        throw logic_error("PC_ProgressAggregator already started");
    }

    stopwatch.Restart();
    NotifyListener("OnCopyStarted", [this](PC_CopyListener& target) {
        target.OnCopyStarted(mode, totalExpectedBytes, workerCount);
    });
    pollerThread = thread(&PC_ProgressAggregator::PollerLoop, this);
}

void PC_ProgressAggregator::OnRangeProgress(size_t workerIndex, uint64_t bytesDelta)
{
    if (workerIndex >= workerCount)
    {
        return;
    }
    slots[workerIndex].bytesCopied.fetch_add(bytesDelta, memory_order_relaxed);

    NotifyListener("OnWorkerProgress", [workerIndex, bytesDelta](PC_CopyListener& target) {
        target.OnWorkerProgress(workerIndex, bytesDelta);
    });
}

void PC_ProgressAggregator::OnFileProgress(size_t workerIndex, int percent, uint64_t bytesDelta)
{
    if (workerIndex >= workerCount)
    {
        return;
    }
    percent = min(max(percent, 0), 100);
    slots[workerIndex].bytesCopied.fetch_add(bytesDelta, memory_order_relaxed);
    slots[workerIndex].percent.store(percent, memory_order_relaxed);

    NotifyListener("OnWorkerFilePercent", [workerIndex, percent](PC_CopyListener& target) {
        target.OnWorkerFilePercent(workerIndex, percent);
    });
    if (bytesDelta > 0)
    {
        NotifyListener("OnGlobalBytesDelta", [bytesDelta](PC_CopyListener& target) {
            target.OnGlobalBytesDelta(bytesDelta);
        });
    }
}

void PC_ProgressAggregator::OnWorkerFinished(const PC_WorkerOutcome& outcome)
{
    if (outcome.workerIndex >= workerCount)
    {
        return;
    }
    slots[outcome.workerIndex].finished.store(true, memory_order_release);

    // 计数与回调同在 listenerMutex 内，OnCopyFinished 排在所有 OnWorkerFinished 之后
    lock_guard<mutex> lock(listenerMutex);
    {
        lock_guard<mutex> stateLock(stateMutex);
        outcomes.push_back(outcome);
        finishedCount++;
    }
    stateCond.notify_all();

    if (listener)
    {
        InvokeGuarded("OnWorkerFinished", [&outcome](PC_CopyListener& target) {
            target.OnWorkerFinished(outcome);
        });
    }
}

PC_CopyStatus PC_ProgressAggregator::GetStatus() const
{
    return BuildStatus();
}

bool PC_ProgressAggregator::IsFinished() const
{
    lock_guard<mutex> lock(stateMutex);
    return isFinished;
}

PC_CopyResult PC_ProgressAggregator::Wait()
{
    unique_lock<mutex> lock(stateMutex);
    stateCond.wait(lock, [this]() {
        return isFinished;
    });
    return result;
}

size_t PC_ProgressAggregator::GetWorkerCount() const
{
    return workerCount;
}

PC_CopyStatus PC_ProgressAggregator::BuildStatus() const
{
    PC_CopyStatus status;
    status.totalExpectedBytes = totalExpectedBytes;
    status.elapsedSeconds = stopwatch.GetElapsedSeconds();
    status.workers.resize(workerCount);

    uint64_t copied = 0;
    for (size_t i = 0; i < workerCount; i++)
    {
        const WorkerSlot& slot = slots[i];
        PC_WorkerProgress& progress = status.workers[i];
        progress.bytesCopied = slot.bytesCopied.load(memory_order_relaxed);
        progress.bytesAssigned = slot.bytesAssigned;
        progress.finished = slot.finished.load(memory_order_acquire);
        if (mode == PC_CopyMode::File)
        {
            if (progress.bytesAssigned > 0)
            {
                progress.percent = static_cast<int>(min<uint64_t>(progress.bytesCopied * 100 / progress.bytesAssigned, 100));
            }
            else
            {
                progress.percent = progress.finished ? 100 : 0;
            }
        }
        else
        {
            progress.percent = slot.percent.load(memory_order_relaxed);
        }

        copied += progress.bytesCopied;
        if (progress.finished)
        {
            status.finishedWorkers++;
        }
    }

    {
        lock_guard<mutex> lock(statusMutex);
        copied = min(copied, totalExpectedBytes);
        copied = max(copied, reportedCopiedBytes);
        reportedCopiedBytes = copied;
    }
    status.totalCopiedBytes = copied;

    if (status.elapsedSeconds > 0.0)
    {
        status.bytesPerSecond = static_cast<double>(copied) / status.elapsedSeconds;
    }
    if (status.bytesPerSecond > 0.0)
    {
        status.etaSeconds = static_cast<double>(totalExpectedBytes - copied) / status.bytesPerSecond;
    }
    return status;
}

void PC_ProgressAggregator::EmitStatusTick(const PC_CopyStatus& status)
{
    NotifyListener("OnStatusTick", [&status](PC_CopyListener& target) {
        target.OnStatusTick(status);
    });
}

PC_CopyResult PC_ProgressAggregator::BuildResult(const PC_CopyStatus& finalStatus)
{
    PC_CopyResult copyResult;
    copyResult.mode = mode;
    copyResult.totalExpectedBytes = totalExpectedBytes;
    copyResult.elapsedSeconds = finalStatus.elapsedSeconds;
    copyResult.destinationPath = destinationPath;
    {
        lock_guard<mutex> lock(stateMutex);
        copyResult.outcomes = outcomes;
    }
    sort(copyResult.outcomes.begin(), copyResult.outcomes.end(), [](const PC_WorkerOutcome& a, const PC_WorkerOutcome& b) {
        return a.workerIndex < b.workerIndex;
    });

    // 以 worker 自报的字节数核对，不受快照钳制影响
    uint64_t copied = 0;
    size_t failedCount = 0;
    size_t cancelledCount = 0;
    const PC_WorkerOutcome* firstFailure = nullptr;
    for (size_t i = 0; i < copyResult.outcomes.size(); i++)
    {
        const PC_WorkerOutcome& outcome = copyResult.outcomes[i];
        copied += outcome.bytesCopied;
        if (outcome.status == PC_WorkerStatus::Failed)
        {
            failedCount++;
            if (!firstFailure)
            {
                firstFailure = &outcome;
            }
        }
        else if (outcome.status == PC_WorkerStatus::Cancelled)
        {
            cancelledCount++;
        }
    }
    copyResult.totalCopiedBytes = copied;

    ostringstream oss;
    if (token.IsCancelled() && cancelledCount > 0)
    {
        copyResult.kind = PC_CopyResultKind::Cancelled;
        oss << "cancelled after " << PC_FormatByteSize(static_cast<double>(copied)) << " of "
            << PC_FormatByteSize(static_cast<double>(totalExpectedBytes));
    }
    else if (failedCount == 0 && cancelledCount == 0 && copied == totalExpectedBytes)
    {
        copyResult.kind = PC_CopyResultKind::Completed;
        oss << "copied " << PC_FormatByteSize(static_cast<double>(copied)) << " in "
            << PC_FormatDuration(copyResult.elapsedSeconds);
    }
    else
    {
        copyResult.kind = PC_CopyResultKind::CompletedWithErrors;
        oss << "copied " << copied << " of " << totalExpectedBytes << " bytes";
        if (failedCount > 0)
        {
            oss << "; " << failedCount << " worker(s) failed, first error: " << firstFailure->errorMessage;
        }
    }
    copyResult.message = oss.str();
    return copyResult;
}

void PC_ProgressAggregator::PollerLoop()
{
    const chrono::milliseconds interval(statusIntervalMs);

    unique_lock<mutex> lock(stateMutex);
    for (;;)
    {
        const bool wokeEarly = stateCond.wait_for(lock, interval, [this]() {
            return isStopping || finishedCount == workerCount;
        });
        if (isStopping)
        {
            return;
        }
        if (wokeEarly)
        {
            break;
        }

        lock.unlock();
        EmitStatusTick(BuildStatus());
        lock.lock();
    }
    lock.unlock();

    const PC_CopyStatus finalStatus = BuildStatus();
    EmitStatusTick(finalStatus);

    const PC_CopyResult finalResult = BuildResult(finalStatus);
    if (finalResult.kind == PC_CopyResultKind::Completed)
    {
        PC_LOG_INFO("Copy finished: " + finalResult.message);
    }
    else
    {
        PC_LOG_WARNING(string("Copy finished (") + PC_CopyResultKindToString(finalResult.kind) + "): " + finalResult.message);
    }

    NotifyListener("OnCopyFinished", [&finalResult](PC_CopyListener& target) {
        target.OnCopyFinished(finalResult);
    });

    lock.lock();
    result = finalResult;
    isFinished = true;
    lock.unlock();
    stateCond.notify_all();
}

void PC_ProgressAggregator::NotifyListener(const char* callbackName, const function<void(PC_CopyListener&)>& callback)
{
    if (!listener)
    {
        return;
    }
    lock_guard<mutex> lock(listenerMutex);
    InvokeGuarded(callbackName, callback);
}

// 调用方须已持有 listenerMutex
void PC_ProgressAggregator::InvokeGuarded(const char* callbackName, const function<void(PC_CopyListener&)>& callback)
{
    try
    {
        callback(*listener);
    }
    catch (const exception& e)
    {
        PC_LOG_ERROR(string("Listener ") + callbackName + " threw: " + e.what());
    }
}
