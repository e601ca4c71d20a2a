#include "PC_CopyWorker.h"
#include "PC_File.h"
#include "PC_TestHelpers.h"
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace std;

namespace
{
    // 直接记录 worker 的回调，不经过聚合器
    class FakeSink : public PC_ProgressSink
    {
    public:
        void OnRangeProgress(size_t workerIndex, uint64_t bytesDelta) override
        {
            lock_guard<mutex> lock(mtx);
            lastWorker = workerIndex;
            rangeBytes += bytesDelta;
            rangeEvents++;
        }

        void OnFileProgress(size_t workerIndex, int percent, uint64_t bytesDelta) override
        {
            lock_guard<mutex> lock(mtx);
            lastWorker = workerIndex;
            fileBytes += bytesDelta;
            percents.push_back(percent);
        }

        void OnWorkerFinished(const PC_WorkerOutcome& outcome) override
        {
            lock_guard<mutex> lock(mtx);
            finished.push_back(outcome);
        }

        mutex mtx;
        size_t lastWorker = 0;
        uint64_t rangeBytes = 0;
        size_t rangeEvents = 0;
        uint64_t fileBytes = 0;
        vector<int> percents;
        vector<PC_WorkerOutcome> finished;
    };

    void CreateSizedFile(const string& path, uint64_t size)
    {
        PC_File file(path, PC_File::OpenMode::WriteTruncate);
        file.Resize(size);
        file.Close();
    }

    PC_FileTask MakeTask(const PC_TempDir& temp, const string& relativePath, uint64_t size)
    {
        PC_FileTask task;
        task.sourcePath = temp.Join("src/" + relativePath);
        task.destinationPath = temp.Join("dst/" + relativePath);
        task.relativePath = relativePath;
        task.fileSize = size;
        return task;
    }
}

TEST(PC_CopyWorkerTest, RangeWorkerCopiesOnlyItsRange)
{
    PC_TempDir temp;
    const string src = temp.Join("src.bin");
    const string dst = temp.Join("dst.bin");
    const vector<unsigned char> bytes = PC_WriteRandomFile(src, 10000, 11);
    CreateSizedFile(dst, 10000);

    PC_FileRange range;
    range.workerIndex = 1;
    range.startOffset = 3000;
    range.endOffset = 7001;

    FakeSink sink;
    PC_CancellationToken token;
    PC_RangeCopyWorker worker(src, dst, range, 1000, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Success);
    EXPECT_EQ(outcome.workerIndex, 1u);
    EXPECT_EQ(outcome.bytesCopied, 4001u);
    EXPECT_EQ(sink.rangeBytes, 4001u);
    EXPECT_EQ(sink.rangeEvents, 5u);
    EXPECT_EQ(sink.lastWorker, 1u);
    ASSERT_EQ(sink.finished.size(), 1u);

    const vector<unsigned char> copied = PC_ReadAllBytes(dst);
    ASSERT_EQ(copied.size(), 10000u);
    for (size_t i = 0; i < copied.size(); i++)
    {
        const unsigned char expected = (i >= 3000 && i < 7001) ? bytes[i] : 0;
        ASSERT_EQ(copied[i], expected) << "offset " << i;
    }
}

TEST(PC_CopyWorkerTest, EmptyRangeSucceedsWithoutTouchingFiles)
{
    PC_TempDir temp;
    PC_FileRange range;
    range.workerIndex = 0;
    range.startOffset = 0;
    range.endOffset = 0;

    FakeSink sink;
    PC_CancellationToken token;
    PC_RangeCopyWorker worker(temp.Join("missing.bin"), temp.Join("also-missing.bin"), range, 4096, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Success);
    EXPECT_EQ(outcome.bytesCopied, 0u);
    EXPECT_EQ(sink.finished.size(), 1u);
}

// 源文件在区间读完之前被截断
TEST(PC_CopyWorkerTest, RangeWorkerFailsOnTruncatedSource)
{
    PC_TempDir temp;
    const string src = temp.Join("src.bin");
    const string dst = temp.Join("dst.bin");
    PC_WriteRandomFile(src, 5000, 3);
    CreateSizedFile(dst, 8000);

    PC_FileRange range;
    range.workerIndex = 0;
    range.startOffset = 4000;
    range.endOffset = 8000;

    FakeSink sink;
    PC_CancellationToken token;
    PC_RangeCopyWorker worker(src, dst, range, 4096, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Failed);
    EXPECT_EQ(outcome.errorCode, PC_ErrorCode::UnexpectedEndOfFile);
    EXPECT_EQ(outcome.bytesCopied, 1000u);
    EXPECT_FALSE(outcome.errorMessage.empty());
    EXPECT_EQ(sink.finished.size(), 1u);
}

TEST(PC_CopyWorkerTest, RangeWorkerReportsMissingSourceAsFailure)
{
    PC_TempDir temp;
    const string dst = temp.Join("dst.bin");
    CreateSizedFile(dst, 100);

    PC_FileRange range;
    range.workerIndex = 2;
    range.startOffset = 0;
    range.endOffset = 100;

    FakeSink sink;
    PC_CancellationToken token;
    PC_RangeCopyWorker worker(temp.Join("gone.bin"), dst, range, 4096, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Failed);
    EXPECT_EQ(outcome.errorCode, PC_ErrorCode::IOFailure);
    ASSERT_EQ(sink.finished.size(), 1u);
    EXPECT_EQ(sink.finished[0].workerIndex, 2u);
}

TEST(PC_CopyWorkerTest, RangeWorkerStopsWhenCancelled)
{
    PC_TempDir temp;
    const string src = temp.Join("src.bin");
    const string dst = temp.Join("dst.bin");
    PC_WriteRandomFile(src, 4096, 5);
    CreateSizedFile(dst, 4096);

    PC_FileRange range;
    range.workerIndex = 0;
    range.startOffset = 0;
    range.endOffset = 4096;

    FakeSink sink;
    PC_CancellationToken token;
    token.Cancel();
    PC_RangeCopyWorker worker(src, dst, range, 1024, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Cancelled);
    EXPECT_EQ(outcome.errorCode, PC_ErrorCode::Cancelled);
    EXPECT_EQ(outcome.bytesCopied, 0u);
    EXPECT_EQ(sink.finished.size(), 1u);
}

TEST(PC_CopyWorkerTest, QueueWorkerCopiesEveryTask)
{
    PC_TempDir temp;
    vector<PC_FileTask> tasks;
    tasks.push_back(MakeTask(temp, "a.bin", 2500));
    tasks.push_back(MakeTask(temp, "sub/deeper/b.bin", 1000));
    tasks.push_back(MakeTask(temp, "empty.bin", 0));
    vector<vector<unsigned char>> contents;
    for (const PC_FileTask& task : tasks)
    {
        contents.push_back(PC_WriteRandomFile(task.sourcePath, task.fileSize, static_cast<uint32_t>(task.fileSize)));
    }

    PC_TaskQueue queue(tasks);
    FakeSink sink;
    PC_CancellationToken token;
    PC_QueueCopyWorker worker(3, queue, 1000, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Success);
    EXPECT_EQ(outcome.filesCopied, 3u);
    EXPECT_EQ(outcome.filesFailed, 0u);
    EXPECT_EQ(outcome.bytesCopied, 3500u);
    EXPECT_EQ(sink.fileBytes, 3500u);
    EXPECT_EQ(sink.lastWorker, 3u);
    EXPECT_TRUE(queue.IsEmpty());

    // a.bin: 40, 80, 100；b.bin: 100；empty.bin: 100
    const vector<int> expectedPercents = { 40, 80, 100, 100, 100 };
    EXPECT_EQ(sink.percents, expectedPercents);

    for (size_t i = 0; i < tasks.size(); i++)
    {
        EXPECT_EQ(PC_ReadAllBytes(tasks[i].destinationPath), contents[i]) << tasks[i].relativePath;
    }
}

TEST(PC_CopyWorkerTest, QueueWorkerContinuesAfterFileFailure)
{
    PC_TempDir temp;
    vector<PC_FileTask> tasks;
    tasks.push_back(MakeTask(temp, "missing.bin", 10));
    tasks.push_back(MakeTask(temp, "ok.bin", 20));
    PC_WriteRandomFile(tasks[1].sourcePath, 20, 9);

    PC_TaskQueue queue(tasks);
    FakeSink sink;
    PC_CancellationToken token;
    PC_QueueCopyWorker worker(0, queue, 4096, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Failed);
    EXPECT_EQ(outcome.filesCopied, 1u);
    EXPECT_EQ(outcome.filesFailed, 1u);
    EXPECT_EQ(outcome.errorCode, PC_ErrorCode::IOFailure);
    EXPECT_NE(outcome.errorMessage.find("missing.bin"), string::npos);
    EXPECT_TRUE(PC_IsFileExists(tasks[1].destinationPath));
}

TEST(PC_CopyWorkerTest, QueueWorkerFailsFileShorterThanScanned)
{
    PC_TempDir temp;
    PC_FileTask task = MakeTask(temp, "shrunk.bin", 5000);
    PC_WriteRandomFile(task.sourcePath, 1200, 4);

    PC_TaskQueue queue(vector<PC_FileTask>(1, task));
    FakeSink sink;
    PC_CancellationToken token;
    PC_QueueCopyWorker worker(0, queue, 4096, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Failed);
    EXPECT_EQ(outcome.errorCode, PC_ErrorCode::UnexpectedEndOfFile);
    EXPECT_EQ(outcome.filesFailed, 1u);
    EXPECT_EQ(outcome.bytesCopied, 1200u);
}

TEST(PC_CopyWorkerTest, QueueWorkerCancelledLeavesRemainingTasks)
{
    PC_TempDir temp;
    vector<PC_FileTask> tasks;
    tasks.push_back(MakeTask(temp, "one.bin", 10));
    tasks.push_back(MakeTask(temp, "two.bin", 10));

    PC_TaskQueue queue(tasks);
    FakeSink sink;
    PC_CancellationToken token;
    token.Cancel();
    PC_QueueCopyWorker worker(0, queue, 4096, sink, token);
    const PC_WorkerOutcome outcome = worker.Run();

    EXPECT_EQ(outcome.status, PC_WorkerStatus::Cancelled);
    EXPECT_EQ(outcome.filesCopied, 0u);
    EXPECT_FALSE(PC_IsPathExists(tasks[0].destinationPath));
    EXPECT_EQ(sink.finished.size(), 1u);
}

TEST(PC_CopyWorkerTest, QueueWorkerOnEmptyQueueSucceeds)
{
    PC_TaskQueue queue;
    FakeSink sink;
    PC_CancellationToken token;
    token.Cancel();
    PC_QueueCopyWorker worker(0, queue, 4096, sink, token);

    // 没有剩余任务时，即使已取消也记为成功
    EXPECT_EQ(worker.Run().status, PC_WorkerStatus::Success);
}

TEST(PC_CopyWorkerTest, SharedQueueSplitsWorkAcrossWorkers)
{
    PC_TempDir temp;
    vector<PC_FileTask> tasks;
    for (int i = 0; i < 40; i++)
    {
        tasks.push_back(MakeTask(temp, "d" + to_string(i % 4) + "/f" + to_string(i) + ".bin", 3000 + i));
        PC_WriteRandomFile(tasks.back().sourcePath, tasks.back().fileSize, static_cast<uint32_t>(i));
    }

    PC_TaskQueue queue(tasks);
    FakeSink sink;
    PC_CancellationToken token;
    vector<unique_ptr<PC_QueueCopyWorker>> workers;
    vector<thread> threads;
    for (size_t i = 0; i < 4; i++)
    {
        workers.emplace_back(new PC_QueueCopyWorker(i, queue, 4096, sink, token));
    }
    for (size_t i = 0; i < workers.size(); i++)
    {
        PC_QueueCopyWorker* worker = workers[i].get();
        threads.emplace_back([worker]() {
            worker->Run();
        });
    }
    for (thread& th : threads)
    {
        th.join();
    }

    size_t filesCopied = 0;
    for (const PC_WorkerOutcome& outcome : sink.finished)
    {
        EXPECT_EQ(outcome.status, PC_WorkerStatus::Success);
        filesCopied += outcome.filesCopied;
    }
    EXPECT_EQ(sink.finished.size(), 4u);
    EXPECT_EQ(filesCopied, tasks.size());
    for (const PC_FileTask& task : tasks)
    {
        EXPECT_EQ(PC_ReadAllBytes(task.destinationPath), PC_ReadAllBytes(task.sourcePath)) << task.relativePath;
    }
}
