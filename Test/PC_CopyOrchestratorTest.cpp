#include "PC_BaseTypes.h"
#include "PC_CopyOrchestrator.h"
#include "PC_TestHelpers.h"
#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <thread>
#include <tuple>

#if !defined(_WIN32)
#   include <sys/stat.h>
#   include <unistd.h>
#endif

using namespace std;

namespace
{
    const uint64_t kBlock = 4096;

    PC_CopyRequest MakeRequest(const string& source, const string& destination, size_t workerCount)
    {
        PC_CopyRequest request;
        request.sourcePath = source;
        request.destinationDirectory = destination;
        request.workerCount = workerCount;
        request.blockSize = kBlock;
        request.statusIntervalMs = 10;
        return request;
    }

    PC_ErrorCode StartAndCatch(PC_CopyOrchestrator& orchestrator, const PC_CopyRequest& request)
    {
        try
        {
            orchestrator.Start(request);
        }
        catch (const PC_CopyError& e)
        {
            return e.GetCode();
        }
        return PC_ErrorCode::None;
    }

    // 在第一个进度回调处阻塞 worker，直到测试线程放行
    class GateListener : public PC_RecordingListener
    {
    public:
        void OnWorkerProgress(size_t workerIndex, uint64_t bytesDelta) override
        {
            WaitGate();
            PC_RecordingListener::OnWorkerProgress(workerIndex, bytesDelta);
        }

        void OnWorkerFilePercent(size_t workerIndex, int percent) override
        {
            WaitGate();
            PC_RecordingListener::OnWorkerFilePercent(workerIndex, percent);
        }

        bool WaitUntilBlocked()
        {
            unique_lock<mutex> lock(gateMutex);
            return gateCv.wait_for(lock, chrono::seconds(10), [this]() {
                return isBlocked;
            });
        }

        void Release()
        {
            {
                lock_guard<mutex> lock(gateMutex);
                isReleased = true;
            }
            gateCv.notify_all();
        }

    private:
        void WaitGate()
        {
            unique_lock<mutex> lock(gateMutex);
            isBlocked = true;
            gateCv.notify_all();
            gateCv.wait(lock, [this]() {
                return isReleased;
            });
        }

        mutex gateMutex;
        condition_variable gateCv;
        bool isBlocked = false;
        bool isReleased = false;
    };
}

class PC_FileCopyRoundTripTest : public ::testing::TestWithParam<tuple<uint64_t, size_t>>
{
};

TEST_P(PC_FileCopyRoundTripTest, CopiesByteForByte)
{
    const uint64_t size = get<0>(GetParam());
    const size_t workerCount = get<1>(GetParam());

    PC_TempDir temp;
    const string src = temp.Join("in/data.bin");
    const vector<unsigned char> bytes = PC_WriteRandomFile(src, size, static_cast<uint32_t>(size + workerCount));
    PC_CreateDirectory(temp.Join("out"));

    PC_RecordingListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(src, temp.Join("out"), workerCount), &listener);
    EXPECT_EQ(orchestrator.GetMode(), PC_CopyMode::File);
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed) << result.message;
    EXPECT_EQ(result.totalExpectedBytes, size);
    EXPECT_EQ(result.totalCopiedBytes, size);
    EXPECT_EQ(result.outcomes.size(), workerCount);
    EXPECT_EQ(result.destinationPath, temp.Join("out/data.bin"));
    EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/data.bin")), bytes);

    lock_guard<mutex> lock(listener.mtx);
    EXPECT_EQ(listener.startedCount, 1);
    EXPECT_EQ(listener.startedMode, PC_CopyMode::File);
    EXPECT_EQ(listener.startedTotalBytes, size);
    EXPECT_EQ(listener.rangeBytes, size);
    EXPECT_EQ(listener.finishedCount, 1);
    EXPECT_EQ(listener.workerOutcomes.size(), workerCount);
    EXPECT_FALSE(listener.workerFinishedAfterCompletion);
    EXPECT_FALSE(listener.overlapDetected.load());
}

INSTANTIATE_TEST_SUITE_P(SizesAndWorkers, PC_FileCopyRoundTripTest,
    ::testing::Combine(::testing::Values(0ull, 1ull, kBlock - 1, kBlock, kBlock + 1, 3ull * 1024 * 1024 + 17),
        ::testing::Values(size_t(1), size_t(2), size_t(4), size_t(16))));

TEST(PC_CopyOrchestratorTest, TenMiBRangesMatchPartition)
{
    PC_TempDir temp;
    const string src = temp.Join("big.bin");
    const vector<unsigned char> bytes = PC_WriteRandomFile(src, 10485760, 99);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyOrchestrator orchestrator;
    PC_CopyRequest request = MakeRequest(src, temp.Join("out"), 4);
    request.blockSize = 1024 * 1024;
    orchestrator.Start(request);

    const vector<PC_FileRange> ranges = orchestrator.GetRanges();
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0].endOffset, 2621440u);
    EXPECT_EQ(ranges[1].endOffset, 5242880u);
    EXPECT_EQ(ranges[2].endOffset, 7864320u);
    EXPECT_EQ(ranges[3].endOffset, 10485760u);

    const PC_CopyResult result = orchestrator.Wait();
    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed);
    for (const PC_WorkerOutcome& outcome : result.outcomes)
    {
        EXPECT_EQ(outcome.bytesCopied, 2621440u);
    }
    EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/big.bin")), bytes);
}

TEST(PC_CopyOrchestratorTest, RequestValuesAreClamped)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("s.bin"), 100, 1);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyRequest request = MakeRequest(temp.Join("s.bin"), temp.Join("out"), 1000);
    request.blockSize = 1;
    request.statusIntervalMs = 1;

    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(request);
    const PC_CopyRequest effective = orchestrator.GetEffectiveRequest();
    EXPECT_EQ(effective.workerCount, PC_MaxWorkerCount);
    EXPECT_EQ(effective.blockSize, PC_MinBlockSize);
    EXPECT_EQ(effective.statusIntervalMs, PC_MinStatusIntervalMs);
    EXPECT_EQ(orchestrator.Wait().kind, PC_CopyResultKind::Completed);
}

TEST(PC_CopyOrchestratorTest, OverwritesLongerExistingFile)
{
    PC_TempDir temp;
    const vector<unsigned char> bytes = PC_WriteRandomFile(temp.Join("s.bin"), 5000, 1);
    PC_WriteRandomFile(temp.Join("out/s.bin"), 50000, 2);

    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 3));
    EXPECT_EQ(orchestrator.Wait().kind, PC_CopyResultKind::Completed);
    EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/s.bin")), bytes);
}

TEST(PC_CopyOrchestratorTest, FolderTreeIsMirrored)
{
    PC_TempDir temp;
    const string src = temp.Join("tree");
    PC_WriteRandomFile(src + "/root.bin", 70000, 1);
    PC_WriteRandomFile(src + "/a/one.bin", 4096, 2);
    PC_WriteRandomFile(src + "/a/b/two.bin", 123, 3);
    PC_WriteRandomFile(src + "/a/b/zero.bin", 0, 4);
    PC_WriteRandomFile(src + "/c/three.bin", 9999, 5);
    PC_CreateDirectory(src + "/empty/nested");
    PC_CreateDirectory(temp.Join("out"));

    PC_RecordingListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(src + "/", temp.Join("out"), 3), &listener);
    EXPECT_EQ(orchestrator.GetMode(), PC_CopyMode::Folder);
    EXPECT_TRUE(orchestrator.GetRanges().empty());
    const PC_CopyResult result = orchestrator.Wait();

    const uint64_t total = 70000 + 4096 + 123 + 9999;
    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed) << result.message;
    EXPECT_EQ(result.mode, PC_CopyMode::Folder);
    EXPECT_EQ(result.totalExpectedBytes, total);
    EXPECT_EQ(result.totalCopiedBytes, total);
    EXPECT_EQ(result.destinationPath, temp.Join("out/tree"));

    size_t filesCopied = 0;
    for (const PC_WorkerOutcome& outcome : result.outcomes)
    {
        EXPECT_EQ(outcome.status, PC_WorkerStatus::Success);
        filesCopied += outcome.filesCopied;
    }
    EXPECT_EQ(filesCopied, 5u);

    const char* files[] = { "root.bin", "a/one.bin", "a/b/two.bin", "a/b/zero.bin", "c/three.bin" };
    for (const char* file : files)
    {
        EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/tree/" + string(file))), PC_ReadAllBytes(src + "/" + file)) << file;
    }
    EXPECT_TRUE(PC_IsDirectoryExists(temp.Join("out/tree/empty/nested")));

    lock_guard<mutex> lock(listener.mtx);
    EXPECT_EQ(listener.finishedCount, 1);
    EXPECT_EQ(listener.globalBytes, total);
    EXPECT_FALSE(listener.percentOutOfRange);
    EXPECT_FALSE(listener.overlapDetected.load());
}

TEST(PC_CopyOrchestratorTest, DottedSourcePathNamedByLastComponent)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("tree/sub/a.bin"), 100, 9);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("tree/sub/./.."), temp.Join("out"), 1));
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed) << result.message;
    EXPECT_EQ(result.destinationPath, temp.Join("out/tree"));
    EXPECT_TRUE(PC_IsFileExists(temp.Join("out/tree/sub/a.bin")));
}

TEST(PC_CopyOrchestratorTest, FolderResultIndependentOfWorkerCount)
{
    PC_TempDir temp;
    const string src = temp.Join("tree");
    for (int i = 0; i < 30; i++)
    {
        PC_WriteRandomFile(src + "/d" + to_string(i % 5) + "/f" + to_string(i) + ".bin", 1000 * i + 7, static_cast<uint32_t>(i));
    }
    PC_CreateDirectory(temp.Join("one"));
    PC_CreateDirectory(temp.Join("many"));

    PC_CopyOrchestrator single;
    single.Start(MakeRequest(src, temp.Join("one"), 1));
    EXPECT_EQ(single.Wait().kind, PC_CopyResultKind::Completed);

    PC_CopyOrchestrator parallel;
    parallel.Start(MakeRequest(src, temp.Join("many"), 8));
    EXPECT_EQ(parallel.Wait().kind, PC_CopyResultKind::Completed);

    for (int i = 0; i < 30; i++)
    {
        const string rel = "tree/d" + to_string(i % 5) + "/f" + to_string(i) + ".bin";
        EXPECT_EQ(PC_ReadAllBytes(temp.Join("one/" + rel)), PC_ReadAllBytes(temp.Join("many/" + rel))) << rel;
    }
}

// 三个文件 100/200/300 字节，两个 worker
TEST(PC_CopyOrchestratorTest, SmallFolderCompletesOnce)
{
    PC_TempDir temp;
    const string src = temp.Join("three");
    PC_WriteRandomFile(src + "/a", 100, 1);
    PC_WriteRandomFile(src + "/b", 200, 2);
    PC_WriteRandomFile(src + "/c", 300, 3);
    PC_CreateDirectory(temp.Join("out"));

    PC_RecordingListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(src, temp.Join("out"), 2), &listener);
    const PC_CopyResult result = orchestrator.Wait();
    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed);
    EXPECT_EQ(result.totalCopiedBytes, 600u);

    lock_guard<mutex> lock(listener.mtx);
    EXPECT_EQ(listener.finishedCount, 1);
    EXPECT_EQ(listener.workerOutcomes.size(), 2u);
    ASSERT_FALSE(listener.ticks.empty());
    EXPECT_EQ(listener.ticks.back().totalCopiedBytes, 600u);
}

TEST(PC_CopyOrchestratorTest, StatusTicksNeverDecrease)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("s.bin"), 8 * 1024 * 1024, 1);
    PC_CreateDirectory(temp.Join("out"));

    PC_RecordingListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 4), &listener);
    orchestrator.Wait();

    lock_guard<mutex> lock(listener.mtx);
    ASSERT_FALSE(listener.ticks.empty());
    for (size_t i = 1; i < listener.ticks.size(); i++)
    {
        EXPECT_GE(listener.ticks[i].totalCopiedBytes, listener.ticks[i - 1].totalCopiedBytes);
    }
    EXPECT_EQ(listener.ticks.back().totalCopiedBytes, 8u * 1024u * 1024u);
    EXPECT_EQ(listener.ticks.back().finishedWorkers, 4u);
}

TEST(PC_CopyOrchestratorTest, EmptyFolderRejectedBeforeCreatingAnything)
{
    PC_TempDir temp;
    PC_CreateDirectory(temp.Join("empty/sub"));
    PC_WriteRandomFile(temp.Join("empty/sub/zero.bin"), 0, 1);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyOrchestrator orchestrator;
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("empty"), temp.Join("out"), 2)), PC_ErrorCode::EmptySource);
    EXPECT_FALSE(PC_IsPathExists(temp.Join("out/empty")));
    EXPECT_FALSE(orchestrator.IsRunning());
}

TEST(PC_CopyOrchestratorTest, InvalidRequestsRejected)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("s.bin"), 10, 1);
    PC_WriteRandomFile(temp.Join("tree/x.bin"), 10, 2);
    PC_CreateDirectory(temp.Join("out/s.bin"));

    PC_CopyOrchestrator orchestrator;
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("missing"), temp.Join("out"), 2)), PC_ErrorCode::InvalidSource);
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest("", temp.Join("out"), 2)), PC_ErrorCode::InvalidSource);
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("s.bin"), temp.Join("nowhere"), 2)),
        PC_ErrorCode::InvalidDestination);
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("s.bin"), temp.Join("tree/x.bin"), 2)),
        PC_ErrorCode::InvalidDestination);

    // 目标位置已有同名目录
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("s.bin"), temp.Join("out"), 2)),
        PC_ErrorCode::InvalidDestination);
    // 拷贝到源文件所在目录，目标即源文件本身
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("s.bin"), temp.GetPath(), 2)),
        PC_ErrorCode::InvalidDestination);
    // 目标目录位于源目录内部
    PC_CreateDirectory(temp.Join("tree/inner"));
    EXPECT_EQ(StartAndCatch(orchestrator, MakeRequest(temp.Join("tree"), temp.Join("tree/inner"), 2)),
        PC_ErrorCode::InvalidDestination);
    EXPECT_FALSE(PC_IsPathExists(temp.Join("tree/inner/tree")));

    EXPECT_FALSE(orchestrator.IsRunning());
    EXPECT_THROW(orchestrator.Wait(), PC_CopyError);
    EXPECT_EQ(orchestrator.GetStatus().totalExpectedBytes, 0u);
}

TEST(PC_CopyOrchestratorTest, StartWhileRunningRejected)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("s.bin"), 64 * 1024, 1);
    PC_CreateDirectory(temp.Join("out"));

    GateListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 1), &listener);
    EXPECT_TRUE(listener.WaitUntilBlocked());
    EXPECT_TRUE(orchestrator.IsRunning());

    try
    {
        orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 1));
        ADD_FAILURE() << "second Start should throw";
    }
    catch (const PC_CopyError& e)
    {
        EXPECT_EQ(e.GetCode(), PC_ErrorCode::InvalidArgument);
    }

    listener.Release();
    EXPECT_EQ(orchestrator.Wait().kind, PC_CopyResultKind::Completed);
    EXPECT_FALSE(orchestrator.IsRunning());

    // 上一次完成后可以再次启动
    orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 2));
    EXPECT_EQ(orchestrator.Wait().kind, PC_CopyResultKind::Completed);
}

TEST(PC_CopyOrchestratorTest, CancelFileCopy)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("s.bin"), 64 * 1024, 1);
    PC_CreateDirectory(temp.Join("out"));

    GateListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 1), &listener);
    EXPECT_TRUE(listener.WaitUntilBlocked());

    orchestrator.Cancel();
    listener.Release();
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::Cancelled);
    EXPECT_EQ(result.totalCopiedBytes, kBlock);
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(result.outcomes[0].status, PC_WorkerStatus::Cancelled);

    lock_guard<mutex> lock(listener.mtx);
    EXPECT_EQ(listener.finishedCount, 1);
}

TEST(PC_CopyOrchestratorTest, CancelFolderCopy)
{
    PC_TempDir temp;
    for (int i = 0; i < 10; i++)
    {
        PC_WriteRandomFile(temp.Join("tree/f" + to_string(i) + ".bin"), 3 * kBlock, static_cast<uint32_t>(i));
    }
    PC_CreateDirectory(temp.Join("out"));

    GateListener listener;
    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("tree"), temp.Join("out"), 1), &listener);
    EXPECT_TRUE(listener.WaitUntilBlocked());

    orchestrator.Cancel();
    listener.Release();
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::Cancelled);
    EXPECT_LT(result.totalCopiedBytes, result.totalExpectedBytes);
    EXPECT_FALSE(PC_IsPathExists(temp.Join("out/tree/f9.bin")));
}

TEST(PC_CopyOrchestratorTest, DestructorCancelsRunningCopy)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("s.bin"), 64 * 1024, 1);
    PC_CreateDirectory(temp.Join("out"));

    GateListener listener;
    thread releaser;
    {
        PC_CopyOrchestrator orchestrator;
        orchestrator.Start(MakeRequest(temp.Join("s.bin"), temp.Join("out"), 1), &listener);
        EXPECT_TRUE(listener.WaitUntilBlocked());

        releaser = thread([&listener]() {
            this_thread::sleep_for(chrono::milliseconds(50));
            listener.Release();
        });
    }
    releaser.join();

    lock_guard<mutex> lock(listener.mtx);
    EXPECT_EQ(listener.finishedCount, 1);
    EXPECT_EQ(listener.result.kind, PC_CopyResultKind::Cancelled);
}

#if !defined(_WIN32)
TEST(PC_CopyOrchestratorTest, UnreadableFileGivesCompletedWithErrors)
{
    if (::geteuid() == 0)
    {
        GTEST_SKIP() << "root ignores file permissions";
    }

    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("tree/good.bin"), 5000, 1);
    PC_WriteRandomFile(temp.Join("tree/locked.bin"), 5000, 2);
    ASSERT_EQ(::chmod(temp.Join("tree/locked.bin").c_str(), 0), 0);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("tree"), temp.Join("out"), 2));
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::CompletedWithErrors);
    EXPECT_EQ(result.totalCopiedBytes, 5000u);
    EXPECT_NE(result.message.find("locked.bin"), string::npos);
    EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/tree/good.bin")), PC_ReadAllBytes(temp.Join("tree/good.bin")));
}
// 目标名取链接名，而不是链接目标的名字
TEST(PC_CopyOrchestratorTest, SymlinkedFileKeepsLinkName)
{
    PC_TempDir temp;
    const vector<unsigned char> bytes = PC_WriteRandomFile(temp.Join("real.bin"), 5000, 7);
    ASSERT_EQ(::symlink("real.bin", temp.Join("link.bin").c_str()), 0);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("link.bin"), temp.Join("out"), 2));
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed) << result.message;
    EXPECT_EQ(result.destinationPath, temp.Join("out/link.bin"));
    EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/link.bin")), bytes);
    EXPECT_FALSE(PC_IsPathExists(temp.Join("out/real.bin")));
}

TEST(PC_CopyOrchestratorTest, SymlinkedFolderKeepsLinkName)
{
    PC_TempDir temp;
    PC_WriteRandomFile(temp.Join("realdir/a.bin"), 3000, 8);
    ASSERT_EQ(::symlink("realdir", temp.Join("linkdir").c_str()), 0);
    PC_CreateDirectory(temp.Join("out"));

    PC_CopyOrchestrator orchestrator;
    orchestrator.Start(MakeRequest(temp.Join("linkdir/"), temp.Join("out"), 2));
    const PC_CopyResult result = orchestrator.Wait();

    EXPECT_EQ(result.kind, PC_CopyResultKind::Completed) << result.message;
    EXPECT_EQ(result.destinationPath, temp.Join("out/linkdir"));
    EXPECT_EQ(PC_ReadAllBytes(temp.Join("out/linkdir/a.bin")), PC_ReadAllBytes(temp.Join("realdir/a.bin")));
    EXPECT_FALSE(PC_IsPathExists(temp.Join("out/realdir")));
}
#endif
