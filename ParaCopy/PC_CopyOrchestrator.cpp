#include "PC_CopyOrchestrator.h"
#include "PC_BaseTypes.h"
#include "PC_Config.h"
#include "PC_DirectoryScanner.h"
#include "PC_File.h"
#include "PC_FileSystem.h"
#include "PC_Logger.h"
#include "PC_Utility.h"
#include <system_error>
#include <utility>

using namespace std;

PC_CopyOrchestrator::PC_CopyOrchestrator() : mode(PC_CopyMode::None)
{
}

PC_CopyOrchestrator::~PC_CopyOrchestrator()
{
    if (!aggregator)
    {
        return;
    }
    if (!aggregator->IsFinished())
    {
        Cancel();
    }
    aggregator->Wait();
    pool.reset();
}

PC_CopyRequest PC_CopyOrchestrator::ResolveRequest(const PC_CopyRequest& request) const
{
    const PC_CopySettings defaults = LoadCopySettings();

    PC_CopySettings settings;
    settings.workerCount = request.workerCount != 0 ? request.workerCount : defaults.workerCount;
    settings.blockSize = request.blockSize != 0 ? request.blockSize : defaults.blockSize;
    settings.statusIntervalMs = request.statusIntervalMs > 0 ? request.statusIntervalMs : defaults.statusIntervalMs;
    settings = ClampCopySettings(settings);

    PC_CopyRequest resolved = request;
    resolved.workerCount = settings.workerCount;
    resolved.blockSize = settings.blockSize;
    resolved.statusIntervalMs = settings.statusIntervalMs;
    return resolved;
}

void PC_CopyOrchestrator::Start(const PC_CopyRequest& request, PC_CopyListener* listener)
{
    if (IsRunning())
    {
        throw PC_CopyError(PC_ErrorCode::InvalidArgument, "a copy is already running on this orchestrator");
    }
    ReleaseRun();

    effectiveRequest = ResolveRequest(request);
    const string& source = effectiveRequest.sourcePath;
    const string& destinationDir = effectiveRequest.destinationDirectory;

    if (source.empty() || !PC_IsPathExists(source))
    {
        throw PC_CopyError(PC_ErrorCode::InvalidSource, "source does not exist: " + source);
    }
    const bool isFile = PC_IsFileExists(source);
    const bool isDirectory = !isFile && PC_IsDirectoryExists(source);
    if (!isFile && !isDirectory)
    {
        throw PC_CopyError(PC_ErrorCode::InvalidSource, "source is neither a regular file nor a directory: " + source);
    }
    if (destinationDir.empty() || !PC_IsDirectoryExists(destinationDir))
    {
        throw PC_CopyError(PC_ErrorCode::InvalidDestination, "destination is not an existing directory: " + destinationDir);
    }

    const string sourceCanonical = PC_GetCanonicalPath(source);
    const string destinationCanonical = PC_GetCanonicalPath(destinationDir);
    if (sourceCanonical.empty())
    {
        throw PC_CopyError(PC_ErrorCode::InvalidSource, "cannot resolve source path: " + source);
    }
    if (destinationCanonical.empty())
    {
        throw PC_CopyError(PC_ErrorCode::InvalidDestination, "cannot resolve destination path: " + destinationDir);
    }

    // 目标名取自请求路径本身，符号链接保留链接名；"."、".." 之类写不出名字时才退回解析后的路径
    string name = PC_GetFileName(PC_NormalizePath(source));
    if (name.empty() || name == "." || name == "..")
    {
        name = PC_GetFileName(sourceCanonical);
    }
    if (name.empty())
    {
        throw PC_CopyError(PC_ErrorCode::InvalidSource, "cannot derive a destination name from source: " + source);
    }
    const string targetPath = PC_JoinPath(destinationDir, name);
    const string targetCanonical = PC_JoinPath(destinationCanonical, name);

    if (isFile)
    {
        if (PC_IsDirectoryExists(targetPath))
        {
            throw PC_CopyError(PC_ErrorCode::InvalidDestination, "a directory already exists at " + targetPath);
        }
        if (PC_IsPathExists(targetPath) && PC_IsSameFile(source, targetPath))
        {
            throw PC_CopyError(PC_ErrorCode::InvalidDestination, "destination file is the source itself: " + targetPath);
        }
        PrepareFileMode(targetPath, listener);
    }
    else
    {
        PrepareFolderMode(sourceCanonical, targetPath, targetCanonical, listener);
    }

    Launch();
}

void PC_CopyOrchestrator::PrepareFileMode(const string& targetPath, PC_CopyListener* listener)
{
    const string& source = effectiveRequest.sourcePath;

    uint64_t fileSize = 0;
    if (!PC_TryGetFileSize(source, fileSize))
    {
        throw PC_CopyError(PC_ErrorCode::IOFailure, "cannot read size of source file: " + source);
    }

    try
    {
        PC_File destination(targetPath, PC_File::OpenMode::WriteTruncate);
        destination.Resize(fileSize);
        destination.Close();
    }
    catch (const PC_IOError& e)
    {
        throw PC_CopyError(PC_ErrorCode::IOFailure, string("cannot pre-allocate destination file: ") + e.what());
    }

    const size_t workerCount = effectiveRequest.workerCount;
    ranges = PC_PartitionRange(fileSize, workerCount);

    vector<uint64_t> bytesAssigned;
    bytesAssigned.reserve(ranges.size());
    for (size_t i = 0; i < ranges.size(); i++)
    {
        bytesAssigned.push_back(ranges[i].Length());
    }

    mode = PC_CopyMode::File;
    destinationPath = targetPath;
    aggregator.reset(new PC_ProgressAggregator(mode, fileSize, bytesAssigned, effectiveRequest.statusIntervalMs, listener,
        token, destinationPath));

    workers.reserve(ranges.size());
    for (size_t i = 0; i < ranges.size(); i++)
    {
        workers.emplace_back(new PC_RangeCopyWorker(source, targetPath, ranges[i], effectiveRequest.blockSize, *aggregator, token));
    }

    PC_LOG_INFO("File copy: " + source + " -> " + targetPath + ", " + PC_FormatByteSize(static_cast<double>(fileSize)) +
        ", " + to_string(workerCount) + " workers");
}

void PC_CopyOrchestrator::PrepareFolderMode(const string& sourceCanonical, const string& targetPath, const string& targetCanonical,
    PC_CopyListener* listener)
{
    const string& source = effectiveRequest.sourcePath;

    if (PC_IsSameOrSubPath(sourceCanonical, targetCanonical))
    {
        throw PC_CopyError(PC_ErrorCode::InvalidDestination, "destination " + targetPath + " lies inside the source tree " + source);
    }

    PC_ScanResult scan;
    if (!PC_ScanDirectory(source, targetPath, scan))
    {
        throw PC_CopyError(PC_ErrorCode::InvalidSource, "cannot read source directory: " + source);
    }
    if (scan.totalBytes == 0)
    {
        throw PC_CopyError(PC_ErrorCode::EmptySource, "source directory contains no data to copy: " + source);
    }
    if (!scan.skippedEntries.empty())
    {
        PC_LOG_WARNING(to_string(scan.skippedEntries.size()) + " entries of " + source + " will not be copied");
    }

    if (!PC_CreateDirectory(targetPath))
    {
        throw PC_CopyError(PC_ErrorCode::IOFailure, "cannot create destination directory: " + targetPath);
    }
    for (size_t i = 0; i < scan.directories.size(); i++)
    {
        const string dir = PC_JoinPath(targetPath, scan.directories[i]);
        if (!PC_CreateDirectory(dir))
        {
            throw PC_CopyError(PC_ErrorCode::IOFailure, "cannot create destination directory: " + dir);
        }
    }

    const size_t workerCount = effectiveRequest.workerCount;
    const size_t fileCount = scan.tasks.size();
    const uint64_t totalBytes = scan.totalBytes;

    mode = PC_CopyMode::Folder;
    destinationPath = targetPath;
    queue.reset(new PC_TaskQueue(std::move(scan.tasks)));
    aggregator.reset(new PC_ProgressAggregator(mode, totalBytes, vector<uint64_t>(workerCount, 0),
        effectiveRequest.statusIntervalMs, listener, token, destinationPath));

    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; i++)
    {
        workers.emplace_back(new PC_QueueCopyWorker(i, *queue, effectiveRequest.blockSize, *aggregator, token));
    }

    PC_LOG_INFO("Folder copy: " + source + " -> " + targetPath + ", " + to_string(fileCount) + " files, " +
        PC_FormatByteSize(static_cast<double>(totalBytes)) + ", " + to_string(workerCount) + " workers");
}

void PC_CopyOrchestrator::Launch()
{
    // 先建线程，失败时还没有任何 worker 在运行，可以直接回滚
    try
    {
        pool.reset(new PC_ThreadPool(workers.size()));
    }
    catch (const system_error& e)
    {
        ReleaseRun();
        throw PC_CopyError(PC_ErrorCode::IOFailure, string("cannot start worker threads: ") + e.what());
    }

    token.Reset();
    aggregator->Start();
    for (size_t i = 0; i < workers.size(); i++)
    {
        PC_CopyWorker* worker = workers[i].get();
        pool->Post([worker]() {
            worker->Run();
        });
    }
}

void PC_CopyOrchestrator::Cancel()
{
    token.Cancel();
}

PC_CopyResult PC_CopyOrchestrator::Wait()
{
    if (!aggregator)
    {
        throw PC_CopyError(PC_ErrorCode::InvalidArgument, "no copy has been started");
    }

    const PC_CopyResult result = aggregator->Wait();
    if (pool)
    {
        pool->WaitIdle();
        pool.reset();
    }
    return result;
}

bool PC_CopyOrchestrator::IsRunning() const
{
    return aggregator && !aggregator->IsFinished();
}

PC_CopyStatus PC_CopyOrchestrator::GetStatus() const
{
    if (!aggregator)
    {
        return PC_CopyStatus();
    }
    return aggregator->GetStatus();
}

PC_CopyMode PC_CopyOrchestrator::GetMode() const
{
    return mode;
}

vector<PC_FileRange> PC_CopyOrchestrator::GetRanges() const
{
    return ranges;
}

PC_CopyRequest PC_CopyOrchestrator::GetEffectiveRequest() const
{
    return effectiveRequest;
}

// 只能在没有 worker 运行时调用
void PC_CopyOrchestrator::ReleaseRun()
{
    pool.reset();
    workers.clear();
    queue.reset();
    aggregator.reset();
    ranges.clear();
    destinationPath.clear();
    mode = PC_CopyMode::None;
}
