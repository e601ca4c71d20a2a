#include "PC_CopyOrchestrator.h"
#include "PC_Logger.h"
#include "PC_Utility.h"
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace std;

namespace internal
{
    enum ExitCode
    {
        ExitCompleted = 0,
        ExitCompletedWithErrors = 1,
        ExitRejected = 2,
        ExitCancelled = 3,
        ExitUsage = 64
    };

    static volatile sig_atomic_t interruptRequested = 0;

    static void OnInterrupt(int)
    {
        interruptRequested = 1;
    }

    static void PrintUsage(const char* program)
    {
        cerr << "Usage: " << program << " [-t THREADS] [-b BLOCK_SIZE] [-i INTERVAL_MS] [-v] <source> <destinationDirectory>\n"
            << "  -t THREADS      worker count, 1-64 (default from config, 4)\n"
            << "  -b BLOCK_SIZE   bytes per read/write, accepts K/M/G suffixes (default 1M)\n"
            << "  -i INTERVAL_MS  status refresh interval in milliseconds (default 500)\n"
            << "  -v              print log output to the console for this run\n";
    }

    // 仅接受不带后缀的正整数
    static bool ParsePositive(const string& text, uint64_t& value)
    {
        if (text.empty() || text.find_first_not_of("0123456789") != string::npos)
        {
            return false;
        }
        return PC_ParseByteSize(text, value) && value > 0;
    }

    /*
        终端输出：每次状态刷新打印一行，worker 结束时打印其终态。
        回调已被聚合器串行化，这里不再加锁。
    */
    class ConsoleListener : public PC_CopyListener
    {
    public:
        void OnCopyStarted(PC_CopyMode mode, uint64_t totalBytes, size_t workerCount) override
        {
            cout << (mode == PC_CopyMode::File ? "File" : "Folder") << " copy, "
                << PC_FormatByteSize(static_cast<double>(totalBytes)) << ", " << workerCount << " workers" << endl;
        }

        void OnStatusTick(const PC_CopyStatus& status) override
        {
            cout << "total " << PC_FormatByteSize(static_cast<double>(status.totalExpectedBytes))
                << " | copied " << PC_FormatByteSize(static_cast<double>(status.totalCopiedBytes))
                << " | " << PC_FormatByteSize(status.bytesPerSecond) << "/s"
                << " | ETA " << PC_FormatDuration(status.etaSeconds) << endl;
        }

        void OnWorkerFinished(const PC_WorkerOutcome& outcome) override
        {
            cout << "worker " << outcome.workerIndex << ": " << PC_WorkerStatusToString(outcome.status)
                << ", " << PC_FormatByteSize(static_cast<double>(outcome.bytesCopied));
            if (outcome.filesCopied > 0 || outcome.filesFailed > 0)
            {
                cout << ", " << outcome.filesCopied << " files";
                if (outcome.filesFailed > 0)
                {
                    cout << ", " << outcome.filesFailed << " failed";
                }
            }
            if (outcome.status == PC_WorkerStatus::Failed)
            {
                cout << " (" << outcome.errorMessage << ")";
            }
            cout << endl;
        }
    };
}

int main(int argc, char* argv[])
{
    PC_CopyRequest request;
    bool verbose = false;
    string positional[2];
    int positionalCount = 0;

    for (int i = 1; i < argc; i++)
    {
        const string arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            internal::PrintUsage(argv[0]);
            return internal::ExitCompleted;
        }
        if (arg == "-v")
        {
            verbose = true;
            continue;
        }
        if (arg == "-t" || arg == "-b" || arg == "-i")
        {
            if (i + 1 >= argc)
            {
                cerr << "Missing value for " << arg << "\n";
                internal::PrintUsage(argv[0]);
                return internal::ExitUsage;
            }
            const string value = argv[++i];
            uint64_t number = 0;
            if (arg == "-b")
            {
                if (!PC_ParseByteSize(value, number) || number == 0)
                {
                    cerr << "Invalid block size: " << value << "\n";
                    return internal::ExitUsage;
                }
                request.blockSize = number;
            }
            else
            {
                if (!internal::ParsePositive(value, number))
                {
                    cerr << "Invalid value for " << arg << ": " << value << "\n";
                    return internal::ExitUsage;
                }
                if (arg == "-t")
                {
                    request.workerCount = static_cast<size_t>(number > 1024 ? 1024 : number);
                }
                else
                {
                    request.statusIntervalMs = static_cast<int>(number > 600000 ? 600000 : number);
                }
            }
            continue;
        }
        if (!arg.empty() && arg[0] == '-' && arg != "-")
        {
            cerr << "Unknown option: " << arg << "\n";
            internal::PrintUsage(argv[0]);
            return internal::ExitUsage;
        }
        if (positionalCount >= 2)
        {
            internal::PrintUsage(argv[0]);
            return internal::ExitUsage;
        }
        positional[positionalCount++] = arg;
    }

    if (positionalCount != 2)
    {
        internal::PrintUsage(argv[0]);
        return internal::ExitUsage;
    }
    request.sourcePath = positional[0];
    request.destinationDirectory = positional[1];

    if (verbose)
    {
        SetLogEnabled(true, false);
        SetLogToConsole(true, false);
    }

    signal(SIGINT, internal::OnInterrupt);

    internal::ConsoleListener listener;
    PC_CopyOrchestrator orchestrator;
    try
    {
        orchestrator.Start(request, &listener);
    }
    catch (const PC_CopyError& e)
    {
        cerr << "Copy rejected (" << PC_ErrorCodeToString(e.GetCode()) << "): " << e.what() << endl;
        PC_LOG_ERROR(string("Copy rejected: ") + e.what());
        PC_Logger::GetInstance().Flush();
        return internal::ExitRejected;
    }

    bool cancelRequested = false;
    while (orchestrator.IsRunning())
    {
        if (internal::interruptRequested && !cancelRequested)
        {
            cerr << "Interrupted, cancelling..." << endl;
            orchestrator.Cancel();
            cancelRequested = true;
        }
        this_thread::sleep_for(chrono::milliseconds(50));
    }

    const PC_CopyResult result = orchestrator.Wait();
    cout << PC_CopyResultKindToString(result.kind) << ": " << result.message << endl;
    PC_Logger::GetInstance().Flush();

    switch (result.kind)
    {
    case PC_CopyResultKind::Completed:
        return internal::ExitCompleted;
    case PC_CopyResultKind::Cancelled:
        return internal::ExitCancelled;
    default:
        return internal::ExitCompletedWithErrors;
    }
}
