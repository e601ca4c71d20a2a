#include "PC_Logger.h"
#include "PC_Config.h"
#include "PC_FileSystem.h"
#include "PC_Timer.h"
#include "PC_Utf8String.h"
#include <iostream>
#include <sstream>
#include <vector>

#if defined(_WIN32)
#   ifndef NOMINMAX
#       define NOMINMAX
#   endif
#   include <windows.h>
#endif

using namespace std;

namespace internal
{
    static const char* kEnableLogKey = "PC_EnableLog";
    static const char* kLogToConsoleKey = "PC_IsLogToConsole";
    static const char* kLogLevelKey = "PC_LogLevel";

    // 日志开关的进程内缓存，首次查询时从配置加载
    struct LogSettings
    {
        mutex mtx;
        bool loaded = false;
        bool enabled = false;
        bool toConsole = false;
        PC_LogLevel level = PC_LogLevel::PCLOG_TRACE;
    };

    static LogSettings& GetLogSettings()
    {
        static LogSettings settings;
        return settings;
    }

    static bool ReadSwitch(const char* key)
    {
        string value;
        return GetPcConfig(key, value) && Utf8Trim(value) == "1";
    }

    static PC_LogLevel ParseLevel(const string& text)
    {
        const string value = Utf8ToUpper(Utf8Trim(text));
        if (value == "TRACE" || value == "0") return PC_LogLevel::PCLOG_TRACE;
        if (value == "DEBUG" || value == "1") return PC_LogLevel::PCLOG_DEBUG;
        if (value == "INFO" || value == "2") return PC_LogLevel::PCLOG_INFO;
        if (value == "WARNING" || value == "3") return PC_LogLevel::PCLOG_WARNING;
        if (value == "ERROR" || value == "4") return PC_LogLevel::PCLOG_ERROR;
        if (value == "FATAL" || value == "5") return PC_LogLevel::PCLOG_FATAL;
        if (value == "DISABLELOG" || value == "6") return PC_LogLevel::PCLOG_DISABLELOG;
        return PC_LogLevel::PCLOG_TRACE;
    }

    // 调用方需持有 settings.mtx
    static void LoadIfNeeded(LogSettings& settings)
    {
        if (settings.loaded)
        {
            return;
        }
        settings.enabled = ReadSwitch(kEnableLogKey);
        settings.toConsole = ReadSwitch(kLogToConsoleKey);
        string levelText;
        settings.level = GetPcConfig(kLogLevelKey, levelText) ? ParseLevel(levelText) : PC_LogLevel::PCLOG_TRACE;
        settings.loaded = true;
    }

    static void AppendJsonEscaped(string& out, const string& s)
    {
        out.reserve(out.size() + s.size());
        for (size_t i = 0; i < s.size(); i++)
        {
            const unsigned char ch = static_cast<unsigned char>(s[i]);
            switch (ch)
            {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (ch < 0x20)
                {
                    static const char* hex = "0123456789ABCDEF";
                    out += "\\u00";
                    out += hex[(ch >> 4) & 0xF];
                    out += hex[ch & 0xF];
                }
                else
                {
                    out += static_cast<char>(ch);
                }
                break;
            }
        }
    }

    // VT/ANSI 转义序列
    static const char* GetAnsiColorByLevel(PC_LogLevel level)
    {
        switch (level)
        {
        case PC_LogLevel::PCLOG_TRACE:   return "\x1b[90m"; // 灰
        case PC_LogLevel::PCLOG_DEBUG:   return "\x1b[36m"; // 青
        case PC_LogLevel::PCLOG_INFO:    return "\x1b[32m"; // 绿
        case PC_LogLevel::PCLOG_WARNING: return "\x1b[33m"; // 黄
        case PC_LogLevel::PCLOG_ERROR:   return "\x1b[31m"; // 红
        case PC_LogLevel::PCLOG_FATAL:   return "\x1b[35m"; // 品红
        default:                         return "\x1b[0m";
        }
    }

    static ostream& SelectStream(PC_LogLevel level)
    {
        return (level >= PC_LogLevel::PCLOG_ERROR) ? cerr : cout;
    }

#if defined(_WIN32)
    static void EnableWinVtOnce()
    {
        static once_flag once;
        call_once(once, []()
            {
                ::SetConsoleOutputCP(CP_UTF8);
                const HANDLE handles[2] = { ::GetStdHandle(STD_OUTPUT_HANDLE), ::GetStdHandle(STD_ERROR_HANDLE) };
                for (size_t i = 0; i < 2; i++)
                {
                    DWORD mode = 0;
                    if (handles[i] && ::GetConsoleMode(handles[i], &mode))
                    {
                        ::SetConsoleMode(handles[i], mode | 0x0004 /* ENABLE_VIRTUAL_TERMINAL_PROCESSING */);
                    }
                }
            });
    }
#endif

    static void ConsoleWriteColoredUtf8(const string& textUtf8, PC_LogLevel level)
    {
#if defined(_WIN32)
        EnableWinVtOnce();
#endif
        ostream& os = SelectStream(level);
        os << GetAnsiColorByLevel(level) << textUtf8 << "\x1b[0m";
        os.flush();
    }

    static bool OpenAppend(ofstream& stream, const string& pathUtf8)
    {
#if defined(_WIN32)
        stream.open(Utf8ToWString(Utf8Replace(pathUtf8, "/", "\\")).c_str(), ios::out | ios::app | ios::binary);
#else
        stream.open(pathUtf8.c_str(), ios::out | ios::app | ios::binary);
#endif
        return stream.is_open();
    }

    static string NormalizeSourceFile(const char* file)
    {
        if (!file)
        {
            return string();
        }
        return Utf8Replace(MakeUtf8String(file), "\\", "/");
    }
}

string LogLevelToString(PC_LogLevel level)
{
    switch (level)
    {
    case PC_LogLevel::PCLOG_TRACE:      return "TRACE";
    case PC_LogLevel::PCLOG_DEBUG:      return "DEBUG";
    case PC_LogLevel::PCLOG_INFO:       return "INFO";
    case PC_LogLevel::PCLOG_WARNING:    return "WARNING";
    case PC_LogLevel::PCLOG_ERROR:      return "ERROR";
    case PC_LogLevel::PCLOG_FATAL:      return "FATAL";
    case PC_LogLevel::PCLOG_DISABLELOG: return "DISABLELOG";
    default:                            return "UNKNOWN";
    }
}

string PC_LogItem::ToJsonString() const
{
    string out;
    out.reserve(64 + message.size() + threadId.size() + file.size());

    out += "{\"ts\":\"";
    internal::AppendJsonEscaped(out, timestamp);
    out += "\",\"level\":\"";
    out += LogLevelToString(level);
    out += "\",\"thread\":\"";
    internal::AppendJsonEscaped(out, threadId);
    out += "\",\"file\":\"";
    internal::AppendJsonEscaped(out, file);
    out += "\",\"line\":";
    out += to_string(line);
    out += ",\"msg\":\"";
    internal::AppendJsonEscaped(out, message);
    out += "\"}\n";
    return out;
}

string PC_LogItem::ToPlainTextString() const
{
    string out;
    out.reserve(64 + message.size() + threadId.size() + file.size());

    out += "[";
    out += timestamp;
    out += "] [";
    out += LogLevelToString(level);
    out += "] [";
    out += threadId;
    out += "] [";
    out += file;
    out += ":";
    out += to_string(line);
    out += "] ";
    out += message;
    out += "\n";
    return out;
}

PC_Logger& PC_Logger::GetInstance()
{
    static PC_Logger instance;
    return instance;
}

PC_Logger::PC_Logger() : pendingCount(0), isStop(false)
{
    const string logDir = PC_GetExeDirectory() + "PC_Logs/";
    allLogFilePath = logDir + "PC_AllLog.log";
    outputLogFilePath = logDir + "PC_OutputLog.log";

    // 开关缓存须先于本单例构造完成，才能晚于本单例析构
    internal::GetLogSettings();

    logThread = thread(&PC_Logger::LogThreadFunc, this);
}

PC_Logger::~PC_Logger()
{
    {
        lock_guard<mutex> lock(logQueueMtx);
        isStop = true;
    }
    logQueueCv.notify_all();

    if (logThread.joinable())
    {
        logThread.join();
    }
}

void PC_Logger::Log(PC_LogLevel level, const string& msgUtf8, const string& fileUtf8, int line)
{
    PC_LogItem logItem;
    logItem.timestamp = PC_GetLocalTimeStr();
    logItem.level = level;
    logItem.message = msgUtf8;
    {
        ostringstream oss;
        oss << this_thread::get_id();
        logItem.threadId = oss.str();
    }
    logItem.file = fileUtf8;
    logItem.line = line;
    {
        lock_guard<mutex> lock(logQueueMtx);
        logQueue.push(std::move(logItem));
        pendingCount++;
    }
    logQueueCv.notify_one();
}

void PC_Logger::LogWithSourceFile(PC_LogLevel level, const string& msgUtf8, const char* file, int line)
{
    Log(level, msgUtf8, internal::NormalizeSourceFile(file), line);
}

void PC_Logger::LogTrace(const string& msgUtf8, const char* file, int line)
{
    LogWithSourceFile(PC_LogLevel::PCLOG_TRACE, msgUtf8, file, line);
}

void PC_Logger::LogDebug(const string& msgUtf8, const char* file, int line)
{
    LogWithSourceFile(PC_LogLevel::PCLOG_DEBUG, msgUtf8, file, line);
}

void PC_Logger::LogInfo(const string& msgUtf8, const char* file, int line)
{
    LogWithSourceFile(PC_LogLevel::PCLOG_INFO, msgUtf8, file, line);
}

void PC_Logger::LogWarning(const string& msgUtf8, const char* file, int line)
{
    LogWithSourceFile(PC_LogLevel::PCLOG_WARNING, msgUtf8, file, line);
}

void PC_Logger::LogError(const string& msgUtf8, const char* file, int line)
{
    LogWithSourceFile(PC_LogLevel::PCLOG_ERROR, msgUtf8, file, line);
}

void PC_Logger::LogFatal(const string& msgUtf8, const char* file, int line)
{
    LogWithSourceFile(PC_LogLevel::PCLOG_FATAL, msgUtf8, file, line);
}

void PC_Logger::Flush()
{
    unique_lock<mutex> lock(logQueueMtx);
    drainedCv.wait(lock, [this]() {
        return pendingCount == 0 || isStop;
    });

    lock_guard<mutex> fileLock(fileMtx);
    if (allLogStream.is_open())
    {
        allLogStream.flush();
    }
    if (outputLogStream.is_open())
    {
        outputLogStream.flush();
    }
}

bool PC_Logger::ClearLogFiles()
{
    lock_guard<mutex> fileLock(fileMtx);
    allLogStream.close();
    outputLogStream.close();

    if (!PC_CreateDirectory(PC_GetDirectoryPath(allLogFilePath)))
    {
        return false;
    }

    bool ok = true;
    const string paths[2] = { allLogFilePath, outputLogFilePath };
    for (size_t i = 0; i < 2; i++)
    {
        ofstream truncated;
#if defined(_WIN32)
        truncated.open(Utf8ToWString(Utf8Replace(paths[i], "/", "\\")).c_str(), ios::out | ios::trunc | ios::binary);
#else
        truncated.open(paths[i].c_str(), ios::out | ios::trunc | ios::binary);
#endif
        ok = truncated.is_open() && ok;
    }
    return ok;
}

string PC_Logger::GetAllLogFilePath() const
{
    return allLogFilePath;
}

string PC_Logger::GetOutputLogFilePath() const
{
    return outputLogFilePath;
}

// 调用方需持有 fileMtx
bool PC_Logger::EnsureStreamsOpen()
{
    if (allLogStream.is_open() && outputLogStream.is_open())
    {
        return true;
    }
    if (!PC_CreateDirectory(PC_GetDirectoryPath(allLogFilePath)))
    {
        return false;
    }
    if (!allLogStream.is_open() && !internal::OpenAppend(allLogStream, allLogFilePath))
    {
        return false;
    }
    if (!outputLogStream.is_open() && !internal::OpenAppend(outputLogStream, outputLogFilePath))
    {
        return false;
    }
    return true;
}

void PC_Logger::WriteItem(const PC_LogItem& logItem)
{
    if (!IsLogEnabled())
    {
        return;
    }

    const bool passFilter = CheckLogLevel(logItem.level);
    const string logJsonUtf8 = logItem.ToJsonString();
    {
        lock_guard<mutex> fileLock(fileMtx);
        // 日志目录不可写时只保留控制台输出
        if (EnsureStreamsOpen())
        {
            allLogStream << logJsonUtf8;
            if (passFilter)
            {
                outputLogStream << logJsonUtf8;
            }
        }
    }

    if (passFilter && IsLogToConsole())
    {
        internal::ConsoleWriteColoredUtf8(logItem.ToPlainTextString(), logItem.level);
    }
}

void PC_Logger::LogThreadFunc()
{
    for (;;)
    {
        queue<PC_LogItem> localQueue;
        bool stopping = false;
        {
            unique_lock<mutex> lock(logQueueMtx);
            logQueueCv.wait(lock, [this]() {
                return !logQueue.empty() || isStop;
            });
            swap(localQueue, logQueue);
            stopping = isStop;
        }

        const size_t batchSize = localQueue.size();
        while (!localQueue.empty())
        {
            WriteItem(localQueue.front());
            localQueue.pop();
        }

        {
            lock_guard<mutex> fileLock(fileMtx);
            if (allLogStream.is_open())
            {
                allLogStream.flush();
            }
            if (outputLogStream.is_open())
            {
                outputLogStream.flush();
            }
        }

        {
            lock_guard<mutex> lock(logQueueMtx);
            pendingCount -= batchSize;
        }
        drainedCv.notify_all();

        // 停止前已入队的日志全部写出后再退出
        if (stopping)
        {
            lock_guard<mutex> lock(logQueueMtx);
            if (logQueue.empty())
            {
                return;
            }
        }
    }
}

bool IsLogEnabled()
{
    internal::LogSettings& settings = internal::GetLogSettings();
    lock_guard<mutex> lock(settings.mtx);
    internal::LoadIfNeeded(settings);
    return settings.enabled;
}

bool SetLogEnabled(bool enable, bool persist)
{
    {
        internal::LogSettings& settings = internal::GetLogSettings();
        lock_guard<mutex> lock(settings.mtx);
        internal::LoadIfNeeded(settings);
        settings.enabled = enable;
    }
    if (!persist)
    {
        return true;
    }
    return SetPcConfig(internal::kEnableLogKey, enable ? "1" : "0");
}

bool IsLogToConsole()
{
    internal::LogSettings& settings = internal::GetLogSettings();
    lock_guard<mutex> lock(settings.mtx);
    internal::LoadIfNeeded(settings);
    return settings.toConsole;
}

bool SetLogToConsole(bool enable, bool persist)
{
    {
        internal::LogSettings& settings = internal::GetLogSettings();
        lock_guard<mutex> lock(settings.mtx);
        internal::LoadIfNeeded(settings);
        settings.toConsole = enable;
    }
    if (!persist)
    {
        return true;
    }
    return SetPcConfig(internal::kLogToConsoleKey, enable ? "1" : "0");
}

PC_LogLevel GetLogFilterLevel()
{
    internal::LogSettings& settings = internal::GetLogSettings();
    lock_guard<mutex> lock(settings.mtx);
    internal::LoadIfNeeded(settings);
    if (!settings.enabled)
    {
        return PC_LogLevel::PCLOG_DISABLELOG;
    }
    return settings.level;
}

bool SetLogFilterLevel(PC_LogLevel level, bool persist)
{
    {
        internal::LogSettings& settings = internal::GetLogSettings();
        lock_guard<mutex> lock(settings.mtx);
        internal::LoadIfNeeded(settings);
        settings.level = level;
    }
    if (!persist)
    {
        return true;
    }
    return SetPcConfig(internal::kLogLevelKey, LogLevelToString(level));
}

bool CheckLogLevel(PC_LogLevel level)
{
    const PC_LogLevel filterLevel = GetLogFilterLevel();
    return level >= filterLevel && filterLevel != PC_LogLevel::PCLOG_DISABLELOG;
}

void ReloadLogSettings()
{
    internal::LogSettings& settings = internal::GetLogSettings();
    lock_guard<mutex> lock(settings.mtx);
    settings.loaded = false;
}
