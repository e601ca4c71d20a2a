#ifndef PARACOPY_LOGGER_H_H
#define PARACOPY_LOGGER_H_H

#include "ParaCopyPort.h"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#pragma warning(push)
#pragma warning(disable : 4251)

enum class PC_LogLevel : int
{
    PCLOG_TRACE = 0,
    PCLOG_DEBUG = 1,
    PCLOG_INFO = 2,
    PCLOG_WARNING = 3,
    PCLOG_ERROR = 4,
    PCLOG_FATAL = 5,
    PCLOG_DISABLELOG = 6
};

PARACOPY_PORT std::string LogLevelToString(PC_LogLevel level);

struct PARACOPY_PORT PC_LogItem
{
    std::string timestamp; // 时间戳
    PC_LogLevel level; // 日志级别
    std::string message; // 日志消息
    std::string threadId; // 线程 ID
    std::string file; // 文件名
    int line; // 行号

    // 单行 JSON，以 '\n' 结尾
    std::string ToJsonString() const;

    // "[ts] [LEVEL] [thread] [file:line] msg\n"
    std::string ToPlainTextString() const;
};

/*
    异步日志：
      - Log* 只负责组装 PC_LogItem 并入队，真正的文件/控制台输出在后台线程中完成；
      - 全部日志以 JSON 行写入 <exe 目录>/PC_Logs/PC_AllLog.log，
        不低于过滤级别的日志另写入 PC_OutputLog.log，并按需彩色输出到控制台；
      - 未启用日志（PC_EnableLog != 1）时后台线程直接丢弃日志项。
*/
class PARACOPY_PORT PC_Logger
{
public:
    static PC_Logger& GetInstance();

    void Log(PC_LogLevel level, const std::string& msgUtf8, const std::string& fileUtf8, int line);

    void LogTrace(const std::string& msgUtf8, const char* file, int line);
    void LogDebug(const std::string& msgUtf8, const char* file, int line);
    void LogInfo(const std::string& msgUtf8, const char* file, int line);
    void LogWarning(const std::string& msgUtf8, const char* file, int line);
    void LogError(const std::string& msgUtf8, const char* file, int line);
    void LogFatal(const std::string& msgUtf8, const char* file, int line);

    // 阻塞直到此前入队的日志全部处理完毕
    void Flush();

    // 清空两个日志文件（不存在则创建）
    bool ClearLogFiles();

    std::string GetAllLogFilePath() const;
    std::string GetOutputLogFilePath() const;

private:
    std::queue<PC_LogItem> logQueue; // 日志队列
    std::mutex logQueueMtx; // 互斥锁保护日志队列与 pendingCount
    std::condition_variable logQueueCv; // 用于通知日志处理线程
    std::condition_variable drainedCv; // 用于 Flush
    size_t pendingCount; // 已入队但尚未写出的日志数

    std::mutex fileMtx; // 保护两个文件流
    std::ofstream allLogStream;
    std::ofstream outputLogStream;

    std::string allLogFilePath;
    std::string outputLogFilePath;

    bool isStop; // 受 logQueueMtx 保护
    std::thread logThread; // 日志处理线程

    PC_Logger();
    ~PC_Logger();
    PC_Logger(const PC_Logger&) = delete;
    PC_Logger& operator=(const PC_Logger&) = delete;

    void LogWithSourceFile(PC_LogLevel level, const std::string& msgUtf8, const char* file, int line);
    void WriteItem(const PC_LogItem& logItem);
    bool EnsureStreamsOpen();

    void LogThreadFunc(); // 日志处理线程函数
};

#pragma warning(pop)

// persist 为 false 时仅修改本进程内的开关，不写配置
PARACOPY_PORT bool IsLogEnabled();
PARACOPY_PORT bool SetLogEnabled(bool enable, bool persist = true);

PARACOPY_PORT bool IsLogToConsole();
PARACOPY_PORT bool SetLogToConsole(bool enable, bool persist = true);

PARACOPY_PORT PC_LogLevel GetLogFilterLevel();
PARACOPY_PORT bool SetLogFilterLevel(PC_LogLevel level, bool persist = true);
PARACOPY_PORT bool CheckLogLevel(PC_LogLevel level);

// 丢弃进程内缓存，下次查询时重新从配置读取
PARACOPY_PORT void ReloadLogSettings();

#define PC_LOG_TRACE(msg) PC_Logger::GetInstance().LogTrace((msg), __FILE__, __LINE__)
#define PC_LOG_DEBUG(msg) PC_Logger::GetInstance().LogDebug((msg), __FILE__, __LINE__)
#define PC_LOG_INFO(msg) PC_Logger::GetInstance().LogInfo((msg), __FILE__, __LINE__)
#define PC_LOG_WARNING(msg) PC_Logger::GetInstance().LogWarning((msg), __FILE__, __LINE__)
#define PC_LOG_ERROR(msg) PC_Logger::GetInstance().LogError((msg), __FILE__, __LINE__)
#define PC_LOG_FATAL(msg) PC_Logger::GetInstance().LogFatal((msg), __FILE__, __LINE__)

#endif
