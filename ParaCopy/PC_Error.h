#ifndef PARACOPY_ERROR_H_H
#define PARACOPY_ERROR_H_H

#include "ParaCopyPort.h"
#include <stdexcept>
#include <string>

#pragma warning(push)
#pragma warning(disable : 4251 4275)

enum class PC_ErrorCode : int
{
    None = 0,
    InvalidSource = 1,        // 源路径不存在，或既不是常规文件也不是目录
    InvalidDestination = 2,   // 目标不是已存在的目录，或与源冲突
    EmptySource = 3,          // 目录扫描得到的总字节数为 0
    IOFailure = 4,            // 单个文件/区间的读写失败
    UnexpectedEndOfFile = 5,  // 源文件在分配的区间读完之前就到达 EOF
    Cancelled = 6,
    InvalidArgument = 7
};

PARACOPY_PORT const char* PC_ErrorCodeToString(PC_ErrorCode code);

/*
    请求级错误：在任何 worker 启动之前由 PC_CopyOrchestrator::Start 同步抛出。
*/
class PARACOPY_PORT PC_CopyError : public std::runtime_error
{
public:
    PC_CopyError(PC_ErrorCode code, const std::string& messageUtf8);

    PC_ErrorCode GetCode() const;

private:
    PC_ErrorCode code;
};

/*
    底层 I/O 错误：由 PC_File 抛出，由 worker 在本地捕获并转为 Failed 结果。
    systemError 为 errno（POSIX）或 GetLastError()（Windows），0 表示非系统调用错误。
*/
class PARACOPY_PORT PC_IOError : public std::runtime_error
{
public:
    PC_IOError(PC_ErrorCode code, const std::string& pathUtf8, const std::string& operation, int systemError);

    PC_ErrorCode GetCode() const;
    const std::string& GetPath() const;
    int GetSystemError() const;

private:
    static std::string BuildMessage(const std::string& pathUtf8, const std::string& operation, int systemError);

    PC_ErrorCode code;
    std::string path;
    int systemError;
};

#pragma warning(pop)

#endif
