#include "PC_Error.h"
#include <cstring>
#include <sstream>

#if defined(_WIN32)
#   ifndef NOMINMAX
#       define NOMINMAX
#   endif
#   include <windows.h>
#endif

using namespace std;

namespace internal
{
    static string DescribeSystemError(int systemError)
    {
#if defined(_WIN32)
        char buffer[512] = { 0 };
        const DWORD len = ::FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, nullptr,
            static_cast<DWORD>(systemError), 0, buffer, static_cast<DWORD>(sizeof(buffer)), nullptr);
        string text(buffer, len);
        while (!text.empty() && (text.back() == '\r' || text.back() == '\n' || text.back() == ' '))
        {
            text.pop_back();
        }
        return text;
#else
        // strerror_r 有 GNU 与 XSI 两种签名，这里用 strerror 并立即拷贝
        const char* text = ::strerror(systemError);
        return text ? string(text) : string();
#endif
    }
}

const char* PC_ErrorCodeToString(PC_ErrorCode code)
{
    switch (code)
    {
    case PC_ErrorCode::None:                return "None";
    case PC_ErrorCode::InvalidSource:       return "InvalidSource";
    case PC_ErrorCode::InvalidDestination:  return "InvalidDestination";
    case PC_ErrorCode::EmptySource:         return "EmptySource";
    case PC_ErrorCode::IOFailure:           return "IOFailure";
    case PC_ErrorCode::UnexpectedEndOfFile: return "UnexpectedEndOfFile";
    case PC_ErrorCode::Cancelled:           return "Cancelled";
    case PC_ErrorCode::InvalidArgument:     return "InvalidArgument";
    default:                                return "Unknown";
    }
}

PC_CopyError::PC_CopyError(PC_ErrorCode code, const string& messageUtf8) : runtime_error(messageUtf8), code(code)
{
}

PC_ErrorCode PC_CopyError::GetCode() const
{
    return code;
}

PC_IOError::PC_IOError(PC_ErrorCode code, const string& pathUtf8, const string& operation, int systemError)
    : runtime_error(BuildMessage(pathUtf8, operation, systemError)), code(code), path(pathUtf8), systemError(systemError)
{
}

PC_ErrorCode PC_IOError::GetCode() const
{
    return code;
}

const string& PC_IOError::GetPath() const
{
    return path;
}

int PC_IOError::GetSystemError() const
{
    return systemError;
}

string PC_IOError::BuildMessage(const string& pathUtf8, const string& operation, int systemError)
{
    ostringstream oss;
    oss << operation << " failed: " << pathUtf8;
    if (systemError != 0)
    {
        oss << " (" << systemError << ": " << internal::DescribeSystemError(systemError) << ")";
    }
    return oss.str();
}
