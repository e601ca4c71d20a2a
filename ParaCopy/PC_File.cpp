#include "PC_File.h"
#include "PC_Error.h"
#include "PC_Utf8String.h"
#include <algorithm>
#include <cerrno>
#include <utility>

#if defined(_WIN32)
#   ifndef NOMINMAX
#       define NOMINMAX
#   endif
#   include <windows.h>
#else
#   include <fcntl.h>
#   include <unistd.h>
#   include <sys/stat.h>
#   include <sys/types.h>
#endif

using namespace std;

namespace internal
{
#if defined(_WIN32)
    // 单次 ReadFile/WriteFile 的长度上限（DWORD）
    static const size_t kMaxIoChunk = 1u << 30;

    static int LastSystemError()
    {
        return static_cast<int>(::GetLastError());
    }
#else
    static int LastSystemError()
    {
        return errno;
    }
#endif

    static void ThrowIOError(const string& path, const char* operation, int systemError)
    {
        throw PC_IOError(PC_ErrorCode::IOFailure, path, operation, systemError);
    }
}

PC_File::PC_File()
#if defined(_WIN32)
    : handle(INVALID_HANDLE_VALUE)
#else
    : fd(-1)
#endif
{
}

PC_File::PC_File(const string& filePathUtf8, OpenMode mode) : PC_File()
{
    Open(filePathUtf8, mode);
}

PC_File::~PC_File()
{
    Reset();
}

PC_File::PC_File(PC_File&& other) noexcept : path(std::move(other.path))
#if defined(_WIN32)
    , handle(other.handle)
#else
    , fd(other.fd)
#endif
{
#if defined(_WIN32)
    other.handle = INVALID_HANDLE_VALUE;
#else
    other.fd = -1;
#endif
}

PC_File& PC_File::operator=(PC_File&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    Reset();
    path = std::move(other.path);
#if defined(_WIN32)
    handle = other.handle;
    other.handle = INVALID_HANDLE_VALUE;
#else
    fd = other.fd;
    other.fd = -1;
#endif
    return *this;
}

void PC_File::Open(const string& filePathUtf8, OpenMode mode)
{
    Reset();
    path = filePathUtf8;

#if defined(_WIN32)
    DWORD access = GENERIC_READ;
    DWORD disposition = OPEN_EXISTING;
    if (mode == OpenMode::ReadWriteExisting)
    {
        access = GENERIC_READ | GENERIC_WRITE;
    }
    else if (mode == OpenMode::WriteTruncate)
    {
        access = GENERIC_WRITE;
        disposition = CREATE_ALWAYS;
    }

    const wstring widePath = Utf8ToWString(Utf8Replace(filePathUtf8, "/", "\\"));
    if (widePath.empty())
    {
        internal::ThrowIOError(path, "open", ERROR_INVALID_NAME);
    }
    HANDLE h = ::CreateFileW(widePath.c_str(), access, FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
        disposition, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        internal::ThrowIOError(path, "open", internal::LastSystemError());
    }
    handle = h;
#else
    int flags = O_RDONLY;
    if (mode == OpenMode::ReadWriteExisting)
    {
        flags = O_RDWR;
    }
    else if (mode == OpenMode::WriteTruncate)
    {
        flags = O_WRONLY | O_CREAT | O_TRUNC;
    }
    flags |= O_CLOEXEC;

    int newFd = -1;
    do
    {
        newFd = ::open(filePathUtf8.c_str(), flags, 0644);
    } while (newFd < 0 && errno == EINTR);

    if (newFd < 0)
    {
        internal::ThrowIOError(path, "open", internal::LastSystemError());
    }
    fd = newFd;
#endif
}

void PC_File::Close()
{
#if defined(_WIN32)
    if (handle == INVALID_HANDLE_VALUE)
    {
        return;
    }
    HANDLE h = static_cast<HANDLE>(handle);
    handle = INVALID_HANDLE_VALUE;
    if (!::CloseHandle(h))
    {
        internal::ThrowIOError(path, "close", internal::LastSystemError());
    }
#else
    if (fd < 0)
    {
        return;
    }
    const int oldFd = fd;
    fd = -1;
    // close 失败时描述符同样已释放，不能重试
    if (::close(oldFd) != 0 && errno != EINTR)
    {
        internal::ThrowIOError(path, "close", internal::LastSystemError());
    }
#endif
}

bool PC_File::IsOpen() const
{
#if defined(_WIN32)
    return handle != INVALID_HANDLE_VALUE;
#else
    return fd >= 0;
#endif
}

const string& PC_File::GetPath() const
{
    return path;
}

size_t PC_File::ReadAt(uint64_t offset, void* buffer, size_t size)
{
    if (!IsOpen())
    {
        internal::ThrowIOError(path, "read", 0);
    }

    unsigned char* out = static_cast<unsigned char*>(buffer);
    size_t total = 0;
    while (total < size)
    {
        const uint64_t pos = offset + total;
#if defined(_WIN32)
        const DWORD want = static_cast<DWORD>(min(size - total, internal::kMaxIoChunk));
        OVERLAPPED ov;
        ZeroMemory(&ov, sizeof(ov));
        ov.Offset = static_cast<DWORD>(pos & 0xFFFFFFFFull);
        ov.OffsetHigh = static_cast<DWORD>(pos >> 32);
        DWORD got = 0;
        if (!::ReadFile(static_cast<HANDLE>(handle), out + total, want, &got, &ov))
        {
            const DWORD ec = ::GetLastError();
            if (ec == ERROR_HANDLE_EOF)
            {
                break;
            }
            internal::ThrowIOError(path, "read", static_cast<int>(ec));
        }
#else
        const ssize_t got = ::pread(fd, out + total, size - total, static_cast<off_t>(pos));
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            internal::ThrowIOError(path, "read", internal::LastSystemError());
        }
#endif
        if (got == 0)
        {
            break;
        }
        total += static_cast<size_t>(got);
    }
    return total;
}

void PC_File::WriteAt(uint64_t offset, const void* buffer, size_t size)
{
    if (!IsOpen())
    {
        internal::ThrowIOError(path, "write", 0);
    }

    const unsigned char* in = static_cast<const unsigned char*>(buffer);
    size_t total = 0;
    while (total < size)
    {
        const uint64_t pos = offset + total;
#if defined(_WIN32)
        const DWORD want = static_cast<DWORD>(min(size - total, internal::kMaxIoChunk));
        OVERLAPPED ov;
        ZeroMemory(&ov, sizeof(ov));
        ov.Offset = static_cast<DWORD>(pos & 0xFFFFFFFFull);
        ov.OffsetHigh = static_cast<DWORD>(pos >> 32);
        DWORD put = 0;
        if (!::WriteFile(static_cast<HANDLE>(handle), in + total, want, &put, &ov))
        {
            internal::ThrowIOError(path, "write", internal::LastSystemError());
        }
#else
        const ssize_t put = ::pwrite(fd, in + total, size - total, static_cast<off_t>(pos));
        if (put < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            internal::ThrowIOError(path, "write", internal::LastSystemError());
        }
#endif
        if (put == 0)
        {
            // 磁盘满时部分平台返回 0 而不设置错误码
            internal::ThrowIOError(path, "write", 0);
        }
        total += static_cast<size_t>(put);
    }
}

void PC_File::Resize(uint64_t newSize)
{
    if (!IsOpen())
    {
        internal::ThrowIOError(path, "resize", 0);
    }

#if defined(_WIN32)
    FILE_END_OF_FILE_INFO info;
    info.EndOfFile.QuadPart = static_cast<LONGLONG>(newSize);
    if (!::SetFileInformationByHandle(static_cast<HANDLE>(handle), FileEndOfFileInfo, &info, sizeof(info)))
    {
        internal::ThrowIOError(path, "resize", internal::LastSystemError());
    }
#else
    int rc = 0;
    do
    {
        rc = ::ftruncate(fd, static_cast<off_t>(newSize));
    } while (rc != 0 && errno == EINTR);
    if (rc != 0)
    {
        internal::ThrowIOError(path, "resize", internal::LastSystemError());
    }
#endif
}

uint64_t PC_File::GetSize() const
{
    if (!IsOpen())
    {
        internal::ThrowIOError(path, "stat", 0);
    }

#if defined(_WIN32)
    LARGE_INTEGER size;
    if (!::GetFileSizeEx(static_cast<HANDLE>(handle), &size))
    {
        internal::ThrowIOError(path, "stat", internal::LastSystemError());
    }
    return static_cast<uint64_t>(size.QuadPart);
#else
    struct stat st;
    if (::fstat(fd, &st) != 0)
    {
        internal::ThrowIOError(path, "stat", internal::LastSystemError());
    }
    return static_cast<uint64_t>(st.st_size);
#endif
}

void PC_File::Reset() noexcept
{
#if defined(_WIN32)
    if (handle != INVALID_HANDLE_VALUE)
    {
        ::CloseHandle(static_cast<HANDLE>(handle));
        handle = INVALID_HANDLE_VALUE;
    }
#else
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
#endif
}
