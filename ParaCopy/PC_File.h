#ifndef PARACOPY_FILE_H_H
#define PARACOPY_FILE_H_H

#include "ParaCopyPort.h"
#include <cstddef>
#include <cstdint>
#include <string>

#pragma warning(push)
#pragma warning(disable : 4251)

/*
    PC_File：按绝对偏移读写的文件句柄（RAII）。

    - ReadAt / WriteAt 不依赖也不改变共享的文件指针（POSIX 为 pread/pwrite，
      Windows 为带 OVERLAPPED 偏移的 ReadFile/WriteFile），
      因此多个线程各自打开同一文件、写入互不重叠的区间时不需要加锁。
    - 所有失败均抛出 PC_IOError（errorCode 为 IOFailure）。
    - 不可拷贝，可移动。
*/
class PARACOPY_PORT PC_File
{
public:
    enum class OpenMode
    {
        Read,               // 只读，文件必须存在
        ReadWriteExisting,  // 读写，文件必须存在，不截断
        WriteTruncate       // 只写，不存在则创建，存在则截断为 0
    };

    PC_File();
    PC_File(const std::string& filePathUtf8, OpenMode mode);
    ~PC_File();

    PC_File(const PC_File&) = delete;
    PC_File& operator=(const PC_File&) = delete;
    PC_File(PC_File&& other) noexcept;
    PC_File& operator=(PC_File&& other) noexcept;

    void Open(const std::string& filePathUtf8, OpenMode mode);
    void Close();
    bool IsOpen() const;

    const std::string& GetPath() const;

    /**
     * @brief 从 offset 处读取至多 size 字节。
     *
     * @return 实际读到的字节数；返回值小于 size 仅表示到达文件末尾（EINTR 与短读在内部重试）。
     */
    size_t ReadAt(uint64_t offset, void* buffer, size_t size);

    // 把 size 字节全部写到 offset 处，短写在内部续写
    void WriteAt(uint64_t offset, const void* buffer, size_t size);

    // 设置文件长度（扩展部分为稀疏或零填充，取决于文件系统）
    void Resize(uint64_t newSize);

    uint64_t GetSize() const;

private:
    void Reset() noexcept;

    std::string path;
#if defined(_WIN32)
    void* handle;
#else
    int fd;
#endif
};

#pragma warning(pop)

#endif
