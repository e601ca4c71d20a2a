#ifndef PARACOPY_FILESYSTEM_H_H
#define PARACOPY_FILESYSTEM_H_H

#include "ParaCopyPort.h"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief 判断给定 UTF-8 路径是否存在且为“常规文件”（跟随符号链接）。
 *
 * @remarks Windows 使用 GetFileAttributesW；Linux 使用 stat 并判定 S_ISREG。
 */
PARACOPY_PORT bool PC_IsFileExists(const std::string& filePathUtf8);

/**
 * @brief 判断给定 UTF-8 路径是否存在且为目录（跟随符号链接）。
 */
PARACOPY_PORT bool PC_IsDirectoryExists(const std::string& dirPathUtf8);

/**
 * @brief 判断路径是否存在（任意类型）。
 */
PARACOPY_PORT bool PC_IsPathExists(const std::string& pathUtf8);

/**
 * @brief 递归创建目录，等价于“mkdir -p”。
 *
 * @return true  全部级别创建成功或已存在；
 * @return false 任一层创建失败（同名常规文件阻塞、权限不足等）。
 *
 * @threadsafety 幂等：多个线程同时创建同一目录时，“已存在”被视为成功，不需要额外加锁。
 */
PARACOPY_PORT bool PC_CreateDirectory(const std::string& dirPathUtf8);

/**
 * @brief 获取路径最后一级名称（含扩展名）。末尾的分隔符会被忽略：
 *        "/data/src/" -> "src"，"a/b.txt" -> "b.txt"，"/" -> ""。
 */
PARACOPY_PORT std::string PC_GetFileName(const std::string& pathUtf8);

/**
 * @brief 纯字符串的路径规范化：统一正斜杠，去掉多余分隔符与 "."，把 ".." 与前一级抵消。
 *        不访问文件系统，不解析符号链接。
 *        "src/./a/../b/" -> "src/b"，"/x/../.." -> "/"，"../a" -> "../a"，"" 或 "a/.." -> "."。
 */
PARACOPY_PORT std::string PC_NormalizePath(const std::string& pathUtf8);

/**
 * @brief 获取父目录路径（统一使用正斜杠，且以“/”结尾）；无分隔符时返回空串。
 *        只做字符串截取，不访问文件系统。
 */
PARACOPY_PORT std::string PC_GetDirectoryPath(const std::string& filePathUtf8);

/**
 * @brief 拼接路径，保证两段之间恰好一个“/”。任一段为空时返回另一段。
 */
PARACOPY_PORT std::string PC_JoinPath(const std::string& basePathUtf8, const std::string& childPathUtf8);

/**
 * @brief 读取常规文件的 64 位大小。失败（不存在、不是常规文件）返回 false。
 */
PARACOPY_PORT bool PC_TryGetFileSize(const std::string& filePathUtf8, uint64_t& sizeByte);

/**
 * @brief 解析为绝对、规范化路径（解析 "."、".." 与符号链接），统一正斜杠，不以“/”结尾（根除外）。
 *        路径必须存在；失败返回空串。
 */
PARACOPY_PORT std::string PC_GetCanonicalPath(const std::string& pathUtf8);

/**
 * @brief 判断两个已存在路径是否指向同一个文件（POSIX 比较 st_dev/st_ino；Windows 比较卷序列号与文件索引）。
 */
PARACOPY_PORT bool PC_IsSameFile(const std::string& pathAUtf8, const std::string& pathBUtf8);

/**
 * @brief 字符串层面判断 childPath 是否等于 parentPath 或位于其下（两者应为规范化绝对路径）。
 */
PARACOPY_PORT bool PC_IsSameOrSubPath(const std::string& parentPathUtf8, const std::string& childPathUtf8);

/**
 * @brief 获取当前可执行程序所在目录（UTF-8，正斜杠，以“/”结尾）。失败返回空串。
 */
PARACOPY_PORT std::string PC_GetExeDirectory();

enum class PC_DirEntryType
{
    RegularFile,
    Directory,
    SymlinkToDirectory, // 指向目录的符号链接，扫描时不跟随
    Other               // 设备、FIFO、socket、悬空链接等
};

struct PARACOPY_PORT PC_DirEntry
{
    std::string name;       // 条目名（不含路径）
    PC_DirEntryType type;
    uint64_t size;          // 仅 RegularFile 有效
};

/**
 * @brief 列出目录的直接子项（不含 "." 与 ".."），按名称字节序升序排列。
 *
 * @return false 目录无法打开。单个条目 stat 失败时按 Other 记录，不中断遍历。
 *
 * @remarks 指向常规文件的符号链接按 RegularFile 报告（大小为目标文件大小）。
 */
PARACOPY_PORT bool PC_ListDirectory(const std::string& dirPathUtf8, std::vector<PC_DirEntry>& entries);

#endif
