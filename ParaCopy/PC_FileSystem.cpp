#include "PC_FileSystem.h"
#include "PC_Utf8String.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sys/stat.h>

#if defined(_WIN32)
#   ifndef NOMINMAX
#       define NOMINMAX
#   endif
#   include <windows.h>
#else
#   include <dirent.h>
#   include <unistd.h>
#   include <limits.h>
#   include <sys/types.h>
#endif

using namespace std;

namespace internal
{
    static inline bool IsSlash(char ch)
    {
        return ch == '/' || ch == '\\';
    }

    static string ToForwardSlashes(const string& p)
    {
        string s = p;
        replace(s.begin(), s.end(), '\\', '/');
        return s;
    }

    // 去掉末尾多余的分隔符，但保留根（"/"、"C:/"）
    static string StripTrailingSlashes(const string& in)
    {
        string s = ToForwardSlashes(in);
        while (s.size() > 1 && s.back() == '/')
        {
#if defined(_WIN32)
            if (s.size() == 3 && s[1] == ':')
            {
                break;
            }
#endif
            s.pop_back();
        }
        return s;
    }

    static string EnsureTrailingSlash(const string& in)
    {
        string s = ToForwardSlashes(in);
        if (s.empty() || s.back() != '/')
        {
            s.push_back('/');
        }
        return s;
    }

#if defined(_WIN32)
    static wstring ToNativeWide(const string& pathUtf8)
    {
        string native = pathUtf8;
        replace(native.begin(), native.end(), '/', '\\');
        return Utf8ToWString(native);
    }
#endif

    // exists=false 表示不存在；返回 false 仅表示路径无法转换
    static bool StatPath(const string& pathUtf8, bool& exists, bool& isDir, bool& isRegular)
    {
        exists = false;
        isDir = false;
        isRegular = false;
#if defined(_WIN32)
        const wstring w = ToNativeWide(pathUtf8);
        if (w.empty())
        {
            return false;
        }
        const DWORD attr = ::GetFileAttributesW(w.c_str());
        if (attr == INVALID_FILE_ATTRIBUTES)
        {
            return true;
        }
        exists = true;
        isDir = (attr & FILE_ATTRIBUTE_DIRECTORY) != 0;
        isRegular = !isDir && (attr & FILE_ATTRIBUTE_DEVICE) == 0;
        return true;
#else
        struct stat st;
        if (::stat(ToForwardSlashes(pathUtf8).c_str(), &st) != 0)
        {
            return true;
        }
        exists = true;
        isDir = S_ISDIR(st.st_mode);
        isRegular = S_ISREG(st.st_mode);
        return true;
#endif
    }

    // 仅创建单级目录；“已存在且为目录”视为成功
    static bool MakeOneDirectory(const string& dirUtf8)
    {
#if defined(_WIN32)
        const wstring w = ToNativeWide(dirUtf8);
        if (w.empty())
        {
            return false;
        }
        if (::CreateDirectoryW(w.c_str(), nullptr))
        {
            return true;
        }
        const DWORD ec = ::GetLastError();
        if (ec != ERROR_ALREADY_EXISTS && ec != ERROR_ACCESS_DENIED)
        {
            return false;
        }
        // 盘符根等对 CreateDirectoryW 返回 ACCESS_DENIED，最终以属性为准
        const DWORD attr = ::GetFileAttributesW(w.c_str());
        return attr != INVALID_FILE_ATTRIBUTES && (attr & FILE_ATTRIBUTE_DIRECTORY) != 0;
#else
        if (::mkdir(dirUtf8.c_str(), 0755) == 0)
        {
            return true;
        }
        if (errno != EEXIST)
        {
            return false;
        }
        // 可能是其他线程刚刚创建，也可能是同名文件阻塞
        struct stat st;
        return ::stat(dirUtf8.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
#endif
    }

    static bool MakeDirsRecursive(const string& dirUtf8)
    {
        const string norm = EnsureTrailingSlash(dirUtf8);

        size_t start = 0;
#if defined(_WIN32)
        if (norm.size() >= 3 && norm[1] == ':' && norm[2] == '/')
        {
            start = 3;
        }
        else if (norm.size() >= 2 && norm[0] == '/' && norm[1] == '/')
        {
            // UNC：跳过 //server/share/
            size_t p = norm.find('/', 2);
            if (p != string::npos)
            {
                p = norm.find('/', p + 1);
            }
            start = (p == string::npos) ? norm.size() : p + 1;
        }
        else if (!norm.empty() && norm[0] == '/')
        {
            start = 1;
        }
#else
        if (!norm.empty() && norm[0] == '/')
        {
            start = 1;
        }
#endif

        for (size_t i = start; i < norm.size(); i++)
        {
            if (norm[i] != '/')
            {
                continue;
            }
            const string sub = norm.substr(0, i);
            if (sub.empty() || sub.back() == '/')
            {
                continue;
            }
            if (!MakeOneDirectory(sub))
            {
                return false;
            }
        }
        return true;
    }
}

bool PC_IsFileExists(const string& filePathUtf8)
{
    bool exists = false;
    bool isDir = false;
    bool isRegular = false;
    if (!internal::StatPath(filePathUtf8, exists, isDir, isRegular))
    {
        return false;
    }
    return exists && isRegular;
}

bool PC_IsDirectoryExists(const string& dirPathUtf8)
{
    bool exists = false;
    bool isDir = false;
    bool isRegular = false;
    if (!internal::StatPath(dirPathUtf8, exists, isDir, isRegular))
    {
        return false;
    }
    return exists && isDir;
}

bool PC_IsPathExists(const string& pathUtf8)
{
    bool exists = false;
    bool isDir = false;
    bool isRegular = false;
    if (!internal::StatPath(pathUtf8, exists, isDir, isRegular))
    {
        return false;
    }
    return exists;
}

bool PC_CreateDirectory(const string& dirPathUtf8)
{
    if (dirPathUtf8.empty())
    {
        return false;
    }
    return internal::MakeDirsRecursive(dirPathUtf8);
}

string PC_GetFileName(const string& pathUtf8)
{
    const string s = internal::StripTrailingSlashes(pathUtf8);
    if (s == "/")
    {
        return string();
    }
    const size_t pos = s.find_last_of('/');
    if (pos == string::npos)
    {
        return s;
    }
    return s.substr(pos + 1);
}

string PC_NormalizePath(const string& pathUtf8)
{
    const string s = internal::ToForwardSlashes(pathUtf8);

    // 根前缀："/"、"C:/"、"//server/share/"
    string root;
    size_t start = 0;
#if defined(_WIN32)
    if (s.size() >= 2 && s[1] == ':')
    {
        root = s.substr(0, 2);
        start = 2;
    }
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/')
    {
        size_t p = s.find('/', 2);
        p = (p == string::npos) ? string::npos : s.find('/', p + 1);
        root = (p == string::npos) ? s + "/" : s.substr(0, p + 1);
        start = (p == string::npos) ? s.size() : p + 1;
    }
    else
#endif
    if (start < s.size() && s[start] == '/')
    {
        root += '/';
        start++;
    }

    vector<string> parts;
    size_t pos = start;
    while (pos <= s.size())
    {
        size_t next = s.find('/', pos);
        if (next == string::npos)
        {
            next = s.size();
        }
        const string part = s.substr(pos, next - pos);
        pos = next + 1;

        if (part.empty() || part == ".")
        {
            continue;
        }
        if (part == "..")
        {
            if (!parts.empty() && parts.back() != "..")
            {
                parts.pop_back();
            }
            else if (root.empty())
            {
                parts.push_back(part);
            }
            continue;
        }
        parts.push_back(part);
    }

    string out = root;
    for (size_t i = 0; i < parts.size(); i++)
    {
        if (i > 0)
        {
            out += '/';
        }
        out += parts[i];
    }
    return out.empty() ? string(".") : out;
}

string PC_GetDirectoryPath(const string& filePathUtf8)
{
    const string s = internal::ToForwardSlashes(filePathUtf8);
    const size_t pos = s.find_last_of('/');
    if (pos == string::npos)
    {
        return string();
    }
    return s.substr(0, pos + 1);
}

string PC_JoinPath(const string& basePathUtf8, const string& childPathUtf8)
{
    if (basePathUtf8.empty())
    {
        return internal::ToForwardSlashes(childPathUtf8);
    }
    if (childPathUtf8.empty())
    {
        return internal::ToForwardSlashes(basePathUtf8);
    }

    string child = internal::ToForwardSlashes(childPathUtf8);
    size_t skip = 0;
    while (skip < child.size() && child[skip] == '/')
    {
        skip++;
    }
    return internal::EnsureTrailingSlash(basePathUtf8) + child.substr(skip);
}

bool PC_TryGetFileSize(const string& filePathUtf8, uint64_t& sizeByte)
{
#if defined(_WIN32)
    const wstring w = internal::ToNativeWide(filePathUtf8);
    if (w.empty())
    {
        return false;
    }
    WIN32_FILE_ATTRIBUTE_DATA data;
    if (!::GetFileAttributesExW(w.c_str(), GetFileExInfoStandard, &data))
    {
        return false;
    }
    if (data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY)
    {
        return false;
    }
    ULARGE_INTEGER size;
    size.LowPart = data.nFileSizeLow;
    size.HighPart = data.nFileSizeHigh;
    sizeByte = static_cast<uint64_t>(size.QuadPart);
    return true;
#else
    struct stat st;
    if (::stat(internal::ToForwardSlashes(filePathUtf8).c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return false;
    }
    sizeByte = static_cast<uint64_t>(st.st_size);
    return true;
#endif
}

string PC_GetCanonicalPath(const string& pathUtf8)
{
    if (pathUtf8.empty())
    {
        return string();
    }
#if defined(_WIN32)
    const wstring w = internal::ToNativeWide(pathUtf8);
    if (w.empty())
    {
        return string();
    }
    HANDLE h = ::CreateFileW(w.c_str(), 0, FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
        OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        return string();
    }
    vector<wchar_t> buf(512);
    DWORD len = 0;
    for (;;)
    {
        len = ::GetFinalPathNameByHandleW(h, buf.data(), static_cast<DWORD>(buf.size()), FILE_NAME_NORMALIZED);
        if (len == 0 || len < buf.size())
        {
            break;
        }
        buf.resize(static_cast<size_t>(len) + 1);
    }
    ::CloseHandle(h);
    if (len == 0)
    {
        return string();
    }
    wstring full(buf.data(), len);
    // 去掉 "\\?\" 前缀
    if (full.compare(0, 4, L"\\\\?\\") == 0)
    {
        full = full.substr(4);
    }
    return internal::StripTrailingSlashes(WStringToUtf8(full));
#else
    char* resolved = ::realpath(pathUtf8.c_str(), nullptr);
    if (!resolved)
    {
        return string();
    }
    const string out(resolved);
    ::free(resolved);
    return internal::StripTrailingSlashes(out);
#endif
}

bool PC_IsSameFile(const string& pathAUtf8, const string& pathBUtf8)
{
#if defined(_WIN32)
    auto queryId = [](const string& pathUtf8, BY_HANDLE_FILE_INFORMATION& info) -> bool
        {
            const wstring w = internal::ToNativeWide(pathUtf8);
            if (w.empty())
            {
                return false;
            }
            HANDLE h = ::CreateFileW(w.c_str(), 0, FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
            if (h == INVALID_HANDLE_VALUE)
            {
                return false;
            }
            const BOOL ok = ::GetFileInformationByHandle(h, &info);
            ::CloseHandle(h);
            return ok != FALSE;
        };

    BY_HANDLE_FILE_INFORMATION infoA;
    BY_HANDLE_FILE_INFORMATION infoB;
    if (!queryId(pathAUtf8, infoA) || !queryId(pathBUtf8, infoB))
    {
        return false;
    }
    return infoA.dwVolumeSerialNumber == infoB.dwVolumeSerialNumber &&
        infoA.nFileIndexHigh == infoB.nFileIndexHigh &&
        infoA.nFileIndexLow == infoB.nFileIndexLow;
#else
    struct stat stA;
    struct stat stB;
    if (::stat(pathAUtf8.c_str(), &stA) != 0 || ::stat(pathBUtf8.c_str(), &stB) != 0)
    {
        return false;
    }
    return stA.st_dev == stB.st_dev && stA.st_ino == stB.st_ino;
#endif
}

bool PC_IsSameOrSubPath(const string& parentPathUtf8, const string& childPathUtf8)
{
    const string parent = internal::StripTrailingSlashes(parentPathUtf8);
    const string child = internal::StripTrailingSlashes(childPathUtf8);
    if (parent.empty() || child.empty())
    {
        return false;
    }
#if defined(_WIN32)
    // NTFS 默认大小写不敏感
    const string p = Utf8ToUpper(parent);
    const string c = Utf8ToUpper(child);
#else
    const string& p = parent;
    const string& c = child;
#endif
    if (c == p)
    {
        return true;
    }
    const string prefix = internal::EnsureTrailingSlash(p);
    return c.size() > prefix.size() && c.compare(0, prefix.size(), prefix) == 0;
}

string PC_GetExeDirectory()
{
#if defined(_WIN32)
    vector<wchar_t> buf(512);
    for (;;)
    {
        const DWORD len = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
        {
            return string();
        }
        if (len < buf.size() - 1)
        {
            buf[len] = L'\0';
            break;
        }
        buf.resize(buf.size() * 2);
    }
    const string full = internal::ToForwardSlashes(WStringToUtf8(wstring(buf.data())));
#else
    vector<char> buf(256);
    for (;;)
    {
        const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
        if (n < 0)
        {
            return string();
        }
        if (static_cast<size_t>(n) < buf.size() - 1)
        {
            buf[static_cast<size_t>(n)] = '\0';
            break;
        }
        buf.resize(buf.size() * 2);
    }
    string full(buf.data());
    const string deletedTag = " (deleted)";
    if (full.size() > deletedTag.size() && full.compare(full.size() - deletedTag.size(), deletedTag.size(), deletedTag) == 0)
    {
        full.erase(full.size() - deletedTag.size());
    }
#endif
    return PC_GetDirectoryPath(full);
}

bool PC_ListDirectory(const string& dirPathUtf8, vector<PC_DirEntry>& entries)
{
    entries.clear();
    const string dir = internal::EnsureTrailingSlash(dirPathUtf8);

#if defined(_WIN32)
    const wstring pattern = internal::ToNativeWide(dir + "*");
    if (pattern.empty())
    {
        return false;
    }
    WIN32_FIND_DATAW fd;
    HANDLE h = ::FindFirstFileExW(pattern.c_str(), FindExInfoBasic, &fd, FindExSearchNameMatch, nullptr, 0);
    if (h == INVALID_HANDLE_VALUE)
    {
        return false;
    }
    do
    {
        const wchar_t* name = fd.cFileName;
        if (name[0] == L'.' && (name[1] == L'\0' || (name[1] == L'.' && name[2] == L'\0')))
        {
            continue;
        }
        PC_DirEntry entry;
        entry.name = WStringToUtf8(name);
        entry.size = 0;
        const bool isDir = (fd.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
        const bool isReparse = (fd.dwFileAttributes & FILE_ATTRIBUTE_REPARSE_POINT) != 0;
        if (isDir)
        {
            entry.type = isReparse ? PC_DirEntryType::SymlinkToDirectory : PC_DirEntryType::Directory;
        }
        else if ((fd.dwFileAttributes & FILE_ATTRIBUTE_DEVICE) != 0)
        {
            entry.type = PC_DirEntryType::Other;
        }
        else
        {
            entry.type = PC_DirEntryType::RegularFile;
            ULARGE_INTEGER size;
            size.LowPart = fd.nFileSizeLow;
            size.HighPart = fd.nFileSizeHigh;
            entry.size = static_cast<uint64_t>(size.QuadPart);
            // 文件符号链接报告的是链接本身的大小，改用目标大小
            if (isReparse && !PC_TryGetFileSize(dir + entry.name, entry.size))
            {
                entry.type = PC_DirEntryType::Other;
                entry.size = 0;
            }
        }
        entries.push_back(entry);
    } while (::FindNextFileW(h, &fd));
    ::FindClose(h);
#else
    DIR* d = ::opendir(dir.c_str());
    if (!d)
    {
        return false;
    }
    while (dirent* ent = ::readdir(d))
    {
        const char* name = ent->d_name;
        if (name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0')))
        {
            continue;
        }

        PC_DirEntry entry;
        entry.name = name;
        entry.type = PC_DirEntryType::Other;
        entry.size = 0;

        const string full = dir + name;
        struct stat lst;
        if (::lstat(full.c_str(), &lst) == 0)
        {
            if (S_ISDIR(lst.st_mode))
            {
                entry.type = PC_DirEntryType::Directory;
            }
            else if (S_ISREG(lst.st_mode))
            {
                entry.type = PC_DirEntryType::RegularFile;
                entry.size = static_cast<uint64_t>(lst.st_size);
            }
            else if (S_ISLNK(lst.st_mode))
            {
                struct stat st;
                if (::stat(full.c_str(), &st) == 0)
                {
                    if (S_ISDIR(st.st_mode))
                    {
                        entry.type = PC_DirEntryType::SymlinkToDirectory;
                    }
                    else if (S_ISREG(st.st_mode))
                    {
                        entry.type = PC_DirEntryType::RegularFile;
                        entry.size = static_cast<uint64_t>(st.st_size);
                    }
                }
            }
        }
        entries.push_back(entry);
    }
    ::closedir(d);
#endif

    sort(entries.begin(), entries.end(), [](const PC_DirEntry& a, const PC_DirEntry& b) {
        return a.name < b.name;
    });
    return true;
}
