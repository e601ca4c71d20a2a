#include "PC_Config.h"
#include "PC_BaseTypes.h"
#include "PC_FileSystem.h"
#include "PC_Utf8String.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <vector>
#include <sys/stat.h>
#if defined(_WIN32)
#   ifndef NOMINMAX
#       define NOMINMAX
#   endif
#   include <windows.h>
#   include <process.h>
#else
#   include <fcntl.h>
#   include <unistd.h>
#   include <sys/types.h>
#endif

using namespace std;

namespace internal
{
    static const char* kThreadCountKey = "PC_DefaultThreadCount";
    static const char* kBlockSizeKey = "PC_BlockSize";
    static const char* kStatusIntervalKey = "PC_StatusIntervalMs";

    static string GetEnvUtf8(const char* name)
    {
#if defined(_WIN32)
        const wstring wideName = Utf8ToWString(name);
        const DWORD len = ::GetEnvironmentVariableW(wideName.c_str(), nullptr, 0);
        if (len == 0)
        {
            return string();
        }
        vector<wchar_t> buf(len, L'\0');
        const DWORD written = ::GetEnvironmentVariableW(wideName.c_str(), buf.data(), len);
        if (written == 0 || written >= len)
        {
            return string();
        }
        return WStringToUtf8(wstring(buf.data(), written));
#else
        const char* value = getenv(name);
        if (value && *value)
        {
            return MakeUtf8String(value);
        }
        return string();
#endif
    }

    static string GetConfigFile()
    {
#if defined(_WIN32)
        const string appData = GetEnvUtf8("APPDATA");
        if (appData.empty())
        {
            return string("./ParaCopy/config.kv");
        }
        return Utf8Replace(appData, "\\", "/") + "/ParaCopy/config.kv";
#else
        const string xdg = GetEnvUtf8("XDG_CONFIG_HOME"); // XDG Base Directory
        string base;
        if (!xdg.empty())
        {
            base = xdg;
        }
        else
        {
            const string home = GetEnvUtf8("HOME");
            if (home.empty())
            {
                return string("./ParaCopy/config.kv");
            }
            base = home + "/.config";
        }
        return base + "/ParaCopy/config.kv";
#endif
    }

    // 键值转义：'\\'、'='、换行、回车与行首 '#' 前加反斜杠，其余 UTF-8 字节原样写出
    static string EscapeField(const string& text)
    {
        string out;
        out.reserve(text.size() + 8);
        for (size_t i = 0; i < text.size(); i++)
        {
            const char ch = text[i];
            switch (ch)
            {
            case '\\':
                out += "\\\\";
                break;
            case '=':
                out += "\\=";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '#':
                out += (i == 0) ? "\\#" : "#";
                break;
            default:
                out.push_back(ch);
                break;
            }
        }
        return out;
    }

    static bool UnescapeField(const string& text, string& out)
    {
        out.clear();
        bool pendingEscape = false;
        for (const char ch : text)
        {
            if (!pendingEscape)
            {
                if (ch == '\\')
                {
                    pendingEscape = true;
                }
                else
                {
                    out.push_back(ch);
                }
                continue;
            }

            pendingEscape = false;
            if (ch == 'n')
            {
                out.push_back('\n');
            }
            else if (ch == 'r')
            {
                out.push_back('\r');
            }
            else if (ch == '\\' || ch == '=' || ch == '#')
            {
                out.push_back(ch);
            }
            else
            {
                return false;
            }
        }
        return !pendingEscape;
    }

    // 第一个未转义的 '=' 的位置
    static size_t FindSeparator(const string& line)
    {
        for (size_t i = 0; i < line.size(); i++)
        {
            if (line[i] == '\\')
            {
                i++;
            }
            else if (line[i] == '=')
            {
                return i;
            }
        }
        return string::npos;
    }

    static bool AtomicWriteFile(const string& path, const string& content)
    {
        const string dir = PC_GetDirectoryPath(path);
        if (!dir.empty() && !PC_CreateDirectory(dir))
        {
            return false;
        }

        // 临时文件放在同一目录，保证 rename 原子
        ostringstream oss;
#if defined(_WIN32)
        oss << path << ".tmp." << ::_getpid() << "." << ::time(nullptr);
#else
        oss << path << ".tmp." << ::getpid() << "." << ::time(nullptr);
#endif
        const string tmp = oss.str();

#if defined(_WIN32)
        const wstring tmpW = Utf8ToWString(Utf8Replace(tmp, "/", "\\"));
        const wstring pathW = Utf8ToWString(Utf8Replace(path, "/", "\\"));
        HANDLE h = ::CreateFileW(tmpW.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE)
        {
            return false;
        }
        DWORD written = 0;
        const BOOL writeOk = content.empty() ||
            (::WriteFile(h, content.data(), static_cast<DWORD>(content.size()), &written, nullptr) && written == content.size());
        const BOOL flushOk = writeOk && ::FlushFileBuffers(h);
        ::CloseHandle(h);
        if (!flushOk)
        {
            ::DeleteFileW(tmpW.c_str());
            return false;
        }
        if (!::MoveFileExW(tmpW.c_str(), pathW.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH))
        {
            ::DeleteFileW(tmpW.c_str());
            return false;
        }
        return true;
#else
        // O_CREAT|O_EXCL 防止覆盖其他进程的临时文件
        const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            return false;
        }

        const char* data = content.data();
        size_t left = content.size();
        while (left > 0)
        {
            const ssize_t n = ::write(fd, data, left);
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                ::close(fd);
                ::unlink(tmp.c_str());
                return false;
            }
            data += n;
            left -= static_cast<size_t>(n);
        }

        if (::fsync(fd) != 0)
        {
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        if (::close(fd) != 0)
        {
            ::unlink(tmp.c_str());
            return false;
        }

        if (::rename(tmp.c_str(), path.c_str()) != 0)
        {
            ::unlink(tmp.c_str());
            return false;
        }

        // 刷新目录项
        const int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
        if (dfd >= 0)
        {
            ::fsync(dfd);
            ::close(dfd);
        }
        return true;
#endif
    }

    using ConfigMap = unordered_map<string, string>;

    // 文件不存在时得到空表；空行、'#' 注释行与无法解析的行被跳过
    static bool LoadAllKv(const string& filePath, ConfigMap& entries)
    {
        entries.clear();
        if (!PC_IsFileExists(filePath))
        {
            return true;
        }

#if defined(_WIN32)
        ifstream input(Utf8ToWString(Utf8Replace(filePath, "/", "\\")).c_str(), ios::in | ios::binary);
#else
        ifstream input(filePath.c_str(), ios::in | ios::binary);
#endif
        if (!input)
        {
            return false;
        }

        string line;
        while (getline(input, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#')
            {
                continue;
            }

            const size_t sep = FindSeparator(line);
            string key;
            string value;
            if (sep == string::npos || !UnescapeField(line.substr(0, sep), key) ||
                !UnescapeField(line.substr(sep + 1), value) || key.empty())
            {
                continue;
            }
            entries[key] = value;
        }
        return true;
    }

    static bool StoreAllKv(const string& filePath, const ConfigMap& entries)
    {
        vector<pair<string, string>> sorted(entries.begin(), entries.end());
        sort(sorted.begin(), sorted.end());

        string content = "# ParaCopy settings\n";
        for (const pair<string, string>& entry : sorted)
        {
            content += EscapeField(entry.first);
            content += '=';
            content += EscapeField(entry.second);
            content += '\n';
        }
        return AtomicWriteFile(filePath, content);
    }

    // 读出整张表交给 edit 修改；edit 返回 false 表示不需要写回
    template <typename Edit>
    static bool ModifyConfig(const string& keyUtf8, Edit edit)
    {
        if (keyUtf8.empty())
        {
            return false;
        }

        const string filePath = GetConfigFile();
        ConfigMap entries;
        if (!LoadAllKv(filePath, entries) || !edit(entries))
        {
            return false;
        }
        return StoreAllKv(filePath, entries);
    }

    static bool LookupConfig(const string& keyUtf8, string* valueUtf8)
    {
        ConfigMap entries;
        if (keyUtf8.empty() || !LoadAllKv(GetConfigFile(), entries))
        {
            return false;
        }

        const ConfigMap::const_iterator found = entries.find(keyUtf8);
        if (found == entries.end())
        {
            return false;
        }
        if (valueUtf8)
        {
            *valueUtf8 = found->second;
        }
        return true;
    }

    // 纯十进制非负整数，不接受符号与空白
    static bool ParseUnsigned(const string& text, uint64_t& value)
    {
        const string s = Utf8Trim(text);
        if (s.empty() || s.size() > 20)
        {
            return false;
        }
        uint64_t result = 0;
        for (size_t i = 0; i < s.size(); i++)
        {
            const char ch = s[i];
            if (ch < '0' || ch > '9')
            {
                return false;
            }
            const uint64_t digit = static_cast<uint64_t>(ch - '0');
            if (result > (UINT64_MAX - digit) / 10)
            {
                return false;
            }
            result = result * 10 + digit;
        }
        value = result;
        return true;
    }

    static bool ReadUnsignedConfig(const char* key, uint64_t& value)
    {
        string text;
        if (!GetPcConfig(key, text))
        {
            return false;
        }
        return ParseUnsigned(text, value);
    }
}

string GetPcConfigPath()
{
    return internal::GetConfigFile();
}

bool IsExistsPcConfig(const string& keyUtf8)
{
    return internal::LookupConfig(keyUtf8, nullptr);
}

bool GetPcConfig(const string& keyUtf8, string& valueUtf8)
{
    return internal::LookupConfig(keyUtf8, &valueUtf8);
}

bool SetPcConfig(const string& keyUtf8, const string& valueUtf8)
{
    return internal::ModifyConfig(keyUtf8, [&](internal::ConfigMap& entries) {
        entries[keyUtf8] = valueUtf8;
        return true;
    });
}

bool DeletePcConfig(const string& keyUtf8)
{
    return internal::ModifyConfig(keyUtf8, [&](internal::ConfigMap& entries) {
        return entries.erase(keyUtf8) > 0;
    });
}

unordered_map<string, string> GetAllPcConfig()
{
    internal::ConfigMap entries;
    if (!internal::LoadAllKv(internal::GetConfigFile(), entries))
    {
        entries.clear();
    }
    return entries;
}

PC_CopySettings::PC_CopySettings() : workerCount(PC_DefaultWorkerCount), blockSize(PC_DefaultBlockSize),
statusIntervalMs(PC_DefaultStatusIntervalMs)
{
}

PC_CopySettings ClampCopySettings(const PC_CopySettings& settings)
{
    PC_CopySettings out = settings;

    if (out.workerCount == 0)
    {
        out.workerCount = PC_DefaultWorkerCount;
    }
    out.workerCount = min(max(out.workerCount, PC_MinWorkerCount), PC_MaxWorkerCount);

    if (out.blockSize == 0)
    {
        out.blockSize = PC_DefaultBlockSize;
    }
    out.blockSize = min(max(out.blockSize, PC_MinBlockSize), PC_MaxBlockSize);

    if (out.statusIntervalMs <= 0)
    {
        out.statusIntervalMs = PC_DefaultStatusIntervalMs;
    }
    out.statusIntervalMs = min(max(out.statusIntervalMs, PC_MinStatusIntervalMs), PC_MaxStatusIntervalMs);

    return out;
}

PC_CopySettings LoadCopySettings()
{
    PC_CopySettings settings;
    uint64_t value = 0;

    if (internal::ReadUnsignedConfig(internal::kThreadCountKey, value) && value > 0)
    {
        settings.workerCount = static_cast<size_t>(min<uint64_t>(value, PC_MaxWorkerCount));
    }
    if (internal::ReadUnsignedConfig(internal::kBlockSizeKey, value) && value > 0)
    {
        settings.blockSize = value;
    }
    if (internal::ReadUnsignedConfig(internal::kStatusIntervalKey, value) && value > 0)
    {
        settings.statusIntervalMs = static_cast<int>(min<uint64_t>(value, static_cast<uint64_t>(PC_MaxStatusIntervalMs)));
    }

    return ClampCopySettings(settings);
}

bool SaveCopySettings(const PC_CopySettings& settings)
{
    const PC_CopySettings clamped = ClampCopySettings(settings);

    const bool ok1 = SetPcConfig(internal::kThreadCountKey, to_string(clamped.workerCount));
    const bool ok2 = SetPcConfig(internal::kBlockSizeKey, to_string(clamped.blockSize));
    const bool ok3 = SetPcConfig(internal::kStatusIntervalKey, to_string(clamped.statusIntervalMs));
    return ok1 && ok2 && ok3;
}
