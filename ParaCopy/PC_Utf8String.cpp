#include "PC_Utf8String.h"

#if defined(_WIN32)
#   ifndef NOMINMAX
#       define NOMINMAX
#   endif
#   include <windows.h>
#endif

using namespace std;

string MakeUtf8String(const char* s)
{
    if (!s)
    {
        return string();
    }
    return string(s);
}

string Utf8Replace(const string& utf8Str, const string& oldValue, const string& newValue)
{
    if (oldValue.empty())
    {
        return utf8Str;
    }

    // UTF-8 自同步：完整的 oldValue 字节序列不会落在某个码点的中间
    string out;
    out.reserve(utf8Str.size());
    size_t from = 0;
    for (;;)
    {
        const size_t pos = utf8Str.find(oldValue, from);
        if (pos == string::npos)
        {
            out.append(utf8Str, from, string::npos);
            break;
        }
        out.append(utf8Str, from, pos - from);
        out += newValue;
        from = pos + oldValue.size();
    }
    return out;
}

string Utf8Trim(const string& utf8Str, const string& trimChars)
{
    const size_t first = utf8Str.find_first_not_of(trimChars);
    if (first == string::npos)
    {
        return string();
    }
    const size_t last = utf8Str.find_last_not_of(trimChars);
    return utf8Str.substr(first, last - first + 1);
}

string Utf8ToUpper(const string& utf8Str)
{
    string out = utf8Str;
    for (size_t i = 0; i < out.size(); i++)
    {
        const char ch = out[i];
        if (ch >= 'a' && ch <= 'z')
        {
            out[i] = static_cast<char>(ch - 'a' + 'A');
        }
    }
    return out;
}

#if defined(_WIN32)
wstring Utf8ToWString(const string& utf8Str)
{
    if (utf8Str.empty())
    {
        return wstring();
    }
    const int need = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8Str.data(),
        static_cast<int>(utf8Str.size()), nullptr, 0);
    if (need <= 0)
    {
        return wstring();
    }
    wstring ws(static_cast<size_t>(need), L'\0');
    const int written = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8Str.data(),
        static_cast<int>(utf8Str.size()), &ws[0], need);
    if (written != need)
    {
        return wstring();
    }
    return ws;
}

string WStringToUtf8(const wstring& wideStr)
{
    if (wideStr.empty())
    {
        return string();
    }
    const int need = ::WideCharToMultiByte(CP_UTF8, 0, wideStr.data(), static_cast<int>(wideStr.size()),
        nullptr, 0, nullptr, nullptr);
    if (need <= 0)
    {
        return string();
    }
    string s(static_cast<size_t>(need), '\0');
    const int written = ::WideCharToMultiByte(CP_UTF8, 0, wideStr.data(), static_cast<int>(wideStr.size()),
        &s[0], need, nullptr, nullptr);
    if (written != need)
    {
        return string();
    }
    return s;
}
#endif
