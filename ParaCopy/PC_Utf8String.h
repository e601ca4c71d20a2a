#ifndef PARACOPY_UTF8_STRING_H_H
#define PARACOPY_UTF8_STRING_H_H

#include "ParaCopyPort.h"
#include <string>

// 构造 UTF-8 字符串
PARACOPY_PORT std::string MakeUtf8String(const char* s);

// C++20
#if defined(__cpp_char8_t)
inline std::string MakeUtf8String(const char8_t* s)
{
    if (!s)
    {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(s));
}
#endif

#define PC_STR(x) MakeUtf8String(u8##x)

// 字节级替换所有 oldValue（oldValue 为空时原样返回）
PARACOPY_PORT std::string Utf8Replace(const std::string& utf8Str, const std::string& oldValue, const std::string& newValue);

// 删除两端的指定字符（默认空白字符、Tab、\r和\n）
PARACOPY_PORT std::string Utf8Trim(const std::string& utf8Str, const std::string& trimChars = " \t\r\n");

// 转大写（仅 ASCII，其余字节保持不变）
PARACOPY_PORT std::string Utf8ToUpper(const std::string& utf8Str);

#if defined(_WIN32)
// UTF-8 与 UTF-16 互转，供 *W 系列 API 使用；失败返回空串
PARACOPY_PORT std::wstring Utf8ToWString(const std::string& utf8Str);
PARACOPY_PORT std::string WStringToUtf8(const std::wstring& wideStr);
#endif

#endif
