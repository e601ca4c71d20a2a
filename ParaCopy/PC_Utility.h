#ifndef PARACOPY_UTILITY_H_H
#define PARACOPY_UTILITY_H_H

#include "ParaCopyPort.h"
#include <cstdint>
#include <string>

// 以 1024 进制格式化字节数，保留两位小数，例如 1536 -> "1.50KB"，单位依次为 B、KB、MB、GB、TB、PB
PARACOPY_PORT std::string PC_FormatByteSize(double bytes);

// 将秒数格式化为 "1h02m03s" / "2m05s" / "7s"，负数按 0 处理
PARACOPY_PORT std::string PC_FormatDuration(double seconds);

// 解析十进制无符号整数，可带 K/M/G 后缀（1024 进制）；格式错误或溢出返回 false
PARACOPY_PORT bool PC_ParseByteSize(const std::string& text, uint64_t& value);

#endif
