#ifndef PARACOPY_BASE_TYPES_H_H
#define PARACOPY_BASE_TYPES_H_H

#include <vector>
#include <cstdint>
#include <cstddef>

using PC_ByteBuffer = std::vector<unsigned char>;

// 工作线程数量范围
constexpr static size_t PC_MinWorkerCount = 1;
constexpr static size_t PC_MaxWorkerCount = 64;
constexpr static size_t PC_DefaultWorkerCount = 4;

// 单次读写的块大小（字节）
constexpr static uint64_t PC_DefaultBlockSize = 1024ull * 1024ull;
constexpr static uint64_t PC_MinBlockSize = 4ull * 1024ull;
constexpr static uint64_t PC_MaxBlockSize = 64ull * 1024ull * 1024ull;

// 状态刷新间隔（毫秒）
constexpr static int PC_DefaultStatusIntervalMs = 500;
constexpr static int PC_MinStatusIntervalMs = 10;
constexpr static int PC_MaxStatusIntervalMs = 60000;

#endif
