#ifndef PARACOPY_RANGE_PARTITIONER_H_H
#define PARACOPY_RANGE_PARTITIONER_H_H

#include "ParaCopyPort.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// 半开区间 [startOffset, endOffset)
struct PARACOPY_PORT PC_FileRange
{
    size_t workerIndex;
    uint64_t startOffset;
    uint64_t endOffset;

    uint64_t Length() const
    {
        return endOffset - startOffset;
    }
};

/**
 * @brief 把 [0, totalSize) 切成 workerCount 段连续、互不重叠的区间。
 *
 * 前 N-1 段各 floor(S/N) 字节，最后一段取余下全部，保证并集恰为 [0, S)。
 * workerCount 为 0 时按 1 处理；S 为 0 时返回 N 个空区间。
 */
PARACOPY_PORT std::vector<PC_FileRange> PC_PartitionRange(uint64_t totalSize, size_t workerCount);

#endif
