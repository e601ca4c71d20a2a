#include "PC_RangePartitioner.h"

using namespace std;

vector<PC_FileRange> PC_PartitionRange(uint64_t totalSize, size_t workerCount)
{
    if (workerCount == 0)
    {
        workerCount = 1;
    }

    const uint64_t chunk = totalSize / workerCount;

    vector<PC_FileRange> ranges;
    ranges.reserve(workerCount);
    for (size_t i = 0; i < workerCount; i++)
    {
        PC_FileRange range;
        range.workerIndex = i;
        range.startOffset = chunk * i;
        range.endOffset = (i + 1 == workerCount) ? totalSize : chunk * (i + 1);
        ranges.push_back(range);
    }
    return ranges;
}
