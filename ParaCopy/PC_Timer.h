#ifndef PARACOPY_TIMER_H_H
#define PARACOPY_TIMER_H_H

#include "ParaCopyPort.h"
#include <chrono>
#include <string>

/**
 * @brief 获取当前本地时间的 ISO 8601 文本（UTF-8，仅 ASCII），形如 "2025-08-19T11:44:44.063"。
 *
 * @param withMs 是否输出 3 位毫秒。
 *
 * @threadsafety 使用 localtime_s / localtime_r，可在多线程环境下调用。
 */
PARACOPY_PORT std::string PC_GetLocalTimeStr(bool withMs = true);

/*
    基于 steady_clock 的秒表，不受系统时间调整影响。
    用于吞吐率与 ETA 的计算。
*/
class PARACOPY_PORT PC_Stopwatch
{
public:
    PC_Stopwatch();

    void Restart();

    double GetElapsedSeconds() const;
    long long GetElapsedMilliseconds() const;

private:
    std::chrono::steady_clock::time_point startTime;
};

#endif
