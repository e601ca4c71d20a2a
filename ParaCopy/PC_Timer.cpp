#include "PC_Timer.h"
#include <ctime>
#include <sstream>
#include <iomanip>
#include <locale>

using namespace std;

string PC_GetLocalTimeStr(bool withMs)
{
    const chrono::system_clock::time_point now = chrono::system_clock::now();
    const time_t tt = chrono::system_clock::to_time_t(now);

    tm localTm;
#if defined(_WIN32)
    localtime_s(&localTm, &tt);
#else
    localtime_r(&tt, &localTm);
#endif

    ostringstream oss;
    oss.imbue(locale::classic());
    oss << put_time(&localTm, "%Y-%m-%dT%H:%M:%S");
    if (withMs)
    {
        const long long msSinceEpoch = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count();
        oss << '.' << setw(3) << setfill('0') << static_cast<int>(msSinceEpoch % 1000);
    }
    return oss.str();
}

PC_Stopwatch::PC_Stopwatch() : startTime(chrono::steady_clock::now())
{
}

void PC_Stopwatch::Restart()
{
    startTime = chrono::steady_clock::now();
}

double PC_Stopwatch::GetElapsedSeconds() const
{
    const chrono::duration<double> elapsed = chrono::steady_clock::now() - startTime;
    return elapsed.count();
}

long long PC_Stopwatch::GetElapsedMilliseconds() const
{
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - startTime).count();
}
