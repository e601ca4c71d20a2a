#include "PC_Utility.h"
#include "PC_Utf8String.h"
#include <cmath>
#include <cstdio>
#include <limits>

using namespace std;

string PC_FormatByteSize(double bytes)
{
    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };

    double size = bytes < 0.0 ? 0.0 : bytes;
    char buffer[64] = { 0 };
    for (size_t i = 0; i < sizeof(units) / sizeof(units[0]); i++)
    {
        if (size < 1024.0)
        {
            snprintf(buffer, sizeof(buffer), "%.2f%s", size, units[i]);
            return string(buffer);
        }
        size /= 1024.0;
    }
    snprintf(buffer, sizeof(buffer), "%.2fPB", size);
    return string(buffer);
}

string PC_FormatDuration(double seconds)
{
    if (!(seconds > 0.0) || std::isinf(seconds))
    {
        return PC_STR("0s");
    }

    const long long total = static_cast<long long>(seconds);
    const long long hours = total / 3600;
    const long long minutes = (total % 3600) / 60;
    const long long secs = total % 60;

    char buffer[64] = { 0 };
    if (hours > 0)
    {
        snprintf(buffer, sizeof(buffer), "%lldh%02lldm%02llds", hours, minutes, secs);
    }
    else if (minutes > 0)
    {
        snprintf(buffer, sizeof(buffer), "%lldm%02llds", minutes, secs);
    }
    else
    {
        snprintf(buffer, sizeof(buffer), "%llds", secs);
    }
    return string(buffer);
}

bool PC_ParseByteSize(const string& text, uint64_t& value)
{
    const string s = Utf8ToUpper(Utf8Trim(text));
    if (s.empty())
    {
        return false;
    }

    size_t digitsEnd = 0;
    uint64_t number = 0;
    while (digitsEnd < s.size() && s[digitsEnd] >= '0' && s[digitsEnd] <= '9')
    {
        const uint64_t digit = static_cast<uint64_t>(s[digitsEnd] - '0');
        if (number > (numeric_limits<uint64_t>::max() - digit) / 10)
        {
            return false;
        }
        number = number * 10 + digit;
        digitsEnd++;
    }
    if (digitsEnd == 0)
    {
        return false;
    }

    uint64_t multiplier = 1;
    const string suffix = s.substr(digitsEnd);
    if (suffix.empty() || suffix == "B")
    {
        multiplier = 1;
    }
    else if (suffix == "K" || suffix == "KB")
    {
        multiplier = 1024ull;
    }
    else if (suffix == "M" || suffix == "MB")
    {
        multiplier = 1024ull * 1024ull;
    }
    else if (suffix == "G" || suffix == "GB")
    {
        multiplier = 1024ull * 1024ull * 1024ull;
    }
    else
    {
        return false;
    }

    if (number > numeric_limits<uint64_t>::max() / multiplier)
    {
        return false;
    }
    value = number * multiplier;
    return true;
}
