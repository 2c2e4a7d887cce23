#include "Tools.h"

#include <iostream>
#include <iomanip>
#include <locale>

#include <stdio.h>
#include <time.h>

namespace FitDecode {

void DumpData (const unsigned char *data, int size, std::ostream &o, uint32_t base)
{
    const int ncols = 16;
    std::ios::fmtflags saved = o.flags();
    char saved_fill = o.fill();
    std::locale loc = o.getloc();

    auto pchar = [&loc] (unsigned char b) -> char
        {
            char c = static_cast<char>(b);
            // whitespace other than ' ' would break the layout
            if (std::isspace (c, loc) && c != ' ')
                return '?';
            if (std::isprint (c, loc))
                return c;
            return '?';
        };

    o << std::hex << std::setfill ('0');

    for (int start = 0; start < size; start += ncols) {
        int end = start + ncols < size ? start + ncols : size;

        o << std::setw (8) << base + start << " ";
        for (int idx = start; idx < end; ++idx)
            o << pchar(data[idx]);
        for (int idx = end; idx < start + ncols; ++idx)
            o << ' ';

        o << '\t';
        for (int idx = start; idx < end; ++idx)
            o << std::setw (2) << static_cast<unsigned>(data[idx]) << " ";
        o << '\n';
    }

    o.flags (saved);
    o.fill (saved_fill);
}

void PutTimestamp(std::ostream &o)
{
    struct timespec tsp;

    if (clock_gettime(CLOCK_REALTIME, &tsp) < 0) {
        perror("clock_gettime");
        return;
    }
    struct tm tm;
    localtime_r(&tsp.tv_sec, &tm);

    unsigned msec = tsp.tv_nsec / 1000000;
    char saved_fill = o.fill();

    o << std::setfill('0')
      << std::setw(4) << tm.tm_year + 1900
      << '-' << std::setw(2) << tm.tm_mon + 1
      << '-' << std::setw(2) << tm.tm_mday
      << ' ' << std::setw(2) << tm.tm_hour
      << ':' << std::setw(2) << tm.tm_min
      << ':' << std::setw(2) << tm.tm_sec
      << '.' << std::setw(3) << msec << ' ';
    o.fill(saved_fill);
}


};                                      // end namespace FitDecode
