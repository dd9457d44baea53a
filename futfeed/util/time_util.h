#pragma once

#ifndef _XOPEN_SOURCE
#define _XOPEN_SOURCE
#endif

#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <sys/time.h>
#include <stdexcept>
#include <string>
#include <cmath>

namespace utils {

class TimeUtil {
public:

    //
    // utc and string conversions
    //
    static uint64_t string_to_frac_UTC(const char* str_buf, int frac_decimals=0, const char* fmt_str="%Y%m%d-%H:%M:%S", bool string_in_gmt = false);
       // expects a UTC time string like YYYYMMDD-HH:MM:SS.ssssss
       // the .ssssss part, if found, is taken as a fraction.
       // returns the utc * frac_mul + fraction * frac_mul,
       // where frac_mul = 10**frac_decimals
       // set frac_decimals to be 0 to get a whole second (fraction dropped, NOT rounded)
       // If the string is in GMT, set the string_in_gmt to be true.
       // Otherwise, it is taken as a local time.

    static size_t frac_UTC_to_string(uint64_t utc_frac_mul, char* char_buf, int buf_size, int frac_decimals=0, const char* fmt_str="%Y%m%d-%H:%M:%S", bool string_in_gmt=false);
       // expects utc_frac_mul = whole_seconds * frac_mul + frac_seconds
       // where frac_mul=10**frac_decimals
       // ret YYYYMMDD-HHMMSS.sss, where 0.sss = frac_seconds/frac_mul
       // set the utc_frac_mul to 0 for the current time
       // If string_in_gmt is true, return string in GMT
       // If string_in_gmt is false, return string in local time

    static std::string frac_UTC_to_string(uint64_t utc_frac_mul=0, int frac_decimals=0, const char* fmt_str="%Y%m%d-%H:%M:%S", bool string_in_gmt = false);

    //
    // feed time, a calendar time taken as is, without any time zone
    //
    static long long fixed_string_to_milli(const std::string& str);
       // parses exactly 17 digits of yyyyMMddHHmmssfff, i.e. 20230615093012123,
       // into milliseconds since 1970-01-01 00:00:00.000 of the same calendar,
       // no time zone or daylight saving adjustment is applied.
       // throws std::invalid_argument on a wrong width, a non-digit or
       // an out-of-range calendar field.

    static std::string milli_to_string(long long milli, const char* fmt_str="%Y-%m-%dT%H:%M:%S");
       // the reverse of fixed_string_to_milli with the given format plus ".fff"

    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);

    //
    // timer
    //
    static uint64_t cur_micro();
    static time_t   cur_utc();
    static int      cur_year();

    //
    // mockings
    //
    static void set_cur_time_micro(uint64_t cur_micro);
    static void unset_cur_time_micro();

private:
    static uint64_t CurTimeMicro;  // static instance for time mocking
};

//
// inlines
//
inline std::string TimeUtil::frac_UTC_to_string(uint64_t utc_frac_mul, int frac_decimals, const char* fmt_str, bool string_in_gmt) {
    char buf[64];
    frac_UTC_to_string(utc_frac_mul, buf, sizeof(buf), frac_decimals, fmt_str, string_in_gmt);
    return std::string(buf);
}

inline bool TimeUtil::isLeapYear(int year) {
    return ((year%4==0) && (year%100!=0)) || (year%400==0);
}

inline int TimeUtil::daysInMonth(int year, int month) {
    static const int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (month<1 || month>12) {
        return 0;
    }
    return days[month-1] + ((month==2 && isLeapYear(year))? 1:0);
}

inline void TimeUtil::set_cur_time_micro(uint64_t cur_micro) {
    TimeUtil::CurTimeMicro = cur_micro;
}

inline void TimeUtil::unset_cur_time_micro() {
    TimeUtil::CurTimeMicro = 0;
}

inline uint64_t TimeUtil::cur_micro() {
    if (__builtin_expect(TimeUtil::CurTimeMicro != 0, 0)) {
        return TimeUtil::CurTimeMicro;
    }
    struct timeval tv;
    gettimeofday(&tv, NULL);
    return ((uint64_t)tv.tv_sec)*1000000ULL + tv.tv_usec;
};

inline time_t TimeUtil::cur_utc() {
    return time_t(TimeUtil::cur_micro()/1000000ULL);
}

inline int TimeUtil::cur_year() {
    time_t utc = cur_utc();
    struct tm t;
    localtime_r(&utc, &t);
    return t.tm_year + 1900;
}

}
