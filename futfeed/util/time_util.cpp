#include "time_util.h"
#include <ctype.h>

namespace utils {
    uint64_t TimeUtil::string_to_frac_UTC(const char* str_buf, int frac_decimals, const char* fmt_str, bool string_in_gmt) {
       // For example,
       // 1. string_to_frac_UTC( "20201123-09:30:00.987654", 3)
       //         returns utc of "20201123-09:30:00" * 1000 + 987
       // 2. string_to_frac_UTC( "20201123-09:30:00.987654", 0)
       //         returns utc of "20201123-09:30:00"
       // 3. string_to_frac_UTC( "20201123-09:30:00", 3)
       //         returns utc of "20201123-09:30:00" * 1000

       if (frac_decimals<0 || frac_decimals>9) {
           throw std::runtime_error("frac_decimals out-of-range: " + std::to_string(frac_decimals));
       }

       if (fmt_str == NULL) {
           fmt_str = "%Y%m%d-%H:%M:%S";
       }
       uint64_t frac_mul = 1;
       for (int i=frac_decimals; i>0; --i, frac_mul*=10);
       struct tm time_tm;
       memset(&time_tm, 0, sizeof(struct tm));
       char* p = strptime(str_buf, fmt_str, &time_tm);
       if (!p) {
           return 0;
       }
       time_tm.tm_isdst = -1;

       uint64_t tsf;
       if (string_in_gmt) {
           tsf = (uint64_t)timegm(&time_tm);
       } else {
           tsf = (uint64_t)mktime(&time_tm);
       }
       tsf *= frac_mul;
       if(*p=='.') {
           double f = std::stod("0"+std::string(p));
           tsf+=(uint64_t)(f*(double)frac_mul);
       }
       return tsf;
    };

    size_t TimeUtil::frac_UTC_to_string(uint64_t utc_frac_mul, char* char_buf, int buf_size, int frac_decimals, const char* fmt_str, bool string_in_gmt) {
       if (frac_decimals<0 || frac_decimals>9) {
           throw std::runtime_error("frac_decimals out-of-range: " + std::to_string(frac_decimals));
       }
       if (fmt_str == NULL) {
           fmt_str = "%Y%m%d-%H:%M:%S";
       }
       uint64_t frac_mul = 1;
       for (int i=frac_decimals; i>0; --i, frac_mul*=10);

       if (utc_frac_mul==0) {
           // use current time
           utc_frac_mul = cur_micro();
           int decimal_adj = frac_decimals-6;
           while (decimal_adj > 0) {
               utc_frac_mul*=10;
               --decimal_adj;
           }
           while (decimal_adj < 0) {
               utc_frac_mul/=10;
               ++decimal_adj;
           }
       }

       time_t sec = (time_t) (utc_frac_mul/frac_mul);
       struct tm t;
       memset(&t, 0, sizeof(struct tm));
       size_t bytes = 0;

       bool ok;
       if (__builtin_expect(string_in_gmt,0))
           ok = (gmtime_r(&sec, &t) !=NULL);
       else
           ok = (localtime_r(&sec, &t) != NULL);
       if (ok) {
           bytes = strftime(char_buf, buf_size, fmt_str, &t);
           if (frac_decimals > 0) {
               // zero padded fraction digits
               bytes += snprintf(char_buf+bytes, buf_size-bytes, ".%0*llu",
                       frac_decimals, (unsigned long long)(utc_frac_mul%frac_mul));
           }
       }
       return bytes;
   };

    long long TimeUtil::fixed_string_to_milli(const std::string& str) {
        static const size_t Width = 17;  // yyyyMMddHHmmssfff
        if (str.size() != Width) {
            throw std::invalid_argument("timestamp width is not 17: " + str);
        }
        for (size_t i=0; i<Width; ++i) {
            if (!isdigit((unsigned char)str[i])) {
                throw std::invalid_argument("non-digit in timestamp: " + str);
            }
        }
        auto field = [&str](int pos, int len) {
            int v = 0;
            for (int i=pos; i<pos+len; ++i) {
                v = v*10 + (str[i]-'0');
            }
            return v;
        };
        const int year = field(0,4), month = field(4,2), day = field(6,2);
        const int hour = field(8,2), minute = field(10,2), second = field(12,2);
        const int milli = field(14,3);
        if ((month<1) || (month>12) || (day<1) || (day>daysInMonth(year, month)) ||
            (hour>23) || (minute>59) || (second>59)) {
            throw std::invalid_argument("timestamp field out of range: " + str);
        }

        struct tm t;
        memset(&t, 0, sizeof(struct tm));
        t.tm_year = year - 1900;
        t.tm_mon = month - 1;
        t.tm_mday = day;
        t.tm_hour = hour;
        t.tm_min = minute;
        t.tm_sec = second;
        // timegm does the calendar arithmetic only, the fields stay feed local
        const long long sec = (long long) timegm(&t);
        return sec*1000LL + milli;
    }

    std::string TimeUtil::milli_to_string(long long milli, const char* fmt_str) {
        long long sec = milli/1000LL, ms = milli%1000LL;
        if (ms < 0) {
            ms += 1000;
            --sec;
        }
        const time_t tsec = (time_t) sec;
        struct tm t;
        memset(&t, 0, sizeof(struct tm));
        char buf[64];
        if (!gmtime_r(&tsec, &t)) {
            throw std::runtime_error("failed to convert milli " + std::to_string(milli));
        }
        size_t bytes = strftime(buf, sizeof(buf), fmt_str, &t);
        snprintf(buf+bytes, sizeof(buf)-bytes, ".%03d", (int)ms);
        return std::string(buf);
    }

    uint64_t TimeUtil::CurTimeMicro  = 0;  // init to use

}
