#pragma once

#include <string>
#include <stdexcept>
#include <vector>

#include <stdio.h>
#include <cstddef>
#include <cstdlib>
#include <cmath>
#include <cctype>
#include <algorithm>

namespace utils {
    class CSVUtil {
    public:
        using LineTokens = std::vector<std::string>;
        static const char Delimiter = ',';

        static LineTokens read_line(const std::string& line, char delimiter = Delimiter, bool trim_token = true) {
            // splits a line on delimiter, keeping empty fields, including
            // a trailing one, i.e. "a,,b," gives ["a","","b",""].
            // No quoting rule is applied: a quoted delimiter still splits.
            LineTokens vec;
            size_t sz = line.size();
            if (sz && (line[sz-1] == '\r')) {
                --sz;
            }
            if (sz==0)
                return vec;

            size_t start = 0;
            while (true) {
                size_t pos = line.find(delimiter, start);
                if (pos == std::string::npos || pos >= sz) {
                    pos = sz;
                }
                std::string token = line.substr(start, pos-start);
                vec.push_back(trim_token? trim(token):token);
                if (pos == sz) {
                    break;
                }
                start = pos+1;
            }
            return vec;
        }

        // string utilities
        static std::string ltrim(const std::string& s) {
            static const std::string WhiteSpace = " \n\r\t\f\v";
            size_t start = s.find_first_not_of(WhiteSpace);
            return (start == std::string::npos) ? "" : s.substr(start);
        }

        static std::string rtrim(const std::string& s) {
            static const std::string WhiteSpace = " \n\r\t\f\v";
            size_t end = s.find_last_not_of(WhiteSpace);
            return (end == std::string::npos) ? "" : s.substr(0, end+1);
        }

        static std::string trim(const std::string& s) {
            return rtrim(ltrim(s));
        }

        // removes all leading and trailing ch, i.e. trim_char("\"ESU3\"", '"') is ESU3
        static std::string trim_char(const std::string& s, char ch) {
            size_t start = s.find_first_not_of(ch);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = s.find_last_not_of(ch);
            return s.substr(start, end-start+1);
        }

        static std::string to_upper(const std::string& s) {
            std::string ret(s);
            std::transform(ret.begin(), ret.end(), ret.begin(),
                    [](unsigned char c) { return (char)std::toupper(c); });
            return ret;
        }

        static std::string printDouble(double d, int max_decimal) {
            // convert a double to string, with maximum number of decimals in fraction precision
            // note it rounds the last decimal if needed, similar as %g in printf
            // i.e.
            // printDouble(-2.5678, 2) --> -2.57
            // printDouble(-2.5678, 6) --> -2.5678
            // printDouble(-2.5678, 0) --> -3
            // printDouble(0, 0)       --> 0

            if (__builtin_expect((max_decimal>20) || (max_decimal < 0),0)) {
                throw std::runtime_error(std::string("printDouble got max_decimal too high ") + std::to_string(max_decimal));
            }

            char strbuf[128];
            size_t cnt = 0;
            if (d < (double)0.0) {
                strbuf[cnt++] = '-';
                d = -d;
            }
            double mul10 = pow(10,max_decimal), intpart, fracpart;
            d = (double)((unsigned long long)(d*mul10 + 0.5))/mul10; // normalize d w.r.t. max_decimal
            fracpart = modf(d, &intpart);

            cnt += snprintf(strbuf+cnt, sizeof(strbuf)-cnt, "%llu",  (unsigned long long) (intpart+0.5));
            if (max_decimal > 0) {
                strbuf[cnt++]='.';
                unsigned long long fpart = (unsigned long long) (fracpart*mul10 + 0.5);
                if (fpart == 0) {
                    // no fraction, put "0" and done
                    strbuf[cnt++]='0';
                    strbuf[cnt++]=0;
                } else {
                    char* ptr = strbuf + (cnt+max_decimal);
                    *ptr--=0;
                    const char* ptr0 = strbuf+cnt;
                    // skipping trailing zeros
                    while (fpart%10==0) {
                        fpart/=10;
                        *ptr--=0;
                    };
                    while (ptr>=ptr0) {
                        *ptr--= (char)((fpart%10) + '0');
                        fpart/=10;
                    }
                }
            }
            return std::string(strbuf);
        }
    };

}
