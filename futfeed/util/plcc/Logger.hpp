#pragma once

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <stdexcept>
#include "time_util.h"
#include "rate_limiter.h"

#define MAX_LOG_ENTRY 1024*4
#define MAX_LOG_PER_SECOND 100

namespace utils {
  enum LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Trace = 3,
    Debug = 4,

    TotalLevels
  };

  inline
  static const char* getLevelStr(LogLevel level) {
    switch (level) {
    case Error: return "ERR";
    case Warning: return "WAR";
    case Info: return "INF";
    case Trace: return "TRC";
    case Debug: return "DBG";
    default:
        return "???";
    }
  }

  class Logger {
  public:
    void logInfo(const char* file, int line, const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(Info, file, line, fmt, ap);
        va_end(ap);
    }

    void logInfo(const char* file, int line, const std::string& str) {
        logInfo(file, line, "%s", str.c_str());
    }

    void logTrace(const char* file, int line, const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(Trace, file, line, fmt, ap);
        va_end(ap);
    }

    void logDebug(const char* file, int line, const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(Debug, file, line, fmt, ap);
        va_end(ap);
    }

    void logError(const char* file, int line, const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(Error, file, line, fmt, ap);
        va_end(ap);
    }

    void logError(const char* file, int line, const std::string& str) {
        logError(file, line, "%s", str.c_str());
    }

    // entries above level are dropped
    void setLogLevel(LogLevel level) { m_level = level; };
    LogLevel getLogLevel() const { return m_level; };

    // number of entries dropped by the rate limit
    long long getDropped() const { return m_dropped; };

    virtual void flush() = 0;
    Logger():rl(MAX_LOG_PER_SECOND,1), m_level(Trace), m_dropped(0) {}
    virtual ~Logger() {
    };

  protected:
    void log(LogLevel level, const char* file, int line, const char* fmt, va_list ap) {
      if (level > m_level) {
          return;
      }
      if (__builtin_expect(rl.check() != 0,0)) {
          ++m_dropped;
          return;
      }
      char char_buffer[MAX_LOG_ENTRY];
      int len = Logger::prepare_log_string(level, file, line, char_buffer, MAX_LOG_ENTRY-1);
      int len2 = vsnprintf(char_buffer+len, MAX_LOG_ENTRY-len, fmt, ap);
      if (__builtin_expect(len2 >= MAX_LOG_ENTRY-len,0)) {
          strcpy(char_buffer+MAX_LOG_ENTRY-11, "<CROPPED!>");
          len = MAX_LOG_ENTRY-1;
      } else {
          len += len2;
      }
      char_buffer[len++] = '\n';
      writeLog(level, char_buffer, len);
    }

    static int prepare_log_string(LogLevel level, const char* file, int line, char* char_buffer, int buf_size) {
      int len = (int) TimeUtil::frac_UTC_to_string(0, char_buffer, buf_size, 3);
      len += snprintf(char_buffer+len, buf_size-len, ",%s,%s:%d,", getLevelStr(level),file,line);
      return len;
    }

    virtual void writeLog(int level, const char* str, int size) = 0;
    RateLimiter rl;
    LogLevel m_level;
    long long m_dropped;
  };

  class FileLogger : public Logger {
  public:
    explicit FileLogger(const char* filepath): fp(NULL), fp_save(NULL) {
        if (strncmp(filepath, "stdout", 6)==0) {
            fp = stdout;
        } else if (strncmp(filepath, "stderr", 6)==0) {
            fp = stderr;
        } else {
            fp = fopen(filepath, "at+");
        }
        if (!fp) {
            throw std::runtime_error(std::string("cannot open log file to write: ") + filepath);
        }
        fp_save = fp;
    }
    ~FileLogger() {
        // don't close stdout/stderr
        if (fp_save && (fp_save != stdout) && (fp_save != stderr)) {
            fclose(fp_save);
        }
        fp_save = NULL;
    }
    void flush() {
       fflush(fp);
    }

    void loggerStdoutON() {
        fp = stdout;
    }

    void loggerStdoutOFF() {
        fp = fp_save;
    }

  private:
    FILE* fp;
    FILE* fp_save;
    void writeLog(int level, const char* str, int size) {
        fwrite(str, 1, size, fp);
        flush();
    };
  };
};
