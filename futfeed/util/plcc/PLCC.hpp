#pragma once

#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>
#include <memory>
#include <string>
#include <stdexcept>
#include "plcc/Logger.hpp"
#include "plcc/ConfigureReader.hpp"
#include "csv_util.h"

#include <string.h>

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/')+1 : __FILE__)

#define logDebug(a...) utils::PLCC::instance().logDebug(__FILENAME__,__LINE__,a)
#define logTrace(a...) utils::PLCC::instance().logTrace(__FILENAME__,__LINE__,a)
#define logInfo(a...) utils::PLCC::instance().logInfo(__FILENAME__,__LINE__,a)
#define logError(a...) utils::PLCC::instance().logError(__FILENAME__,__LINE__,a)

#define plcc_getInt(a...) utils::PLCC::instance().get<int>(a)
#define plcc_getDouble(a...) utils::PLCC::instance().get<double>(a)
#define plcc_getString(a...) utils::PLCC::instance().get<std::string>(a)
#define plcc_getStringArr(a...) utils::PLCC::instance().getArr<std::string>(a)

#define PRICE_PRECISION 8
#define PriceString(px)  utils::CSVUtil::printDouble((px),  PRICE_PRECISION)
#define PriceCString(px) utils::CSVUtil::printDouble((px),  PRICE_PRECISION).c_str()

#define DefaultLoggerConfigKey "Logger"
#define DefaultConfigFilePath  "config/main.cfg"

namespace utils {

// the process wide configuration and logger
class PLCC : public ConfigureReader, public FileLogger {
public:
    static const char* LoggerConfigKey;
    static const char* ConfigFilePath;

    static const char* getConfigPath();
    static void setConfigPath(const char* cfg_path);

    // setup without main cfg, logging to stdout
    static void ToggleTest(bool is_on=true);
    static const std::string getLogFileName(const std::string& logfile);
    static PLCC& instance();

private:
    explicit PLCC(const char* configFileName);
    ~PLCC();
    static PLCC* default_plcc;
};
}
