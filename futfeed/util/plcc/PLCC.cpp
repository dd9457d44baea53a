#include "plcc/PLCC.hpp"

namespace utils {

const char* PLCC::LoggerConfigKey = DefaultLoggerConfigKey;
const char* PLCC::ConfigFilePath =  DefaultConfigFilePath;
PLCC* PLCC::default_plcc=nullptr;

const char* PLCC::getConfigPath() {
    return ConfigFilePath;
};

void PLCC::setConfigPath(const char* cfg_path) {
    ConfigFilePath = cfg_path;
}

const std::string PLCC::getLogFileName(const std::string& logfile) {
    if ((logfile == "stdout") || (logfile == "stderr")) {
        return logfile;
    }
    return logfile + "_" + TimeUtil::frac_UTC_to_string(0, 0, "%Y%m%d") + ".txt";
}

void PLCC::ToggleTest(bool is_on) {
    if (PLCC::default_plcc) {
        delete PLCC::default_plcc;
        PLCC::default_plcc = nullptr;
    }
    if (is_on) {
        setConfigPath(nullptr);
    } else {
        setConfigPath(DefaultConfigFilePath);
    }
    PLCC::default_plcc = new PLCC(getConfigPath());
}

PLCC& PLCC::instance() {
    // note this is NOT thread safe
    if (__builtin_expect(!default_plcc, 0)) {
        default_plcc=new PLCC(getConfigPath());
    }
    return *default_plcc;
}

PLCC::PLCC(const char* configFileName) :
    ConfigureReader(configFileName),
    FileLogger(configFileName?
       getLogFileName(get<std::string>(LoggerConfigKey, nullptr, "stdout")).c_str() :
       "stdout")
{}

PLCC::~PLCC() {}
}
