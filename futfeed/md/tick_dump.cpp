#include "futures_reader.h"
#include "plcc/PLCC.hpp"

#include <stdio.h>
#include <string.h>
#include <signal.h>
#include <unistd.h>
#include <string>
#include <memory>

using namespace md;
using namespace utils;
using namespace std;

volatile bool user_stopped = false;

void sig_handler(int signo)
{
  if (signo == SIGINT) {
    fprintf(stderr, "Received SIGINT, exiting...\n");
  }
  user_stopped = true;
}

// multiplier = {
//     ES = 1.0
//     NQ = 1.0
// }
static FuturesTickReader::MultiplierMap loadMultipliers(const char* cfg_file) {
    FuturesTickReader::MultiplierMap mm;
    const ConfigureReader cfg(cfg_file);
    const auto mcfg = cfg.getReader("multiplier");
    for (const auto& sym : mcfg.listKeys()) {
        mm[sym] = mcfg.get<double>(sym.c_str());
    }
    return mm;
}

int main(int argc, char**argv) {
    if (argc < 3) {
        printf("Usage: %s data_file multiplier_cfg [symbol_filter|ALL] [out_file]\n", argv[0]);
        printf("Example: %s ES_20230615.csv.gz config/multipliers.cfg ES,NQ ticks.csv\n", argv[0]);
        printf("  data_file is plain, .gz or .bz2; ticks are written to stdout without out_file\n");
        printf("  main config is read from %s if present\n", DefaultConfigFilePath);
        return 0;
    }
    if (signal(SIGINT, sig_handler) == SIG_ERR)
    {
            printf("\ncan't catch SIGINT\n");
            return -1;
    }
    if (access(DefaultConfigFilePath, R_OK) != 0) {
        // no main config, logs to stdout with an empty symbol properties
        PLCC::ToggleTest();
    }

    const std::string data_file(argv[1]);
    std::unique_ptr<FuturesTickReader::SymbolFilter> filter;
    if ((argc > 3) && (strcmp(argv[3], "ALL") != 0)) {
        filter.reset(new FuturesTickReader::SymbolFilter());
        for (const auto& s : CSVUtil::read_line(argv[3])) {
            if (s.size()) filter->insert(s);
        }
    }

    FILE* fp = stdout;
    if (argc > 4) {
        fp = fopen(argv[4], "wt");
        if (!fp) {
            logError("failed to open %s for writing", argv[4]);
            return -1;
        }
    }

    int ret = 0;
    try {
        const auto mm = loadMultipliers(argv[2]);
        logInfo("dumping %s with %d multipliers, filter %s",
                data_file.c_str(), (int) mm.size(), (argc>3? argv[3] : "ALL"));

        FuturesTickReader reader(data_file, mm, filter.get());
        while (!user_stopped) {
            const Tick* tick = reader.current();
            if (!tick) {
                break;
            }
            fprintf(fp, "%s\n", tick->toCSVLine().c_str());
            reader.moveNext();
        }
        reader.close();
        logInfo("done %s: %s", data_file.c_str(), reader.stats().toString().c_str());
    } catch (const std::exception& e) {
        logError("failed to dump %s: %s", data_file.c_str(), e.what());
        ret = -1;
    }

    if (fp != stdout) {
        fclose(fp);
    }
    return ret;
}
